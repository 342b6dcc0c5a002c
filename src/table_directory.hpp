#ifndef TTGLYPH_TABLE_DIRECTORY_HPP
#define TTGLYPH_TABLE_DIRECTORY_HPP

#include "font_data.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace ttglyph
{

struct table_entry
{
    tag_t tag;
    std::uint32_t checksum;
    std::uint32_t offset;
    std::uint32_t length;
    static constexpr std::size_t byte_size = 16;
};

/*
 * The sfnt header and its table records. Construction validates the
 * version tag and that every record lies inside the font buffer.
 */
class table_directory
{
    public:
    static constexpr std::uint32_t truetype_version = 0x00010000;
    static constexpr std::uint32_t apple_true_version = 0x74727565; // 'true'
    static constexpr std::uint32_t apple_typ1_version = 0x74797031; // 'typ1'
    static constexpr std::size_t header_size = 12;

    explicit table_directory(font_data const & data);

    [[nodiscard]] std::uint32_t sfnt_version() const noexcept
    {
        return m_sfnt_version;
    }

    [[nodiscard]] std::vector<table_entry> const & entries() const noexcept
    {
        return m_entries;
    }

    [[nodiscard]] std::optional<table_entry> find(tag_t const & tag) const;
    [[nodiscard]] std::optional<table_entry> find(char const * tag) const
    {
        return find(tag_from_c_string(tag));
    }

    /* Throws format_error(missing_table) when the table is absent. */
    [[nodiscard]] table_entry require(char const * tag) const;

    /* Bounded cursor over the bytes of `entry`. */
    [[nodiscard]] byte_cursor cursor(table_entry const & entry) const;
    [[nodiscard]] byte_cursor cursor(char const * tag) const
    {
        return cursor(require(tag));
    }

    private:
    font_data const & m_data;
    std::uint32_t m_sfnt_version{0};
    std::vector<table_entry> m_entries;
}; /* class table_directory */

} /* namespace ttglyph */

#endif /* TTGLYPH_TABLE_DIRECTORY_HPP */
