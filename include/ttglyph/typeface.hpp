#ifndef TTGLYPH_TYPEFACE_HPP
#define TTGLYPH_TYPEFACE_HPP

#include <ttglyph/export.hpp>
#include <ttglyph/glyph.hpp>
#include <ttglyph/metrics.hpp>
#include <ttglyph/path.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace ttglyph
{

struct TTGLYPH_EXPORT font_options
{
    /* Nesting limit for compound glyphs referencing compound glyphs. */
    unsigned max_component_depth{8};
};

enum class loca_format: std::int16_t
{
    short_offsets = 0,
    long_offsets = 1
};

struct TTGLYPH_EXPORT table_info
{
    std::string tag;
    std::uint32_t checksum;
    std::uint32_t offset;
    std::uint32_t length;
};

/*
 * A parsed TrueType font. All tables are validated by the constructor,
 * which throws format_error on failure. The parsed state is immutable and
 * shared between copies, so a typeface can be read from any number of
 * threads.
 */
class TTGLYPH_EXPORT typeface
{
    public:
    typeface();
    typeface(typeface const & other);
    typeface(typeface && other) noexcept;

    explicit typeface(
        std::vector<std::byte> && data, font_options const & options = {});

    ~typeface();

    typeface & operator=(typeface const & other);
    typeface & operator=(typeface && other) noexcept;

    explicit operator bool() const noexcept;

    [[nodiscard]] std::uint16_t glyph_count() const;
    [[nodiscard]] std::uint16_t units_per_em() const;
    [[nodiscard]] loca_format index_to_loc_format() const;
    [[nodiscard]] glyph_description const & bounds() const;
    [[nodiscard]] font_metrics const & metrics() const;
    [[nodiscard]] std::vector<table_info> tables() const;

    /* Unmapped code points resolve to glyph 0. */
    [[nodiscard]] std::uint16_t glyph_index(char32_t codepoint) const;

    [[nodiscard]] ttglyph::glyph glyph(std::uint16_t id) const;
    [[nodiscard]] ttglyph::glyph_metrics glyph_metrics(std::uint16_t id) const;

    /* hmtx record only; does not touch the glyph's outline data. */
    [[nodiscard]] advance_metrics horizontal_metrics(std::uint16_t id) const;

    /* Outline of any glyph with compound components composed in place. */
    [[nodiscard]] path glyph_path(std::uint16_t id) const;

    private:
    class implementation;

    [[nodiscard]] implementation const & impl() const;

    std::shared_ptr<implementation const> m_impl;
}; /* class typeface */

[[nodiscard]] TTGLYPH_EXPORT typeface parse(
    std::vector<std::byte> data, font_options const & options = {});

} /* namespace ttglyph */

#endif /* TTGLYPH_TYPEFACE_HPP */
