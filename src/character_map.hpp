#ifndef TTGLYPH_CHARACTER_MAP_HPP
#define TTGLYPH_CHARACTER_MAP_HPP

#include "font_data.hpp"

#include <cstdint>
#include <vector>

namespace ttglyph
{

struct encoding_record
{
    platform_id platform;
    std::uint16_t encoding_id;
    std::uint32_t subtable_offset;
    static constexpr std::size_t byte_size = 8;
};

/*
 * Code point to glyph id mapping decoded from one cmap subtable. Every
 * supported subtable format is normalized into sorted code point ranges.
 */
class character_map
{
    public:
    static character_map parse(byte_cursor cmap, std::uint16_t num_glyphs);

    /* 0 for code points without a mapping. */
    [[nodiscard]] std::uint16_t glyph_index(char32_t codepoint) const;

    [[nodiscard]] std::uint16_t format() const noexcept { return m_format; }

    private:
    enum class range_kind
    {
        /* glyph = (codepoint + delta) mod 65536 */
        modular_delta,
        /* glyph = codepoint + delta */
        sequential,
        /* glyph = glyph_ids[array_base + codepoint], then modular delta */
        array
    };

    struct range
    {
        char32_t first;
        char32_t last;
        range_kind kind;
        std::int64_t delta;
        std::int64_t array_base;
    };

    void parse_format0(byte_cursor c);
    void parse_format4(byte_cursor c);
    void parse_format6(byte_cursor c);
    void parse_format12(byte_cursor c);

    std::vector<range> m_ranges;
    std::vector<std::uint16_t> m_glyph_ids;
    std::uint16_t m_num_glyphs{0};
    std::uint16_t m_format{0};
};

} /* namespace ttglyph */

#endif /* TTGLYPH_CHARACTER_MAP_HPP */
