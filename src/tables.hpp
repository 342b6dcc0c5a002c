#ifndef TTGLYPH_TABLES_HPP
#define TTGLYPH_TABLES_HPP

#include "font_data.hpp"

#include <ttglyph/metrics.hpp>
#include <ttglyph/typeface.hpp>

#include <cstdint>
#include <utility>
#include <vector>

namespace ttglyph
{

struct head_table
{
    std::uint16_t units_per_em;
    glyph_description bounds;
    loca_format index_to_loc_format;

    static head_table parse(byte_cursor c);
};

struct maxp_table
{
    std::uint16_t num_glyphs;

    static maxp_table parse(byte_cursor c);
};

struct hhea_table
{
    font_metrics metrics;
    std::uint16_t number_of_h_metrics;

    static hhea_table parse(byte_cursor c, std::uint16_t num_glyphs);
};

struct long_hor_metric
{
    std::uint16_t advance_width;
    std::int16_t left_side_bearing;
};

/* Horizontal metrics expanded to one record per glyph. */
class hmtx_table
{
    public:
    static hmtx_table parse(
        byte_cursor c,
        std::uint16_t num_glyphs,
        std::uint16_t number_of_h_metrics);

    [[nodiscard]] long_hor_metric const & operator[](
        std::uint16_t glyph_id) const
    {
        TTGLYPH_ASSERT(glyph_id < m_metrics.size());
        return m_metrics[glyph_id];
    }

    private:
    std::vector<long_hor_metric> m_metrics;
};

/* Glyph offsets into glyf, numGlyphs+1 entries, already doubled for the
 * short format. Stored as read; ranges are checked per glyph. */
class loca_table
{
    public:
    static loca_table parse(
        byte_cursor c,
        loca_format format,
        std::uint16_t num_glyphs,
        std::uint32_t glyf_length);

    /* [begin, end) of the glyph inside the glyf table. A decreasing pair
     * is malformed_table, an end past glyf is truncated_buffer; both
     * concern this glyph only. */
    [[nodiscard]] std::pair<std::uint32_t, std::uint32_t> range(
        std::uint16_t glyph_id) const;

    private:
    std::vector<std::uint32_t> m_offsets;
    std::uint32_t m_glyf_length{0};
};

} /* namespace ttglyph */

#endif /* TTGLYPH_TABLES_HPP */
