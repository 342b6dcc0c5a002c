#include "tables.hpp"

#include <fmt/format.h>

namespace ttglyph
{

namespace
{

[[noreturn]] void malformed(tag_t const & table, std::string const & what)
{
    auto const name = to_string(table);
    throw format_error{
        error_kind::malformed_table, name, fmt::format("{}: {}", name, what)};
}

} /* namespace */

head_table head_table::parse(byte_cursor c)
{
    auto head = head_table{};

    head.units_per_em = c.peek<std::uint16_t>(18);
    head.bounds.x_min = c.peek<std::int16_t>(36);
    head.bounds.y_min = c.peek<std::int16_t>(38);
    head.bounds.x_max = c.peek<std::int16_t>(40);
    head.bounds.y_max = c.peek<std::int16_t>(42);

    auto const format = c.peek<std::int16_t>(50);
    switch(format)
    {
        case 0:
            head.index_to_loc_format = loca_format::short_offsets;
            break;
        case 1:
            head.index_to_loc_format = loca_format::long_offsets;
            break;

        default:
            malformed(
                c.table(),
                fmt::format("unknown indexToLocFormat {}", format));
    }

    return head;
}

maxp_table maxp_table::parse(byte_cursor c)
{
    auto const num_glyphs = c.peek<std::uint16_t>(4);
    if(num_glyphs == 0)
    {
        malformed(c.table(), "font has no glyphs");
    }

    return {num_glyphs};
}

hhea_table hhea_table::parse(byte_cursor c, std::uint16_t num_glyphs)
{
    auto hhea = hhea_table{};

    hhea.metrics.ascent = static_cast<float>(c.peek<std::int16_t>(4));
    hhea.metrics.descent = static_cast<float>(c.peek<std::int16_t>(6));
    hhea.metrics.line_gap = static_cast<float>(c.peek<std::int16_t>(8));
    hhea.number_of_h_metrics = c.peek<std::uint16_t>(34);

    if(hhea.number_of_h_metrics == 0 ||
       hhea.number_of_h_metrics > num_glyphs)
    {
        malformed(
            c.table(),
            fmt::format(
                "numberOfHMetrics {} out of range for {} glyphs",
                hhea.number_of_h_metrics, num_glyphs));
    }

    return hhea;
}

hmtx_table hmtx_table::parse(
    byte_cursor c,
    std::uint16_t num_glyphs,
    std::uint16_t number_of_h_metrics)
{
    auto hmtx = hmtx_table{};
    hmtx.m_metrics.reserve(num_glyphs);

    for(auto i = 0u; i != number_of_h_metrics; ++i)
    {
        auto const advance = c.read<std::uint16_t>();
        auto const lsb = c.read<std::int16_t>();
        hmtx.m_metrics.push_back({advance, lsb});
    }

    // Monospaced tail: shared advance, own side bearing when stored.
    auto const last = hmtx.m_metrics.back();
    for(auto i = std::size_t{number_of_h_metrics}; i != num_glyphs; ++i)
    {
        auto const lsb =
            c.remaining() >= 2 ?
            c.read<std::int16_t>() :
            last.left_side_bearing;
        hmtx.m_metrics.push_back({last.advance_width, lsb});
    }

    return hmtx;
}

loca_table loca_table::parse(
    byte_cursor c,
    loca_format format,
    std::uint16_t num_glyphs,
    std::uint32_t glyf_length)
{
    auto loca = loca_table{};
    auto const count = std::size_t{num_glyphs} + 1;
    loca.m_offsets.reserve(count);
    loca.m_glyf_length = glyf_length;

    for(auto i = std::size_t{0}; i != count; ++i)
    {
        loca.m_offsets.push_back(
            format == loca_format::short_offsets ?
            std::uint32_t{c.read<std::uint16_t>()} * 2 :
            c.read<std::uint32_t>());
    }

    return loca;
}

std::pair<std::uint32_t, std::uint32_t> loca_table::range(
    std::uint16_t glyph_id) const
{
    TTGLYPH_ASSERT(glyph_id + 1u < m_offsets.size());
    auto const begin = m_offsets[glyph_id];
    auto const end = m_offsets[glyph_id + 1u];

    if(end < begin)
    {
        malformed(
            tag_from_c_string("loca"),
            fmt::format(
                "offset of glyph {} decreases from {} to {}",
                glyph_id + 1u, begin, end));
    }

    if(end > m_glyf_length)
    {
        throw format_error{
            error_kind::truncated_buffer,
            "glyf",
            fmt::format(
                "glyf: glyph {} ends at {} beyond table length {}",
                glyph_id, end, m_glyf_length)};
    }

    return {begin, end};
}

} /* namespace ttglyph */
