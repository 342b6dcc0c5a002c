#include "character_map.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <optional>

namespace ttglyph
{

namespace
{

static constexpr std::uint16_t unicode_bmp_encoding_id = 3;
static constexpr std::uint16_t unicode_full_encoding_id = 4;
static constexpr std::uint16_t unicode_full_repertoire_encoding_id = 6;
static constexpr std::uint16_t windows_unicode_bmp_encoding_id = 1;
static constexpr std::uint16_t windows_unicode_full_encoding_id = 10;

// Lower is better; nullopt for encodings that are not Unicode.
std::optional<int> encoding_rank(encoding_record const & record)
{
    switch(record.platform)
    {
        case platform_id::windows:
            if(record.encoding_id == windows_unicode_full_encoding_id)
                return 0;
            if(record.encoding_id == windows_unicode_bmp_encoding_id)
                return 3;
            return std::nullopt;

        case platform_id::unicode:
            if(record.encoding_id == unicode_full_repertoire_encoding_id)
                return 1;
            if(record.encoding_id == unicode_full_encoding_id)
                return 2;
            if(record.encoding_id == unicode_bmp_encoding_id)
                return 4;
            return 5;

        default:
            return std::nullopt;
    }
}

bool supported_format(std::uint16_t format)
{
    return format == 0 || format == 4 || format == 6 || format == 12;
}

} /* namespace */

character_map character_map::parse(byte_cursor cmap, std::uint16_t num_glyphs)
{
    auto const num_tables = cmap.peek<std::uint16_t>(2);

    auto best = std::optional<encoding_record>{};
    auto best_rank = 0;

    for(auto i = 0u; i != num_tables; ++i)
    {
        auto const offs = 4 + encoding_record::byte_size * i;
        auto const record = encoding_record{
            cmap.peek<platform_id>(offs + 0),
            cmap.peek<std::uint16_t>(offs + 2),
            cmap.peek<std::uint32_t>(offs + 4)};

        auto const rank = encoding_rank(record);
        if(!rank || (best && *rank >= best_rank))
            continue;

        auto const format = cmap.peek<std::uint16_t>(record.subtable_offset);
        if(!supported_format(format))
            continue;

        best = record;
        best_rank = *rank;
    }

    if(!best)
    {
        throw format_error{
            error_kind::malformed_table,
            "cmap",
            "cmap: no Unicode subtable of a supported format"};
    }

    auto result = character_map{};
    result.m_num_glyphs = num_glyphs;

    auto const subtable = cmap.window_from(best->subtable_offset);
    result.m_format = subtable.peek<std::uint16_t>(0);

    switch(result.m_format)
    {
        case 0:
            result.parse_format0(subtable);
            break;
        case 4:
            result.parse_format4(subtable);
            break;
        case 6:
            result.parse_format6(subtable);
            break;
        case 12:
            result.parse_format12(subtable);
            break;

        default:
            TTGLYPH_ASSERT(false);
            break;
    }

    auto const by_first = [](auto const & a, auto const & b)
    {
        return a.first < b.first;
    };
    std::sort(
        std::begin(result.m_ranges), std::end(result.m_ranges), by_first);

    return result;
}

std::uint16_t character_map::glyph_index(char32_t codepoint) const
{
    auto const it = std::lower_bound(
        std::cbegin(m_ranges), std::cend(m_ranges), codepoint,
        [](range const & r, char32_t cp) { return r.last < cp; });

    if(it == std::cend(m_ranges) || codepoint < it->first)
    {
        return 0;
    }

    auto glyph = std::int64_t{0};
    switch(it->kind)
    {
        case range_kind::modular_delta:
            glyph = (std::int64_t{codepoint} + it->delta) & 0xFFFF;
            break;

        case range_kind::sequential:
            glyph = std::int64_t{codepoint} + it->delta;
            break;

        case range_kind::array:
        {
            auto const index = it->array_base + std::int64_t{codepoint};
            if(index < 0 || index >= static_cast<std::int64_t>(m_glyph_ids.size()))
            {
                return 0;
            }

            glyph = m_glyph_ids[static_cast<std::size_t>(index)];
            if(glyph != 0)
            {
                glyph = (glyph + it->delta) & 0xFFFF;
            }
            break;
        }
    }

    if(glyph < 0 || glyph >= m_num_glyphs)
    {
        return 0;
    }

    return static_cast<std::uint16_t>(glyph);
}

void character_map::parse_format0(byte_cursor c)
{
    auto const base = static_cast<std::int64_t>(m_glyph_ids.size());

    c.seek(6);
    for(auto i = 0; i != 256; ++i)
    {
        m_glyph_ids.push_back(c.read<std::uint8_t>());
    }

    m_ranges.push_back({0, 255, range_kind::array, 0, base});
}

void character_map::parse_format4(byte_cursor c)
{
    auto const seg_count = std::size_t{c.peek<std::uint16_t>(6)} / 2;
    if(seg_count == 0)
    {
        throw format_error{
            error_kind::malformed_table, "cmap", "cmap: format 4 without segments"};
    }

    auto const end_codes = std::size_t{14};
    auto const start_codes = end_codes + seg_count*2 + 2;
    auto const id_deltas = start_codes + seg_count*2;
    auto const id_range_offsets = id_deltas + seg_count*2;
    auto const glyph_id_array = id_range_offsets + seg_count*2;

    // The declared length is unreliable in large fonts; trust it only
    // when it is consistent with the segment arrays.
    auto length = std::size_t{c.peek<std::uint16_t>(2)};
    if(length < glyph_id_array || length > c.size())
    {
        length = c.size();
    }

    auto const base = static_cast<std::int64_t>(m_glyph_ids.size());
    if(length > glyph_id_array)
    {
        auto ids = c.window(glyph_id_array, length - glyph_id_array);
        while(ids.remaining() >= 2)
        {
            m_glyph_ids.push_back(ids.read<std::uint16_t>());
        }
    }

    for(auto i = std::size_t{0}; i != seg_count; ++i)
    {
        auto const end = c.peek<std::uint16_t>(end_codes + i*2);
        auto const start = c.peek<std::uint16_t>(start_codes + i*2);
        auto const delta = c.peek<std::uint16_t>(id_deltas + i*2);
        auto const range_offset = c.peek<std::uint16_t>(id_range_offsets + i*2);

        if(start > end)
            continue;

        if(range_offset == 0)
        {
            m_ranges.push_back(
                {start, end, range_kind::modular_delta, delta, 0});
        }
        else
        {
            // idRangeOffset is relative to its own slot in the array.
            auto const array_base =
                base +
                range_offset/2 -
                static_cast<std::int64_t>(seg_count - i) -
                start;
            m_ranges.push_back(
                {start, end, range_kind::array, delta, array_base});
        }
    }
}

void character_map::parse_format6(byte_cursor c)
{
    auto const first_code = c.peek<std::uint16_t>(6);
    auto const entry_count = c.peek<std::uint16_t>(8);
    if(entry_count == 0)
        return;

    auto const base = static_cast<std::int64_t>(m_glyph_ids.size());

    c.seek(10);
    for(auto i = 0u; i != entry_count; ++i)
    {
        m_glyph_ids.push_back(c.read<std::uint16_t>());
    }

    m_ranges.push_back({
        first_code,
        static_cast<char32_t>(first_code + entry_count - 1u),
        range_kind::array,
        0,
        base - first_code});
}

void character_map::parse_format12(byte_cursor c)
{
    auto const num_groups = c.peek<std::uint32_t>(12);

    c.seek(16);
    m_ranges.reserve(std::min<std::size_t>(num_groups, c.remaining() / 12));
    for(auto i = std::uint32_t{0}; i != num_groups; ++i)
    {
        auto const start = c.read<std::uint32_t>();
        auto const end = c.read<std::uint32_t>();
        auto const start_glyph = c.read<std::uint32_t>();

        if(start > end)
            continue;

        m_ranges.push_back({
            start,
            end,
            range_kind::sequential,
            std::int64_t{start_glyph} - std::int64_t{start},
            0});
    }
}

} /* namespace ttglyph */
