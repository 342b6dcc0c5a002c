#include "table_directory.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace ttglyph
{

table_directory::table_directory(font_data const & data):
    m_data{data}
{
    auto header = m_data.create_cursor(tag_from_c_string("sfnt"));

    m_sfnt_version = header.read<std::uint32_t>();
    switch(m_sfnt_version)
    {
        case truetype_version:
        case apple_true_version:
        case apple_typ1_version:
            break;

        default:
            throw format_error{
                error_kind::bad_magic,
                fmt::format(
                    "unrecognized sfnt version {:#010x}", m_sfnt_version)};
    }

    auto const num_tables = header.read<std::uint16_t>();
    header.skip(6); // searchRange, entrySelector, rangeShift

    m_entries.reserve(num_tables);
    for(auto i = 0u; i != num_tables; ++i)
    {
        auto entry = table_entry{};
        entry.tag = header.read<tag_t>();
        entry.checksum = header.read<std::uint32_t>();
        entry.offset = header.read<std::uint32_t>();
        entry.length = header.read<std::uint32_t>();

        auto const size = m_data.bytes.size();
        if(entry.offset > size || entry.length > size - entry.offset)
        {
            throw format_error{
                error_kind::truncated_buffer,
                to_string(entry.tag),
                fmt::format(
                    "{}: table at offset {} with length {} exceeds "
                    "font size {}",
                    to_string(entry.tag), entry.offset, entry.length, size)};
        }

        m_entries.push_back(entry);
    }
}

std::optional<table_entry> table_directory::find(tag_t const & tag) const
{
    auto const it = std::find_if(
        std::cbegin(m_entries), std::cend(m_entries),
        [&tag](auto const & e) { return e.tag == tag; });

    if(it == std::cend(m_entries))
    {
        return std::nullopt;
    }

    return *it;
}

table_entry table_directory::require(char const * tag) const
{
    auto const entry = find(tag);
    if(!entry)
    {
        throw format_error{
            error_kind::missing_table,
            tag,
            fmt::format("required table '{}' is missing", tag)};
    }

    return *entry;
}

byte_cursor table_directory::cursor(table_entry const & entry) const
{
    return byte_cursor{
        m_data.bytes.data() + entry.offset, entry.length, entry.tag};
}

} /* namespace ttglyph */
