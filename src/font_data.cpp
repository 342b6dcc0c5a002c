#include "font_data.hpp"

#include <fmt/format.h>

namespace ttglyph
{

void byte_cursor::truncated(std::size_t offset, std::size_t count) const
{
    auto const table = to_string(m_table);
    throw format_error{
        error_kind::truncated_buffer,
        table,
        fmt::format(
            "{}: read of {} bytes at offset {} exceeds table length {}",
            table, count, offset, m_size)};
}

} /* namespace ttglyph */
