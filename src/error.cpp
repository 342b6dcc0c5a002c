#include <ttglyph/error.hpp>

#include <utility>

namespace ttglyph
{

char const * to_string(error_kind kind) noexcept
{
    switch(kind)
    {
        case error_kind::bad_magic:
            return "bad magic";
        case error_kind::missing_table:
            return "missing table";
        case error_kind::truncated_buffer:
            return "truncated buffer";
        case error_kind::invalid_glyph_index:
            return "invalid glyph index";
        case error_kind::malformed_glyph:
            return "malformed glyph";
        case error_kind::malformed_table:
            return "malformed table";
        case error_kind::unsupported_compound_encoding:
            return "unsupported compound encoding";
        case error_kind::component_cycle:
            return "component cycle";
        case error_kind::component_depth_exceeded:
            return "component depth exceeded";
    }

    return "unknown error";
}

format_error::format_error(error_kind kind, std::string const & message):
    std::runtime_error{message},
    m_kind{kind}
{}

format_error::format_error(
    error_kind kind, std::string table, std::string const & message):
    std::runtime_error{message},
    m_kind{kind},
    m_table{std::move(table)}
{}

} /* namespace ttglyph */
