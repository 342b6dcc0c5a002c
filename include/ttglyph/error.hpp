#ifndef TTGLYPH_ERROR_HPP
#define TTGLYPH_ERROR_HPP

#include <ttglyph/export.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>

namespace ttglyph
{

enum class error_kind
{
    bad_magic,
    missing_table,
    truncated_buffer,
    invalid_glyph_index,
    malformed_glyph,
    malformed_table,
    unsupported_compound_encoding,
    component_cycle,
    component_depth_exceeded
};

[[nodiscard]] TTGLYPH_EXPORT char const * to_string(error_kind kind) noexcept;

/*
 * Thrown for every defect found in the font binary. Errors raised while
 * constructing a typeface abort the construction; errors raised while
 * decoding a single glyph leave the typeface usable.
 *
 * table() names the sfnt table involved ("glyf", "cmap", ...) or is empty
 * when the error is not tied to a table.
 */
class TTGLYPH_EXPORT format_error: public std::runtime_error
{
    public:
    format_error(error_kind kind, std::string const & message);
    format_error(
        error_kind kind, std::string table, std::string const & message);

    [[nodiscard]] error_kind kind() const noexcept { return m_kind; }
    [[nodiscard]] std::string const & table() const noexcept
    {
        return m_table;
    }

    private:
    error_kind m_kind;
    std::string m_table;
}; /* class format_error */

} /* namespace ttglyph */

#endif /* TTGLYPH_ERROR_HPP */
