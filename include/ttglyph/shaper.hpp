#ifndef TTGLYPH_SHAPER_HPP
#define TTGLYPH_SHAPER_HPP

#include <ttglyph/export.hpp>
#include <ttglyph/error.hpp>
#include <ttglyph/glyph.hpp>
#include <ttglyph/typeface.hpp>

#include <unicode/unistr.h>

#include <optional>
#include <string_view>
#include <vector>

namespace ttglyph
{

enum class error_policy
{
    /* Record the error and shape the glyph with an empty outline. */
    substitute,
    /* Rethrow the format_error, abandoning the shaping pass. */
    propagate
};

struct TTGLYPH_EXPORT shaper_options
{
    float origin_x{0.0f};
    float origin_y{0.0f};
    error_policy on_error{error_policy::substitute};
};

struct TTGLYPH_EXPORT shaped_glyph
{
    char32_t codepoint{0};
    ttglyph::glyph glyph{};
    float pen_x{0.0f};
    float pen_y{0.0f};

    /* Set when the glyph failed to decode and an empty outline was used. */
    std::optional<error_kind> error{};
};

/*
 * Places one glyph per code point on a horizontal baseline, advancing the
 * pen by each glyph's advance width. Positions are in font units relative
 * to the origin given in the options.
 */
class TTGLYPH_EXPORT shaper
{
    public:
    explicit shaper(typeface font, shaper_options const & options = {});

    [[nodiscard]] std::vector<shaped_glyph> shape(std::u32string_view text) const;
    [[nodiscard]] std::vector<shaped_glyph> shape(
        icu::UnicodeString const & text) const;

    /* Ill-formed UTF-8 sequences are shaped as U+FFFD. */
    [[nodiscard]] std::vector<shaped_glyph> shape_utf8(
        std::string_view text) const;

    [[nodiscard]] typeface const & font() const noexcept { return m_font; }

    private:
    void shape_codepoint(
        char32_t codepoint, float & pen_x, std::vector<shaped_glyph> & out) const;

    typeface m_font;
    shaper_options m_options;
}; /* class shaper */

} /* namespace ttglyph */

#endif /* TTGLYPH_SHAPER_HPP */
