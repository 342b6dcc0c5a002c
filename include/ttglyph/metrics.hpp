#ifndef TTGLYPH_METRICS_HPP
#define TTGLYPH_METRICS_HPP

#include <ttglyph/export.hpp>

#include <cstdint>

namespace ttglyph
{

/* Line metrics from the hhea table, in font units. */
struct TTGLYPH_EXPORT font_metrics
{
    float ascent;
    float descent;
    float line_gap;

    [[nodiscard]] constexpr font_metrics scaled(float s) const noexcept
    {
        return {ascent * s, descent * s, line_gap * s};
    }

    [[nodiscard]] constexpr float height() const noexcept
    {
        return ascent - descent;
    }

    [[nodiscard]] constexpr float linespace() const noexcept
    {
        return height() + line_gap;
    }
};

struct TTGLYPH_EXPORT glyph_metrics
{
    float left_side_bearing;
    float advance;
    float x_min;
    float y_min;
    float x_max;
    float y_max;

    [[nodiscard]] constexpr glyph_metrics scaled(float s) const noexcept
    {
        return {
            left_side_bearing * s,
            advance * s,
            x_min * s,
            y_min * s,
            x_max * s,
            y_max * s
        };
    }

    [[nodiscard]] constexpr float bb_width() const noexcept
    {
        return x_max - x_min;
    }

    [[nodiscard]] constexpr float bb_height() const noexcept
    {
        return y_max - y_min;
    }
};

/* Raw hmtx record of one glyph. */
struct TTGLYPH_EXPORT advance_metrics
{
    std::uint16_t advance_width;
    std::int16_t left_side_bearing;
};

/* Bounding box stored in the glyph header. */
struct TTGLYPH_EXPORT glyph_description
{
    std::int16_t x_min{0};
    std::int16_t y_min{0};
    std::int16_t x_max{0};
    std::int16_t y_max{0};

    [[nodiscard]] constexpr std::int32_t width() const noexcept
    {
        return std::int32_t{x_max} - x_min;
    }

    [[nodiscard]] constexpr std::int32_t height() const noexcept
    {
        return std::int32_t{y_max} - y_min;
    }
};

} /* namespace ttglyph */

#endif /* TTGLYPH_METRICS_HPP */
