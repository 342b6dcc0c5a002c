#ifndef TTGLYPH_GLYPH_DECODER_HPP
#define TTGLYPH_GLYPH_DECODER_HPP

#include "font_data.hpp"

#include <ttglyph/glyph.hpp>
#include <ttglyph/metrics.hpp>

#include <cstdint>

namespace ttglyph
{

struct glyph_header
{
    std::int16_t number_of_contours;
    glyph_description bounds;
    static constexpr std::size_t byte_size = 10;

    static glyph_header parse(byte_cursor & c);
};

struct decoded_glyph
{
    glyph_description description;
    glyph_data data;
};

/*
 * Decodes the glyf bytes of one glyph. `c` must cover exactly the glyph's
 * range as given by loca and must not be empty. Component references are
 * checked against self-reference and `num_glyphs`, deeper reference cycles
 * are the caller's concern.
 */
[[nodiscard]] decoded_glyph decode_glyph(
    byte_cursor c, std::uint16_t glyph_id, std::uint16_t num_glyphs);

[[nodiscard]] simple_outline decode_simple_outline(
    byte_cursor & c, std::int16_t number_of_contours, std::uint16_t glyph_id);

[[nodiscard]] compound_outline decode_compound_outline(
    byte_cursor & c, std::uint16_t glyph_id, std::uint16_t num_glyphs);

} /* namespace ttglyph */

#endif /* TTGLYPH_GLYPH_DECODER_HPP */
