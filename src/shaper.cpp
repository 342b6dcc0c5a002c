#include <ttglyph/shaper.hpp>

#include <unicode/stringpiece.h>

#include <utility>

namespace ttglyph
{

shaper::shaper(typeface font, shaper_options const & options):
    m_font{std::move(font)},
    m_options{options}
{}

std::vector<shaped_glyph> shaper::shape(std::u32string_view text) const
{
    auto result = std::vector<shaped_glyph>{};
    result.reserve(text.size());

    auto pen_x = m_options.origin_x;
    for(auto const codepoint: text)
    {
        shape_codepoint(codepoint, pen_x, result);
    }

    return result;
}

std::vector<shaped_glyph> shaper::shape(icu::UnicodeString const & text) const
{
    auto result = std::vector<shaped_glyph>{};
    result.reserve(static_cast<std::size_t>(text.countChar32()));

    auto pen_x = m_options.origin_x;
    for(auto i = std::int32_t{0}; i < text.length(); i = text.moveIndex32(i, 1))
    {
        shape_codepoint(static_cast<char32_t>(text.char32At(i)), pen_x, result);
    }

    return result;
}

std::vector<shaped_glyph> shaper::shape_utf8(std::string_view text) const
{
    auto const piece = icu::StringPiece{
        text.data(), static_cast<std::int32_t>(text.size())};
    return shape(icu::UnicodeString::fromUTF8(piece));
}

void shaper::shape_codepoint(
    char32_t codepoint, float & pen_x, std::vector<shaped_glyph> & out) const
{
    auto const id = m_font.glyph_index(codepoint);

    auto shaped = shaped_glyph{};
    shaped.codepoint = codepoint;
    shaped.pen_x = pen_x;
    shaped.pen_y = m_options.origin_y;

    try
    {
        shaped.glyph = m_font.glyph(id);
    }
    catch(format_error const & e)
    {
        if(m_options.on_error == error_policy::propagate)
        {
            throw;
        }

        auto const hm = m_font.horizontal_metrics(id);
        shaped.glyph = ttglyph::glyph{
            id,
            glyph_description{},
            empty_outline{},
            hm.advance_width,
            hm.left_side_bearing};
        shaped.error = e.kind();
    }

    pen_x += static_cast<float>(shaped.glyph.advance_width());
    out.push_back(std::move(shaped));
}

} /* namespace ttglyph */
