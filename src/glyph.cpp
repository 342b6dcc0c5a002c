#include <ttglyph/glyph.hpp>
#include <ttglyph/assert.hpp>

#include <utility>

namespace ttglyph
{

contour_view simple_outline::contour(std::size_t i) const noexcept
{
    TTGLYPH_ASSERT(i < end_points.size());

    auto const first = i == 0 ? std::size_t{0} : end_points[i-1] + 1u;
    auto const last = std::size_t{end_points[i]} + 1u;

    TTGLYPH_ASSERT(last <= points.size());
    return {points.data() + first, points.data() + last};
}

transform component::placement() const noexcept
{
    auto t = transform{};
    if(scale)
    {
        t.m = *scale;
    }

    auto const dx_f = static_cast<float>(dx);
    auto const dy_f = static_cast<float>(dy);

    if((flags & component_flags::scaled_component_offset) &&
       !(flags & component_flags::unscaled_component_offset))
    {
        t.tx = t.m.xx*dx_f + t.m.xy*dy_f;
        t.ty = t.m.yx*dx_f + t.m.yy*dy_f;
    }
    else
    {
        t.tx = dx_f;
        t.ty = dy_f;
    }

    return t;
}

glyph::glyph(
    std::uint16_t id,
    glyph_description const & description,
    glyph_data data,
    std::uint16_t advance_width,
    std::int16_t left_side_bearing):
    m_id{id},
    m_description{description},
    m_data{std::move(data)},
    m_advance_width{advance_width},
    m_left_side_bearing{left_side_bearing}
{}

} /* namespace ttglyph */
