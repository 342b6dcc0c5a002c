#include <ttglyph/path.hpp>
#include <ttglyph/assert.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <stdexcept>
#include <type_traits>
#include <variant>

namespace ttglyph
{

namespace
{

constexpr unsigned max_subdivision_depth = 16;

point to_point(outline_point const & p)
{
    return {static_cast<float>(p.x), static_cast<float>(p.y)};
}

} /* namespace */

void path::move_to(point p)
{
    include(p);
    m_commands.push_back({path_verb::move_to, {}, p});
}

void path::line_to(point p)
{
    TTGLYPH_ASSERT(!m_commands.empty());
    include(p);
    m_commands.push_back({path_verb::line_to, {}, p});
}

void path::quadratic_curve_to(point control, point end)
{
    TTGLYPH_ASSERT(!m_commands.empty());
    include(control);
    include(end);
    m_flat = false;
    m_commands.push_back({path_verb::quadratic_curve_to, control, end});
}

void path::add(path const & other, transform const & t)
{
    m_commands.reserve(m_commands.size() + other.size());

    for(auto const & cmd: other)
    {
        switch(cmd.verb)
        {
            case path_verb::move_to:
                move_to(t.apply(cmd.end));
                break;
            case path_verb::line_to:
                line_to(t.apply(cmd.end));
                break;
            case path_verb::quadratic_curve_to:
                quadratic_curve_to(t.apply(cmd.control), t.apply(cmd.end));
                break;
        }
    }
}

path path::transformed(transform const & t) const
{
    auto result = path{};
    result.add(*this, t);
    return result;
}

path path::flatten(float tolerance) const
{
    if(m_flat)
        return *this;

    auto result = path{};
    auto current = point{0.0f, 0.0f};

    for(auto const & cmd: m_commands)
    {
        switch(cmd.verb)
        {
            case path_verb::move_to:
                result.move_to(cmd.end);
                break;
            case path_verb::line_to:
                result.line_to(cmd.end);
                break;
            case path_verb::quadratic_curve_to:
                result.add_flattened_curve(
                    tolerance, current, cmd.control, cmd.end, 0);
                break;
        }
        current = cmd.end;
    }

    return result;
}

void path::include(point p)
{
    if(!m_has_bounds)
    {
        m_min_x = m_max_x = p.x;
        m_min_y = m_max_y = p.y;
        m_has_bounds = true;
        return;
    }

    m_min_x = std::min(m_min_x, p.x);
    m_min_y = std::min(m_min_y, p.y);
    m_max_x = std::max(m_max_x, p.x);
    m_max_y = std::max(m_max_y, p.y);
}

void path::add_flattened_curve(
    float tolerance, point p0, point p1, point p2, unsigned depth)
{
    // Point of the curve at t=0.5 against the middle of the chord.
    auto const on_curve = midpoint(midpoint(p0, p1), midpoint(p1, p2));
    auto const chord = midpoint(p0, p2);
    auto const dx = chord.x - on_curve.x;
    auto const dy = chord.y - on_curve.y;

    if(dx*dx + dy*dy > tolerance*tolerance && depth < max_subdivision_depth)
    {
        add_flattened_curve(
            tolerance, p0, midpoint(p0, p1), on_curve, depth + 1);
        add_flattened_curve(
            tolerance, on_curve, midpoint(p1, p2), p2, depth + 1);
    }
    else
    {
        line_to(p2);
    }
}

void append_contour_path(path & out, contour_view contour)
{
    auto const n = contour.size();
    if(n == 0)
        return;

    auto const first_on = std::find_if(
        contour.begin(), contour.end(),
        [](auto const & p) { return p.on_curve; });

    // Index of the first point consumed after the start point.
    auto start_index = std::size_t{0};
    auto start = point{};

    if(first_on != contour.end())
    {
        start_index = static_cast<std::size_t>(first_on - contour.begin());
        start = to_point(*first_on);
    }
    else
    {
        start = midpoint(contour[0], contour[n > 1 ? 1 : 0]);
    }

    out.move_to(start);

    auto has_control = false;
    auto control = point{};

    for(auto k = std::size_t{1}; k <= n; ++k)
    {
        auto const & p = contour[(start_index + k) % n];
        auto const pt = to_point(p);

        if(p.on_curve)
        {
            if(has_control)
            {
                out.quadratic_curve_to(control, pt);
            }
            else
            {
                out.line_to(pt);
            }
            has_control = false;
        }
        else
        {
            if(has_control)
            {
                out.quadratic_curve_to(control, midpoint(control, pt));
            }
            control = pt;
            has_control = true;
        }
    }

    if(has_control)
    {
        out.quadratic_curve_to(control, start);
    }
}

path contour_path(contour_view contour)
{
    auto result = path{};
    append_contour_path(result, contour);
    return result;
}

path outline_path(simple_outline const & outline)
{
    auto result = path{};
    for(auto i = std::size_t{0}; i != outline.num_contours(); ++i)
    {
        append_contour_path(result, outline.contour(i));
    }
    return result;
}

path outline_path(glyph const & g)
{
    return std::visit(
        [&g](auto const & data) -> path
        {
            using T = std::decay_t<decltype(data)>;
            if constexpr(std::is_same_v<T, simple_outline>)
            {
                return outline_path(data);
            }
            else if constexpr(std::is_same_v<T, compound_outline>)
            {
                throw std::invalid_argument{fmt::format(
                    "glyph {} is compound; resolve it with "
                    "typeface::glyph_path", g.id())};
            }
            else
            {
                return {};
            }
        },
        g.data());
}

} /* namespace ttglyph */
