#ifndef TTGLYPH_PATH_HPP
#define TTGLYPH_PATH_HPP

#include <ttglyph/export.hpp>
#include <ttglyph/glyph.hpp>
#include <ttglyph/transform.hpp>

#include <cstddef>
#include <vector>

namespace ttglyph
{

enum class path_verb
{
    move_to,
    line_to,
    quadratic_curve_to
};

/* `control` is only meaningful for quadratic_curve_to. */
struct TTGLYPH_EXPORT path_command
{
    path_verb verb;
    point control;
    point end;

    [[nodiscard]] friend bool
    operator==(path_command const & a, path_command const & b) noexcept
    {
        return a.verb == b.verb && a.end == b.end &&
            (a.verb != path_verb::quadratic_curve_to || a.control == b.control);
    }

    [[nodiscard]] friend bool
    operator!=(path_command const & a, path_command const & b) noexcept
    {
        return !(a == b);
    }
};

[[nodiscard]] constexpr point midpoint(point a, point b) noexcept
{
    return {(a.x + b.x) / 2.0f, (a.y + b.y) / 2.0f};
}

[[nodiscard]] constexpr point
midpoint(outline_point const & a, outline_point const & b) noexcept
{
    return midpoint(
        point{static_cast<float>(a.x), static_cast<float>(a.y)},
        point{static_cast<float>(b.x), static_cast<float>(b.y)});
}

/*
 * Drawable outline: a sequence of sub-paths, each starting with move_to and
 * ending where it started. The bounding box covers every command point,
 * control points included.
 */
class TTGLYPH_EXPORT path
{
    public:
    using const_iterator = std::vector<path_command>::const_iterator;

    path() = default;

    void move_to(point p);
    void line_to(point p);
    void quadratic_curve_to(point control, point end);
    void add(path const & other, transform const & t = {});

    [[nodiscard]] path transformed(transform const & t) const;

    /*
     * Replaces every curve with line segments. A curve is subdivided until
     * its midpoint lies within `tolerance` of the chord.
     */
    [[nodiscard]] path flatten(float tolerance) const;

    [[nodiscard]] std::vector<path_command> const & commands() const noexcept
    {
        return m_commands;
    }

    [[nodiscard]] const_iterator begin() const noexcept
    {
        return m_commands.begin();
    }

    [[nodiscard]] const_iterator end() const noexcept
    {
        return m_commands.end();
    }

    [[nodiscard]] std::size_t size() const noexcept
    {
        return m_commands.size();
    }

    [[nodiscard]] bool empty() const noexcept { return m_commands.empty(); }
    [[nodiscard]] bool flat() const noexcept { return m_flat; }

    [[nodiscard]] float min_x() const noexcept { return m_min_x; }
    [[nodiscard]] float min_y() const noexcept { return m_min_y; }
    [[nodiscard]] float max_x() const noexcept { return m_max_x; }
    [[nodiscard]] float max_y() const noexcept { return m_max_y; }
    [[nodiscard]] float width() const noexcept { return m_max_x - m_min_x; }
    [[nodiscard]] float height() const noexcept { return m_max_y - m_min_y; }

    private:
    void include(point p);
    void add_flattened_curve(
        float tolerance, point p0, point p1, point p2, unsigned depth);

    std::vector<path_command> m_commands;
    float m_min_x{0.0f};
    float m_min_y{0.0f};
    float m_max_x{0.0f};
    float m_max_y{0.0f};
    bool m_has_bounds{false};
    bool m_flat{true};
}; /* class path */

/*
 * Rebuilds the quadratic outline of one cyclic contour. Two consecutive
 * off-curve points imply an on-curve point at their midpoint. A contour
 * without on-curve points starts at the midpoint of its first two points.
 * An empty contour yields no commands.
 */
TTGLYPH_EXPORT void append_contour_path(path & out, contour_view contour);

[[nodiscard]] TTGLYPH_EXPORT path contour_path(contour_view contour);
[[nodiscard]] TTGLYPH_EXPORT path outline_path(simple_outline const & outline);

/*
 * Path of a simple or empty glyph. Compound glyphs need the owning
 * typeface to resolve their components; use typeface::glyph_path for them.
 * Throws std::invalid_argument for a compound glyph.
 */
[[nodiscard]] TTGLYPH_EXPORT path outline_path(glyph const & g);

} /* namespace ttglyph */

#endif /* TTGLYPH_PATH_HPP */
