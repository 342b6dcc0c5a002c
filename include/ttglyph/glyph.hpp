#ifndef TTGLYPH_GLYPH_HPP
#define TTGLYPH_GLYPH_HPP

#include <ttglyph/export.hpp>
#include <ttglyph/metrics.hpp>
#include <ttglyph/transform.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

namespace ttglyph
{

/* A point of a simple glyph, in absolute font units. */
struct TTGLYPH_EXPORT outline_point
{
    std::int16_t x;
    std::int16_t y;
    bool on_curve;

    [[nodiscard]] friend constexpr bool
    operator==(outline_point const & a, outline_point const & b) noexcept
    {
        return a.x == b.x && a.y == b.y && a.on_curve == b.on_curve;
    }

    [[nodiscard]] friend constexpr bool
    operator!=(outline_point const & a, outline_point const & b) noexcept
    {
        return !(a == b);
    }
};

/* Read-only view of the points of one contour. */
class TTGLYPH_EXPORT contour_view
{
    public:
    constexpr contour_view() noexcept = default;
    constexpr contour_view(
        outline_point const * first, outline_point const * last) noexcept:
        m_first{first}, m_last{last}
    {}

    [[nodiscard]] constexpr outline_point const * begin() const noexcept
    {
        return m_first;
    }

    [[nodiscard]] constexpr outline_point const * end() const noexcept
    {
        return m_last;
    }

    [[nodiscard]] constexpr std::size_t size() const noexcept
    {
        return static_cast<std::size_t>(m_last - m_first);
    }

    [[nodiscard]] constexpr bool empty() const noexcept
    {
        return m_first == m_last;
    }

    [[nodiscard]] constexpr outline_point const &
    operator[](std::size_t i) const noexcept
    {
        return m_first[i];
    }

    private:
    outline_point const * m_first{nullptr};
    outline_point const * m_last{nullptr};
};

/*
 * Contours of a simple glyph. end_points holds the index of the last point
 * of each contour; it is strictly increasing and its last element equals
 * points.size()-1.
 */
struct TTGLYPH_EXPORT simple_outline
{
    std::vector<std::uint16_t> end_points;
    std::vector<outline_point> points;

    [[nodiscard]] std::size_t num_contours() const noexcept
    {
        return end_points.size();
    }

    [[nodiscard]] contour_view contour(std::size_t i) const noexcept;
};

enum component_flags: std::uint16_t
{
    arg_1_and_arg_2_are_words = 0x0001,
    args_are_xy_values = 0x0002,
    round_xy_to_grid = 0x0004,
    we_have_a_scale = 0x0008,
    more_components = 0x0020,
    we_have_an_x_and_y_scale = 0x0040,
    we_have_a_two_by_two = 0x0080,
    we_have_instructions = 0x0100,
    use_my_metrics = 0x0200,
    overlap_compound = 0x0400,
    scaled_component_offset = 0x0800,
    unscaled_component_offset = 0x1000
};

struct TTGLYPH_EXPORT component
{
    std::uint16_t glyph_id{0};
    std::int16_t dx{0};
    std::int16_t dy{0};
    std::optional<matrix_2x2> scale{};
    std::uint16_t flags{0};

    [[nodiscard]] bool uses_my_metrics() const noexcept
    {
        return (flags & component_flags::use_my_metrics) != 0;
    }

    /* Maps the referenced glyph's coordinates into the compound glyph. */
    [[nodiscard]] transform placement() const noexcept;
};

struct TTGLYPH_EXPORT compound_outline
{
    std::vector<component> components;
};

struct TTGLYPH_EXPORT empty_outline
{
};

using glyph_data = std::variant<empty_outline, simple_outline, compound_outline>;

class TTGLYPH_EXPORT glyph
{
    public:
    glyph() = default;
    glyph(
        std::uint16_t id,
        glyph_description const & description,
        glyph_data data,
        std::uint16_t advance_width,
        std::int16_t left_side_bearing);

    [[nodiscard]] std::uint16_t id() const noexcept { return m_id; }

    [[nodiscard]] glyph_description const & description() const noexcept
    {
        return m_description;
    }

    [[nodiscard]] glyph_data const & data() const noexcept { return m_data; }

    [[nodiscard]] std::uint16_t advance_width() const noexcept
    {
        return m_advance_width;
    }

    [[nodiscard]] std::int16_t left_side_bearing() const noexcept
    {
        return m_left_side_bearing;
    }

    [[nodiscard]] bool is_simple() const noexcept
    {
        return std::holds_alternative<simple_outline>(m_data);
    }

    [[nodiscard]] bool is_compound() const noexcept
    {
        return std::holds_alternative<compound_outline>(m_data);
    }

    [[nodiscard]] bool is_empty() const noexcept
    {
        return std::holds_alternative<empty_outline>(m_data);
    }

    [[nodiscard]] simple_outline const * simple() const noexcept
    {
        return std::get_if<simple_outline>(&m_data);
    }

    [[nodiscard]] compound_outline const * compound() const noexcept
    {
        return std::get_if<compound_outline>(&m_data);
    }

    private:
    std::uint16_t m_id{0};
    glyph_description m_description{};
    glyph_data m_data{};
    std::uint16_t m_advance_width{0};
    std::int16_t m_left_side_bearing{0};
}; /* class glyph */

} /* namespace ttglyph */

#endif /* TTGLYPH_GLYPH_HPP */
