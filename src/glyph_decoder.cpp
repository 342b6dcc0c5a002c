#include "glyph_decoder.hpp"

#include <fmt/format.h>

#include <vector>

namespace ttglyph
{

namespace
{

[[noreturn]] void glyph_failure(
    error_kind kind, std::uint16_t glyph_id, std::string const & what)
{
    throw format_error{
        kind, "glyf", fmt::format("glyf: glyph {}: {}", glyph_id, what)};
}

/*
 * One coordinate axis. A short vector is an unsigned byte whose sign is
 * given by `same_or_positive`; otherwise `same_or_positive` repeats the
 * previous coordinate and its absence means a signed 16-bit delta.
 */
template <std::int16_t outline_point::*Axis>
void read_coordinates(
    byte_cursor & c,
    std::vector<std::uint8_t> const & flags,
    std::uint8_t const short_vector,
    std::uint8_t const same_or_positive,
    std::vector<outline_point> & points)
{
    auto current = std::int16_t{0};
    for(auto i = std::size_t{0}; i != flags.size(); ++i)
    {
        auto const f = flags[i];
        if(f & short_vector)
        {
            auto const d = c.read<std::uint8_t>();
            current = static_cast<std::int16_t>(
                (f & same_or_positive) ? current + d : current - d);
        }
        else if(!(f & same_or_positive))
        {
            current = static_cast<std::int16_t>(
                current + c.read<std::int16_t>());
        }

        points[i].*Axis = current;
    }
}

} /* namespace */

glyph_header glyph_header::parse(byte_cursor & c)
{
    auto h = glyph_header{};
    h.number_of_contours = c.read<std::int16_t>();
    h.bounds.x_min = c.read<std::int16_t>();
    h.bounds.y_min = c.read<std::int16_t>();
    h.bounds.x_max = c.read<std::int16_t>();
    h.bounds.y_max = c.read<std::int16_t>();
    return h;
}

decoded_glyph decode_glyph(
    byte_cursor c, std::uint16_t glyph_id, std::uint16_t num_glyphs)
{
    auto const header = glyph_header::parse(c);

    if(header.number_of_contours >= 0)
    {
        return {
            header.bounds,
            decode_simple_outline(c, header.number_of_contours, glyph_id)};
    }

    if(header.number_of_contours == -1)
    {
        return {
            header.bounds,
            decode_compound_outline(c, glyph_id, num_glyphs)};
    }

    glyph_failure(
        error_kind::malformed_glyph,
        glyph_id,
        fmt::format("invalid numberOfContours {}", header.number_of_contours));
}

simple_outline decode_simple_outline(
    byte_cursor & c, std::int16_t number_of_contours, std::uint16_t glyph_id)
{
    auto outline = simple_outline{};
    if(number_of_contours == 0)
    {
        return outline;
    }

    outline.end_points.reserve(static_cast<std::size_t>(number_of_contours));
    for(auto i = 0; i != number_of_contours; ++i)
    {
        auto const end_point = c.read<std::uint16_t>();
        if(!outline.end_points.empty() && end_point <= outline.end_points.back())
        {
            glyph_failure(
                error_kind::malformed_glyph,
                glyph_id,
                fmt::format(
                    "end point {} of contour {} does not follow {}",
                    end_point, i, outline.end_points.back()));
        }
        outline.end_points.push_back(end_point);
    }

    auto const num_points = std::size_t{outline.end_points.back()} + 1;

    // Hinting instructions are not executed.
    auto const instruction_length = c.read<std::uint16_t>();
    c.skip(instruction_length);

    auto flags = std::vector<std::uint8_t>{};
    flags.reserve(num_points);
    while(flags.size() < num_points)
    {
        auto const f = c.read<std::uint8_t>();
        flags.push_back(f);

        if(f & simple_glyph_flags::repeat_flag)
        {
            auto const repeat = c.read<std::uint8_t>();
            if(repeat > num_points - flags.size())
            {
                glyph_failure(
                    error_kind::malformed_glyph,
                    glyph_id,
                    fmt::format(
                        "flag repeat of {} overruns {} points",
                        repeat, num_points));
            }
            flags.insert(flags.end(), std::size_t{repeat}, f);
        }
    }

    outline.points.resize(num_points);

    read_coordinates<&outline_point::x>(
        c, flags,
        simple_glyph_flags::x_short_vector,
        simple_glyph_flags::x_is_same_or_positive_x_short_vector,
        outline.points);

    read_coordinates<&outline_point::y>(
        c, flags,
        simple_glyph_flags::y_short_vector,
        simple_glyph_flags::y_is_same_or_positive_y_short_vector,
        outline.points);

    for(auto i = std::size_t{0}; i != num_points; ++i)
    {
        outline.points[i].on_curve =
            (flags[i] & simple_glyph_flags::on_curve_point) != 0;
    }

    return outline;
}

compound_outline decode_compound_outline(
    byte_cursor & c, std::uint16_t glyph_id, std::uint16_t num_glyphs)
{
    auto outline = compound_outline{};

    auto flags =
        static_cast<std::uint16_t>(component_flags::more_components);

    while(flags & component_flags::more_components)
    {
        auto comp = component{};
        flags = c.read<std::uint16_t>();
        comp.flags = flags;
        comp.glyph_id = c.read<std::uint16_t>();

        if(!(flags & component_flags::args_are_xy_values))
        {
            glyph_failure(
                error_kind::unsupported_compound_encoding,
                glyph_id,
                fmt::format(
                    "component {} is placed by point matching",
                    outline.components.size()));
        }

        if(comp.glyph_id == glyph_id)
        {
            glyph_failure(
                error_kind::component_cycle,
                glyph_id,
                "component references its own glyph");
        }

        if(comp.glyph_id >= num_glyphs)
        {
            glyph_failure(
                error_kind::invalid_glyph_index,
                glyph_id,
                fmt::format(
                    "component references glyph {} of {}",
                    comp.glyph_id, num_glyphs));
        }

        if(flags & component_flags::arg_1_and_arg_2_are_words)
        {
            comp.dx = c.read<std::int16_t>();
            comp.dy = c.read<std::int16_t>();
        }
        else
        {
            comp.dx = c.read<std::int8_t>();
            comp.dy = c.read<std::int8_t>();
        }

        auto const f2dot14 = [&c]()
        {
            return static_cast<float>(c.read<std::int16_t>()) / 16384.0f;
        };

        if(flags & component_flags::we_have_a_scale)
        {
            auto const scale = f2dot14();
            comp.scale = matrix_2x2{scale, 0.0f, 0.0f, scale};
        }
        else if(flags & component_flags::we_have_an_x_and_y_scale)
        {
            auto const x_scale = f2dot14();
            auto const y_scale = f2dot14();
            comp.scale = matrix_2x2{x_scale, 0.0f, 0.0f, y_scale};
        }
        else if(flags & component_flags::we_have_a_two_by_two)
        {
            auto m = matrix_2x2{};
            m.xx = f2dot14();
            m.yx = f2dot14();
            m.xy = f2dot14();
            m.yy = f2dot14();
            comp.scale = m;
        }

        outline.components.push_back(comp);
    }

    return outline;
}

} /* namespace ttglyph */
