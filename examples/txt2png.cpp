#include "pngsaver.hpp"
#include "tool_support.hpp"

#include <ttglyph/error.hpp>
#include <ttglyph/path.hpp>
#include <ttglyph/rasterizer.hpp>
#include <ttglyph/shaper.hpp>
#include <ttglyph/typeface.hpp>

#include <unicode/unistr.h>
#include <fmt/format.h>
#include <fmt/color.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

namespace
{

void usage(char const * program_name)
{
    std::cerr <<
        fmt::format("Usage: {} ", program_name) <<
        fmt::format(fmt::emphasis::underline, "font-file") <<
        " " <<
        fmt::format(fmt::emphasis::underline, "font-size") <<
        " " <<
        fmt::format(fmt::emphasis::underline, "text-file") <<
        " " <<
        fmt::format(fmt::emphasis::underline, "png-file") <<
        "\n";
}

struct layout_line
{
    float left_edge{0.0f};
    float right_edge{0.0f};
    std::vector<ttglyph::shaped_glyph> glyphs;
};

struct text_layout
{
    float left_edge{std::numeric_limits<float>::max()};
    float right_edge{std::numeric_limits<float>::lowest()};
    std::vector<layout_line> lines;

    [[nodiscard]] float width() const
    {
        return lines.empty() ? 0.0f : right_edge - left_edge;
    }
};

void report_errors(std::vector<ttglyph::shaped_glyph> const & glyphs)
{
    for(auto const & g: glyphs)
    {
        if(g.error)
        {
            fmt::print(
                stderr,
                fmt::fg(fmt::color::orange),
                "warning: U+{:04X} (glyph {}) drawn empty: {}\n",
                static_cast<std::uint32_t>(g.codepoint),
                g.glyph.id(),
                ttglyph::to_string(*g.error));
        }
    }
}

layout_line create_line(
    icu::UnicodeString const & line, ttglyph::shaper const & shaper)
{
    auto res = layout_line{
        std::numeric_limits<float>::max(),
        std::numeric_limits<float>::lowest(),
        shaper.shape(icu::UnicodeString{line}.trim())};
    report_errors(res.glyphs);

    for(auto const & g: res.glyphs)
    {
        auto const & d = g.glyph.description();
        res.left_edge = std::min(res.left_edge, g.pen_x + d.x_min);
        res.right_edge = std::max(
            res.right_edge,
            g.pen_x + std::max<float>(d.x_max, g.glyph.advance_width()));
    }

    if(res.glyphs.empty())
    {
        res.left_edge = res.right_edge = 0.0f;
    }

    return res;
}

text_layout create_text_layout(
    icu::UnicodeString const & str, ttglyph::shaper const & shaper)
{
    ttglyph_tools::profiling_point p{__FUNCTION__};

    auto res = text_layout{};
    auto line_start = std::int32_t{0};

    auto const add_line = [&](std::int32_t end)
    {
        res.lines.push_back(create_line(
            str.tempSubString(line_start, end - line_start), shaper));
        res.left_edge = std::min(res.left_edge, res.lines.back().left_edge);
        res.right_edge = std::max(res.right_edge, res.lines.back().right_edge);
    };

    for(auto i = std::int32_t{0}; i < str.length(); ++i)
    {
        if(str.charAt(i) == u'\n')
        {
            add_line(i);
            line_start = i + 1;
        }
    }

    // Add last line
    if(line_start != str.length())
    {
        add_line(str.length());
    }

    return res;
}

/* Composes the laid out text into a single path in pixel units. */
ttglyph::path create_path(
    text_layout const & layout, ttglyph::typeface const & font, float scale)
{
    ttglyph_tools::profiling_point p{__FUNCTION__};

    auto const metrics = font.metrics().scaled(scale);
    auto const path_width = std::ceil(layout.width() * scale);
    auto v_pos = -metrics.descent +
        (static_cast<float>(layout.lines.size()) * metrics.linespace());

    auto res = ttglyph::path{};
    for(auto const & line: layout.lines)
    {
        v_pos -= metrics.linespace();
        auto const line_width = (line.right_edge - line.left_edge) * scale;
        auto const indent = (path_width - line_width) / 2.0f;
        for(auto const & g: line.glyphs)
        {
            if(g.glyph.is_empty())
                continue;

            auto const x = indent + (g.pen_x - line.left_edge) * scale;
            res.add(
                font.glyph_path(g.glyph.id()),
                ttglyph::transform::from_scale_translate(scale, {x, v_pos}));
        }
    }

    return res;
}

} /* namespace */

int main(int argc, char const * argv[])
{
    if(argc != 5)
    {
        usage(argv[0]);
        return 1;
    }

    try
    {
        ttglyph_tools::profiling_point p1{"main"};
        auto const typeface = ttglyph_tools::load_font(argv[1]);
        auto const font_size = std::stof(argv[2]);
        auto const text = ttglyph_tools::load_text_file(argv[3]);
        auto const scale = font_size / typeface.metrics().height();

        auto const shaper = ttglyph::shaper{typeface};
        auto const layout = create_text_layout(text, shaper);
        auto const path = create_path(layout, typeface, scale);

        if(path.empty())
        {
            fmt::print(stderr, "Nothing to draw\n");
            return 1;
        }

        auto const image_width =
            static_cast<std::size_t>(std::ceil(path.width())) + 1;
        auto const image_height =
            static_cast<std::size_t>(std::ceil(path.height())) + 1;

        auto image_data = std::vector<std::uint8_t>(image_width * image_height);

        auto const rasterizer = ttglyph::rasterizer{
            image_data.data(), image_width, image_height,
            static_cast<std::ptrdiff_t>(image_width)};

        rasterizer.rasterize(path, -path.min_x(), -path.min_y());
        save_png(argv[4], image_data.data(), image_width, image_height);

        fmt::print(
            "path bounding box: ({}, {}), ({}, {})\n",
            path.min_x(), path.min_y(), path.max_x(), path.max_y());
        fmt::print("Image size: {}, {}\n", image_width, image_height);
    }
    catch(ttglyph::format_error const & e)
    {
        fmt::print(
            stderr, fmt::fg(fmt::color::red), "{}: {}\n",
            ttglyph::to_string(e.kind()), e.what());
        return 2;
    }
    catch(std::exception const & e)
    {
        fmt::print(stderr, fmt::fg(fmt::color::red), "error: {}\n", e.what());
        return 2;
    }

    return 0;
}
