#include "tool_support.hpp"

#include <ttglyph/error.hpp>
#include <ttglyph/glyph.hpp>
#include <ttglyph/path.hpp>
#include <ttglyph/typeface.hpp>

#include <fmt/format.h>
#include <fmt/color.h>

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

/*
 * References:
 *  https://docs.microsoft.com/en-us/typography/opentype/spec/otff
 *  https://developer.apple.com/fonts/TrueType-Reference-Manual/RM01/Chap1.html
 */

namespace
{

auto constexpr html_head =
R"html(<!DOCTYPE html>
<html>
<head>
<title>{}</title>
<style>
figure {{ display: inline-block; margin: 4px; }}
canvas {{ border: 1px solid #d3d3d3; }}
</style>
</head>
<body>
<script>
function glyph(id, w, h, tx, ty, draw) {{
  var f = document.createElement("figure");
  var c = document.createElement("canvas");
  c.width = w;
  c.height = h;
  var cap = document.createElement("figcaption");
  cap.textContent = id;
  f.appendChild(c);
  f.appendChild(cap);
  document.body.appendChild(f);
  var ctx = c.getContext("2d");
  ctx.scale({}, -{});
  ctx.translate(tx, ty);
  ctx.beginPath();
  draw(ctx);
  ctx.fill("nonzero");
}}
)html";

auto const html_foot =
R"html(</script>
</body>
</html>
)html";

auto constexpr html_scale = 0.05f;

void usage(char const * program_name)
{
    std::cerr <<
        fmt::format("Usage: {} ", program_name) <<
        fmt::format(fmt::emphasis::underline, "font-file") <<
        " [" <<
        fmt::format(fmt::emphasis::underline, "glyph-id") <<
        " | --html " <<
        fmt::format(fmt::emphasis::underline, "out-dir") <<
        "]\n";
}

struct file_closer
{
    void operator()(FILE * fp) const
    {
        if(fp)
        {
            std::fclose(fp);
        }
    }
};

char const * glyph_kind(ttglyph::glyph const & g)
{
    if(g.is_compound())
        return "compound";
    if(g.is_simple())
        return "simple";
    return "empty";
}

void print_info(ttglyph::typeface const & font)
{
    fmt::print("Tables:\n");
    for(auto const & t: font.tables())
    {
        fmt::print(
            "  {} checksum={:#010x} offset={:>8} length={:>8}\n",
            t.tag, t.checksum, t.offset, t.length);
    }

    auto const & m = font.metrics();
    auto const & b = font.bounds();
    fmt::print("unitsPerEm: {}\n", font.units_per_em());
    fmt::print(
        "indexToLocFormat: {}\n",
        font.index_to_loc_format() == ttglyph::loca_format::short_offsets ?
            "short" : "long");
    fmt::print("numGlyphs: {}\n", font.glyph_count());
    fmt::print(
        "ascent: {}, descent: {}, lineGap: {}\n",
        m.ascent, m.descent, m.line_gap);
    fmt::print(
        "bounds: ({}, {}), ({}, {})\n", b.x_min, b.y_min, b.x_max, b.y_max);

    auto simple = 0u;
    auto compound = 0u;
    auto empty = 0u;
    auto failed = 0u;
    for(auto id = 0u; id != font.glyph_count(); ++id)
    {
        try
        {
            auto const g = font.glyph(static_cast<std::uint16_t>(id));
            simple += g.is_simple();
            compound += g.is_compound();
            empty += g.is_empty();
        }
        catch(ttglyph::format_error const & e)
        {
            ++failed;
            fmt::print(
                stderr, fmt::fg(fmt::color::orange),
                "glyph {}: {}: {}\n", id, ttglyph::to_string(e.kind()), e.what());
        }
    }

    fmt::print(
        "glyphs: {} simple, {} compound, {} empty, {} failed\n",
        simple, compound, empty, failed);
}

void print_glyph(ttglyph::typeface const & font, std::uint16_t id)
{
    auto const g = font.glyph(id);
    auto const & d = g.description();

    fmt::print("glyph {}: {}\n", id, glyph_kind(g));
    fmt::print(
        "  advance: {}, lsb: {}, bbox: ({}, {}), ({}, {})\n",
        g.advance_width(), g.left_side_bearing(),
        d.x_min, d.y_min, d.x_max, d.y_max);

    if(auto const s = g.simple())
    {
        for(auto i = 0u; i != s->num_contours(); ++i)
        {
            fmt::print("  contour {}:", i);
            for(auto const & p: s->contour(i))
            {
                fmt::print(" ({}, {}{})", p.x, p.y, p.on_curve ? "" : " off");
            }
            fmt::print("\n");
        }
    }
    else if(auto const c = g.compound())
    {
        for(auto const & comp: c->components)
        {
            auto const t = comp.placement();
            fmt::print(
                "  component {} flags={:#06x} offset=({}, {}) "
                "matrix=[{} {} {} {}]\n",
                comp.glyph_id, comp.flags, t.tx, t.ty,
                t.m.xx, t.m.yx, t.m.xy, t.m.yy);
        }
    }

    fmt::print("  path:\n");
    for(auto const & cmd: font.glyph_path(id))
    {
        switch(cmd.verb)
        {
            case ttglyph::path_verb::move_to:
                fmt::print("    M {} {}\n", cmd.end.x, cmd.end.y);
                break;
            case ttglyph::path_verb::line_to:
                fmt::print("    L {} {}\n", cmd.end.x, cmd.end.y);
                break;
            case ttglyph::path_verb::quadratic_curve_to:
                fmt::print(
                    "    Q {} {} {} {}\n",
                    cmd.control.x, cmd.control.y, cmd.end.x, cmd.end.y);
                break;
        }
    }
}

void write_canvas_commands(FILE * out, ttglyph::path const & p)
{
    for(auto const & cmd: p)
    {
        switch(cmd.verb)
        {
            case ttglyph::path_verb::move_to:
                fmt::print(out, "ctx.moveTo({}, {});", cmd.end.x, cmd.end.y);
                break;
            case ttglyph::path_verb::line_to:
                fmt::print(out, "ctx.lineTo({}, {});", cmd.end.x, cmd.end.y);
                break;
            case ttglyph::path_verb::quadratic_curve_to:
                fmt::print(
                    out, "ctx.quadraticCurveTo({}, {}, {}, {});",
                    cmd.control.x, cmd.control.y, cmd.end.x, cmd.end.y);
                break;
        }
    }
}

void write_html(ttglyph::typeface const & font, std::filesystem::path const & dir)
{
    ttglyph_tools::profiling_point p{__FUNCTION__};

    std::filesystem::create_directories(dir);
    auto const file = dir / "glyphs.html";
    auto const out = std::unique_ptr<FILE, file_closer>{
        std::fopen(file.string().c_str(), "w")};
    if(!out)
    {
        throw std::runtime_error{
            fmt::format("cannot open '{}' for writing", file.string())};
    }

    fmt::print(
        out.get(), fmt::runtime(html_head),
        file.string(), html_scale, html_scale);

    auto const & b = font.bounds();
    auto const w = static_cast<int>(std::ceil((b.x_max - b.x_min) * html_scale)) + 2;
    auto const h = static_cast<int>(std::ceil((b.y_max - b.y_min) * html_scale)) + 2;

    for(auto id = 0u; id != font.glyph_count(); ++id)
    {
        auto path = ttglyph::path{};
        try
        {
            path = font.glyph_path(static_cast<std::uint16_t>(id));
        }
        catch(ttglyph::format_error const & e)
        {
            fmt::print(
                stderr, fmt::fg(fmt::color::orange),
                "glyph {}: {}\n", id, e.what());
        }

        fmt::print(
            out.get(), "glyph({}, {}, {}, {}, {}, function(ctx) {{ ",
            id, w, h, -b.x_min, -b.y_max);
        write_canvas_commands(out.get(), path);
        fmt::print(out.get(), " }});\n");
    }

    fmt::print(out.get(), fmt::runtime(html_foot));
    fmt::print("Wrote {}\n", file.string());
}

} /* namespace */

int main(int argc, char const * argv[])
{
    if(argc < 2 || argc > 4)
    {
        usage(argv[0]);
        return 1;
    }

    try
    {
        auto const font = ttglyph_tools::load_font(argv[1]);

        if(argc == 2)
        {
            print_info(font);
        }
        else if(std::string_view{argv[2]} == "--html")
        {
            if(argc != 4)
            {
                usage(argv[0]);
                return 1;
            }
            write_html(font, argv[3]);
        }
        else
        {
            auto const id = std::stoul(argv[2]);
            if(id > 0xffff)
            {
                throw std::out_of_range{
                    fmt::format("glyph id {} out of range", id)};
            }
            print_glyph(font, static_cast<std::uint16_t>(id));
        }
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
