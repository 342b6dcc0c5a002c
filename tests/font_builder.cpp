#include "font_builder.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace ttglyph_test
{

namespace
{

// simple glyph flags
constexpr std::uint8_t on_curve = 0x01;
constexpr std::uint8_t x_short = 0x02;
constexpr std::uint8_t y_short = 0x04;
constexpr std::uint8_t repeat = 0x08;
constexpr std::uint8_t x_same_or_positive = 0x10;
constexpr std::uint8_t y_same_or_positive = 0x20;

std::uint8_t delta_flags(
    int delta, std::uint8_t short_bit, std::uint8_t same_or_positive_bit)
{
    if(delta == 0)
        return same_or_positive_bit;
    if(delta >= -255 && delta <= 255)
        return delta > 0 ? short_bit | same_or_positive_bit : short_bit;
    return 0;
}

void write_delta(byte_writer & out, int delta, std::uint8_t flags,
    std::uint8_t short_bit, std::uint8_t same_or_positive_bit)
{
    if(flags & short_bit)
    {
        out.u8(static_cast<std::uint8_t>(delta < 0 ? -delta : delta));
    }
    else if(!(flags & same_or_positive_bit))
    {
        out.i16(static_cast<std::int16_t>(delta));
    }
}

std::int16_t to_f2dot14(float v)
{
    return static_cast<std::int16_t>(std::lround(v * 16384.0f));
}

std::uint32_t table_checksum(std::vector<std::byte> const & data)
{
    auto sum = std::uint32_t{0};
    for(auto i = std::size_t{0}; i < data.size(); i += 4)
    {
        auto word = std::uint32_t{0};
        for(auto j = std::size_t{0}; j != 4; ++j)
        {
            auto const b = i + j < data.size() ?
                std::to_integer<std::uint32_t>(data[i + j]) : 0u;
            word = (word << 8) | b;
        }
        sum += word;
    }
    return sum;
}

struct format4_segment
{
    std::uint16_t start;
    std::uint16_t end;
    std::uint16_t delta;
    std::vector<std::uint16_t> ids;
};

std::vector<std::byte> build_cmap_format4(
    std::map<char32_t, std::uint16_t> const & mapping, bool use_glyph_array)
{
    auto segments = std::vector<format4_segment>{};
    for(auto const & [cp, gid]: mapping)
    {
        if(cp >= 0xFFFF)
            continue;

        auto const code = static_cast<std::uint16_t>(cp);
        auto const delta = static_cast<std::uint16_t>(gid - code);

        if(!segments.empty() && segments.back().end + 1u == code &&
           (use_glyph_array || segments.back().delta == delta))
        {
            segments.back().end = code;
            segments.back().ids.push_back(gid);
            continue;
        }

        segments.push_back({code, code, delta, {gid}});
    }
    segments.push_back({0xFFFF, 0xFFFF, 1, {}});

    auto const seg_count = static_cast<std::uint16_t>(segments.size());
    auto entry_selector = std::uint16_t{0};
    while((2u << entry_selector) <= seg_count)
    {
        ++entry_selector;
    }
    auto const search_range = static_cast<std::uint16_t>(2u << entry_selector);

    auto out = byte_writer{};
    out.u16(4).u16(0).u16(0)
        .u16(static_cast<std::uint16_t>(seg_count * 2))
        .u16(search_range)
        .u16(entry_selector)
        .u16(static_cast<std::uint16_t>(seg_count * 2 - search_range));

    for(auto const & s: segments)
        out.u16(s.end);
    out.u16(0);
    for(auto const & s: segments)
        out.u16(s.start);

    auto const array_segment = [use_glyph_array](format4_segment const & s)
    {
        return use_glyph_array && s.start != 0xFFFF;
    };

    for(auto const & s: segments)
        out.u16(array_segment(s) ? 0 : s.delta);

    auto array_index = std::size_t{0};
    for(auto i = std::size_t{0}; i != segments.size(); ++i)
    {
        if(!array_segment(segments[i]))
        {
            out.u16(0);
            continue;
        }

        out.u16(static_cast<std::uint16_t>(
            (seg_count - i) * 2 + array_index * 2));
        array_index += segments[i].ids.size();
    }

    for(auto const & s: segments)
    {
        if(array_segment(s))
        {
            for(auto const id: s.ids)
                out.u16(id);
        }
    }

    out.patch_u16(2, static_cast<std::uint16_t>(out.size()));
    return out.bytes();
}

std::vector<std::byte> build_cmap_format12(
    std::map<char32_t, std::uint16_t> const & mapping)
{
    struct group
    {
        std::uint32_t start;
        std::uint32_t end;
        std::uint32_t glyph;
    };

    auto groups = std::vector<group>{};
    for(auto const & [cp, gid]: mapping)
    {
        if(!groups.empty())
        {
            auto & g = groups.back();
            if(g.end + 1 == cp && g.glyph + (g.end - g.start) + 1 == gid)
            {
                g.end = cp;
                continue;
            }
        }
        groups.push_back({cp, cp, gid});
    }

    auto out = byte_writer{};
    out.u16(12).u16(0)
        .u32(static_cast<std::uint32_t>(16 + groups.size() * 12))
        .u32(0)
        .u32(static_cast<std::uint32_t>(groups.size()));
    for(auto const & g: groups)
    {
        out.u32(g.start).u32(g.end).u32(g.glyph);
    }

    return out.bytes();
}

} /* namespace */

byte_writer & byte_writer::u8(std::uint8_t v)
{
    m_bytes.push_back(static_cast<std::byte>(v));
    return *this;
}

byte_writer & byte_writer::i8(std::int8_t v)
{
    return u8(static_cast<std::uint8_t>(v));
}

byte_writer & byte_writer::u16(std::uint16_t v)
{
    return u8(static_cast<std::uint8_t>(v >> 8)).u8(static_cast<std::uint8_t>(v));
}

byte_writer & byte_writer::i16(std::int16_t v)
{
    return u16(static_cast<std::uint16_t>(v));
}

byte_writer & byte_writer::u32(std::uint32_t v)
{
    return u16(static_cast<std::uint16_t>(v >> 16))
        .u16(static_cast<std::uint16_t>(v));
}

byte_writer & byte_writer::tag(char const * t)
{
    for(auto i = 0; i != 4; ++i)
    {
        u8(static_cast<std::uint8_t>(t[i]));
    }
    return *this;
}

byte_writer & byte_writer::append(std::vector<std::byte> const & bytes)
{
    m_bytes.insert(m_bytes.end(), bytes.begin(), bytes.end());
    return *this;
}

byte_writer & byte_writer::zeros(std::size_t count)
{
    m_bytes.insert(m_bytes.end(), count, std::byte{0});
    return *this;
}

byte_writer & byte_writer::align(std::size_t alignment)
{
    while(m_bytes.size() % alignment != 0)
    {
        u8(0);
    }
    return *this;
}

void byte_writer::patch_u16(std::size_t offset, std::uint16_t v)
{
    m_bytes.at(offset) = static_cast<std::byte>(v >> 8);
    m_bytes.at(offset + 1) = static_cast<std::byte>(v & 0xff);
}

void byte_writer::patch_u32(std::size_t offset, std::uint32_t v)
{
    patch_u16(offset, static_cast<std::uint16_t>(v >> 16));
    patch_u16(offset + 2, static_cast<std::uint16_t>(v));
}

std::vector<std::byte> encode_simple_glyph(
    std::vector<contour_points> const & contours,
    std::vector<std::uint8_t> const & instructions)
{
    auto points = contour_points{};
    auto end_points = std::vector<std::uint16_t>{};
    for(auto const & c: contours)
    {
        points.insert(points.end(), c.begin(), c.end());
        end_points.push_back(static_cast<std::uint16_t>(points.size() - 1));
    }

    auto x_min = std::int16_t{0};
    auto y_min = std::int16_t{0};
    auto x_max = std::int16_t{0};
    auto y_max = std::int16_t{0};
    if(!points.empty())
    {
        x_min = x_max = points.front().x;
        y_min = y_max = points.front().y;
        for(auto const & p: points)
        {
            x_min = std::min(x_min, p.x);
            y_min = std::min(y_min, p.y);
            x_max = std::max(x_max, p.x);
            y_max = std::max(y_max, p.y);
        }
    }

    auto out = byte_writer{};
    out.i16(static_cast<std::int16_t>(contours.size()))
        .i16(x_min).i16(y_min).i16(x_max).i16(y_max);

    for(auto const e: end_points)
        out.u16(e);

    out.u16(static_cast<std::uint16_t>(instructions.size()));
    for(auto const i: instructions)
        out.u8(i);

    auto flags = std::vector<std::uint8_t>{};
    auto dxs = std::vector<int>{};
    auto dys = std::vector<int>{};
    auto prev_x = 0;
    auto prev_y = 0;
    for(auto const & p: points)
    {
        auto const dx = p.x - prev_x;
        auto const dy = p.y - prev_y;
        flags.push_back(static_cast<std::uint8_t>(
            (p.on_curve ? on_curve : 0) |
            delta_flags(dx, x_short, x_same_or_positive) |
            delta_flags(dy, y_short, y_same_or_positive)));
        dxs.push_back(dx);
        dys.push_back(dy);
        prev_x = p.x;
        prev_y = p.y;
    }

    for(auto i = std::size_t{0}; i < flags.size();)
    {
        auto run = std::size_t{1};
        while(i + run < flags.size() && flags[i + run] == flags[i] && run < 256)
        {
            ++run;
        }

        if(run > 2)
        {
            out.u8(flags[i] | repeat).u8(static_cast<std::uint8_t>(run - 1));
        }
        else
        {
            run = 1;
            out.u8(flags[i]);
        }
        i += run;
    }

    for(auto i = std::size_t{0}; i != flags.size(); ++i)
        write_delta(out, dxs[i], flags[i], x_short, x_same_or_positive);
    for(auto i = std::size_t{0}; i != flags.size(); ++i)
        write_delta(out, dys[i], flags[i], y_short, y_same_or_positive);

    return out.bytes();
}

std::vector<std::byte> encode_compound_glyph(
    std::vector<component_record> const & components,
    std::int16_t x_min, std::int16_t y_min,
    std::int16_t x_max, std::int16_t y_max)
{
    auto out = byte_writer{};
    out.i16(-1).i16(x_min).i16(y_min).i16(x_max).i16(y_max);

    for(auto i = std::size_t{0}; i != components.size(); ++i)
    {
        auto const & c = components[i];

        auto flags = static_cast<std::uint16_t>(c.extra_flags);
        if(!c.point_matching)
            flags |= ttglyph::args_are_xy_values;
        if(i + 1 != components.size())
            flags |= ttglyph::more_components;

        auto const words =
            c.dx < -128 || c.dx > 127 || c.dy < -128 || c.dy > 127;
        if(words)
            flags |= ttglyph::arg_1_and_arg_2_are_words;

        if(c.scale)
        {
            auto const & m = *c.scale;
            if(m.xy != 0.0f || m.yx != 0.0f)
                flags |= ttglyph::we_have_a_two_by_two;
            else if(m.xx != m.yy)
                flags |= ttglyph::we_have_an_x_and_y_scale;
            else
                flags |= ttglyph::we_have_a_scale;
        }

        out.u16(flags).u16(c.glyph_id);

        if(words)
            out.i16(c.dx).i16(c.dy);
        else
            out.i8(static_cast<std::int8_t>(c.dx)).i8(static_cast<std::int8_t>(c.dy));

        if(flags & ttglyph::we_have_a_two_by_two)
        {
            out.i16(to_f2dot14(c.scale->xx)).i16(to_f2dot14(c.scale->yx))
                .i16(to_f2dot14(c.scale->xy)).i16(to_f2dot14(c.scale->yy));
        }
        else if(flags & ttglyph::we_have_an_x_and_y_scale)
        {
            out.i16(to_f2dot14(c.scale->xx)).i16(to_f2dot14(c.scale->yy));
        }
        else if(flags & ttglyph::we_have_a_scale)
        {
            out.i16(to_f2dot14(c.scale->xx));
        }
    }

    return out.bytes();
}

std::uint16_t font_builder::add_glyph(
    std::vector<std::byte> data,
    std::uint16_t advance_width,
    std::int16_t left_side_bearing)
{
    glyphs.push_back(std::move(data));
    metrics.push_back({advance_width, left_side_bearing});
    return static_cast<std::uint16_t>(glyphs.size() - 1);
}

std::vector<std::byte> font_builder::build() const
{
    auto const num_glyphs = static_cast<std::uint16_t>(glyphs.size());
    auto tables = std::map<std::string, std::vector<std::byte>>{};

    auto head = byte_writer{};
    head.u32(0x00010000).u32(0x00010000).u32(0).u32(0x5F0F3CF5)
        .u16(0)
        .u16(units_per_em)
        .zeros(16)
        .i16(0).i16(descent)
        .i16(static_cast<std::int16_t>(units_per_em)).i16(ascent)
        .u16(0).u16(8).i16(2)
        .i16(index_to_loc_format)
        .i16(0);
    tables["head"] = head.bytes();

    auto maxp = byte_writer{};
    maxp.u32(0x00005000).u16(num_glyphs);
    tables["maxp"] = maxp.bytes();

    auto const nhm = number_of_h_metrics.value_or(
        static_cast<std::uint16_t>(metrics.size()));

    auto hhea = byte_writer{};
    hhea.u32(0x00010000).i16(ascent).i16(descent).i16(line_gap)
        .zeros(22)
        .i16(0)
        .u16(nhm);
    tables["hhea"] = hhea.bytes();

    auto hmtx = byte_writer{};
    for(auto i = std::size_t{0}; i != metrics.size(); ++i)
    {
        if(i < nhm)
        {
            hmtx.u16(metrics[i].advance_width).i16(metrics[i].left_side_bearing);
        }
        else if(hmtx_tail_bearings)
        {
            hmtx.i16(metrics[i].left_side_bearing);
        }
    }
    tables["hmtx"] = hmtx.bytes();

    auto glyf = byte_writer{};
    auto offsets = std::vector<std::uint32_t>{};
    for(auto const & g: glyphs)
    {
        offsets.push_back(static_cast<std::uint32_t>(glyf.size()));
        glyf.append(g).align(4);
    }
    offsets.push_back(static_cast<std::uint32_t>(glyf.size()));
    tables["glyf"] = glyf.bytes();

    auto loca = byte_writer{};
    for(auto const o: loca_offsets.value_or(offsets))
    {
        if(index_to_loc_format == 0)
            loca.u16(static_cast<std::uint16_t>(o / 2));
        else
            loca.u32(o);
    }
    tables["loca"] = loca.bytes();

    auto cmap_table = byte_writer{};
    cmap_table.u16(0).u16(1);
    if(cmap_format == 12)
    {
        cmap_table.u16(3).u16(10).u32(12).append(build_cmap_format12(cmap));
    }
    else
    {
        cmap_table.u16(3).u16(1).u32(12)
            .append(build_cmap_format4(cmap, cmap_use_glyph_array));
    }
    tables["cmap"] = cmap_table.bytes();

    for(auto const & [name, bytes]: raw_tables)
    {
        tables[name] = bytes;
    }
    for(auto const & name: omitted_tables)
    {
        tables.erase(name);
    }

    auto const num_tables = static_cast<std::uint16_t>(tables.size());
    auto entry_selector = std::uint16_t{0};
    while((2u << entry_selector) <= num_tables)
    {
        ++entry_selector;
    }
    auto const search_range = static_cast<std::uint16_t>(16u << entry_selector);

    auto out = byte_writer{};
    out.u32(sfnt_version)
        .u16(num_tables)
        .u16(search_range)
        .u16(entry_selector)
        .u16(static_cast<std::uint16_t>(num_tables * 16 - search_range));

    auto offset = static_cast<std::uint32_t>(12 + 16 * tables.size());
    for(auto const & [name, bytes]: tables)
    {
        out.tag(name.c_str())
            .u32(table_checksum(bytes))
            .u32(offset)
            .u32(static_cast<std::uint32_t>(bytes.size()));
        offset += static_cast<std::uint32_t>((bytes.size() + 3) & ~std::size_t{3});
    }

    for(auto const & [name, bytes]: tables)
    {
        out.append(bytes).align(4);
    }

    return out.bytes();
}

font_builder basic_font()
{
    auto f = font_builder{};

    f.add_glyph(
        encode_simple_glyph({{
            {50, 0, true}, {450, 0, true}, {450, 700, true}, {50, 700, true}}}),
        500, 50);

    auto const a = f.add_glyph(
        encode_simple_glyph({{{0, 0, true}, {600, 0, true}, {300, 700, true}}}),
        600, 0);

    auto const space = f.add_glyph({}, 250, 0);

    auto const b = f.add_glyph(
        encode_simple_glyph({{
            {0, 0, true}, {400, 0, true}, {400, 300, false}, {0, 300, true}}}),
        450, 0);

    f.cmap[U'A'] = a;
    f.cmap[U' '] = space;
    f.cmap[U'B'] = b;

    return f;
}

std::vector<std::byte> load_test_file(std::string const & name)
{
    auto const file = std::string{TTGLYPH_TEST_DATA_DIR} + "/" + name;
    auto fs = std::ifstream{file, std::ios::binary};
    if(!fs)
    {
        throw std::runtime_error{"cannot open " + file};
    }

    auto contents = std::vector<std::byte>{};
    std::transform(
        std::istreambuf_iterator<char>{fs}, std::istreambuf_iterator<char>{},
        std::back_inserter(contents),
        [](char c) { return static_cast<std::byte>(c); });
    return contents;
}

} /* namespace ttglyph_test */
