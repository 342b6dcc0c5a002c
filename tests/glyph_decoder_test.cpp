#include <catch2/catch.hpp>

#include "font_builder.hpp"
#include "glyph_decoder.hpp"

#include <ttglyph/error.hpp>
#include <ttglyph/path.hpp>

#include <variant>

using namespace ttglyph;
using ttglyph_test::byte_writer;
using ttglyph_test::component_record;
using ttglyph_test::contour_points;
using ttglyph_test::encode_compound_glyph;
using ttglyph_test::encode_simple_glyph;

namespace
{

constexpr std::uint16_t num_glyphs = 10;

decoded_glyph decode(std::vector<std::byte> const & bytes, std::uint16_t id = 5)
{
    return decode_glyph(
        byte_cursor{bytes.data(), bytes.size(), tag_from_c_string("glyf")},
        id, num_glyphs);
}

simple_outline decode_simple(std::vector<std::byte> const & bytes)
{
    auto const g = decode(bytes);
    auto const outline = std::get_if<simple_outline>(&g.data);
    REQUIRE(outline);
    return *outline;
}

compound_outline decode_compound(std::vector<std::byte> const & bytes)
{
    auto const g = decode(bytes);
    auto const outline = std::get_if<compound_outline>(&g.data);
    REQUIRE(outline);
    return *outline;
}

error_kind decode_error(std::vector<std::byte> const & bytes, std::uint16_t id = 5)
{
    try
    {
        static_cast<void>(decode(bytes, id));
    }
    catch(format_error const & e)
    {
        CHECK(e.table() == "glyf");
        return e.kind();
    }

    FAIL("glyph decoded");
    return error_kind::malformed_glyph;
}

std::vector<contour_points> contours_of(simple_outline const & outline)
{
    auto result = std::vector<contour_points>{};
    for(auto i = std::size_t{0}; i != outline.num_contours(); ++i)
    {
        auto const c = outline.contour(i);
        result.emplace_back(c.begin(), c.end());
    }
    return result;
}

std::vector<contour_points> const mixed_contours{
    {
        {0, 0, true}, {0, 0, false}, {-300, 12, true}, {-300, 12, true},
        {255, -255, false}, {-1, 256, true}, {32767, -32768, true},
        {32767, 100, false}
    },
    {
        {10, 10, true}, {20, 10, true}, {30, 10, true}, {40, 10, true},
        {50, 10, true}, {60, 10, true}
    },
    {
        {-5, -5, false}
    }
};

} /* namespace */

TEST_CASE("simple glyph header and contours", "[glyph_decoder]")
{
    auto const bytes = encode_simple_glyph({
        {{0, 0, true}, {600, 0, true}, {300, 700, true}},
        {{100, 100, true}, {200, 100, false}, {150, 300, true}, {120, 200, false}}});

    auto const g = decode(bytes);
    CHECK(g.description.x_min == 0);
    CHECK(g.description.y_min == 0);
    CHECK(g.description.x_max == 600);
    CHECK(g.description.y_max == 700);

    auto const outline = decode_simple(bytes);
    REQUIRE(outline.num_contours() == 2);
    CHECK(outline.end_points == std::vector<std::uint16_t>{2, 6});
    CHECK(outline.points.size() == 7);
    CHECK(outline.contour(0).size() == 3);
    CHECK(outline.contour(1).size() == 4);
    CHECK(outline.contour(1)[1] == outline_point{200, 100, false});
    CHECK(outline.contour(1)[3] == outline_point{120, 200, false});
}

TEST_CASE("every simple glyph satisfies the end point invariant", "[glyph_decoder]")
{
    auto const outline = decode_simple(encode_simple_glyph(mixed_contours));

    REQUIRE_FALSE(outline.end_points.empty());
    CHECK(outline.points.size() == outline.end_points.back() + 1u);
    for(auto i = std::size_t{1}; i < outline.end_points.size(); ++i)
    {
        CHECK(outline.end_points[i - 1] < outline.end_points[i]);
    }
}

TEST_CASE("coordinate deltas survive a decode and encode cycle", "[glyph_decoder]")
{
    auto const instructions = std::vector<std::uint8_t>{0xb0, 0x04, 0x2c};
    auto const original = encode_simple_glyph(mixed_contours, instructions);

    auto const outline = decode_simple(original);
    CHECK(contours_of(outline) == mixed_contours);
    CHECK(encode_simple_glyph(contours_of(outline), instructions) == original);
}

TEST_CASE("flag runs and short vectors", "[glyph_decoder]")
{
    // One contour of four on-curve points sharing a single repeated flag:
    // on-curve, both axes short and positive.
    auto bytes = byte_writer{};
    bytes.i16(1).i16(0).i16(0).i16(0).i16(0)
        .u16(3)
        .u16(0)
        .u8(0x3f).u8(3)
        .u8(1).u8(2).u8(3).u8(4)
        .u8(5).u8(6).u8(7).u8(8);

    auto const outline = decode_simple(bytes.bytes());
    REQUIRE(outline.points.size() == 4);
    CHECK(outline.points[0] == outline_point{1, 5, true});
    CHECK(outline.points[1] == outline_point{3, 11, true});
    CHECK(outline.points[2] == outline_point{6, 18, true});
    CHECK(outline.points[3] == outline_point{10, 26, true});
}

TEST_CASE("negative short vectors and repeated coordinates", "[glyph_decoder]")
{
    auto bytes = byte_writer{};
    bytes.i16(1).i16(0).i16(0).i16(0).i16(0)
        .u16(2)
        .u16(0)
        // x word 1000, y same
        .u8(0x21)
        // x short negative, y short negative, off-curve
        .u8(0x06)
        // x same, y word
        .u8(0x11)
        .i16(1000)
        .u8(200)
        .u8(50)
        .i16(-400);

    auto const outline = decode_simple(bytes.bytes());
    REQUIRE(outline.points.size() == 3);
    CHECK(outline.points[0] == outline_point{1000, 0, true});
    CHECK(outline.points[1] == outline_point{800, -50, false});
    CHECK(outline.points[2] == outline_point{800, -450, true});
}

TEST_CASE("hinting instructions are skipped", "[glyph_decoder]")
{
    auto const contours = std::vector<contour_points>{
        {{0, 0, true}, {10, 0, true}, {10, 10, false}}};

    auto const plain = decode_simple(encode_simple_glyph(contours));
    auto const hinted = decode_simple(encode_simple_glyph(
        contours, std::vector<std::uint8_t>(300, 0x4b)));

    CHECK(plain.points == hinted.points);
    CHECK(plain.end_points == hinted.end_points);
}

TEST_CASE("a glyph with zero contours decodes as an empty outline", "[glyph_decoder]")
{
    auto bytes = byte_writer{};
    bytes.i16(0).i16(0).i16(0).i16(0).i16(0);

    auto const outline = decode_simple(bytes.bytes());
    CHECK(outline.num_contours() == 0);
    CHECK(outline.points.empty());
    CHECK(outline_path(outline).empty());
}

TEST_CASE("malformed simple glyphs", "[glyph_decoder]")
{
    SECTION("end points not increasing")
    {
        auto bytes = byte_writer{};
        bytes.i16(2).i16(0).i16(0).i16(0).i16(0).u16(3).u16(3).u16(0)
            .u8(0x37).u8(0x37).u8(0x37).u8(0x37)
            .zeros(8);
        CHECK(decode_error(bytes.bytes()) == error_kind::malformed_glyph);
    }

    SECTION("flag repeat past the point count")
    {
        auto bytes = byte_writer{};
        bytes.i16(1).i16(0).i16(0).i16(0).i16(0).u16(3).u16(0)
            .u8(0x3f).u8(4)
            .zeros(10);
        CHECK(decode_error(bytes.bytes()) == error_kind::malformed_glyph);
    }

    SECTION("negative contour count other than -1")
    {
        auto bytes = byte_writer{};
        bytes.i16(-2).i16(0).i16(0).i16(0).i16(0).zeros(8);
        CHECK(decode_error(bytes.bytes()) == error_kind::malformed_glyph);
    }

    SECTION("coordinates cut short")
    {
        auto data = encode_simple_glyph(mixed_contours);
        data.resize(data.size() - 3);
        CHECK(decode_error(data) == error_kind::truncated_buffer);
    }

    SECTION("instructions longer than the glyph")
    {
        auto bytes = byte_writer{};
        bytes.i16(1).i16(0).i16(0).i16(0).i16(0).u16(0).u16(500).zeros(4);
        CHECK(decode_error(bytes.bytes()) == error_kind::truncated_buffer);
    }

    SECTION("header only")
    {
        auto bytes = byte_writer{};
        bytes.i16(1).i16(0).i16(0);
        CHECK(decode_error(bytes.bytes()) == error_kind::truncated_buffer);
    }
}

TEST_CASE("compound glyph components", "[glyph_decoder][compound]")
{
    auto const bytes = encode_compound_glyph({
        {1, 10, -20},
        {2, 1000, -2000, std::nullopt, use_my_metrics},
        {3, 0, 0, matrix_2x2{0.5f, 0.0f, 0.0f, 0.5f}},
        {4, 0, 0, matrix_2x2{1.5f, 0.0f, 0.0f, -1.0f}},
        {6, 5, 5, matrix_2x2{0.0f, 1.0f, -1.0f, 0.0f}}},
        -10, -20, 300, 400);

    auto const g = decode(bytes);
    CHECK(g.description.x_min == -10);
    CHECK(g.description.y_max == 400);

    auto const outline = decode_compound(bytes);
    REQUIRE(outline.components.size() == 5);

    auto const & c0 = outline.components[0];
    CHECK(c0.glyph_id == 1);
    CHECK(c0.dx == 10);
    CHECK(c0.dy == -20);
    CHECK_FALSE(c0.scale);
    CHECK_FALSE(c0.uses_my_metrics());
    CHECK((c0.flags & arg_1_and_arg_2_are_words) == 0);

    auto const & c1 = outline.components[1];
    CHECK(c1.glyph_id == 2);
    CHECK(c1.dx == 1000);
    CHECK(c1.dy == -2000);
    CHECK(c1.uses_my_metrics());
    CHECK((c1.flags & arg_1_and_arg_2_are_words) != 0);

    auto const & c2 = outline.components[2];
    REQUIRE(c2.scale);
    CHECK((c2.flags & we_have_a_scale) != 0);
    CHECK(c2.scale->xx == 0.5f);
    CHECK(c2.scale->yy == 0.5f);

    auto const & c3 = outline.components[3];
    REQUIRE(c3.scale);
    CHECK((c3.flags & we_have_an_x_and_y_scale) != 0);
    CHECK(c3.scale->xx == 1.5f);
    CHECK(c3.scale->yy == -1.0f);

    auto const & c4 = outline.components[4];
    REQUIRE(c4.scale);
    CHECK((c4.flags & we_have_a_two_by_two) != 0);
    CHECK(c4.scale->xx == 0.0f);
    CHECK(c4.scale->yx == 1.0f);
    CHECK(c4.scale->xy == -1.0f);
    CHECK(c4.scale->yy == 0.0f);

    CHECK((outline.components.back().flags & more_components) == 0);
}

TEST_CASE("component placement", "[glyph_decoder][compound]")
{
    auto c = component{};
    c.dx = 10;
    c.dy = 20;

    SECTION("translation only")
    {
        auto const t = c.placement();
        CHECK(t.apply(1.0f, 2.0f) == point{11.0f, 22.0f});
    }

    SECTION("offsets are not scaled by default")
    {
        c.scale = matrix_2x2{2.0f, 0.0f, 0.0f, 3.0f};
        auto const t = c.placement();
        CHECK(t.apply(1.0f, 1.0f) == point{12.0f, 23.0f});
    }

    SECTION("scaled component offset")
    {
        c.scale = matrix_2x2{2.0f, 0.0f, 0.0f, 3.0f};
        c.flags = scaled_component_offset;
        auto const t = c.placement();
        CHECK(t.apply(0.0f, 0.0f) == point{20.0f, 60.0f});
    }

    SECTION("unscaled component offset takes precedence")
    {
        c.scale = matrix_2x2{2.0f, 0.0f, 0.0f, 3.0f};
        c.flags = scaled_component_offset | unscaled_component_offset;
        auto const t = c.placement();
        CHECK(t.apply(0.0f, 0.0f) == point{10.0f, 20.0f});
    }
}

TEST_CASE("rejected compound glyphs", "[glyph_decoder][compound]")
{
    SECTION("point matching")
    {
        auto record = component_record{};
        record.glyph_id = 1;
        record.dx = 3;
        record.dy = 4;
        record.point_matching = true;
        CHECK(decode_error(encode_compound_glyph({{2, 0, 0}, record}))
            == error_kind::unsupported_compound_encoding);
    }

    SECTION("self reference")
    {
        CHECK(decode_error(encode_compound_glyph({{1, 0, 0}, {5, 0, 0}}), 5)
            == error_kind::component_cycle);
    }

    SECTION("component beyond the glyph count")
    {
        CHECK(decode_error(encode_compound_glyph({{num_glyphs, 0, 0}}))
            == error_kind::invalid_glyph_index);
        CHECK(decode_error(encode_compound_glyph({{0xffff, 0, 0}}))
            == error_kind::invalid_glyph_index);
    }

    SECTION("record cut short")
    {
        auto data = encode_compound_glyph({{1, 0, 0}, {2, 0, 0}});
        data.resize(data.size() - 1);
        CHECK(decode_error(data) == error_kind::truncated_buffer);
    }
}
