#include "typeface_p.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <initializer_list>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace ttglyph
{

namespace
{

table_directory const & require_tables(table_directory const & directory)
{
    for(auto const tag: {"head", "maxp", "hhea", "hmtx", "loca", "glyf", "cmap"})
    {
        static_cast<void>(directory.require(tag));
    }

    return directory;
}

} /* namespace */

/* Class: typeface::implementation */
typeface::implementation::implementation(
    std::vector<std::byte> && data, font_options const & options):
    m_data{std::move(data)},
    m_directory{require_tables(table_directory{m_data})},
    m_options{options},
    m_head{head_table::parse(m_directory.cursor("head"))},
    m_maxp{maxp_table::parse(m_directory.cursor("maxp"))},
    m_hhea{hhea_table::parse(m_directory.cursor("hhea"), m_maxp.num_glyphs)},
    m_hmtx{hmtx_table::parse(
        m_directory.cursor("hmtx"),
        m_maxp.num_glyphs,
        m_hhea.number_of_h_metrics)},
    m_glyf{m_directory.require("glyf")},
    m_loca{loca_table::parse(
        m_directory.cursor("loca"),
        m_head.index_to_loc_format,
        m_maxp.num_glyphs,
        m_glyf.length)},
    m_cmap{character_map::parse(m_directory.cursor("cmap"), m_maxp.num_glyphs)}
{}

std::vector<table_info> typeface::implementation::tables() const
{
    auto result = std::vector<table_info>{};
    result.reserve(m_directory.entries().size());

    for(auto const & e: m_directory.entries())
    {
        result.push_back({to_string(e.tag), e.checksum, e.offset, e.length});
    }

    return result;
}

ttglyph::glyph typeface::implementation::decode(std::uint16_t id) const
{
    auto decoded = decode_outline(id);

    if(auto const compound = std::get_if<compound_outline>(&decoded.data))
    {
        auto chain = component_chain{id};
        auto validated = validated_components{};
        validate_components(*compound, chain, validated);
    }

    auto const hm = horizontal_metrics(id, decoded.data);
    return ttglyph::glyph{
        id,
        decoded.description,
        std::move(decoded.data),
        hm.advance_width,
        hm.left_side_bearing};
}

ttglyph::glyph_metrics
typeface::implementation::metrics(std::uint16_t id) const
{
    check_glyph_index(id);

    auto hm = m_hmtx[id];
    auto bounds = glyph_description{};

    if(auto bytes = glyph_bytes(id))
    {
        auto const header = glyph_header::parse(*bytes);
        bounds = header.bounds;

        if(header.number_of_contours == -1)
        {
            auto const data = glyph_data{
                decode_compound_outline(*bytes, id, m_maxp.num_glyphs)};
            hm = horizontal_metrics(id, data);
        }
    }

    return {
        static_cast<float>(hm.left_side_bearing),
        static_cast<float>(hm.advance_width),
        static_cast<float>(bounds.x_min),
        static_cast<float>(bounds.y_min),
        static_cast<float>(bounds.x_max),
        static_cast<float>(bounds.y_max)};
}

path typeface::implementation::glyph_path(std::uint16_t id) const
{
    auto result = path{};
    auto chain = component_chain{id};
    append_glyph_path(result, id, transform{}, chain);
    return result;
}

void typeface::implementation::check_glyph_index(std::uint16_t id) const
{
    if(id >= m_maxp.num_glyphs)
    {
        throw format_error{
            error_kind::invalid_glyph_index,
            fmt::format(
                "glyph {} out of range, font has {} glyphs",
                id, m_maxp.num_glyphs)};
    }
}

std::optional<byte_cursor>
typeface::implementation::glyph_bytes(std::uint16_t id) const
{
    auto const [begin, end] = m_loca.range(id);
    if(begin == end)
    {
        return std::nullopt;
    }

    return m_directory.cursor(m_glyf).window(begin, end - begin);
}

decoded_glyph typeface::implementation::decode_outline(std::uint16_t id) const
{
    check_glyph_index(id);

    auto bytes = glyph_bytes(id);
    if(!bytes)
    {
        return {glyph_description{}, empty_outline{}};
    }

    return decode_glyph(*bytes, id, m_maxp.num_glyphs);
}

long_hor_metric typeface::implementation::horizontal_metrics(
    std::uint16_t id, glyph_data const & data) const
{
    if(auto const compound = std::get_if<compound_outline>(&data))
    {
        auto const it = std::find_if(
            std::cbegin(compound->components),
            std::cend(compound->components),
            [](auto const & c) { return c.uses_my_metrics(); });

        if(it != std::cend(compound->components))
        {
            return m_hmtx[it->glyph_id];
        }
    }

    return m_hmtx[id];
}

void typeface::implementation::enter_component(
    component_chain & chain, std::uint16_t id) const
{
    if(std::find(std::cbegin(chain), std::cend(chain), id) != std::cend(chain))
    {
        throw format_error{
            error_kind::component_cycle,
            "glyf",
            fmt::format(
                "glyf: glyph {} is its own component via glyph {}",
                id, chain.back())};
    }

    if(chain.size() > m_options.max_component_depth)
    {
        throw format_error{
            error_kind::component_depth_exceeded,
            "glyf",
            fmt::format(
                "glyf: components of glyph {} nest deeper than {}",
                chain.front(), m_options.max_component_depth)};
    }

    chain.push_back(id);
}

void typeface::implementation::validate_components(
    compound_outline const & outline,
    component_chain & chain,
    validated_components & validated) const
{
    for(auto const & c: outline.components)
    {
        enter_component(chain, c.glyph_id);

        auto const it = validated.find(c.glyph_id);
        if(it == std::cend(validated) || it->second < chain.size())
        {
            if(auto bytes = glyph_bytes(c.glyph_id))
            {
                auto const header = glyph_header::parse(*bytes);
                if(header.number_of_contours == -1)
                {
                    auto const nested = decode_compound_outline(
                        *bytes, c.glyph_id, m_maxp.num_glyphs);
                    validate_components(nested, chain, validated);
                }
            }

            validated[c.glyph_id] = chain.size();
        }

        chain.pop_back();
    }
}

void typeface::implementation::append_glyph_path(
    path & out,
    std::uint16_t id,
    transform const & t,
    component_chain & chain) const
{
    auto const decoded = decode_outline(id);

    std::visit(
        [&](auto const & data)
        {
            using T = std::decay_t<decltype(data)>;
            if constexpr(std::is_same_v<T, simple_outline>)
            {
                out.add(outline_path(data), t);
            }
            else if constexpr(std::is_same_v<T, compound_outline>)
            {
                for(auto const & c: data.components)
                {
                    enter_component(chain, c.glyph_id);
                    append_glyph_path(
                        out, c.glyph_id, t.combined(c.placement()), chain);
                    chain.pop_back();
                }
            }
        },
        decoded.data);
}

/* Class: typeface */
typeface::typeface() = default;
typeface::typeface(typeface const &) = default;
typeface::typeface(typeface &&) noexcept = default;

typeface::typeface(
    std::vector<std::byte> && data, font_options const & options):
    m_impl{std::make_shared<implementation const>(std::move(data), options)}
{}

typeface::~typeface() = default;

typeface & typeface::operator=(typeface const &) = default;
typeface & typeface::operator=(typeface &&) noexcept = default;

typeface::operator bool() const noexcept
{
    return m_impl != nullptr;
}

typeface::implementation const & typeface::impl() const
{
    if(!m_impl)
    {
        throw std::logic_error{"typeface holds no font"};
    }

    return *m_impl;
}

std::uint16_t typeface::glyph_count() const
{
    return impl().glyph_count();
}

std::uint16_t typeface::units_per_em() const
{
    return impl().head().units_per_em;
}

loca_format typeface::index_to_loc_format() const
{
    return impl().head().index_to_loc_format;
}

glyph_description const & typeface::bounds() const
{
    return impl().head().bounds;
}

font_metrics const & typeface::metrics() const
{
    return impl().metrics();
}

std::vector<table_info> typeface::tables() const
{
    return impl().tables();
}

std::uint16_t typeface::glyph_index(char32_t codepoint) const
{
    return impl().glyph_index(codepoint);
}

glyph typeface::glyph(std::uint16_t id) const
{
    return impl().decode(id);
}

glyph_metrics typeface::glyph_metrics(std::uint16_t id) const
{
    return impl().metrics(id);
}

advance_metrics typeface::horizontal_metrics(std::uint16_t id) const
{
    return impl().hmtx(id);
}

path typeface::glyph_path(std::uint16_t id) const
{
    return impl().glyph_path(id);
}

typeface parse(std::vector<std::byte> data, font_options const & options)
{
    return typeface{std::move(data), options};
}

} /* namespace ttglyph */
