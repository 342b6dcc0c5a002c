#ifndef TTGLYPH_TYPEFACE_P_HPP
#define TTGLYPH_TYPEFACE_P_HPP

#include <ttglyph/typeface.hpp>
#include "character_map.hpp"
#include "font_data.hpp"
#include "glyph_decoder.hpp"
#include "table_directory.hpp"
#include "tables.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <vector>

namespace ttglyph
{

class typeface::implementation
{
    public:
    implementation() = delete;
    implementation(implementation const &) = delete;
    implementation(implementation &&) = delete;

    implementation(std::vector<std::byte> && data, font_options const & options);

    implementation & operator=(implementation const &) = delete;
    implementation & operator=(implementation &&) = delete;

    [[nodiscard]] std::uint16_t glyph_count() const noexcept
    {
        return m_maxp.num_glyphs;
    }

    [[nodiscard]] head_table const & head() const noexcept { return m_head; }

    [[nodiscard]] font_metrics const & metrics() const noexcept
    {
        return m_hhea.metrics;
    }

    [[nodiscard]] std::vector<table_info> tables() const;

    [[nodiscard]] std::uint16_t glyph_index(char32_t codepoint) const
    {
        return m_cmap.glyph_index(codepoint);
    }

    [[nodiscard]] advance_metrics hmtx(std::uint16_t id) const
    {
        check_glyph_index(id);
        auto const & hm = m_hmtx[id];
        return {hm.advance_width, hm.left_side_bearing};
    }

    [[nodiscard]] ttglyph::glyph decode(std::uint16_t id) const;
    [[nodiscard]] ttglyph::glyph_metrics metrics(std::uint16_t id) const;
    [[nodiscard]] path glyph_path(std::uint16_t id) const;

    private:
    using component_chain = std::vector<std::uint16_t>;

    /* Glyph id to the deepest chain length its components passed at. A
     * glyph that passed at some depth passes at any shallower one. */
    using validated_components = std::map<std::uint16_t, std::size_t>;

    void check_glyph_index(std::uint16_t id) const;

    /* nullopt for glyphs without outline data. */
    [[nodiscard]] std::optional<byte_cursor> glyph_bytes(std::uint16_t id) const;

    [[nodiscard]] decoded_glyph decode_outline(std::uint16_t id) const;

    [[nodiscard]] long_hor_metric horizontal_metrics(
        std::uint16_t id, glyph_data const & data) const;

    void enter_component(component_chain & chain, std::uint16_t id) const;

    void validate_components(
        compound_outline const & outline,
        component_chain & chain,
        validated_components & validated) const;

    void append_glyph_path(
        path & out,
        std::uint16_t id,
        transform const & t,
        component_chain & chain) const;

    font_data m_data;
    table_directory m_directory;
    font_options m_options;
    head_table m_head;
    maxp_table m_maxp;
    hhea_table m_hhea;
    hmtx_table m_hmtx;
    table_entry m_glyf;
    loca_table m_loca;
    character_map m_cmap;
}; /* class typeface::implementation */

} /* namespace ttglyph */

#endif /* TTGLYPH_TYPEFACE_P_HPP */
