#ifndef TTGLYPH_TRANSFORM_HPP
#define TTGLYPH_TRANSFORM_HPP

#include <ttglyph/export.hpp>

namespace ttglyph
{

struct TTGLYPH_EXPORT point
{
    float x;
    float y;

    [[nodiscard]] friend constexpr bool operator==(point a, point b) noexcept
    {
        return a.x == b.x && a.y == b.y;
    }

    [[nodiscard]] friend constexpr bool operator!=(point a, point b) noexcept
    {
        return !(a == b);
    }
};

/* Column-major 2x2: x' = xx*x + xy*y, y' = yx*x + yy*y */
struct TTGLYPH_EXPORT matrix_2x2
{
    float xx{1.0f};
    float yx{0.0f};
    float xy{0.0f};
    float yy{1.0f};

    [[nodiscard]] constexpr bool is_identity() const noexcept
    {
        return xx == 1.0f && yx == 0.0f && xy == 0.0f && yy == 1.0f;
    }
};

struct TTGLYPH_EXPORT transform
{
    matrix_2x2 m{};
    float tx{0.0f};
    float ty{0.0f};

    [[nodiscard]] static constexpr transform
    from_scale_translate(float scale, point translate) noexcept
    {
        return {{scale, 0.0f, 0.0f, scale}, translate.x, translate.y};
    }

    [[nodiscard]] static constexpr transform
    from_scale_translate(point scale, point translate) noexcept
    {
        return {{scale.x, 0.0f, 0.0f, scale.y}, translate.x, translate.y};
    }

    [[nodiscard]] constexpr point apply(float x, float y) const noexcept
    {
        return {m.xx*x + m.xy*y + tx, m.yx*x + m.yy*y + ty};
    }

    [[nodiscard]] constexpr point apply(point p) const noexcept
    {
        return apply(p.x, p.y);
    }

    /* Transform equivalent to applying `inner` first, then *this. */
    [[nodiscard]] constexpr transform
    combined(transform const & inner) const noexcept
    {
        return {
            {
                m.xx*inner.m.xx + m.xy*inner.m.yx,
                m.yx*inner.m.xx + m.yy*inner.m.yx,
                m.xx*inner.m.xy + m.xy*inner.m.yy,
                m.yx*inner.m.xy + m.yy*inner.m.yy
            },
            m.xx*inner.tx + m.xy*inner.ty + tx,
            m.yx*inner.tx + m.yy*inner.ty + ty
        };
    }
}; /* struct transform */

} /* namespace ttglyph */

#endif /* TTGLYPH_TRANSFORM_HPP */
