#ifndef TTGLYPH_RASTERIZER_HPP
#define TTGLYPH_RASTERIZER_HPP

#include <ttglyph/export.hpp>
#include <ttglyph/path.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>

namespace ttglyph
{

/*
 * Renders paths into an 8-bit coverage image using the non-zero winding
 * rule. Row 0 of the image is y = 0 of the path, so rows grow upwards like
 * font units do. Rendering combines with existing pixels by taking the
 * maximum coverage.
 */
class TTGLYPH_EXPORT rasterizer
{
    public:
    rasterizer();
    rasterizer(rasterizer const &) = delete;
    rasterizer(rasterizer &&) noexcept;

    rasterizer(
        std::uint8_t * image,
        std::size_t width,
        std::size_t height,
        std::ptrdiff_t stride);

    ~rasterizer();

    rasterizer & operator=(rasterizer const &) = delete;
    rasterizer & operator=(rasterizer &&) noexcept;

    /* Curves are flattened with `tolerance`, in pixels. */
    void rasterize(
        path const & p, float x, float y, float tolerance = 0.25f) const;

    private:
    class implementation;

    std::unique_ptr<implementation> m_impl;
};

} /* namespace ttglyph */

#endif /* TTGLYPH_RASTERIZER_HPP */
