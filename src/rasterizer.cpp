#include <ttglyph/rasterizer.hpp>
#include <ttglyph/assert.hpp>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace ttglyph
{

/* Class: rasterizer::implementation */
class rasterizer::implementation
{
    public:
    implementation(
        std::uint8_t * image,
        std::size_t width,
        std::size_t height,
        std::ptrdiff_t stride):
        m_image{image},
        m_width{width},
        m_height{height},
        m_stride{stride}
    {}

    void rasterize(path const & p, float x_offset, float y_offset) const;

    private:
    struct line_segment
    {
        point from;
        point to;
    };

    /*
     * Signed area accumulation. Each edge deposits, for every row it
     * crosses, the change in coverage it causes at each column; a running
     * sum along the row yields the winding-weighted coverage.
     */
    class accumulator
    {
        public:
        accumulator(std::size_t width, std::size_t height):
            m_width{width},
            m_height{height},
            m_cells((width + 2) * height, 0.0f)
        {}

        void add_line(point p0, point p1);

        [[nodiscard]] float const * row(std::size_t y) const
        {
            return &m_cells[y * (m_width + 2)];
        }

        private:
        void add(std::size_t y, std::ptrdiff_t x, float v)
        {
            auto const cx = std::clamp<std::ptrdiff_t>(
                x, 0, static_cast<std::ptrdiff_t>(m_width + 1));
            m_cells[y * (m_width + 2) + static_cast<std::size_t>(cx)] += v;
        }

        std::size_t m_width;
        std::size_t m_height;
        std::vector<float> m_cells;
    };

    [[nodiscard]] static std::vector<line_segment> create_lines(
        path const & flat, float x_offset, float y_offset);

    std::uint8_t * m_image{nullptr};
    std::size_t m_width{0};
    std::size_t m_height{0};
    std::ptrdiff_t m_stride{0};
}; /* class rasterizer::implementation */

void rasterizer::implementation::accumulator::add_line(point p0, point p1)
{
    if(p0.y == p1.y)
        return;

    auto const dir = p0.y < p1.y ? 1.0f : -1.0f;
    if(p0.y > p1.y)
    {
        std::swap(p0, p1);
    }

    auto const height = static_cast<float>(m_height);
    if(p1.y <= 0.0f || p0.y >= height)
        return;

    auto const dxdy = (p1.x - p0.x) / (p1.y - p0.y);
    auto x = p0.x;
    auto y0 = p0.y;
    if(y0 < 0.0f)
    {
        x -= y0 * dxdy;
        y0 = 0.0f;
    }
    auto const y1 = std::min(p1.y, height);

    auto const width = static_cast<float>(m_width);
    auto const first_row = static_cast<std::size_t>(std::floor(y0));
    auto const last_row = static_cast<std::size_t>(std::ceil(y1));

    for(auto y = first_row; y < last_row; ++y)
    {
        auto const fy = static_cast<float>(y);
        auto const dy = std::min(fy + 1.0f, y1) - std::max(fy, y0);
        auto const x_next = x + dxdy * dy;
        auto const d = dy * dir;

        auto const xa = std::clamp(std::min(x, x_next), 0.0f, width);
        auto const xb = std::clamp(std::max(x, x_next), 0.0f, width);
        auto const xa_floor = std::floor(xa);
        auto const xb_ceil = std::ceil(xb);
        auto const xa_i = static_cast<std::ptrdiff_t>(xa_floor);
        auto const xb_i = static_cast<std::ptrdiff_t>(xb_ceil);

        if(xb_i <= xa_i + 1)
        {
            // Edge stays within one column on this row.
            auto const xm = 0.5f * (xa + xb) - xa_floor;
            add(y, xa_i, d - d * xm);
            add(y, xa_i + 1, d * xm);
        }
        else
        {
            auto const s = 1.0f / (xb - xa);
            auto const xa_f = xa - xa_floor;
            auto const a0 = 0.5f * s * (1.0f - xa_f) * (1.0f - xa_f);
            auto const xb_f = xb - xb_ceil + 1.0f;
            auto const am = 0.5f * s * xb_f * xb_f;

            add(y, xa_i, d * a0);
            if(xb_i == xa_i + 2)
            {
                add(y, xa_i + 1, d * (1.0f - a0 - am));
            }
            else
            {
                auto const a1 = s * (1.5f - xa_f);
                add(y, xa_i + 1, d * (a1 - a0));
                for(auto xi = xa_i + 2; xi < xb_i - 1; ++xi)
                {
                    add(y, xi, d * s);
                }
                auto const a2 = a1 + static_cast<float>(xb_i - xa_i - 3) * s;
                add(y, xb_i - 1, d * (1.0f - a2 - am));
            }
            add(y, xb_i, d * am);
        }

        x = x_next;
    }
}

void rasterizer::implementation::rasterize(
    path const & p, float x_offset, float y_offset) const
{
    auto const start_x = std::max(0.0f, std::floor(p.min_x() + x_offset));
    auto const start_y = std::max(0.0f, std::floor(p.min_y() + y_offset));
    auto const end_x = std::min(
        static_cast<float>(m_width), std::ceil(p.max_x() + x_offset));
    auto const end_y = std::min(
        static_cast<float>(m_height), std::ceil(p.max_y() + y_offset));

    // Early exit, if path is out of bounds
    if(p.empty() || start_x >= end_x || start_y >= end_y)
        return;

    auto const x0 = static_cast<std::size_t>(start_x);
    auto const y0 = static_cast<std::size_t>(start_y);
    auto const w = static_cast<std::size_t>(end_x) - x0;
    auto const h = static_cast<std::size_t>(end_y) - y0;

    auto acc = accumulator{w, h};
    for(auto const & l: create_lines(p, x_offset - start_x, y_offset - start_y))
    {
        acc.add_line(l.from, l.to);
    }

    for(auto y = std::size_t{0}; y != h; ++y)
    {
        auto const cells = acc.row(y);
        auto const row_start = static_cast<std::ptrdiff_t>(y0 + y) * m_stride;
        auto * out = m_image + row_start + static_cast<std::ptrdiff_t>(x0);

        auto coverage = 0.0f;
        for(auto x = std::size_t{0}; x != w; ++x)
        {
            coverage += cells[x];
            auto const c = std::min(std::abs(coverage), 1.0f);
            auto const v = static_cast<std::uint8_t>(
                std::min(255, static_cast<int>(c * 255.0f + 0.5f)));
            out[x] = std::max(out[x], v);
        }
    }
}

std::vector<rasterizer::implementation::line_segment>
rasterizer::implementation::create_lines(
    path const & flat, float x_offset, float y_offset)
{
    TTGLYPH_ASSERT(flat.flat());

    std::vector<line_segment> lines;
    lines.reserve(flat.size());

    auto const offset = [x_offset, y_offset](point q)
    {
        return point{q.x + x_offset, q.y + y_offset};
    };

    auto start = point{0.0f, 0.0f};
    auto current = start;

    for(auto const & cmd: flat)
    {
        auto const to = offset(cmd.end);
        if(cmd.verb == path_verb::move_to)
        {
            if(current != start)
            {
                lines.push_back({current, start});
            }
            start = current = to;
            continue;
        }

        lines.push_back({current, to});
        current = to;
    }

    if(current != start)
    {
        lines.push_back({current, start});
    }

    return lines;
}

/* Class: rasterizer */
rasterizer::rasterizer() = default;
rasterizer::rasterizer(rasterizer &&) noexcept = default;

rasterizer::rasterizer(
    std::uint8_t * image,
    std::size_t width,
    std::size_t height,
    std::ptrdiff_t stride):
    m_impl{std::make_unique<implementation>(image, width, height, stride)}
{}

rasterizer::~rasterizer() = default;

rasterizer & rasterizer::operator=(rasterizer &&) noexcept = default;

void rasterizer::rasterize(
    path const & p, float x_offset, float y_offset, float tolerance) const
{
    if(!m_impl)
        return;

    if(!p.flat())
    {
        rasterize(p.flatten(tolerance), x_offset, y_offset, tolerance);
        return;
    }

    m_impl->rasterize(p, x_offset, y_offset);
}

} /* namespace ttglyph */
