#ifndef TTGLYPH_FONT_DATA_HPP
#define TTGLYPH_FONT_DATA_HPP

#include <ttglyph/assert.hpp>
#include <ttglyph/error.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace ttglyph
{

using tag_t = std::array<std::uint8_t, 4>;

enum class platform_id: std::uint16_t
{
    unicode = 0,
    macintosh = 1,
    iso = 2,
    windows = 3,
    custom = 4
};

enum simple_glyph_flags: std::uint8_t
{
    on_curve_point = 0x01,
    x_short_vector = 0x02,
    y_short_vector = 0x04,
    repeat_flag = 0x08,
    x_is_same_or_positive_x_short_vector = 0x10,
    y_is_same_or_positive_y_short_vector = 0x20,
    overlap_simple = 0x40
};

inline tag_t tag_from_c_string(char const * str)
{
    TTGLYPH_ASSERT(std::strlen(str) == 4);

    auto begin = reinterpret_cast<std::uint8_t const *>(str);
    return tag_t{begin[0], begin[1], begin[2], begin[3]};
}

inline std::string to_string(tag_t const & tag)
{
    return std::string(tag.begin(), tag.end());
}

namespace detail
{

template <typename T>
T extract(std::byte const * data)
{
    using U = std::make_unsigned_t<T>;
    static constexpr auto size = sizeof(T);

    auto v = U{0};

    for(auto i = std::size_t{0}; i != size; ++i)
    {
        v = static_cast<U>(static_cast<U>(v<<8) | std::to_integer<U>(data[i]));
    }

    return static_cast<T>(v);
}

template<>
inline tag_t extract<tag_t>(std::byte const * data)
{
    return tag_t{
        std::to_integer<std::uint8_t>(data[0]),
        std::to_integer<std::uint8_t>(data[1]),
        std::to_integer<std::uint8_t>(data[2]),
        std::to_integer<std::uint8_t>(data[3])};
}

} /* namespace detail */

/*
 * Big-endian reader over a window of the font buffer. Every access is
 * checked against the window; reading past it throws format_error with
 * kind truncated_buffer naming the table the window belongs to.
 */
class byte_cursor
{
    public:
    byte_cursor(std::byte const * data, std::size_t size, tag_t table):
        m_data{data}, m_size{size}, m_table{table}
    {}

    template <typename T>
    [[nodiscard]] T peek(std::size_t offs = 0) const
    {
        require(m_offset + offs, sizeof(T));
        return detail::extract<T>(m_data + m_offset + offs);
    }

    template <typename T>
    T read()
    {
        auto const v = peek<T>();
        m_offset += sizeof(T);
        return v;
    }

    void skip(std::size_t count)
    {
        require(m_offset, count);
        m_offset += count;
    }

    void seek(std::size_t offset)
    {
        require(offset, 0);
        m_offset = offset;
    }

    /* Cursor over [offset, offset+length) of this window. */
    [[nodiscard]] byte_cursor window(
        std::size_t offset, std::size_t length) const
    {
        require(offset, length);
        return byte_cursor{m_data + offset, length, m_table};
    }

    [[nodiscard]] byte_cursor window_from(std::size_t offset) const
    {
        require(offset, 0);
        return byte_cursor{m_data + offset, m_size - offset, m_table};
    }

    [[nodiscard]] std::size_t offset() const noexcept { return m_offset; }
    [[nodiscard]] std::size_t size() const noexcept { return m_size; }
    [[nodiscard]] std::size_t remaining() const noexcept
    {
        return m_size - m_offset;
    }
    [[nodiscard]] tag_t const & table() const noexcept { return m_table; }

    private:
    void require(std::size_t offset, std::size_t count) const
    {
        if(offset > m_size || count > m_size - offset)
        {
            truncated(offset, count);
        }
    }

    [[noreturn]] void truncated(std::size_t offset, std::size_t count) const;

    std::byte const * m_data;
    std::size_t m_size;
    std::size_t m_offset{0};
    tag_t m_table;
}; /* class byte_cursor */

struct font_data
{
    font_data() = delete;
    font_data(font_data const &) = delete;
    font_data(font_data &&) = delete;

    explicit font_data(std::vector<std::byte> && data):
        bytes{std::move(data)}
    {}

    ~font_data() = default;

    font_data & operator=(font_data const &) = delete;
    font_data & operator=(font_data &&) = delete;

    [[nodiscard]] byte_cursor create_cursor(tag_t table) const
    {
        return byte_cursor{bytes.data(), bytes.size(), table};
    }

    std::vector<std::byte> const bytes;
};

} /* namespace ttglyph */

#endif /* TTGLYPH_FONT_DATA_HPP */
