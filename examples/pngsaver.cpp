#include "pngsaver.hpp"

#include <png.h>

#include <fmt/format.h>

#include <cstdio>
#include <memory>
#include <stdexcept>
#include <vector>

namespace
{

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

using unique_file_ptr = std::unique_ptr<FILE, file_closer>;

class png_writer
{
    public:
    png_writer():
        m_context{
            png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr)}
    {
        if(!m_context)
        {
            throw std::runtime_error{"png_create_write_struct failed"};
        }

        m_info = png_create_info_struct(m_context);
        if(!m_info)
        {
            png_destroy_write_struct(&m_context, nullptr);
            throw std::runtime_error{"png_create_info_struct failed"};
        }
    }

    png_writer(png_writer const &) = delete;
    png_writer & operator=(png_writer const &) = delete;

    ~png_writer()
    {
        png_destroy_write_struct(&m_context, &m_info);
    }

    png_structp context() const { return m_context; }
    png_infop info() const { return m_info; }

    private:
    png_structp m_context{nullptr};
    png_infop m_info{nullptr};
};

} /* namespace */

void save_png(
    std::filesystem::path const & file, std::uint8_t const * data,
    std::size_t const width, std::size_t const height)
{
    auto fp = unique_file_ptr{std::fopen(file.string().c_str(), "wb")};
    if(!fp)
    {
        throw std::runtime_error{
            fmt::format("cannot open '{}' for writing", file.string())};
    }

    auto const writer = png_writer{};

    auto row_pointers = std::vector<png_bytep>(height);
    for(auto y = std::size_t{0}; y < height; ++y)
    {
        row_pointers[y] =
            const_cast<png_bytep>(data + ((height-y-1) * width));
    }

    if(setjmp(png_jmpbuf(writer.context())))
    {
        throw std::runtime_error{
            fmt::format("PNG I/O failed for '{}'", file.string())};
    }

    png_init_io(writer.context(), fp.get());

    png_set_IHDR(
        writer.context(),
        writer.info(),
        static_cast<png_uint_32>(width),
        static_cast<png_uint_32>(height),
        8, // Bit-depth
        PNG_COLOR_TYPE_GRAY,
        PNG_INTERLACE_NONE,
        PNG_COMPRESSION_TYPE_BASE,
        PNG_FILTER_TYPE_BASE);
    png_write_info(writer.context(), writer.info());
    png_write_image(writer.context(), row_pointers.data());
    png_write_end(writer.context(), nullptr);
}
