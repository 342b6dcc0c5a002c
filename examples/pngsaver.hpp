#ifndef TTGLYPH_EXAMPLES_PNGSAVER_HPP
#define TTGLYPH_EXAMPLES_PNGSAVER_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>

/*
 * Writes an 8-bit grayscale image whose first row is the bottom row.
 * Throws std::runtime_error when the file cannot be written.
 */
void save_png(
    std::filesystem::path const & file, std::uint8_t const * data,
    std::size_t const width, std::size_t const height);

#endif /* TTGLYPH_EXAMPLES_PNGSAVER_HPP */
