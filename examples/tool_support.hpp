#ifndef TTGLYPH_EXAMPLES_TOOL_SUPPORT_HPP
#define TTGLYPH_EXAMPLES_TOOL_SUPPORT_HPP

#include <ttglyph/typeface.hpp>

#include <unicode/unistr.h>

#include <chrono>
#include <filesystem>
#include <string_view>

namespace ttglyph_tools
{

/* Prints the time spent in its scope when destroyed. */
class profiling_point
{
    public:
    profiling_point() = delete;
    profiling_point(profiling_point const &) = delete;
    profiling_point(profiling_point &&) = delete;

    explicit profiling_point(std::string_view const & name);
    ~profiling_point();

    private:
    std::string_view m_name;
    std::chrono::high_resolution_clock::time_point m_start;
};

/* Throws std::runtime_error if the file can't be read. */
ttglyph::typeface load_font(std::filesystem::path const & file);
icu::UnicodeString load_text_file(std::filesystem::path const & file);

} /* namespace ttglyph_tools */

#endif /* TTGLYPH_EXAMPLES_TOOL_SUPPORT_HPP */
