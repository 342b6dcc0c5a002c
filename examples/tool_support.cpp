#include "tool_support.hpp"

#include <fmt/format.h>
#include <fmt/chrono.h>

#include <algorithm>
#include <cstddef>
#include <cstdio>
#include <exception>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

namespace ttglyph_tools
{

namespace
{

std::ifstream open_input(std::filesystem::path const & file)
{
    auto fs = std::ifstream{file, std::ios::binary};
    if(!fs)
    {
        throw std::runtime_error{
            fmt::format("cannot open '{}'", file.string())};
    }

    return fs;
}

} /* namespace */

profiling_point::profiling_point(std::string_view const & name):
    m_name(name),
    m_start(std::chrono::high_resolution_clock::now())
{}

profiling_point::~profiling_point()
{
    auto const end = std::chrono::high_resolution_clock::now();
    try
    {
        fmt::print("Profiling: name={}, elapsed={}\n", m_name, end-m_start);
    }
    catch(std::exception const & e)
    {
        // Destructors must not throw.
        std::fputs(e.what(), stderr);
        std::fputc('\n', stderr);
    }
}

ttglyph::typeface load_font(std::filesystem::path const & file)
{
    profiling_point p{__FUNCTION__};

    using iterator = std::istreambuf_iterator<char>;
    auto fs = open_input(file);
    auto contents = std::vector<std::byte>{};
    std::transform(
        iterator{fs}, iterator{}, std::back_inserter(contents),
        [](auto c) { return static_cast<std::byte>(c); });

    return ttglyph::typeface{std::move(contents)};
}

icu::UnicodeString load_text_file(std::filesystem::path const & file)
{
    profiling_point p{__FUNCTION__};

    using iterator = std::istreambuf_iterator<char>;
    auto fs = open_input(file);
    auto contents = std::string{};
    std::copy(iterator{fs}, iterator{}, std::back_inserter(contents));
    return icu::UnicodeString::fromUTF8(contents);
}

} /* namespace ttglyph_tools */
