#pragma once

/**
 * @file print.hpp
 * @brief std::print / std::println for standard libraries that ship <format> without <print>
 */

#if __has_include(<print>)
    #include <print>
#else
    #include <cstdio>
    #include <format>
    #include <string>
    #include <utility>

namespace std {

template <typename... Args>
void print(std::format_string<Args...> fmt, Args&&... args)
{
    const auto text = std::format(fmt, std::forward<Args>(args)...);
    std::fwrite(text.data(), 1, text.size(), stdout);
}

template <typename... Args>
void print(FILE* stream, std::format_string<Args...> fmt, Args&&... args)
{
    const auto text = std::format(fmt, std::forward<Args>(args)...);
    std::fwrite(text.data(), 1, text.size(), stream);
}

template <typename... Args>
void println(std::format_string<Args...> fmt, Args&&... args)
{
    auto text = std::format(fmt, std::forward<Args>(args)...);
    text.push_back('\n');
    std::fwrite(text.data(), 1, text.size(), stdout);
}

template <typename... Args>
void println(FILE* stream, std::format_string<Args...> fmt, Args&&... args)
{
    auto text = std::format(fmt, std::forward<Args>(args)...);
    text.push_back('\n');
    std::fwrite(text.data(), 1, text.size(), stream);
}

}  // namespace std
#endif
