#ifndef DLIST_LOGGING_HPP
#define DLIST_LOGGING_HPP

#include <chrono>
#include <ctime>
#include <iostream>
#include <source_location>
#include <string_view>

#include <fmt/core.h>

namespace dlist {

// format string plus the call site; the location defaults to the caller
struct LogFormat {
    std::string_view text;
    std::source_location location;

    template<typename S>
    LogFormat(const S& s, const std::source_location& loc = std::source_location::current())
        : text(s), location(loc) {}
};

// variadic templates for multiple arguments.
template<typename... Args>
void log_message(LogFormat format, const Args&... args) {
    auto time_t_val = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()); // Get the current time and convert to "time_t".
    char time_str[20]; // create a buffer of characters.
    std::tm tm_val{};
    localtime_r(&time_t_val, &tm_val);
    std::strftime(time_str, sizeof(time_str), "%Y-%m-%d %H:%M:%S", &tm_val);

    std::cerr << fmt::format("[{}] {}:{} - ",
                             time_str,
                             format.location.file_name(),
                             format.location.line());

    std::cerr << fmt::vformat(format.text, fmt::make_format_args(args...)) << '\n';
}

} // namespace dlist

/*

Example Usage:
dlist::log_message("drained {} values, sum {}", 100, 1000);
dlist::log_message("list = {}", list);

Output:
[2026-10-19 18:05:12] main.cpp:5 - drained 100 values, sum 1000
[2026-10-19 18:05:12] main.cpp:6 - list = [10, 10, 10]

*/

#endif // DLIST_LOGGING_HPP
