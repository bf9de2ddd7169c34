#include <charconv>      // std::from_chars
#include <cstddef>       // std::size_t
#include <exception>     // std::exception
#include <iostream>      // std::cerr
#include <string_view>   // std::string_view
#include <system_error>  // std::errc

#include "dlist/dlist.hpp"

namespace {

struct DemoConfig {
    std::size_t count = dlist::DEFAULT_DEMO_COUNT;
    int value = dlist::DEFAULT_DEMO_VALUE;
};

template<typename N>
dlist::Result<N> parse_number(std::string_view text) {
    N out{};
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    if (ec != std::errc{} || end != text.data() + text.size()) {
        return std::unexpected(std::make_error_code(std::errc::invalid_argument));
    }
    return out;
}

// usage: dlist_demo [count] [value]
dlist::Result<DemoConfig> parse_args(int argc, char* argv[]) {
    DemoConfig config;
    if (argc > 3) {
        return std::unexpected(std::make_error_code(std::errc::invalid_argument));
    }
    if (argc > 1) {
        auto count = parse_number<std::size_t>(argv[1]);
        if (!count) return std::unexpected(count.error());
        config.count = *count;
    }
    if (argc > 2) {
        auto value = parse_number<int>(argv[2]);
        if (!value) return std::unexpected(value.error());
        config.value = *value;
    }
    return config;
}

template<typename List>
void run_engine(std::string_view name, const DemoConfig& config) {
    auto list = dlist::make_list<List>(config.value, config.count);
    if (config.count <= 10) {
        dlist::log_message("{}: {}", name, list);
    }

    long long sum = 0;
    for (auto& value : list.drain()) {
        sum += value;
    }
    dlist::log_message("{}: drained {} values, sum {}, empty afterwards: {}",
                       name, config.count, sum, list.empty());
}

// holding a mutable peek while removing the same node is a contract violation
void show_borrow_conflict() {
    auto list = dlist::make_list<dlist::SharedLinkedList<int>>({1, 2, 3});
    auto front = list.peek_front_mut();
    try {
        static_cast<void>(list.pop_front());
    } catch (const dlist::BorrowError& e) {
        dlist::log_message("shared engine rejected pop_front: {} (list still {})", e.what(), list.size());
    }
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        auto config = parse_args(argc, argv);
        if (!config) {
            dlist::log_message("usage: {} [count] [value] ({})", argv[0], config.error().message());
            return 1;
        }

        run_engine<dlist::LinkedList<int>>("manual", *config);
        run_engine<dlist::SharedLinkedList<int>>("shared", *config);
        run_engine<dlist::ArenaLinkedList<int>>("arena", *config);
        show_borrow_conflict();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
