#include "opfwd/log.hpp"

#include "opfwd/utils.hpp"

#include <atomic>
#include <chrono>
#include <format>
#include <iostream>
#include <mutex>

namespace opfwd::log {

    namespace detail {
        static std::atomic<level> current_threshold{level::info};

        // never destroyed: detached connection workers may still log while the process exits
        static std::mutex& output_mutex() {
            static auto* m = new std::mutex{};
            return *m;
        }

        static constexpr std::string_view sloc_fname(const std::source_location& loc) {
            std::string_view sv{loc.file_name()};
            if (auto p = sv.rfind('/'); p != sv.npos) {
                sv.remove_prefix(p + 1);
            }
            return sv;
        }
    }  // namespace detail

    bool try_parse_level(std::string_view text, level& out) {
        if (utils::str_case_eq(text, "debug"sv)) {
            out = level::debug;
            return true;
        }
        if (utils::str_case_eq(text, "info"sv)) {
            out = level::info;
            return true;
        }
        if (utils::str_case_eq(text, "warn"sv) || utils::str_case_eq(text, "warning"sv)) {
            out = level::warn;
            return true;
        }
        if (utils::str_case_eq(text, "error"sv)) {
            out = level::error;
            return true;
        }
        return false;
    }

    void set_threshold(level lvl) {
        detail::current_threshold.store(lvl, std::memory_order_relaxed);
    }

    level threshold() {
        return detail::current_threshold.load(std::memory_order_relaxed);
    }

    void emit(level lvl, const std::source_location& loc, std::string_view message) {
        auto now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
        auto line = std::format(
                "{:%Y-%m-%d %H:%M:%S} [{}] [{}:{}] {}\n",
                now,
                to_string(lvl),
                detail::sloc_fname(loc),
                loc.line(),
                message);

        std::lock_guard lock{detail::output_mutex()};
        std::cerr << line << std::flush;
    }

}  // namespace opfwd::log
