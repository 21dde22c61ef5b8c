#pragma once

#include <cstdint>
#include <source_location>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace opfwd::log {

    using namespace std::string_view_literals;

    enum class level : uint8_t { debug, info, warn, error };

    inline constexpr std::string_view to_string(level lvl) {
        switch (lvl) {
            case level::debug:
                return "DEBUG"sv;
            case level::info:
                return "INFO"sv;
            case level::warn:
                return "WARN"sv;
            case level::error:
                return "ERROR"sv;
        }
        return "INFO"sv;
    }

    bool try_parse_level(std::string_view text, level& out);

    void set_threshold(level lvl);
    level threshold();

    inline bool enabled(level lvl) {
        return static_cast<uint8_t>(lvl) >= static_cast<uint8_t>(threshold());
    }

    // Writes one complete line to stderr; lines from concurrent threads never interleave.
    void emit(level lvl, const std::source_location& loc, std::string_view message);

    namespace detail {
        template <typename... Args>
        void write(level lvl, const std::source_location& loc, Args&&... args) {
            if (!enabled(lvl)) {
                return;
            }
            std::ostringstream os{};
            (os << ... << std::forward<Args>(args));
            emit(lvl, loc, os.str());
        }
    }  // namespace detail

    template <typename... Args>
    struct debug {
        explicit debug(Args&&... args, const std::source_location& loc = std::source_location::current()) {
            detail::write(level::debug, loc, std::forward<Args>(args)...);
        }
    };

    template <typename... Args>
    struct info {
        explicit info(Args&&... args, const std::source_location& loc = std::source_location::current()) {
            detail::write(level::info, loc, std::forward<Args>(args)...);
        }
    };

    template <typename... Args>
    struct warn {
        explicit warn(Args&&... args, const std::source_location& loc = std::source_location::current()) {
            detail::write(level::warn, loc, std::forward<Args>(args)...);
        }
    };

    template <typename... Args>
    struct error {
        explicit error(Args&&... args, const std::source_location& loc = std::source_location::current()) {
            detail::write(level::error, loc, std::forward<Args>(args)...);
        }
    };

    // deduction guides
    template <typename... Args>
    debug(Args&&...) -> debug<Args...>;
    template <typename... Args>
    info(Args&&...) -> info<Args...>;
    template <typename... Args>
    warn(Args&&...) -> warn<Args...>;
    template <typename... Args>
    error(Args&&...) -> error<Args...>;

}  // namespace opfwd::log
