#pragma once

#include <algorithm>
#include <array>
#include <format>
#include <ranges>
#include <string>
#include <string_view>
#include <vector>

namespace opfwd {

    namespace utils {
        inline constexpr std::string_view whitespace{" \t\r\n\v\f"};

        constexpr char char_tolower(char c) {
            if (c >= 'A' && c <= 'Z') {
                return c + ('a' - 'A');
            }
            return c;
        }

        constexpr bool str_case_eq(std::string_view lhs, std::string_view rhs) {
            return std::ranges::equal(
                    lhs | std::views::transform(char_tolower), rhs | std::views::transform(char_tolower));
        }

        constexpr std::string_view trim_view(std::string_view value) {
            auto first = value.find_first_not_of(whitespace);
            if (first == std::string_view::npos) {
                return {};
            }
            auto last = value.find_last_not_of(whitespace);
            return value.substr(first, (last - first) + 1U);
        }

        // Plain whitespace tokenization: no quote or escape handling.
        inline std::vector<std::string> split_whitespace(std::string_view value) {
            std::vector<std::string> tokens{};
            std::size_t pos = 0;
            while (pos < value.size()) {
                auto start = value.find_first_not_of(whitespace, pos);
                if (start == std::string_view::npos) {
                    break;
                }
                auto end = value.find_first_of(whitespace, start);
                if (end == std::string_view::npos) {
                    end = value.size();
                }
                tokens.emplace_back(value.substr(start, end - start));
                pos = end;
            }
            return tokens;
        }

        inline std::string join_with_separator(const std::vector<std::string>& values, std::string_view separator) {
            if (values.empty()) {
                return {};
            }
            return values | std::views::join_with(separator) | std::ranges::to<std::string>();
        }

        inline std::string quote_args(const std::vector<std::string>& args) {
            std::vector<std::string> quoted{};
            quoted.reserve(args.size());
            for (const auto& arg : args) {
                quoted.push_back("'" + arg + "'");
            }
            return join_with_separator(quoted, " ");
        }

    }  // namespace utils

    namespace detail {
        template <size_t N>
        struct string_literal {
            std::array<char, N> str;

            consteval string_literal(const char (&s)[N]) { std::ranges::copy(s, s + N, str.begin()); }
            constexpr std::string_view sv() const { return {str.data(), N - 1}; }
        };

        template <string_literal Format>
        struct format_wrapper {
            consteval format_wrapper() = default;

            template <typename... T>
            constexpr auto operator()(T&&... args) && {
                return std::format(Format.sv(), std::forward<T>(args)...);
            }
        };
    }  // namespace detail

    namespace literals {
        template <detail::string_literal Format>
        inline consteval auto operator""_format() {
            return detail::format_wrapper<Format>{};
        }
    }  // namespace literals

}  // namespace opfwd
