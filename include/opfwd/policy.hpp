#pragma once

#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace opfwd {

    /*
     * Command whitelist. A trimmed command line is allowed when it equals one of the exact
     * commands or starts with one of the prefixes. Matching is case-sensitive and byte-wise;
     * whitespace inside the line is significant. An empty policy allows nothing.
     */
    class command_policy {
      public:
        command_policy() = default;
        command_policy(std::vector<std::string> exact_commands, std::vector<std::string> prefixes);

        bool is_allowed(std::string_view command) const;

        const std::set<std::string, std::less<>>& exact_commands() const { return exact_; }
        const std::set<std::string, std::less<>>& prefixes() const { return prefixes_; }

        bool empty() const { return exact_.empty() && prefixes_.empty(); }

      private:
        std::set<std::string, std::less<>> exact_{};
        std::set<std::string, std::less<>> prefixes_{};
    };

    // ["--account", account] followed by the whitespace-separated tokens of `command`.
    std::vector<std::string> build_argument_vector(std::string_view account, std::string_view command);

}  // namespace opfwd
