#include "opfwd/policy.hpp"

#include "opfwd/utils.hpp"

#include <algorithm>

namespace opfwd {

    command_policy::command_policy(std::vector<std::string> exact_commands, std::vector<std::string> prefixes) {
        for (auto& cmd : exact_commands) {
            exact_.emplace(utils::trim_view(cmd));
        }
        for (auto& prefix : prefixes) {
            prefixes_.emplace(std::move(prefix));
        }
    }

    bool command_policy::is_allowed(std::string_view command) const {
        auto cmd = utils::trim_view(command);

        if (exact_.contains(cmd)) {
            return true;
        }

        return std::ranges::any_of(prefixes_, [cmd](std::string_view prefix) { return cmd.starts_with(prefix); });
    }

    std::vector<std::string> build_argument_vector(std::string_view account, std::string_view command) {
        std::vector<std::string> args{"--account", std::string{account}};
        auto tokens = utils::split_whitespace(command);
        args.insert(args.end(), std::make_move_iterator(tokens.begin()), std::make_move_iterator(tokens.end()));
        return args;
    }

}  // namespace opfwd
