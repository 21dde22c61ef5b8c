#pragma once

#include <cstdint>
#include <future>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace opfwd {

    using namespace std::string_view_literals;

    enum class auth_state : uint8_t {
        authenticated,  // status check passed
        signed_in,      // status check failed, sign-in succeeded
    };

    inline constexpr std::string_view to_string(auth_state state) {
        switch (state) {
            case auth_state::authenticated:
                return "authenticated"sv;
            case auth_state::signed_in:
                return "signed_in"sv;
        }
        return "authenticated"sv;
    }

    std::vector<std::string> status_command(std::string_view op_path, std::string_view account);
    std::vector<std::string> signin_command(std::string_view op_path, std::string_view account);

    /*
     * Makes sure the 1Password CLI is signed in to an account before a command runs.
     *
     * Every call checks `op --account <id> account get` and falls back to
     * `op signin --account <id>`; nothing is remembered between calls. Calls for the same
     * account that overlap share one in-flight check and its outcome, so concurrent
     * connections never race each other through sign-in.
     *
     * Throws authentication_error when the status check and sign-in both fail.
     */
    class auth_ensurer {
      public:
        explicit auth_ensurer(std::string op_path);

        auth_state ensure_signed_in(const std::string& account);

      private:
        auth_state check_and_repair(const std::string& account) const;

        std::string op_path_{};
        std::mutex mutex_{};
        std::unordered_map<std::string, std::shared_future<auth_state>> in_flight_{};
    };

}  // namespace opfwd
