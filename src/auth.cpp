#include "opfwd/auth.hpp"

#include "opfwd/errors.hpp"
#include "opfwd/log.hpp"
#include "opfwd/process.hpp"
#include "opfwd/utils.hpp"

#include <exception>

using namespace opfwd::literals;

namespace opfwd {

    namespace detail {
        // tool output folded onto one line so it fits the single-line error response
        static std::string one_line(std::string_view text) {
            std::vector<std::string> lines{};
            std::size_t pos = 0;
            while (pos <= text.size()) {
                auto nl = text.find('\n', pos);
                auto line = utils::trim_view(text.substr(pos, nl == std::string_view::npos ? nl : nl - pos));
                if (!line.empty()) {
                    lines.emplace_back(line);
                }
                if (nl == std::string_view::npos) {
                    break;
                }
                pos = nl + 1;
            }
            return utils::join_with_separator(lines, "; ");
        }
    }  // namespace detail

    std::vector<std::string> status_command(std::string_view op_path, std::string_view account) {
        return {std::string{op_path}, "--account", std::string{account}, "account", "get"};
    }

    std::vector<std::string> signin_command(std::string_view op_path, std::string_view account) {
        return {std::string{op_path}, "signin", "--account", std::string{account}};
    }

    auth_ensurer::auth_ensurer(std::string op_path) : op_path_{std::move(op_path)} {}

    auth_state auth_ensurer::ensure_signed_in(const std::string& account) {
        std::promise<auth_state> promise{};
        {
            std::unique_lock lock{mutex_};
            if (auto it = in_flight_.find(account); it != in_flight_.end()) {
                auto pending = it->second;
                lock.unlock();
                log::debug{"Joining in-flight authentication check for ", account};
                return pending.get();
            }
            in_flight_.emplace(account, promise.get_future().share());
        }

        auto finish = [&] {
            std::lock_guard lock{mutex_};
            in_flight_.erase(account);
        };

        try {
            auto state = check_and_repair(account);
            finish();
            promise.set_value(state);
            return state;
        } catch (...) {
            finish();
            promise.set_exception(std::current_exception());
            throw;
        }
    }

    auth_state auth_ensurer::check_and_repair(const std::string& account) const {
        try {
            auto status = run_capture(status_command(op_path_, account));
            if (status.outcome.success()) {
                log::info{"1Password account is already authenticated"};
                return auth_state::authenticated;
            }
            log::debug{"Status check ", status.outcome.describe(), ": ", detail::one_line(status.output)};
        } catch (const spawn_error& e) {
            log::warn{"Status check could not run: ", e.what()};
        }

        log::info{"1Password account is not signed in, attempting to sign in"};

        captured_run signin{};
        try {
            signin = run_capture(signin_command(op_path_, account));
        } catch (const spawn_error& e) {
            throw authentication_error{"failed to sign in to 1Password: {}"_format(e.what()), std::string{}};
        }

        if (!signin.outcome.success()) {
            log::error{"Sign in attempt failed, output: ", signin.output};
            auto detail_text = detail::one_line(signin.output);
            auto what = "failed to sign in to 1Password: {}"_format(signin.outcome.describe());
            if (!detail_text.empty()) {
                what += ": " + detail_text;
            }
            throw authentication_error{what, std::move(signin.output)};
        }

        log::info{"Successfully signed in to 1Password"};
        return auth_state::signed_in;
    }

}  // namespace opfwd
