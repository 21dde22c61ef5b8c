#include "opfwd/server.hpp"

#include "opfwd/errors.hpp"
#include "opfwd/log.hpp"
#include "opfwd/process.hpp"
#include "opfwd/utils.hpp"

extern "C" {
#include <poll.h>
#include <signal.h>
}

#include <cerrno>
#include <exception>
#include <system_error>
#include <thread>

using namespace opfwd::literals;

namespace opfwd {

    namespace detail {
        static constexpr auto shutdown_grace = std::chrono::seconds{30};
        static constexpr int accept_backoff_ms = 100;

        static std::string describe_list(const auto& values) {
            std::vector<std::string> quoted{};
            for (const auto& v : values) {
                quoted.push_back("\"" + v + "\"");
            }
            return "[" + utils::join_with_separator(quoted, ", ") + "]";
        }

        static void respond(int fd, std::string_view line) {
            if (!write_all(fd, line)) {
                log::warn{"Error writing response: ", std::system_category().message(errno)};
            }
        }
    }  // namespace detail

    connection_supervisor::connection_supervisor(const server_config& cfg)
            : account_{cfg.account},
              op_path_{cfg.op_path},
              policy_{cfg.allowed_commands, cfg.allowed_prefixes},
              auth_{cfg.op_path} {}

    void connection_supervisor::serve(unique_fd conn) noexcept {
        try {
            handle(conn.get());
        } catch (const std::exception& e) {
            log::error{"Recovered from fault in connection handler: ", e.what()};
        } catch (...) {
            log::error{"Recovered from unknown fault in connection handler"};
        }
        // `conn` closes here on every path
    }

    void connection_supervisor::handle(int fd) {
        std::string line{};
        if (!read_line(fd, line)) {
            log::warn{"Error reading from connection: no complete request line"};
            return;
        }

        std::string input{utils::trim_view(line)};
        log::info{"Received input: ", input};

        if (!policy_.is_allowed(input)) {
            log::warn{"Command not allowed: ", input};
            detail::respond(fd, "Error: Command not allowed: {}\n"_format(input));
            return;
        }

        try {
            auto state = auth_.ensure_signed_in(account_);
            log::debug{"Account ", account_, " is ", to_string(state)};
        } catch (const authentication_error& e) {
            log::error{"Error ensuring login: ", e.what()};
            detail::respond(fd, "Error: Could not sign in to 1Password: {}\n"_format(e.what()));
            return;
        }

        auto args = build_argument_vector(account_, input);
        log::info{"Executing op with args: ", utils::quote_args(args)};

        std::vector<std::string> argv{op_path_};
        argv.insert(argv.end(), args.begin(), args.end());

        fd_sink sink{fd};
        try {
            auto outcome = relay(argv, sink);
            if (!outcome.success()) {
                // the child's stderr already told the caller what went wrong
                log::warn{"Command execution error: ", outcome.describe()};
            }
        } catch (const spawn_error& e) {
            log::error{"Error starting command: ", e.what()};
            detail::respond(fd, "Error: {}\n"_format(e.what()));
        }
    }

    void connection_tracker::enter() {
        std::lock_guard lock{mutex_};
        ++active_;
    }

    void connection_tracker::leave() {
        std::lock_guard lock{mutex_};
        if (active_ > 0 && --active_ == 0) {
            idle_.notify_all();
        }
    }

    std::size_t connection_tracker::active() const {
        std::lock_guard lock{mutex_};
        return active_;
    }

    bool connection_tracker::wait_idle(std::chrono::milliseconds timeout) {
        std::unique_lock lock{mutex_};
        return idle_.wait_for(lock, timeout, [this] { return active_ == 0; });
    }

    server::server(const server_config& cfg)
            : socket_path_{cfg.socket_path},
              listener_{socket_listener::bind(cfg.socket_path)},
              supervisor_{std::make_shared<connection_supervisor>(cfg)},
              tracker_{std::make_shared<connection_tracker>()} {
        const auto& policy = supervisor_->policy();

        log::info{"Server listening on ", socket_path_.string()};
        log::info{"Allowed exact commands: ", detail::describe_list(policy.exact_commands())};
        log::info{"Allowed command prefixes: ", detail::describe_list(policy.prefixes())};
        log::info{"Using 1Password account: ", cfg.account};

        if (policy.empty()) {
            log::warn{"No allowed commands or prefixes configured; every request will be rejected"};
        }
        if (policy.prefixes().contains(std::string{})) {
            log::warn{"An empty allowed prefix is configured; it matches every command"};
        }
    }

    void server::dispatch(unique_fd conn) {
        tracker_->enter();
        try {
            std::thread{[supervisor = supervisor_, tracker = tracker_, c = std::move(conn)]() mutable {
                supervisor->serve(std::move(c));
                tracker->leave();
            }}.detach();
        } catch (const std::system_error& e) {
            tracker_->leave();
            log::error{"Failed to start connection worker: ", e.what()};
        }
    }

    void server::run(shutdown_coordinator& shutdown) {
        pollfd fds[2]{};
        fds[0] = {.fd = listener_.fd(), .events = POLLIN, .revents = 0};
        fds[1] = {.fd = shutdown.wait_fd(), .events = POLLIN, .revents = 0};

        while (!shutdown.stop_requested()) {
            int ret = ::poll(fds, 2, -1);
            if (ret < 0) {
                if (errno == EINTR) {
                    continue;
                }
                log::error{"Error waiting for connections: ", std::system_category().message(errno)};
                break;
            }

            if (fds[1].revents != 0) {
                shutdown.acknowledge();
                break;
            }

            if ((fds[0].revents & POLLIN) != 0) {
                while (auto conn = listener_.accept()) {
                    dispatch(std::move(*conn));
                }
                // the pending connection keeps the listener readable; only watch for shutdown for a while
                if (is_resource_exhaustion(listener_.last_error())) {
                    (void)::poll(&fds[1], 1, detail::accept_backoff_ms);
                    continue;
                }
            }
            if ((fds[0].revents & (POLLERR | POLLNVAL)) != 0) {
                log::error{"Listener failed; no longer accepting connections"};
                break;
            }
        }

        if (int signo = shutdown.received_signal(); signo != 0) {
            log::info{"Received signal ", signo, ", shutting down server..."};
        }
        else {
            log::info{"Shutting down server..."};
        }
        listener_.teardown();
    }

    int run_server(const startup_config& startup) {
        if (startup.log_level_override) {
            log::set_threshold(*startup.log_level_override);
        }

        auto config_path = startup.config_path ? expand_home(*startup.config_path) : default_config_path();
        auto cfg = load_config(config_path);
        if (startup.socket_override) {
            cfg.socket_path = expand_home(*startup.socket_override);
        }
        log::set_threshold(startup.log_level_override.value_or(cfg.log_level));

        if (!find_executable(cfg.op_path)) {
            throw error{
                    "The 1Password CLI ({}) command was not found in your system PATH.\n\n"
                    "To install it on macOS:\n\n"
                    "brew install 1password-cli"_format(cfg.op_path)};
        }

        // a caller hanging up mid-relay must not kill the daemon
        ::signal(SIGPIPE, SIG_IGN);

        shutdown_coordinator shutdown{};
        shutdown.install_signal_handlers();

        server srv{cfg};
        srv.run(shutdown);

        if (!srv.wait_for_drain(detail::shutdown_grace)) {
            log::warn{"Exiting with ", srv.active_connections(), " connection(s) still running"};
        }
        log::info{"Server shutdown completed"};
        return 0;
    }

}  // namespace opfwd
