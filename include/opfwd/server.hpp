#pragma once

#include "auth.hpp"
#include "config.hpp"
#include "policy.hpp"
#include "shutdown.hpp"
#include "socket.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

namespace opfwd {

    /*
     * Services one accepted connection:
     *   read one line -> check policy -> ensure sign-in -> relay `op` output -> close
     *
     * Rejections and sign-in failures are answered with a single "Error: ..." line and the
     * external command is never started. serve() is the error boundary for the connection:
     * nothing it does can escape into the caller, and the connection is closed on every path.
     */
    class connection_supervisor {
      public:
        explicit connection_supervisor(const server_config& cfg);

        void serve(unique_fd conn) noexcept;

        const command_policy& policy() const { return policy_; }

      private:
        void handle(int fd);

        std::string account_{};
        std::string op_path_{};
        command_policy policy_{};
        auth_ensurer auth_;
    };

    // Counts connections still being serviced so shutdown can let them drain.
    class connection_tracker {
      public:
        void enter();
        void leave();

        std::size_t active() const;
        bool wait_idle(std::chrono::milliseconds timeout);

      private:
        mutable std::mutex mutex_{};
        std::condition_variable idle_{};
        std::size_t active_{0};
    };

    class server {
      public:
        // Binds the socket; throws already_bound_error or socket_setup_error.
        explicit server(const server_config& cfg);

        const std::filesystem::path& socket_path() const { return socket_path_; }

        // Accepts until `shutdown` fires, then closes the listener and removes the socket
        // file. Connections already accepted keep running on their own threads.
        void run(shutdown_coordinator& shutdown);

        std::size_t active_connections() const { return tracker_->active(); }
        bool wait_for_drain(std::chrono::milliseconds grace) { return tracker_->wait_idle(grace); }

      private:
        void dispatch(unique_fd conn);

        std::filesystem::path socket_path_{};
        socket_listener listener_;
        std::shared_ptr<connection_supervisor> supervisor_{};
        std::shared_ptr<connection_tracker> tracker_{};
    };

    // Server mode entry point: loads config, binds, serves until SIGINT/SIGTERM.
    int run_server(const startup_config& startup);

}  // namespace opfwd
