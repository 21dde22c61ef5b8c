#pragma once

extern "C" {
#include <signal.h>
}

#include <atomic>

namespace opfwd {

    /*
     * Turns SIGINT/SIGTERM (or an explicit request_stop()) into a readable file
     * descriptor the accept loop can poll next to the listener.
     *
     * Only one coordinator may have signal handlers installed at a time; the previous
     * dispositions are restored when it is destroyed.
     */
    class shutdown_coordinator {
      public:
        shutdown_coordinator();
        ~shutdown_coordinator();

        shutdown_coordinator(const shutdown_coordinator&) = delete;
        shutdown_coordinator& operator=(const shutdown_coordinator&) = delete;

        void install_signal_handlers();

        void request_stop();
        bool stop_requested() const { return stop_requested_.load(std::memory_order_acquire); }

        // Becomes readable once a stop was requested or a handled signal arrived.
        int wait_fd() const { return pipe_[0]; }

        // Consumes pending wake-ups; returns true when any were pending.
        bool acknowledge();

        // Last termination signal seen by the handler, 0 if none.
        int received_signal() const;

      private:
        int pipe_[2]{-1, -1};
        std::atomic<bool> stop_requested_{false};
        bool handlers_installed_{false};
        struct sigaction previous_int_{};
        struct sigaction previous_term_{};
    };

}  // namespace opfwd
