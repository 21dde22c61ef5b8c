#include "opfwd/shutdown.hpp"

#include "opfwd/errors.hpp"
#include "opfwd/log.hpp"
#include "opfwd/utils.hpp"

extern "C" {
#include <fcntl.h>
#include <unistd.h>
}

#include <cerrno>
#include <csignal>
#include <system_error>

using namespace opfwd::literals;

namespace opfwd {

    namespace detail {
        // written from the signal handler, so plain async-signal-safe state only
        static volatile std::sig_atomic_t last_signal = 0;
        static std::atomic<int> signal_write_fd{-1};

        static_assert(std::atomic<int>::is_always_lock_free);

        static void on_termination_signal(int signo) {
            int saved_errno = errno;
            last_signal = signo;
            int fd = signal_write_fd.load(std::memory_order_relaxed);
            if (fd >= 0) {
                char byte = 1;
                (void)::write(fd, &byte, 1);
            }
            errno = saved_errno;
        }

        static bool configure_pipe_end(int fd) {
            int fd_flags = ::fcntl(fd, F_GETFD);
            int fl_flags = ::fcntl(fd, F_GETFL);
            return fd_flags != -1 && fl_flags != -1 && ::fcntl(fd, F_SETFD, fd_flags | FD_CLOEXEC) == 0 &&
                   ::fcntl(fd, F_SETFL, fl_flags | O_NONBLOCK) == 0;
        }
    }  // namespace detail

    shutdown_coordinator::shutdown_coordinator() {
        if (::pipe(pipe_) != 0) {
            throw error{"creating shutdown pipe: {}"_format(std::system_category().message(errno))};
        }
        if (!detail::configure_pipe_end(pipe_[0]) || !detail::configure_pipe_end(pipe_[1])) {
            auto err = errno;
            ::close(pipe_[0]);
            ::close(pipe_[1]);
            throw error{"configuring shutdown pipe: {}"_format(std::system_category().message(err))};
        }
    }

    shutdown_coordinator::~shutdown_coordinator() {
        if (handlers_installed_) {
            ::sigaction(SIGINT, &previous_int_, nullptr);
            ::sigaction(SIGTERM, &previous_term_, nullptr);
            detail::signal_write_fd.store(-1, std::memory_order_relaxed);
        }
        ::close(pipe_[0]);
        ::close(pipe_[1]);
    }

    void shutdown_coordinator::install_signal_handlers() {
        if (handlers_installed_) {
            return;
        }

        int expected = -1;
        if (!detail::signal_write_fd.compare_exchange_strong(expected, pipe_[1])) {
            throw error{"termination signal handlers are already owned by another coordinator"};
        }

        struct sigaction sa{};
        sa.sa_handler = detail::on_termination_signal;
        ::sigemptyset(&sa.sa_mask);
        sa.sa_flags = SA_RESTART;

        if (::sigaction(SIGINT, &sa, &previous_int_) != 0 || ::sigaction(SIGTERM, &sa, &previous_term_) != 0) {
            auto err = errno;
            detail::signal_write_fd.store(-1, std::memory_order_relaxed);
            throw error{"installing signal handlers: {}"_format(std::system_category().message(err))};
        }
        handlers_installed_ = true;
        detail::last_signal = 0;
    }

    void shutdown_coordinator::request_stop() {
        stop_requested_.store(true, std::memory_order_release);
        char byte = 1;
        if (::write(pipe_[1], &byte, 1) < 0 && errno != EAGAIN) {
            log::warn{"Failed to wake accept loop: ", std::system_category().message(errno)};
        }
    }

    bool shutdown_coordinator::acknowledge() {
        bool pending = false;
        char buf[64]{};
        while (::read(pipe_[0], buf, sizeof(buf)) > 0) {
            pending = true;
        }
        if (pending) {
            stop_requested_.store(true, std::memory_order_release);
        }
        return pending;
    }

    int shutdown_coordinator::received_signal() const {
        return detail::last_signal;
    }

}  // namespace opfwd
