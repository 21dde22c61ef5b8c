#include "opfwd/process.hpp"

#include "opfwd/errors.hpp"
#include "opfwd/log.hpp"
#include "opfwd/socket.hpp"
#include "opfwd/utils.hpp"

extern "C" {
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <cerrno>
#include <system_error>

extern char** environ;

using namespace opfwd::literals;

namespace opfwd {

    namespace detail {
        static std::string errno_message(int err) {
            return std::system_category().message(err);
        }

        static bool make_pipe(int fds[2]) {
#if OPFWD_PLATFORM_LINUX
            return ::pipe2(fds, O_CLOEXEC) == 0;
#else
            if (::pipe(fds) != 0) {
                return false;
            }
            for (int i = 0; i < 2; ++i) {
                int flags = ::fcntl(fds[i], F_GETFD);
                if (flags == -1 || ::fcntl(fds[i], F_SETFD, flags | FD_CLOEXEC) != 0) {
                    ::close(fds[0]);
                    ::close(fds[1]);
                    return false;
                }
            }
            return true;
#endif
        }

        static void close_pair(int fds[2]) {
            if (fds[0] >= 0) {
                ::close(fds[0]);
            }
            if (fds[1] >= 0) {
                ::close(fds[1]);
            }
        }

        struct spawn_actions {
            posix_spawn_file_actions_t actions{};
            posix_spawnattr_t attr{};
            bool actions_ready{false};
            bool attr_ready{false};

            spawn_actions() {
                actions_ready = ::posix_spawn_file_actions_init(&actions) == 0;
                attr_ready = ::posix_spawnattr_init(&attr) == 0;
            }

            ~spawn_actions() {
                if (actions_ready) {
                    ::posix_spawn_file_actions_destroy(&actions);
                }
                if (attr_ready) {
                    ::posix_spawnattr_destroy(&attr);
                }
            }

            spawn_actions(const spawn_actions&) = delete;
            spawn_actions& operator=(const spawn_actions&) = delete;
        };
    }  // namespace detail

    std::string exit_outcome::describe() const {
        if (signaled) {
            return "killed by signal {}"_format(term_signal);
        }
        return "exit status {}"_format(exit_code);
    }

    bool fd_sink::write(std::string_view data) {
        if (failed_) {
            return false;
        }
        if (!write_all(fd_, data)) {
            failed_ = true;
        }
        return !failed_;
    }

    child_process::child_process(pid_t pid, int stdout_fd, int stderr_fd)
            : pid_{pid}, stdout_fd_{stdout_fd}, stderr_fd_{stderr_fd} {}

    child_process::child_process(child_process&& other) noexcept
            : pid_{other.pid_}, stdout_fd_{other.stdout_fd_}, stderr_fd_{other.stderr_fd_} {
        other.pid_ = -1;
        other.stdout_fd_ = -1;
        other.stderr_fd_ = -1;
    }

    child_process::~child_process() {
        close_pipes();
        if (pid_ > 0) {
            // closed pipes make a still-writing child exit on SIGPIPE
            (void)wait();
        }
    }

    void child_process::close_pipes() {
        if (stdout_fd_ >= 0) {
            ::close(stdout_fd_);
            stdout_fd_ = -1;
        }
        if (stderr_fd_ >= 0) {
            ::close(stderr_fd_);
            stderr_fd_ = -1;
        }
    }

    child_process child_process::spawn(const std::vector<std::string>& argv) {
        if (argv.empty()) {
            throw spawn_error{"empty command"};
        }

        int stdout_pipe[2]{-1, -1};
        int stderr_pipe[2]{-1, -1};
        if (!detail::make_pipe(stdout_pipe)) {
            throw spawn_error{"creating stdout pipe: {}"_format(detail::errno_message(errno))};
        }
        if (!detail::make_pipe(stderr_pipe)) {
            auto err = errno;
            detail::close_pair(stdout_pipe);
            throw spawn_error{"creating stderr pipe: {}"_format(detail::errno_message(err))};
        }

        detail::spawn_actions sa{};
        if (!sa.actions_ready || !sa.attr_ready) {
            detail::close_pair(stdout_pipe);
            detail::close_pair(stderr_pipe);
            throw spawn_error{"initializing spawn attributes failed"};
        }

        // never share the daemon's stdin between children
        ::posix_spawn_file_actions_addopen(&sa.actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
        ::posix_spawn_file_actions_adddup2(&sa.actions, stdout_pipe[1], STDOUT_FILENO);
        ::posix_spawn_file_actions_adddup2(&sa.actions, stderr_pipe[1], STDERR_FILENO);

        sigset_t defaults{};
        ::sigemptyset(&defaults);
        ::sigaddset(&defaults, SIGPIPE);
        ::sigaddset(&defaults, SIGINT);
        ::sigaddset(&defaults, SIGTERM);
        sigset_t empty_mask{};
        ::sigemptyset(&empty_mask);
        ::posix_spawnattr_setsigdefault(&sa.attr, &defaults);
        ::posix_spawnattr_setsigmask(&sa.attr, &empty_mask);
        ::posix_spawnattr_setflags(&sa.attr, POSIX_SPAWN_SETSIGDEF | POSIX_SPAWN_SETSIGMASK);

        std::vector<char*> c_argv{};
        c_argv.reserve(argv.size() + 1U);
        for (const auto& arg : argv) {
            c_argv.push_back(const_cast<char*>(arg.c_str()));
        }
        c_argv.push_back(nullptr);

        pid_t pid = -1;
        int rc = ::posix_spawnp(&pid, c_argv[0], &sa.actions, &sa.attr, c_argv.data(), environ);

        ::close(stdout_pipe[1]);
        ::close(stderr_pipe[1]);

        if (rc != 0) {
            ::close(stdout_pipe[0]);
            ::close(stderr_pipe[0]);
            throw spawn_error{"failed to start {}: {}"_format(argv[0], detail::errno_message(rc))};
        }

        return child_process{pid, stdout_pipe[0], stderr_pipe[0]};
    }

    void child_process::drain_into(byte_sink& sink) {
        pollfd fds[2]{};
        fds[0] = {.fd = stdout_fd_, .events = POLLIN, .revents = 0};
        fds[1] = {.fd = stderr_fd_, .events = POLLIN, .revents = 0};
        int fds_open = 2;
        bool sink_lost = false;

        while (fds_open > 0) {
            int ret = ::poll(fds, 2, -1);
            if (ret < 0) {
                if (errno == EINTR) {
                    continue;
                }
                log::error{"Error polling child output: ", detail::errno_message(errno)};
                break;
            }

            char chunk[4096]{};
            for (int i = 0; i < 2; ++i) {
                if (fds[i].fd < 0 || (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                    continue;
                }
                auto n = ::read(fds[i].fd, chunk, sizeof(chunk));
                if (n < 0 && errno == EINTR) {
                    continue;
                }
                if (n <= 0) {
                    if (n < 0) {
                        log::error{"Error copying ", i == 0 ? "stdout" : "stderr", ": ", detail::errno_message(errno)};
                    }
                    fds[i].fd = -1;
                    --fds_open;
                    continue;
                }
                if (!sink_lost && !sink.write({chunk, static_cast<std::size_t>(n)})) {
                    // keep reading so the child never blocks on a full pipe
                    log::warn{"Caller went away; discarding remaining output of pid ", pid_};
                    sink_lost = true;
                }
            }
        }

        close_pipes();
    }

    exit_outcome child_process::wait() {
        if (pid_ <= 0) {
            return {};
        }

        int status = 0;
        pid_t rc = -1;
        do {
            rc = ::waitpid(pid_, &status, 0);
        } while (rc < 0 && errno == EINTR);
        pid_ = -1;

        if (rc < 0) {
            log::error{"waitpid failed: ", detail::errno_message(errno)};
            return {};
        }
        if (WIFEXITED(status)) {
            return {.exit_code = WEXITSTATUS(status)};
        }
        if (WIFSIGNALED(status)) {
            return {.exit_code = 128 + WTERMSIG(status), .signaled = true, .term_signal = WTERMSIG(status)};
        }
        return {};
    }

    exit_outcome relay(const std::vector<std::string>& argv, byte_sink& sink) {
        auto child = child_process::spawn(argv);
        child.drain_into(sink);
        return child.wait();
    }

    captured_run run_capture(const std::vector<std::string>& argv) {
        string_sink sink{};
        auto outcome = relay(argv, sink);
        return {.outcome = outcome, .output = sink.take()};
    }

}  // namespace opfwd
