#pragma once

#include <string>
#include <string_view>
#include <sys/types.h>
#include <vector>

namespace opfwd {

    struct exit_outcome {
        int exit_code{1};
        bool signaled{false};
        int term_signal{0};

        bool success() const { return !signaled && exit_code == 0; }
        std::string describe() const;
    };

    // Destination for relayed child output. write() returning false means the
    // destination is gone; the relay keeps draining the child regardless.
    class byte_sink {
      public:
        virtual ~byte_sink() = default;
        virtual bool write(std::string_view data) = 0;
    };

    class fd_sink final : public byte_sink {
      public:
        explicit fd_sink(int fd) : fd_{fd} {}

        bool write(std::string_view data) override;
        bool failed() const { return failed_; }

      private:
        int fd_{-1};
        bool failed_{false};
    };

    class string_sink final : public byte_sink {
      public:
        bool write(std::string_view data) override {
            buffer_.append(data);
            return true;
        }

        const std::string& str() const { return buffer_; }
        std::string take() { return std::move(buffer_); }

      private:
        std::string buffer_{};
    };

    /*
     * A spawned child with its stdout and stderr connected to pipes.
     *
     * argv[0] is looked up on PATH. The child reads stdin from /dev/null and gets default
     * dispositions for SIGPIPE, SIGINT and SIGTERM with an empty signal mask.
     * Throws spawn_error when the executable cannot be started.
     */
    class child_process {
      public:
        static child_process spawn(const std::vector<std::string>& argv);

        child_process(child_process&& other) noexcept;
        child_process& operator=(child_process&&) = delete;
        child_process(const child_process&) = delete;
        child_process& operator=(const child_process&) = delete;
        ~child_process();

        pid_t pid() const { return pid_; }

        // Copies both output streams into `sink` until both reach EOF.
        void drain_into(byte_sink& sink);

        exit_outcome wait();

      private:
        child_process(pid_t pid, int stdout_fd, int stderr_fd);

        void close_pipes();

        pid_t pid_{-1};
        int stdout_fd_{-1};
        int stderr_fd_{-1};
    };

    // Runs argv, streaming stdout and stderr into `sink`; returns after both streams are
    // fully copied and the child has exited.
    exit_outcome relay(const std::vector<std::string>& argv, byte_sink& sink);

    struct captured_run {
        exit_outcome outcome{};
        std::string output{};  // stdout and stderr merged
    };

    captured_run run_capture(const std::vector<std::string>& argv);

}  // namespace opfwd
