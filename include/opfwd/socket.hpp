#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace opfwd {

    class unique_fd {
      public:
        unique_fd() = default;
        explicit unique_fd(int fd) : fd_{fd} {}
        ~unique_fd() { reset(); }

        unique_fd(const unique_fd&) = delete;
        unique_fd& operator=(const unique_fd&) = delete;

        unique_fd(unique_fd&& other) noexcept : fd_{other.release()} {}
        unique_fd& operator=(unique_fd&& other) noexcept {
            if (this != &other) {
                reset(other.release());
            }
            return *this;
        }

        int get() const { return fd_; }
        explicit operator bool() const { return fd_ >= 0; }

        int release() {
            int fd = fd_;
            fd_ = -1;
            return fd;
        }

        void reset(int fd = -1);

      private:
        int fd_{-1};
    };

    /*
     * Listening Unix-domain socket that owns its socket file.
     *
     * bind() never replaces an existing file at the path: its presence means another
     * instance is running. The parent directory is created 0700 if missing and the socket
     * file is restricted to 0600 before the listener is handed out. The destructor closes
     * the listener and removes the socket file unless teardown() already did.
     */
    class socket_listener {
      public:
        static socket_listener bind(const std::filesystem::path& path);

        socket_listener(socket_listener&& other) noexcept;
        socket_listener& operator=(socket_listener&& other) noexcept;
        ~socket_listener();

        socket_listener(const socket_listener&) = delete;
        socket_listener& operator=(const socket_listener&) = delete;

        int fd() const { return fd_.get(); }
        const std::filesystem::path& path() const { return path_; }
        bool is_open() const { return static_cast<bool>(fd_); }

        // Nullopt when no connection was ready or the accept failed; see last_error().
        std::optional<unique_fd> accept();

        // errno of the most recent failed accept(), 0 after a success.
        int last_error() const { return last_error_; }

        // Stops accepting; the socket file stays until teardown().
        void close();

        // Closes the listener and removes the socket file; safe to call repeatedly.
        void teardown();

      private:
        socket_listener(std::filesystem::path path, unique_fd fd);

        std::filesystem::path path_{};
        unique_fd fd_{};
        bool torn_down_{false};
        int last_error_{0};
    };

    // Accept failures that persist until descriptors or buffers are freed elsewhere.
    bool is_resource_exhaustion(int err);

    // Longest request line accepted from a caller, terminator excluded.
    inline constexpr std::size_t max_request_line = 64U * 1024U;

    // Reads up to the first '\n'. False on EOF or error before a terminator or an over-long line.
    bool read_line(int fd, std::string& out, std::size_t max_length = max_request_line);

    // Writes everything or returns false; never raises SIGPIPE.
    bool write_all(int fd, std::string_view data);

    unique_fd connect_unix(const std::filesystem::path& path);

}  // namespace opfwd
