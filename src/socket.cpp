#include "opfwd/socket.hpp"

#include "opfwd/errors.hpp"
#include "opfwd/log.hpp"
#include "opfwd/utils.hpp"

extern "C" {
#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>
}

#include <cerrno>
#include <cstring>
#include <system_error>
#include <vector>

using namespace opfwd::literals;

namespace opfwd {

    namespace detail {
        namespace fs = std::filesystem;

        static std::string errno_message(int err) {
            return std::system_category().message(err);
        }

        static bool set_cloexec(int fd) {
            int flags = ::fcntl(fd, F_GETFD);
            return flags != -1 && ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC) == 0;
        }

        static bool set_nonblocking(int fd, bool enabled) {
            int flags = ::fcntl(fd, F_GETFL);
            if (flags == -1) {
                return false;
            }
            flags = enabled ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
            return ::fcntl(fd, F_SETFL, flags) == 0;
        }

        static sockaddr_un make_address(const fs::path& path) {
            sockaddr_un addr{};
            addr.sun_family = AF_UNIX;
            const auto& native = path.native();
            if (native.size() >= sizeof(addr.sun_path)) {
                throw socket_setup_error{
                        "socket path too long ({} bytes, limit {}): {}"_format(
                                native.size(), sizeof(addr.sun_path) - 1U, native)};
            }
            std::memcpy(addr.sun_path, native.c_str(), native.size() + 1U);
            return addr;
        }

        // mkdir -p where every directory created here is owner-only
        static void create_private_directories(const fs::path& dir) {
            if (dir.empty()) {
                return;
            }

            std::vector<fs::path> missing{};
            std::error_code ec{};
            for (auto p = dir; !p.empty() && !fs::exists(p, ec); p = p.parent_path()) {
                missing.push_back(p);
                if (p == p.parent_path()) {
                    break;
                }
            }

            for (auto it = missing.rbegin(); it != missing.rend(); ++it) {
                if (::mkdir(it->c_str(), 0700) != 0 && errno != EEXIST) {
                    throw socket_setup_error{
                            "failed to create socket directory {}: {}"_format(it->string(), errno_message(errno))};
                }
            }
        }

        /*
         * An interrupted connect() may still be completing in the background (BSD) or may
         * have been abandoned (Linux AF_UNIX). Waits for the socket to settle; true once it
         * has a peer, false when connect() has to be issued again.
         */
        static bool finish_interrupted_connect(int fd) {
            pollfd pfd{.fd = fd, .events = POLLOUT, .revents = 0};
            while (::poll(&pfd, 1, -1) < 0) {
                if (errno != EINTR) {
                    throw error{"Error connecting to socket: {}"_format(errno_message(errno))};
                }
            }

            int so_error = 0;
            socklen_t len = sizeof(so_error);
            if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0) {
                throw error{"Error connecting to socket: {}"_format(errno_message(errno))};
            }
            if (so_error != 0) {
                throw error{"Error connecting to socket: {}"_format(errno_message(so_error))};
            }

            sockaddr_un peer{};
            socklen_t peer_len = sizeof(peer);
            if (::getpeername(fd, reinterpret_cast<sockaddr*>(&peer), &peer_len) == 0) {
                return true;
            }
            if (errno != ENOTCONN) {
                throw error{"Error connecting to socket: {}"_format(errno_message(errno))};
            }
            return false;
        }

        static unique_fd make_stream_socket() {
            unique_fd fd{::socket(AF_UNIX, SOCK_STREAM, 0)};
            if (!fd) {
                throw socket_setup_error{"failed to create socket: {}"_format(errno_message(errno))};
            }
            if (!set_cloexec(fd.get())) {
                throw socket_setup_error{"failed to set close-on-exec on socket: {}"_format(errno_message(errno))};
            }
            return fd;
        }
    }  // namespace detail

    void unique_fd::reset(int fd) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

    socket_listener::socket_listener(std::filesystem::path path, unique_fd fd)
            : path_{std::move(path)}, fd_{std::move(fd)} {}

    socket_listener::socket_listener(socket_listener&& other) noexcept
            : path_{std::move(other.path_)}, fd_{std::move(other.fd_)}, torn_down_{other.torn_down_} {
        other.path_.clear();
        other.torn_down_ = true;
    }

    socket_listener& socket_listener::operator=(socket_listener&& other) noexcept {
        if (this != &other) {
            teardown();
            path_ = std::move(other.path_);
            fd_ = std::move(other.fd_);
            torn_down_ = other.torn_down_;
            other.path_.clear();
            other.torn_down_ = true;
        }
        return *this;
    }

    socket_listener::~socket_listener() {
        teardown();
    }

    socket_listener socket_listener::bind(const std::filesystem::path& path) {
        struct ::stat st{};
        if (::lstat(path.c_str(), &st) == 0) {
            throw already_bound_error{
                    "Socket file already exists at {0}. Another server might be running.\n"
                    "If you're sure no other server is running, remove it manually with: rm {0}"_format(
                            path.string())};
        }

        auto addr = detail::make_address(path);
        detail::create_private_directories(path.parent_path());

        auto fd = detail::make_stream_socket();

        if (::bind(fd.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
            auto err = errno;
            if (err == EADDRINUSE) {
                throw already_bound_error{"socket {} was bound by another process during startup"_format(path.string())};
            }
            throw socket_setup_error{"failed to bind socket {}: {}"_format(path.string(), detail::errno_message(err))};
        }

        // from here on the socket file exists and belongs to us
        socket_listener listener{path, std::move(fd)};

        if (::listen(listener.fd(), SOMAXCONN) != 0) {
            auto err = errno;
            listener.teardown();
            throw socket_setup_error{"failed to listen on socket: {}"_format(detail::errno_message(err))};
        }

        if (::chmod(path.c_str(), 0600) != 0) {
            auto err = errno;
            listener.teardown();
            throw socket_setup_error{"failed to set permissions on socket: {}"_format(detail::errno_message(err))};
        }

        if (!detail::set_nonblocking(listener.fd(), true)) {
            auto err = errno;
            listener.teardown();
            throw socket_setup_error{"failed to make listener non-blocking: {}"_format(detail::errno_message(err))};
        }

        return listener;
    }

    std::optional<unique_fd> socket_listener::accept() {
        if (!fd_) {
            return std::nullopt;
        }

        unique_fd conn{::accept(fd_.get(), nullptr, nullptr)};
        if (!conn) {
            last_error_ = errno;
            if (last_error_ != EAGAIN && last_error_ != EWOULDBLOCK && last_error_ != EINTR &&
                last_error_ != ECONNABORTED) {
                log::error{"Error accepting connection: ", detail::errno_message(last_error_)};
            }
            return std::nullopt;
        }
        last_error_ = 0;

        // BSD accept() inherits O_NONBLOCK from the listener
        if (!detail::set_nonblocking(conn.get(), false) || !detail::set_cloexec(conn.get())) {
            log::error{"Error configuring accepted connection: ", detail::errno_message(errno)};
            return std::nullopt;
        }
        return conn;
    }

    bool is_resource_exhaustion(int err) {
        return err == EMFILE || err == ENFILE || err == ENOBUFS || err == ENOMEM;
    }

    void socket_listener::close() {
        fd_.reset();
    }

    void socket_listener::teardown() {
        close();
        if (torn_down_ || path_.empty()) {
            return;
        }
        torn_down_ = true;

        log::info{"Cleaning up and removing socket..."};
        if (::unlink(path_.c_str()) != 0) {
            log::warn{"Failed to remove socket during cleanup: ", path_.string(), ": ", detail::errno_message(errno)};
        }
    }

    bool read_line(int fd, std::string& out, std::size_t max_length) {
        out.clear();
        char chunk[4096]{};
        for (;;) {
            auto n = ::recv(fd, chunk, sizeof(chunk), 0);
            if (n < 0 && errno == ENOTSOCK) {
                n = ::read(fd, chunk, sizeof(chunk));
            }
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return false;
            }
            if (n == 0) {
                return false;
            }

            std::string_view data{chunk, static_cast<std::size_t>(n)};
            if (auto nl = data.find('\n'); nl != std::string_view::npos) {
                out.append(data.substr(0, nl));
                return out.size() <= max_length;
            }
            out.append(data);
            if (out.size() > max_length) {
                return false;
            }
        }
    }

    bool write_all(int fd, std::string_view data) {
#if OPFWD_PLATFORM_LINUX
        constexpr int send_flags = MSG_NOSIGNAL;
#else
        constexpr int send_flags = 0;
#endif
        while (!data.empty()) {
            auto n = ::send(fd, data.data(), data.size(), send_flags);
            if (n < 0 && errno == ENOTSOCK) {
                n = ::write(fd, data.data(), data.size());
            }
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return false;
            }
            data.remove_prefix(static_cast<std::size_t>(n));
        }
        return true;
    }

    unique_fd connect_unix(const std::filesystem::path& path) {
        auto addr = detail::make_address(path);
        auto fd = detail::make_stream_socket();
        for (;;) {
            if (::connect(fd.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0) {
                return fd;
            }
            int err = errno;
            if (err == EISCONN) {
                return fd;
            }
            if (err != EINTR && err != EALREADY && err != EINPROGRESS) {
                throw error{"Error connecting to socket: {}"_format(detail::errno_message(err))};
            }
            if (detail::finish_interrupted_connect(fd.get())) {
                return fd;
            }
        }
    }

}  // namespace opfwd
