#pragma once

#include "opfwd.hpp"

#include "opfwd/auth.hpp"
#include "opfwd/client.hpp"
#include "opfwd/policy.hpp"
#include "opfwd/process.hpp"
#include "opfwd/server.hpp"
#include "opfwd/shutdown.hpp"
#include "opfwd/socket.hpp"

#include <catch2/catch_test_macros.hpp>

extern "C" {
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

namespace opfwd::test::detail {
    namespace fs = std::filesystem;

    inline constexpr auto test_account = "test-account"sv;
    inline constexpr auto exact_command = "read op://Employee/CONFIG/operator"sv;
    inline constexpr auto create_prefix = "item create"sv;

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(std::string_view prefix) {
            static std::atomic<unsigned> counter{0};
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now << "_" << counter++;
            // short root: sockaddr_un paths are limited to ~100 bytes
            path = fs::path{"/tmp"} / dir_name.str();
            fs::create_directories(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }

        temp_dir(const temp_dir&) = delete;
        temp_dir& operator=(const temp_dir&) = delete;
    };

    inline void write_text_file(const fs::path& path, std::string_view text) {
        std::ofstream out{path};
        REQUIRE(out.good());
        out << text;
        REQUIRE(out.good());
    }

    inline void make_executable_file(const fs::path& path, std::string_view content) {
        write_text_file(path, content);
        fs::permissions(
                path,
                fs::perms::owner_read | fs::perms::owner_write | fs::perms::owner_exec,
                fs::perm_options::replace);
    }

    inline void touch(const fs::path& path) {
        write_text_file(path, "");
    }

    inline std::vector<std::string> read_lines(const fs::path& path) {
        std::vector<std::string> lines{};
        std::ifstream in{path};
        if (!in.good()) {
            return lines;
        }
        std::string line{};
        while (std::getline(in, line)) {
            lines.push_back(line);
        }
        return lines;
    }

    /*
     * Stand-in for the 1Password CLI. Every invocation appends "$*" to calls.log.
     * Behaviour switches are marker files next to the script:
     *   authenticated  status check succeeds
     *   signin_fails   sign-in exits 1 with a diagnostic on stderr
     *   status_delay   status check sleeps for a second first
     *   exec_revoked   a successful status check drops the script's execute bits
     */
    struct mock_op {
        fs::path dir{};
        fs::path script{};
        fs::path calls_log{};

        explicit mock_op(const fs::path& root) : dir{root / "mock"}, script{dir / "op"}, calls_log{dir / "calls.log"} {
            fs::create_directories(dir);
            std::ostringstream s{};
            s << "#!/usr/bin/env bash\n";
            s << "MOCK_DIR='" << dir.string() << "'\n";
            s << R"sh(printf '%s\n' "$*" >> "$MOCK_DIR/calls.log"
if [[ "$*" == *"account get"* ]]; then
    if [[ -f "$MOCK_DIR/status_delay" ]]; then
        sleep 1
    fi
    if [[ -f "$MOCK_DIR/authenticated" ]]; then
        if [[ -f "$MOCK_DIR/exec_revoked" ]]; then
            chmod a-x "$0"
        fi
        echo "Account is authenticated"
        exit 0
    fi
    echo "[ERROR] account is not signed in" >&2
    exit 1
elif [[ "$1" == "signin" ]]; then
    if [[ -f "$MOCK_DIR/signin_fails" ]]; then
        echo "[ERROR] authorization prompt dismissed" >&2
        echo "please try again" >&2
        exit 1
    fi
    touch "$MOCK_DIR/authenticated"
    echo "Signed in to $3"
    exit 0
elif [[ "$*" == *"read op://Employee/CONFIG/operator"* ]]; then
    echo "SECRET_VALUE_123"
elif [[ "$*" == *"item create"* ]]; then
    echo "Item created successfully"
elif [[ "$*" == *"both streams"* ]]; then
    echo "to stdout"
    echo "to stderr" >&2
elif [[ "$*" == *"large output"* ]]; then
    head -c 300000 /dev/zero | tr '\0' 'o'
    head -c 200000 /dev/zero | tr '\0' 'e' >&2
elif [[ "$*" == *"reads stdin"* ]]; then
    line="unset"
    read -r line
    echo "got:$line"
elif [[ "$*" == *"exit code"* ]]; then
    echo "[ERROR] item not found" >&2
    exit 3
else
    echo "Unrecognized command" >&2
    exit 1
fi
)sh";
            make_executable_file(script, s.str());
        }

        void set(std::string_view marker) const { touch(dir / marker); }

        std::vector<std::string> calls() const { return read_lines(calls_log); }

        std::size_t count_calls(std::string_view needle) const {
            auto lines = calls();
            return static_cast<std::size_t>(
                    std::ranges::count_if(lines, [needle](std::string_view l) { return l.contains(needle); }));
        }
    };

    inline server_config make_config(const mock_op& op, const fs::path& socket_path) {
        server_config cfg{};
        cfg.socket_path = socket_path;
        cfg.account = std::string{test_account};
        cfg.allowed_commands = {std::string{exact_command}};
        cfg.allowed_prefixes = {std::string{create_prefix}, "item get both streams", "item get large output", "item get exit code"};
        cfg.op_path = op.script.string();
        return cfg;
    }

    inline std::string read_all(int fd) {
        std::string out{};
        char chunk[4096]{};
        for (;;) {
            auto n = ::read(fd, chunk, sizeof(chunk));
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n <= 0) {
                break;
            }
            out.append(chunk, static_cast<std::size_t>(n));
        }
        return out;
    }

    // Runs `request` through a supervisor over a socketpair and returns everything it wrote back.
    inline std::string exchange(connection_supervisor& supervisor, std::string_view request) {
        int fds[2]{-1, -1};
        REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);
        unique_fd client{fds[0]};

        REQUIRE(write_all(client.get(), request));
        ::shutdown(client.get(), SHUT_WR);

        // served concurrently: large responses would otherwise fill the socket buffer
        std::thread worker{[&supervisor, conn = unique_fd{fds[1]}]() mutable { supervisor.serve(std::move(conn)); }};
        auto response = read_all(client.get());
        worker.join();
        return response;
    }

    inline bool wait_until(const std::function<bool()>& pred, std::chrono::milliseconds timeout) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (pred()) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds{10});
        }
        return pred();
    }

    // While alive, no new file descriptor can be allocated by this process.
    struct fd_exhaustion {
        ::rlimit saved{};

        fd_exhaustion() {
            REQUIRE(::getrlimit(RLIMIT_NOFILE, &saved) == 0);
            int lowest_free = ::open("/dev/null", O_RDONLY);
            REQUIRE(lowest_free >= 0);
            ::close(lowest_free);
            ::rlimit clamped = saved;
            clamped.rlim_cur = static_cast<rlim_t>(lowest_free);
            REQUIRE(::setrlimit(RLIMIT_NOFILE, &clamped) == 0);
        }

        ~fd_exhaustion() { ::setrlimit(RLIMIT_NOFILE, &saved); }

        fd_exhaustion(const fd_exhaustion&) = delete;
        fd_exhaustion& operator=(const fd_exhaustion&) = delete;
    };

    inline unique_fd unconnected_unix_socket() {
        unique_fd fd{::socket(AF_UNIX, SOCK_STREAM, 0)};
        REQUIRE(fd);
        return fd;
    }

    inline int connect_raw(int fd, const fs::path& path) {
        ::sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        std::ranges::copy(path.string(), addr.sun_path);
        return ::connect(fd, reinterpret_cast<::sockaddr*>(&addr), sizeof(addr));
    }

    inline double cpu_seconds() {
        ::rusage usage{};
        REQUIRE(::getrusage(RUSAGE_SELF, &usage) == 0);
        auto seconds = [](const ::timeval& tv) {
            return static_cast<double>(tv.tv_sec) + static_cast<double>(tv.tv_usec) / 1e6;
        };
        return seconds(usage.ru_utime) + seconds(usage.ru_stime);
    }

    inline mode_t file_mode(const fs::path& path) {
        struct ::stat st{};
        REQUIRE(::lstat(path.c_str(), &st) == 0);
        return st.st_mode & 0777;
    }

}  // namespace opfwd::test::detail
