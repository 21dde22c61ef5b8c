#pragma once

#include "log.hpp"
#include "utils.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace opfwd {

    using namespace std::string_view_literals;

    /*
     * opfwd Config Options
     *
     * Server (read from the JSON config file)
     * - socket_path: Unix socket to listen on. Defaults to ~/.ssh/opfwd.sock; a leading "~/" expands to $HOME.
     * - account: 1Password account passed verbatim as `--account`. Required.
     * - allowed_commands: Command lines permitted by exact (trimmed) equality.
     * - allowed_prefixes: Command lines permitted when they start with one of these byte-for-byte.
     * - op_path: 1Password CLI executable; searched on PATH when it has no '/'.
     * - log_level: debug|info|warn|error.
     *
     * Startup (command line only)
     * - server: Run the daemon instead of forwarding a command.
     * - config_path: Config file location, ~/.config/opfwd/config.json by default.
     * - socket_override: Replaces socket_path (server) or the socket to dial (client).
     * - log_level_override: Replaces log_level from the file.
     * - command: Positional words forwarded by the client, joined with single spaces.
     */

    inline constexpr auto default_op_executable = "op"sv;
    inline constexpr auto default_socket_name = "opfwd.sock"sv;

    struct server_config {
        std::filesystem::path socket_path{};
        std::string account{};
        std::vector<std::string> allowed_commands{};
        std::vector<std::string> allowed_prefixes{};
        std::string op_path{default_op_executable};
        log::level log_level{log::level::info};
    };

    struct startup_config {
        bool server{false};
        std::optional<std::filesystem::path> config_path{};
        std::optional<std::filesystem::path> socket_override{};
        std::optional<log::level> log_level_override{};
        std::vector<std::string> command{};
    };

    // $HOME, falling back to the password database entry of the current user.
    std::filesystem::path home_directory();

    std::filesystem::path expand_home(const std::filesystem::path& path);

    std::filesystem::path default_config_path();
    std::filesystem::path default_socket_path();

    // Parses and validates a config document; `source` names it in error messages.
    server_config parse_config(std::string_view json, std::string_view source);

    server_config load_config(const std::filesystem::path& path);

    // Resolves `op_path` the way execvp would; nullopt when no executable is found.
    std::optional<std::filesystem::path> find_executable(std::string_view name);

}  // namespace opfwd
