#include "cli.hpp"

#include <CLI/CLI.hpp>

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace opfwd::cli {

    void print_version(std::ostream& os) {
        os << "opfwd version " << build::version << '\n';
        os << "Commit: " << build::commit << '\n';
        if (!build::date.empty()) {
            os << "Build Date: " << build::date << '\n';
        }
        os << "Compiler: " << build::compiler << '\n';
    }

    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg) {
        CLI::App app{"opfwd: forward whitelisted 1Password CLI commands over a Unix socket"};
        app.usage("opfwd [OPTIONS] <command> [arguments...]\n       opfwd --server [--config PATH]");

        bool show_version = false;
        std::string config_arg{};
        std::string socket_arg{};
        std::string log_level_arg{};

        app.add_flag("--server", cfg.server, "Run in server mode");
        app.add_option("--config", config_arg, "Path to the config file (server mode only)");
        app.add_option("--socket", socket_arg, "Socket to listen on (server) or connect to (client)");
        app.add_option("--log-level", log_level_arg, "Log level: debug|info|warn|error (server mode only)");
        app.add_flag("--version", show_version, "Show version information");

        // everything from the first positional word on is the forwarded command
        app.prefix_command();

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e)};
        }

        if (show_version) {
            print_version(std::cout);
            return std::optional<int>{0};
        }

        if (!log_level_arg.empty()) {
            log::level lvl{};
            if (!log::try_parse_level(log_level_arg, lvl)) {
                std::cerr << "invalid --log-level value: " << log_level_arg << " (expected debug|info|warn|error)\n";
                return std::optional<int>{2};
            }
            cfg.log_level_override = lvl;
        }

        if (!config_arg.empty()) {
            cfg.config_path = config_arg;
        }
        if (!socket_arg.empty()) {
            cfg.socket_override = socket_arg;
        }

        cfg.command = app.remaining();

        if (cfg.server && !cfg.command.empty()) {
            std::cerr << "--server does not take a command\n";
            return std::optional<int>{2};
        }
        if (!cfg.server && cfg.config_path) {
            std::cerr << "--config is only valid with --server\n";
            return std::optional<int>{2};
        }

        return std::nullopt;
    }

}  // namespace opfwd::cli
