#include "opfwd/config.hpp"

#include "opfwd/errors.hpp"

#include <glaze/glaze.hpp>

extern "C" {
#include <pwd.h>
#include <unistd.h>
}

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>

using namespace opfwd::literals;

namespace opfwd {

    namespace detail {
        namespace fs = std::filesystem;

        struct persisted_config {
            std::optional<std::string> socket_path{};
            std::string account{};
            std::vector<std::string> allowed_commands{};
            std::vector<std::string> allowed_prefixes{};
            std::optional<std::string> op_path{};
            std::optional<std::string> log_level{};
        };

        static std::string read_text_file(const fs::path& path) {
            std::ifstream in{path};
            if (!in) {
                std::error_code ec{};
                auto legacy = fs::path{path}.replace_extension(".yaml");
                if (path.extension() == ".json" && fs::exists(legacy, ec)) {
                    throw config_error{
                            "reading config file: failed to open {}; found {}, but the config file is JSON now "
                            "(convert it and save it as {})"_format(path.string(), legacy.string(), path.string())};
                }
                throw config_error{"reading config file: failed to open {}"_format(path.string())};
            }
            std::ostringstream ss{};
            ss << in.rdbuf();
            if (!in.good() && !in.eof()) {
                throw config_error{"reading config file: failed to read {}"_format(path.string())};
            }
            return ss.str();
        }

        static bool is_executable_file(const fs::path& path) {
            std::error_code ec{};
            if (!fs::is_regular_file(path, ec)) {
                return false;
            }
            return ::access(path.c_str(), X_OK) == 0;
        }
    }  // namespace detail

    std::filesystem::path home_directory() {
        if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
            return home;
        }
        if (const passwd* pw = ::getpwuid(::getuid()); pw != nullptr && pw->pw_dir != nullptr) {
            return pw->pw_dir;
        }
        throw config_error{"getting current user: no home directory"};
    }

    std::filesystem::path expand_home(const std::filesystem::path& path) {
        auto text = path.string();
        if (text == "~") {
            return home_directory();
        }
        if (text.starts_with("~/")) {
            return home_directory() / text.substr(2);
        }
        return path;
    }

    std::filesystem::path default_config_path() {
        return home_directory() / ".config" / "opfwd" / "config.json";
    }

    std::filesystem::path default_socket_path() {
        return home_directory() / ".ssh" / default_socket_name;
    }

    server_config parse_config(std::string_view json, std::string_view source) {
        detail::persisted_config data{};
        if (auto ec = glz::read_json(data, json)) {
            throw config_error{"parsing config file {}: {}"_format(source, glz::format_error(ec, json))};
        }

        if (utils::trim_view(data.account).empty()) {
            throw config_error{"account is required in config"};
        }

        server_config cfg{};
        cfg.account = std::move(data.account);
        cfg.allowed_commands = std::move(data.allowed_commands);
        cfg.allowed_prefixes = std::move(data.allowed_prefixes);

        if (data.socket_path && !data.socket_path->empty()) {
            cfg.socket_path = expand_home(*data.socket_path);
        }
        else {
            cfg.socket_path = default_socket_path();
        }

        if (data.op_path && !data.op_path->empty()) {
            cfg.op_path = std::move(*data.op_path);
        }

        if (data.log_level && !log::try_parse_level(*data.log_level, cfg.log_level)) {
            throw config_error{
                    "invalid log_level in {}: {} (expected debug|info|warn|error)"_format(source, *data.log_level)};
        }

        return cfg;
    }

    server_config load_config(const std::filesystem::path& path) {
        auto json = detail::read_text_file(path);
        return parse_config(json, path.string());
    }

    std::optional<std::filesystem::path> find_executable(std::string_view name) {
        if (name.empty()) {
            return std::nullopt;
        }
        if (name.find('/') != std::string_view::npos) {
            std::filesystem::path candidate{name};
            if (detail::is_executable_file(candidate)) {
                return candidate;
            }
            return std::nullopt;
        }

        const char* path_env = std::getenv("PATH");
        std::string_view search{path_env != nullptr ? path_env : "/usr/bin:/bin"};
        while (true) {
            auto sep = search.find(':');
            auto dir = search.substr(0, sep);
            std::filesystem::path candidate = dir.empty() ? std::filesystem::path{"."} : std::filesystem::path{dir};
            candidate /= name;
            if (detail::is_executable_file(candidate)) {
                return candidate;
            }
            if (sep == std::string_view::npos) {
                break;
            }
            search.remove_prefix(sep + 1);
        }
        return std::nullopt;
    }

}  // namespace opfwd
