#include "utils.hpp"

namespace opfwd::test {
    using namespace std::string_view_literals;

    namespace detail {
        struct scoped_env {
            std::string name{};
            std::optional<std::string> saved{};

            scoped_env(std::string var, const std::string& value) : name{std::move(var)} {
                if (const char* old = std::getenv(name.c_str())) {
                    saved = old;
                }
                ::setenv(name.c_str(), value.c_str(), 1);
            }

            ~scoped_env() {
                if (saved) {
                    ::setenv(name.c_str(), saved->c_str(), 1);
                }
                else {
                    ::unsetenv(name.c_str());
                }
            }

            scoped_env(const scoped_env&) = delete;
            scoped_env& operator=(const scoped_env&) = delete;
        };
    }  // namespace detail

    TEST_CASE("003: config document with every field", "[003][config]") {
        detail::scoped_env home{"HOME", "/home/tester"};

        auto cfg = parse_config(
                R"({
                    "socket_path": "~/.ssh/custom.sock",
                    "account": "my.1password.com",
                    "allowed_commands": ["read op://Employee/CONFIG/operator"],
                    "allowed_prefixes": ["item create", "item get"],
                    "op_path": "/opt/op/bin/op",
                    "log_level": "warn"
                })"sv,
                "inline"sv);

        CHECK(cfg.socket_path == "/home/tester/.ssh/custom.sock");
        CHECK(cfg.account == "my.1password.com");
        CHECK(cfg.allowed_commands == std::vector<std::string>{"read op://Employee/CONFIG/operator"});
        CHECK(cfg.allowed_prefixes == std::vector<std::string>{"item create", "item get"});
        CHECK(cfg.op_path == "/opt/op/bin/op");
        CHECK(cfg.log_level == log::level::warn);
    }

    TEST_CASE("003: config defaults", "[003][config]") {
        detail::scoped_env home{"HOME", "/home/tester"};

        auto cfg = parse_config(R"({"account": "acct"})"sv, "inline"sv);

        CHECK(cfg.socket_path == "/home/tester/.ssh/opfwd.sock");
        CHECK(cfg.op_path == "op");
        CHECK(cfg.log_level == log::level::info);
        CHECK(cfg.allowed_commands.empty());
        CHECK(cfg.allowed_prefixes.empty());
        CHECK(default_config_path() == "/home/tester/.config/opfwd/config.json");
        CHECK(default_socket_path() == "/home/tester/.ssh/opfwd.sock");
    }

    TEST_CASE("003: invalid config documents are rejected", "[003][config]") {
        SECTION("missing account") {
            CHECK_THROWS_AS(parse_config(R"({"allowed_commands": ["whoami"]})"sv, "inline"sv), config_error);
        }
        SECTION("blank account") {
            CHECK_THROWS_AS(parse_config(R"({"account": "   "})"sv, "inline"sv), config_error);
        }
        SECTION("malformed json") {
            CHECK_THROWS_AS(parse_config(R"({"account": )"sv, "inline"sv), config_error);
        }
        SECTION("unknown key") {
            CHECK_THROWS_AS(parse_config(R"({"account": "a", "allowed_command": ["x"]})"sv, "inline"sv), config_error);
        }
        SECTION("bad log level") {
            CHECK_THROWS_AS(parse_config(R"({"account": "a", "log_level": "chatty"})"sv, "inline"sv), config_error);
        }
    }

    TEST_CASE("003: load_config reads a file and reports missing ones", "[003][config][file]") {
        detail::temp_dir dir{"opfwd_003"};
        auto path = dir.path / "config.json";
        detail::write_text_file(
                path,
                R"({"account": "acct", "socket_path": "/tmp/x.sock", "allowed_prefixes": ["item create"]})");

        auto cfg = load_config(path);
        CHECK(cfg.account == "acct");
        CHECK(cfg.socket_path == "/tmp/x.sock");
        CHECK(cfg.allowed_prefixes == std::vector<std::string>{"item create"});

        CHECK_THROWS_AS(load_config(dir.path / "absent.json"), config_error);
    }

    TEST_CASE("003: a leftover YAML config is pointed out", "[003][config][file]") {
        detail::temp_dir dir{"opfwd_003_yaml"};
        detail::write_text_file(dir.path / "config.yaml", "account: acct\n");

        try {
            (void)load_config(dir.path / "config.json");
            FAIL("load_config should have failed");
        } catch (const config_error& e) {
            std::string_view what{e.what()};
            CHECK(what.contains("failed to open " + (dir.path / "config.json").string()));
            CHECK(what.contains("found " + (dir.path / "config.yaml").string()));
            CHECK(what.contains("JSON"));
        }

        // nothing to point at without the old file
        try {
            (void)load_config(dir.path / "other.json");
            FAIL("load_config should have failed");
        } catch (const config_error& e) {
            CHECK_FALSE(std::string_view{e.what()}.contains("found "));
        }
    }

    TEST_CASE("003: home expansion only touches a leading tilde", "[003][config]") {
        detail::scoped_env home{"HOME", "/home/tester"};

        CHECK(expand_home("~") == "/home/tester");
        CHECK(expand_home("~/a/b") == "/home/tester/a/b");
        CHECK(expand_home("/srv/~/a") == "/srv/~/a");
        CHECK(expand_home("relative/path") == "relative/path");
    }

    TEST_CASE("003: executable lookup follows PATH", "[003][config][path]") {
        detail::temp_dir dir{"opfwd_003_path"};
        detail::make_executable_file(dir.path / "op", "#!/bin/sh\nexit 0\n");
        detail::write_text_file(dir.path / "not-exec", "data");

        detail::scoped_env path{"PATH", dir.path.string() + ":/nonexistent"};

        auto found = find_executable("op"sv);
        REQUIRE(found);
        CHECK(*found == dir.path / "op");

        CHECK_FALSE(find_executable("not-exec"sv));
        CHECK_FALSE(find_executable("definitely-not-a-tool"sv));

        auto direct = find_executable((dir.path / "op").string());
        REQUIRE(direct);
        CHECK(*direct == dir.path / "op");
        CHECK_FALSE(find_executable((dir.path / "missing").string()));
    }
}  // namespace opfwd::test
