#pragma once

#include "config.hpp"

#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

namespace opfwd {

    // Sends `command` as one line and copies the response to `out` until the server closes.
    // Throws opfwd::error when the socket cannot be reached.
    void forward_command(const std::filesystem::path& socket_path, const std::string& command, std::ostream& out);

    // Client mode entry point; returns the process exit code.
    int run_client(const startup_config& startup);

}  // namespace opfwd
