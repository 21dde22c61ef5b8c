#pragma once

#include "opfwd.hpp"

#include "opfwd/client.hpp"
#include "opfwd/server.hpp"

#include <optional>
#include <ostream>

namespace opfwd::cli {

    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg);
    void print_version(std::ostream& os);

}  // namespace opfwd::cli
