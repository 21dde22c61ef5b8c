#include "cli.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        opfwd::startup_config cfg{};
        if (auto cli_result = opfwd::cli::parse_cli(argc, argv, cfg)) {
            return *cli_result;
        }

        if (cfg.server) {
            return opfwd::run_server(cfg);
        }
        return opfwd::run_client(cfg);
    } catch (std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    } catch (...) {
        std::cerr << "fatal: unknown exception\n";
        return 1;
    }
}
