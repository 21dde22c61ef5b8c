#include "opfwd/client.hpp"

#include "opfwd/errors.hpp"
#include "opfwd/socket.hpp"
#include "opfwd/utils.hpp"

extern "C" {
#include <signal.h>
#include <unistd.h>
}

#include <cerrno>
#include <iostream>
#include <system_error>

using namespace opfwd::literals;

namespace opfwd {

    void forward_command(const std::filesystem::path& socket_path, const std::string& command, std::ostream& out) {
        auto conn = connect_unix(socket_path);

        if (!write_all(conn.get(), command + "\n")) {
            throw error{"Error sending command: {}"_format(std::system_category().message(errno))};
        }

        char chunk[4096]{};
        for (;;) {
            auto n = ::read(conn.get(), chunk, sizeof(chunk));
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                throw error{"Error reading response: {}"_format(std::system_category().message(errno))};
            }
            if (n == 0) {
                break;
            }
            out.write(chunk, static_cast<std::streamsize>(n));
            if (!out) {
                throw error{"Error reading response: output stream failed"};
            }
        }
        out.flush();
    }

    int run_client(const startup_config& startup) {
        if (startup.command.empty()) {
            std::cout << "Usage: opfwd <command> [arguments]\n";
            return 1;
        }

        auto socket_path = startup.socket_override ? expand_home(*startup.socket_override) : default_socket_path();

        std::error_code ec{};
        if (!std::filesystem::exists(socket_path, ec)) {
            std::cout << "Error: Socket " << socket_path.string() << " not found.\n";
            std::cout << "Make sure the opfwd server is running and the socket is accessible.\n";
            return 1;
        }

        ::signal(SIGPIPE, SIG_IGN);

        try {
            forward_command(socket_path, utils::join_with_separator(startup.command, " "), std::cout);
        } catch (const error& e) {
            std::cout << e.what() << '\n';
            return 1;
        }
        return 0;
    }

}  // namespace opfwd
