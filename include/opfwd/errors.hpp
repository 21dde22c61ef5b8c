#pragma once

#include <stdexcept>
#include <string>

namespace opfwd {

    struct error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    // Unreadable or invalid configuration; fatal at startup.
    struct config_error : error {
        using error::error;
    };

    // Something already exists at the socket path; treated as another running instance.
    struct already_bound_error : error {
        using error::error;
    };

    struct socket_setup_error : error {
        using error::error;
    };

    // The external tool could not be started at all.
    struct spawn_error : error {
        using error::error;
    };

    // Status check and sign-in both failed. `output()` holds what the sign-in attempt printed.
    class authentication_error : public error {
      public:
        authentication_error(const std::string& what, std::string output) : error{what}, output_{std::move(output)} {}

        const std::string& output() const noexcept { return output_; }

      private:
        std::string output_{};
    };

}  // namespace opfwd
