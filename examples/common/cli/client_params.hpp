#pragma once

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>

#include <CLI/CLI.hpp>

#include "common/cli/validators.hpp"
#include "lcr/log/logger.hpp"

namespace ariwire::examples::cli::client {

struct Params {
    std::string ari_host     = "localhost";
    std::uint16_t ari_port   = 8088;
    std::string stasis_app   = "";
    std::string ari_user     = "";
    std::string ari_password = "";
    std::string log_level    = "info";

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n"
           << "  ARI host   : " << ari_host << ":" << ari_port << "\n"
           << "  Stasis app : " << stasis_app << "\n"
           << "  ARI user   : " << ari_user << "\n"
           << "  Log level  : " << log_level << "\n";
    }
};

[[nodiscard]]
inline Params configure(int argc, char** argv, std::string_view description) {
    CLI::App app{std::string(description)};
    Params params{};

    app.add_option("--ari-host", params.ari_host, "Asterisk ARI host to connect to")->check(host_validator)->default_val(params.ari_host);
    app.add_option("--ari-port", params.ari_port, "Asterisk ARI port")->check(CLI::Range(1, 65535))->default_val(params.ari_port);
    app.add_option("-a,--stasis-app", params.stasis_app, "Stasis app to register as")->required();
    app.add_option("-U,--ari-user", params.ari_user, "ARI user to authenticate as")->required();
    app.add_option("-P,--ari-password", params.ari_password, "Password for the ARI user")->required();
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")->check(log_level_validator)->default_val(params.log_level);

    app.footer(
        "Asterisk dials a WebSocket channel for every call entering the app with\n"
        "app_data 'incoming'; its media connection is opened back to Asterisk."
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e, std::cout, std::cerr));
    }

    lcr::log::Logger::instance().set_level(lcr::log::parse_level(params.log_level));
    return params;
}

} // namespace ariwire::examples::cli::client
