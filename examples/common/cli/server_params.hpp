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

namespace ariwire::examples::cli::server {

struct Params {
    std::string ari_bind_address   = "127.0.0.1";
    std::uint16_t ari_port         = 0;
    std::string ari_protocol       = "ari";
    std::string ari_user           = "";
    std::string ari_password       = "";

    std::string media_bind_address = "127.0.0.1";
    std::uint16_t media_port       = 0;
    std::string media_protocol     = "media";
    std::string media_connection   = "media_connection1";   // websocket_client.conf entry
    std::string media_user         = "";
    std::string media_password     = "";

    std::string announce_file      = "echo-announce.ulaw";
    std::string goodbye_file       = "zombies.ulaw";
    unsigned echo_seconds          = 10;

    std::string log_level          = "info";

    [[nodiscard]] inline bool ari_auth() const noexcept { return !ari_user.empty() && !ari_password.empty(); }
    [[nodiscard]] inline bool media_auth() const noexcept { return !media_user.empty() && !media_password.empty(); }

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n"
           << "  ARI listener   : " << ari_bind_address << ":" << ari_port << " (" << ari_protocol
           << (ari_auth() ? ", basic auth" : "") << ")\n"
           << "  Media listener : " << media_bind_address << ":" << media_port << " (" << media_protocol
           << (media_auth() ? ", basic auth" : "") << ")\n"
           << "  Media conn id  : " << media_connection << "\n"
           << "  Prompts        : " << announce_file << ", " << goodbye_file << " after " << echo_seconds << "s of echo\n"
           << "  Log level      : " << log_level << "\n";
    }
};

[[nodiscard]]
inline Params configure(int argc, char** argv, std::string_view description) {
    CLI::App app{std::string(description)};
    Params params{};

    app.add_option("--ari-bind-address", params.ari_bind_address, "Address to bind the ARI websocket server to")->default_val(params.ari_bind_address);
    app.add_option("--ari-bind-port", params.ari_port, "Port to bind the ARI websocket server to")->check(CLI::Range(1, 65535))->required();
    app.add_option("--ari-websocket-protocol", params.ari_protocol, "Subprotocol required on ARI websockets")->check(subprotocol_validator)->default_val(params.ari_protocol);
    app.add_option("--ari-user", params.ari_user, "ARI user incoming connections must authenticate as");
    app.add_option("--ari-password", params.ari_password, "Password for the ARI user");

    app.add_option("--media-bind-address", params.media_bind_address, "Address to bind the media websocket server to")->default_val(params.media_bind_address);
    app.add_option("--media-bind-port", params.media_port, "Port to bind the media websocket server to")->check(CLI::Range(1, 65535))->required();
    app.add_option("--media-websocket-protocol", params.media_protocol, "Subprotocol required on media websockets")->check(subprotocol_validator)->default_val(params.media_protocol);
    app.add_option("--media-websocket-id", params.media_connection, "Connection name from websocket_client.conf")->default_val(params.media_connection);
    app.add_option("--media-user", params.media_user, "Media user incoming connections must authenticate as");
    app.add_option("--media-password", params.media_password, "Password for the media user");

    app.add_option("--announce", params.announce_file, "ulaw file played when media starts")->default_val(params.announce_file);
    app.add_option("--goodbye", params.goodbye_file, "ulaw file played before hanging up")->default_val(params.goodbye_file);
    app.add_option("--echo-seconds", params.echo_seconds, "Seconds of echo between the two prompts")->default_val(params.echo_seconds);
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")->check(log_level_validator)->default_val(params.log_level);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e, std::cout, std::cerr));
    }

    lcr::log::Logger::instance().set_level(lcr::log::parse_level(params.log_level));
    return params;
}

} // namespace ariwire::examples::cli::server
