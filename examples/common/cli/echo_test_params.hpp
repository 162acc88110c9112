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

namespace ariwire::examples::cli::echo_test {

struct Params {
    std::string bind_address = "127.0.0.1";
    std::uint16_t port       = 8787;
    std::string protocol     = "media";
    std::string user         = "medianame";
    std::string password     = "mediapassword";
    std::string file         = "test.ulaw";
    unsigned grace_seconds   = 2;
    unsigned offset_frames   = 0;
    std::string log_level    = "info";

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n"
           << "  Listener  : " << bind_address << ":" << port << " (" << protocol << ", user " << user << ")\n"
           << "  File      : " << file << "\n"
           << "  Grace     : " << grace_seconds << "s\n"
           << "  Offset    : up to " << offset_frames << " frames\n"
           << "  Log level : " << log_level << "\n";
    }
};

[[nodiscard]]
inline Params configure(int argc, char** argv, std::string_view description) {
    CLI::App app{std::string(description)};
    Params params{};

    app.add_option("--bind-address", params.bind_address, "Address to bind the media websocket server to")->default_val(params.bind_address);
    app.add_option("-p,--port", params.port, "Port to bind the media websocket server to")->check(CLI::Range(1, 65535))->default_val(params.port);
    app.add_option("--protocol", params.protocol, "Subprotocol required on the media websocket")->check(subprotocol_validator)->default_val(params.protocol);
    app.add_option("-U,--user", params.user, "User the media connection must authenticate as")->default_val(params.user);
    app.add_option("-P,--password", params.password, "Password for the media user")->default_val(params.password);
    app.add_option("-f,--file", params.file, "ulaw file to send")->check(CLI::ExistingFile)->default_val(params.file);
    app.add_option("-g,--grace", params.grace_seconds, "Seconds to wait for echoed frames after HANGUP")->default_val(params.grace_seconds);
    app.add_option("--offset-frames", params.offset_frames, "Leading echo frames the comparison may skip")->default_val(params.offset_frames);
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")->check(log_level_validator)->default_val(params.log_level);

    app.footer("Exit status is 0 when the echoed audio matches what was sent, 1 otherwise.");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e, std::cout, std::cerr));
    }

    lcr::log::Logger::instance().set_level(lcr::log::parse_level(params.log_level));
    return params;
}

} // namespace ariwire::examples::cli::echo_test
