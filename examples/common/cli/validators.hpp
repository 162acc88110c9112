#pragma once

#include <string>

#include <CLI/CLI.hpp>


namespace ariwire::examples::cli {

// -------------------------------------------------------------
// Host validator (no scheme, no port)
// -------------------------------------------------------------
inline auto host_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value.empty() || value.find("://") != std::string::npos || value.find('/') != std::string::npos) {
            return "Host must be a bare name or address (e.g. localhost, 10.0.0.1)";
        }
        return {};
    },
    "Host validator"
);


// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline auto log_level_validator = CLI::IsMember({"trace", "debug", "info", "warn", "error", "fatal"});


// -------------------------------------------------------------
// Websocket subprotocol token validator
// -------------------------------------------------------------
inline auto subprotocol_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value.find_first_of(" ,;\t") == std::string::npos) {
            return {};
        }
        return "Subprotocol must be a single token (e.g. ari, media)";
    },
    "Websocket subprotocol validator"
);

} // namespace ariwire::examples::cli
