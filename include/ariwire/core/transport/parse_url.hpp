#pragma once

#include <string>
#include <string_view>
#include <cstdlib>
#include <cstddef>

#include "ariwire/core/transport/error.hpp"


namespace ariwire::core::transport {

    // Contains parsed URL components
    struct ParsedUrl {
        std::string host;
        std::string port;
        std::string path;    // path without query ("/" if missing)
        std::string query;   // text after '?' (may be empty)

        // Request target as sent on the wire
        [[nodiscard]]
        inline std::string target() const {
            return query.empty() ? path : path + "?" + query;
        }
    };


    // ---------------------------------------------------------------------
    // NOTE: Minimal URL parser supporting ws:// only.
    // This is a minimal, invariant-validated WebSocket URL parser. It accepts
    // the ws:// URLs used for ARI and media websockets and rejects malformed
    // inputs without attempting full RFC compliance. wss:// is rejected: TLS
    // termination is left to a proxy in front of the endpoint.
    //
    // Example inputs:
    //   ws://localhost:8088/ari/events?app=demo&subscribeAll=false
    //   ws://127.0.0.1:8787/media/4b9c1d2e
    // ---------------------------------------------------------------------
    [[nodiscard]]
    inline Error parse_url(std::string_view url, ParsedUrl& out) noexcept {
        out = ParsedUrl{};
        // 1) Extract scheme
        constexpr std::string_view ws  = "ws://";
        if (url.substr(0, ws.size()) != ws) {
            return Error::InvalidUrl;
        }
        size_t pos = ws.size();
        // 2) Extract host[:port]
        size_t slash = url.find_first_of("/?", pos);
        std::string_view hostport = (slash == std::string_view::npos) ? url.substr(pos) : url.substr(pos, slash - pos);
        if (hostport.empty()) {
            return Error::InvalidUrl;
        }
        // 3) Split host and port
        size_t colon = hostport.find(':');
        if (colon != std::string_view::npos) {
            out.host = std::string(hostport.substr(0, colon));
            out.port = std::string(hostport.substr(colon + 1));
        } else {
            out.host = std::string(hostport);
            out.port = "80";
        }
        // 4) Path (default "/" if missing) and query
        std::string_view rest = (slash == std::string_view::npos) ? std::string_view{} : url.substr(slash);
        size_t qmark = rest.find('?');
        std::string_view path = rest.substr(0, qmark);
        out.path = path.empty() ? "/" : std::string(path);
        if (qmark != std::string_view::npos) {
            out.query = std::string(rest.substr(qmark + 1));
        }

        // Invariants check --------------------------------

        // Validate host
        if (out.host.empty() || out.port.empty()) {
            return Error::InvalidUrl;
        }
        // Validate port - must be numeric and in range
        for (char c : out.port) {
            if (c < '0' || c > '9') {
                return Error::InvalidUrl;
            }
        }
        const unsigned long p = std::strtoul(out.port.c_str(), nullptr, 10);
        if (p == 0 || p > 65535) {
            return Error::InvalidUrl;
        }
        // Validate path
        if (out.path[0] != '/') {
            return Error::InvalidUrl;
        }
        // ---------------------------------------------------

        return Error::None;
    }

} // namespace ariwire::core::transport
