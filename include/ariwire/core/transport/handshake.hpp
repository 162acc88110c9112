#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <boost/beast/core/detail/base64.hpp>

#include "lcr/optional.hpp"


namespace ariwire::core::transport {

/*
===============================================================================
 WebSocket upgrade handshake
===============================================================================

Client role:
  Handshake describes what is presented during the upgrade request: the
  subprotocol, optional credentials (Authorization: Basic header, or an
  api_key=user:password query parameter) and an optional connection id header.

Server role:
  UpgradeRequest is the summary of an inbound HTTP upgrade request that the
  listener extracted. handshake::verify() decides, without side effects,
  whether it satisfies a Policy (expected subprotocol, optional credentials).
===============================================================================
*/

struct Credentials {
    std::string user;
    std::string password;

    [[nodiscard]]
    inline bool empty() const noexcept { return user.empty() && password.empty(); }

    [[nodiscard]]
    inline bool operator==(const Credentials& other) const noexcept {
        return user == other.user && password == other.password;
    }
};

enum class CredentialMode : std::uint8_t {
    BasicAuth,     // Authorization: Basic base64(user:password)
    ApiKeyQuery    // ?api_key=user:password appended to the request target
};

struct Handshake {
    std::string subprotocol;                 // Sec-WebSocket-Protocol (empty = none)
    lcr::optional<Credentials> credentials;
    CredentialMode mode{CredentialMode::BasicAuth};
    std::string connection_id;               // sent as X-Connection-Id when not empty
};


namespace handshake {

inline constexpr std::string_view CONNECTION_ID_HEADER = "X-Connection-Id";
inline constexpr std::string_view DEFAULT_REALM        = "asterisk";

// -----------------------------------------------------------------------------
// Basic auth
// -----------------------------------------------------------------------------

// Beast ships its base64 codec in a detail namespace; this alias is the
// only reference to it
namespace b64 = boost::beast::detail::base64;

[[nodiscard]]
inline std::string base64_encode(std::string_view in) {
    std::string out(b64::encoded_size(in.size()), '\0');
    out.resize(b64::encode(out.data(), in.data(), in.size()));
    return out;
}

[[nodiscard]]
inline bool base64_decode(std::string_view in, std::string& out) {
    if (in.size() % 4 != 0) {
        return false;
    }
    out.assign(b64::decoded_size(in.size()), '\0');
    auto [written, read] = b64::decode(out.data(), in.data(), in.size());
    if (read != in.size()) {
        return false;
    }
    out.resize(written);
    return true;
}

// "Basic dXNlcjpwYXNz"
[[nodiscard]]
inline std::string basic_auth_header(const Credentials& c) {
    std::string plain;
    plain.reserve(c.user.size() + c.password.size() + 1);
    plain += c.user;
    plain += ':';
    plain += c.password;
    return "Basic " + base64_encode(plain);
}

// Splits "user:password" (password may contain ':')
[[nodiscard]]
inline bool split_user_password(std::string_view s, Credentials& out) {
    const auto colon = s.find(':');
    if (colon == std::string_view::npos) {
        return false;
    }
    out.user     = std::string(s.substr(0, colon));
    out.password = std::string(s.substr(colon + 1));
    return true;
}

[[nodiscard]]
inline bool parse_basic_auth(std::string_view header, Credentials& out) {
    constexpr std::string_view scheme = "Basic ";
    if (header.size() <= scheme.size()) {
        return false;
    }
    // Scheme name is case-insensitive
    for (std::size_t i = 0; i < scheme.size(); ++i) {
        const char a = static_cast<char>(header[i] | 0x20);
        const char b = static_cast<char>(scheme[i] | 0x20);
        if (a != b) {
            return false;
        }
    }
    std::string_view token = header.substr(scheme.size());
    while (!token.empty() && token.front() == ' ') token.remove_prefix(1);
    while (!token.empty() && token.back() == ' ')  token.remove_suffix(1);
    std::string decoded;
    if (!base64_decode(token, decoded)) {
        return false;
    }
    return split_user_password(decoded, out);
}

// -----------------------------------------------------------------------------
// Query strings
// -----------------------------------------------------------------------------

[[nodiscard]]
inline std::string percent_decode(std::string_view in) {
    auto hex = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };
    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        const char c = in[i];
        if (c == '%' && i + 2 < in.size()) {
            const int hi = hex(in[i + 1]);
            const int lo = hex(in[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        out += (c == '+') ? ' ' : c;
    }
    return out;
}

[[nodiscard]]
inline std::string percent_encode(std::string_view in) {
    static constexpr char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(in.size());
    for (char c : in) {
        const auto u = static_cast<unsigned char>(c);
        const bool unreserved = (u >= 'a' && u <= 'z') || (u >= 'A' && u <= 'Z') ||
                                (u >= '0' && u <= '9') || u == '-' || u == '_' ||
                                u == '.' || u == '~' || u == ':';
        if (unreserved) {
            out += c;
        }
        else {
            out += '%';
            out += hex[u >> 4];
            out += hex[u & 0x0F];
        }
    }
    return out;
}

// Value of `key` in "a=1&b=2" (decoded); false when absent
[[nodiscard]]
inline bool query_param(std::string_view query, std::string_view key, std::string& out) {
    while (!query.empty()) {
        const auto amp = query.find('&');
        std::string_view pair = query.substr(0, amp);
        const auto eq = pair.find('=');
        if (pair.substr(0, eq) == key) {
            out = (eq == std::string_view::npos) ? std::string{} : percent_decode(pair.substr(eq + 1));
            return true;
        }
        if (amp == std::string_view::npos) {
            break;
        }
        query.remove_prefix(amp + 1);
    }
    return false;
}

// Request target with the api_key parameter appended when the handshake uses it
[[nodiscard]]
inline std::string request_target(std::string_view path, const Handshake& hs) {
    std::string target(path);
    if (hs.mode == CredentialMode::ApiKeyQuery && hs.credentials.has()) {
        const Credentials& c = hs.credentials.value();
        target += (target.find('?') == std::string::npos) ? '?' : '&';
        target += "api_key=";
        target += percent_encode(c.user + ":" + c.password);
    }
    return target;
}

// -----------------------------------------------------------------------------
// Server-side verification
// -----------------------------------------------------------------------------

struct UpgradeRequest {
    std::string target;          // request target (path + query)
    bool is_upgrade{false};      // Connection: upgrade + Upgrade: websocket
    std::string subprotocols;    // raw Sec-WebSocket-Protocol value (comma separated)
    std::string authorization;   // raw Authorization value
    std::string connection_id;   // X-Connection-Id value
    std::string remote_address;  // "ip:port"
};

struct Policy {
    std::string subprotocol;                 // required subprotocol (empty = accept any)
    lcr::optional<Credentials> credentials;  // required credentials (empty = no check)
    std::string realm{DEFAULT_REALM};
};

enum class Reason : std::uint8_t {
    None,
    NotUpgrade,
    SubprotocolMismatch,
    MissingCredentials,
    BadCredentials
};

[[nodiscard]]
inline constexpr std::string_view to_string(Reason r) noexcept {
    switch (r) {
        case Reason::None:                return "None";
        case Reason::NotUpgrade:          return "NotUpgrade";
        case Reason::SubprotocolMismatch: return "SubprotocolMismatch";
        case Reason::MissingCredentials:  return "MissingCredentials";
        case Reason::BadCredentials:      return "BadCredentials";
        default:                          return "Unknown";
    }
}

struct Verdict {
    Reason reason{Reason::None};
    unsigned http_status{101};
    std::string subprotocol;   // value echoed back on accept
    std::string principal;     // authenticated user (empty when no check)

    [[nodiscard]]
    inline bool accepted() const noexcept { return reason == Reason::None; }
};

// True when `wanted` appears in the comma separated offer list
[[nodiscard]]
inline bool offers_subprotocol(std::string_view offered, std::string_view wanted) noexcept {
    while (!offered.empty()) {
        const auto comma = offered.find(',');
        std::string_view item = offered.substr(0, comma);
        while (!item.empty() && item.front() == ' ') item.remove_prefix(1);
        while (!item.empty() && item.back() == ' ')  item.remove_suffix(1);
        if (item == wanted) {
            return true;
        }
        if (comma == std::string_view::npos) {
            break;
        }
        offered.remove_prefix(comma + 1);
    }
    return false;
}

[[nodiscard]]
inline Verdict verify(const UpgradeRequest& req, const Policy& policy) {
    Verdict v;
    auto reject = [&v](Reason r, unsigned status) {
        v.reason = r;
        v.http_status = status;
        return v;
    };

    if (!req.is_upgrade) {
        return reject(Reason::NotUpgrade, 400);
    }
    if (!policy.subprotocol.empty()) {
        if (!offers_subprotocol(req.subprotocols, policy.subprotocol)) {
            return reject(Reason::SubprotocolMismatch, 400);
        }
        v.subprotocol = policy.subprotocol;
    }
    if (policy.credentials.has()) {
        Credentials presented;
        bool found = false;
        if (!req.authorization.empty()) {
            found = parse_basic_auth(req.authorization, presented);
        }
        if (!found) {
            const auto q = req.target.find('?');
            std::string api_key;
            if (q != std::string::npos &&
                query_param(std::string_view(req.target).substr(q + 1), "api_key", api_key)) {
                found = split_user_password(api_key, presented);
            }
        }
        if (!found) {
            return reject(Reason::MissingCredentials, 401);
        }
        if (!(presented == policy.credentials.value())) {
            return reject(Reason::BadCredentials, 401);
        }
        v.principal = presented.user;
    }
    return v;
}

} // namespace handshake
} // namespace ariwire::core::transport
