#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include "lcr/optional.hpp"

namespace ariwire::core::config {

// Wire dialect used for outbound requests (inbound accepts both)
enum class Dialect : std::uint8_t {
    Asterisk,   // RESTRequest / RESTResponse (ARI websocket REST tunnel)
    Generic     // {"id","method","path","body"} / {"id","status","body"}
};

[[nodiscard]]
inline constexpr std::string_view to_string(Dialect d) noexcept {
    return (d == Dialect::Asterisk) ? "Asterisk" : "Generic";
}

struct Control {
    // Applied to requests issued without an explicit timeout (empty = none)
    lcr::optional<std::chrono::milliseconds> request_timeout{};
    Dialect dialect{Dialect::Asterisk};
    // Prepended to log lines ("tag: ...")
    std::string tag{};
};

} // namespace ariwire::core::config
