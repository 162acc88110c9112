#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "ariwire/core/config/control.hpp"
#include "ariwire/core/config/media.hpp"
#include "ariwire/core/transport/handshake.hpp"
#include "lcr/optional.hpp"

namespace ariwire::core::config {

// Which session an accepted connection is bound to
enum class SessionKind : std::uint8_t {
    Control,
    Media
};

[[nodiscard]]
inline constexpr std::string_view to_string(SessionKind k) noexcept {
    return (k == SessionKind::Control) ? "Control" : "Media";
}

// Server-role endpoint
struct Listener {
    std::string address{"0.0.0.0"};
    std::uint16_t port{0};                          // 0 = ephemeral
    std::string subprotocol{};                      // required, empty = any ("ari", "media")
    lcr::optional<transport::Credentials> credentials{};
    std::string realm{transport::handshake::DEFAULT_REALM};
    SessionKind kind{SessionKind::Control};

    // Applied to every session accepted on this listener
    Control control{};
    Media media{};
};

} // namespace ariwire::core::config
