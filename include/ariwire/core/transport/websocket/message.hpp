/*
================================================================================
ariwire WebSocket Message
================================================================================

Message represents a single complete WebSocket message stored inside the
transport's inbound ring.

Text messages carry the control protocol (ARI JSON) and media text commands.
Binary messages carry media frames. A single connection never mixes ARI JSON
and binary media.

-------------------------------------------------------------------------------
Ownership Model
-------------------------------------------------------------------------------

  Message memory is owned by the transport ring.
  Upper layers obtain it with peek_message() and MUST NOT retain references
  after release_message().

================================================================================
*/

#pragma once

#include <cstdint>
#include <string>
#include <string_view>


namespace ariwire::core::transport::websocket {

enum class MessageKind : std::uint8_t {
    Text,
    Binary
};

[[nodiscard]]
inline constexpr std::string_view to_string(MessageKind k) noexcept {
    return (k == MessageKind::Text) ? "Text" : "Binary";
}

struct Message {
    MessageKind kind{MessageKind::Text};
    std::string data;

    [[nodiscard]]
    inline std::string_view view() const noexcept { return data; }

    [[nodiscard]]
    inline bool is_text() const noexcept { return kind == MessageKind::Text; }
};

} // namespace ariwire::core::transport::websocket
