#pragma once

#include <string>

#include "ariwire/core/protocol/control/event_kind.hpp"

namespace ariwire::core::protocol::control {

// Unsolicited notification. Immutable once dispatched: handlers receive it
// by const reference. Fields the layer does not model stay available in raw.
struct Event {
    EventKind kind{EventKind::Unknown};
    std::string type;           // discriminant exactly as received
    std::string application;
    std::string timestamp;

    // "channel" object, or "peer" for events that carry no channel (Dial)
    std::string channel_id;
    std::string channel_name;
    std::string app_data;       // channel.dialplan.app_data

    std::string bridge_id;
    std::string bridge_name;

    std::string dial_status;    // Dial only
    std::string media_connection_id; // peer/channel channelvars MEDIA_WEBSOCKET_CONNECTION_ID

    std::string raw;            // full JSON text
};

} // namespace ariwire::core::protocol::control
