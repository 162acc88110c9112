#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace ariwire::core::protocol::control {

// ===============================================
// ARI EVENT DISCRIMINANT
// ===============================================
// Closed set of event types handlers can be keyed on. Any other "type"
// value maps to Unknown and is still dispatched to catch-all handlers.
enum class EventKind : std::uint8_t {
    StasisStart,
    StasisEnd,
    Dial,
    ChannelCreated,
    ChannelDestroyed,
    ChannelStateChange,
    ChannelVarset,
    ChannelHangupRequest,
    ChannelDtmfReceived,
    ChannelEnteredBridge,
    ChannelLeftBridge,
    BridgeCreated,
    BridgeDestroyed,
    PlaybackStarted,
    PlaybackFinished,
    ApplicationReplaced,
    Unknown
};

inline constexpr std::size_t EVENT_KIND_COUNT = static_cast<std::size_t>(EventKind::Unknown) + 1;

[[nodiscard]]
inline constexpr std::string_view to_string(EventKind k) noexcept {
    switch (k) {
        case EventKind::StasisStart:          return "StasisStart";
        case EventKind::StasisEnd:            return "StasisEnd";
        case EventKind::Dial:                 return "Dial";
        case EventKind::ChannelCreated:       return "ChannelCreated";
        case EventKind::ChannelDestroyed:     return "ChannelDestroyed";
        case EventKind::ChannelStateChange:   return "ChannelStateChange";
        case EventKind::ChannelVarset:        return "ChannelVarset";
        case EventKind::ChannelHangupRequest: return "ChannelHangupRequest";
        case EventKind::ChannelDtmfReceived:  return "ChannelDtmfReceived";
        case EventKind::ChannelEnteredBridge: return "ChannelEnteredBridge";
        case EventKind::ChannelLeftBridge:    return "ChannelLeftBridge";
        case EventKind::BridgeCreated:        return "BridgeCreated";
        case EventKind::BridgeDestroyed:      return "BridgeDestroyed";
        case EventKind::PlaybackStarted:      return "PlaybackStarted";
        case EventKind::PlaybackFinished:     return "PlaybackFinished";
        case EventKind::ApplicationReplaced:  return "ApplicationReplaced";
        default:                              return "Unknown";
    }
}

[[nodiscard]]
inline constexpr EventKind to_event_kind(std::string_view type) noexcept {
    for (std::size_t i = 0; i < EVENT_KIND_COUNT - 1; ++i) {
        const auto k = static_cast<EventKind>(i);
        if (to_string(k) == type) {
            return k;
        }
    }
    return EventKind::Unknown;
}

} // namespace ariwire::core::protocol::control
