#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace ariwire::core::config {

// What the media session does with an out-of-sequence inbound frame.
// Every anomaly is reported to the error channel regardless of policy.
enum class SequencePolicy : std::uint8_t {
    Deliver,      // deliver, annotated
    DropLate,     // drop duplicates and regressions; gaps are delivered
    FillSilence,  // insert silence frames for gaps; drop late frames
    Abort         // close the session
};

[[nodiscard]]
inline constexpr std::string_view to_string(SequencePolicy p) noexcept {
    switch (p) {
    case SequencePolicy::Deliver:     return "Deliver";
    case SequencePolicy::DropLate:    return "DropLate";
    case SequencePolicy::FillSilence: return "FillSilence";
    case SequencePolicy::Abort:       return "Abort";
    default:                          return "Unknown";
    }
}

struct Media {
    // 20 ms of 8 kHz ulaw. MEDIA_START optimal_frame_size overrides it
    // until the first frame is exchanged.
    std::size_t frame_size{160};
    std::uint32_t sample_rate{8000};
    // How long finish() waits for trailing inbound frames
    std::chrono::milliseconds drain_grace{2000};
    SequencePolicy sequence_policy{SequencePolicy::Deliver};
    // Upper bound of silence frames synthesized for one gap (FillSilence)
    std::uint32_t max_fill_frames{50};
    // Send every inbound payload back
    bool echo{false};
    // Prepended to log lines ("tag: ..."); MEDIA_START channel fills it when empty
    std::string tag{};
};

} // namespace ariwire::core::config
