#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "lcr/endian.hpp"


namespace ariwire::core::protocol::media {

/*
===============================================================================
Media frame wire format
===============================================================================

Binary websocket message:

   0               4               8
  +---------------+---------------+------------------------------+
  |   sequence    |   timestamp   |   ulaw payload (frame_size)  |
  +---------------+---------------+------------------------------+

  - sequence:  uint32, network byte order, +1 per frame and direction
  - timestamp: uint32, network byte order, in samples (1 ulaw byte = 1 sample)
  - payload:   exactly frame_size bytes; short payloads are padded with
               ulaw silence (0xFF) by the sender
===============================================================================
*/

inline constexpr std::size_t HEADER_SIZE = 8;
inline constexpr char ULAW_SILENCE = static_cast<char>(0xFF);

struct FrameHeader {
    std::uint32_t sequence{0};
    std::uint32_t timestamp{0};
};

// How an inbound sequence number relates to the expected one
enum class SequenceAnomaly : std::uint8_t {
    None,        // sequence == expected
    Gap,         // frames were skipped
    Duplicate,   // same sequence as the previous frame
    Regression   // older than the previous frame
};

[[nodiscard]]
inline constexpr std::string_view to_string(SequenceAnomaly a) noexcept {
    switch (a) {
    case SequenceAnomaly::None:       return "None";
    case SequenceAnomaly::Gap:        return "Gap";
    case SequenceAnomaly::Duplicate:  return "Duplicate";
    case SequenceAnomaly::Regression: return "Regression";
    default:                          return "Unknown";
    }
}

// Decoded inbound frame as delivered to the consumer
struct InboundFrame {
    std::uint32_t sequence{0};
    std::uint32_t timestamp{0};
    std::uint32_t expected{0};          // sequence the session expected
    SequenceAnomaly anomaly{SequenceAnomaly::None};
    bool synthesized{false};            // silence inserted for a gap
    std::string payload;
};

// Appends header + payload padded to frame_size. Caller checks the size.
inline void encode_frame(std::string& out, FrameHeader h, std::string_view payload, std::size_t frame_size) {
    const std::size_t start = out.size();
    out.resize(start + HEADER_SIZE);
    auto* p = reinterpret_cast<std::byte*>(out.data() + start);
    lcr::store_be32(p, h.sequence);
    lcr::store_be32(p + 4, h.timestamp);
    out.append(payload.data(), payload.size());
    if (payload.size() < frame_size) {
        out.append(frame_size - payload.size(), ULAW_SILENCE);
    }
}

// Splits a binary message into header and payload view
[[nodiscard]]
inline bool decode_frame(std::string_view bytes, FrameHeader& h, std::string_view& payload) noexcept {
    if (bytes.size() < HEADER_SIZE) {
        return false;
    }
    const auto* p = reinterpret_cast<const std::byte*>(bytes.data());
    h.sequence  = lcr::load_be32(p);
    h.timestamp = lcr::load_be32(p + 4);
    payload = bytes.substr(HEADER_SIZE);
    return true;
}

// Classifies `actual` against `expected` (modulo 2^32)
[[nodiscard]]
inline constexpr SequenceAnomaly classify(std::uint32_t expected, std::uint32_t actual) noexcept {
    const std::uint32_t ahead = actual - expected;
    if (ahead == 0) {
        return SequenceAnomaly::None;
    }
    if (ahead < 0x80000000u) {
        return SequenceAnomaly::Gap;
    }
    return (actual == expected - 1) ? SequenceAnomaly::Duplicate : SequenceAnomaly::Regression;
}

} // namespace ariwire::core::protocol::media
