#pragma once

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>

#include "ariwire/core/protocol/media/error.hpp"


namespace ariwire::core::protocol::media {

/*
===============================================================================
EchoVerifier
===============================================================================

Compares the audio sent to an echoing peer with the audio it sent back.

  - The peer pads the last short frame with silence, so the expected length
    is the sent length rounded up to a multiple of the frame size
  - The echoed stream may start late by a whole number of frames (round trip
    framing delay). Offsets 0..max_offset_frames are tried in order and the
    first one whose payload matches is reported
  - Only the first sent_length bytes after the offset are compared; padding
    and trailing audio are ignored

A report passes when a matching offset exists and at least expected_length
bytes were received after it.
===============================================================================
*/

struct VerificationReport {
    static constexpr std::size_t npos = static_cast<std::size_t>(-1);

    std::size_t sent_length{0};
    std::size_t expected_length{0};
    std::size_t received_length{0};
    std::size_t offset_frames{0};            // alignment used for the verdict
    std::size_t first_mismatch{npos};        // byte index into the sent stream
    bool length_ok{false};
    Error error{Error::None};                // None or VerificationMismatch

    [[nodiscard]]
    inline bool passed() const noexcept { return error == Error::None; }
};

class EchoVerifier {
public:
    explicit EchoVerifier(std::size_t frame_size = 160, std::size_t max_offset_frames = 0)
        : frame_size_(frame_size)
        , max_offset_frames_(max_offset_frames)
    {}

    // MEDIA_START may renegotiate the frame size before audio flows
    inline void set_frame_size(std::size_t frame_size) noexcept {
        frame_size_ = frame_size;
    }

    inline void record_sent(std::string_view payload) {
        sent_.append(payload.data(), payload.size());
    }

    inline void record_received(std::string_view payload) {
        received_.append(payload.data(), payload.size());
    }

    inline void reset() {
        sent_.clear();
        received_.clear();
    }

    [[nodiscard]]
    inline VerificationReport verify() const {
        VerificationReport r;
        r.sent_length     = sent_.size();
        r.received_length = received_.size();
        r.expected_length = r.sent_length;
        if (frame_size_ > 0 && (r.sent_length % frame_size_) != 0) {
            r.expected_length += frame_size_ - (r.sent_length % frame_size_);
        }

        // Try each alignment; remember the mismatch of the zero offset
        std::size_t mismatch_at_zero = VerificationReport::npos;
        for (std::size_t k = 0; k <= max_offset_frames_; ++k) {
            const std::size_t start = k * frame_size_;
            const std::size_t mismatch = compare_(start);
            if (k == 0) {
                mismatch_at_zero = mismatch;
            }
            if (mismatch == VerificationReport::npos) {
                r.offset_frames  = k;
                r.first_mismatch = VerificationReport::npos;
                r.length_ok      = r.received_length >= start + r.expected_length;
                r.error          = r.length_ok ? Error::None : Error::VerificationMismatch;
                return r;
            }
            if (frame_size_ == 0) {
                break;
            }
        }
        r.offset_frames  = 0;
        r.first_mismatch = mismatch_at_zero;
        r.length_ok      = r.received_length >= r.expected_length;
        r.error          = Error::VerificationMismatch;
        return r;
    }

    [[nodiscard]] inline const std::string& sent() const noexcept { return sent_; }
    [[nodiscard]] inline const std::string& received() const noexcept { return received_; }
    [[nodiscard]] inline std::size_t frame_size() const noexcept { return frame_size_; }

private:
    std::size_t frame_size_;
    std::size_t max_offset_frames_;
    std::string sent_;
    std::string received_;

    // First differing index of sent_ against received_[start...], npos if equal
    [[nodiscard]]
    inline std::size_t compare_(std::size_t start) const noexcept {
        const std::size_t available = (received_.size() > start) ? received_.size() - start : 0;
        const std::size_t n = std::min(available, sent_.size());
        for (std::size_t i = 0; i < n; ++i) {
            if (sent_[i] != received_[start + i]) {
                return i;
            }
        }
        return (n < sent_.size()) ? n : VerificationReport::npos;
    }
};

} // namespace ariwire::core::protocol::media
