/*
===============================================================================
Media protocol Session
===============================================================================

Streams fixed-size ulaw frames over a dedicated websocket connection, in
either role, on top of transport::Connection.

Outbound:
  - send_frame() stamps the next sequence number and timestamp, pads short
    payloads with silence and sends one binary message. It never blocks:
    a full transport queue or a peer MEDIA_XOFF refuses the frame with
    Error::Backpressure and the sequence number is not consumed
  - send_audio() chunks a buffer into frames and stops at the first refusal
  - send_command() sends a media control-plane command (text)

Inbound:
  - Binary messages are decoded into InboundFrame values in arrival order
    and annotated with a SequenceAnomaly. What happens next is selected by
    config::Media::sequence_policy; every anomaly is reported
  - A payload that is not exactly the session frame size is reported as
    Error::InvalidFrame and not delivered
  - Text messages are media notifications (MEDIA_START, MEDIA_XOFF, ...),
    queued for the consumer after the session has applied them

Lifecycle (see media/state.hpp):
  - Streaming starts with the first frame sent or received
  - finish() sends HANGUP and drains trailing frames for a grace period;
    an inbound HANGUP drains the same way
  - cancel() is immediate: sends stop, the transport is closed, frames
    already in flight are still delivered until it is
  - Closed is terminal; transport loss leads there from any state

Consumers pull frames, notices and errors after poll().
===============================================================================
*/

#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "ariwire/core/config/media.hpp"
#include "ariwire/core/config/ring_sizes.hpp"
#include "ariwire/core/transport/connection.hpp"
#include "ariwire/core/protocol/media/command.hpp"
#include "ariwire/core/protocol/media/echo_verifier.hpp"
#include "ariwire/core/protocol/media/error.hpp"
#include "ariwire/core/protocol/media/frame.hpp"
#include "ariwire/core/protocol/media/state.hpp"
#include "lcr/local/ring_buffer.hpp"
#include "lcr/log/logger.hpp"
#include "lcr/optional.hpp"


namespace ariwire::core::protocol::media {

template<transport::WebSocketConcept WS>
class Session {
public:
    using context_type = typename WS::context_type;
    using clock        = std::chrono::steady_clock;

    explicit Session(context_type& ctx, config::Media cfg = {})
        : connection_(ctx)
        , config_(std::move(cfg))
        , frame_size_(config_.frame_size)
        , tag_(config_.tag)
    {}

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    // Client role
    [[nodiscard]]
    inline transport::Error open(std::string_view url, const transport::Handshake& handshake = {}) {
        if (state_ != State::Idle) {
            return transport::Error::InvalidState;
        }
        return connection_.open(url, handshake);
    }

    // Server role
    [[nodiscard]]
    inline transport::Error adopt(std::unique_ptr<WS> ws, transport::Identity identity) {
        if (state_ != State::Idle) {
            return transport::Error::InvalidState;
        }
        return connection_.adopt(std::move(ws), std::move(identity));
    }

    // Sends HANGUP and waits up to `grace` for trailing frames
    [[nodiscard]]
    inline Error finish(lcr::optional<std::chrono::milliseconds> grace = {}) {
        if (state_ == State::Closed) {
            return Error::InvalidState;
        }
        if (state_ == State::Draining) {
            return Error::None;
        }
        const Error err = send_command(Command::Hangup);
        if (err != Error::None) {
            AW_WARN(tag() << "[MEDIA] HANGUP not sent (" << to_string(err) << "), closing");
            cancel();
            return err;
        }
        begin_drain_(grace.value_or(config_.drain_grace));
        return Error::None;
    }

    // Immediate stop. Idempotent.
    inline void cancel() noexcept {
        if (state_ != State::Closed) {
            AW_DEBUG(tag() << "[MEDIA] Session cancelled in " << to_string(state_));
            set_state_(State::Closed);
        }
        connection_.close();
    }

    // Non-owning; the verifier must outlive the session or be detached
    inline void attach_verifier(EchoVerifier* verifier) noexcept {
        verifier_ = verifier;
        if (verifier_) {
            verifier_->set_frame_size(frame_size_);
        }
    }

    // -------------------------------------------------------------------------
    // Sending
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline Error send_frame(std::string_view payload) {
        if (state_ == State::Draining || state_ == State::Closed) {
            return Error::InvalidState;
        }
        if (payload.size() > frame_size_) {
            return Error::InvalidFrame;
        }
        if (xoff_) {
            return Error::Backpressure;
        }

        scratch_.clear();
        encode_frame(scratch_, FrameHeader{out_sequence_, out_timestamp_}, payload, frame_size_);
        const transport::Error err = connection_.send(scratch_, transport::websocket::MessageKind::Binary);
        if (err != transport::Error::None) {
            return from_transport(err);
        }

        ++out_sequence_;
        out_timestamp_ += static_cast<std::uint32_t>(frame_size_);
        ++frames_sent_;
        bytes_sent_ += payload.size();
        if (verifier_) {
            verifier_->record_sent(payload);
        }
        if (state_ == State::Idle) {
            set_state_(State::Streaming);
        }
        return Error::None;
    }

    // Returns the number of bytes accepted (a multiple of the frame size
    // unless the whole buffer was accepted)
    [[nodiscard]]
    inline std::size_t send_audio(std::string_view bytes) {
        std::size_t accepted = 0;
        while (accepted < bytes.size()) {
            const std::size_t n = std::min(frame_size_, bytes.size() - accepted);
            if (send_frame(bytes.substr(accepted, n)) != Error::None) {
                break;
            }
            accepted += n;
        }
        return accepted;
    }

    [[nodiscard]]
    inline Error send_command(Command command, std::string_view argument = {}) {
        if (state_ == State::Closed) {
            return Error::InvalidState;
        }
        const std::string text = format_command(command, argument);
        AW_DEBUG(tag() << "[MEDIA] Sending " << text);
        return from_transport(connection_.send(text, transport::websocket::MessageKind::Text));
    }

    // -------------------------------------------------------------------------
    // Inbound
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline bool pop_frame(InboundFrame& out) noexcept {
        return frames_.pop(out);
    }

    template<class F>
    inline void drain_frames(F&& f) {
        InboundFrame frame;
        while (frames_.pop(frame)) {
            std::forward<F>(f)(frame);
        }
    }

    [[nodiscard]]
    inline bool pop_notice(Notice& out) noexcept {
        return notices_.pop(out);
    }

    template<class F>
    inline void drain_notices(F&& f) {
        Notice n;
        while (notices_.pop(n)) {
            std::forward<F>(f)(n);
        }
    }

    [[nodiscard]]
    inline bool pop_error(ErrorReport& out) noexcept {
        return errors_.pop(out);
    }

    template<class F>
    inline void drain_errors(F&& f) {
        ErrorReport r;
        while (errors_.pop(r)) {
            std::forward<F>(f)(r);
        }
    }

    // -------------------------------------------------------------------------
    // Event loop
    // -------------------------------------------------------------------------
    inline void poll() {
        connection_.poll();

        while (transport::websocket::Message* msg = connection_.peek_message()) {
            transport::websocket::Message m = std::move(*msg);
            connection_.release_message();
            if (m.is_text()) {
                handle_notice_(m.view());
            }
            else {
                handle_frame_(m.view());
            }
        }

        if (state_ == State::Draining && clock::now() >= drain_deadline_) {
            AW_INFO(tag() << "[MEDIA] Drain complete (" << frames_received_ << " frames received)");
            set_state_(State::Closed);
            connection_.close();
        }

        transport::connection::Signal sig;
        while (connection_.poll_signal(sig)) {
            handle_signal_(sig);
        }
    }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------
    [[nodiscard]] inline State state() const noexcept { return state_; }
    [[nodiscard]] inline const transport::Connection<WS>& connection() const noexcept { return connection_; }
    [[nodiscard]] inline bool is_open() const noexcept { return connection_.is_open(); }
    [[nodiscard]] inline bool is_closed() const noexcept { return state_ == State::Closed && !connection_.is_active(); }
    [[nodiscard]] inline const transport::Identity& identity() const noexcept { return connection_.identity(); }
    [[nodiscard]] inline const config::Media& config() const noexcept { return config_; }

    [[nodiscard]] inline std::size_t frame_size() const noexcept { return frame_size_; }
    [[nodiscard]] inline bool xoff() const noexcept { return xoff_; }
    [[nodiscard]] inline std::uint32_t next_sequence() const noexcept { return out_sequence_; }
    [[nodiscard]] inline std::uint32_t expected_sequence() const noexcept { return in_sequence_; }

    [[nodiscard]] inline std::uint64_t frames_sent() const noexcept { return frames_sent_; }
    [[nodiscard]] inline std::uint64_t frames_received() const noexcept { return frames_received_; }
    [[nodiscard]] inline std::uint64_t bytes_sent() const noexcept { return bytes_sent_; }
    [[nodiscard]] inline std::uint64_t bytes_received() const noexcept { return bytes_received_; }
    [[nodiscard]] inline std::uint64_t anomalies() const noexcept { return anomalies_; }

    [[nodiscard]]
    inline lcr::log::Tag tag() const noexcept {
        return lcr::log::Tag{tag_};
    }

#ifdef AW_UNIT_TEST
public:
    WS& ws() {
        return connection_.ws();
    }
#endif // AW_UNIT_TEST

private:
    transport::Connection<WS> connection_;
    config::Media config_;
    std::size_t frame_size_;
    std::string tag_;

    State state_{State::Idle};
    bool xoff_{false};
    clock::time_point drain_deadline_{};
    EchoVerifier* verifier_{nullptr};

    std::uint32_t out_sequence_{0};
    std::uint32_t out_timestamp_{0};
    std::uint32_t in_sequence_{0};
    std::string scratch_;

    std::uint64_t frames_sent_{0};
    std::uint64_t frames_received_{0};
    std::uint64_t bytes_sent_{0};
    std::uint64_t bytes_received_{0};
    std::uint64_t anomalies_{0};

    lcr::local::ring_buffer<InboundFrame, config::frame_ring> frames_;
    lcr::local::ring_buffer<Notice, config::media_notice_ring> notices_;
    lcr::local::ring_buffer<ErrorReport, config::error_ring> errors_;

private:
    inline void set_state_(State s) noexcept {
        AW_TRACE(tag() << "[MEDIA] State: " << to_string(state_) << " -> " << to_string(s));
        state_ = s;
    }

    inline void begin_drain_(std::chrono::milliseconds grace) {
        drain_deadline_ = clock::now() + grace;
        set_state_(State::Draining);
        AW_DEBUG(tag() << "[MEDIA] Draining for " << grace.count() << " ms");
    }

    inline void report_(Error error, std::string detail) {
        ErrorReport r{error, std::move(detail)};
        if (!errors_.push(std::move(r))) {
            AW_WARN(tag() << "[MEDIA] Error channel full, dropping oldest report");
            errors_.drop_front();
            (void)errors_.push(std::move(r));
        }
    }

    inline void handle_notice_(std::string_view text) {
        Notice notice;
        if (!parse_notice(text, notice)) {
            AW_WARN(tag() << "[MEDIA] Malformed media notification: " << text);
            report_(Error::Protocol, std::string(text));
            return;
        }
        AW_INFO(tag() << "[MEDIA] Received media notification " << text);

        switch (notice.type) {
        case NoticeType::MediaStart:
            if (tag_.empty() && !notice.channel.empty()) {
                tag_ = notice.channel;
            }
            if (notice.optimal_frame_size > 0) {
                if (state_ == State::Idle) {
                    frame_size_ = notice.optimal_frame_size;
                    if (verifier_) {
                        verifier_->set_frame_size(frame_size_);
                    }
                }
                else if (notice.optimal_frame_size != frame_size_) {
                    AW_WARN(tag() << "[MEDIA] Ignoring frame size " << notice.optimal_frame_size
                            << " after streaming started (keeping " << frame_size_ << ")");
                }
            }
            break;

        case NoticeType::MediaXoff:
            xoff_ = true;
            break;

        case NoticeType::MediaXon:
            xoff_ = false;
            break;

        case NoticeType::Hangup:
            if (state_ == State::Idle || state_ == State::Streaming) {
                begin_drain_(config_.drain_grace);
            }
            break;

        default:
            break;
        }

        if (!notices_.push(std::move(notice))) {
            AW_WARN(tag() << "[MEDIA] Notice ring full, dropping " << text);
        }
    }

    inline void handle_frame_(std::string_view bytes) {
        FrameHeader header;
        std::string_view payload;
        if (!decode_frame(bytes, header, payload)) {
            AW_WARN(tag() << "[MEDIA] Binary message of " << bytes.size() << " bytes is not a frame");
            report_(Error::InvalidFrame, "short binary message");
            return;
        }
        if (payload.size() != frame_size_) {
            // Sequence tracking is left untouched, the next frame reports the gap
            AW_WARN(tag() << "[MEDIA] Frame " << header.sequence << " carries " << payload.size()
                    << " bytes, session frame size is " << frame_size_);
            report_(Error::InvalidFrame, "frame " + std::to_string(header.sequence) + " payload of "
                    + std::to_string(payload.size()) + " bytes, expected " + std::to_string(frame_size_));
            return;
        }
        ++frames_received_;
        bytes_received_ += payload.size();
        if (state_ == State::Idle) {
            set_state_(State::Streaming);
        }

        const std::uint32_t expected = in_sequence_;
        const SequenceAnomaly anomaly = classify(expected, header.sequence);
        if (anomaly == SequenceAnomaly::None || anomaly == SequenceAnomaly::Gap) {
            in_sequence_ = header.sequence + 1;
        }

        if (anomaly != SequenceAnomaly::None) {
            ++anomalies_;
            AW_WARN(tag() << "[MEDIA] Sequence " << to_string(anomaly) << ": expected " << expected
                    << ", received " << header.sequence);
            report_(Error::SequenceAnomaly, std::string(to_string(anomaly)) + " expected "
                    + std::to_string(expected) + " received " + std::to_string(header.sequence));

            switch (config_.sequence_policy) {
            case config::SequencePolicy::Abort:
                AW_ERROR(tag() << "[MEDIA] Aborting on sequence anomaly");
                cancel();
                return;

            case config::SequencePolicy::DropLate:
                if (anomaly != SequenceAnomaly::Gap) {
                    return;
                }
                break;

            case config::SequencePolicy::FillSilence:
                if (anomaly != SequenceAnomaly::Gap) {
                    return;
                }
                fill_gap_(expected, header);
                break;

            default:
                break;
            }
        }

        InboundFrame frame;
        frame.sequence  = header.sequence;
        frame.timestamp = header.timestamp;
        frame.expected  = expected;
        frame.anomaly   = anomaly;
        frame.payload.assign(payload.data(), payload.size());
        deliver_(std::move(frame));
    }

    inline void fill_gap_(std::uint32_t expected, const FrameHeader& header) {
        const std::uint32_t missing = header.sequence - expected;
        const std::uint32_t count = std::min(missing, config_.max_fill_frames);
        // Fill the frames right before the one received
        const std::uint32_t first = header.sequence - count;
        for (std::uint32_t i = 0; i < count; ++i) {
            InboundFrame frame;
            frame.sequence    = first + i;
            frame.timestamp   = header.timestamp - static_cast<std::uint32_t>((count - i) * frame_size_);
            frame.expected    = expected;
            frame.anomaly     = SequenceAnomaly::None;
            frame.synthesized = true;
            frame.payload.assign(frame_size_, ULAW_SILENCE);
            deliver_(std::move(frame));
        }
    }

    inline void deliver_(InboundFrame&& frame) {
        if (verifier_ && !frame.synthesized) {
            verifier_->record_received(frame.payload);
        }
        if (config_.echo && state_ == State::Streaming && !frame.synthesized) {
            const Error err = send_frame(frame.payload);
            if (err != Error::None) {
                report_(err, "echo of frame " + std::to_string(frame.sequence) + " refused");
            }
        }
        if (!frames_.push(std::move(frame))) {
            AW_WARN(tag() << "[MEDIA] Frame ring full, dropping frame (consumer not draining)");
            report_(Error::Backpressure, "frame ring full");
        }
    }

    inline void handle_signal_(transport::connection::Signal sig) {
        switch (sig) {
        case transport::connection::Signal::Opened:
            AW_INFO(tag() << "[MEDIA] Media websocket connection " << (connection_.role() == transport::Role::Server ? "from " : "to ")
                    << connection_.identity().remote_address);
            break;

        case transport::connection::Signal::OpenFailed:
        case transport::connection::Signal::Closed:
            if (state_ != State::Closed) {
                set_state_(State::Closed);
            }
            AW_INFO(tag() << "[MEDIA] Media disconnected (sent " << frames_sent_ << " frames, received "
                    << frames_received_ << ")");
            break;

        case transport::connection::Signal::BackpressureDetected:
            AW_WARN(tag() << "[MEDIA] Transport backpressure detected");
            break;

        case transport::connection::Signal::BackpressureCleared:
            AW_DEBUG(tag() << "[MEDIA] Transport backpressure cleared");
            break;

        default:
            break;
        }
    }
};

} // namespace ariwire::core::protocol::media
