/*
===============================================================================
Control protocol Session
===============================================================================

Implements the ARI control protocol (REST requests tunnelled over a websocket
plus asynchronous events) on top of transport::Connection.

Architecture:
  - transport::*            → WebSocket transport (Beast, mockable)
  - transport::Connection   → lifecycle of one connection in either role
                               • client: open(url, handshake)
                               • server: adopt(ws, identity)
  - protocol::control       → protocol logic
                               • request serialization (dialect aware)
                               • response correlation (PendingRequests)
                               • event classification and dispatch

The session never sees which role produced its connection: requests,
responses and events behave identically for dialed and accepted sockets.

Execution model:
  - No threads. poll() advances the transport, dispatches inbound messages
    in arrival order, expires deadlines and then processes connection edges
  - request() never blocks: the completion is delivered during a later
    poll(), either to the supplied handler or to the completion ring
  - call() is the suspending form: it drives poll() until its own request
    resolves. It must not be used from inside a handler

Failure model:
  - A refused send resolves the request (mapped through from_transport)
  - Connection loss resolves every pending request with ConnectionClosed
  - Malformed messages and unmatched responses are reported to the error
    channel; they never close the connection
  - Handler exceptions are reported as HandlerFailed; dispatch continues
===============================================================================
*/

#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "ariwire/core/config/control.hpp"
#include "ariwire/core/config/ring_sizes.hpp"
#include "ariwire/core/transport/connection.hpp"
#include "ariwire/core/protocol/control/completion.hpp"
#include "ariwire/core/protocol/control/error.hpp"
#include "ariwire/core/protocol/control/event.hpp"
#include "ariwire/core/protocol/control/pending_requests.hpp"
#include "ariwire/core/protocol/control/req_id.hpp"
#include "ariwire/core/protocol/control/request.hpp"
#include "ariwire/core/protocol/control/parser/router.hpp"
#include "lcr/local/ring_buffer.hpp"
#include "lcr/log/logger.hpp"
#include "lcr/optional.hpp"
#include "lcr/sequence.hpp"


namespace ariwire::core::protocol::control {

using handler_id_t   = std::uint64_t;
using EventHandler   = std::function<void(const Event&)>;
using EventPredicate = std::function<bool(const Event&)>;

template<transport::WebSocketConcept WS>
class Session {
public:
    using context_type = typename WS::context_type;

    explicit Session(context_type& ctx, config::Control cfg = {})
        : connection_(ctx)
        , config_(std::move(cfg))
    {}

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    // Client role
    [[nodiscard]]
    inline transport::Error open(std::string_view url, const transport::Handshake& handshake = {}) {
        return connection_.open(url, handshake);
    }

    // Server role (socket already upgraded by the connection manager)
    [[nodiscard]]
    inline transport::Error adopt(std::unique_ptr<WS> ws, transport::Identity identity) {
        return connection_.adopt(std::move(ws), std::move(identity));
    }

    inline void close() noexcept {
        connection_.close();
    }

    // -------------------------------------------------------------------------
    // Requests
    // -------------------------------------------------------------------------

    // Issues a request and returns its correlation id.
    // The completion is delivered exactly once during a later poll(): to
    // `handler` when supplied, otherwise to pop_completion().
    // A timeout overrides config::Control::request_timeout.
    [[nodiscard]]
    inline req_id_t request(Request req, CompletionHandler handler = {},
                            lcr::optional<std::chrono::milliseconds> timeout = {}) {
        PendingRequest pending;
        pending.handler = std::move(handler);
        pending.created = clock::now();

        if (req.id.has()) {
            pending.id = req.id.value();
            if (pending.id == INVALID_REQ_ID || is_live_(pending.id)) {
                AW_ERROR(tag_() << "[CTRL] Request id " << pending.id << " is already pending, refusing " << req.method << " " << req.path);
                const req_id_t id = pending.id;
                defer_(std::move(pending), Error::DuplicateId);
                return id;
            }
        }
        else {
            do {
                pending.id = ids_.next();
            } while (pending.id == INVALID_REQ_ID || is_live_(pending.id));
        }

        req.write_json(pending.payload, pending.id, config_.dialect);

        const auto effective = timeout.has() ? timeout : config_.request_timeout;
        if (effective.has()) {
            pending.deadline = pending.created + effective.value();
        }

        AW_DEBUG(tag_() << "[CTRL] Sending request " << pending.id << ": " << req.method << " " << req.path);
        AW_TRACE(tag_() << "[CTRL] >> " << pending.payload);

        const transport::Error err = connection_.send(pending.payload, transport::websocket::MessageKind::Text);
        if (err != transport::Error::None) {
            AW_WARN(tag_() << "[CTRL] Request " << pending.id << " not sent (" << transport::to_string(err) << ")");
            const req_id_t id = pending.id;
            defer_(std::move(pending), from_transport(err));
            return id;
        }

        ++requests_issued_;
        const req_id_t id = pending.id;
        if (!pending_.add(std::move(pending))) {
            // Unreachable: liveness was checked above
            AW_ERROR(tag_() << "[CTRL] Pending table refused req_id=" << id);
        }
        return id;
    }

    // Suspending form: drives poll() until the request resolves.
    // Never call from inside a handler.
    [[nodiscard]]
    inline Completion call(Request req, lcr::optional<std::chrono::milliseconds> timeout = {}) {
        lcr::optional<Completion> result;
        (void)request(std::move(req), [&result](const Completion& c) { result = c; }, timeout);
        while (!result.has()) {
            poll();
            if (!result.has()) {
                std::this_thread::yield();
            }
        }
        return result.take();
    }

    // Resolves a pending request with Cancelled. Returns false if unknown.
    inline bool cancel(req_id_t id) {
        PendingRequest pending;
        if (!pending_.take(id, pending)) {
            return false;
        }
        AW_DEBUG(tag_() << "[CTRL] Request " << id << " cancelled");
        complete_(std::move(pending), Error::Cancelled);
        return true;
    }

    [[nodiscard]]
    inline bool pop_completion(Completion& out) {
        if (!completions_.pop(out)) {
            return false;
        }
        refill_completions_();
        return true;
    }

    template<class F>
    inline void drain_completions(F&& f) {
        Completion c;
        while (pop_completion(c)) {
            std::forward<F>(f)(c);
        }
    }

    // -------------------------------------------------------------------------
    // Events
    // -------------------------------------------------------------------------

    inline handler_id_t on_event(EventKind kind, EventHandler handler) {
        return add_handler_(Filter::Kind, kind, {}, std::move(handler));
    }

    inline handler_id_t on_any_event(EventHandler handler) {
        return add_handler_(Filter::Any, EventKind::Unknown, {}, std::move(handler));
    }

    inline handler_id_t on_event(EventPredicate predicate, EventHandler handler) {
        return add_handler_(Filter::Predicate, EventKind::Unknown, std::move(predicate), std::move(handler));
    }

    // Safe to call from inside a handler
    inline bool remove_handler(handler_id_t id) noexcept {
        for (auto& h : handlers_) {
            if (h.id == id && h.active) {
                h.active = false;
                handlers_dirty_ = true;
                return true;
            }
        }
        return false;
    }

    // -------------------------------------------------------------------------
    // Error channel
    // -------------------------------------------------------------------------

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

        // Requests refused at send time
        flush_deferred_();

        // Inbound messages, strictly in arrival order
        while (transport::websocket::Message* msg = connection_.peek_message()) {
            transport::websocket::Message m = std::move(*msg);
            connection_.release_message();
            handle_message_(m);
        }

        // Deadlines
        for (auto& expired : pending_.expire(clock::now())) {
            AW_WARN(tag_() << "[CTRL] Request " << expired.id << " timed out");
            complete_(std::move(expired), Error::Timeout);
        }

        // Connection edges (after messages: responses received before the
        // close still resolve their requests)
        transport::connection::Signal sig;
        while (connection_.poll_signal(sig)) {
            handle_signal_(sig);
        }
    }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------
    [[nodiscard]] inline const transport::Connection<WS>& connection() const noexcept { return connection_; }
    [[nodiscard]] inline transport::State state() const noexcept { return connection_.state(); }
    [[nodiscard]] inline bool is_open() const noexcept { return connection_.is_open(); }
    [[nodiscard]] inline bool is_closed() const noexcept { return connection_.is_closed(); }
    [[nodiscard]] inline const transport::Identity& identity() const noexcept { return connection_.identity(); }
    [[nodiscard]] inline const config::Control& config() const noexcept { return config_; }

    [[nodiscard]] inline std::size_t pending_requests() const noexcept { return pending_.size(); }
    [[nodiscard]] inline std::uint64_t requests_issued() const noexcept { return requests_issued_; }
    [[nodiscard]] inline std::uint64_t responses_matched() const noexcept { return responses_matched_; }
    [[nodiscard]] inline std::uint64_t unmatched_responses() const noexcept { return unmatched_responses_; }
    [[nodiscard]] inline std::uint64_t events_dispatched() const noexcept { return events_dispatched_; }
    [[nodiscard]] inline std::uint64_t protocol_errors() const noexcept { return protocol_errors_; }

    // True when no request awaits resolution
    [[nodiscard]]
    inline bool is_idle() const noexcept {
        return pending_.empty() && deferred_.empty();
    }

#ifdef AW_UNIT_TEST
public:
    WS& ws() {
        return connection_.ws();
    }
#endif // AW_UNIT_TEST

private:
    enum class Filter : std::uint8_t { Kind, Any, Predicate };

    struct HandlerEntry {
        handler_id_t id;
        Filter filter;
        EventKind kind;
        EventPredicate predicate;
        EventHandler fn;
        bool active;
    };

    struct Deferred {
        PendingRequest request;
        Error error;
    };

    transport::Connection<WS> connection_;
    config::Control config_;
    parser::Router router_;
    parser::Inbound inbound_;

    lcr::sequence ids_{1};
    PendingRequests pending_;
    std::vector<Deferred> deferred_;

    std::vector<HandlerEntry> handlers_;
    handler_id_t next_handler_id_{1};
    bool handlers_dirty_{false};
    int dispatch_depth_{0};

    lcr::local::ring_buffer<Completion, config::completion_ring> completions_;
    // Completions resolved while the ring was full, oldest first
    std::deque<Completion> completion_overflow_;
    lcr::local::ring_buffer<ErrorReport, config::error_ring> errors_;

    std::uint64_t requests_issued_{0};
    std::uint64_t responses_matched_{0};
    std::uint64_t unmatched_responses_{0};
    std::uint64_t events_dispatched_{0};
    std::uint64_t protocol_errors_{0};

private:
    [[nodiscard]]
    inline lcr::log::Tag tag_() const noexcept {
        return lcr::log::Tag{config_.tag};
    }

    [[nodiscard]]
    inline bool is_live_(req_id_t id) const noexcept {
        if (pending_.contains(id)) {
            return true;
        }
        for (const auto& d : deferred_) {
            if (d.request.id == id && d.error != Error::DuplicateId) {
                return true;
            }
        }
        return false;
    }

    inline void defer_(PendingRequest&& pending, Error error) {
        deferred_.push_back(Deferred{std::move(pending), error});
    }

    inline void flush_deferred_() {
        if (deferred_.empty()) {
            return;
        }
        std::vector<Deferred> batch;
        batch.swap(deferred_);
        for (auto& d : batch) {
            complete_(std::move(d.request), d.error);
        }
    }

    inline void complete_(PendingRequest&& pending, Error error, Response response = {}) {
        Completion c;
        c.req_id   = pending.id;
        c.error    = error;
        c.response = std::move(response);
        c.response.req_id = pending.id;

        if (pending.handler) {
            try {
                pending.handler(c);
            }
            catch (const std::exception& e) {
                AW_ERROR(tag_() << "[CTRL] Completion handler for request " << pending.id << " threw: " << e.what());
                report_(Error::HandlerFailed, pending.id, e.what());
            }
            return;
        }
        if (!completion_overflow_.empty() || !completions_.push(std::move(c))) [[unlikely]] {
            if (completion_overflow_.empty()) {
                AW_WARN(tag_() << "[CTRL] Completion ring full, queueing completion of request " << pending.id << " in overflow (user not draining completions)");
            }
            completion_overflow_.push_back(std::move(c));
        }
    }

    inline void refill_completions_() {
        while (!completion_overflow_.empty() && completions_.push(std::move(completion_overflow_.front()))) {
            completion_overflow_.pop_front();
        }
    }

    inline void report_(Error error, req_id_t id, std::string detail) {
        ErrorReport r{error, id, std::move(detail)};
        if (!errors_.push(std::move(r))) {
            AW_WARN(tag_() << "[CTRL] Error channel full, dropping oldest report");
            errors_.drop_front();
            (void)errors_.push(std::move(r));
        }
    }

    inline handler_id_t add_handler_(Filter filter, EventKind kind, EventPredicate predicate, EventHandler fn) {
        const handler_id_t id = next_handler_id_++;
        handlers_.push_back(HandlerEntry{id, filter, kind, std::move(predicate), std::move(fn), true});
        return id;
    }

    [[nodiscard]]
    static inline bool matches_(const HandlerEntry& h, const Event& ev) {
        switch (h.filter) {
        case Filter::Kind:      return h.kind == ev.kind;
        case Filter::Any:       return true;
        case Filter::Predicate: return h.predicate && h.predicate(ev);
        }
        return false;
    }

    inline void handle_message_(const transport::websocket::Message& msg) {
        if (!msg.is_text()) {
            ++protocol_errors_;
            AW_WARN(tag_() << "[CTRL] Binary message (" << msg.data.size() << " bytes) on control connection ignored");
            report_(Error::Protocol, INVALID_REQ_ID, "binary message on control connection");
            return;
        }
        AW_TRACE(tag_() << "[CTRL] << " << msg.data);

        const parser::Result r = router_.parse(msg.view(), inbound_);
        if (r != parser::Result::Parsed) {
            ++protocol_errors_;
            AW_WARN(tag_() << "[CTRL] Malformed control message (" << parser::to_string(r) << "): " << msg.data);
            report_(Error::Protocol, INVALID_REQ_ID, std::string(parser::to_string(r)));
            return;
        }

        if (inbound_.type == parser::Inbound::Type::Response) {
            handle_response_(std::move(inbound_.response));
        }
        else {
            dispatch_event_(inbound_.event);
        }
    }

    inline void handle_response_(Response&& response) {
        PendingRequest pending;
        if (response.req_id == INVALID_REQ_ID || !pending_.take(response.req_id, pending)) {
            ++unmatched_responses_;
            AW_WARN(tag_() << "[CTRL] Dropping response for unknown request " << response.req_id
                    << " (status " << response.status << ")");
            report_(Error::Protocol, response.req_id, "unmatched response");
            return;
        }
        ++responses_matched_;
        const Error error = response.success() ? Error::None : Error::Remote;
        AW_DEBUG(tag_() << "[CTRL] Request " << pending.id << " completed: " << response.status << " " << response.reason);
        complete_(std::move(pending), error, std::move(response));
    }

    inline void dispatch_event_(const Event& ev) {
        if (ev.kind != EventKind::ChannelVarset) {
            AW_DEBUG(tag_() << "[CTRL] Received " << ev.type << " "
                     << (ev.bridge_name.empty() ? ev.bridge_id : ev.bridge_name) << " " << ev.channel_name);
        }
        ++events_dispatched_;

        ++dispatch_depth_;
        // Handlers registered while dispatching see the next event only
        const std::size_t count = handlers_.size();
        for (std::size_t i = 0; i < count; ++i) {
            if (!handlers_[i].active) {
                continue;
            }
            // Copy: a handler may register another one and reallocate the table
            HandlerEntry entry = handlers_[i];
            try {
                if (matches_(entry, ev)) {
                    entry.fn(ev);
                }
            }
            catch (const std::exception& e) {
                AW_ERROR(tag_() << "[CTRL] Handler " << entry.id << " failed on " << ev.type << ": " << e.what());
                report_(Error::HandlerFailed, INVALID_REQ_ID, e.what());
            }
        }
        --dispatch_depth_;

        if (dispatch_depth_ == 0 && handlers_dirty_) {
            std::erase_if(handlers_, [](const HandlerEntry& h) { return !h.active; });
            handlers_dirty_ = false;
        }
    }

    inline void handle_signal_(transport::connection::Signal sig) {
        switch (sig) {
        case transport::connection::Signal::Opened:
            AW_INFO(tag_() << "[CTRL] Control connection open (" << transport::to_string(connection_.role())
                    << ", peer " << connection_.identity().remote_address << ")");
            break;

        case transport::connection::Signal::OpenFailed:
        case transport::connection::Signal::Closed:
            fail_all_(Error::ConnectionClosed);
            break;

        case transport::connection::Signal::BackpressureDetected:
            AW_WARN(tag_() << "[CTRL] Transport backpressure detected");
            break;

        case transport::connection::Signal::BackpressureCleared:
            AW_INFO(tag_() << "[CTRL] Transport backpressure cleared");
            break;

        default:
            break;
        }
    }

    inline void fail_all_(Error error) {
        flush_deferred_();
        auto all = pending_.take_all();
        if (!all.empty()) {
            AW_WARN(tag_() << "[CTRL] Resolving " << all.size() << " pending request(s) with " << to_string(error));
        }
        for (auto& p : all) {
            complete_(std::move(p), error);
        }
    }
};

} // namespace ariwire::core::protocol::control
