/*
===============================================================================
 Media Session Test Harness
===============================================================================

Builds a media::Session over MockWebSocket in either role and offers frame
helpers (encode an inbound frame, decode an outbound one).
===============================================================================
*/
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "ariwire/core/protocol/media/session.hpp"
#include "common/mock_websocket.hpp"
#include "common/roles.hpp"
#include "common/test_check.hpp"


using namespace ariwire::core;
using namespace ariwire::core::protocol;

using WebSocketUnderTest = transport::test::MockWebSocket;
using MediaUnderTest     = media::Session<WebSocketUnderTest>;


namespace ariwire::core::protocol::media::test {
namespace harness {

// Inbound frame as the peer would send it
inline std::string frame(std::uint32_t seq, std::string_view payload, std::size_t frame_size = 160) {
    std::string out;
    encode_frame(out, FrameHeader{seq, seq * static_cast<std::uint32_t>(frame_size)}, payload, frame_size);
    return out;
}

struct Session {
    transport::test::MockContext ctx;
    transport::Role role;
    MediaUnderTest session;

    explicit Session(transport::Role r, config::Media cfg = {})
        : role(r)
        , session(ctx, std::move(cfg))
    {
        WebSocketUnderTest::reset();
    }

    inline void connect() {
        if (role == transport::Role::Client) {
            transport::Handshake hs;
            hs.subprotocol = "media";
            TEST_CHECK(session.open("ws://pbx:8088/media/conn-1", hs) == transport::Error::None);
        }
        else {
            auto ws = std::make_unique<WebSocketUnderTest>(ctx);
            ws->accept("media", "10.0.0.5:51002");
            transport::Identity id;
            id.remote_address = "10.0.0.5:51002";
            id.subprotocol = "media";
            TEST_CHECK(session.adopt(std::move(ws), std::move(id)) == transport::Error::None);
        }
        drain();
        TEST_CHECK(session.is_open());
    }

    inline void drain(int iterations = 4) {
        for (int i = 0; i < iterations; ++i) {
            session.poll();
        }
    }

    inline WebSocketUnderTest& ws() {
        return session.ws();
    }

    [[nodiscard]]
    inline std::vector<InboundFrame> frames() {
        std::vector<InboundFrame> out;
        session.drain_frames([&out](const InboundFrame& f) { out.push_back(f); });
        return out;
    }

    // Outbound binary frames decoded (header, payload)
    [[nodiscard]]
    inline std::vector<std::pair<FrameHeader, std::string>> sent_frames() {
        std::vector<std::pair<FrameHeader, std::string>> out;
        for (const auto& m : ws().sent()) {
            if (m.is_text()) continue;
            FrameHeader h;
            std::string_view payload;
            TEST_CHECK(decode_frame(m.view(), h, payload));
            out.emplace_back(h, std::string(payload));
        }
        return out;
    }

    [[nodiscard]]
    inline std::vector<std::string> sent_commands() {
        std::vector<std::string> out;
        for (const auto& m : ws().sent()) {
            if (m.is_text()) out.push_back(m.data);
        }
        return out;
    }
};

} // namespace harness
} // namespace ariwire::core::protocol::media::test
