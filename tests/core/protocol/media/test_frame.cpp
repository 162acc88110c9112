/*
===============================================================================
 media frame / notification Unit Tests
===============================================================================

Scope:
------
- Frame header layout (network byte order) and silence padding
- Sequence classification, including wrap-around
- Media notification parsing (MEDIA_START parameters, arguments, errors)
- Outbound command formatting
===============================================================================
*/

#include <iostream>
#include <string>
#include <string_view>

#include "ariwire/core/protocol/media/command.hpp"
#include "ariwire/core/protocol/media/frame.hpp"
#include "common/test_check.hpp"

using namespace ariwire::core::protocol::media;


static unsigned byte_at(const std::string& s, std::size_t i) {
    return static_cast<unsigned char>(s[i]);
}

// -----------------------------------------------------------------------------
// Frames
// -----------------------------------------------------------------------------
void test_encode_layout() {
    std::cout << "[TEST] frame layout and padding\n";
    std::string out;
    encode_frame(out, FrameHeader{0x01020304u, 0x0A0B0C0Du}, "abc", 8);

    TEST_CHECK(out.size() == HEADER_SIZE + 8);
    TEST_CHECK(byte_at(out, 0) == 0x01 && byte_at(out, 3) == 0x04);
    TEST_CHECK(byte_at(out, 4) == 0x0A && byte_at(out, 7) == 0x0D);
    TEST_CHECK(out.substr(8, 3) == "abc");
    for (std::size_t i = 11; i < out.size(); ++i) {
        TEST_CHECK(out[i] == ULAW_SILENCE);
    }

    // Appends after existing content
    std::string two = "xy";
    encode_frame(two, FrameHeader{1, 2}, std::string(4, 'p'), 4);
    TEST_CHECK(two.size() == 2 + HEADER_SIZE + 4);
    TEST_CHECK(two.substr(0, 2) == "xy");
    std::cout << "[TEST] OK\n";
}

void test_decode() {
    std::cout << "[TEST] frame decoding\n";
    std::string wire;
    encode_frame(wire, FrameHeader{7, 1120}, std::string(160, '\x55'), 160);

    FrameHeader h;
    std::string_view payload;
    TEST_CHECK(decode_frame(wire, h, payload));
    TEST_CHECK(h.sequence == 7);
    TEST_CHECK(h.timestamp == 1120);
    TEST_CHECK(payload.size() == 160);
    TEST_CHECK(payload[0] == '\x55');

    // Header only: valid, empty payload
    TEST_CHECK(decode_frame(std::string_view(wire).substr(0, HEADER_SIZE), h, payload));
    TEST_CHECK(payload.empty());

    TEST_CHECK(!decode_frame(std::string_view(wire).substr(0, HEADER_SIZE - 1), h, payload));
    TEST_CHECK(!decode_frame("", h, payload));
    std::cout << "[TEST] OK\n";
}

void test_classify() {
    std::cout << "[TEST] sequence classification\n";
    TEST_CHECK(classify(5, 5) == SequenceAnomaly::None);
    TEST_CHECK(classify(5, 6) == SequenceAnomaly::Gap);
    TEST_CHECK(classify(5, 500) == SequenceAnomaly::Gap);
    TEST_CHECK(classify(5, 4) == SequenceAnomaly::Duplicate);
    TEST_CHECK(classify(5, 1) == SequenceAnomaly::Regression);

    // Wrap-around of the 32-bit counter
    TEST_CHECK(classify(0xFFFFFFFFu, 0xFFFFFFFFu) == SequenceAnomaly::None);
    TEST_CHECK(classify(0xFFFFFFFEu, 1) == SequenceAnomaly::Gap);
    TEST_CHECK(classify(0, 0xFFFFFFFFu) == SequenceAnomaly::Duplicate);
    TEST_CHECK(classify(2, 0xFFFFFFF0u) == SequenceAnomaly::Regression);

    TEST_CHECK(to_string(SequenceAnomaly::Gap) == "Gap");
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Notifications
// -----------------------------------------------------------------------------
void test_media_start() {
    std::cout << "[TEST] MEDIA_START parsing\n";
    Notice n;
    const std::string text =
        "MEDIA_START connection_id:4b9c1d2e channel:WebSocket/media-1/0x7f01 "
        "format:ulaw optimal_frame_size:320 ptime:20";
    TEST_CHECK(parse_notice(text, n));
    TEST_CHECK(n.type == NoticeType::MediaStart);
    TEST_CHECK(n.name == "MEDIA_START");
    TEST_CHECK(n.channel == "WebSocket/media-1/0x7f01");
    TEST_CHECK(n.optimal_frame_size == 320);
    TEST_CHECK(n.param("connection_id") == "4b9c1d2e");
    TEST_CHECK(n.param("format") == "ulaw");
    TEST_CHECK(n.param("missing").empty());
    TEST_CHECK(n.params.size() == 5);
    TEST_CHECK(n.argument.empty());
    TEST_CHECK(n.raw == text);
    std::cout << "[TEST] OK\n";
}

void test_simple_notices() {
    std::cout << "[TEST] flow control and other notifications\n";
    Notice n;
    TEST_CHECK(parse_notice("MEDIA_XOFF", n));
    TEST_CHECK(n.type == NoticeType::MediaXoff);
    TEST_CHECK(n.params.empty());

    TEST_CHECK(parse_notice("MEDIA_XON", n));
    TEST_CHECK(n.type == NoticeType::MediaXon);

    TEST_CHECK(parse_notice("MEDIA_BUFFERING_COMPLETED  prompt-1", n));
    TEST_CHECK(n.type == NoticeType::BufferingCompleted);
    TEST_CHECK(n.argument == "prompt-1");

    TEST_CHECK(parse_notice("HANGUP", n));
    TEST_CHECK(n.type == NoticeType::Hangup);

    TEST_CHECK(parse_notice("QUEUE_DRAINED now", n));
    TEST_CHECK(n.type == NoticeType::Unknown);
    TEST_CHECK(n.name == "QUEUE_DRAINED");
    TEST_CHECK(n.argument == "now");
    std::cout << "[TEST] OK\n";
}

void test_malformed_notices() {
    std::cout << "[TEST] malformed notifications\n";
    Notice n;
    TEST_CHECK(!parse_notice("", n));
    TEST_CHECK(!parse_notice("   ", n));
    TEST_CHECK(!parse_notice("MEDIA_START optimal_frame_size:abc", n));
    TEST_CHECK(n.optimal_frame_size == 0);
    TEST_CHECK(!parse_notice("MEDIA_START optimal_frame_size:160x", n));
    std::cout << "[TEST] OK\n";
}

void test_format_command() {
    std::cout << "[TEST] command formatting\n";
    TEST_CHECK(format_command(Command::StartMediaBuffering) == "START_MEDIA_BUFFERING");
    TEST_CHECK(format_command(Command::StopMediaBuffering, "prompt-1") == "STOP_MEDIA_BUFFERING prompt-1");
    TEST_CHECK(format_command(Command::Hangup) == "HANGUP");
    std::cout << "[TEST] OK\n";
}

#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    test_encode_layout();
    test_decode();
    test_classify();
    test_media_start();
    test_simple_notices();
    test_malformed_notices();
    test_format_command();

    std::cout << "\n[MEDIA FRAME TESTS PASSED]\n";
    return 0;
}
