/*
===============================================================================
 media::Session - Group B Unit Tests (inbound path and lifecycle)
===============================================================================

Every test runs once per role.

Scope:
------
B1. In-order frames are delivered with their header fields
B2. Sequence policies: Deliver, DropLate, FillSilence, Abort
B3. Echo mode sends every received payload back; verifier integration
B4. finish() / inbound HANGUP drain then close; cancel() is immediate
B5. MEDIA_START negotiates the frame size only before streaming
B6. Malformed input is reported, never fatal; frames of the wrong size are
    not delivered and leave sequence tracking untouched
===============================================================================
*/

#include <chrono>
#include <iostream>
#include <string>
#include <vector>

#include "common/harness/media.hpp"

using media::Error;
using media::ErrorReport;
using media::InboundFrame;
using media::SequenceAnomaly;
using media::test::harness::frame;


static std::string role_name(transport::Role role) {
    return std::string(transport::to_string(role));
}

static std::vector<ErrorReport> errors(MediaUnderTest& s) {
    std::vector<ErrorReport> out;
    s.drain_errors([&out](const ErrorReport& r) { out.push_back(r); });
    return out;
}

static config::Media with_policy(config::SequencePolicy p) {
    config::Media cfg;
    cfg.sequence_policy = p;
    return cfg;
}

// -----------------------------------------------------------------------------
// B1: in-order delivery
// -----------------------------------------------------------------------------
void test_in_order_delivery(transport::Role role) {
    std::cout << "[TEST] Group B1: in-order delivery (" << role_name(role) << ")\n";
    media::test::harness::Session h(role);
    h.connect();

    for (std::uint32_t i = 0; i < 3; ++i) {
        h.ws().emit_binary(frame(i, std::string(160, static_cast<char>('a' + i))));
    }
    h.drain();

    const auto frames = h.frames();
    TEST_CHECK(frames.size() == 3);
    for (std::uint32_t i = 0; i < 3; ++i) {
        TEST_CHECK(frames[i].sequence == i);
        TEST_CHECK(frames[i].timestamp == i * 160);
        TEST_CHECK(frames[i].anomaly == SequenceAnomaly::None);
        TEST_CHECK(!frames[i].synthesized);
    }
    TEST_CHECK(frames[2].payload == std::string(160, 'c'));
    TEST_CHECK(h.session.state() == media::State::Streaming);
    TEST_CHECK(h.session.expected_sequence() == 3);
    TEST_CHECK(h.session.frames_received() == 3);
    TEST_CHECK(h.session.bytes_received() == 480);
    TEST_CHECK(errors(h.session).empty());
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// B2: sequence policies
// -----------------------------------------------------------------------------
void test_policy_deliver(transport::Role role) {
    std::cout << "[TEST] Group B2: Deliver policy (" << role_name(role) << ")\n";
    media::test::harness::Session h(role, with_policy(config::SequencePolicy::Deliver));
    h.connect();

    for (std::uint32_t seq : {0u, 1u, 4u, 4u, 2u}) {
        h.ws().emit_binary(frame(seq, "x"));
    }
    h.drain();

    const auto frames = h.frames();
    TEST_CHECK(frames.size() == 5);
    TEST_CHECK(frames[2].anomaly == SequenceAnomaly::Gap);
    TEST_CHECK(frames[2].expected == 2);
    TEST_CHECK(frames[3].anomaly == SequenceAnomaly::Duplicate);
    TEST_CHECK(frames[4].anomaly == SequenceAnomaly::Regression);
    TEST_CHECK(h.session.expected_sequence() == 5);
    TEST_CHECK(h.session.anomalies() == 3);

    const auto reports = errors(h.session);
    TEST_CHECK(reports.size() == 3);
    for (const auto& r : reports) {
        TEST_CHECK(r.error == Error::SequenceAnomaly);
    }
    TEST_CHECK(reports[0].detail == "Gap expected 2 received 4");
    std::cout << "[TEST] OK\n";
}

void test_policy_drop_late(transport::Role role) {
    std::cout << "[TEST] Group B2: DropLate policy (" << role_name(role) << ")\n";
    media::test::harness::Session h(role, with_policy(config::SequencePolicy::DropLate));
    h.connect();

    for (std::uint32_t seq : {0u, 1u, 1u, 0u, 3u}) {
        h.ws().emit_binary(frame(seq, "x"));
    }
    h.drain();

    const auto frames = h.frames();
    TEST_CHECK(frames.size() == 3);
    TEST_CHECK(frames[0].sequence == 0);
    TEST_CHECK(frames[1].sequence == 1);
    TEST_CHECK(frames[2].sequence == 3);
    TEST_CHECK(frames[2].anomaly == SequenceAnomaly::Gap);
    TEST_CHECK(errors(h.session).size() == 3);
    TEST_CHECK(h.session.frames_received() == 5);
    std::cout << "[TEST] OK\n";
}

void test_policy_fill_silence(transport::Role role) {
    std::cout << "[TEST] Group B2: FillSilence policy (" << role_name(role) << ")\n";
    config::Media cfg = with_policy(config::SequencePolicy::FillSilence);
    cfg.max_fill_frames = 2;
    media::test::harness::Session h(role, cfg);
    h.connect();

    h.ws().emit_binary(frame(0, std::string(160, 'a')));
    h.ws().emit_binary(frame(4, std::string(160, 'e')));   // 1, 2, 3 missing
    h.ws().emit_binary(frame(2, std::string(160, 'c')));   // late: dropped
    h.ws().emit_binary(frame(6, std::string(160, 'g')));   // 5 missing
    h.drain();

    const auto frames = h.frames();
    TEST_CHECK(frames.size() == 6);
    TEST_CHECK(frames[0].sequence == 0);

    // At most two silence frames, right before the received one
    TEST_CHECK(frames[1].sequence == 2 && frames[1].synthesized);
    TEST_CHECK(frames[1].timestamp == 320);
    TEST_CHECK(frames[1].payload == std::string(160, media::ULAW_SILENCE));
    TEST_CHECK(frames[2].sequence == 3 && frames[2].synthesized);
    TEST_CHECK(frames[3].sequence == 4 && !frames[3].synthesized);
    TEST_CHECK(frames[3].payload == std::string(160, 'e'));

    TEST_CHECK(frames[4].sequence == 5 && frames[4].synthesized);
    TEST_CHECK(frames[5].sequence == 6);
    TEST_CHECK(errors(h.session).size() == 3);
    std::cout << "[TEST] OK\n";
}

void test_policy_abort(transport::Role role) {
    std::cout << "[TEST] Group B2: Abort policy (" << role_name(role) << ")\n";
    media::test::harness::Session h(role, with_policy(config::SequencePolicy::Abort));
    h.connect();

    h.ws().emit_binary(frame(0, "x"));
    h.ws().emit_binary(frame(2, "x"));
    h.drain();

    const auto frames = h.frames();
    TEST_CHECK(frames.size() == 1);
    TEST_CHECK(h.session.state() == media::State::Closed);
    TEST_CHECK(h.session.is_closed());
    TEST_CHECK(h.session.send_frame("x") == Error::InvalidState);
    TEST_CHECK(errors(h.session).size() == 1);
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// B3: echo
// -----------------------------------------------------------------------------
void test_echo_mode(transport::Role role) {
    std::cout << "[TEST] Group B3: echo mode (" << role_name(role) << ")\n";
    config::Media cfg;
    cfg.echo = true;
    media::test::harness::Session h(role, cfg);
    h.connect();

    h.ws().emit_binary(frame(10, std::string(160, 'a')));
    h.ws().emit_binary(frame(11, std::string(160, 'b')));
    h.drain();

    const auto sent = h.sent_frames();
    TEST_CHECK(sent.size() == 2);
    TEST_CHECK(sent[0].first.sequence == 0);    // our own numbering
    TEST_CHECK(sent[0].second == std::string(160, 'a'));
    TEST_CHECK(sent[1].first.sequence == 1);
    TEST_CHECK(sent[1].second == std::string(160, 'b'));

    // Echo refused under XOFF: reported, frame still delivered
    h.ws().emit_message("MEDIA_XOFF");
    h.ws().emit_binary(frame(12, std::string(160, 'c')));
    h.drain();
    TEST_CHECK(h.sent_frames().size() == 2);
    TEST_CHECK(h.frames().size() == 3);

    const auto reports = errors(h.session);
    bool backpressure = false;
    for (const auto& r : reports) {
        backpressure = backpressure || r.error == Error::Backpressure;
    }
    TEST_CHECK(backpressure);
    std::cout << "[TEST] OK\n";
}

void test_verifier_integration(transport::Role role) {
    std::cout << "[TEST] Group B3: echo verification (" << role_name(role) << ")\n";
    media::test::harness::Session h(role);
    h.connect();

    media::EchoVerifier verifier;
    h.session.attach_verifier(&verifier);

    std::string audio(400, '\0');
    for (std::size_t i = 0; i < audio.size(); ++i) {
        audio[i] = static_cast<char>(i % 200);
    }
    TEST_CHECK(h.session.send_audio(audio) == 400);

    // Peer echoes the padded frames back
    std::uint32_t seq = 0;
    for (const auto& [header, payload] : h.sent_frames()) {
        h.ws().emit_binary(frame(seq++, payload));
    }
    h.drain();

    const media::VerificationReport r = verifier.verify();
    TEST_CHECK(r.passed());
    TEST_CHECK(r.sent_length == 400);
    TEST_CHECK(r.received_length == 480);
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// B4: lifecycle
// -----------------------------------------------------------------------------
void test_finish_drains(transport::Role role) {
    std::cout << "[TEST] Group B4: finish drains (" << role_name(role) << ")\n";
    media::test::harness::Session h(role);
    h.connect();

    TEST_CHECK(h.session.send_frame(std::string(160, 'a')) == Error::None);
    TEST_CHECK(h.session.finish(std::chrono::milliseconds{60000}) == Error::None);
    TEST_CHECK(h.session.state() == media::State::Draining);
    TEST_CHECK(h.sent_commands().back() == "HANGUP");
    TEST_CHECK(h.session.send_frame(std::string(160, 'b')) == Error::InvalidState);
    TEST_CHECK(h.session.finish() == Error::None); // already draining

    // Trailing frames are still delivered
    h.ws().emit_binary(frame(0, "tail"));
    h.drain();
    TEST_CHECK(h.frames().size() == 1);
    TEST_CHECK(h.session.state() == media::State::Draining);
    TEST_CHECK(h.session.is_open());
    std::cout << "[TEST] OK\n";
}

void test_finish_grace_elapses(transport::Role role) {
    std::cout << "[TEST] Group B4: drain grace elapses (" << role_name(role) << ")\n";
    media::test::harness::Session h(role);
    h.connect();

    TEST_CHECK(h.session.finish(std::chrono::milliseconds{0}) == Error::None);
    h.drain();
    TEST_CHECK(h.session.state() == media::State::Closed);
    TEST_CHECK(h.session.is_closed());
    TEST_CHECK(h.session.finish() == Error::InvalidState);
    std::cout << "[TEST] OK\n";
}

void test_inbound_hangup(transport::Role role) {
    std::cout << "[TEST] Group B4: inbound HANGUP (" << role_name(role) << ")\n";
    config::Media cfg;
    cfg.drain_grace = std::chrono::milliseconds{0};
    media::test::harness::Session h(role, cfg);
    h.connect();

    h.ws().emit_binary(frame(0, "x"));
    h.ws().emit_message("HANGUP");
    h.drain();

    TEST_CHECK(h.session.is_closed());
    TEST_CHECK(h.frames().size() == 1);
    media::Notice n;
    TEST_CHECK(h.session.pop_notice(n));
    TEST_CHECK(n.type == media::NoticeType::Hangup);
    std::cout << "[TEST] OK\n";
}

void test_cancel_and_remote_close(transport::Role role) {
    std::cout << "[TEST] Group B4: cancel and remote close (" << role_name(role) << ")\n";
    {
        media::test::harness::Session h(role);
        h.connect();
        TEST_CHECK(h.session.send_frame("x") == Error::None);
        h.session.cancel();
        TEST_CHECK(h.session.state() == media::State::Closed);
        TEST_CHECK(h.session.send_frame("x") == Error::InvalidState);
        TEST_CHECK(h.session.send_command(media::Command::Hangup) == Error::InvalidState);
        TEST_CHECK(h.session.finish() == Error::InvalidState);
        h.drain();
        TEST_CHECK(h.session.is_closed());
        h.session.cancel(); // idempotent
        TEST_CHECK(h.session.is_closed());
    }
    {
        media::test::harness::Session h(role);
        h.connect();
        h.ws().emit_close();
        h.drain();
        TEST_CHECK(h.session.state() == media::State::Closed);
        TEST_CHECK(h.session.is_closed());
    }
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// B5: MEDIA_START
// -----------------------------------------------------------------------------
void test_media_start_frame_size(transport::Role role) {
    std::cout << "[TEST] Group B5: MEDIA_START frame size (" << role_name(role) << ")\n";
    media::test::harness::Session h(role);
    h.connect();

    h.ws().emit_message("MEDIA_START connection_id:c1 channel:WebSocket/media-1/0x01 format:ulaw optimal_frame_size:320");
    h.session.poll();
    TEST_CHECK(h.session.frame_size() == 320);

    media::Notice n;
    TEST_CHECK(h.session.pop_notice(n));
    TEST_CHECK(n.type == media::NoticeType::MediaStart);
    TEST_CHECK(n.channel == "WebSocket/media-1/0x01");

    TEST_CHECK(h.session.send_frame(std::string(320, 'a')) == Error::None);
    TEST_CHECK(h.sent_frames().back().second.size() == 320);

    // Renegotiation after streaming started is ignored
    h.ws().emit_message("MEDIA_START optimal_frame_size:160");
    h.session.poll();
    TEST_CHECK(h.session.frame_size() == 320);
    TEST_CHECK(h.session.send_frame(std::string(320, 'b')) == Error::None);
    TEST_CHECK(h.sent_frames().back().first.timestamp == 320);
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// B6: malformed input
// -----------------------------------------------------------------------------
void test_malformed_input(transport::Role role) {
    std::cout << "[TEST] Group B6: malformed input (" << role_name(role) << ")\n";
    media::test::harness::Session h(role);
    h.connect();

    h.ws().emit_binary(std::string(5, 'x'));
    h.ws().emit_message("");
    h.ws().emit_message("MEDIA_START optimal_frame_size:big");
    h.ws().emit_binary(frame(0, "ok"));
    h.drain();

    const auto reports = errors(h.session);
    TEST_CHECK(reports.size() == 3);
    TEST_CHECK(reports[0].error == Error::InvalidFrame);
    TEST_CHECK(reports[1].error == Error::Protocol);
    TEST_CHECK(reports[2].error == Error::Protocol);
    TEST_CHECK(h.frames().size() == 1);
    TEST_CHECK(h.session.frame_size() == 160);
    TEST_CHECK(h.session.is_open());
    std::cout << "[TEST] OK\n";
}

void test_frame_size_mismatch(transport::Role role) {
    std::cout << "[TEST] Group B6: frame size mismatch (" << role_name(role) << ")\n";
    media::test::harness::Session h(role);
    h.connect();
    media::EchoVerifier verifier;
    h.session.attach_verifier(&verifier);

    h.ws().emit_binary(frame(0, "x", 1));                     // 8-byte header + 1 byte
    h.ws().emit_binary(frame(0, std::string(320, 'y'), 320)); // oversized
    h.ws().emit_binary(frame(0, std::string(160, 'a')));
    h.drain();

    const auto reports = errors(h.session);
    TEST_CHECK(reports.size() == 2);
    TEST_CHECK(reports[0].error == Error::InvalidFrame);
    TEST_CHECK(reports[1].error == Error::InvalidFrame);

    const auto got = h.frames();
    TEST_CHECK(got.size() == 1);
    TEST_CHECK(got[0].sequence == 0);
    TEST_CHECK(got[0].anomaly == SequenceAnomaly::None);
    TEST_CHECK(got[0].payload == std::string(160, 'a'));
    TEST_CHECK(h.session.frames_received() == 1);
    TEST_CHECK(h.session.bytes_received() == 160);
    TEST_CHECK(h.session.expected_sequence() == 1);
    TEST_CHECK(h.session.anomalies() == 0);
    TEST_CHECK(verifier.verify().received_length == 160);
    TEST_CHECK(h.session.is_open());
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    for_each_role(test_in_order_delivery);
    for_each_role(test_policy_deliver);
    for_each_role(test_policy_drop_late);
    for_each_role(test_policy_fill_silence);
    for_each_role(test_policy_abort);
    for_each_role(test_echo_mode);
    for_each_role(test_verifier_integration);
    for_each_role(test_finish_drains);
    for_each_role(test_finish_grace_elapses);
    for_each_role(test_inbound_hangup);
    for_each_role(test_cancel_and_remote_close);
    for_each_role(test_media_start_frame_size);
    for_each_role(test_malformed_input);
    for_each_role(test_frame_size_mismatch);

    std::cout << "\n[GROUP B - MEDIA INBOUND & LIFECYCLE TESTS PASSED]\n";
    return 0;
}
