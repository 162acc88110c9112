/*
===============================================================================
 control::Session - Group A Unit Tests (requests and correlation)
===============================================================================

Every test runs once per role (dialed client, adopted server socket): the
session must behave identically for both.

Scope:
------
A1. Ids are assigned in issue order and written in the configured dialect
A2. Out-of-order responses interleaved with events resolve the right requests
A3. Completions without a handler go to the completion ring
A4. Non-2xx responses and peer error objects resolve as Remote
A5. Explicit ids; a live id is refused with DuplicateId
A6. Responses nobody waits for are reported, the connection stays open
===============================================================================
*/

#include <iostream>
#include <string>
#include <vector>

#include "common/harness/session.hpp"

using control::Completion;
using control::ErrorReport;
using control::Request;
using control::req_id_t;


// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------
static Request get(std::string path) {
    Request req;
    req.method = "GET";
    req.path = std::move(path);
    return req;
}

static std::string role_name(transport::Role role) {
    return std::string(transport::to_string(role));
}

// -----------------------------------------------------------------------------
// A1: id assignment and wire text
// -----------------------------------------------------------------------------
void test_ids_and_wire_text(transport::Role role) {
    std::cout << "[TEST] Group A1: id assignment (" << role_name(role) << ")\n";
    control::test::harness::Session h(role);
    h.connect();

    const req_id_t a = h.session.request(get("channels"));
    TEST_CHECK(h.last_sent() == R"({"type":"RESTRequest","request_id":"1","method":"GET","uri":"channels"})");
    const req_id_t b = h.session.request(get("bridges"));
    const req_id_t c = h.session.request(get("endpoints"));

    TEST_CHECK(a == 1 && b == 2 && c == 3);
    TEST_CHECK(h.ws().sent().size() == 3);
    TEST_CHECK(h.session.pending_requests() == 3);
    TEST_CHECK(h.session.requests_issued() == 3);
    TEST_CHECK(!h.session.is_idle());

    // Generic dialect
    config::Control cfg;
    cfg.dialect = config::Dialect::Generic;
    control::test::harness::Session g(role, cfg);
    g.connect();
    const req_id_t id = g.session.request(get("channels"));
    TEST_CHECK(g.last_sent() == R"({"id":)" + std::to_string(id) + R"(,"method":"GET","path":"channels"})");
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// A2: out-of-order responses with interleaved events
// -----------------------------------------------------------------------------
void test_out_of_order_correlation(transport::Role role) {
    std::cout << "[TEST] Group A2: out-of-order correlation (" << role_name(role) << ")\n";
    control::test::harness::Session h(role);
    h.connect();

    std::vector<std::string> log;
    h.session.on_any_event([&log](const control::Event& ev) { log.push_back("event:" + ev.type); });

    auto record = [&log](const Completion& c) {
        log.push_back("done:" + std::to_string(c.req_id) + ":" + c.response.body);
    };
    const req_id_t a = h.session.request(get("channels/a"), record);
    const req_id_t b = h.session.request(get("channels/b"), record);
    const req_id_t c = h.session.request(get("channels/c"), record);

    h.respond(c, 200, R"({"id":"c"})");
    h.ws().emit_message(json::event::stasis_start("ch-1", "PJSIP/alice-1"));
    h.respond(a, 200, R"({"id":"a"})");
    h.ws().emit_message(json::event::of_type("ChannelStateChange"));
    h.respond(b, 200, R"({"id":"b"})");
    h.drain();

    TEST_CHECK(log.size() == 5);
    TEST_CHECK(log[0] == R"(done:3:{"id":"c"})");
    TEST_CHECK(log[1] == "event:StasisStart");
    TEST_CHECK(log[2] == R"(done:1:{"id":"a"})");
    TEST_CHECK(log[3] == "event:ChannelStateChange");
    TEST_CHECK(log[4] == R"(done:2:{"id":"b"})");

    TEST_CHECK(h.session.pending_requests() == 0);
    TEST_CHECK(h.session.responses_matched() == 3);
    TEST_CHECK(h.session.events_dispatched() == 2);
    TEST_CHECK(h.session.is_idle());
    TEST_CHECK(h.errors().empty());
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// A3: completion ring
// -----------------------------------------------------------------------------
void test_completion_ring(transport::Role role) {
    std::cout << "[TEST] Group A3: completion ring (" << role_name(role) << ")\n";
    control::test::harness::Session h(role);
    h.connect();

    const req_id_t a = h.session.request(get("asterisk/info"));
    const req_id_t b = h.session.request(get("applications"));
    h.respond(b, 200, "[]");
    h.respond(a, 200, R"({"build":{}})");
    h.drain();

    Completion c;
    TEST_CHECK(h.session.pop_completion(c));
    TEST_CHECK(c.req_id == b);
    TEST_CHECK(c.ok());
    TEST_CHECK(c.response.status == 200);
    TEST_CHECK(c.response.body == "[]");

    std::vector<req_id_t> rest;
    h.session.drain_completions([&rest](const Completion& x) { rest.push_back(x.req_id); });
    TEST_CHECK(rest.size() == 1);
    TEST_CHECK(rest[0] == a);
    TEST_CHECK(!h.session.pop_completion(c));
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// A4: remote failures
// -----------------------------------------------------------------------------
void test_remote_errors(transport::Role role) {
    std::cout << "[TEST] Group A4: remote errors (" << role_name(role) << ")\n";
    control::test::harness::Session h(role);
    h.connect();

    const req_id_t a = h.session.request(get("channels/missing"));
    h.respond(a, 404);
    const req_id_t b = h.session.request(get("channels/bad"));
    h.ws().emit_message(json::generic::error(b, "Allocation failed"));
    h.drain();

    Completion c;
    TEST_CHECK(h.session.pop_completion(c));
    TEST_CHECK(c.req_id == a);
    TEST_CHECK(c.error == control::Error::Remote);
    TEST_CHECK(c.response.status == 404);
    TEST_CHECK(c.response.reason == "Not Found");

    TEST_CHECK(h.session.pop_completion(c));
    TEST_CHECK(c.req_id == b);
    TEST_CHECK(c.error == control::Error::Remote);
    TEST_CHECK(c.response.status == 0);
    TEST_CHECK(c.response.error == "Allocation failed");

    // A remote failure is a normal completion, not a protocol error
    TEST_CHECK(h.errors().empty());
    TEST_CHECK(h.session.is_open());
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// A5: explicit ids
// -----------------------------------------------------------------------------
void test_explicit_and_duplicate_ids(transport::Role role) {
    std::cout << "[TEST] Group A5: explicit and duplicate ids (" << role_name(role) << ")\n";
    control::test::harness::Session h(role);
    h.connect();

    Request r = get("channels");
    r.id = req_id_t{100};
    TEST_CHECK(h.session.request(r) == 100);
    TEST_CHECK(h.ws().sent().size() == 1);

    // Same id while the first is live: refused, never sent
    TEST_CHECK(h.session.request(r) == 100);
    TEST_CHECK(h.ws().sent().size() == 1);

    // Reserved id
    Request zero = get("channels");
    zero.id = control::INVALID_REQ_ID;
    (void)h.session.request(zero);
    TEST_CHECK(h.ws().sent().size() == 1);

    h.session.poll();
    std::vector<Completion> done;
    h.session.drain_completions([&done](const Completion& c) { done.push_back(c); });
    TEST_CHECK(done.size() == 2);
    TEST_CHECK(done[0].req_id == 100);
    TEST_CHECK(done[0].error == control::Error::DuplicateId);
    TEST_CHECK(done[1].error == control::Error::DuplicateId);

    // The original request is unaffected
    TEST_CHECK(h.session.pending_requests() == 1);
    h.respond(100, 200);
    h.drain();
    Completion c;
    TEST_CHECK(h.session.pop_completion(c));
    TEST_CHECK(c.req_id == 100);
    TEST_CHECK(c.ok());

    // Auto ids keep counting from 1 and never collide with a live explicit id
    Request live = get("bridges");
    live.id = req_id_t{1};
    TEST_CHECK(h.session.request(live) == 1);
    TEST_CHECK(h.session.request(get("channels")) == 2);
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// A6: unmatched responses
// -----------------------------------------------------------------------------
void test_unmatched_response(transport::Role role) {
    std::cout << "[TEST] Group A6: unmatched response (" << role_name(role) << ")\n";
    control::test::harness::Session h(role);
    h.connect();

    const req_id_t a = h.session.request(get("channels"));
    h.respond(a + 41, 200);
    h.ws().emit_message(R"({"type":"RESTResponse","request_id":"not-ours","status_code":200})");
    h.drain();

    const std::vector<ErrorReport> errors = h.errors();
    TEST_CHECK(errors.size() == 2);
    TEST_CHECK(errors[0].error == control::Error::Protocol);
    TEST_CHECK(errors[0].req_id == a + 41);
    TEST_CHECK(errors[1].req_id == control::INVALID_REQ_ID);
    TEST_CHECK(h.session.unmatched_responses() == 2);

    // Still open, original request still pending
    TEST_CHECK(h.session.is_open());
    TEST_CHECK(h.session.pending_requests() == 1);
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    for_each_role(test_ids_and_wire_text);
    for_each_role(test_out_of_order_correlation);
    for_each_role(test_completion_ring);
    for_each_role(test_remote_errors);
    for_each_role(test_explicit_and_duplicate_ids);
    for_each_role(test_unmatched_response);

    std::cout << "\n[GROUP A - REQUEST CORRELATION TESTS PASSED]\n";
    return 0;
}
