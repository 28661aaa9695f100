// ─────────────────────────────────────────────────────────────────────────────
// BOSH Session Tests
// ─────────────────────────────────────────────────────────────────────────────
// Drives a real session against MockHttpClient, which holds every request
// open until the test answers it, like a connection manager would.
// Tests cover:
// - rid seeding and sequencing
// - sid binding
// - empty polls
// - stream close from either side, stop()
// - failure delivery

#include <catch2/catch_test_macros.hpp>

#include "boshpp/bosh/bosh_body.hpp"
#include "boshpp/bosh/bosh_transport.hpp"
#include "boshpp/bosh/owner_mailbox.hpp"
#include "boshpp/xml/stanza.hpp"
#include "mocks/mock_http_client.hpp"

#include <algorithm>
#include <functional>
#include <optional>
#include <thread>
#include <vector>

using namespace boshpp;
using namespace boshpp::testing;
using namespace std::chrono_literals;

namespace {

constexpr Rid kSeed = 1000;

const std::string kCreationReply =
    R"(<body sid="abc123" wait="60" hold="1" from="localhost" xmpp:version="1.0")"
    R"( xmlns="http://jabber.org/protocol/httpbind" xmlns:xmpp="urn:xmpp:xbosh")"
    R"( xmlns:stream="http://etherx.jabber.org/streams"><stream:features/></body>)";

bool wait_until(const std::function<bool()>& predicate, std::chrono::milliseconds timeout = 2s) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return predicate();
}

struct SessionFixture {
    std::shared_ptr<MockHttpClient> http = std::make_shared<MockHttpClient>();
    std::shared_ptr<OwnerMailbox> owner = std::make_shared<OwnerMailbox>();
    BoshConfig config = BoshConfig{}
        .with_host("x")
        .with_port(1234)
        .with_path("/http-bind")
        .with_initial_rid(kSeed);
    std::optional<BoshTransport> transport;

    ~SessionFixture() {
        if (transport.has_value()) {
            (void)transport->stop();
        }
        http->shutdown();
    }

    BoshTransport& connect() {
        auto result = BoshTransport::connect(config, owner, http);
        REQUIRE(result.has_value());
        transport = *result;
        return *transport;
    }

    RecordedRequest request_for(Rid rid) {
        auto request = http->wait_for_rid(rid);
        REQUIRE(request.has_value());
        return *request;
    }

    void reply(Rid rid, const std::string& body, int status = 200) {
        http->respond(request_for(rid).id, status, body);
    }

    std::optional<OwnerEvent> next_event(std::chrono::milliseconds timeout = 2s) {
        return owner->receive_with_timeout(timeout);
    }

    StreamItem next_item() {
        auto event = next_event();
        REQUIRE(event.has_value());
        REQUIRE(std::holds_alternative<StanzaReceived>(*event));
        return std::get<StanzaReceived>(*event).stanza;
    }

    BoshError next_failure() {
        auto event = next_event();
        REQUIRE(event.has_value());
        REQUIRE(std::holds_alternative<SessionFailed>(*event));
        return std::get<SessionFailed>(*event).error;
    }

    // Open the stream and answer the creation request: sid bound, poll at seed+1
    void establish() {
        connect().send(stanza::stream_start("localhost"));
        reply(kSeed, kCreationReply);
        REQUIRE(is_stream_start(next_item()));
        REQUIRE(std::get<XmlElement>(next_item()).name == "stream:features");
        (void)request_for(kSeed + 1);
    }
};

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Connect
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE_METHOD(SessionFixture, "Connect starts an idle active session", "[session][connect]") {
    config.with_header("X-Client", "boshpp").with_request_timeout(90s);
    auto& t = connect();

    REQUIRE(t.is_connected());
    REQUIRE(t.state() == SessionState::Active);
    REQUIRE(t.get_rid() == kSeed);
    REQUIRE_FALSE(t.get_sid().has_value());
    REQUIRE(t.pending_requests() == 0);
    REQUIRE(t.endpoint() == Endpoint{"x", 1234, "/http-bind", false});
    REQUIRE_FALSE(t.tls());
    REQUIRE_FALSE(t.compress());

    REQUIRE(http->base_url() == "http://x:1234");
    REQUIRE(http->default_headers().at("X-Client") == "boshpp");
    REQUIRE(http->request_timeout() == 90s);

    // Nothing goes out until the owner sends
    std::this_thread::sleep_for(20ms);
    REQUIRE(http->request_count() == 0);
}

TEST_CASE_METHOD(SessionFixture, "Connect seeds rid from the clock by default", "[session][connect]") {
    config.initial_rid.reset();
    const auto now = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    auto& t = connect();

    REQUIRE(t.get_rid() >= static_cast<Rid>(now));
}

TEST_CASE("Connect without an owner or client fails to start", "[session][connect]") {
    auto http = std::make_shared<MockHttpClient>();

    auto no_owner = BoshTransport::connect(BoshConfig{}, nullptr, http);
    REQUIRE_FALSE(no_owner.has_value());
    REQUIRE(no_owner.error().code == BoshErrorCode::StartupError);

    auto no_client = BoshTransport::connect(
        BoshConfig{}, std::make_shared<OwnerMailbox>(), std::shared_ptr<IHttpClient>{});
    REQUIRE_FALSE(no_client.has_value());
    REQUIRE(no_client.error().code == BoshErrorCode::StartupError);
}

TEST_CASE_METHOD(SessionFixture, "Transport handles compare by session", "[session][connect]") {
    auto& t = connect();
    BoshTransport copy = t;
    REQUIRE(copy == t);

    auto other_http = std::make_shared<MockHttpClient>();
    auto other = BoshTransport::connect(config, owner, other_http);
    REQUIRE(other.has_value());
    REQUIRE_FALSE(*other == t);

    REQUIRE(other->stop() == StopResult::Ok);
    other_http->shutdown();
}

// ═══════════════════════════════════════════════════════════════════════════
// Session Creation / sid
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE_METHOD(SessionFixture, "Stream start goes out as a session creation body", "[session][sid]") {
    auto& t = connect();
    t.send(stanza::stream_start("localhost"));

    const auto request = request_for(kSeed);
    REQUIRE(request.path == "/http-bind");
    REQUIRE(request.content_type == "text/xml; charset=utf-8");
    REQUIRE(request.body ==
            R"(<body rid="1000" xmlns="http://jabber.org/protocol/httpbind")"
            R"( content="text/xml; charset=utf-8" xmlns:xmpp="urn:xmpp:xbosh")"
            R"( xmpp:version="1.0" hold="1" wait="60" xml:lang="en" to="localhost"/>)");
    REQUIRE_FALSE(request.has("sid="));

    REQUIRE(t.get_rid() == kSeed + 1);
    REQUIRE(t.pending_requests() == 1);
}

TEST_CASE_METHOD(SessionFixture, "First reply binds sid and later bodies carry it", "[session][sid]") {
    establish();
    auto& t = *transport;

    REQUIRE(t.get_sid() == "abc123");

    const auto poll = request_for(kSeed + 1);
    REQUIRE(poll.has(R"(sid="abc123")"));
    REQUIRE(poll.body ==
            R"(<body rid="1001" xmlns="http://jabber.org/protocol/httpbind" sid="abc123"/>)");

    t.send(stanza::presence());
    const auto presence = request_for(kSeed + 2);
    REQUIRE(presence.body ==
            R"(<body rid="1002" xmlns="http://jabber.org/protocol/httpbind" sid="abc123">)"
            R"(<presence/></body>)");
}

TEST_CASE_METHOD(SessionFixture, "sid is never rebound", "[session][sid]") {
    establish();

    reply(kSeed + 1, R"(<body sid="other"/>)");
    (void)request_for(kSeed + 2);

    REQUIRE(transport->get_sid() == "abc123");
    REQUIRE(request_for(kSeed + 2).has(R"(sid="abc123")"));
}

TEST_CASE_METHOD(SessionFixture, "Stream restart after sid is bound", "[session][sid]") {
    establish();

    transport->send(stanza::stream_start("localhost"));
    const auto restart = request_for(kSeed + 2);

    REQUIRE(restart.has(R"(sid="abc123")"));
    REQUIRE(restart.has(R"(xmpp:restart="true")"));
}

// ═══════════════════════════════════════════════════════════════════════════
// rid Sequencing
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE_METHOD(SessionFixture, "Each request consumes exactly one rid", "[session][rid]") {
    auto& t = connect();
    t.send(stanza::stream_start("localhost"));
    for (int i = 0; i < 5; ++i) {
        t.send(stanza::chat_message("bob@example.com", "msg " + std::to_string(i)));
    }

    REQUIRE(http->wait_for_requests(6));
    std::vector<Rid> rids;
    for (const auto& request : http->requests()) {
        REQUIRE(request.rid().has_value());
        rids.push_back(*request.rid());
    }
    std::sort(rids.begin(), rids.end());

    std::vector<Rid> expected;
    for (Rid rid = kSeed; rid < kSeed + 6; ++rid) {
        expected.push_back(rid);
    }
    REQUIRE(rids == expected);
    REQUIRE(t.get_rid() == kSeed + 6);
    REQUIRE(t.pending_requests() == 6);

    // Payloads keep call order
    REQUIRE(request_for(kSeed + 1).has("msg 0"));
    REQUIRE(request_for(kSeed + 5).has("msg 4"));
}

TEST_CASE_METHOD(SessionFixture, "send_raw posts the body unchanged and consumes a rid", "[session][rid]") {
    auto& t = connect();

    XmlElement raw = empty_body(t.get_rid(), std::nullopt, {{"ack", "1"}});
    t.send_raw(raw);

    REQUIRE(request_for(kSeed).body == to_string(raw));
    REQUIRE(t.get_rid() == kSeed + 1);
    REQUIRE(t.pending_requests() == 1);
}

// ═══════════════════════════════════════════════════════════════════════════
// Empty Polls
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE_METHOD(SessionFixture, "Reply that drains pending issues exactly one poll", "[session][poll]") {
    establish();

    REQUIRE(wait_until([this]() { return http->request_count() == 2; }));
    std::this_thread::sleep_for(30ms);
    REQUIRE(http->request_count() == 2);
    REQUIRE(transport->pending_requests() == 1);

    // Empty reply to the poll: next poll
    reply(kSeed + 1, "<body/>");
    const auto next_poll = request_for(kSeed + 2);
    REQUIRE(next_poll.body ==
            R"(<body rid="1002" xmlns="http://jabber.org/protocol/httpbind" sid="abc123"/>)");
    std::this_thread::sleep_for(30ms);
    REQUIRE(http->request_count() == 3);
}

TEST_CASE_METHOD(SessionFixture, "No poll while another request is outstanding", "[session][poll]") {
    auto& t = connect();
    t.send(stanza::stream_start("localhost"));
    t.send(stanza::presence());
    REQUIRE(http->wait_for_requests(2));

    reply(kSeed, kCreationReply);
    (void)next_item();
    (void)next_item();

    std::this_thread::sleep_for(30ms);
    REQUIRE(http->request_count() == 2);
    REQUIRE(t.pending_requests() == 1);

    reply(kSeed + 1, "<body/>");
    const auto poll = request_for(kSeed + 2);
    REQUIRE(poll.body.find("<presence") == std::string::npos);
}

TEST_CASE_METHOD(SessionFixture, "Replies are delivered in document order", "[session][poll]") {
    establish();

    reply(kSeed + 1,
          R"(<body><message id="a"/><presence from="bob@example.com"/><message id="b"/></body>)");

    REQUIRE(std::get<XmlElement>(next_item()).attr("id") == "a");
    REQUIRE(std::get<XmlElement>(next_item()).name == "presence");
    REQUIRE(std::get<XmlElement>(next_item()).attr("id") == "b");

    REQUIRE_FALSE(next_event(50ms).has_value());
}

// ═══════════════════════════════════════════════════════════════════════════
// Stream Close / Stop
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE_METHOD(SessionFixture, "Server terminate delivers stream end and stops", "[session][stop]") {
    establish();
    auto& t = *transport;

    reply(kSeed + 1, R"(<body type="terminate" condition="system-shutdown"/>)");

    REQUIRE(is_stream_end(next_item()));
    REQUIRE(wait_until([&t]() { return t.is_connected() == false; }));
    REQUIRE(t.state() == SessionState::Stopped);

    // No poll and no termination body after a server-side end
    std::this_thread::sleep_for(30ms);
    REQUIRE(http->request_count() == 2);
    REQUIRE(t.stop() == StopResult::AlreadyStopped);
}

TEST_CASE_METHOD(SessionFixture, "Owner stream end drains outstanding requests", "[session][stop]") {
    establish();
    auto& t = *transport;

    t.send(stanza::stream_end());
    REQUIRE(t.state() == SessionState::Stopping);

    const auto terminate = request_for(kSeed + 2);
    REQUIRE(terminate.has(R"(type="terminate")"));
    REQUIRE(terminate.has(R"(<presence type="unavailable"/>)"));
    REQUIRE(terminate.has(R"(sid="abc123")"));

    // Sends while stopping are dropped
    t.send(stanza::presence());
    std::this_thread::sleep_for(30ms);
    REQUIRE(http->request_count() == 3);

    reply(kSeed + 1, "<body/>");
    std::this_thread::sleep_for(30ms);
    REQUIRE(t.state() == SessionState::Stopping);
    REQUIRE(t.pending_requests() == 1);

    reply(kSeed + 2, "<body/>");
    REQUIRE(wait_until([&t]() { return t.is_connected() == false; }));
    REQUIRE(t.state() == SessionState::Stopped);
    REQUIRE(http->request_count() == 3);
}

TEST_CASE_METHOD(SessionFixture, "stop while stopping sends no second termination body", "[session][stop]") {
    auto& t = connect();
    t.send(stanza::stream_start("localhost"));
    t.send(stanza::stream_end());

    REQUIRE(t.state() == SessionState::Stopping);
    REQUIRE(http->wait_for_requests(2));
    REQUIRE(request_for(kSeed + 1).has(R"(type="terminate")"));

    REQUIRE(t.stop() == StopResult::Ok);
    REQUIRE_FALSE(t.is_connected());
    REQUIRE(t.state() == SessionState::Stopped);

    std::this_thread::sleep_for(30ms);
    REQUIRE(http->request_count() == 2);
    REQUIRE(t.get_rid() == kSeed + 2);
    REQUIRE(t.stop() == StopResult::AlreadyStopped);
}

TEST_CASE_METHOD(SessionFixture, "stop sends a termination body once", "[session][stop]") {
    establish();
    auto& t = *transport;

    REQUIRE(t.stop() == StopResult::Ok);
    REQUIRE_FALSE(t.is_connected());

    const auto terminate = request_for(kSeed + 2);
    REQUIRE(terminate.has(R"(type="terminate")"));

    REQUIRE(t.stop() == StopResult::AlreadyStopped);
    REQUIRE(http->request_count() == 3);

    // Queries return the final values
    REQUIRE(t.get_rid() == kSeed + 3);
    REQUIRE(t.get_sid() == "abc123");
    REQUIRE(t.state() == SessionState::Stopped);
}

TEST_CASE_METHOD(SessionFixture, "Late replies after stop are discarded", "[session][stop]") {
    establish();
    REQUIRE(transport->stop() == StopResult::Ok);

    reply(kSeed + 1, R"(<body><message id="late"/></body>)");
    reply(kSeed + 2, R"(<body type="terminate"/>)");

    REQUIRE_FALSE(next_event(100ms).has_value());
}

TEST_CASE_METHOD(SessionFixture, "Commands after stop are dropped", "[session][stop]") {
    auto& t = connect();
    REQUIRE(t.stop() == StopResult::Ok);
    REQUIRE(http->wait_for_requests(1));

    t.send(stanza::presence());
    t.send_raw(empty_body(1, std::nullopt));
    t.reset_parser();

    std::this_thread::sleep_for(30ms);
    REQUIRE(http->request_count() == 1);
    REQUIRE(t.get_rid() == kSeed + 1);
}

TEST_CASE_METHOD(SessionFixture, "Session stops once the owner is gone", "[session][stop]") {
    establish();
    auto& t = *transport;

    owner.reset();
    reply(kSeed + 1, R"(<body><message id="orphan"/></body>)");

    REQUIRE(wait_until([&t]() { return t.is_connected() == false; }));
    std::this_thread::sleep_for(30ms);
    REQUIRE(http->request_count() == 2);
}

// ═══════════════════════════════════════════════════════════════════════════
// Failures
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE_METHOD(SessionFixture, "Network error fails the session", "[session][error]") {
    establish();
    auto& t = *transport;

    http->respond_error(request_for(kSeed + 1).id,
                        HttpClientError::connection_failed("Connection refused"));

    const auto error = next_failure();
    REQUIRE(error.code == BoshErrorCode::TransportError);
    REQUIRE(error.message == "ConnectionFailed: Connection refused");
    REQUIRE(wait_until([&t]() { return t.is_connected() == false; }));
    REQUIRE(t.state() == SessionState::Stopped);
}

TEST_CASE_METHOD(SessionFixture, "Non-2xx status fails the session", "[session][error]") {
    establish();

    reply(kSeed + 1, "", 404);

    const auto error = next_failure();
    REQUIRE(error.code == BoshErrorCode::TransportError);
    REQUIRE(error.http_status == 404);
    REQUIRE(error.message == "HTTP status 404");
}

TEST_CASE_METHOD(SessionFixture, "Unparseable reply fails with a protocol error", "[session][error]") {
    auto& t = connect();
    t.send(stanza::stream_start("localhost"));

    reply(kSeed, "<body sid='x'");

    const auto error = next_failure();
    REQUIRE(error.code == BoshErrorCode::ProtocolError);
    REQUIRE(wait_until([&t]() { return t.is_connected() == false; }));
}

TEST_CASE_METHOD(SessionFixture, "Reply with a mismatched closing tag fails the session", "[session][error]") {
    establish();
    auto& t = *transport;

    reply(kSeed + 1, R"(<body><message id="1"></iq></body>)");

    REQUIRE(next_failure().code == BoshErrorCode::ProtocolError);
    REQUIRE(wait_until([&t]() { return t.is_connected() == false; }));
    REQUIRE(owner->try_receive().has_value() == false);
}

TEST_CASE_METHOD(SessionFixture, "Reply with a foreign root fails with a protocol error", "[session][error]") {
    auto& t = connect();
    t.send(stanza::stream_start("localhost"));

    reply(kSeed, "<html><body>Proxy error</body></html>");

    REQUIRE(next_failure().code == BoshErrorCode::ProtocolError);
}

TEST_CASE_METHOD(SessionFixture, "Failure event carries the failing transport", "[session][error]") {
    auto& t = connect();
    t.send(stanza::presence());

    reply(kSeed, "", 503);

    auto event = next_event();
    REQUIRE(event.has_value());
    REQUIRE(std::get<SessionFailed>(*event).transport == t);
}

TEST_CASE_METHOD(SessionFixture, "TLS upgrade and compression are unsupported", "[session][capability]") {
    auto& t = connect();

    auto tls = t.upgrade_to_tls();
    REQUIRE_FALSE(tls.has_value());
    REQUIRE(tls.error().code == BoshErrorCode::UnsupportedCapability);

    auto zlib = t.use_zlib();
    REQUIRE_FALSE(zlib.has_value());
    REQUIRE(zlib.error().code == BoshErrorCode::UnsupportedCapability);

    REQUIRE(t.is_connected());
}

// ═══════════════════════════════════════════════════════════════════════════
// Parser Reset
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE_METHOD(SessionFixture, "reset_parser keeps rid, sid and pending count", "[session][parser]") {
    establish();
    auto& t = *transport;

    t.reset_parser();

    REQUIRE(t.get_rid() == kSeed + 2);
    REQUIRE(t.get_sid() == "abc123");
    REQUIRE(t.pending_requests() == 1);

    reply(kSeed + 1, R"(<body><message id="after-reset"/></body>)");
    REQUIRE(std::get<XmlElement>(next_item()).attr("id") == "after-reset");
}
