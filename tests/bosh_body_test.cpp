// ─────────────────────────────────────────────────────────────────────────────
// BOSH Body Wrapping Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "boshpp/bosh/bosh_body.hpp"
#include "boshpp/xml/stanza.hpp"
#include "boshpp/xml/xml_stream_parser.hpp"
#include "boshpp/xml/xmlns.hpp"

#include <limits>

using namespace boshpp;

namespace {

XmlElement parse(const std::string& text) {
    XmlStreamParser parser;
    auto result = parser.parse(text);
    REQUIRE(result.has_value());
    return *result;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Body Constructors
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("pack_rid is plain unsigned decimal", "[bosh][body]") {
    REQUIRE(pack_rid(0) == "0");
    REQUIRE(pack_rid(1700000000123456ULL) == "1700000000123456");
    REQUIRE(pack_rid(std::numeric_limits<Rid>::max()) == "18446744073709551615");
}

TEST_CASE("empty_body omits sid while unbound", "[bosh][body]") {
    const auto body = empty_body(42, std::nullopt);

    REQUIRE(to_string(body) ==
            R"(<body rid="42" xmlns="http://jabber.org/protocol/httpbind"/>)");
}

TEST_CASE("empty_body puts sid after the common attributes", "[bosh][body]") {
    const auto body = empty_body(43, std::string("abc123"), {{"ack", "42"}});

    REQUIRE(body.attrs.size() == 4);
    REQUIRE(body.attrs[0].first == "rid");
    REQUIRE(body.attrs[1] == XmlAttribute{"xmlns", std::string(xmlns::kHttpBind)});
    REQUIRE(body.attrs[2] == XmlAttribute{"sid", "abc123"});
    REQUIRE(body.attrs[3] == XmlAttribute{"ack", "42"});
}

TEST_CASE("session_creation_body carries the creation attributes", "[bosh][body]") {
    const auto body = session_creation_body(100, "example.com");

    REQUIRE(to_string(body) ==
            R"(<body rid="100" xmlns="http://jabber.org/protocol/httpbind")"
            R"( content="text/xml; charset=utf-8" xmlns:xmpp="urn:xmpp:xbosh")"
            R"( xmpp:version="1.0" hold="1" wait="60" xml:lang="en" to="example.com"/>)");
}

TEST_CASE("session_creation_body with sid is a stream restart", "[bosh][body]") {
    const auto body = session_creation_body("1.0", "de", 101, "example.com", std::string("s1"));

    REQUIRE(body.attr("sid") == "s1");
    REQUIRE(body.attr("xml:lang") == "de");
    REQUIRE(body.attr("xmpp:restart") == "true");
    REQUIRE(body.attrs.back().first == "xmpp:restart");
}

TEST_CASE("session_termination_body sends unavailable presence", "[bosh][body]") {
    const auto body = session_termination_body(7, std::string("s1"));

    REQUIRE(to_string(body) ==
            R"(<body rid="7" xmlns="http://jabber.org/protocol/httpbind" sid="s1" type="terminate">)"
            R"(<presence type="unavailable"/></body>)");
}

// ═══════════════════════════════════════════════════════════════════════════
// Wrapping
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Wrapping a bare stream start fills in defaults", "[bosh][wrap]") {
    const auto body = wrap_item(StreamStart{}, 5, std::nullopt);

    REQUIRE(body.attr("xmpp:version") == "1.0");
    REQUIRE(body.attr("xml:lang") == "en");
    REQUIRE(body.attr("to") == "localhost");
    REQUIRE(body.attr("hold") == "1");
    REQUIRE(body.attr("wait") == "60");
    REQUIRE_FALSE(body.attr("sid").has_value());
    REQUIRE_FALSE(body.attr("xmpp:restart").has_value());
}

TEST_CASE("Wrapping a stream start uses its attributes", "[bosh][wrap]") {
    StreamStart start;
    start.attrs = {{"to", "example.org"}, {"version", "2.0"}, {"xml:lang", "fr"}};

    const auto body = wrap_item(start, 5, std::string("sid-1"));

    REQUIRE(body.attr("to") == "example.org");
    REQUIRE(body.attr("xmpp:version") == "2.0");
    REQUIRE(body.attr("xml:lang") == "fr");
    REQUIRE(body.attr("xmpp:restart") == "true");
}

TEST_CASE("Wrapping a stream end produces a termination body", "[bosh][wrap]") {
    const auto body = wrap_item(stanza::stream_end(), 9, std::string("s"));

    REQUIRE(body == session_termination_body(9, std::string("s")));
}

TEST_CASE("Wrapping a stanza gives one child per body", "[bosh][wrap]") {
    const auto presence = stanza::presence();
    const auto body = wrap_item(presence, 11, std::string("s"));

    REQUIRE(body.attr("rid") == "11");
    REQUIRE(body.attr("sid") == "s");
    REQUIRE(body.children.size() == 1);
    REQUIRE(body.children[0].element() == presence);
}

// ═══════════════════════════════════════════════════════════════════════════
// Unwrapping
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("classify_body", "[bosh][unwrap]") {
    REQUIRE(classify_body(parse(R"(<body/>)")).kind == BodyKind::Normal);
    REQUIRE(classify_body(parse(R"(<body type="terminate"/>)")).kind == BodyKind::StreamEnd);

    const auto start = classify_body(parse(R"(<body xmpp:version="1.0"/>)"));
    REQUIRE(start.kind == BodyKind::StreamStart);
    REQUIRE(start.version == "1.0");

    // terminate wins when both are present
    REQUIRE(classify_body(parse(R"(<body type="terminate" xmpp:version="1.0"/>)")).kind
            == BodyKind::StreamEnd);
}

TEST_CASE("Unwrapping a session creation reply synthesizes a stream start", "[bosh][unwrap]") {
    const auto body = parse(
        R"(<body sid="abc123" from="example.com" xmpp:version="1.0" xmlns:xmpp="urn:xmpp:xbosh">)"
        R"(<stream:features/></body>)");

    auto items = unwrap_body(body);
    REQUIRE(items.has_value());
    REQUIRE(items->size() == 2);
    REQUIRE(is_stream_start((*items)[0]));

    const auto& start = std::get<StreamStart>((*items)[0]);
    REQUIRE(start.name == "stream:stream");
    REQUIRE(start.attrs == XmlAttributes{
        {"from", "example.com"},
        {"version", "1.0"},
        {"xml:lang", "en"},
        {"xmlns", "jabber:client"},
        {"xmlns:stream", "http://etherx.jabber.org/streams"}
    });
    REQUIRE(std::get<XmlElement>((*items)[1]).name == "stream:features");
}

TEST_CASE("Unwrapped stream start omits a missing from", "[bosh][unwrap]") {
    auto items = unwrap_body(parse(R"(<body xmpp:version="1.0"/>)"));

    REQUIRE(items.has_value());
    const auto& start = std::get<StreamStart>(items->front());
    REQUIRE_FALSE(start.attr("from").has_value());
    REQUIRE(start.attrs.front().first == "version");
}

TEST_CASE("Unwrapping a terminate reply yields stream end then children", "[bosh][unwrap]") {
    auto items = unwrap_body(parse(
        R"(<body type="terminate"><presence type="unavailable"/></body>)"));

    REQUIRE(items.has_value());
    REQUIRE(items->size() == 2);
    REQUIRE(is_stream_end((*items)[0]));
    REQUIRE(is_stanza((*items)[1]));
}

TEST_CASE("Unwrapping a normal reply keeps children in order", "[bosh][unwrap]") {
    auto items = unwrap_body(parse(
        R"(<body><message id="1"/><presence/><message id="2"/></body>)"));

    REQUIRE(items.has_value());
    REQUIRE(items->size() == 3);
    REQUIRE(std::get<XmlElement>((*items)[0]).attr("id") == "1");
    REQUIRE(std::get<XmlElement>((*items)[1]).name == "presence");
    REQUIRE(std::get<XmlElement>((*items)[2]).attr("id") == "2");
}

TEST_CASE("Unwrapping an empty reply yields nothing", "[bosh][unwrap]") {
    auto items = unwrap_body(parse(R"(<body sid="s"/>)"));

    REQUIRE(items.has_value());
    REQUIRE(items->empty());
}

TEST_CASE("Unwrapping rejects a non-body root", "[bosh][unwrap]") {
    auto items = unwrap_body(parse(R"(<html><p>Bad gateway</p></html>)"));

    REQUIRE_FALSE(items.has_value());
    REQUIRE(items.error().code == BoshErrorCode::ProtocolError);
    REQUIRE(items.error().message == "Expected <body> reply, got <html>");
}

TEST_CASE("A wrapped stanza unwraps to itself", "[bosh][wrap][unwrap]") {
    const auto message = stanza::chat_message("bob@example.com", "x < y");
    const auto body = parse(to_string(wrap_item(message, 1, std::nullopt)));

    auto items = unwrap_body(body);
    REQUIRE(items.has_value());
    REQUIRE(items->size() == 1);
    REQUIRE(std::get<XmlElement>(items->front()) == message);
}
