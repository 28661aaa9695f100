#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// BOSH Transport Handle
// ═══════════════════════════════════════════════════════════════════════════
// The value callers hold for a running BOSH session. Copies share the same
// session; two handles compare equal when they refer to the same one.
//
// Usage:
//   auto owner = std::make_shared<boshpp::OwnerMailbox>();
//   auto transport = boshpp::BoshTransport::connect(config, owner);
//   if (!transport) { /* StartupError */ }
//
//   transport->send(boshpp::stanza::stream_start("example.com"));
//   while (auto event = owner->receive_with_timeout(5s)) { ... }
//   transport->stop();
//
// send(), send_raw() and reset_parser() are fire-and-forget. Everything else
// waits for the session to answer. Once the session has stopped, queries
// return the values it had when it stopped.

#include "boshpp/bosh/bosh_body.hpp"
#include "boshpp/bosh/bosh_config.hpp"
#include "boshpp/bosh/bosh_error.hpp"
#include "boshpp/bosh/session_state.hpp"
#include "boshpp/transport/http_client.hpp"
#include "boshpp/xml/xml_element.hpp"

#include <cstddef>
#include <memory>

namespace boshpp {

class BoshSession;
class OwnerMailbox;

class BoshTransport {
public:
    // ─────────────────────────────────────────────────────────────────────────
    // Connect
    // ─────────────────────────────────────────────────────────────────────────

    /// Start a session using the default (cpr) HTTP client.
    [[nodiscard]] static BoshResult<BoshTransport> connect(
        const BoshConfig& config,
        std::shared_ptr<OwnerMailbox> owner
    );

    /// Start a session on a caller-supplied HTTP client.
    [[nodiscard]] static BoshResult<BoshTransport> connect(
        const BoshConfig& config,
        std::shared_ptr<OwnerMailbox> owner,
        std::shared_ptr<IHttpClient> http_client
    );

    // ─────────────────────────────────────────────────────────────────────────
    // Commands
    // ─────────────────────────────────────────────────────────────────────────

    /// Wrap the item in a <body> and POST it. A StreamEnd closes the stream.
    void send(StreamItem item) const;

    /// POST a caller-built <body> unchanged. Still consumes a rid, so do not
    /// mix with send() unless the body carries get_rid().
    void send_raw(XmlElement body) const;

    /// Replace the reply parser. rid, sid and pending count are kept.
    void reset_parser() const;

    /// Send a termination body and stop the session.
    StopResult stop() const;

    // ─────────────────────────────────────────────────────────────────────────
    // Capabilities
    // ─────────────────────────────────────────────────────────────────────────
    // Stream-level TLS and compression cannot be negotiated over BOSH.

    [[nodiscard]] BoshResult<void> upgrade_to_tls() const;
    [[nodiscard]] BoshResult<void> use_zlib() const;

    [[nodiscard]] bool tls() const noexcept { return false; }
    [[nodiscard]] bool compress() const noexcept { return false; }

    // ─────────────────────────────────────────────────────────────────────────
    // Queries
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] bool is_connected() const;
    [[nodiscard]] Sid get_sid() const;
    [[nodiscard]] Rid get_rid() const;
    [[nodiscard]] SessionState state() const;
    [[nodiscard]] std::size_t pending_requests() const;

    [[nodiscard]] const Endpoint& endpoint() const noexcept {
        return endpoint_;
    }

    bool operator==(const BoshTransport& other) const noexcept {
        return session_ == other.session_;
    }

private:
    friend class BoshSession;

    BoshTransport(std::shared_ptr<BoshSession> session, Endpoint endpoint);

    std::shared_ptr<BoshSession> session_;
    Endpoint endpoint_;
};

}  // namespace boshpp
