#include "boshpp/bosh/bosh_transport.hpp"
#include "boshpp/bosh/bosh_session.hpp"
#include "boshpp/bosh/owner_mailbox.hpp"
#include "boshpp/log/logger.hpp"

namespace boshpp {

BoshTransport::BoshTransport(std::shared_ptr<BoshSession> session, Endpoint endpoint)
    : session_(std::move(session))
    , endpoint_(std::move(endpoint))
{}

// ─────────────────────────────────────────────────────────────────────────────
// Connect
// ─────────────────────────────────────────────────────────────────────────────

BoshResult<BoshTransport> BoshTransport::connect(
    const BoshConfig& config,
    std::shared_ptr<OwnerMailbox> owner
) {
    return connect(config, std::move(owner), std::shared_ptr<IHttpClient>(make_http_client()));
}

BoshResult<BoshTransport> BoshTransport::connect(
    const BoshConfig& config,
    std::shared_ptr<OwnerMailbox> owner,
    std::shared_ptr<IHttpClient> http_client
) {
    if (owner == nullptr) {
        return tl::unexpected(BoshError::startup_error("No owner mailbox supplied"));
    }

    auto session = BoshSession::start(config, owner, std::move(http_client));
    if (session.has_value() == false) {
        BOSHPP_LOG_ERROR("BOSH connect failed: " + session.error().message);
        return tl::unexpected(session.error());
    }

    auto endpoint = (*session)->endpoint();
    return BoshTransport(std::move(*session), std::move(endpoint));
}

// ─────────────────────────────────────────────────────────────────────────────
// Commands
// ─────────────────────────────────────────────────────────────────────────────

void BoshTransport::send(StreamItem item) const {
    session_->send(std::move(item));
}

void BoshTransport::send_raw(XmlElement body) const {
    session_->send_raw(std::move(body));
}

void BoshTransport::reset_parser() const {
    session_->reset_parser();
}

StopResult BoshTransport::stop() const {
    return session_->stop();
}

// ─────────────────────────────────────────────────────────────────────────────
// Capabilities
// ─────────────────────────────────────────────────────────────────────────────

BoshResult<void> BoshTransport::upgrade_to_tls() const {
    return tl::unexpected(BoshError::unsupported_capability("TLS upgrade"));
}

BoshResult<void> BoshTransport::use_zlib() const {
    return tl::unexpected(BoshError::unsupported_capability("Stream compression"));
}

// ─────────────────────────────────────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────────────────────────────────────

bool BoshTransport::is_connected() const {
    return session_->is_running();
}

Sid BoshTransport::get_sid() const {
    return session_->sid();
}

Rid BoshTransport::get_rid() const {
    return session_->rid();
}

SessionState BoshTransport::state() const {
    return session_->state();
}

std::size_t BoshTransport::pending_requests() const {
    return session_->pending_requests();
}

}  // namespace boshpp
