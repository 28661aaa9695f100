#include "boshpp/bosh/bosh_session.hpp"
#include "boshpp/bosh/bosh_transport.hpp"
#include "boshpp/bosh/owner_mailbox.hpp"
#include "boshpp/log/logger.hpp"

#include <asio/post.hpp>
#include <asio/use_future.hpp>

#include <chrono>
#include <exception>
#include <new>
#include <string>
#include <system_error>

namespace boshpp {

namespace {

Rid seed_rid(const BoshConfig& config) {
    if (config.initial_rid.has_value()) {
        return *config.initial_rid;
    }
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<Rid>(std::chrono::duration_cast<std::chrono::microseconds>(now).count());
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Construction / Lifecycle
// ─────────────────────────────────────────────────────────────────────────────

BoshResult<std::shared_ptr<BoshSession>> BoshSession::start(
    const BoshConfig& config,
    std::weak_ptr<OwnerMailbox> owner,
    std::shared_ptr<IHttpClient> http_client
) {
    if (http_client == nullptr) {
        return tl::unexpected(BoshError::startup_error("No HTTP client supplied"));
    }

    const Endpoint endpoint = config.endpoint();
    http_client->set_base_url(endpoint.base_url());
    http_client->set_default_headers(config.default_headers);
    http_client->set_connect_timeout(config.connect_timeout);
    http_client->set_request_timeout(config.request_timeout);
    http_client->set_verify_ssl(config.verify_ssl);

    std::shared_ptr<BoshSession> session;
    try {
        session = std::make_shared<BoshSession>(
            PrivateTag{}, config, std::move(owner), std::move(http_client));
    } catch (const std::bad_alloc&) {
        return tl::unexpected(BoshError::startup_error("Could not allocate BOSH session"));
    }

    auto launched = session->launch();
    if (launched.has_value() == false) {
        return tl::unexpected(launched.error());
    }

    return session;
}

BoshSession::BoshSession(
    PrivateTag,
    const BoshConfig& config,
    std::weak_ptr<OwnerMailbox> owner,
    std::shared_ptr<IHttpClient> http_client
)
    : endpoint_(config.endpoint())
    , owner_(std::move(owner))
    , work_(asio::make_work_guard(io_))
    , dispatcher_(std::move(http_client), config.path)
    , parser_(std::make_unique<XmlStreamParser>())
    , rid_(seed_rid(config))
{}

BoshSession::~BoshSession() {
    if (thread_.joinable()) {
        // The actor thread holds the last reference while it unwinds
        const bool on_actor_thread = (thread_.get_id() == std::this_thread::get_id());
        if (on_actor_thread) {
            thread_.detach();
        } else {
            thread_.join();
        }
    }
}

BoshResult<void> BoshSession::launch() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    get_logger().info_fmt("Starting BOSH session for {} (rid {})", endpoint_.url(), rid_);
    state_ = SessionState::Active;
    running_ = true;
    try {
        thread_ = std::thread([self = shared_from_this()]() {
            self->run();
        });
    } catch (const std::system_error& e) {
        running_ = false;
        state_ = SessionState::Stopped;
        parser_.reset();
        work_.reset();
        return tl::unexpected(BoshError::startup_error(
            std::string("Could not start session thread: ") + e.what()));
    }
    return {};
}

void BoshSession::run() {
    for (;;) {
        try {
            io_.run();
            return;
        } catch (const std::exception& e) {
            get_logger().error_fmt("Unhandled exception in BOSH session: {}", e.what());
            fail(BoshError::protocol_error(
                std::string("Unhandled exception in session handler: ") + e.what()));
        }
    }
}

template <typename Fn>
void BoshSession::cast(const char* what, Fn&& fn) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (running_ == false) {
        get_logger().warn_fmt("Dropping {}: BOSH session has stopped", what);
        return;
    }
    asio::post(io_, std::forward<Fn>(fn));
}

template <typename Fn>
auto BoshSession::call(Fn&& fn) -> decltype(fn()) {
    std::unique_lock<std::mutex> lock(lifecycle_mutex_);
    if (running_ == false) {
        // Actor is gone; its state is frozen
        return fn();
    }
    auto result = asio::post(io_, asio::use_future(std::forward<Fn>(fn)));
    lock.unlock();
    return result.get();
}

// ─────────────────────────────────────────────────────────────────────────────
// Public API
// ─────────────────────────────────────────────────────────────────────────────

void BoshSession::send(StreamItem item) {
    cast("send", [this, item = std::move(item)]() {
        handle_send(item);
    });
}

void BoshSession::send_raw(XmlElement body) {
    cast("send_raw", [this, body = std::move(body)]() {
        handle_send_raw(body);
    });
}

void BoshSession::reset_parser() {
    cast("reset_parser", [this]() {
        handle_reset_parser();
    });
}

StopResult BoshSession::stop() {
    return call([this]() {
        return handle_stop();
    });
}

bool BoshSession::is_running() const {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    return running_;
}

Sid BoshSession::sid() {
    return call([this]() { return sid_; });
}

Rid BoshSession::rid() {
    return call([this]() { return rid_; });
}

SessionState BoshSession::state() {
    return call([this]() { return state_; });
}

std::size_t BoshSession::pending_requests() {
    return call([this]() { return pending_; });
}

// ─────────────────────────────────────────────────────────────────────────────
// Command Handlers
// ─────────────────────────────────────────────────────────────────────────────

void BoshSession::handle_send(const StreamItem& item) {
    if (state_ == SessionState::Stopping || state_ == SessionState::Stopped) {
        get_logger().warn_fmt("Dropping send in state {}", to_string(state_));
        return;
    }

    const bool closes_stream = is_stream_end(item);
    dispatch(wrap_item(item, rid_, sid_));

    if (closes_stream) {
        BOSHPP_LOG_INFO("Stream closed by owner, draining outstanding requests");
        state_ = SessionState::Stopping;
    }
}

void BoshSession::handle_send_raw(const XmlElement& body) {
    if (state_ == SessionState::Stopping || state_ == SessionState::Stopped) {
        get_logger().warn_fmt("Dropping send_raw in state {}", to_string(state_));
        return;
    }
    dispatch(body);
}

void BoshSession::handle_reset_parser() {
    if (state_ == SessionState::Stopped) {
        return;
    }
    get_logger().debug_fmt("Resetting parser after {} documents", parser_->documents_parsed());
    parser_->reset();
}

StopResult BoshSession::handle_stop() {
    if (state_ == SessionState::Stopped) {
        return StopResult::AlreadyStopped;
    }
    if (state_ == SessionState::Stopping) {
        // Stream end already went out or came in; nothing more to send
        shutdown();
        return StopResult::Ok;
    }
    dispatch(session_termination_body(rid_, sid_));
    shutdown();
    return StopResult::Ok;
}

// ─────────────────────────────────────────────────────────────────────────────
// Request / Reply
// ─────────────────────────────────────────────────────────────────────────────

void BoshSession::dispatch(const XmlElement& body) {
    const Rid used = rid_;
    ++rid_;
    ++pending_;

    get_logger().debug_fmt("Dispatching rid {} ({} pending)", used, pending_);

    std::weak_ptr<BoshSession> weak = weak_from_this();
    dispatcher_.dispatch(to_string(body),
        [weak, used](HttpClientResult<HttpClientResponse> result) {
            auto self = weak.lock();
            if (self != nullptr) {
                self->on_http_complete(used, std::move(result));
            }
        });
}

void BoshSession::on_http_complete(Rid rid, HttpClientResult<HttpClientResponse> result) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (running_ == false) {
        get_logger().trace_fmt("Discarding reply to rid {}: session stopped", rid);
        return;
    }
    asio::post(io_, [this, rid, result = std::move(result)]() {
        handle_reply(rid, result);
    });
}

void BoshSession::handle_reply(Rid rid, const HttpClientResult<HttpClientResponse>& result) {
    if (state_ == SessionState::Stopped) {
        return;
    }
    if (pending_ > 0) {
        --pending_;
    }

    if (result.has_value() == false) {
        fail(BoshError::from_client_error(result.error()));
        return;
    }

    const HttpClientResponse& response = *result;
    if (response.is_success() == false) {
        fail(BoshError::http_status_error(response.status_code));
        return;
    }

    get_logger().trace_fmt("Reply to rid {}: {}", rid, response.body);

    auto root = parser_->parse(response.body);
    if (root.has_value() == false) {
        fail(BoshError::from_xml_error(root.error()));
        return;
    }

    if (sid_.has_value() == false) {
        auto sid = root->attr("sid");
        if (sid.has_value()) {
            get_logger().info_fmt("BOSH session bound to sid {}", *sid);
            sid_ = std::move(sid);
        }
    }

    auto items = unwrap_body(*root);
    if (items.has_value() == false) {
        fail(items.error());
        return;
    }

    bool stream_ended = false;
    for (auto& item : *items) {
        stream_ended = stream_ended || is_stream_end(item);
        if (notify_owner_stanza(std::move(item)) == false) {
            return;
        }
    }

    if (stream_ended) {
        BOSHPP_LOG_INFO("Stream terminated by server");
        state_ = SessionState::Stopping;
        asio::post(io_, [this]() {
            shutdown();
        });
        return;
    }

    if (pending_ == 0) {
        if (state_ == SessionState::Active) {
            send_empty_poll();
        } else if (state_ == SessionState::Stopping) {
            shutdown();
        }
    }
}

void BoshSession::send_empty_poll() {
    get_logger().trace_fmt("No requests outstanding, polling with rid {}", rid_);
    dispatch(empty_body(rid_, sid_));
}

// ─────────────────────────────────────────────────────────────────────────────
// Owner Notification / Teardown
// ─────────────────────────────────────────────────────────────────────────────

bool BoshSession::notify_owner_stanza(StreamItem item) {
    auto owner = owner_.lock();
    const bool delivered = (owner != nullptr) &&
                           owner->deliver(StanzaReceived{handle(), std::move(item)});
    if (delivered == false) {
        BOSHPP_LOG_WARN("Owner mailbox is gone, stopping BOSH session");
        shutdown();
    }
    return delivered;
}

void BoshSession::fail(const BoshError& error) {
    get_logger().error_fmt("BOSH session failed ({}): {}", to_string(error.code), error.message);

    auto owner = owner_.lock();
    const bool delivered = (owner != nullptr) &&
                           owner->deliver(SessionFailed{handle(), error});
    if (delivered == false) {
        BOSHPP_LOG_WARN("Owner mailbox is gone, failure not delivered");
    }
    shutdown();
}

void BoshSession::shutdown() {
    if (state_ == SessionState::Stopped) {
        return;
    }

    state_ = SessionState::Stopped;
    parser_.reset();
    work_.reset();
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        running_ = false;
    }

    get_logger().info_fmt("BOSH session {} stopped at rid {} ({} requests outstanding)",
        sid_.value_or("<unbound>"), rid_, pending_);
}

BoshTransport BoshSession::handle() {
    return BoshTransport(shared_from_this(), endpoint_);
}

}  // namespace boshpp
