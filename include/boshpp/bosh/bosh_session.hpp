#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// BOSH Session Actor
// ═══════════════════════════════════════════════════════════════════════════
// One session = one asio::io_context run by one dedicated thread. rid, sid,
// pending count, parser and state are only touched by handlers on that
// thread.
//
//   caller ──post──▶ io_context ──▶ wrap ──▶ HttpDispatcher ──▶ network
//                         ▲                                        │
//                         └───────── post(completion) ◀────────────┘
//                                           │
//                                           ▼
//                                  unwrap ──▶ OwnerMailbox
//
// Commands are posted and return immediately. Queries and stop() are posted
// with asio::use_future and waited on. Once the actor has stopped, queries
// read the frozen state directly.
//
// Requests are never cancelled. Completions arriving after the session has
// stopped are discarded.

#include "boshpp/bosh/bosh_body.hpp"
#include "boshpp/bosh/bosh_config.hpp"
#include "boshpp/bosh/bosh_error.hpp"
#include "boshpp/bosh/session_state.hpp"
#include "boshpp/transport/http_client.hpp"
#include "boshpp/transport/http_dispatcher.hpp"
#include "boshpp/xml/xml_element.hpp"
#include "boshpp/xml/xml_stream_parser.hpp"

#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>

#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>

namespace boshpp {

class BoshTransport;
class OwnerMailbox;

class BoshSession : public std::enable_shared_from_this<BoshSession> {
    struct PrivateTag {};

public:
    /// Configure the HTTP client, seed rid, allocate the parser and start
    /// the actor thread. Fails only with StartupError.
    [[nodiscard]] static BoshResult<std::shared_ptr<BoshSession>> start(
        const BoshConfig& config,
        std::weak_ptr<OwnerMailbox> owner,
        std::shared_ptr<IHttpClient> http_client
    );

    BoshSession(
        PrivateTag,
        const BoshConfig& config,
        std::weak_ptr<OwnerMailbox> owner,
        std::shared_ptr<IHttpClient> http_client
    );
    ~BoshSession();

    BoshSession(const BoshSession&) = delete;
    BoshSession& operator=(const BoshSession&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Commands (asynchronous)
    // ─────────────────────────────────────────────────────────────────────────

    void send(StreamItem item);
    void send_raw(XmlElement body);
    void reset_parser();

    // ─────────────────────────────────────────────────────────────────────────
    // Synchronous
    // ─────────────────────────────────────────────────────────────────────────

    StopResult stop();

    [[nodiscard]] bool is_running() const;
    [[nodiscard]] Sid sid();
    [[nodiscard]] Rid rid();
    [[nodiscard]] SessionState state();
    [[nodiscard]] std::size_t pending_requests();

    [[nodiscard]] const Endpoint& endpoint() const noexcept {
        return endpoint_;
    }

private:
    BoshResult<void> launch();
    void run();

    // Post a command; dropped with a log line if the actor has exited.
    template <typename Fn>
    void cast(const char* what, Fn&& fn);

    // Run fn on the actor and wait for its result.
    template <typename Fn>
    auto call(Fn&& fn) -> decltype(fn());

    // ─────────────────────────────────────────────────────────────────────────
    // Actor-thread only
    // ─────────────────────────────────────────────────────────────────────────

    void handle_send(const StreamItem& item);
    void handle_send_raw(const XmlElement& body);
    void handle_reset_parser();
    StopResult handle_stop();

    void dispatch(const XmlElement& body);
    void on_http_complete(Rid rid, HttpClientResult<HttpClientResponse> result);
    void handle_reply(Rid rid, const HttpClientResult<HttpClientResponse>& result);
    void send_empty_poll();

    // Deliver to the owner. Stops the session and returns false if the
    // owner's mailbox no longer exists.
    bool notify_owner_stanza(StreamItem item);
    void fail(const BoshError& error);
    void shutdown();

    [[nodiscard]] BoshTransport handle();

    // ─────────────────────────────────────────────────────────────────────────
    // Immutable after construction
    // ─────────────────────────────────────────────────────────────────────────

    const Endpoint endpoint_;
    const std::weak_ptr<OwnerMailbox> owner_;

    // ─────────────────────────────────────────────────────────────────────────
    // Actor machinery
    // ─────────────────────────────────────────────────────────────────────────

    asio::io_context io_;
    asio::executor_work_guard<asio::io_context::executor_type> work_;
    std::thread thread_;

    // Guards the running_ check and the post that follows it.
    mutable std::mutex lifecycle_mutex_;
    bool running_{false};

    // ─────────────────────────────────────────────────────────────────────────
    // Session state (actor thread)
    // ─────────────────────────────────────────────────────────────────────────

    HttpDispatcher dispatcher_;
    std::unique_ptr<XmlStreamParser> parser_;
    Sid sid_;
    Rid rid_{0};
    std::size_t pending_{0};
    SessionState state_{SessionState::Connecting};
};

}  // namespace boshpp
