#pragma once

#include "boshpp/bosh/bosh_error.hpp"
#include "boshpp/bosh/bosh_transport.hpp"
#include "boshpp/xml/xml_element.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <variant>

namespace boshpp {

// ─────────────────────────────────────────────────────────────────────────────
// Owner Events
// ─────────────────────────────────────────────────────────────────────────────

/// One decoded stream item from a reply, in reply order.
struct StanzaReceived {
    BoshTransport transport;
    StreamItem stanza;
};

/// The session died. Always the last event a session delivers.
struct SessionFailed {
    BoshTransport transport;
    BoshError error;
};

using OwnerEvent = std::variant<StanzaReceived, SessionFailed>;

// ─────────────────────────────────────────────────────────────────────────────
// OwnerMailbox
// ─────────────────────────────────────────────────────────────────────────────
// Thread-safe queue the session delivers into and the owner reads from.
// Sessions hold it weakly: once the owner drops its last reference, the next
// delivery attempt stops the session.
//
// Several sessions may share one mailbox; events carry their transport.

class OwnerMailbox {
public:
    OwnerMailbox() = default;

    OwnerMailbox(const OwnerMailbox&) = delete;
    OwnerMailbox& operator=(const OwnerMailbox&) = delete;

    /// Enqueue an event. Returns false (and drops it) once closed.
    bool deliver(OwnerEvent event);

    /// Block until an event arrives. nullopt once closed and drained.
    [[nodiscard]] std::optional<OwnerEvent> receive();

    /// nullopt on timeout, or once closed and drained.
    [[nodiscard]] std::optional<OwnerEvent> receive_with_timeout(std::chrono::milliseconds timeout);

    [[nodiscard]] std::optional<OwnerEvent> try_receive();

    /// Refuse further deliveries and wake blocked receivers. Events already
    /// queued can still be read.
    void close();

    [[nodiscard]] bool is_closed() const;
    [[nodiscard]] std::size_t size() const;

private:
    std::optional<OwnerEvent> pop_locked();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<OwnerEvent> events_;
    bool closed_{false};
};

}  // namespace boshpp
