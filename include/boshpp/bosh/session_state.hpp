#pragma once

#include <string_view>

namespace boshpp {

// ─────────────────────────────────────────────────────────────────────────────
// Session State
// ─────────────────────────────────────────────────────────────────────────────

/// Lifecycle of a BOSH session.
///
///     ┌──────────────┐  start()   ┌──────────────┐
///     │  Connecting  │──────────▶│    Active    │◀──┐ send / reply
///     └──────────────┘            └──────┬───────┘───┘
///                                        │ stream end (either side)
///                                        ▼
///                                 ┌──────────────┐
///                                 │   Stopping   │
///                                 └──────┬───────┘
///                                        │ drained / server end
///                                        ▼
///                                 ┌──────────────┐
///                                 │   Stopped    │◀── stop(), failure,
///                                 └──────────────┘    owner gone
///
enum class SessionState {
    Connecting,  ///< Created, actor not yet running
    Active,      ///< Sending and long-polling
    Stopping,    ///< Stream closed, waiting for outstanding replies
    Stopped      ///< Actor exited; queries return final values
};

[[nodiscard]] constexpr std::string_view to_string(SessionState state) noexcept {
    switch (state) {
        case SessionState::Connecting: return "Connecting";
        case SessionState::Active:     return "Active";
        case SessionState::Stopping:   return "Stopping";
        case SessionState::Stopped:    return "Stopped";
    }
    return "Unknown";
}

}  // namespace boshpp
