#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// BOSH Session Error
// ═══════════════════════════════════════════════════════════════════════════
// Returned by connect() and the capability operations, and delivered to the
// owner inside SessionFailed when a running session dies.

#include "boshpp/transport/http_client.hpp"
#include "boshpp/xml/xml_stream_parser.hpp"

#include <tl/expected.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace boshpp {

/// Error codes for BOSH session operations
enum class BoshErrorCode {
    StartupError,           ///< Session actor could not be started
    TransportError,         ///< HTTP request failed or returned non-2xx
    ProtocolError,          ///< Reply was not a well-formed <body>
    UnsupportedCapability,  ///< TLS upgrade / compression requested
    InvalidConfig           ///< Configuration input rejected
};

[[nodiscard]] constexpr std::string_view to_string(BoshErrorCode code) noexcept {
    switch (code) {
        case BoshErrorCode::StartupError:          return "StartupError";
        case BoshErrorCode::TransportError:        return "TransportError";
        case BoshErrorCode::ProtocolError:         return "ProtocolError";
        case BoshErrorCode::UnsupportedCapability: return "UnsupportedCapability";
        case BoshErrorCode::InvalidConfig:         return "InvalidConfig";
        default:                                   return "Unknown";
    }
}

struct BoshError {
    BoshErrorCode code;
    std::string message;
    std::optional<int> http_status;  ///< Set for non-2xx replies

    // ─────────────────────────────────────────────────────────────────────────
    // Factory Methods
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] static BoshError startup_error(std::string msg) {
        return {BoshErrorCode::StartupError, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static BoshError transport_error(std::string msg) {
        return {BoshErrorCode::TransportError, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static BoshError http_status_error(int status) {
        return {BoshErrorCode::TransportError, "HTTP status " + std::to_string(status), status};
    }

    [[nodiscard]] static BoshError protocol_error(std::string msg) {
        return {BoshErrorCode::ProtocolError, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static BoshError unsupported_capability(std::string_view capability) {
        return {BoshErrorCode::UnsupportedCapability,
                std::string(capability) + " is not supported over BOSH",
                std::nullopt};
    }

    [[nodiscard]] static BoshError invalid_config(std::string msg) {
        return {BoshErrorCode::InvalidConfig, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static BoshError from_client_error(const HttpClientError& err) {
        return transport_error(std::string(to_string(err.code)) + ": " + err.message);
    }

    [[nodiscard]] static BoshError from_xml_error(const XmlError& err) {
        if (err.offset.has_value()) {
            return protocol_error(err.message + " (at byte " + std::to_string(*err.offset) + ")");
        }
        return protocol_error(err.message);
    }
};

template <typename T>
using BoshResult = tl::expected<T, BoshError>;

/// Outcome of BoshTransport::stop(). Stopping twice is not an error.
enum class StopResult {
    Ok,
    AlreadyStopped
};

[[nodiscard]] constexpr std::string_view to_string(StopResult result) noexcept {
    switch (result) {
        case StopResult::Ok:             return "Ok";
        case StopResult::AlreadyStopped: return "AlreadyStopped";
        default:                         return "Unknown";
    }
}

}  // namespace boshpp
