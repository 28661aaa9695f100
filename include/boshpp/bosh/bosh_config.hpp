#ifndef BOSHPP_BOSH_BOSH_CONFIG_HPP
#define BOSHPP_BOSH_BOSH_CONFIG_HPP

#include "boshpp/bosh/bosh_error.hpp"
#include "boshpp/transport/http_types.hpp"

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace boshpp {

// ─────────────────────────────────────────────────────────────────────────────
// Endpoint
// ─────────────────────────────────────────────────────────────────────────────
// Where a session POSTs its bodies. Fixed for the lifetime of the session.

struct Endpoint {
    std::string host;
    std::uint16_t port{0};
    std::string path;
    bool secure{false};

    /// "http://host:port" or "https://host:port", no path.
    [[nodiscard]] std::string base_url() const;

    /// base_url() followed by path.
    [[nodiscard]] std::string url() const;

    bool operator==(const Endpoint&) const = default;
};

// ─────────────────────────────────────────────────────────────────────────────
// BOSH Session Configuration
// ─────────────────────────────────────────────────────────────────────────────

struct BoshConfig {
    // ─────────────────────────────────────────────────────────────────────────
    // Endpoint
    // ─────────────────────────────────────────────────────────────────────────

    std::string host{"localhost"};
    std::uint16_t port{5280};
    std::string path{"/http-bind"};

    // Use https. TLS here belongs to the HTTP layer; the XMPP-level
    // upgrade_to_tls() stays unsupported either way.
    bool secure{false};

    // Verify the server certificate when secure is set.
    bool verify_ssl{true};

    // ─────────────────────────────────────────────────────────────────────────
    // Session
    // ─────────────────────────────────────────────────────────────────────────

    // First rid to use. Unset = wall clock in microseconds.
    std::optional<std::uint64_t> initial_rid;

    // Extra headers sent with every request.
    HeaderMap default_headers;

    // ─────────────────────────────────────────────────────────────────────────
    // Timeouts
    // ─────────────────────────────────────────────────────────────────────────

    std::chrono::milliseconds connect_timeout{10'000};

    // Whole-request limit. 0 = none. A connection manager holds a poll for up
    // to "wait" (60s) seconds, so anything set here should exceed that.
    std::chrono::milliseconds request_timeout{0};

    [[nodiscard]] Endpoint endpoint() const;

    // ─────────────────────────────────────────────────────────────────────────
    // Builder-Style Helpers
    // ─────────────────────────────────────────────────────────────────────────
    //   BoshConfig{}.with_host("example.com").with_port(5443).with_secure(true)

    BoshConfig& with_host(const std::string& value);
    BoshConfig& with_port(std::uint16_t value);
    BoshConfig& with_path(const std::string& value);
    BoshConfig& with_secure(bool value);
    BoshConfig& with_header(const std::string& name, const std::string& value);
    BoshConfig& with_initial_rid(std::uint64_t rid);
    BoshConfig& with_connect_timeout(std::chrono::milliseconds timeout);
    BoshConfig& with_request_timeout(std::chrono::milliseconds timeout);

    // ─────────────────────────────────────────────────────────────────────────
    // Parsing
    // ─────────────────────────────────────────────────────────────────────────

    /// "http://example.com:5280/http-bind". Port defaults to the scheme's.
    [[nodiscard]] static BoshResult<BoshConfig> from_url(const std::string& url);

    /// Keys: host, port, path, secure, verify_ssl, initial_rid,
    /// request_timeout_ms, connect_timeout_ms, headers (object of strings).
    /// Missing keys keep their defaults.
    [[nodiscard]] static BoshResult<BoshConfig> from_json(const nlohmann::json& json);

    /// Same as from_json, from a JSON document.
    [[nodiscard]] static BoshResult<BoshConfig> from_json_string(const std::string& text);
};

}  // namespace boshpp

#endif  // BOSHPP_BOSH_BOSH_CONFIG_HPP
