#include "boshpp/transport/http_client.hpp"

#include <cpr/cpr.h>

#include <algorithm>
#include <cctype>
#include <mutex>
#include <vector>

namespace boshpp {

// ─────────────────────────────────────────────────────────────────────────────
// CprHttpClient Implementation
// ─────────────────────────────────────────────────────────────────────────────
// Each post() is an independent cpr::Post call, so concurrent requests from
// the dispatcher's worker threads never share a curl handle. Settings are
// copied under a lock at the start of every request.

class CprHttpClient : public IHttpClient {
public:
    CprHttpClient() = default;
    ~CprHttpClient() override = default;

    // ─────────────────────────────────────────────────────────────────────────
    // Configuration
    // ─────────────────────────────────────────────────────────────────────────

    void set_base_url(const std::string& url) override {
        std::lock_guard<std::mutex> lock(mutex_);
        settings_.base_url = url;
    }

    void set_default_headers(const HeaderMap& headers) override {
        std::lock_guard<std::mutex> lock(mutex_);
        settings_.default_headers = headers;
    }

    void set_connect_timeout(std::chrono::milliseconds timeout) override {
        std::lock_guard<std::mutex> lock(mutex_);
        settings_.connect_timeout = timeout;
    }

    void set_request_timeout(std::chrono::milliseconds timeout) override {
        std::lock_guard<std::mutex> lock(mutex_);
        settings_.request_timeout = timeout;
    }

    void set_verify_ssl(bool verify) override {
        std::lock_guard<std::mutex> lock(mutex_);
        settings_.verify_ssl = verify;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Requests
    // ─────────────────────────────────────────────────────────────────────────

    HttpClientResult<HttpClientResponse> post(
        const std::string& path,
        const std::string& body,
        const std::string& content_type,
        const HeaderMap& headers
    ) override {
        Settings settings;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            settings = settings_;
        }

        auto url = build_url(settings.base_url, path);
        if (url.has_value() == false) {
            return tl::unexpected(url.error());
        }

        auto request_headers = build_headers(settings.default_headers, headers);
        request_headers["Content-Type"] = content_type;

        auto response = cpr::Post(
            cpr::Url{*url},
            request_headers,
            cpr::Body{body},
            cpr::ConnectTimeout{settings.connect_timeout},
            cpr::Timeout{settings.request_timeout},
            cpr::VerifySsl{settings.verify_ssl}
        );
        return convert_response(response);
    }

private:
    struct Settings {
        std::string base_url;
        HeaderMap default_headers;
        std::chrono::milliseconds connect_timeout{10000};
        std::chrono::milliseconds request_timeout{0};
        bool verify_ssl{true};
    };

    // ─────────────────────────────────────────────────────────────────────────
    // Path Validation
    // ─────────────────────────────────────────────────────────────────────────
    // The endpoint path comes from user configuration. Reject control
    // characters and dot-dot segments, literal or percent-encoded.

    static bool contains_traversal_pattern(const std::string& path) {
        std::string lower = path;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                      [](unsigned char c) { return std::tolower(c); });

        if (lower.find("..") != std::string::npos) {
            return true;
        }
        if (lower.find("%2e%2e") != std::string::npos ||
            lower.find("%2e.") != std::string::npos ||
            lower.find(".%2e") != std::string::npos ||
            lower.find("%252e") != std::string::npos) {
            return true;
        }
        return false;
    }

    static bool contains_dangerous_characters(const std::string& path) {
        return std::any_of(path.begin(), path.end(), [](unsigned char c) {
            return c < 0x20 || c == 0x7F;
        });
    }

    static HttpClientResult<std::string> build_url(
        const std::string& base_url,
        const std::string& path
    ) {
        if (contains_dangerous_characters(path)) {
            return tl::unexpected(HttpClientError::invalid_request(
                "Path contains control characters"));
        }
        if (contains_traversal_pattern(path)) {
            return tl::unexpected(HttpClientError::invalid_request(
                "Path traversal pattern detected in URL path"));
        }
        if (path.empty()) {
            return base_url + "/";
        }
        if (path.front() != '/') {
            return base_url + "/" + path;
        }
        return base_url + path;
    }

    static cpr::Header build_headers(const HeaderMap& defaults, const HeaderMap& extra_headers) {
        cpr::Header cpr_headers;
        for (const auto& [name, value] : defaults) {
            cpr_headers[name] = value;
        }
        for (const auto& [name, value] : extra_headers) {
            cpr_headers[name] = value;
        }
        return cpr_headers;
    }

    static HttpClientResult<HttpClientResponse> convert_response(const cpr::Response& response) {
        const bool has_error = (response.error.code != cpr::ErrorCode::OK);
        if (has_error) {
            return tl::unexpected(map_error(response.error));
        }

        HttpClientResponse result;
        result.status_code = static_cast<int>(response.status_code);
        result.body = response.text;
        for (const auto& [name, value] : response.header) {
            result.headers[name] = value;
        }
        return result;
    }

    static HttpClientError map_error(const cpr::Error& error) {
        const std::string& msg = error.message;
        const bool is_ssl_error =
            (msg.find("SSL") != std::string::npos) ||
            (msg.find("ssl") != std::string::npos) ||
            (msg.find("certificate") != std::string::npos) ||
            (msg.find("TLS") != std::string::npos);

        if (is_ssl_error) {
            return HttpClientError::ssl_error(msg);
        }

        switch (error.code) {
            case cpr::ErrorCode::OK:
                return HttpClientError::unknown("No error");

            case cpr::ErrorCode::OPERATION_TIMEDOUT:
                return HttpClientError::timeout(msg);

            case cpr::ErrorCode::SSL_CONNECT_ERROR:
                return HttpClientError::ssl_error(msg);

            default:
                return HttpClientError::connection_failed(msg);
        }
    }

    mutable std::mutex mutex_;
    Settings settings_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Factory Function
// ─────────────────────────────────────────────────────────────────────────────

std::unique_ptr<IHttpClient> make_http_client() {
    return std::make_unique<CprHttpClient>();
}

}  // namespace boshpp
