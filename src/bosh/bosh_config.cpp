#include "boshpp/bosh/bosh_config.hpp"

#include <nlohmann/json.hpp>

#include <limits>
#include <string>

namespace boshpp {

std::string Endpoint::base_url() const {
    // IPv6 literals need brackets in the authority
    const bool ipv6_literal = host.find(':') != std::string::npos && host.front() != '[';
    const std::string authority = ipv6_literal ? "[" + host + "]" : host;
    return std::string(secure ? "https" : "http") + "://" + authority + ":" + std::to_string(port);
}

std::string Endpoint::url() const {
    return base_url() + path;
}

Endpoint BoshConfig::endpoint() const {
    return Endpoint{host, port, path, secure};
}

BoshConfig& BoshConfig::with_host(const std::string& value) {
    host = value;
    return *this;
}

BoshConfig& BoshConfig::with_port(std::uint16_t value) {
    port = value;
    return *this;
}

BoshConfig& BoshConfig::with_path(const std::string& value) {
    path = value;
    return *this;
}

BoshConfig& BoshConfig::with_secure(bool value) {
    secure = value;
    return *this;
}

BoshConfig& BoshConfig::with_header(const std::string& name, const std::string& value) {
    default_headers[name] = value;
    return *this;
}

BoshConfig& BoshConfig::with_initial_rid(std::uint64_t rid) {
    initial_rid = rid;
    return *this;
}

BoshConfig& BoshConfig::with_connect_timeout(std::chrono::milliseconds timeout) {
    connect_timeout = timeout;
    return *this;
}

BoshConfig& BoshConfig::with_request_timeout(std::chrono::milliseconds timeout) {
    request_timeout = timeout;
    return *this;
}

BoshResult<BoshConfig> BoshConfig::from_url(const std::string& url) {
    const auto components = parse_url(url);
    if (components.has_value() == false) {
        return tl::unexpected(BoshError::invalid_config(
            "Not a valid http(s) URL: '" + url + "'"));
    }

    BoshConfig config;
    config.host = components->host;
    config.port = components->port;
    config.path = components->path_with_query();
    config.secure = components->is_secure();
    return config;
}

BoshResult<BoshConfig> BoshConfig::from_json(const nlohmann::json& json) {
    if (json.is_object() == false) {
        return tl::unexpected(BoshError::invalid_config("Configuration must be a JSON object"));
    }

    BoshConfig config;
    try {
        if (json.contains("host")) {
            config.host = json.at("host").get<std::string>();
        }
        if (json.contains("port")) {
            const auto port = json.at("port").get<std::int64_t>();
            if (port <= 0 || port > std::numeric_limits<std::uint16_t>::max()) {
                return tl::unexpected(BoshError::invalid_config(
                    "Port out of range: " + std::to_string(port)));
            }
            config.port = static_cast<std::uint16_t>(port);
        }
        if (json.contains("path")) {
            config.path = json.at("path").get<std::string>();
        }
        if (json.contains("secure")) {
            config.secure = json.at("secure").get<bool>();
        }
        if (json.contains("verify_ssl")) {
            config.verify_ssl = json.at("verify_ssl").get<bool>();
        }
        if (json.contains("initial_rid")) {
            config.initial_rid = json.at("initial_rid").get<std::uint64_t>();
        }
        if (json.contains("request_timeout_ms")) {
            config.request_timeout = std::chrono::milliseconds(
                json.at("request_timeout_ms").get<std::int64_t>());
        }
        if (json.contains("connect_timeout_ms")) {
            config.connect_timeout = std::chrono::milliseconds(
                json.at("connect_timeout_ms").get<std::int64_t>());
        }
        if (json.contains("headers")) {
            config.default_headers = json.at("headers").get<HeaderMap>();
        }
    } catch (const nlohmann::json::exception& e) {
        return tl::unexpected(BoshError::invalid_config(e.what()));
    }

    if (config.host.empty()) {
        return tl::unexpected(BoshError::invalid_config("Host must not be empty"));
    }
    if (config.request_timeout.count() < 0 || config.connect_timeout.count() < 0) {
        return tl::unexpected(BoshError::invalid_config("Timeouts must not be negative"));
    }
    return config;
}

BoshResult<BoshConfig> BoshConfig::from_json_string(const std::string& text) {
    try {
        return from_json(nlohmann::json::parse(text));
    } catch (const nlohmann::json::parse_error& e) {
        return tl::unexpected(BoshError::invalid_config(e.what()));
    }
}

}  // namespace boshpp
