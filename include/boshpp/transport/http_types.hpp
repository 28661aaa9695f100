#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <unordered_map>

namespace boshpp {

using HeaderMap = std::unordered_map<std::string, std::string>;

// ─────────────────────────────────────────────────────────────────────────────
// Case-Insensitive Header Lookup
// ─────────────────────────────────────────────────────────────────────────────
// HTTP header names are case-insensitive (RFC 7230). Connection managers in
// front of BOSH endpoints are not consistent about casing.

inline HeaderMap::const_iterator find_header(
    const HeaderMap& headers,
    std::string_view name
) {
    return std::ranges::find_if(headers,
        [&name](const auto& pair) {
            const auto& key = pair.first;
            return key.size() == name.size() &&
                   std::ranges::equal(key, name,
                       [](char a, char b) {
                           return std::tolower(static_cast<unsigned char>(a)) ==
                                  std::tolower(static_cast<unsigned char>(b));
                       });
        });
}

inline std::optional<std::string> get_header(
    const HeaderMap& headers,
    std::string_view name
) {
    const auto it = find_header(headers, name);
    if (it != headers.end()) {
        return it->second;
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// URL Components
// ─────────────────────────────────────────────────────────────────────────────

struct UrlComponents {
    std::string scheme;   // "http" or "https"
    std::string host;
    std::uint16_t port;   // Explicit, or the scheme default
    std::string path;     // Always starts with "/"
    std::string query;    // "?a=b" or empty

    [[nodiscard]] bool is_secure() const {
        return scheme == "https";
    }

    [[nodiscard]] std::string path_with_query() const {
        if (query.empty() == false) {
            return path + query;
        }
        return path;
    }
};

/// Parse an http(s) URL with ada (WHATWG URL Standard).
/// Returns nullopt for invalid URLs, other schemes, or an empty host.
std::optional<UrlComponents> parse_url(const std::string& url);

}  // namespace boshpp
