#pragma once

#include <ada.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <unordered_map>

namespace meshgate {

// ─────────────────────────────────────────────────────────────────────────────
// Case-Insensitive Header Lookup
// ─────────────────────────────────────────────────────────────────────────────
// HTTP header names are case-insensitive per RFC 7230.

using HeaderMap = std::unordered_map<std::string, std::string>;

/// Find a header by name (case-insensitive).
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
    const bool found = (it != headers.end());
    if (found) {
        return it->second;
    }
    return std::nullopt;
}

inline bool has_header(const HeaderMap& headers, std::string_view name) {
    return find_header(headers, name) != headers.end();
}

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Method
// ─────────────────────────────────────────────────────────────────────────────

enum class HttpMethod {
    Get,
    Post,
    Put,
    Patch,
    Delete,
    Head
};

inline std::string to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get:    return "GET";
        case HttpMethod::Post:   return "POST";
        case HttpMethod::Put:    return "PUT";
        case HttpMethod::Patch:  return "PATCH";
        case HttpMethod::Delete: return "DELETE";
        case HttpMethod::Head:   return "HEAD";
    }
    return "UNKNOWN";
}

/// Parse a method name (case-insensitive). nullopt for anything unsupported.
std::optional<HttpMethod> parse_http_method(std::string_view name);

// ─────────────────────────────────────────────────────────────────────────────
// URL Components
// ─────────────────────────────────────────────────────────────────────────────
// Parsed http(s) URL. Uses ada-url (WHATWG-compliant).

struct UrlComponents {
    std::string scheme;   // "http" or "https"
    std::string host;     // "api.example.com"
    std::uint16_t port;   // 443 for https, 80 for http (or explicit)
    std::string path;     // "/users" (includes leading slash)
    std::string query;    // "?foo=bar" (optional, includes ?)

    [[nodiscard]] bool is_secure() const {
        return scheme == "https";
    }

    [[nodiscard]] std::string origin() const {
        return scheme + "://" + host + ":" + std::to_string(port);
    }

    [[nodiscard]] std::string path_with_query() const {
        const bool has_query = (query.empty() == false);
        if (has_query) {
            return path + query;
        }
        return path;
    }
};

/// Parse an http/https URL. Returns nullopt for invalid URLs or other schemes.
std::optional<UrlComponents> parse_url(const std::string& url);

/// True when `target` parses as an absolute http(s) URL.
inline bool is_http_url(const std::string& target) {
    return parse_url(target).has_value();
}

/// Join a base URL and a request path without doubling the slash.
std::string join_url(std::string_view base, std::string_view path);

}  // namespace meshgate
