#include "meshgate/transport/http_types.hpp"

namespace meshgate {

std::optional<HttpMethod> parse_http_method(std::string_view name) {
    std::string upper(name);
    std::ranges::transform(upper, upper.begin(),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "GET")    return HttpMethod::Get;
    if (upper == "POST")   return HttpMethod::Post;
    if (upper == "PUT")    return HttpMethod::Put;
    if (upper == "PATCH")  return HttpMethod::Patch;
    if (upper == "DELETE") return HttpMethod::Delete;
    if (upper == "HEAD")   return HttpMethod::Head;
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// URL Parser Implementation (using ada-url)
// ─────────────────────────────────────────────────────────────────────────────

std::optional<UrlComponents> parse_url(const std::string& url) {
    auto parsed = ada::parse<ada::url>(url);

    const bool parse_failed = (parsed.has_value() == false);
    if (parse_failed) {
        return std::nullopt;
    }

    const auto& ada_url = parsed.value();

    // ada returns "https:" - drop the colon
    std::string scheme = std::string(ada_url.get_protocol());
    const bool has_colon = (scheme.empty() == false) && (scheme.back() == ':');
    if (has_colon) {
        scheme.pop_back();
    }

    const bool is_http = (scheme == "http");
    const bool is_https = (scheme == "https");
    if ((is_http || is_https) == false) {
        return std::nullopt;
    }

    std::string host = std::string(ada_url.get_hostname());
    if (host.empty()) {
        return std::nullopt;
    }

    std::uint16_t port = is_https ? 443 : 80;
    const auto port_str = ada_url.get_port();
    const bool has_explicit_port = (port_str.empty() == false);
    if (has_explicit_port) {
        port = static_cast<std::uint16_t>(std::stoi(std::string(port_str)));
    }

    std::string path = std::string(ada_url.get_pathname());
    if (path.empty()) {
        path = "/";
    }

    UrlComponents result;
    result.scheme = std::move(scheme);
    result.host = std::move(host);
    result.port = port;
    result.path = std::move(path);
    result.query = std::string(ada_url.get_search());
    return result;
}

std::string join_url(std::string_view base, std::string_view path) {
    std::string result(base);
    while (result.empty() == false && result.back() == '/') {
        result.pop_back();
    }
    if (path.empty()) {
        return result;
    }
    if (path.front() != '/') {
        result.push_back('/');
    }
    result.append(path);
    return result;
}

}  // namespace meshgate
