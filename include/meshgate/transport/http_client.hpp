#pragma once

#include "meshgate/transport/http_types.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace meshgate {

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Client Error
// ─────────────────────────────────────────────────────────────────────────────

struct HttpClientError {
    enum class Code {
        ConnectionFailed,
        Timeout,
        SslError,
        InvalidRequest,
        Cancelled,
        Unknown
    };

    Code code;
    std::string message;

    static HttpClientError connection_failed(const std::string& msg) {
        return {Code::ConnectionFailed, msg};
    }
    static HttpClientError timeout(const std::string& msg) {
        return {Code::Timeout, msg};
    }
    static HttpClientError ssl_error(const std::string& msg) {
        return {Code::SslError, msg};
    }
    static HttpClientError invalid_request(const std::string& msg) {
        return {Code::InvalidRequest, msg};
    }
    static HttpClientError cancelled() {
        return {Code::Cancelled, "Request cancelled"};
    }
    static HttpClientError unknown(const std::string& msg) {
        return {Code::Unknown, msg};
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Client Request / Response
// ─────────────────────────────────────────────────────────────────────────────

struct HttpClientRequest {
    HttpMethod method{HttpMethod::Get};
    std::string url;                        ///< Absolute http(s) URL
    HeaderMap headers;
    std::string body;
    std::chrono::milliseconds timeout{0};   ///< 0 = client read timeout

    HttpClientRequest& with_header(const std::string& name, const std::string& value) {
        headers[name] = value;
        return *this;
    }

    HttpClientRequest& with_body(std::string content) {
        body = std::move(content);
        return *this;
    }

    HttpClientRequest& with_timeout(std::chrono::milliseconds value) {
        timeout = value;
        return *this;
    }
};

struct HttpClientResponse {
    int status_code{0};
    HeaderMap headers;
    std::string body;

    [[nodiscard]] bool is_success() const {
        return (status_code >= 200) && (status_code < 300);
    }

    [[nodiscard]] bool is_json() const {
        const auto content_type = get_header(headers, "Content-Type");
        const bool found = content_type.has_value();
        if (found == false) return false;
        return content_type->find("application/json") != std::string::npos;
    }
};

template <typename T>
using HttpClientResult = tl::expected<T, HttpClientError>;

// ─────────────────────────────────────────────────────────────────────────────
// IHttpClient Interface
// ─────────────────────────────────────────────────────────────────────────────
// Outbound HTTP used by URL endpoints and the default /health probe. Calls are
// synchronous; the router already runs dispatch on its worker pool and bounds
// it with its own deadline.

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    // ─────────────────────────────────────────────────────────────────────────
    // Configuration
    // ─────────────────────────────────────────────────────────────────────────

    /// Headers sent with every request (request headers win on conflict)
    virtual void set_default_headers(const HeaderMap& headers) = 0;

    virtual void set_connect_timeout(std::chrono::milliseconds timeout) = 0;

    /// Used when a request does not carry its own timeout
    virtual void set_read_timeout(std::chrono::milliseconds timeout) = 0;

    virtual void set_verify_ssl(bool verify) = 0;

    // ─────────────────────────────────────────────────────────────────────────
    // Operations
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] virtual HttpClientResult<HttpClientResponse> send(const HttpClientRequest& request) = 0;

    [[nodiscard]] HttpClientResult<HttpClientResponse> get(
        const std::string& url,
        std::chrono::milliseconds timeout = std::chrono::milliseconds{0}
    ) {
        HttpClientRequest request;
        request.method = HttpMethod::Get;
        request.url = url;
        request.timeout = timeout;
        return send(request);
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    /// Refuse new requests (in-flight requests complete)
    virtual void cancel() = 0;

    /// Accept requests again after cancel()
    virtual void reset() = 0;
};

// Creates the default (cpr-backed) client.
std::unique_ptr<IHttpClient> make_http_client();

}  // namespace meshgate
