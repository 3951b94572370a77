#include "meshgate/transport/http_client.hpp"

#include <cpr/cpr.h>

#include <atomic>
#include <mutex>

namespace meshgate {

// ─────────────────────────────────────────────────────────────────────────────
// CprHttpClient Implementation
// ─────────────────────────────────────────────────────────────────────────────
// cpr (C++ Requests) over libcurl. Each send() builds an independent
// cpr::Session so concurrent calls from the dispatch pool do not share state.

class CprHttpClient : public IHttpClient {
public:
    CprHttpClient() = default;
    ~CprHttpClient() override = default;

    // ─────────────────────────────────────────────────────────────────────────
    // Configuration
    // ─────────────────────────────────────────────────────────────────────────

    void set_default_headers(const HeaderMap& headers) override {
        std::lock_guard<std::mutex> lock(config_mutex_);
        default_headers_ = headers;
    }

    void set_connect_timeout(std::chrono::milliseconds timeout) override {
        std::lock_guard<std::mutex> lock(config_mutex_);
        connect_timeout_ = timeout;
    }

    void set_read_timeout(std::chrono::milliseconds timeout) override {
        std::lock_guard<std::mutex> lock(config_mutex_);
        read_timeout_ = timeout;
    }

    void set_verify_ssl(bool verify) override {
        std::lock_guard<std::mutex> lock(config_mutex_);
        verify_ssl_ = verify;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Operations
    // ─────────────────────────────────────────────────────────────────────────

    HttpClientResult<HttpClientResponse> send(const HttpClientRequest& request) override {
        const bool is_cancelled = cancelled_.load();
        if (is_cancelled) {
            return tl::unexpected(HttpClientError::cancelled());
        }

        const bool valid_url = is_http_url(request.url);
        if (valid_url == false) {
            return tl::unexpected(HttpClientError::invalid_request("Not an http(s) URL: " + request.url));
        }

        cpr::Session session;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            const auto timeout = (request.timeout.count() > 0) ? request.timeout : read_timeout_;
            session.SetUrl(cpr::Url{request.url});
            session.SetHeader(build_headers(request.headers));
            session.SetConnectTimeout(cpr::ConnectTimeout{connect_timeout_});
            session.SetTimeout(cpr::Timeout{timeout});
            session.SetVerifySsl(cpr::VerifySsl{verify_ssl_});
        }

        const bool has_body = (request.body.empty() == false);
        if (has_body) {
            session.SetBody(cpr::Body{request.body});
        }

        cpr::Response response;
        switch (request.method) {
            case HttpMethod::Get:    response = session.Get(); break;
            case HttpMethod::Post:   response = session.Post(); break;
            case HttpMethod::Put:    response = session.Put(); break;
            case HttpMethod::Patch:  response = session.Patch(); break;
            case HttpMethod::Delete: response = session.Delete(); break;
            case HttpMethod::Head:   response = session.Head(); break;
        }
        return convert_response(response);
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    void cancel() override {
        // cpr cannot abort in-flight transfers; this only gates new ones
        cancelled_.store(true);
    }

    void reset() override {
        cancelled_.store(false);
    }

private:
    // Caller must hold config_mutex_
    cpr::Header build_headers(const HeaderMap& extra_headers) const {
        cpr::Header cpr_headers;
        for (const auto& [name, value] : default_headers_) {
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

    mutable std::mutex config_mutex_;
    HeaderMap default_headers_;
    std::chrono::milliseconds connect_timeout_{10000};
    std::chrono::milliseconds read_timeout_{30000};
    bool verify_ssl_{true};

    std::atomic<bool> cancelled_{false};
};

// ─────────────────────────────────────────────────────────────────────────────
// Factory Function
// ─────────────────────────────────────────────────────────────────────────────

std::unique_ptr<IHttpClient> make_http_client() {
    return std::make_unique<CprHttpClient>();
}

}  // namespace meshgate
