#ifndef MESHGATE_TESTS_MOCKS_MOCK_HTTP_CLIENT_HPP
#define MESHGATE_TESTS_MOCKS_MOCK_HTTP_CLIENT_HPP

#include "meshgate/transport/http_client.hpp"

#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace meshgate::testing {

// ─────────────────────────────────────────────────────────────────────────────
// MockHttpClient - IHttpClient double for URL endpoints and /health probes
// ─────────────────────────────────────────────────────────────────────────────
// Answers are resolved in this order:
//   1. a fixed answer registered for the exact URL (respond_to)
//   2. the next queued answer (queue_*)
//   3. the response handler
//   4. ConnectionFailed "No response queued"
//
// Usage:
//   auto http = std::make_shared<MockHttpClient>();
//   http->respond_to("http://users:8080/health", 200, "ok");
//   http->queue_json_response(200, R"({"id":42})");

class MockHttpClient final : public IHttpClient {
public:
    using Answer = HttpClientResult<HttpClientResponse>;
    using ResponseHandler = std::function<Answer(const HttpClientRequest&)>;

    // ─────────────────────────────────────────────────────────────────────────
    // Scripting
    // ─────────────────────────────────────────────────────────────────────────

    void respond_to(const std::string& url, int status_code, const std::string& body = {}) {
        std::lock_guard<std::mutex> lock(mutex_);
        fixed_[url] = HttpClientResponse{status_code, {}, body};
    }

    void queue_response(int status_code, const std::string& body, const HeaderMap& headers = {}) {
        push(HttpClientResponse{status_code, headers, body});
    }

    void queue_json_response(int status_code, const std::string& body) {
        queue_response(status_code, body, HeaderMap{{"Content-Type", "application/json"}});
    }

    void queue_error(HttpClientError::Code code, const std::string& message) {
        push(tl::unexpected(HttpClientError{code, message}));
    }

    void queue_connection_error(const std::string& message = "Connection refused") {
        queue_error(HttpClientError::Code::ConnectionFailed, message);
    }

    void queue_timeout(const std::string& message = "Request timed out") {
        queue_error(HttpClientError::Code::Timeout, message);
    }

    void set_response_handler(ResponseHandler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handler_ = std::move(handler);
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Inspection
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] std::vector<HttpClientRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

    [[nodiscard]] std::size_t request_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_.size();
    }

    [[nodiscard]] std::optional<HttpClientRequest> last_request() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (sent_.empty()) {
            return std::nullopt;
        }
        return sent_.back();
    }

    [[nodiscard]] std::size_t requests_to(const std::string& url) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t count = 0;
        for (const auto& request : sent_) {
            if (request.url == url) {
                count++;
            }
        }
        return count;
    }

    [[nodiscard]] bool was_requested(const std::string& url) const {
        return requests_to(url) > 0;
    }

    [[nodiscard]] HeaderMap default_headers() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return default_headers_;
    }

    [[nodiscard]] bool was_cancelled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // IHttpClient
    // ─────────────────────────────────────────────────────────────────────────

    void set_default_headers(const HeaderMap& headers) override {
        std::lock_guard<std::mutex> lock(mutex_);
        default_headers_ = headers;
    }

    void set_connect_timeout(std::chrono::milliseconds /*timeout*/) override {}
    void set_read_timeout(std::chrono::milliseconds /*timeout*/) override {}
    void set_verify_ssl(bool /*verify*/) override {}

    Answer send(const HttpClientRequest& request) override {
        ResponseHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (cancelled_) {
                return tl::unexpected(HttpClientError::cancelled());
            }
            sent_.push_back(request);

            const auto fixed = fixed_.find(request.url);
            if (fixed != fixed_.end()) {
                return fixed->second;
            }
            if (queue_.empty() == false) {
                auto next = std::move(queue_.front());
                queue_.pop_front();
                return next;
            }
            handler = handler_;
        }

        // Outside the lock so a handler may inspect the mock
        if (handler) {
            return handler(request);
        }
        return tl::unexpected(HttpClientError::connection_failed("No response queued"));
    }

    void cancel() override {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }

    void reset() override {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = false;
    }

private:
    void push(Answer answer) {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(answer));
    }

    mutable std::mutex mutex_;
    std::map<std::string, HttpClientResponse> fixed_;
    std::deque<Answer> queue_;
    ResponseHandler handler_;
    std::vector<HttpClientRequest> sent_;
    HeaderMap default_headers_;
    bool cancelled_{false};
};

}  // namespace meshgate::testing

#endif  // MESHGATE_TESTS_MOCKS_MOCK_HTTP_CLIENT_HPP
