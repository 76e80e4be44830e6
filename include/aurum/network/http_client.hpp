#pragma once
// ============================================================================
// AURUM - HTTP Client
// ============================================================================
// Minimal Boost.Beast HTTP/1.1 client used by the advisory predictor
// Every request carries its own deadline and never blocks past it
// ============================================================================

#include "aurum/core/types.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <string>

namespace aurum::network {

// ============================================================================
// HTTP Types
// ============================================================================

struct HttpResponse {
    int status_code = 0;  // -1 on transport failure, body holds the error
    std::map<std::string, std::string> headers;
    std::string body;
    Timestamp received_at{};
    bool timed_out = false;

    [[nodiscard]] bool is_success() const { return status_code >= 200 && status_code < 300; }
};

struct HttpClientConfig {
    std::string host = "127.0.0.1";
    std::string port = "8080";
    std::string user_agent = "Aurum/1.0";
};

// ============================================================================
// HTTP Client Interface
// ============================================================================

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    /// POST a JSON body; returns within `timeout`. Transport failures are
    /// reported through the response status, not thrown
    [[nodiscard]] virtual HttpResponse post(const std::string& target,
                                            const std::string& body,
                                            std::chrono::milliseconds timeout) = 0;
};

// ============================================================================
// HTTP Client Implementation
// ============================================================================

class HttpClient : public IHttpClient {
public:
    explicit HttpClient(HttpClientConfig config);
    ~HttpClient() override;

    // Non-copyable
    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    /// Safe to call from several threads; each call owns its io_context
    [[nodiscard]] HttpResponse post(const std::string& target,
                                    const std::string& body,
                                    std::chrono::milliseconds timeout) override;

    [[nodiscard]] const HttpClientConfig& config() const { return config_; }

private:
    HttpClientConfig config_;
};

}  // namespace aurum::network
