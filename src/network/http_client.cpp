// ============================================================================
// AURUM - HTTP Client Implementation
// ============================================================================
// Boost.Beast async request chain driven by a per-call io_context that is
// run for at most the request deadline
// ============================================================================

#include "aurum/network/http_client.hpp"

#include <utility>

#include <boost/asio.hpp>
#include <boost/beast.hpp>

namespace aurum::network {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

// ============================================================================
// Single Request Exchange
// ============================================================================

namespace {

struct Exchange {
    Exchange(net::io_context& ioc, const HttpClientConfig& config,
             std::chrono::milliseconds timeout)
        : config_(config), timeout_(timeout), resolver_(ioc), stream_(ioc) {}

    void start(const std::string& target, const std::string& body) {
        request_.version(11);
        request_.method(http::verb::post);
        request_.target(target);
        request_.set(http::field::host, config_.host);
        request_.set(http::field::user_agent, config_.user_agent);
        request_.set(http::field::content_type, "application/json");
        request_.body() = body;
        request_.prepare_payload();

        resolver_.async_resolve(
            config_.host,
            config_.port,
            [this](beast::error_code ec, tcp::resolver::results_type results) {
                on_resolve(ec, results);
            });
    }

    void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) {
            fail("resolve failed: " + ec.message());
            return;
        }

        stream_.expires_after(timeout_);
        stream_.async_connect(
            results,
            [this](beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
                on_connect(ec);
            });
    }

    void on_connect(beast::error_code ec) {
        if (ec) {
            fail("connect failed: " + ec.message());
            return;
        }

        stream_.expires_after(timeout_);
        http::async_write(
            stream_, request_,
            [this](beast::error_code ec, std::size_t) { on_write(ec); });
    }

    void on_write(beast::error_code ec) {
        if (ec) {
            fail("write failed: " + ec.message());
            return;
        }

        http::async_read(
            stream_, buffer_, http_response_,
            [this](beast::error_code ec, std::size_t) { on_read(ec); });
    }

    void on_read(beast::error_code ec) {
        if (ec) {
            fail("read failed: " + ec.message());
            return;
        }

        response_.status_code = static_cast<int>(http_response_.result_int());
        response_.body = http_response_.body();
        response_.received_at = now();
        for (const auto& header : http_response_) {
            response_.headers[std::string(header.name_string())] = std::string(header.value());
        }

        beast::error_code shutdown_ec;
        stream_.socket().shutdown(tcp::socket::shutdown_both, shutdown_ec);
        done_ = true;
    }

    void fail(const std::string& message) {
        response_.status_code = -1;
        response_.body = message;
        response_.timed_out = message.find("timed out") != std::string::npos;
        done_ = true;
    }

    void abandon() {
        resolver_.cancel();
        beast::error_code ec;
        stream_.socket().close(ec);
        response_.status_code = -1;
        response_.body = "request deadline exceeded";
        response_.timed_out = true;
    }

    const HttpClientConfig& config_;
    std::chrono::milliseconds timeout_;
    tcp::resolver resolver_;
    beast::tcp_stream stream_;
    http::request<http::string_body> request_;
    http::response<http::string_body> http_response_;
    beast::flat_buffer buffer_;
    HttpResponse response_;
    bool done_ = false;
};

}  // namespace

// ============================================================================
// HttpClient Public Interface
// ============================================================================

HttpClient::HttpClient(HttpClientConfig config) : config_(std::move(config)) {}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::post(const std::string& target,
                              const std::string& body,
                              std::chrono::milliseconds timeout) {
    net::io_context ioc(1);
    Exchange exchange(ioc, config_, timeout);
    exchange.start(target, body);

    // Resolution has no timer of its own, so the whole chain is bounded here
    ioc.run_for(timeout);

    if (!exchange.done_) {
        exchange.abandon();
        ioc.stop();
    }
    return exchange.response_;
}

}  // namespace aurum::network
