#ifndef BEAST_TRANSPORT_H
#define BEAST_TRANSPORT_H

// =============================================================================
// FileBridge Hub: Boost.Beast Transport
// =============================================================================
// One accepted socket (plain or TLS) carries either a single HTTP exchange
// or, after an upgrade on ws_path, one bridge session for its lifetime.
//
// Every socket is created on its own strand of the shared io_context. All
// stream operations are started on that strand and the owning pool thread
// blocks until they complete, so a session reading on one thread and a
// broadcast writing from another never touch the stream at the same time.
// Pre-upgrade reads and writes carry an idle deadline (handshake_timeout_s).
// =============================================================================

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include "hub_common.h"
#include "hub_config.h"
#include "connection_registry.h"
#include "http_files.h"
#include "bridge_hub.h"

namespace beast     = boost::beast;
namespace http      = beast::http;
namespace websocket = beast::websocket;
namespace net       = boost::asio;
using tcp           = net::ip::tcp;

// Multipart framing on top of the raw upload limit
constexpr uint64_t HTTP_BODY_SLACK   = 64 * 1024;
constexpr size_t   HTTP_HEADER_LIMIT = 16 * 1024;

inline std::chrono::steady_clock::duration to_steady(double seconds) {
    return std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(seconds));
}

// -----------------------------------------------------------------------------
// Starts an async operation on `ex` and blocks until its handler runs.
// `start` receives the completion handler. Must not be called from an
// io_context thread. If the io_context drops the operation without running
// it, the broken promise surfaces as std::future_error.
// -----------------------------------------------------------------------------
template <class Executor, class Start>
beast::error_code run_on_strand(const Executor& ex, Start start) {
    auto done = std::make_shared<std::promise<beast::error_code>>();
    std::future<beast::error_code> result = done->get_future();
    net::post(ex, [start = std::move(start), done]() mutable {
        start([done](beast::error_code ec, std::size_t = 0) { done->set_value(ec); });
    });
    return result.get();
}

// =============================================================================
// WEBSOCKET PEER CHANNEL
// =============================================================================
// NextLayer is beast::tcp_stream or beast::ssl_stream<beast::tcp_stream>.
// =============================================================================
template <class NextLayer>
class BeastPeerChannel : public PeerChannel,
                         public std::enable_shared_from_this<BeastPeerChannel<NextLayer>> {
public:
    BeastPeerChannel(NextLayer&& next, size_t max_message, double handshake_timeout, AsyncLogger* logger)
        : ws_(std::move(next)), logger_(logger)
    {
        websocket::stream_base::timeout opt{};
        opt.handshake_timeout = to_steady(handshake_timeout);
        opt.idle_timeout      = websocket::stream_base::none();
        opt.keep_alive_pings  = false;
        ws_.set_option(opt);

        ws_.read_message_max(max_message);
        ws_.auto_fragment(false);
        ws_.text(true);
        ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
            res.set(http::field::server, std::string("filebridge-hub/") + HUB_VERSION);
        }));
    }

    bool accept(const http::request<http::string_body>& req, std::string& err) {
        beast::error_code ec = run_on_strand(ws_.get_executor(), [this, &req](auto done) {
            // The websocket layer keeps its own timers from here on
            beast::get_lowest_layer(ws_).expires_never();
            ws_.async_accept(req, std::move(done));
        });
        if (ec) { err = ec.message(); return false; }
        return true;
    }

    bool read_frame(std::string& out) override {
        beast::flat_buffer buffer;
        beast::error_code ec = run_on_strand(ws_.get_executor(), [this, &buffer](auto done) {
            ws_.async_read(buffer, std::move(done));
        });
        if (ec) {
            if (ec != websocket::error::closed && !closed_.load())
                hub_log(logger_, AsyncLogger::DEBUG, "WebSocket read ended: " + ec.message());
            return false;
        }
        out = beast::buffers_to_string(buffer.data());
        return true;
    }

    // Beast allows one outstanding write; write_mutex_ queues the callers
    bool write_frame(const std::string& text) override {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (closed_.load()) return false;
        beast::error_code ec = run_on_strand(ws_.get_executor(), [this, &text](auto done) {
            ws_.async_write(net::buffer(text), std::move(done));
        });
        if (ec) {
            hub_log(logger_, AsyncLogger::DEBUG, "WebSocket write failed: " + ec.message());
            return false;
        }
        return true;
    }

    // Runs the shutdown on the strand; the pending read then completes with
    // an error and wakes the session thread
    void close() override {
        if (closed_.exchange(true)) return;
        auto self = this->shared_from_this();
        net::post(ws_.get_executor(), [self] {
            auto& lowest = beast::get_lowest_layer(self->ws_);
            beast::error_code ec;
            lowest.socket().shutdown(tcp::socket::shutdown_both, ec);
            if (ec && ec != net::error::not_connected)
                hub_log(self->logger_, AsyncLogger::DEBUG, "Socket shutdown: " + ec.message());
            lowest.cancel();
        });
    }

    bool is_closed() const override { return closed_.load(); }

private:
    websocket::stream<NextLayer> ws_;
    AsyncLogger*                 logger_;
    std::mutex                   write_mutex_;
    std::atomic<bool>            closed_{ false };
};

// =============================================================================
// CONNECTION DISPATCH
// =============================================================================
inline std::string sv_str(beast::string_view sv) { return std::string(sv.data(), sv.size()); }

inline std::string to_lower_ascii(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

template <class Stream>
void write_http_response(Stream& stream, const HttpResponse& resp, unsigned version,
                         std::chrono::steady_clock::duration deadline, AsyncLogger* logger) {
    http::response<http::string_body> res{ static_cast<http::status>(resp.status), version };
    res.set(http::field::server, std::string("filebridge-hub/") + HUB_VERSION);
    res.set(http::field::content_type, resp.content_type);
    for (const auto& h : resp.headers) res.set(h.first, h.second);
    res.keep_alive(false);
    res.body() = resp.body;
    res.prepare_payload();

    beast::error_code ec = run_on_strand(stream.get_executor(), [&stream, &res, deadline](auto done) {
        beast::get_lowest_layer(stream).expires_after(deadline);
        http::async_write(stream, res, std::move(done));
    });
    if (ec) hub_log(logger, AsyncLogger::DEBUG, "HTTP write failed: " + ec.message());
}

// -----------------------------------------------------------------------------
// Reads one request head and routes it. Takes ownership of the stream.
// A peer that stays silent for handshake_timeout_s at any point before the
// upgrade (or while sending an HTTP body) is disconnected.
// -----------------------------------------------------------------------------
template <class Stream>
void serve_connection(Stream stream, BridgeHub& hub, AsyncLogger* logger) {
    const HubConfig& cfg = hub.config();
    const auto idle = to_steady(cfg.handshake_timeout_s);
    auto& lowest = beast::get_lowest_layer(stream);
    auto ex = stream.get_executor();

    beast::flat_buffer buffer;
    http::request_parser<http::string_body> parser;
    parser.header_limit(static_cast<std::uint32_t>(HTTP_HEADER_LIMIT));
    parser.body_limit(cfg.upload_max_bytes() + HTTP_BODY_SLACK);

    beast::error_code ec = run_on_strand(ex, [&](auto done) {
        lowest.expires_after(idle);
        http::async_read_header(stream, buffer, parser, std::move(done));
    });
    if (ec) {
        hub_log(logger, ec == beast::error::timeout ? AsyncLogger::WARN : AsyncLogger::DEBUG,
                "HTTP header read failed: " + ec.message());
        return;
    }

    const auto& head = parser.get();
    unsigned version = head.version();
    std::string target = sv_str(head.target());
    std::string path = target.substr(0, target.find('?'));

    if (websocket::is_upgrade(head)) {
        if (path != cfg.ws_path) {
            write_http_response(stream, HttpResponse::error(404, "not found"), version, idle, logger);
            return;
        }
        http::request<http::string_body> req = parser.release();
        auto channel = std::make_shared<BeastPeerChannel<Stream>>(
            std::move(stream), cfg.ws_max_size, cfg.handshake_timeout_s, logger);
        std::string err;
        if (!channel->accept(req, err)) {
            hub_log(logger, AsyncLogger::WARN, "WebSocket upgrade failed: " + err);
            return;
        }
        hub.serve_peer(channel);
        return;
    }

    if (to_lower_ascii(sv_str(head[http::field::expect])) == "100-continue") {
        http::response<http::empty_body> cont{ http::status::continue_, version };
        ec = run_on_strand(ex, [&](auto done) {
            lowest.expires_after(idle);
            http::async_write(stream, cont, std::move(done));
        });
        if (ec) return;
    }

    HttpRequest req;
    req.method = sv_str(head.method_string());
    req.target = target;
    for (const auto& field : head)
        req.headers[to_lower_ascii(sv_str(field.name_string()))] = sv_str(field.value());

    // The deadline is re-armed per read, so it bounds silence, not transfer time
    while (!parser.is_done()) {
        ec = run_on_strand(ex, [&](auto done) {
            lowest.expires_after(idle);
            http::async_read_some(stream, buffer, parser, std::move(done));
        });
        if (ec) break;
    }
    if (ec == http::error::body_limit) {
        req.body_too_large = true;
    } else if (ec) {
        hub_log(logger, ec == beast::error::timeout ? AsyncLogger::WARN : AsyncLogger::DEBUG,
                "HTTP body read failed: " + ec.message());
        return;
    } else {
        req.body = std::move(parser.get().body());
    }

    HttpResponse resp = hub.handle_http(req);
    hub_log(logger, AsyncLogger::DEBUG, req.method + " " + path + " -> " + std::to_string(resp.status));
    write_http_response(stream, resp, version, idle, logger);

    ec = run_on_strand(ex, [&](auto done) {
        beast::error_code shut;
        lowest.expires_never();
        lowest.socket().shutdown(tcp::socket::shutdown_send, shut);
        done(shut);
    });
    if (ec) hub_log(logger, AsyncLogger::DEBUG, "Socket shutdown: " + ec.message());
}

#endif
