#include "beast_transport.h"
#include "test_support.h"

#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using testing_support::ManualClock;
using testing_support::make_temp_dir;
using testing_support::parse_frame;
using testing_support::signed_frame;

namespace {

const std::string kToken = "bridge-secret";

bool wait_until(const std::function<bool()>& pred, double timeout_sec = 5.0) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::duration<double>(timeout_sec);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

// Server side runs on its own io thread with one strand per socket, the way
// the hub executable accepts. The client side uses plain blocking sockets.
struct Loopback {
    net::io_context server_ioc;
    net::executor_work_guard<net::io_context::executor_type> work;
    tcp::acceptor acceptor;
    net::io_context client_ioc;
    std::thread io;

    Loopback()
        : work(net::make_work_guard(server_ioc)),
          acceptor(server_ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0)) {
        io = std::thread([this] { server_ioc.run(); });
    }

    ~Loopback() {
        work.reset();
        server_ioc.stop();
        io.join();
    }

    tcp::socket connect(tcp::socket& client) {
        client.connect(acceptor.local_endpoint());
        tcp::socket server(net::make_strand(server_ioc));
        acceptor.accept(server);
        return server;
    }
};

// One pool-worker stand-in running serve_connection
struct ServerTask {
    std::atomic<bool> done{ false };
    std::thread thread;

    ServerTask(tcp::socket sock, BridgeHub& hub) {
        auto shared = std::make_shared<tcp::socket>(std::move(sock));
        thread = std::thread([this, shared, &hub] {
            serve_connection(beast::tcp_stream(std::move(*shared)), hub, nullptr);
            done = true;
        });
    }

    ~ServerTask() {
        if (thread.joinable()) thread.join();
    }

    bool finished_within(double sec) {
        return wait_until([this] { return done.load(); }, sec);
    }
};

struct HubFixture {
    std::filesystem::path dir = make_temp_dir("transport");
    ManualClock clock;
    HubConfig   cfg;
    std::unique_ptr<BridgeHub> hub;

    HubFixture() {
        cfg.token = kToken;
        cfg.upload_dir = (dir / "files").string();
        cfg.handshake_timeout_s = 0.5;
        cfg.heartbeat_interval_s = 60;
        hub = std::make_unique<BridgeHub>(cfg, SessionHandlers{}, &clock, nullptr);
        std::string err;
        bool ok = hub->init(err);
        assert(ok);
        (void)ok;
    }

    ~HubFixture() {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }
};

// The server side must be gone: the next client read sees EOF or a reset
void expect_peer_gone(tcp::socket& client) {
    char byte;
    beast::error_code ec;
    client.read_some(net::buffer(&byte, 1), ec);
    assert(ec);
}

void test_silent_client_is_released() {
    HubFixture f;
    Loopback lo;
    tcp::socket client(lo.client_ioc);
    ServerTask task(lo.connect(client), *f.hub);

    assert(task.finished_within(5.0));
    expect_peer_gone(client);
}

void test_partial_header_is_released() {
    HubFixture f;
    Loopback lo;
    tcp::socket client(lo.client_ioc);
    ServerTask task(lo.connect(client), *f.hub);

    net::write(client, net::buffer(std::string("GET /v1/files/list HTTP/1.1\r\nHost: hub\r\n")));
    assert(task.finished_within(5.0));
    expect_peer_gone(client);
}

// A stalled upload body frees the worker and registers nothing
void test_stalled_body_is_released() {
    HubFixture f;
    Loopback lo;
    tcp::socket client(lo.client_ioc);
    ServerTask task(lo.connect(client), *f.hub);

    std::string head = "POST /v1/files/upload?token=" + kToken + " HTTP/1.1\r\n"
                       "Host: hub\r\n"
                       "Content-Type: application/octet-stream\r\n"
                       "Content-Length: 100\r\n\r\n";
    net::write(client, net::buffer(head + "0123456789"));

    assert(task.finished_within(5.0));
    expect_peer_gone(client);
    assert(f.hub->files().size() == 0);
}

void test_list_over_http() {
    HubFixture f;
    Loopback lo;
    tcp::socket client(lo.client_ioc);
    ServerTask task(lo.connect(client), *f.hub);

    http::request<http::empty_body> req{ http::verb::get, "/v1/files/list?token=" + kToken, 11 };
    req.set(http::field::host, "hub");
    http::write(client, req);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(client, buffer, res);
    assert(res.result_int() == 200);
    json body = json::parse(res.body());
    assert(body["files"].is_array());
    assert(body["files"].empty());
    assert(task.finished_within(5.0));
}

using ClientWs = websocket::stream<tcp::socket>;

std::string read_text(ClientWs& ws) {
    beast::flat_buffer buffer;
    ws.read(buffer);
    return beast::buffers_to_string(buffer.data());
}

void greet(ClientWs& ws, BridgeHub& hub, const std::string& server_id) {
    ws.handshake("127.0.0.1", hub.config().ws_path);
    ws.text(true);
    ws.write(net::buffer(signed_frame(MsgType::MSG_HELLO, server_id, kToken, json{ { "token", kToken } })));
    BridgePacket ack = parse_frame(read_text(ws));
    assert(ack.type == MsgType::MSG_HELLO_ACK);
    bool ready = wait_until([&] {
        auto conn = hub.connections().get(server_id);
        return conn && conn->authenticated();
    });
    assert(ready);
    (void)ready;
}

// Broadcasts from another thread land while the session thread is parked
// in a read on the same socket
void test_session_reads_while_broadcasts_write() {
    HubFixture f;
    Loopback lo;
    ClientWs ws(lo.client_ioc);
    ServerTask task(lo.connect(ws.next_layer()), *f.hub);

    greet(ws, *f.hub, "srv-live");

    const int pushes = 20;
    std::atomic<int> reached{ 0 };
    std::thread pusher([&] {
        for (int i = 0; i < pushes; i++)
            reached += static_cast<int>(f.hub->push_file("", "map_" + std::to_string(i) + ".vpk"));
    });
    for (int i = 0; i < pushes; i++) {
        BridgePacket notice = parse_frame(read_text(ws));
        assert(notice.type == MsgType::MSG_FILE_IN_NOTICE);
        assert(notice.verify_sig(kToken));
    }
    pusher.join();
    assert(reached == pushes);

    ws.write(net::buffer(signed_frame(MsgType::MSG_PING, "srv-live", kToken)));
    BridgePacket pong = parse_frame(read_text(ws));
    assert(pong.type == MsgType::MSG_PONG);

    ws.close(websocket::close_code::normal);
    assert(task.finished_within(5.0));
    assert(f.hub->connection_count() == 0);
}

void test_close_all_wakes_blocked_session() {
    HubFixture f;
    Loopback lo;
    ClientWs ws(lo.client_ioc);
    ServerTask task(lo.connect(ws.next_layer()), *f.hub);

    greet(ws, *f.hub, "srv-idle");
    assert(f.hub->connection_count() == 1);

    f.hub->close_all();
    assert(task.finished_within(5.0));
    assert(f.hub->connection_count() == 0);
}

}  // namespace

int main() {
    test_silent_client_is_released();
    test_partial_header_is_released();
    test_stalled_body_is_released();
    test_list_over_http();
    test_session_reads_while_broadcasts_write();
    test_close_all_wakes_blocked_session();
    return 0;
}
