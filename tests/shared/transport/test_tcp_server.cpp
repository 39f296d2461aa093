/**
 * @file test_tcp_server.cpp
 * @brief Loopback tests for TcpServer and TcpConnection.
 */

#include <catch2/catch_test_macros.hpp>

#include "core/log.hpp"
#include "protocol/frame_codec.hpp"
#include "transport/tcp_server.hpp"
#include "test_utils.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <chrono>
#include <memory>
#include <vector>

using namespace shared::transport;
using namespace shared::proto;

namespace {

void quiet_logs() {
    shared::core::LogConfig cfg;
    cfg.enabled = false;
    (void)shared::core::configure(cfg);
}

// Blocking loopback client with a short receive timeout.
class TestClient {
public:
    explicit TestClient(std::uint16_t port) {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        REQUIRE(fd_ >= 0);

        timeval tv{};
        tv.tv_usec = 50 * 1000;
        ::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
        REQUIRE(::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
    }

    ~TestClient() {
        if (fd_ >= 0) ::close(fd_);
    }

    TestClient(const TestClient&) = delete;
    TestClient& operator=(const TestClient&) = delete;

    void send_bytes(const std::vector<std::uint8_t>& bytes) {
        std::size_t off = 0;
        while (off < bytes.size()) {
            const ssize_t n = ::send(fd_, bytes.data() + off, bytes.size() - off, MSG_NOSIGNAL);
            REQUIRE(n > 0);
            off += static_cast<std::size_t>(n);
        }
    }

    void send_packet(const RawPacket& p) {
        send_bytes(encoder_.encode(p));
    }

    // Reads whatever arrived within the timeout. Returns false once the server hung up.
    bool pump() {
        std::uint8_t buf[4096];
        const ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
        if (n == 0) return false;
        if (n > 0) decoder_.feed(std::span<const std::uint8_t>(buf, static_cast<std::size_t>(n)));
        return true;
    }

    bool next(RawPacket& out) {
        return decoder_.next(out) == DecodeStatus::FrameReady;
    }

    void close() {
        ::close(fd_);
        fd_ = -1;
    }

private:
    int fd_{-1};
    FrameEncoder encoder_;
    FrameDecoder decoder_;
};

RawPacket packet(std::int32_t id, std::vector<std::uint8_t> body = {}) {
    RawPacket p;
    p.id = id;
    p.body = std::move(body);
    return p;
}

} // namespace

TEST_CASE("TcpServer binds an ephemeral port", "[transport][tcp]") {
    quiet_logs();
    TcpServer server;
    REQUIRE(server.start("127.0.0.1", 0, 4));
    REQUIRE(server.is_running());
    REQUIRE(server.port() != 0);

    // Already running.
    REQUIRE_FALSE(server.start("127.0.0.1", 0, 4));

    server.stop();
    REQUIRE_FALSE(server.is_running());
}

TEST_CASE("TcpServer rejects a bad bind address", "[transport][tcp]") {
    quiet_logs();
    TcpServer server;
    REQUIRE_FALSE(server.start("not-an-ip", 0, 4));
    REQUIRE_FALSE(server.is_running());
}

TEST_CASE("Packets flow both ways over loopback", "[transport][tcp]") {
    quiet_logs();
    TcpServer server;
    REQUIRE(server.start("127.0.0.1", 0, 4));

    std::shared_ptr<TcpConnection> accepted;
    server.onConnect = [&](std::shared_ptr<TcpConnection> c) { accepted = c; };

    TestClient client(server.port());
    REQUIRE(test_helpers::wait_for([&]() {
        server.poll(5);
        return accepted != nullptr;
    }));
    REQUIRE(server.connections().size() == 1);
    REQUIRE(accepted->id() == 1);
    REQUIRE(accepted->peer_name().rfind("127.0.0.1:", 0) == 0);

    client.send_packet(packet(0x00, {1, 2, 3}));

    RawPacket got;
    REQUIRE(test_helpers::wait_for([&]() {
        server.poll(5);
        return accepted->try_recv(got);
    }));
    REQUIRE(got == packet(0x00, {1, 2, 3}));
    REQUIRE(accepted->bytes_received() == 5);

    accepted->send(packet(0x01, std::vector<std::uint8_t>(20000, 0xEE)));
    REQUIRE(accepted->wants_write());
    server.flush_all();

    RawPacket reply;
    REQUIRE(test_helpers::wait_for([&]() {
        server.poll(0);
        client.pump();
        return client.next(reply);
    }));
    REQUIRE(reply.id == 0x01);
    REQUIRE(reply.body.size() == 20000);

    server.stop();
}

TEST_CASE("A full server turns new clients away", "[transport][tcp]") {
    quiet_logs();
    TcpServer server;
    REQUIRE(server.start("127.0.0.1", 0, 1));

    TestClient first(server.port());
    REQUIRE(test_helpers::wait_for([&]() {
        server.poll(5);
        return server.connections().size() == 1;
    }));

    TestClient second(server.port());
    // The second socket is accepted and closed right away.
    REQUIRE(test_helpers::wait_for([&]() {
        server.poll(5);
        return !second.pump();
    }));
    REQUIRE(server.connections().size() == 1);

    server.stop();
}

TEST_CASE("A malformed stream closes only that connection", "[transport][tcp]") {
    quiet_logs();
    TcpServer server;
    REQUIRE(server.start("127.0.0.1", 0, 4));

    std::vector<std::shared_ptr<TcpConnection>> gone;
    server.onDisconnect = [&](std::shared_ptr<TcpConnection> c) { gone.push_back(c); };

    TestClient bad(server.port());
    TestClient good(server.port());
    REQUIRE(test_helpers::wait_for([&]() {
        server.poll(5);
        return server.connections().size() == 2;
    }));

    // Frame length zero.
    bad.send_bytes({0x00});
    good.send_packet(packet(0x02));

    REQUIRE(test_helpers::wait_for([&]() {
        server.poll(5);
        RawPacket p;
        for (const auto& c : server.connections()) {
            (void)c->try_recv(p);
        }
        server.flush_all();
        return gone.size() == 1;
    }));

    REQUIRE(gone.front()->close_reason() == "malformed stream: invalid encoding");
    REQUIRE(server.connections().size() == 1);

    server.stop();
    REQUIRE(gone.size() == 2);
}

TEST_CASE("A peer hang-up is reaped", "[transport][tcp]") {
    quiet_logs();
    TcpServer server;
    REQUIRE(server.start("127.0.0.1", 0, 4));

    bool disconnected = false;
    server.onDisconnect = [&](std::shared_ptr<TcpConnection> c) {
        disconnected = true;
        REQUIRE(c->close_reason() == "peer closed");
    };

    TestClient client(server.port());
    REQUIRE(test_helpers::wait_for([&]() {
        server.poll(5);
        return server.connections().size() == 1;
    }));

    client.close();
    REQUIRE(test_helpers::wait_for([&]() {
        server.poll(5);
        return disconnected;
    }));
    REQUIRE(server.connections().empty());
}

TEST_CASE("Connections drain queued output before closing", "[transport][tcp]") {
    quiet_logs();
    TcpServer server;
    REQUIRE(server.start("127.0.0.1", 0, 4));

    TestClient client(server.port());
    REQUIRE(test_helpers::wait_for([&]() {
        server.poll(5);
        return server.connections().size() == 1;
    }));

    auto conn = server.connections().front();
    conn->send(packet(0x00, {0x42}));
    conn->close("bye");
    REQUIRE(conn->state() == TcpConnection::State::Closing);

    // Sends after close are dropped.
    conn->send(packet(0x01));

    server.flush_all();
    REQUIRE(server.connections().empty());

    RawPacket p;
    REQUIRE(test_helpers::wait_for([&]() {
        client.pump();
        return client.next(p);
    }));
    REQUIRE(p == packet(0x00, {0x42}));

    RawPacket extra;
    REQUIRE(test_helpers::wait_for([&]() { return !client.pump(); }));
    REQUIRE_FALSE(client.next(extra));
}
