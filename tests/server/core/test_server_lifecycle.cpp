/**
 * @file test_server_lifecycle.cpp
 * @brief DedicatedServer start/stop and real TCP clients joining and leaving.
 */

#include <catch2/catch_test_macros.hpp>

#include "core/dedicated_server.hpp"
#include "core/log.hpp"
#include "protocol/frame_codec.hpp"
#include "test_utils.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

using namespace server::core;
using namespace shared::proto;
using shared::io::Value;
using test_helpers::ClientView;

namespace {

ServerConfig test_config(const std::filesystem::path& world) {
    shared::core::LogConfig quiet;
    quiet.enabled = false;
    (void)shared::core::configure(quiet);

    ServerConfig cfg;
    cfg.network.bind = "127.0.0.1";
    cfg.network.port = 0;
    cfg.network.maxPlayers = 4;
    cfg.world.folder = world.string();
    cfg.server.tickRate = 100;
    cfg.logging = quiet;
    return cfg;
}

// Minimal blocking protocol client.
class Client {
public:
    explicit Client(std::uint16_t port) {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        REQUIRE(fd_ >= 0);

        timeval tv{};
        tv.tv_usec = 20 * 1000;
        ::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
        REQUIRE(::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
    }

    ~Client() { close(); }

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    void send(PacketType type, const Value& body) {
        const auto bytes = codec_.encode(test_helpers::make_packet(view, type, body));
        std::size_t off = 0;
        while (off < bytes.size()) {
            const ssize_t n = ::send(fd_, bytes.data() + off, bytes.size() - off, MSG_NOSIGNAL);
            REQUIRE(n > 0);
            off += static_cast<std::size_t>(n);
        }
    }

    std::optional<test_helpers::Received> receive(std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
        std::optional<test_helpers::Received> out;
        (void)test_helpers::wait_for([&]() {
            RawPacket p;
            if (codec_.next(p) == DecodeStatus::FrameReady) {
                out = test_helpers::decode_packet(view, p);
                return true;
            }
            std::uint8_t buf[4096];
            const ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
            if (n == 0) {
                hungUp_ = true;
                return true;
            }
            if (n > 0) codec_.feed(std::span<const std::uint8_t>(buf, static_cast<std::size_t>(n)));
            return false;
        }, timeout);
        return out;
    }

    bool hung_up() const { return hungUp_; }

    void set_compression(std::int32_t threshold) { codec_.set_compression(threshold); }

    void close() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

    ClientView view{};

private:
    int fd_{-1};
    bool hungUp_{false};
    FrameCodec codec_{};
};

void begin(Client& client, std::int32_t version, std::int32_t intent) {
    const auto registries = default_registries();
    client.view.entry = registries->find(version);
    REQUIRE(client.view.entry != nullptr);
    client.view.version = version;
    client.send(PacketType::Handshake, test_helpers::handshake_body(version, intent, "127.0.0.1"));
    client.view.state = intent == 1 ? ProtocolState::Status : ProtocolState::Login;
}

void login(Client& client, std::int32_t version, const std::string& name) {
    begin(client, version, 2);
    client.send(PacketType::LoginStart, test_helpers::login_start_body(version, name));

    auto packet = client.receive();
    REQUIRE(packet.has_value());
    REQUIRE(packet->type == PacketType::SetCompression);
    client.set_compression(static_cast<std::int32_t>(packet->body.field("threshold").as_int()));

    packet = client.receive();
    REQUIRE(packet.has_value());
    REQUIRE(packet->type == PacketType::LoginSuccess);
    REQUIRE(packet->body.field("username").as_string() == name);

    if (client.view.entry->has_configuration()) {
        client.send(PacketType::LoginAcknowledged, Value::record());
        client.view.state = ProtocolState::Configuration;

        packet = client.receive();
        REQUIRE(packet.has_value());
        REQUIRE(packet->type == PacketType::FinishConfiguration);
        client.send(PacketType::AckFinishConfiguration, Value::record());
    }
    client.view.state = ProtocolState::Play;
}

} // namespace

// =============================================================================
// Start / stop
// =============================================================================

TEST_CASE("DedicatedServer starts and stops cleanly", "[server][lifecycle]") {
    test_helpers::TempDirGuard world("lodestone_world");
    DedicatedServer server(test_config(world.path()));

    REQUIRE_FALSE(server.is_running());
    REQUIRE(server.start());
    REQUIRE(server.is_running());
    REQUIRE(server.port() != 0);

    SECTION("Ticks advance while running") {
        REQUIRE(test_helpers::wait_for([&]() { return server.server_tick() >= 3; }));
    }

    SECTION("A second start is refused") {
        REQUIRE_FALSE(server.start());
    }

    server.stop();
    REQUIRE_FALSE(server.is_running());

    // Stopping twice is harmless.
    server.stop();
}

TEST_CASE("DedicatedServer destructor stops a running server", "[server][lifecycle]") {
    test_helpers::TempDirGuard world("lodestone_world");
    {
        DedicatedServer server(test_config(world.path()));
        REQUIRE(server.start());
    }
    SUCCEED();
}

// =============================================================================
// Clients
// =============================================================================

TEST_CASE("Status ping over TCP", "[server][lifecycle][status]") {
    test_helpers::TempDirGuard world("lodestone_world");
    auto cfg = test_config(world.path());
    cfg.status.motd = "Lifecycle";
    DedicatedServer server(cfg);
    REQUIRE(server.start());

    Client client(server.port());
    begin(client, kProtocol_1_20_2, 1);
    client.send(PacketType::StatusRequest, Value::record());

    auto response = client.receive();
    REQUIRE(response.has_value());
    REQUIRE(response->type == PacketType::StatusResponse);
    REQUIRE(response->body.field("json").as_string().find("Lifecycle") != std::string::npos);

    Value ping = Value::record();
    ping.set("payload", Value::of_int(42));
    client.send(PacketType::PingRequest, ping);

    auto pong = client.receive();
    REQUIRE(pong.has_value());
    REQUIRE(pong->body.field("payload").as_int() == 42);

    // The server hangs up after the pong.
    REQUIRE_FALSE(client.receive().has_value());
    REQUIRE(client.hung_up());

    server.stop();
}

TEST_CASE("Players join and leave over TCP", "[server][lifecycle][login]") {
    test_helpers::TempDirGuard world("lodestone_world");
    DedicatedServer server(test_config(world.path()));

    std::mutex mu;
    std::vector<std::string> joined;
    std::vector<std::string> left;
    server.onPlayerJoin = [&](const Session::Profile& p) {
        std::lock_guard<std::mutex> lock(mu);
        joined.push_back(p.name);
    };
    server.onPlayerLeave = [&](const Session::Profile& p) {
        std::lock_guard<std::mutex> lock(mu);
        left.push_back(p.name);
    };

    REQUIRE(server.start());

    Client older(server.port());
    login(older, kProtocol_1_18_2, "Older");

    Client newer(server.port());
    login(newer, kProtocol_1_20_2, "Newer");

    REQUIRE(test_helpers::wait_for([&]() { return server.client_count() == 2; }));
    {
        std::lock_guard<std::mutex> lock(mu);
        REQUIRE(joined.size() == 2);
    }

    older.close();
    REQUIRE(test_helpers::wait_for([&]() { return server.client_count() == 1; }));
    {
        std::lock_guard<std::mutex> lock(mu);
        REQUIRE(left == std::vector<std::string>{"Older"});
    }

    server.stop();
    REQUIRE(server.client_count() == 0);

    // Stopping the server kicks the remaining player with a Disconnect.
    auto dc = newer.receive();
    REQUIRE(dc.has_value());
    REQUIRE(dc->type == PacketType::Disconnect);
}

TEST_CASE("An unsupported client is disconnected over TCP", "[server][lifecycle][login]") {
    test_helpers::TempDirGuard world("lodestone_world");
    DedicatedServer server(test_config(world.path()));
    REQUIRE(server.start());

    Client client(server.port());
    // Routes with the newest table, claims an unknown protocol number.
    client.view.entry = &default_registries()->newest();
    client.view.version = client.view.entry->range.min;
    client.send(PacketType::Handshake, test_helpers::handshake_body(2, 2));
    client.view.state = ProtocolState::Login;

    auto dc = client.receive();
    REQUIRE(dc.has_value());
    REQUIRE(dc->type == PacketType::Disconnect);
    REQUIRE(dc->body.field("reason").as_string().find("Unsupported protocol version") != std::string::npos);
    REQUIRE(server.client_count() == 0);

    server.stop();
}
