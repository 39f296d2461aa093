#pragma once

// DedicatedServer - accepts TCP clients and runs one Session per connection
// on a fixed-rate tick thread.

#include "config.hpp"
#include "session.hpp"

#include "../../shared/protocol/registry.hpp"
#include "../../shared/transport/tcp_server.hpp"
#include "../../shared/world/anvil_storage.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <unordered_map>

namespace server::core {

struct ClientState {
    std::shared_ptr<shared::transport::TcpConnection> connection;
    std::unique_ptr<Session> session;
    bool inPlay{false};
};

class DedicatedServer {
public:
    explicit DedicatedServer(const ServerConfig& config);
    ~DedicatedServer();

    DedicatedServer(const DedicatedServer&) = delete;
    DedicatedServer& operator=(const DedicatedServer&) = delete;

    bool start();

    void stop();

    bool is_running() const { return running_.load(); }

    // Bound port; differs from the configured one when that was 0.
    std::uint16_t port() const { return port_.load(); }

    std::uint64_t server_tick() const { return serverTick_.load(); }

    // Players that reached Play.
    std::size_t client_count() const { return playersInPlay_.load(); }

    const ServerConfig& config() const { return config_; }

    // Called on the tick thread.
    std::function<void(const Session::Profile&)> onPlayerJoin;
    std::function<void(const Session::Profile&)> onPlayerLeave;

private:
    void run_loop_();
    void tick_once_();

    void handle_client_connect_(std::shared_ptr<shared::transport::TcpConnection> conn);
    void handle_client_disconnect_(std::shared_ptr<shared::transport::TcpConnection> conn);
    void handle_player_join_(ClientState& client);

    ServerConfig config_;
    std::shared_ptr<const shared::proto::VersionedRegistrySet> registries_;
    shared::transport::TcpServer netServer_;
    shared::world::AnvilStorage storage_;

    std::atomic<bool> running_{false};
    std::thread thread_;

    std::uint32_t tickRate_{20};
    std::atomic<std::uint64_t> serverTick_{0};
    std::atomic<std::uint16_t> port_{0};
    std::atomic<std::size_t> playersInPlay_{0};

    std::unordered_map<std::uint32_t, ClientState> clients_;
};

} // namespace server::core
