#include "dedicated_server.hpp"

#include "../../shared/core/log.hpp"

#include <chrono>

namespace server::core {

using shared::core::logf;

DedicatedServer::DedicatedServer(const ServerConfig& config)
    : config_(config),
      registries_(shared::proto::default_registries()),
      storage_(config.world.folder),
      tickRate_(config.server.tickRate == 0 ? 20 : config.server.tickRate) {

    std::string versions;
    for (const auto& e : registries_->entries()) {
        if (!versions.empty()) versions += ", ";
        versions += e.name + " [" + std::to_string(e.range.min) + ".." + std::to_string(e.range.max - 1) + "]";
    }

    logf(0, "init", "tickRate=%u maxPlayers=%zu threshold=%d world=%s", tickRate_, config_.network.maxPlayers,
         config_.network.compressionThreshold, config_.world.folder.c_str());
    logf(0, "init", "protocols: %s", versions.c_str());
}

DedicatedServer::~DedicatedServer() {
    stop();
}

bool DedicatedServer::start() {
    if (running_.load()) return false;

    netServer_.onConnect = [this](auto conn) {
        handle_client_connect_(conn);
    };
    netServer_.onDisconnect = [this](auto conn) {
        handle_client_disconnect_(conn);
    };

    if (!netServer_.start(config_.network.bind, config_.network.port, config_.network.maxPlayers)) {
        logf(0, "init", "ERROR: failed to bind %s:%u", config_.network.bind.c_str(), config_.network.port);
        return false;
    }

    port_.store(netServer_.port());
    running_.store(true);
    thread_ = std::thread([this]() { run_loop_(); });
    return true;
}

void DedicatedServer::stop() {
    if (!running_.exchange(false)) return;

    if (thread_.joinable()) {
        thread_.join();
    }

    for (auto& [id, client] : clients_) {
        (void)id;
        if (client.session) {
            client.session->disconnect("Server closed");
        }
    }
    netServer_.stop();
    clients_.clear();
    storage_.unload_all();
    playersInPlay_.store(0);
    logf(serverTick_.load(), "init", "server stopped");
}

void DedicatedServer::run_loop_() {
    using clock = std::chrono::steady_clock;
    const auto tickDuration = std::chrono::duration<double>(1.0 / static_cast<double>(tickRate_));
    auto nextTick = clock::now();

    while (running_.load()) {
        nextTick += std::chrono::duration_cast<clock::duration>(tickDuration);
        tick_once_();
        std::this_thread::sleep_until(nextTick);
    }
}

void DedicatedServer::tick_once_() {
    const std::uint64_t tick = ++serverTick_;

    // Connects and disconnects arrive through the callbacks.
    netServer_.poll(0);

    for (auto& [id, client] : clients_) {
        (void)id;
        client.session->update(tick);
        if (!client.inPlay && client.session->in_play() && !client.session->is_closed()) {
            handle_player_join_(client);
        }
    }

    netServer_.flush_all();
}

void DedicatedServer::handle_client_connect_(std::shared_ptr<shared::transport::TcpConnection> conn) {
    Session::Settings settings;
    settings.compressionThreshold = config_.network.compressionThreshold;
    settings.keepAliveTicks = config_.server.keepAliveTicks;
    settings.motd = config_.status.motd;
    settings.maxPlayers = config_.network.maxPlayers;

    ClientState client;
    client.connection = conn;
    client.session = std::make_unique<Session>(conn->id(), conn, registries_, settings);
    client.session->onlinePlayers = [this]() { return playersInPlay_.load(); };

    clients_[conn->id()] = std::move(client);
    logf(serverTick_.load(), "init", "client #%u connected from %s", conn->id(), conn->peer_name().c_str());
}

void DedicatedServer::handle_client_disconnect_(std::shared_ptr<shared::transport::TcpConnection> conn) {
    auto it = clients_.find(conn->id());
    if (it == clients_.end()) return;

    const bool wasInPlay = it->second.inPlay;
    std::optional<Session::Profile> profile = it->second.session->profile();
    clients_.erase(it);

    logf(serverTick_.load(), "init", "client #%u disconnected (%s)", conn->id(), conn->close_reason().c_str());

    if (wasInPlay) {
        playersInPlay_.fetch_sub(1);
        if (onPlayerLeave && profile) {
            onPlayerLeave(*profile);
        }
    }
}

void DedicatedServer::handle_player_join_(ClientState& client) {
    client.inPlay = true;
    playersInPlay_.fetch_add(1);

    const auto& profile = *client.session->profile();

    std::optional<std::uint32_t> written;
    shared::world::StorageError err;
    if (storage_.chunk_last_written(shared::world::ChunkPos{0, 0}, &written, &err)) {
        logf(serverTick_.load(), "world", "spawn chunk for %s: %s", profile.name.c_str(),
             written ? "stored" : "not generated");
    } else {
        logf(serverTick_.load(), "world", "spawn chunk lookup failed: %s (%s)", err.message.c_str(),
             shared::world::to_string(err.kind));
    }

    if (onPlayerJoin) {
        onPlayerJoin(profile);
    }
}

} // namespace server::core
