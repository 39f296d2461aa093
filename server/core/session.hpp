#pragma once

// Session - one client's walk through the connection states.
//
// Transport-agnostic: it only sees an IEndpoint. The owner calls update()
// once per tick; everything the client sent since the last call is handled
// in order, and keep-alives are driven from the tick counter.

#include "../../shared/io/byte_buffer.hpp"
#include "../../shared/io/schema.hpp"
#include "../../shared/protocol/registry.hpp"
#include "../../shared/transport/endpoint.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <string_view>

namespace server::core {

// Version-3 UUID of "OfflinePlayer:<name>", as assigned by offline-mode servers.
shared::io::Uuid offline_uuid(std::string_view name);

std::string format_uuid(const shared::io::Uuid& uuid);

class Session {
public:
    struct Settings {
        // Negative keeps the connection uncompressed.
        std::int32_t compressionThreshold{256};
        std::uint32_t keepAliveTicks{300};
        std::string motd{"A Lodestone server"};
        std::size_t maxPlayers{20};
    };

    struct Profile {
        std::string name;
        shared::io::Uuid uuid{};
    };

    Session(std::uint32_t id,
            std::shared_ptr<shared::transport::IEndpoint> endpoint,
            std::shared_ptr<const shared::proto::VersionedRegistrySet> registries,
            Settings settings);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    void update(std::uint64_t tick);

    // Sends a Disconnect when the current state has one, then closes the endpoint.
    void disconnect(const std::string& reason);

    std::uint32_t id() const { return id_; }
    shared::proto::ProtocolState state() const { return machine_.current(); }
    bool in_play() const { return state() == shared::proto::ProtocolState::Play; }
    bool is_closed() const { return !endpoint_->is_open(); }

    std::int32_t protocol_version() const { return protocolVersion_; }
    const shared::proto::VersionEntry* version() const { return entry_; }
    const std::optional<Profile>& profile() const { return profile_; }

    // Players reported by the status response.
    std::function<std::size_t()> onlinePlayers;

    // Fired once when the session reaches Play.
    std::function<void(Session&)> onPlay;

private:
    using Value = shared::io::Value;
    using PacketType = shared::proto::PacketType;

    void handle_(const shared::proto::RawPacket& packet);
    void handle_handshake_(const Value& v);
    void handle_status_(PacketType type, const Value& v);
    void handle_login_(PacketType type, const Value& v);
    void handle_configuration_(PacketType type, const Value& v);
    void handle_play_(PacketType type, const Value& v);
    void handle_keep_alive_(const Value& v);

    void enter_play_();
    void tick_keep_alive_();

    void send_(PacketType type, const Value& body);
    std::string status_json_() const;

    const shared::proto::VersionEntry& routing_() const;
    std::int32_t layout_version_() const;

    std::uint32_t id_;
    std::shared_ptr<shared::transport::IEndpoint> endpoint_;
    std::shared_ptr<const shared::proto::VersionedRegistrySet> registries_;
    Settings settings_;

    shared::proto::ProtocolStateMachine machine_{};
    std::int32_t protocolVersion_{0};
    const shared::proto::VersionEntry* entry_{nullptr};

    std::optional<Profile> profile_{};
    bool awaitingLoginAck_{false};
    bool awaitingConfigAck_{false};

    std::uint64_t tick_{0};
    std::uint64_t keepAliveDueTick_{0};
    std::optional<std::int64_t> pendingKeepAlive_{};
    std::mt19937_64 rng_;
};

} // namespace server::core
