#pragma once

// Packet id routing.
//
// A PacketRegistry maps (PacketType, ProtocolState) <-> numeric id for one
// direction. Registries are grouped per protocol-version range into a
// VersionedRegistrySet, built once from declarative tables at startup and
// shared read-only by every connection.

#include "packets.hpp"
#include "state.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace shared::proto {

enum class Direction : std::uint8_t {
    Serverbound,
    Clientbound,
};

// Half-open [min, max).
struct VersionRange {
    std::int32_t min{0};
    std::int32_t max{0};

    bool contains(std::int32_t version) const { return version >= min && version < max; }
    bool overlaps(const VersionRange& o) const { return min < o.max && o.min < max; }
    bool empty() const { return max <= min; }
};

struct PacketRoute {
    PacketType type;
    ProtocolState state;
    Direction direction;
    std::int32_t id;
};

class PacketRegistry {
public:
    PacketRegistry();

    // Takes the routes matching `direction`. Throws std::invalid_argument when a
    // (type, state) or (state, id) key appears twice.
    PacketRegistry(const std::vector<PacketRoute>& routes, Direction direction);

    std::optional<std::int32_t> try_id_for(PacketType type, ProtocolState state) const;
    std::optional<PacketType> try_type_for(ProtocolState state, std::int32_t id) const;

    // Throw CodecError(UnregisteredPacket).
    std::int32_t id_for(PacketType type, ProtocolState state) const;
    PacketType type_for(ProtocolState state, std::int32_t id) const;

    bool contains(PacketType type, ProtocolState state) const { return try_id_for(type, state).has_value(); }

    Direction direction() const { return direction_; }
    std::size_t size() const { return byId_.size(); }

private:
    static constexpr std::int32_t kUnregistered = -1;

    static std::uint64_t key_(ProtocolState state, std::int32_t id) {
        return (static_cast<std::uint64_t>(state) << 32) | static_cast<std::uint32_t>(id);
    }

    Direction direction_{Direction::Serverbound};
    std::array<std::array<std::int32_t, kPacketTypeCount>, kProtocolStateCount> ids_{};
    std::unordered_map<std::uint64_t, PacketType> byId_{};
};

// The two registries one side of a connection needs.
struct RegistryPair {
    const PacketRegistry* inbound{nullptr};
    const PacketRegistry* outbound{nullptr};

    RegistryPair flip() const { return RegistryPair{outbound, inbound}; }
};

struct VersionTable {
    VersionRange range;
    std::string name;
    std::vector<PacketRoute> routes;
};

struct VersionEntry {
    VersionRange range;
    std::string name;
    PacketRegistry serverbound;
    PacketRegistry clientbound;

    RegistryPair server_side() const { return RegistryPair{&serverbound, &clientbound}; }
    RegistryPair client_side() const { return server_side().flip(); }

    bool has_configuration() const {
        return clientbound.contains(PacketType::FinishConfiguration, ProtocolState::Configuration);
    }
};

class VersionedRegistrySet {
public:
    // Throws std::invalid_argument on empty or overlapping ranges.
    explicit VersionedRegistrySet(std::vector<VersionTable> tables);

    VersionedRegistrySet(const VersionedRegistrySet&) = delete;
    VersionedRegistrySet& operator=(const VersionedRegistrySet&) = delete;

    // nullptr when no range holds the version.
    const VersionEntry* find(std::int32_t version) const;

    // Entry with the highest range; used to answer status pings from unknown versions.
    const VersionEntry& newest() const { return entries_.back(); }

    const std::vector<VersionEntry>& entries() const { return entries_; }

private:
    std::vector<VersionEntry> entries_;
};

// 1.18.1-1.18.2 (757-758) and 1.20.2 (764).
std::shared_ptr<const VersionedRegistrySet> default_registries();

} // namespace shared::proto
