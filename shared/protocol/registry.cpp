#include "registry.hpp"

#include "../io/codec_error.hpp"

#include <algorithm>
#include <stdexcept>

namespace shared::proto {

using shared::io::CodecError;
using shared::io::ErrorKind;

// =============================================================================
// PacketRegistry
// =============================================================================

PacketRegistry::PacketRegistry() {
    for (auto& row : ids_) {
        row.fill(kUnregistered);
    }
}

PacketRegistry::PacketRegistry(const std::vector<PacketRoute>& routes, Direction direction)
    : PacketRegistry() {
    direction_ = direction;

    for (const auto& r : routes) {
        if (r.direction != direction) continue;

        const auto s = static_cast<std::size_t>(r.state);
        const auto t = static_cast<std::size_t>(r.type);
        if (s >= kProtocolStateCount || t >= kPacketTypeCount) {
            throw std::invalid_argument("packet route out of range");
        }
        if (r.id < 0) {
            throw std::invalid_argument(std::string("negative id for ") + to_string(r.type));
        }
        if (ids_[s][t] != kUnregistered) {
            throw std::invalid_argument(std::string("duplicate route for ") + to_string(r.type) +
                                        " in " + to_string(r.state));
        }
        if (!byId_.emplace(key_(r.state, r.id), r.type).second) {
            throw std::invalid_argument("duplicate id " + std::to_string(r.id) + " in " + to_string(r.state));
        }
        ids_[s][t] = r.id;
    }
}

std::optional<std::int32_t> PacketRegistry::try_id_for(PacketType type, ProtocolState state) const {
    const auto s = static_cast<std::size_t>(state);
    const auto t = static_cast<std::size_t>(type);
    if (s >= kProtocolStateCount || t >= kPacketTypeCount) return std::nullopt;
    const std::int32_t id = ids_[s][t];
    if (id == kUnregistered) return std::nullopt;
    return id;
}

std::optional<PacketType> PacketRegistry::try_type_for(ProtocolState state, std::int32_t id) const {
    auto it = byId_.find(key_(state, id));
    if (it == byId_.end()) return std::nullopt;
    return it->second;
}

std::int32_t PacketRegistry::id_for(PacketType type, ProtocolState state) const {
    if (auto id = try_id_for(type, state)) {
        return *id;
    }
    throw CodecError(ErrorKind::UnregisteredPacket,
                     std::string(to_string(type)) + " is not registered in state " + to_string(state));
}

PacketType PacketRegistry::type_for(ProtocolState state, std::int32_t id) const {
    if (auto type = try_type_for(state, id)) {
        return *type;
    }
    throw CodecError(ErrorKind::UnregisteredPacket,
                     "packet id " + std::to_string(id) + " is not registered in state " + to_string(state), id);
}

// =============================================================================
// VersionedRegistrySet
// =============================================================================

VersionedRegistrySet::VersionedRegistrySet(std::vector<VersionTable> tables) {
    if (tables.empty()) {
        throw std::invalid_argument("registry set needs at least one version table");
    }

    std::sort(tables.begin(), tables.end(), [](const VersionTable& a, const VersionTable& b) {
        return a.range.min < b.range.min;
    });

    for (std::size_t i = 0; i < tables.size(); ++i) {
        if (tables[i].range.empty()) {
            throw std::invalid_argument("empty version range for " + tables[i].name);
        }
        if (i > 0 && tables[i - 1].range.overlaps(tables[i].range)) {
            throw std::invalid_argument("version range of " + tables[i].name + " overlaps " + tables[i - 1].name);
        }
    }

    entries_.reserve(tables.size());
    for (auto& t : tables) {
        entries_.push_back(VersionEntry{
            t.range,
            std::move(t.name),
            PacketRegistry(t.routes, Direction::Serverbound),
            PacketRegistry(t.routes, Direction::Clientbound),
        });
    }
}

const VersionEntry* VersionedRegistrySet::find(std::int32_t version) const {
    for (const auto& e : entries_) {
        if (e.range.contains(version)) return &e;
    }
    return nullptr;
}

// =============================================================================
// Default tables
// =============================================================================

namespace {

constexpr auto SB = Direction::Serverbound;
constexpr auto CB = Direction::Clientbound;

using PT = PacketType;
using PS = ProtocolState;

std::vector<PacketRoute> common_login_routes() {
    return {
        {PT::Handshake, PS::Handshake, SB, 0x00},

        {PT::StatusRequest, PS::Status, SB, 0x00},
        {PT::PingRequest, PS::Status, SB, 0x01},
        {PT::StatusResponse, PS::Status, CB, 0x00},
        {PT::PongResponse, PS::Status, CB, 0x01},

        {PT::LoginStart, PS::Login, SB, 0x00},
        {PT::EncryptionResponse, PS::Login, SB, 0x01},
        {PT::LoginPluginResponse, PS::Login, SB, 0x02},
        {PT::Disconnect, PS::Login, CB, 0x00},
        {PT::EncryptionRequest, PS::Login, CB, 0x01},
        {PT::LoginSuccess, PS::Login, CB, 0x02},
        {PT::SetCompression, PS::Login, CB, 0x03},
        {PT::LoginPluginRequest, PS::Login, CB, 0x04},
    };
}

VersionTable table_1_18() {
    VersionTable t;
    t.range = VersionRange{kProtocol_1_18_1, kProtocol_1_18_2 + 1};
    t.name = "1.18.2";
    t.routes = common_login_routes();

    const std::vector<PacketRoute> play = {
        {PT::KeepAliveServerbound, PS::Play, SB, 0x0F},
        {PT::Disconnect, PS::Play, CB, 0x1A},
        {PT::KeepAliveClientbound, PS::Play, CB, 0x21},
    };
    t.routes.insert(t.routes.end(), play.begin(), play.end());
    return t;
}

VersionTable table_1_20_2() {
    VersionTable t;
    t.range = VersionRange{kProtocol_1_20_2, kProtocol_1_20_2 + 1};
    t.name = "1.20.2";
    t.routes = common_login_routes();

    const std::vector<PacketRoute> extra = {
        {PT::LoginAcknowledged, PS::Login, SB, 0x03},

        {PT::AckFinishConfiguration, PS::Configuration, SB, 0x02},
        {PT::KeepAliveServerbound, PS::Configuration, SB, 0x03},
        {PT::Disconnect, PS::Configuration, CB, 0x01},
        {PT::FinishConfiguration, PS::Configuration, CB, 0x02},
        {PT::KeepAliveClientbound, PS::Configuration, CB, 0x03},

        {PT::KeepAliveServerbound, PS::Play, SB, 0x14},
        {PT::Disconnect, PS::Play, CB, 0x1B},
        {PT::KeepAliveClientbound, PS::Play, CB, 0x24},
    };
    t.routes.insert(t.routes.end(), extra.begin(), extra.end());
    return t;
}

} // namespace

std::shared_ptr<const VersionedRegistrySet> default_registries() {
    std::vector<VersionTable> tables;
    tables.push_back(table_1_18());
    tables.push_back(table_1_20_2());
    return std::make_shared<const VersionedRegistrySet>(std::move(tables));
}

} // namespace shared::proto
