/**
 * @file test_registry.cpp
 * @brief Unit tests for packet id routing and version selection.
 */

#include <catch2/catch_test_macros.hpp>

#include "io/codec_error.hpp"
#include "protocol/registry.hpp"

#include <stdexcept>
#include <vector>

using namespace shared::proto;
using shared::io::CodecError;
using shared::io::ErrorKind;

namespace {

VersionTable table(std::int32_t min, std::int32_t max, const char* name, std::vector<PacketRoute> routes = {}) {
    VersionTable t;
    t.range = VersionRange{min, max};
    t.name = name;
    t.routes = std::move(routes);
    return t;
}

} // namespace

// =============================================================================
// PacketRegistry
// =============================================================================

TEST_CASE("Registry maps both ways within a state", "[protocol][registry]") {
    const std::vector<PacketRoute> routes = {
        {PacketType::StatusRequest, ProtocolState::Status, Direction::Serverbound, 0x00},
        {PacketType::PingRequest, ProtocolState::Status, Direction::Serverbound, 0x01},
        {PacketType::StatusResponse, ProtocolState::Status, Direction::Clientbound, 0x00},
    };
    PacketRegistry sb(routes, Direction::Serverbound);

    REQUIRE(sb.direction() == Direction::Serverbound);
    REQUIRE(sb.size() == 2);
    REQUIRE(sb.id_for(PacketType::PingRequest, ProtocolState::Status) == 0x01);
    REQUIRE(sb.type_for(ProtocolState::Status, 0x00) == PacketType::StatusRequest);

    // Clientbound routes are not part of a serverbound registry.
    REQUIRE_FALSE(sb.contains(PacketType::StatusResponse, ProtocolState::Status));
}

TEST_CASE("The same id means different packets in different states", "[protocol][registry]") {
    const std::vector<PacketRoute> routes = {
        {PacketType::Handshake, ProtocolState::Handshake, Direction::Serverbound, 0x00},
        {PacketType::StatusRequest, ProtocolState::Status, Direction::Serverbound, 0x00},
        {PacketType::LoginStart, ProtocolState::Login, Direction::Serverbound, 0x00},
    };
    PacketRegistry sb(routes, Direction::Serverbound);

    REQUIRE(sb.type_for(ProtocolState::Handshake, 0) == PacketType::Handshake);
    REQUIRE(sb.type_for(ProtocolState::Status, 0) == PacketType::StatusRequest);
    REQUIRE(sb.type_for(ProtocolState::Login, 0) == PacketType::LoginStart);
}

TEST_CASE("Unregistered lookups fail with UnregisteredPacket", "[protocol][registry]") {
    const std::vector<PacketRoute> routes = {
        {PacketType::LoginStart, ProtocolState::Login, Direction::Serverbound, 0x00},
    };
    PacketRegistry sb(routes, Direction::Serverbound);

    REQUIRE_FALSE(sb.try_type_for(ProtocolState::Login, 0x7F).has_value());
    REQUIRE_FALSE(sb.try_id_for(PacketType::LoginStart, ProtocolState::Play).has_value());

    try {
        (void)sb.type_for(ProtocolState::Login, 0x7F);
        FAIL("expected CodecError");
    } catch (const CodecError& e) {
        REQUIRE(e.kind() == ErrorKind::UnregisteredPacket);
        REQUIRE(e.packet_id() == 0x7F);
    }

    try {
        (void)sb.id_for(PacketType::KeepAliveServerbound, ProtocolState::Login);
        FAIL("expected CodecError");
    } catch (const CodecError& e) {
        REQUIRE(e.kind() == ErrorKind::UnregisteredPacket);
    }
}

TEST_CASE("Duplicate routes are rejected at build time", "[protocol][registry]") {
    SECTION("Same type twice in a state") {
        const std::vector<PacketRoute> routes = {
            {PacketType::LoginStart, ProtocolState::Login, Direction::Serverbound, 0x00},
            {PacketType::LoginStart, ProtocolState::Login, Direction::Serverbound, 0x05},
        };
        REQUIRE_THROWS_AS(PacketRegistry(routes, Direction::Serverbound), std::invalid_argument);
    }

    SECTION("Same id twice in a state") {
        const std::vector<PacketRoute> routes = {
            {PacketType::LoginStart, ProtocolState::Login, Direction::Serverbound, 0x00},
            {PacketType::EncryptionResponse, ProtocolState::Login, Direction::Serverbound, 0x00},
        };
        REQUIRE_THROWS_AS(PacketRegistry(routes, Direction::Serverbound), std::invalid_argument);
    }

    SECTION("Negative id") {
        const std::vector<PacketRoute> routes = {
            {PacketType::LoginStart, ProtocolState::Login, Direction::Serverbound, -1},
        };
        REQUIRE_THROWS_AS(PacketRegistry(routes, Direction::Serverbound), std::invalid_argument);
    }

    SECTION("Same id in the other direction is fine") {
        const std::vector<PacketRoute> routes = {
            {PacketType::LoginStart, ProtocolState::Login, Direction::Serverbound, 0x00},
            {PacketType::Disconnect, ProtocolState::Login, Direction::Clientbound, 0x00},
        };
        REQUIRE_NOTHROW(PacketRegistry(routes, Direction::Serverbound));
        REQUIRE_NOTHROW(PacketRegistry(routes, Direction::Clientbound));
    }
}

// =============================================================================
// VersionedRegistrySet
// =============================================================================

TEST_CASE("Version ranges are half-open", "[protocol][registry]") {
    const VersionRange r{757, 759};
    REQUIRE(r.contains(757));
    REQUIRE(r.contains(758));
    REQUIRE_FALSE(r.contains(759));
    REQUIRE_FALSE(r.contains(756));

    REQUIRE(r.overlaps(VersionRange{758, 760}));
    REQUIRE_FALSE(r.overlaps(VersionRange{759, 760}));
    REQUIRE(VersionRange{5, 5}.empty());
}

TEST_CASE("Registry sets reject bad version tables", "[protocol][registry]") {
    SECTION("Overlapping ranges") {
        std::vector<VersionTable> tables;
        tables.push_back(table(100, 200, "a"));
        tables.push_back(table(150, 250, "b"));
        REQUIRE_THROWS_AS(VersionedRegistrySet(std::move(tables)), std::invalid_argument);
    }

    SECTION("Empty range") {
        std::vector<VersionTable> tables;
        tables.push_back(table(100, 100, "a"));
        REQUIRE_THROWS_AS(VersionedRegistrySet(std::move(tables)), std::invalid_argument);
    }

    SECTION("No tables") {
        REQUIRE_THROWS_AS(VersionedRegistrySet(std::vector<VersionTable>{}), std::invalid_argument);
    }
}

TEST_CASE("Registry sets find the table holding a version", "[protocol][registry]") {
    std::vector<VersionTable> tables;
    tables.push_back(table(300, 400, "new"));
    tables.push_back(table(100, 200, "old"));
    VersionedRegistrySet set(std::move(tables));

    REQUIRE(set.entries().size() == 2);
    REQUIRE(set.entries().front().name == "old");
    REQUIRE(set.newest().name == "new");

    REQUIRE(set.find(150)->name == "old");
    REQUIRE(set.find(399)->name == "new");
    REQUIRE(set.find(250) == nullptr);
    REQUIRE(set.find(400) == nullptr);
}

// =============================================================================
// Default tables
// =============================================================================

TEST_CASE("Default registries cover 1.18.2 and 1.20.2", "[protocol][registry]") {
    auto set = default_registries();

    const VersionEntry* legacy = set->find(kProtocol_1_18_2);
    REQUIRE(legacy != nullptr);
    REQUIRE(set->find(kProtocol_1_18_1) == legacy);
    REQUIRE(legacy->name == "1.18.2");
    REQUIRE_FALSE(legacy->has_configuration());

    const VersionEntry* modern = set->find(kProtocol_1_20_2);
    REQUIRE(modern != nullptr);
    REQUIRE(modern->name == "1.20.2");
    REQUIRE(modern->has_configuration());
    REQUIRE(&set->newest() == modern);

    REQUIRE(set->find(763) == nullptr);
    REQUIRE(set->find(47) == nullptr);
}

TEST_CASE("Default tables assign the vanilla ids", "[protocol][registry]") {
    auto set = default_registries();
    const VersionEntry& legacy = *set->find(kProtocol_1_18_2);
    const VersionEntry& modern = *set->find(kProtocol_1_20_2);

    SECTION("Shared early states") {
        for (const VersionEntry* e : {&legacy, &modern}) {
            REQUIRE(e->serverbound.id_for(PacketType::Handshake, ProtocolState::Handshake) == 0x00);
            REQUIRE(e->serverbound.id_for(PacketType::PingRequest, ProtocolState::Status) == 0x01);
            REQUIRE(e->clientbound.id_for(PacketType::SetCompression, ProtocolState::Login) == 0x03);
            REQUIRE(e->clientbound.id_for(PacketType::LoginSuccess, ProtocolState::Login) == 0x02);
            REQUIRE(e->clientbound.id_for(PacketType::Disconnect, ProtocolState::Login) == 0x00);
        }
    }

    SECTION("Play ids moved between versions") {
        REQUIRE(legacy.clientbound.id_for(PacketType::KeepAliveClientbound, ProtocolState::Play) == 0x21);
        REQUIRE(legacy.serverbound.id_for(PacketType::KeepAliveServerbound, ProtocolState::Play) == 0x0F);
        REQUIRE(legacy.clientbound.id_for(PacketType::Disconnect, ProtocolState::Play) == 0x1A);

        REQUIRE(modern.clientbound.id_for(PacketType::KeepAliveClientbound, ProtocolState::Play) == 0x24);
        REQUIRE(modern.serverbound.id_for(PacketType::KeepAliveServerbound, ProtocolState::Play) == 0x14);
        REQUIRE(modern.clientbound.id_for(PacketType::Disconnect, ProtocolState::Play) == 0x1B);
    }

    SECTION("Configuration exists only in the newer table") {
        REQUIRE_FALSE(legacy.serverbound.contains(PacketType::LoginAcknowledged, ProtocolState::Login));
        REQUIRE(modern.serverbound.id_for(PacketType::LoginAcknowledged, ProtocolState::Login) == 0x03);
        REQUIRE(modern.clientbound.id_for(PacketType::FinishConfiguration, ProtocolState::Configuration) == 0x02);
        REQUIRE(modern.serverbound.id_for(PacketType::AckFinishConfiguration, ProtocolState::Configuration) == 0x02);
        REQUIRE(modern.clientbound.id_for(PacketType::Disconnect, ProtocolState::Configuration) == 0x01);
    }
}

TEST_CASE("Server and client views are mirror images", "[protocol][registry]") {
    auto set = default_registries();
    const VersionEntry& e = set->newest();

    const RegistryPair server = e.server_side();
    const RegistryPair client = e.client_side();

    REQUIRE(server.inbound == &e.serverbound);
    REQUIRE(server.outbound == &e.clientbound);
    REQUIRE(client.inbound == server.outbound);
    REQUIRE(client.outbound == server.inbound);
    REQUIRE(client.flip().inbound == server.inbound);
}
