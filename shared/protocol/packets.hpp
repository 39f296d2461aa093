#pragma once

#include "../io/schema.hpp"

#include <cstddef>
#include <cstdint>

namespace shared::proto {

// Protocol numbers the default registries know about.
constexpr std::int32_t kProtocol_1_18_1 = 757;
constexpr std::int32_t kProtocol_1_18_2 = 758;
constexpr std::int32_t kProtocol_1_20_2 = 764;

// First protocol with the Configuration state (and the newer login layouts).
constexpr std::int32_t kFirstConfigurationProtocol = kProtocol_1_20_2;

// Compile-time packet keys. One key may be registered in several states
// (e.g. Disconnect in Login, Configuration and Play) under different ids.
enum class PacketType : std::uint8_t {
    Handshake = 0,

    StatusRequest,
    StatusResponse,
    PingRequest,
    PongResponse,

    LoginStart,
    EncryptionRequest,
    EncryptionResponse,
    LoginPluginRequest,
    LoginPluginResponse,
    SetCompression,
    LoginSuccess,
    LoginAcknowledged,

    FinishConfiguration,
    AckFinishConfiguration,

    KeepAliveClientbound,
    KeepAliveServerbound,
    Disconnect,

    Count
};

constexpr std::size_t kPacketTypeCount = static_cast<std::size_t>(PacketType::Count);

const char* to_string(PacketType type);

// Body layout of a packet for the given protocol version.
// Schemas are built once and shared; the reference stays valid for the process lifetime.
const shared::io::Schema& packet_schema(PacketType type, std::int32_t protocolVersion);

// Field limits used by the layouts above.
constexpr std::size_t kMaxServerAddressLen = 255;
constexpr std::size_t kMaxPlayerNameLen = 16;
constexpr std::size_t kMaxChatLen = 262144;
constexpr std::size_t kMaxServerIdLen = 20;

} // namespace shared::proto
