#include "packets.hpp"

#include <array>
#include <stdexcept>
#include <string>

namespace shared::proto {

namespace s = shared::io::schema;
using shared::io::FieldSchema;
using shared::io::LengthMode;
using shared::io::ListOptions;
using shared::io::OptionalOptions;
using shared::io::SchemaPtr;
using shared::io::TagMode;

namespace {

using SchemaTable = std::array<SchemaPtr, kPacketTypeCount>;

SchemaPtr empty_body() {
    return s::record({});
}

SchemaTable build_common() {
    SchemaTable t{};

    t[static_cast<std::size_t>(PacketType::Handshake)] = s::record({
        {"protocol_version", s::var_int()},
        {"server_address", s::string(kMaxServerAddressLen)},
        {"server_port", s::u16()},
        {"next_state", s::var_int()},
    });

    t[static_cast<std::size_t>(PacketType::StatusRequest)] = empty_body();
    t[static_cast<std::size_t>(PacketType::StatusResponse)] = s::record({
        {"json", s::string()},
    });
    t[static_cast<std::size_t>(PacketType::PingRequest)] = s::record({
        {"payload", s::i64()},
    });
    t[static_cast<std::size_t>(PacketType::PongResponse)] = s::record({
        {"payload", s::i64()},
    });

    // RSA-1024 material; nothing legitimate comes close to this cap.
    ListOptions keyBytes;
    keyBytes.maxLen = 512;

    t[static_cast<std::size_t>(PacketType::EncryptionRequest)] = s::record({
        {"server_id", s::string(kMaxServerIdLen)},
        {"public_key", s::bytes(keyBytes)},
        {"verify_token", s::bytes(keyBytes)},
    });
    t[static_cast<std::size_t>(PacketType::EncryptionResponse)] = s::record({
        {"shared_secret", s::bytes(keyBytes)},
        {"verify_token", s::bytes(keyBytes)},
    });

    ListOptions remaining;
    remaining.length = LengthMode::Remaining;

    t[static_cast<std::size_t>(PacketType::LoginPluginRequest)] = s::record({
        {"message_id", s::var_int()},
        {"channel", s::identifier()},
        {"data", s::bytes(remaining)},
    });

    OptionalOptions whenSuccessful;
    whenSuccessful.tag = TagMode::External;
    whenSuccessful.presentIf = "successful";

    t[static_cast<std::size_t>(PacketType::LoginPluginResponse)] = s::record({
        {"message_id", s::var_int()},
        {"successful", s::boolean()},
        {"data", s::optional(s::bytes(remaining), whenSuccessful)},
    });

    t[static_cast<std::size_t>(PacketType::SetCompression)] = s::record({
        {"threshold", s::var_int()},
    });
    t[static_cast<std::size_t>(PacketType::LoginAcknowledged)] = empty_body();

    t[static_cast<std::size_t>(PacketType::FinishConfiguration)] = empty_body();
    t[static_cast<std::size_t>(PacketType::AckFinishConfiguration)] = empty_body();

    t[static_cast<std::size_t>(PacketType::KeepAliveClientbound)] = s::record({
        {"keep_alive_id", s::i64()},
    });
    t[static_cast<std::size_t>(PacketType::KeepAliveServerbound)] = s::record({
        {"keep_alive_id", s::i64()},
    });
    t[static_cast<std::size_t>(PacketType::Disconnect)] = s::record({
        {"reason", s::string(kMaxChatLen)},
    });

    return t;
}

SchemaTable build_legacy() {
    SchemaTable t = build_common();

    t[static_cast<std::size_t>(PacketType::LoginStart)] = s::record({
        {"name", s::string(kMaxPlayerNameLen)},
    });
    t[static_cast<std::size_t>(PacketType::LoginSuccess)] = s::record({
        {"uuid", s::uuid()},
        {"username", s::string(kMaxPlayerNameLen)},
    });
    return t;
}

SchemaTable build_modern() {
    SchemaTable t = build_common();

    t[static_cast<std::size_t>(PacketType::LoginStart)] = s::record({
        {"name", s::string(kMaxPlayerNameLen)},
        {"uuid", s::uuid()},
    });

    auto property = s::record({
        {"name", s::string()},
        {"value", s::string()},
        {"signature", s::optional(s::string())},
    });
    t[static_cast<std::size_t>(PacketType::LoginSuccess)] = s::record({
        {"uuid", s::uuid()},
        {"username", s::string(kMaxPlayerNameLen)},
        {"properties", s::list(property)},
    });
    return t;
}

} // namespace

const char* to_string(PacketType type) {
    switch (type) {
        case PacketType::Handshake: return "Handshake";
        case PacketType::StatusRequest: return "StatusRequest";
        case PacketType::StatusResponse: return "StatusResponse";
        case PacketType::PingRequest: return "PingRequest";
        case PacketType::PongResponse: return "PongResponse";
        case PacketType::LoginStart: return "LoginStart";
        case PacketType::EncryptionRequest: return "EncryptionRequest";
        case PacketType::EncryptionResponse: return "EncryptionResponse";
        case PacketType::LoginPluginRequest: return "LoginPluginRequest";
        case PacketType::LoginPluginResponse: return "LoginPluginResponse";
        case PacketType::SetCompression: return "SetCompression";
        case PacketType::LoginSuccess: return "LoginSuccess";
        case PacketType::LoginAcknowledged: return "LoginAcknowledged";
        case PacketType::FinishConfiguration: return "FinishConfiguration";
        case PacketType::AckFinishConfiguration: return "AckFinishConfiguration";
        case PacketType::KeepAliveClientbound: return "KeepAliveClientbound";
        case PacketType::KeepAliveServerbound: return "KeepAliveServerbound";
        case PacketType::Disconnect: return "Disconnect";
        case PacketType::Count: break;
    }
    return "?";
}

const shared::io::Schema& packet_schema(PacketType type, std::int32_t protocolVersion) {
    static const SchemaTable legacy = build_legacy();
    static const SchemaTable modern = build_modern();

    const SchemaTable& table = (protocolVersion >= kFirstConfigurationProtocol) ? modern : legacy;
    const std::size_t index = static_cast<std::size_t>(type);
    if (index >= kPacketTypeCount || !table[index]) {
        throw std::out_of_range(std::string("no schema for packet type ") + to_string(type));
    }
    return *table[index];
}

} // namespace shared::proto
