#include "session.hpp"

#include "../../shared/core/log.hpp"
#include "../../shared/io/codec_error.hpp"
#include "../../shared/protocol/packets.hpp"

#include <nlohmann/json.hpp>
#include <openssl/evp.h>

#include <cstdio>
#include <stdexcept>

namespace server::core {

using shared::core::logf;
using shared::io::CodecError;
using shared::io::ErrorKind;
using shared::io::Value;
using shared::proto::PacketType;
using shared::proto::ProtocolState;

namespace {

// Invalid UTF-8 from config or a client is replaced with U+FFFD rather than thrown.
std::string dump_json(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string chat_text(const std::string& text) {
    return dump_json(nlohmann::json{{"text", text}});
}

} // namespace

// =============================================================================
// Offline profiles
// =============================================================================

shared::io::Uuid offline_uuid(std::string_view name) {
    const std::string input = "OfflinePlayer:" + std::string(name);

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    if (EVP_Digest(input.data(), input.size(), digest, &digestLen, EVP_md5(), nullptr) != 1 || digestLen != 16) {
        throw std::runtime_error("MD5 digest failed");
    }

    shared::io::Uuid out{};
    for (std::size_t i = 0; i < out.size(); ++i) {
        out[i] = digest[i];
    }
    out[6] = static_cast<std::uint8_t>((out[6] & 0x0F) | 0x30);
    out[8] = static_cast<std::uint8_t>((out[8] & 0x3F) | 0x80);
    return out;
}

std::string format_uuid(const shared::io::Uuid& uuid) {
    std::string out;
    out.reserve(36);
    char hex[3];
    for (std::size_t i = 0; i < uuid.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
        std::snprintf(hex, sizeof(hex), "%02x", uuid[i]);
        out.append(hex);
    }
    return out;
}

// =============================================================================
// Session
// =============================================================================

Session::Session(std::uint32_t id,
                 std::shared_ptr<shared::transport::IEndpoint> endpoint,
                 std::shared_ptr<const shared::proto::VersionedRegistrySet> registries,
                 Settings settings)
    : id_(id),
      endpoint_(std::move(endpoint)),
      registries_(std::move(registries)),
      settings_(std::move(settings)),
      rng_(std::random_device{}() ^ id) {}

void Session::update(std::uint64_t tick) {
    tick_ = tick;
    if (is_closed()) return;

    try {
        shared::proto::RawPacket packet;
        while (endpoint_->is_open() && endpoint_->try_recv(packet)) {
            handle_(packet);
        }
        if (endpoint_->is_open()) {
            tick_keep_alive_();
        }
    } catch (const CodecError& e) {
        if (e.packet_id()) {
            logf(tick_, "codec", "session #%u %s: %s in %s (packet 0x%02X): %s", id_, endpoint_->peer_name().c_str(),
                 shared::io::to_string(e.kind()), shared::proto::to_string(state()),
                 static_cast<unsigned>(*e.packet_id()), e.what());
        } else {
            logf(tick_, "codec", "session #%u %s: %s in %s: %s", id_, endpoint_->peer_name().c_str(),
                 shared::io::to_string(e.kind()), shared::proto::to_string(state()), e.what());
        }
        disconnect(std::string("Protocol error: ") + shared::io::to_string(e.kind()));
    }
}

void Session::disconnect(const std::string& reason) {
    if (is_closed()) return;

    if (routing_().clientbound.contains(PacketType::Disconnect, state())) {
        Value body = Value::record();
        body.set("reason", Value::of_string(chat_text(reason)));
        try {
            send_(PacketType::Disconnect, body);
        } catch (const CodecError& e) {
            logf(tick_, "codec", "session #%u: disconnect packet not sent: %s", id_, e.what());
        }
    }

    logf(tick_, "init", "session #%u disconnect (%s): %s", id_, shared::proto::to_string(state()), reason.c_str());
    endpoint_->close(reason);
}

// =============================================================================
// Inbound
// =============================================================================

void Session::handle_(const shared::proto::RawPacket& packet) {
    const ProtocolState st = state();
    const PacketType type = routing_().serverbound.type_for(st, packet.id);

    Value v;
    try {
        v = shared::io::decode(packet.body, shared::proto::packet_schema(type, layout_version_()));
    } catch (const CodecError& e) {
        if (e.packet_id()) throw;
        throw e.with_packet_id(packet.id);
    }

    logf(tick_, "rx", "session #%u %s 0x%02X %s (%zu bytes)", id_, shared::proto::to_string(st),
         static_cast<unsigned>(packet.id), shared::proto::to_string(type), packet.body.size());

    switch (st) {
        case ProtocolState::Handshake: handle_handshake_(v); break;
        case ProtocolState::Status: handle_status_(type, v); break;
        case ProtocolState::Login: handle_login_(type, v); break;
        case ProtocolState::Configuration: handle_configuration_(type, v); break;
        case ProtocolState::Play: handle_play_(type, v); break;
    }
}

void Session::handle_handshake_(const Value& v) {
    protocolVersion_ = static_cast<std::int32_t>(v.field("protocol_version").as_int());
    const auto intent = static_cast<std::int32_t>(v.field("next_state").as_int());

    const auto next = shared::proto::state_from_intent(intent);
    if (!next) {
        throw CodecError(ErrorKind::InvalidEncoding, "handshake requested unknown state " + std::to_string(intent));
    }

    entry_ = registries_->find(protocolVersion_);
    machine_.transition(*next);

    logf(tick_, "init", "session #%u handshake protocol=%d (%s) -> %s", id_, protocolVersion_,
         entry_ ? entry_->name.c_str() : "unsupported", shared::proto::to_string(*next));

    if (*next == ProtocolState::Login && !entry_) {
        disconnect("Unsupported protocol version " + std::to_string(protocolVersion_) + ", this server runs " +
                   registries_->newest().name);
    }
}

void Session::handle_status_(PacketType type, const Value& v) {
    if (type == PacketType::StatusRequest) {
        Value body = Value::record();
        body.set("json", Value::of_string(status_json_()));
        send_(PacketType::StatusResponse, body);
        return;
    }

    if (type == PacketType::PingRequest) {
        Value body = Value::record();
        body.set("payload", v.field("payload"));
        send_(PacketType::PongResponse, body);
        endpoint_->close("status complete");
    }
}

void Session::handle_login_(PacketType type, const Value& v) {
    if (type == PacketType::LoginStart) {
        if (profile_) {
            throw CodecError(ErrorKind::InvalidEncoding, "duplicate LoginStart");
        }

        Profile p;
        p.name = v.field("name").as_string();
        if (p.name.empty()) {
            throw CodecError(ErrorKind::InvalidEncoding, "empty player name");
        }
        p.uuid = offline_uuid(p.name);
        profile_ = p;

        if (settings_.compressionThreshold >= 0) {
            Value body = Value::record();
            body.set("threshold", Value::of_int(settings_.compressionThreshold));
            send_(PacketType::SetCompression, body);
            endpoint_->set_compression(settings_.compressionThreshold);
        }

        Value success = Value::record();
        success.set("uuid", Value::of_uuid(p.uuid));
        success.set("username", Value::of_string(p.name));
        if (layout_version_() >= shared::proto::kFirstConfigurationProtocol) {
            success.set("properties", Value::list({}));
        }
        send_(PacketType::LoginSuccess, success);

        logf(tick_, "init", "session #%u login %s uuid=%s", id_, p.name.c_str(), format_uuid(p.uuid).c_str());

        if (entry_->has_configuration()) {
            awaitingLoginAck_ = true;
        } else {
            enter_play_();
        }
        return;
    }

    if (type == PacketType::LoginAcknowledged && awaitingLoginAck_) {
        awaitingLoginAck_ = false;
        machine_.transition(ProtocolState::Configuration);
        keepAliveDueTick_ = 0;

        send_(PacketType::FinishConfiguration, Value::record());
        awaitingConfigAck_ = true;
        return;
    }

    // No encryption or plugin requests are ever sent, so no response is expected.
    throw CodecError(ErrorKind::InvalidEncoding, std::string("unexpected ") + shared::proto::to_string(type));
}

void Session::handle_configuration_(PacketType type, const Value& v) {
    if (type == PacketType::AckFinishConfiguration && awaitingConfigAck_) {
        awaitingConfigAck_ = false;
        enter_play_();
        return;
    }
    if (type == PacketType::KeepAliveServerbound) {
        handle_keep_alive_(v);
        return;
    }
    throw CodecError(ErrorKind::InvalidEncoding, std::string("unexpected ") + shared::proto::to_string(type));
}

void Session::handle_play_(PacketType type, const Value& v) {
    if (type == PacketType::KeepAliveServerbound) {
        handle_keep_alive_(v);
    }
}

void Session::handle_keep_alive_(const Value& v) {
    const std::int64_t got = v.field("keep_alive_id").as_int();
    if (!pendingKeepAlive_ || *pendingKeepAlive_ != got) {
        throw CodecError(ErrorKind::InvalidEncoding, "unexpected keep-alive id " + std::to_string(got));
    }
    pendingKeepAlive_.reset();
}

// =============================================================================
// Play / keep-alive
// =============================================================================

void Session::enter_play_() {
    machine_.transition(ProtocolState::Play);
    keepAliveDueTick_ = 0;

    logf(tick_, "init", "session #%u %s entered play (%s)", id_, profile_ ? profile_->name.c_str() : "?",
         entry_ ? entry_->name.c_str() : "?");

    if (onPlay) {
        onPlay(*this);
    }
}

void Session::tick_keep_alive_() {
    if (!routing_().clientbound.contains(PacketType::KeepAliveClientbound, state())) return;

    if (keepAliveDueTick_ == 0) {
        keepAliveDueTick_ = tick_ + settings_.keepAliveTicks;
        return;
    }
    if (tick_ < keepAliveDueTick_) return;

    keepAliveDueTick_ = tick_ + settings_.keepAliveTicks;

    if (pendingKeepAlive_) {
        disconnect("Timed out");
        return;
    }

    const auto id = static_cast<std::int64_t>(rng_());
    pendingKeepAlive_ = id;

    Value body = Value::record();
    body.set("keep_alive_id", Value::of_int(id));
    send_(PacketType::KeepAliveClientbound, body);
}

// =============================================================================
// Outbound
// =============================================================================

void Session::send_(PacketType type, const Value& body) {
    const std::int32_t id = routing_().clientbound.id_for(type, state());

    shared::proto::RawPacket packet;
    packet.id = id;
    packet.body = shared::io::encode(body, shared::proto::packet_schema(type, layout_version_()));

    logf(tick_, "tx", "session #%u %s 0x%02X %s (%zu bytes)", id_, shared::proto::to_string(state()),
         static_cast<unsigned>(id), shared::proto::to_string(type), packet.body.size());
    endpoint_->send(std::move(packet));
}

std::string Session::status_json_() const {
    const auto& route = routing_();
    const std::size_t online = onlinePlayers ? onlinePlayers() : 0;

    nlohmann::json j;
    j["version"] = {
        {"name", route.name},
        {"protocol", entry_ ? protocolVersion_ : route.range.min},
    };
    j["players"] = {
        {"max", settings_.maxPlayers},
        {"online", online},
    };
    j["description"] = {{"text", settings_.motd}};
    return dump_json(j);
}

const shared::proto::VersionEntry& Session::routing_() const {
    return entry_ ? *entry_ : registries_->newest();
}

std::int32_t Session::layout_version_() const {
    return entry_ ? protocolVersion_ : registries_->newest().range.min;
}

} // namespace server::core
