#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace shared::io {

// Failure taxonomy shared by the typed codec, the frame codec and the registry.
// Truncated is the only recoverable kind, and only at the frame layer where
// more input can still arrive.
enum class ErrorKind : std::uint8_t {
    Truncated = 0,
    InvalidEncoding = 1,
    ExceededBound = 2,
    UnregisteredPacket = 3,
    CompressionMismatch = 4,
    Corrupt = 5,
    Io = 6,
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Truncated: return "truncated";
        case ErrorKind::InvalidEncoding: return "invalid encoding";
        case ErrorKind::ExceededBound: return "exceeded bound";
        case ErrorKind::UnregisteredPacket: return "unregistered packet";
        case ErrorKind::CompressionMismatch: return "compression mismatch";
        case ErrorKind::Corrupt: return "corrupt";
        case ErrorKind::Io: return "io";
    }
    return "unknown";
}

class CodecError : public std::runtime_error {
public:
    CodecError(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    CodecError(ErrorKind kind, const std::string& what, std::int32_t packetId)
        : std::runtime_error(what), kind_(kind), packetId_(packetId) {}

    ErrorKind kind() const { return kind_; }

    // Set by the layer that knows which packet was being processed.
    const std::optional<std::int32_t>& packet_id() const { return packetId_; }

    CodecError with_packet_id(std::int32_t id) const {
        return CodecError(kind_, what(), id);
    }

private:
    ErrorKind kind_;
    std::optional<std::int32_t> packetId_{};
};

} // namespace shared::io
