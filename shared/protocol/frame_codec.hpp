#pragma once

// Packet framing for the wire.
//
//   plain:       [VarInt frameLen][VarInt id][body]
//   compressed:  [VarInt frameLen][VarInt dataLen][payload]
//                dataLen == 0  -> payload is the raw id+body (below threshold)
//                dataLen  > 0  -> payload is zlib(id+body), dataLen its inflated size
//
// With encryption on, every byte on the wire additionally passes through
// AES-128-CFB8 (outermost transform, both directions).

#include "raw_packet.hpp"

#include "../io/cipher.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace shared::proto {

// Largest value a 3-byte VarInt can hold; vanilla caps frames at this size.
constexpr std::size_t kMaxFrameLength = 2097151;

struct CodecSettings {
    std::optional<std::int32_t> compressionThreshold{};
    std::optional<shared::io::CipherKey> encryptionKey{};
};

enum class DecodeStatus : std::uint8_t {
    NeedMore,
    FrameReady,
};

class FrameEncoder {
public:
    FrameEncoder() = default;

    void set_compression(std::int32_t threshold);
    void enable_encryption(const shared::io::CipherKey& key);

    std::vector<std::uint8_t> encode(const RawPacket& packet);

private:
    std::optional<std::int32_t> threshold_{};
    std::unique_ptr<shared::io::Cfb8Cipher> cipher_{};
};

class FrameDecoder {
public:
    FrameDecoder() = default;

    // Applies from the next undecoded frame on.
    void set_compression(std::int32_t threshold);

    // Everything still buffered past the last consumed frame is treated as ciphertext.
    void enable_encryption(const shared::io::CipherKey& key);

    // Appends wire bytes. Decryption (when enabled) happens here.
    void feed(std::span<const std::uint8_t> bytes);

    // Extracts one frame if a complete one is buffered. Partial frames are left untouched.
    // Throws CodecError on malformed or oversized frames; the stream is unusable afterwards.
    DecodeStatus next(RawPacket& out);

    std::size_t buffered() const { return buffer_.size() - readPos_; }
    // Bytes held in memory, including consumed ones not yet dropped.
    std::size_t retained() const { return buffer_.size(); }

private:
    void compact_();
    void drop_consumed_();

    std::vector<std::uint8_t> buffer_{};
    std::size_t readPos_{0};

    std::optional<std::int32_t> threshold_{};
    std::unique_ptr<shared::io::Cfb8Cipher> cipher_{};
};

// Both directions of one connection plus the settings they share.
// Each setting may be applied once; later attempts throw std::logic_error.
class FrameCodec {
public:
    void set_compression(std::int32_t threshold);
    void enable_encryption(const shared::io::CipherKey& key);

    const CodecSettings& settings() const { return settings_; }

    std::vector<std::uint8_t> encode(const RawPacket& packet) { return encoder_.encode(packet); }
    void feed(std::span<const std::uint8_t> bytes) { decoder_.feed(bytes); }
    DecodeStatus next(RawPacket& out) { return decoder_.next(out); }
    std::size_t buffered() const { return decoder_.buffered(); }

private:
    CodecSettings settings_{};
    FrameEncoder encoder_{};
    FrameDecoder decoder_{};
};

} // namespace shared::proto
