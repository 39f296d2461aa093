#include "frame_codec.hpp"

#include "../io/codec_error.hpp"
#include "../io/compression.hpp"

#include <stdexcept>
#include <string>

namespace shared::proto {

using shared::io::ByteReader;
using shared::io::ByteWriter;
using shared::io::CodecError;
using shared::io::ErrorKind;

namespace {

// Drop consumed bytes once they dominate the buffer.
constexpr std::size_t kCompactThreshold = 64 * 1024;

// Reads a VarInt from the front of `bytes` without requiring it to be complete.
// Returns false when more bytes are needed.
bool peek_var_int(std::span<const std::uint8_t> bytes, std::int32_t* outValue, std::size_t* outSize) {
    std::uint32_t result = 0;
    for (std::size_t i = 0; i < shared::io::kMaxVarIntBytes; ++i) {
        if (i >= bytes.size()) {
            return false;
        }
        const std::uint8_t b = bytes[i];
        result |= static_cast<std::uint32_t>(b & 0x7F) << (7 * i);
        if ((b & 0x80) == 0) {
            *outValue = static_cast<std::int32_t>(result);
            *outSize = i + 1;
            return true;
        }
    }
    throw CodecError(ErrorKind::InvalidEncoding, "frame length VarInt is longer than 5 bytes");
}

RawPacket parse_packet(std::span<const std::uint8_t> content) {
    ByteReader r(content);
    RawPacket p;
    p.id = r.read_var_int();
    auto body = r.read_remaining();
    p.body.assign(body.begin(), body.end());
    return p;
}

} // namespace

// =============================================================================
// FrameEncoder
// =============================================================================

void FrameEncoder::set_compression(std::int32_t threshold) {
    if (threshold_) {
        throw std::logic_error("compression already enabled on encoder");
    }
    if (threshold < 0) {
        throw std::invalid_argument("compression threshold must be >= 0");
    }
    threshold_ = threshold;
}

void FrameEncoder::enable_encryption(const shared::io::CipherKey& key) {
    if (cipher_) {
        throw std::logic_error("encryption already enabled on encoder");
    }
    cipher_ = std::make_unique<shared::io::Cfb8Cipher>(key, shared::io::Cfb8Cipher::Mode::Encrypt);
}

std::vector<std::uint8_t> FrameEncoder::encode(const RawPacket& packet) {
    ByteWriter content(packet.len() + 8);
    content.write_var_int(packet.id);
    content.write_bytes(packet.body);

    ByteWriter inner;
    if (threshold_) {
        const std::size_t dataLen = content.size();
        if (dataLen >= static_cast<std::size_t>(*threshold_)) {
            if (dataLen > shared::io::kMaxDecompressedSize) {
                throw CodecError(ErrorKind::ExceededBound,
                                 "packet of " + std::to_string(dataLen) + " bytes exceeds inflated size limit", packet.id);
            }
            auto compressed = shared::io::zlib_compress(content.data());
            inner.write_var_int(static_cast<std::int32_t>(dataLen));
            inner.write_bytes(compressed);
        } else {
            inner.write_var_int(0);
            inner.write_bytes(content.data());
        }
    } else {
        inner.write_bytes(content.data());
    }

    if (inner.size() > kMaxFrameLength) {
        throw CodecError(ErrorKind::ExceededBound,
                         "frame of " + std::to_string(inner.size()) + " bytes exceeds " + std::to_string(kMaxFrameLength),
                         packet.id);
    }

    ByteWriter frame(inner.size() + shared::io::kMaxVarIntBytes);
    frame.write_var_int(static_cast<std::int32_t>(inner.size()));
    frame.write_bytes(inner.data());

    std::vector<std::uint8_t> out = frame.take();
    if (cipher_) {
        cipher_->update(out);
    }
    return out;
}

// =============================================================================
// FrameDecoder
// =============================================================================

void FrameDecoder::set_compression(std::int32_t threshold) {
    if (threshold_) {
        throw std::logic_error("compression already enabled on decoder");
    }
    if (threshold < 0) {
        throw std::invalid_argument("compression threshold must be >= 0");
    }
    threshold_ = threshold;
}

void FrameDecoder::enable_encryption(const shared::io::CipherKey& key) {
    if (cipher_) {
        throw std::logic_error("encryption already enabled on decoder");
    }
    cipher_ = std::make_unique<shared::io::Cfb8Cipher>(key, shared::io::Cfb8Cipher::Mode::Decrypt);
    if (readPos_ < buffer_.size()) {
        cipher_->update(std::span<std::uint8_t>(buffer_.data() + readPos_, buffer_.size() - readPos_));
    }
}

void FrameDecoder::feed(std::span<const std::uint8_t> bytes) {
    if (bytes.empty()) return;
    const std::size_t start = buffer_.size();
    buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
    if (cipher_) {
        cipher_->update(std::span<std::uint8_t>(buffer_.data() + start, bytes.size()));
    }
}

DecodeStatus FrameDecoder::next(RawPacket& out) {
    const std::span<const std::uint8_t> pending(buffer_.data() + readPos_, buffer_.size() - readPos_);

    std::int32_t frameLen = 0;
    std::size_t headerLen = 0;
    if (!peek_var_int(pending, &frameLen, &headerLen)) {
        drop_consumed_();
        return DecodeStatus::NeedMore;
    }
    if (frameLen <= 0) {
        throw CodecError(ErrorKind::InvalidEncoding, "frame length " + std::to_string(frameLen) + " is not positive");
    }
    if (static_cast<std::size_t>(frameLen) > kMaxFrameLength) {
        throw CodecError(ErrorKind::ExceededBound,
                         "frame length " + std::to_string(frameLen) + " exceeds " + std::to_string(kMaxFrameLength));
    }
    if (pending.size() - headerLen < static_cast<std::size_t>(frameLen)) {
        drop_consumed_();
        return DecodeStatus::NeedMore;
    }

    const auto frame = pending.subspan(headerLen, static_cast<std::size_t>(frameLen));

    try {
        if (!threshold_) {
            out = parse_packet(frame);
        } else {
            ByteReader r(frame);
            const std::int32_t dataLen = r.read_var_int();
            if (dataLen < 0) {
                throw CodecError(ErrorKind::InvalidEncoding, "negative data length " + std::to_string(dataLen));
            }
            if (dataLen == 0) {
                out = parse_packet(r.read_remaining());
            } else {
                if (static_cast<std::size_t>(dataLen) > shared::io::kMaxDecompressedSize) {
                    throw CodecError(ErrorKind::ExceededBound,
                                     "data length " + std::to_string(dataLen) + " exceeds inflated size limit");
                }
                auto inflated = shared::io::zlib_decompress(r.read_remaining(), static_cast<std::size_t>(dataLen));
                out = parse_packet(inflated);
            }
        }
    } catch (const CodecError& e) {
        // The frame is complete; a short read inside it is malformed data, not a partial frame.
        if (e.kind() == ErrorKind::Truncated) {
            throw CodecError(ErrorKind::InvalidEncoding, std::string("frame content truncated: ") + e.what());
        }
        throw;
    }

    readPos_ += headerLen + static_cast<std::size_t>(frameLen);
    compact_();
    return DecodeStatus::FrameReady;
}

// Only a partial frame (or nothing) is left, so moving it down is cheap.
void FrameDecoder::drop_consumed_() {
    if (readPos_ == 0) return;
    buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(readPos_));
    readPos_ = 0;
}

void FrameDecoder::compact_() {
    if (readPos_ == buffer_.size()) {
        buffer_.clear();
        readPos_ = 0;
        return;
    }
    if (readPos_ >= kCompactThreshold && readPos_ * 2 >= buffer_.size()) {
        buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(readPos_));
        readPos_ = 0;
    }
}

// =============================================================================
// FrameCodec
// =============================================================================

void FrameCodec::set_compression(std::int32_t threshold) {
    if (settings_.compressionThreshold) {
        throw std::logic_error("compression threshold is already set");
    }
    encoder_.set_compression(threshold);
    decoder_.set_compression(threshold);
    settings_.compressionThreshold = threshold;
}

void FrameCodec::enable_encryption(const shared::io::CipherKey& key) {
    if (settings_.encryptionKey) {
        throw std::logic_error("encryption is already enabled");
    }
    encoder_.enable_encryption(key);
    decoder_.enable_encryption(key);
    settings_.encryptionKey = key;
}

} // namespace shared::proto
