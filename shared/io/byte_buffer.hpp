#pragma once

#include "codec_error.hpp"

#include <array>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace shared::io {

using Uuid = std::array<std::uint8_t, 16>;

// Protocol-wide string cap (UTF-16 code units).
constexpr std::size_t kDefaultStringMaxLen = 32767;

constexpr std::size_t kMaxVarIntBytes = 5;
constexpr std::size_t kMaxVarLongBytes = 10;

inline std::size_t var_int_size(std::int32_t value) {
    std::uint32_t v = static_cast<std::uint32_t>(value);
    std::size_t n = 1;
    while ((v & ~0x7Fu) != 0) {
        v >>= 7;
        ++n;
    }
    return n;
}

// Validates UTF-8 and counts the UTF-16 code units the text would occupy.
// Returns false on malformed input (overlong forms, surrogates, > U+10FFFF).
inline bool utf8_utf16_length(std::string_view s, std::size_t* outUnits) {
    std::size_t units = 0;
    std::size_t i = 0;
    const auto* p = reinterpret_cast<const unsigned char*>(s.data());
    const std::size_t n = s.size();

    while (i < n) {
        const unsigned char c = p[i];
        std::uint32_t cp = 0;
        std::size_t extra = 0;

        if (c < 0x80) {
            cp = c;
        } else if ((c & 0xE0) == 0xC0) {
            cp = c & 0x1F;
            extra = 1;
        } else if ((c & 0xF0) == 0xE0) {
            cp = c & 0x0F;
            extra = 2;
        } else if ((c & 0xF8) == 0xF0) {
            cp = c & 0x07;
            extra = 3;
        } else {
            return false;
        }

        if (i + extra >= n) return false;

        for (std::size_t k = 1; k <= extra; ++k) {
            const unsigned char cc = p[i + k];
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }

        if (extra == 1 && cp < 0x80) return false;
        if (extra == 2 && cp < 0x800) return false;
        if (extra == 3 && (cp < 0x10000 || cp > 0x10FFFF)) return false;
        if (cp >= 0xD800 && cp <= 0xDFFF) return false;

        units += (cp >= 0x10000) ? 2 : 1;
        i += extra + 1;
    }

    if (outUnits) *outUnits = units;
    return true;
}

// ============================================================================
// ByteWriter - Serialize protocol data (big-endian)
// ============================================================================

class ByteWriter {
public:
    ByteWriter() = default;
    explicit ByteWriter(std::size_t reserve) { data_.reserve(reserve); }

    // --- Primitives ---

    void write_u8(std::uint8_t v) {
        data_.push_back(v);
    }

    void write_i8(std::int8_t v) {
        write_u8(static_cast<std::uint8_t>(v));
    }

    void write_u16(std::uint16_t v) {
        data_.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
        data_.push_back(static_cast<std::uint8_t>(v & 0xFF));
    }

    void write_i16(std::int16_t v) {
        write_u16(static_cast<std::uint16_t>(v));
    }

    void write_u32(std::uint32_t v) {
        data_.push_back(static_cast<std::uint8_t>((v >> 24) & 0xFF));
        data_.push_back(static_cast<std::uint8_t>((v >> 16) & 0xFF));
        data_.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
        data_.push_back(static_cast<std::uint8_t>(v & 0xFF));
    }

    void write_i32(std::int32_t v) {
        write_u32(static_cast<std::uint32_t>(v));
    }

    void write_u64(std::uint64_t v) {
        for (int i = 7; i >= 0; --i) {
            data_.push_back(static_cast<std::uint8_t>((v >> (i * 8)) & 0xFF));
        }
    }

    void write_i64(std::int64_t v) {
        write_u64(static_cast<std::uint64_t>(v));
    }

    void write_f32(float v) {
        std::uint32_t bits;
        std::memcpy(&bits, &v, sizeof(bits));
        write_u32(bits);
    }

    void write_f64(double v) {
        std::uint64_t bits;
        std::memcpy(&bits, &v, sizeof(bits));
        write_u64(bits);
    }

    void write_bool(bool v) {
        write_u8(v ? 1 : 0);
    }

    // --- Variable-length integers ---

    void write_var_int(std::int32_t value) {
        std::uint32_t v = static_cast<std::uint32_t>(value);
        while ((v & ~0x7Fu) != 0) {
            data_.push_back(static_cast<std::uint8_t>((v & 0x7F) | 0x80));
            v >>= 7;
        }
        data_.push_back(static_cast<std::uint8_t>(v));
    }

    void write_var_long(std::int64_t value) {
        std::uint64_t v = static_cast<std::uint64_t>(value);
        while ((v & ~0x7Full) != 0) {
            data_.push_back(static_cast<std::uint8_t>((v & 0x7F) | 0x80));
            v >>= 7;
        }
        data_.push_back(static_cast<std::uint8_t>(v));
    }

    // --- Strings ---

    void write_string(std::string_view s, std::size_t maxLen = kDefaultStringMaxLen) {
        std::size_t units = 0;
        if (!utf8_utf16_length(s, &units)) {
            throw CodecError(ErrorKind::InvalidEncoding, "string is not valid UTF-8");
        }
        if (units > maxLen) {
            throw CodecError(ErrorKind::ExceededBound,
                             "string of " + std::to_string(units) + " chars exceeds max " + std::to_string(maxLen));
        }
        write_var_int(static_cast<std::int32_t>(s.size()));
        data_.insert(data_.end(), s.begin(), s.end());
    }

    void write_uuid(const Uuid& id) {
        data_.insert(data_.end(), id.begin(), id.end());
    }

    // --- Raw bytes ---

    void write_bytes(std::span<const std::uint8_t> bytes) {
        data_.insert(data_.end(), bytes.begin(), bytes.end());
    }

    // --- Access ---

    std::span<const std::uint8_t> data() const { return data_; }
    std::size_t size() const { return data_.size(); }
    std::vector<std::uint8_t> take() { return std::move(data_); }
    void clear() { data_.clear(); }

private:
    std::vector<std::uint8_t> data_;
};

// ============================================================================
// ByteReader - Deserialize protocol data (big-endian)
// ============================================================================

class ByteReader {
public:
    explicit ByteReader(std::span<const std::uint8_t> data)
        : data_(data), pos_(0) {}

    // --- Primitives ---

    std::uint8_t read_u8() {
        check_remaining(1);
        return data_[pos_++];
    }

    std::int8_t read_i8() {
        return static_cast<std::int8_t>(read_u8());
    }

    std::uint16_t read_u16() {
        check_remaining(2);
        std::uint16_t v = static_cast<std::uint16_t>(
            (static_cast<std::uint16_t>(data_[pos_]) << 8)
          | static_cast<std::uint16_t>(data_[pos_ + 1]));
        pos_ += 2;
        return v;
    }

    std::int16_t read_i16() {
        return static_cast<std::int16_t>(read_u16());
    }

    std::uint32_t read_u32() {
        check_remaining(4);
        std::uint32_t v = (static_cast<std::uint32_t>(data_[pos_]) << 24)
                        | (static_cast<std::uint32_t>(data_[pos_ + 1]) << 16)
                        | (static_cast<std::uint32_t>(data_[pos_ + 2]) << 8)
                        | static_cast<std::uint32_t>(data_[pos_ + 3]);
        pos_ += 4;
        return v;
    }

    std::int32_t read_i32() {
        return static_cast<std::int32_t>(read_u32());
    }

    std::uint64_t read_u64() {
        check_remaining(8);
        std::uint64_t v = 0;
        for (int i = 0; i < 8; ++i) {
            v = (v << 8) | static_cast<std::uint64_t>(data_[pos_ + i]);
        }
        pos_ += 8;
        return v;
    }

    std::int64_t read_i64() {
        return static_cast<std::int64_t>(read_u64());
    }

    float read_f32() {
        std::uint32_t bits = read_u32();
        float v;
        std::memcpy(&v, &bits, sizeof(v));
        return v;
    }

    double read_f64() {
        std::uint64_t bits = read_u64();
        double v;
        std::memcpy(&v, &bits, sizeof(v));
        return v;
    }

    bool read_bool() {
        const std::uint8_t b = read_u8();
        if (b > 1) {
            throw CodecError(ErrorKind::InvalidEncoding, "boolean byte must be 0 or 1");
        }
        return b != 0;
    }

    // --- Variable-length integers ---

    std::int32_t read_var_int() {
        std::uint32_t result = 0;
        for (std::size_t i = 0; i < kMaxVarIntBytes; ++i) {
            const std::uint8_t b = read_u8();
            result |= static_cast<std::uint32_t>(b & 0x7F) << (7 * i);
            if ((b & 0x80) == 0) {
                return static_cast<std::int32_t>(result);
            }
        }
        throw CodecError(ErrorKind::InvalidEncoding, "VarInt is longer than 5 bytes");
    }

    std::int64_t read_var_long() {
        std::uint64_t result = 0;
        for (std::size_t i = 0; i < kMaxVarLongBytes; ++i) {
            const std::uint8_t b = read_u8();
            result |= static_cast<std::uint64_t>(b & 0x7F) << (7 * i);
            if ((b & 0x80) == 0) {
                return static_cast<std::int64_t>(result);
            }
        }
        throw CodecError(ErrorKind::InvalidEncoding, "VarLong is longer than 10 bytes");
    }

    // Reads a non-negative VarInt used as a length prefix.
    std::size_t read_length() {
        const std::int32_t len = read_var_int();
        if (len < 0) {
            throw CodecError(ErrorKind::InvalidEncoding, "negative length prefix " + std::to_string(len));
        }
        return static_cast<std::size_t>(len);
    }

    // --- Strings ---

    std::string read_string(std::size_t maxLen = kDefaultStringMaxLen) {
        const std::size_t byteLen = read_length();
        // Every UTF-16 unit takes at most 3 UTF-8 bytes; reject before allocating.
        if (byteLen > maxLen * 3) {
            throw CodecError(ErrorKind::ExceededBound,
                             "string of " + std::to_string(byteLen) + " bytes exceeds max " + std::to_string(maxLen));
        }
        check_remaining(byteLen);
        std::string s(reinterpret_cast<const char*>(data_.data() + pos_), byteLen);
        pos_ += byteLen;

        std::size_t units = 0;
        if (!utf8_utf16_length(s, &units)) {
            throw CodecError(ErrorKind::InvalidEncoding, "string is not valid UTF-8");
        }
        if (units > maxLen) {
            throw CodecError(ErrorKind::ExceededBound,
                             "string of " + std::to_string(units) + " chars exceeds max " + std::to_string(maxLen));
        }
        return s;
    }

    Uuid read_uuid() {
        check_remaining(16);
        Uuid id{};
        std::memcpy(id.data(), data_.data() + pos_, id.size());
        pos_ += id.size();
        return id;
    }

    // --- Raw bytes ---

    std::span<const std::uint8_t> read_bytes(std::size_t count) {
        check_remaining(count);
        auto span = data_.subspan(pos_, count);
        pos_ += count;
        return span;
    }

    std::span<const std::uint8_t> read_remaining() {
        return read_bytes(remaining());
    }

    // --- State ---

    std::size_t position() const { return pos_; }
    std::size_t remaining() const { return data_.size() - pos_; }
    bool at_end() const { return pos_ >= data_.size(); }

private:
    void check_remaining(std::size_t need) {
        if (need > data_.size() - pos_) {
            throw CodecError(ErrorKind::Truncated, "ByteReader: not enough data");
        }
    }

    std::span<const std::uint8_t> data_;
    std::size_t pos_;
};

} // namespace shared::io
