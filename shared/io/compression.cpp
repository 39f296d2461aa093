#include "compression.hpp"

#include "codec_error.hpp"

#include <zlib.h>

#include <algorithm>
#include <string>

namespace shared::io {

namespace {

constexpr int kZlibWindowBits = MAX_WBITS;
constexpr int kGzipWindowBits = 16 + MAX_WBITS;
constexpr std::size_t kInflateChunk = 4096;

struct DeflateStream {
    z_stream zs{};
    bool live{false};
    ~DeflateStream() {
        if (live) deflateEnd(&zs);
    }
};

struct InflateStream {
    z_stream zs{};
    bool live{false};
    ~InflateStream() {
        if (live) inflateEnd(&zs);
    }
};

std::vector<std::uint8_t> deflate_bytes(std::span<const std::uint8_t> input, int level, int windowBits) {
    DeflateStream s;
    if (deflateInit2(&s.zs, level, Z_DEFLATED, windowBits, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw CodecError(ErrorKind::Io, "deflateInit2 failed");
    }
    s.live = true;

    s.zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
    s.zs.avail_in = static_cast<uInt>(input.size());

    std::vector<std::uint8_t> out(deflateBound(&s.zs, static_cast<uLong>(input.size())));
    for (;;) {
        s.zs.next_out = out.data() + s.zs.total_out;
        s.zs.avail_out = static_cast<uInt>(out.size() - s.zs.total_out);

        const int ret = deflate(&s.zs, Z_FINISH);
        if (ret == Z_STREAM_END) break;
        if (ret != Z_OK && ret != Z_BUF_ERROR) {
            throw CodecError(ErrorKind::Io, std::string("deflate failed: ") + (s.zs.msg ? s.zs.msg : "unknown"));
        }
        out.resize(out.size() + kInflateChunk);
    }

    out.resize(s.zs.total_out);
    return out;
}

// Output grows geometrically up to maxSize + 1; reaching the extra byte means the stream is too large.
std::vector<std::uint8_t> inflate_bytes(std::span<const std::uint8_t> input, int windowBits,
                                        std::size_t maxSize, ErrorKind overflowKind) {
    InflateStream s;
    if (inflateInit2(&s.zs, windowBits) != Z_OK) {
        throw CodecError(ErrorKind::Io, "inflateInit2 failed");
    }
    s.live = true;

    s.zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
    s.zs.avail_in = static_cast<uInt>(input.size());

    const std::size_t cap = maxSize + 1;
    std::vector<std::uint8_t> out;

    for (;;) {
        if (out.size() == s.zs.total_out) {
            if (out.size() >= cap) {
                throw CodecError(overflowKind, "inflated data exceeds " + std::to_string(maxSize) + " bytes");
            }
            out.resize(std::min(cap, std::max(out.size() * 2, kInflateChunk)));
        }
        s.zs.next_out = out.data() + s.zs.total_out;
        s.zs.avail_out = static_cast<uInt>(out.size() - s.zs.total_out);

        const int ret = inflate(&s.zs, Z_NO_FLUSH);
        if (ret == Z_STREAM_END) break;
        if (ret == Z_OK) continue;
        if (ret == Z_BUF_ERROR && s.zs.avail_out == 0) continue;
        if (ret == Z_BUF_ERROR) {
            throw CodecError(ErrorKind::InvalidEncoding, "compressed stream is truncated");
        }
        throw CodecError(ErrorKind::InvalidEncoding,
                         std::string("inflate failed: ") + (s.zs.msg ? s.zs.msg : "unknown"));
    }

    if (s.zs.total_out > maxSize) {
        throw CodecError(overflowKind, "inflated data exceeds " + std::to_string(maxSize) + " bytes");
    }
    out.resize(s.zs.total_out);
    return out;
}

} // namespace

std::vector<std::uint8_t> zlib_compress(std::span<const std::uint8_t> input, int level) {
    return deflate_bytes(input, level, kZlibWindowBits);
}

std::vector<std::uint8_t> zlib_decompress(std::span<const std::uint8_t> input, std::size_t expectedSize) {
    auto out = inflate_bytes(input, kZlibWindowBits, expectedSize, ErrorKind::CompressionMismatch);
    if (out.size() != expectedSize) {
        throw CodecError(ErrorKind::CompressionMismatch,
                         "declared " + std::to_string(expectedSize) + " bytes, inflated " + std::to_string(out.size()));
    }
    return out;
}

std::vector<std::uint8_t> zlib_decompress_bounded(std::span<const std::uint8_t> input, std::size_t maxSize) {
    return inflate_bytes(input, kZlibWindowBits, maxSize, ErrorKind::ExceededBound);
}

std::vector<std::uint8_t> gzip_compress(std::span<const std::uint8_t> input, int level) {
    return deflate_bytes(input, level, kGzipWindowBits);
}

std::vector<std::uint8_t> gzip_decompress_bounded(std::span<const std::uint8_t> input, std::size_t maxSize) {
    return inflate_bytes(input, kGzipWindowBits, maxSize, ErrorKind::ExceededBound);
}

} // namespace shared::io
