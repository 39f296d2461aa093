#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace shared::io {

// Hard cap on any inflated payload (packet bodies and chunk NBT alike).
constexpr std::size_t kMaxDecompressedSize = 8 * 1024 * 1024;

constexpr int kDefaultCompressionLevel = 6;

// zlib-wrapped deflate (protocol frames, region tag 2).
std::vector<std::uint8_t> zlib_compress(std::span<const std::uint8_t> input, int level = kDefaultCompressionLevel);

// Inflates and requires exactly expectedSize bytes of output.
// Throws CodecError(CompressionMismatch) on any other size, InvalidEncoding on a bad stream.
std::vector<std::uint8_t> zlib_decompress(std::span<const std::uint8_t> input, std::size_t expectedSize);

// Inflates a stream of unknown output size. Throws CodecError(ExceededBound) past maxSize.
std::vector<std::uint8_t> zlib_decompress_bounded(std::span<const std::uint8_t> input,
                                                  std::size_t maxSize = kMaxDecompressedSize);

// gzip framing (region tag 1).
std::vector<std::uint8_t> gzip_compress(std::span<const std::uint8_t> input, int level = kDefaultCompressionLevel);
std::vector<std::uint8_t> gzip_decompress_bounded(std::span<const std::uint8_t> input,
                                                  std::size_t maxSize = kMaxDecompressedSize);

} // namespace shared::io
