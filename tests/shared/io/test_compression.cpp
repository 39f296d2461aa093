/**
 * @file test_compression.cpp
 * @brief Unit tests for the zlib/gzip helpers.
 */

#include <catch2/catch_test_macros.hpp>

#include "io/codec_error.hpp"
#include "io/compression.hpp"
#include "test_utils.hpp"

#include <cstdint>
#include <vector>

using namespace shared::io;

TEST_CASE("zlib round-trips repetitive data", "[io][compression]") {
    const std::vector<std::uint8_t> zeros(1000, 0);

    const auto packed = zlib_compress(zeros);
    REQUIRE(packed.size() < zeros.size());
    // zlib header (CMF 0x78).
    REQUIRE(packed[0] == 0x78);

    REQUIRE(zlib_decompress(packed, zeros.size()) == zeros);
    REQUIRE(zlib_decompress_bounded(packed) == zeros);
}

TEST_CASE("zlib round-trips incompressible data", "[io][compression]") {
    const auto noise = test_helpers::random_bytes(64 * 1024, 7);
    const auto packed = zlib_compress(noise);
    REQUIRE(zlib_decompress(packed, noise.size()) == noise);
}

TEST_CASE("Declared size must match the inflated size", "[io][compression]") {
    const std::vector<std::uint8_t> data(500, 0x41);
    const auto packed = zlib_compress(data);

    SECTION("Declared too small") {
        try {
            (void)zlib_decompress(packed, 499);
            FAIL("expected CodecError");
        } catch (const CodecError& e) {
            REQUIRE(e.kind() == ErrorKind::CompressionMismatch);
        }
    }

    SECTION("Declared too large") {
        try {
            (void)zlib_decompress(packed, 501);
            FAIL("expected CodecError");
        } catch (const CodecError& e) {
            REQUIRE(e.kind() == ErrorKind::CompressionMismatch);
        }
    }
}

TEST_CASE("Bounded inflate stops at the limit", "[io][compression]") {
    const std::vector<std::uint8_t> big(100000, 0);
    const auto packed = zlib_compress(big);

    try {
        (void)zlib_decompress_bounded(packed, 4096);
        FAIL("expected CodecError");
    } catch (const CodecError& e) {
        REQUIRE(e.kind() == ErrorKind::ExceededBound);
    }

    REQUIRE(zlib_decompress_bounded(packed, big.size()).size() == big.size());
}

TEST_CASE("Garbage and truncated streams are InvalidEncoding", "[io][compression]") {
    SECTION("Not a zlib stream") {
        const std::vector<std::uint8_t> junk{0x01, 0x02, 0x03, 0x04, 0x05};
        try {
            (void)zlib_decompress_bounded(junk);
            FAIL("expected CodecError");
        } catch (const CodecError& e) {
            REQUIRE(e.kind() == ErrorKind::InvalidEncoding);
        }
    }

    SECTION("Stream cut in half") {
        const auto noise = test_helpers::random_bytes(2000, 3);
        auto packed = zlib_compress(noise);
        packed.resize(packed.size() / 2);
        try {
            (void)zlib_decompress(packed, noise.size());
            FAIL("expected CodecError");
        } catch (const CodecError& e) {
            REQUIRE(e.kind() == ErrorKind::InvalidEncoding);
        }
    }
}

TEST_CASE("gzip framing round-trips", "[io][compression]") {
    const auto data = test_helpers::random_bytes(3000, 11);
    const auto packed = gzip_compress(data);
    REQUIRE(packed[0] == 0x1F);
    REQUIRE(packed[1] == 0x8B);
    REQUIRE(gzip_decompress_bounded(packed) == data);

    // A gzip stream is not a zlib stream.
    REQUIRE_THROWS_AS(zlib_decompress_bounded(packed), CodecError);
}
