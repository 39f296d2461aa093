/**
 * @file test_local_transport.cpp
 * @brief Unit tests for LocalTransport.
 *
 * Tests FIFO ordering, bidirectional communication, and the codec switches
 * (compression, encryption) applied mid-stream.
 */

#include <catch2/catch_test_macros.hpp>

#include "io/codec_error.hpp"
#include "protocol/frame_codec.hpp"
#include "transport/local_transport.hpp"
#include "test_utils.hpp"

#include <thread>
#include <vector>

using namespace shared::transport;
using namespace shared::proto;

namespace {

RawPacket packet(std::int32_t id, std::vector<std::uint8_t> body = {}) {
    RawPacket p;
    p.id = id;
    p.body = std::move(body);
    return p;
}

shared::io::CipherKey test_key() {
    shared::io::CipherKey k{};
    k.fill(0x42);
    return k;
}

} // namespace

// =============================================================================
// Pair creation tests
// =============================================================================

TEST_CASE("LocalTransport::create_pair creates valid endpoints", "[transport][local]") {
    auto pair = LocalTransport::create_pair();

    REQUIRE(pair.client != nullptr);
    REQUIRE(pair.server != nullptr);
    REQUIRE(pair.client->is_open());
    REQUIRE(pair.client->peer_name() == "local-server");
    REQUIRE(pair.server->peer_name() == "local-client");
}

TEST_CASE("LocalTransport try_recv returns false when empty", "[transport][local]") {
    auto pair = LocalTransport::create_pair();
    RawPacket p;

    SECTION("Client receives nothing initially") {
        REQUIRE_FALSE(pair.client->try_recv(p));
    }

    SECTION("Server receives nothing initially") {
        REQUIRE_FALSE(pair.server->try_recv(p));
    }
}

// =============================================================================
// Message passing
// =============================================================================

TEST_CASE("LocalTransport passes packets both ways", "[transport][local]") {
    auto pair = LocalTransport::create_pair();
    RawPacket p;

    pair.client->send(packet(0x00, {1, 2, 3}));
    REQUIRE(pair.server->try_recv(p));
    REQUIRE(p == packet(0x00, {1, 2, 3}));
    REQUIRE_FALSE(pair.server->try_recv(p));

    pair.server->send(packet(0x24, {9}));
    REQUIRE(pair.client->try_recv(p));
    REQUIRE(p == packet(0x24, {9}));

    // The client never sees its own packets.
    REQUIRE_FALSE(pair.client->try_recv(p));
}

TEST_CASE("LocalTransport maintains FIFO ordering", "[transport][local][fifo]") {
    auto pair = LocalTransport::create_pair();

    for (std::int32_t i = 0; i < 100; ++i) {
        pair.client->send(packet(i, {static_cast<std::uint8_t>(i)}));
    }

    RawPacket p;
    for (std::int32_t i = 0; i < 100; ++i) {
        REQUIRE(pair.server->try_recv(p));
        REQUIRE(p.id == i);
    }
    REQUIRE_FALSE(pair.server->try_recv(p));
}

TEST_CASE("Multiple LocalTransport pairs are independent", "[transport][local]") {
    auto a = LocalTransport::create_pair();
    auto b = LocalTransport::create_pair();

    a.client->send(packet(1));
    RawPacket p;
    REQUIRE_FALSE(b.server->try_recv(p));
    REQUIRE(a.server->try_recv(p));
}

// =============================================================================
// Codec switches
// =============================================================================

TEST_CASE("Compression switches between two packets", "[transport][local][compression]") {
    auto pair = LocalTransport::create_pair();

    // Server announces, then switches; both sides see the switch between the same two frames.
    pair.server->send(packet(0x03, {0x80, 0x02}));
    pair.server->set_compression(256);
    pair.server->send(packet(0x02, std::vector<std::uint8_t>(1000, 0)));

    RawPacket p;
    REQUIRE(pair.client->try_recv(p));
    REQUIRE(p.id == 0x03);
    pair.client->set_compression(256);

    REQUIRE(pair.client->try_recv(p));
    REQUIRE(p.id == 0x02);
    REQUIRE(p.body.size() == 1000);

    REQUIRE(pair.server->settings().compressionThreshold == 256);
}

TEST_CASE("Encryption switches between two packets", "[transport][local][cipher]") {
    auto pair = LocalTransport::create_pair();

    pair.client->send(packet(0x01, {1}));
    pair.client->enable_encryption(test_key());
    pair.client->send(packet(0x00, {2, 3}));

    RawPacket p;
    REQUIRE(pair.server->try_recv(p));
    REQUIRE(p == packet(0x01, {1}));

    pair.server->enable_encryption(test_key());
    REQUIRE(pair.server->try_recv(p));
    REQUIRE(p == packet(0x00, {2, 3}));
}

TEST_CASE("Malformed bytes surface as CodecError", "[transport][local]") {
    auto pair = LocalTransport::create_pair();

    const std::vector<std::uint8_t> zeroLength{0x00};
    pair.client->send_raw(zeroLength);

    RawPacket p;
    REQUIRE_THROWS_AS(pair.server->try_recv(p), shared::io::CodecError);
}

TEST_CASE("Raw bytes arriving in pieces form one packet", "[transport][local]") {
    auto pair = LocalTransport::create_pair();

    FrameEncoder enc;
    const auto bytes = enc.encode(packet(0x05, {7, 7, 7}));

    RawPacket p;
    pair.client->send_raw(std::span<const std::uint8_t>(bytes.data(), 2));
    REQUIRE_FALSE(pair.server->try_recv(p));
    pair.client->send_raw(std::span<const std::uint8_t>(bytes.data() + 2, bytes.size() - 2));
    REQUIRE(pair.server->try_recv(p));
    REQUIRE(p == packet(0x05, {7, 7, 7}));
}

// =============================================================================
// Close
// =============================================================================

TEST_CASE("Closing one end closes both", "[transport][local]") {
    auto pair = LocalTransport::create_pair();

    pair.server->send(packet(0x1B, {1}));
    pair.server->close("kicked");

    REQUIRE_FALSE(pair.server->is_open());
    REQUIRE_FALSE(pair.client->is_open());
    REQUIRE(pair.client->close_reason() == "kicked");

    // Bytes queued before the close are still readable.
    RawPacket p;
    REQUIRE(pair.client->try_recv(p));
    REQUIRE(p.id == 0x1B);

    // Sends after the close are dropped.
    pair.client->send(packet(0x00));
    REQUIRE_FALSE(pair.server->try_recv(p));

    // A second close keeps the first reason.
    pair.client->close("other");
    REQUIRE(pair.server->close_reason() == "kicked");
}

TEST_CASE("LocalTransport is safe across threads", "[transport][local][thread]") {
    auto pair = LocalTransport::create_pair();
    constexpr std::int32_t kCount = 500;

    std::thread producer([&]() {
        for (std::int32_t i = 0; i < kCount; ++i) {
            pair.client->send(packet(i));
        }
    });

    std::int32_t expected = 0;
    RawPacket p;
    const bool done = test_helpers::wait_for([&]() {
        while (pair.server->try_recv(p)) {
            if (p.id != expected) return true;
            ++expected;
        }
        return expected == kCount;
    }, std::chrono::milliseconds(5000));

    producer.join();
    REQUIRE(done);
    REQUIRE(expected == kCount);
}
