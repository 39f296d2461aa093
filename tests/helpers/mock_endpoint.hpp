#pragma once

/**
 * @file mock_endpoint.hpp
 * @brief Mock transport endpoint for testing.
 *
 * Provides a controllable endpoint implementation for unit testing
 * components that depend on IEndpoint without any framing in between.
 */

#include "transport/endpoint.hpp"
#include "protocol/raw_packet.hpp"

#include <cstdint>
#include <optional>
#include <queue>
#include <string>
#include <vector>

namespace test_helpers {

/**
 * @brief Mock endpoint that records sent packets and allows injecting received ones.
 *
 * Usage:
 *   auto endpoint = std::make_shared<MockEndpoint>();
 *   endpoint->inject_packet(RawPacket{0x00, {...}});  // Simulate incoming
 *   session.update(1);
 *   REQUIRE(endpoint->sent().size() == 1);           // Check outgoing
 */
class MockEndpoint final : public shared::transport::IEndpoint {
public:
    void send(shared::proto::RawPacket packet) override {
        if (closed_) return;
        sent_packets_.push_back(std::move(packet));
    }

    bool try_recv(shared::proto::RawPacket& outPacket) override {
        if (incoming_queue_.empty()) {
            return false;
        }
        outPacket = std::move(incoming_queue_.front());
        incoming_queue_.pop();
        return true;
    }

    void set_compression(std::int32_t threshold) override {
        compression_ = threshold;
    }

    void enable_encryption(const shared::io::CipherKey& key) override {
        encryption_ = key;
    }

    bool is_open() const override { return !closed_; }

    void close(const std::string& reason) override {
        if (closed_) return;
        closed_ = true;
        close_reason_ = reason;
    }

    std::string peer_name() const override { return "mock"; }

    // =========================================================================
    // Test helpers
    // =========================================================================

    /** @brief Inject a packet to be received by the component under test. */
    void inject_packet(shared::proto::RawPacket packet) {
        incoming_queue_.push(std::move(packet));
    }

    /** @brief Get all packets sent by the component under test. */
    const std::vector<shared::proto::RawPacket>& sent() const {
        return sent_packets_;
    }

    /** @brief Clear all sent packets and the incoming queue. */
    void clear() {
        sent_packets_.clear();
        while (!incoming_queue_.empty()) {
            incoming_queue_.pop();
        }
    }

    std::size_t pending_count() const { return incoming_queue_.size(); }
    std::size_t sent_count() const { return sent_packets_.size(); }

    const std::optional<std::int32_t>& compression() const { return compression_; }
    const std::optional<shared::io::CipherKey>& encryption() const { return encryption_; }
    const std::string& close_reason() const { return close_reason_; }

private:
    std::vector<shared::proto::RawPacket> sent_packets_;
    std::queue<shared::proto::RawPacket> incoming_queue_;
    std::optional<std::int32_t> compression_;
    std::optional<shared::io::CipherKey> encryption_;
    bool closed_{false};
    std::string close_reason_;
};

} // namespace test_helpers
