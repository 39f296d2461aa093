#pragma once

#include "endpoint.hpp"

#include "../protocol/frame_codec.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <vector>

namespace shared::transport {

// In-process connection pair. Packets are framed into bytes on send and
// deframed on receive, so both ends run a real FrameCodec.
class LocalTransport {
public:
    struct Shared {
        std::mutex mutex;
        std::vector<std::uint8_t> toServer;
        std::vector<std::uint8_t> toClient;
        bool closed{false};
        std::string closeReason;
    };

    class Endpoint final : public IEndpoint {
    public:
        Endpoint(std::shared_ptr<Shared> shared, bool serverSide)
            : shared_(std::move(shared)), serverSide_(serverSide) {}

        void send(shared::proto::RawPacket packet) override;

        // Throws CodecError when the inbound byte stream is malformed.
        bool try_recv(shared::proto::RawPacket& outPacket) override;

        void set_compression(std::int32_t threshold) override { codec_.set_compression(threshold); }
        void enable_encryption(const shared::io::CipherKey& key) override { codec_.enable_encryption(key); }

        bool is_open() const override;
        void close(const std::string& reason) override;
        std::string peer_name() const override { return serverSide_ ? "local-client" : "local-server"; }

        // Queues bytes as if they came off the wire, bypassing the encoder.
        void send_raw(std::span<const std::uint8_t> bytes);

        std::string close_reason() const;
        const shared::proto::CodecSettings& settings() const { return codec_.settings(); }

    private:
        std::vector<std::uint8_t>& outbox_() { return serverSide_ ? shared_->toClient : shared_->toServer; }
        std::vector<std::uint8_t>& inbox_() { return serverSide_ ? shared_->toServer : shared_->toClient; }

        std::shared_ptr<Shared> shared_;
        bool serverSide_;
        shared::proto::FrameCodec codec_{};
    };

    struct Pair {
        std::shared_ptr<Endpoint> client;
        std::shared_ptr<Endpoint> server;
    };

    static Pair create_pair();
};

} // namespace shared::transport
