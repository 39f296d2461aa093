#pragma once

#include "endpoint.hpp"

#include "../protocol/frame_codec.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace shared::transport {

// Non-blocking TCP stream endpoint, driven by TcpServer::poll.
//
// Inbound bytes are fed to the codec as they arrive and deframed lazily by
// try_recv. Outbound frames are queued and written when the socket accepts
// them. A malformed inbound stream is logged under "codec" and closes the
// connection.
class TcpConnection final : public IEndpoint {
public:
    enum class State : std::uint8_t {
        Open,
        Closing,
        Closed,
    };

    TcpConnection(int fd, std::uint32_t id, std::string peerName);
    ~TcpConnection() override;

    TcpConnection(const TcpConnection&) = delete;
    TcpConnection& operator=(const TcpConnection&) = delete;

    void send(shared::proto::RawPacket packet) override;
    bool try_recv(shared::proto::RawPacket& outPacket) override;

    void set_compression(std::int32_t threshold) override { codec_.set_compression(threshold); }
    void enable_encryption(const shared::io::CipherKey& key) override { codec_.enable_encryption(key); }

    bool is_open() const override { return state_ == State::Open; }
    void close(const std::string& reason) override;
    std::string peer_name() const override { return peerName_; }

    // =========================================================================
    // Driven by TcpServer
    // =========================================================================

    // Reads everything available. Returns false once the peer hung up or the socket failed.
    bool on_readable();

    // Writes as much pending output as the socket takes. Returns false on a socket error.
    bool flush();

    bool wants_write() const { return pendingPos_ < pending_.size(); }

    // Closed, or closing with nothing left to write.
    bool finished() const { return state_ == State::Closed || (state_ == State::Closing && !wants_write()); }

    // Releases the socket.
    void shutdown();

    int fd() const { return fd_; }
    std::uint32_t id() const { return id_; }
    State state() const { return state_; }
    const std::string& close_reason() const { return closeReason_; }

    std::uint64_t bytes_sent() const { return bytesSent_; }
    std::uint64_t bytes_received() const { return bytesRecv_; }

private:
    int fd_{-1};
    std::uint32_t id_{0};
    std::string peerName_;
    State state_{State::Open};
    std::string closeReason_;

    shared::proto::FrameCodec codec_{};
    std::vector<std::uint8_t> pending_{};
    std::size_t pendingPos_{0};

    std::uint64_t bytesSent_{0};
    std::uint64_t bytesRecv_{0};
};

} // namespace shared::transport
