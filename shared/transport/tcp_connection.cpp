#include "tcp_connection.hpp"

#include "../core/log.hpp"
#include "../io/codec_error.hpp"

#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <unistd.h>

namespace shared::transport {

namespace {

constexpr std::size_t kReadChunk = 16 * 1024;

} // namespace

TcpConnection::TcpConnection(int fd, std::uint32_t id, std::string peerName)
    : fd_(fd), id_(id), peerName_(std::move(peerName)) {}

TcpConnection::~TcpConnection() {
    shutdown();
}

void TcpConnection::send(shared::proto::RawPacket packet) {
    if (state_ != State::Open) {
        return;
    }

    std::vector<std::uint8_t> bytes;
    try {
        bytes = codec_.encode(packet);
    } catch (const shared::io::CodecError& e) {
        shared::core::logf(0, "codec", "%s: cannot encode packet 0x%02X: %s",
                           peerName_.c_str(), static_cast<unsigned>(packet.id), e.what());
        close(std::string("outbound ") + shared::io::to_string(e.kind()));
        return;
    }

    shared::core::logf(0, "tx", "%s: id=0x%02X len=%zu", peerName_.c_str(),
                       static_cast<unsigned>(packet.id), bytes.size());

    if (pendingPos_ == pending_.size()) {
        pending_.clear();
        pendingPos_ = 0;
    }
    pending_.insert(pending_.end(), bytes.begin(), bytes.end());
}

bool TcpConnection::try_recv(shared::proto::RawPacket& outPacket) {
    if (state_ != State::Open) {
        return false;
    }

    try {
        if (codec_.next(outPacket) != shared::proto::DecodeStatus::FrameReady) {
            return false;
        }
    } catch (const shared::io::CodecError& e) {
        if (e.packet_id()) {
            shared::core::logf(0, "codec", "%s: %s (packet 0x%02X): %s", peerName_.c_str(),
                               shared::io::to_string(e.kind()), static_cast<unsigned>(*e.packet_id()), e.what());
        } else {
            shared::core::logf(0, "codec", "%s: %s: %s", peerName_.c_str(),
                               shared::io::to_string(e.kind()), e.what());
        }
        close(std::string("malformed stream: ") + shared::io::to_string(e.kind()));
        return false;
    }

    shared::core::logf(0, "rx", "%s: id=0x%02X len=%zu", peerName_.c_str(),
                       static_cast<unsigned>(outPacket.id), outPacket.body.size());
    return true;
}

void TcpConnection::close(const std::string& reason) {
    if (state_ != State::Open) {
        return;
    }
    state_ = State::Closing;
    closeReason_ = reason;
    shared::core::logf(0, "init", "%s: closing (%s)", peerName_.c_str(), reason.c_str());
}

bool TcpConnection::on_readable() {
    if (fd_ < 0) {
        return false;
    }

    std::uint8_t buf[kReadChunk];
    for (;;) {
        const ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
        if (n > 0) {
            bytesRecv_ += static_cast<std::uint64_t>(n);
            // Bytes arriving after close() are dropped.
            if (state_ == State::Open) {
                codec_.feed(std::span<const std::uint8_t>(buf, static_cast<std::size_t>(n)));
            }
            continue;
        }
        if (n == 0) {
            if (closeReason_.empty()) closeReason_ = "peer closed";
            state_ = State::Closed;
            return false;
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return true;

        closeReason_ = std::string("recv: ") + std::strerror(errno);
        state_ = State::Closed;
        return false;
    }
}

bool TcpConnection::flush() {
    while (fd_ >= 0 && pendingPos_ < pending_.size()) {
        const ssize_t n = ::send(fd_, pending_.data() + pendingPos_, pending_.size() - pendingPos_, MSG_NOSIGNAL);
        if (n > 0) {
            pendingPos_ += static_cast<std::size_t>(n);
            bytesSent_ += static_cast<std::uint64_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return true;

        closeReason_ = std::string("send: ") + std::strerror(errno);
        state_ = State::Closed;
        return false;
    }

    if (pendingPos_ == pending_.size()) {
        pending_.clear();
        pendingPos_ = 0;
    }
    return true;
}

void TcpConnection::shutdown() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    state_ = State::Closed;
}

} // namespace shared::transport
