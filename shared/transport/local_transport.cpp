#include "local_transport.hpp"

namespace shared::transport {

void LocalTransport::Endpoint::send(shared::proto::RawPacket packet) {
    std::vector<std::uint8_t> bytes = codec_.encode(packet);

    std::lock_guard lock(shared_->mutex);
    if (shared_->closed) {
        return;
    }
    auto& out = outbox_();
    out.insert(out.end(), bytes.begin(), bytes.end());
}

bool LocalTransport::Endpoint::try_recv(shared::proto::RawPacket& outPacket) {
    {
        std::lock_guard lock(shared_->mutex);
        auto& in = inbox_();
        if (!in.empty()) {
            codec_.feed(in);
            in.clear();
        }
    }

    // Frames are decoded one at a time so a compression or cipher switch made
    // after this packet applies to the next one.
    return codec_.next(outPacket) == shared::proto::DecodeStatus::FrameReady;
}

bool LocalTransport::Endpoint::is_open() const {
    std::lock_guard lock(shared_->mutex);
    return !shared_->closed;
}

void LocalTransport::Endpoint::close(const std::string& reason) {
    std::lock_guard lock(shared_->mutex);
    if (shared_->closed) {
        return;
    }
    shared_->closed = true;
    shared_->closeReason = reason;
}

void LocalTransport::Endpoint::send_raw(std::span<const std::uint8_t> bytes) {
    std::lock_guard lock(shared_->mutex);
    auto& out = outbox_();
    out.insert(out.end(), bytes.begin(), bytes.end());
}

std::string LocalTransport::Endpoint::close_reason() const {
    std::lock_guard lock(shared_->mutex);
    return shared_->closeReason;
}

LocalTransport::Pair LocalTransport::create_pair() {
    auto shared = std::make_shared<Shared>();

    Pair pair;
    pair.client = std::make_shared<Endpoint>(shared, false);
    pair.server = std::make_shared<Endpoint>(shared, true);
    return pair;
}

} // namespace shared::transport
