#pragma once

#include "../io/cipher.hpp"
#include "../protocol/raw_packet.hpp"

#include <cstdint>
#include <string>

namespace shared::transport {

// One side of a framed packet stream.
//
// Endpoints own the FrameCodec of their connection, so compression and
// encryption are switched here. Both switches affect packets sent after the
// call and frames decoded after the call.
class IEndpoint {
public:
    virtual ~IEndpoint() = default;

    virtual void send(shared::proto::RawPacket packet) = 0;
    virtual bool try_recv(shared::proto::RawPacket& outPacket) = 0;

    virtual void set_compression(std::int32_t threshold) = 0;
    virtual void enable_encryption(const shared::io::CipherKey& key) = 0;

    virtual bool is_open() const = 0;

    // Already queued outbound bytes are still delivered.
    virtual void close(const std::string& reason) = 0;

    virtual std::string peer_name() const = 0;
};

} // namespace shared::transport
