#pragma once

#include "../io/byte_buffer.hpp"

#include <cstdint>
#include <vector>

namespace shared::proto {

// One de-framed packet: numeric id plus undecoded body.
struct RawPacket {
    std::int32_t id{0};
    std::vector<std::uint8_t> body{};

    // Length field of an uncompressed frame (id + body).
    std::size_t len() const {
        return shared::io::var_int_size(id) + body.size();
    }

    bool operator==(const RawPacket&) const = default;
};

} // namespace shared::proto
