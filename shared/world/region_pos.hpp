#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace shared::world {

constexpr std::int32_t kRegionSize = 32;
constexpr std::int32_t kChunksPerRegion = kRegionSize * kRegionSize;

struct ChunkPos {
    std::int32_t x{0};
    std::int32_t z{0};

    bool operator==(const ChunkPos&) const = default;
};

struct RegionPos {
    std::int32_t x{0};
    std::int32_t z{0};

    bool operator==(const RegionPos&) const = default;

    // Floor division, so chunk -1 lives in region -1.
    static RegionPos from_chunk(ChunkPos c) {
        return RegionPos{floor_div_(c.x), floor_div_(c.z)};
    }

    // "r.<x>.<z>.mca"
    std::string file_name() const {
        return "r." + std::to_string(x) + "." + std::to_string(z) + ".mca";
    }

private:
    static std::int32_t floor_div_(std::int32_t v) {
        return (v >= 0) ? v / kRegionSize : (v - kRegionSize + 1) / kRegionSize;
    }
};

// Position of a chunk inside its region, both axes in [0, 32).
struct LocalChunkPos {
    std::int32_t x{0};
    std::int32_t z{0};

    bool operator==(const LocalChunkPos&) const = default;

    static LocalChunkPos from_chunk(ChunkPos c) {
        return LocalChunkPos{euclid_mod_(c.x), euclid_mod_(c.z)};
    }

    static LocalChunkPos from_index(std::size_t index) {
        return LocalChunkPos{static_cast<std::int32_t>(index % kRegionSize),
                             static_cast<std::int32_t>(index / kRegionSize)};
    }

    // Slot in the location/timestamp tables.
    std::size_t index() const {
        return static_cast<std::size_t>(x) + static_cast<std::size_t>(z) * kRegionSize;
    }

private:
    static std::int32_t euclid_mod_(std::int32_t v) {
        const std::int32_t m = v % kRegionSize;
        return (m < 0) ? m + kRegionSize : m;
    }
};

} // namespace shared::world

template <>
struct std::hash<shared::world::RegionPos> {
    std::size_t operator()(const shared::world::RegionPos& p) const noexcept {
        return std::hash<std::int64_t>{}((static_cast<std::int64_t>(p.x) << 32) | static_cast<std::uint32_t>(p.z));
    }
};
