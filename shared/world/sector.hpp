#pragma once

// Region file layout:
//   sector 0      1024 x u32 location entries (BE): sector index << 8 | sector count
//   sector 1      1024 x u32 last-write timestamps (BE, seconds since epoch)
//   sector 2..    chunk payloads, each padded to whole sectors:
//                 u32 length (BE, includes the tag byte), u8 compression tag, data

#include <cstddef>
#include <cstdint>

namespace shared::world {

constexpr std::size_t kSectorSize = 4096;
constexpr std::size_t kTableEntries = 1024;
constexpr std::uint32_t kDataStartSector = 2;
constexpr std::uint32_t kMaxSectorCount = 255;

// Length prefix plus compression tag.
constexpr std::size_t kChunkHeaderSize = 5;

enum class CompressionTag : std::uint8_t {
    GZip = 1,
    Zlib = 2,
    None = 3,
};

// Set on the tag byte when the payload lives in c.<x>.<z>.mcc instead.
constexpr std::uint8_t kExternalFlag = 0x80;

struct SectorPtr {
    std::uint32_t index{0};
    std::uint32_t count{0};

    static SectorPtr from_raw(std::uint32_t raw) { return SectorPtr{raw >> 8, raw & 0xFFu}; }
    std::uint32_t raw() const { return (index << 8) | (count & 0xFFu); }

    bool present() const { return index != 0 || count != 0; }
    std::uint32_t end() const { return index + count; }

    bool operator==(const SectorPtr&) const = default;
};

constexpr std::uint32_t sectors_for(std::size_t bytes) {
    return static_cast<std::uint32_t>((bytes + kSectorSize - 1) / kSectorSize);
}

} // namespace shared::world
