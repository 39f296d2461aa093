#pragma once

#include <cstdint>
#include <map>

namespace shared::world {

// Tracks free sector runs of one region file.
//
// Everything from kDataStartSector to end_sector() that is not reserved is
// free. Free runs are kept merged, keyed by start sector.
class SectorAllocator {
public:
    SectorAllocator();

    // Marks a range as used while loading the location table.
    // Returns false when the range overlaps one already reserved.
    bool reserve(std::uint32_t start, std::uint32_t count);

    // First-fit; extends the file when no free run is large enough.
    std::uint32_t allocate(std::uint32_t count);

    void release(std::uint32_t start, std::uint32_t count);

    // Shrinks a run in place, freeing its tail.
    void shrink(std::uint32_t start, std::uint32_t oldCount, std::uint32_t newCount);

    std::uint32_t end_sector() const { return end_; }
    std::uint32_t free_sectors() const;
    const std::map<std::uint32_t, std::uint32_t>& free_runs() const { return free_; }

private:
    void insert_free_(std::uint32_t start, std::uint32_t count);

    std::map<std::uint32_t, std::uint32_t> free_;
    std::uint32_t end_;
};

} // namespace shared::world
