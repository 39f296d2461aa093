#include "sector_allocator.hpp"

#include "sector.hpp"

#include <iterator>

namespace shared::world {

SectorAllocator::SectorAllocator() : end_(kDataStartSector) {}

bool SectorAllocator::reserve(std::uint32_t start, std::uint32_t count) {
    if (count == 0 || start < kDataStartSector) return false;
    const std::uint32_t stop = start + count;

    if (start >= end_) {
        if (start > end_) {
            insert_free_(end_, start - end_);
        }
        end_ = stop;
        return true;
    }

    // Below the end the range has to sit inside a single free run.
    auto it = free_.upper_bound(start);
    if (it == free_.begin()) return false;
    --it;

    const std::uint32_t runStart = it->first;
    const std::uint32_t runEnd = runStart + it->second;
    if (start >= runEnd || stop > runEnd) return false;

    free_.erase(it);
    if (runStart < start) free_[runStart] = start - runStart;
    if (stop < runEnd) free_[stop] = runEnd - stop;
    return true;
}

std::uint32_t SectorAllocator::allocate(std::uint32_t count) {
    for (auto it = free_.begin(); it != free_.end(); ++it) {
        if (it->second < count) continue;

        const std::uint32_t start = it->first;
        const std::uint32_t len = it->second;
        free_.erase(it);
        if (len > count) {
            free_[start + count] = len - count;
        }
        return start;
    }

    const std::uint32_t start = end_;
    end_ += count;
    return start;
}

void SectorAllocator::release(std::uint32_t start, std::uint32_t count) {
    if (count == 0) return;
    insert_free_(start, count);

    // A free run touching the end just moves the end back.
    if (!free_.empty()) {
        auto last = std::prev(free_.end());
        if (last->first + last->second >= end_) {
            end_ = last->first;
            free_.erase(last);
        }
    }
}

void SectorAllocator::shrink(std::uint32_t start, std::uint32_t oldCount, std::uint32_t newCount) {
    if (newCount >= oldCount) return;
    release(start + newCount, oldCount - newCount);
}

std::uint32_t SectorAllocator::free_sectors() const {
    std::uint32_t total = 0;
    for (const auto& [start, len] : free_) {
        (void)start;
        total += len;
    }
    return total;
}

void SectorAllocator::insert_free_(std::uint32_t start, std::uint32_t count) {
    std::uint32_t s = start;
    std::uint32_t e = start + count;

    auto next = free_.lower_bound(s);
    if (next != free_.begin()) {
        auto prev = std::prev(next);
        if (prev->first + prev->second >= s) {
            s = prev->first;
            if (prev->first + prev->second > e) e = prev->first + prev->second;
            free_.erase(prev);
        }
    }

    next = free_.lower_bound(s);
    while (next != free_.end() && next->first <= e) {
        if (next->first + next->second > e) e = next->first + next->second;
        next = free_.erase(next);
    }

    free_[s] = e - s;
}

} // namespace shared::world
