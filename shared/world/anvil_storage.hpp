#pragma once

#include "anvil_file.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

namespace shared::world {

// A world folder of region files, opened on first use.
// Not thread-safe; the owner serializes access.
class AnvilStorage {
public:
    explicit AnvilStorage(std::filesystem::path folder);

    AnvilStorage(const AnvilStorage&) = delete;
    AnvilStorage& operator=(const AnvilStorage&) = delete;

    bool load_chunk(ChunkPos pos, std::optional<std::vector<std::uint8_t>>* out, StorageError* outError);
    bool save_chunk(ChunkPos pos, std::span<const std::uint8_t> data, StorageError* outError);
    bool chunk_last_written(ChunkPos pos, std::optional<std::uint32_t>* out, StorageError* outError);
    bool remove_chunk(ChunkPos pos, StorageError* outError);

    // Closes the region file if loaded. Returns false when it was not.
    bool unload(RegionPos pos);
    void unload_all() { regions_.clear(); }

    std::size_t loaded_regions() const { return regions_.size(); }
    bool is_loaded(RegionPos pos) const { return regions_.count(pos) != 0; }
    const std::filesystem::path& folder() const { return folder_; }

private:
    AnvilFile* region_(ChunkPos pos, StorageError* outError);

    std::filesystem::path folder_;
    std::unordered_map<RegionPos, AnvilFile> regions_;
};

} // namespace shared::world
