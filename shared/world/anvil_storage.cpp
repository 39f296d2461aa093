#include "anvil_storage.hpp"

#include "../core/log.hpp"

#include <utility>

namespace shared::world {

AnvilStorage::AnvilStorage(std::filesystem::path folder)
    : folder_(std::move(folder)) {}

bool AnvilStorage::load_chunk(ChunkPos pos, std::optional<std::vector<std::uint8_t>>* out, StorageError* outError) {
    AnvilFile* f = region_(pos, outError);
    return f && f->read_chunk(pos, out, outError);
}

bool AnvilStorage::save_chunk(ChunkPos pos, std::span<const std::uint8_t> data, StorageError* outError) {
    AnvilFile* f = region_(pos, outError);
    return f && f->write_chunk(pos, data, outError);
}

bool AnvilStorage::chunk_last_written(ChunkPos pos, std::optional<std::uint32_t>* out, StorageError* outError) {
    AnvilFile* f = region_(pos, outError);
    return f && f->chunk_last_written(pos, out, outError);
}

bool AnvilStorage::remove_chunk(ChunkPos pos, StorageError* outError) {
    AnvilFile* f = region_(pos, outError);
    return f && f->remove_chunk(pos, outError);
}

bool AnvilStorage::unload(RegionPos pos) {
    if (regions_.erase(pos) == 0) return false;
    shared::core::logf(0, "world", "unloaded region %d,%d", pos.x, pos.z);
    return true;
}

AnvilFile* AnvilStorage::region_(ChunkPos pos, StorageError* outError) {
    const RegionPos rp = RegionPos::from_chunk(pos);

    auto it = regions_.find(rp);
    if (it != regions_.end()) {
        return &it->second;
    }

    AnvilFile f;
    if (!AnvilFile::open(folder_, rp, &f, outError)) {
        if (outError) {
            shared::core::logf(0, "world", "open %s failed: %s", rp.file_name().c_str(), outError->message.c_str());
        }
        return nullptr;
    }

    shared::core::logf(0, "world", "opened %s (%zu chunks)", f.path().string().c_str(), f.present_chunks().size());
    auto [inserted, ok] = regions_.emplace(rp, std::move(f));
    (void)ok;
    return &inserted->second;
}

} // namespace shared::world
