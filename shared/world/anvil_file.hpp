#pragma once

#include "region_pos.hpp"
#include "sector.hpp"
#include "sector_allocator.hpp"

#include <array>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace shared::world {

struct StorageError {
    enum class Kind : std::uint8_t {
        Io,
        Corrupt,
    };

    Kind kind{Kind::Io};
    std::string message;
};

const char* to_string(StorageError::Kind kind);

// Parses "r.<x>.<z>.mca".
bool parse_region_file_name(std::string_view name, RegionPos* out);

// One open region file (32x32 chunks).
//
// The location and timestamp tables are mirrored in memory; payloads are read
// from disk on demand. A rewrite that needs a new sector run lands the payload
// and flushes before the location entry is pointed at it, so a crash leaves
// either the old or the new chunk readable.
//
// A location entry that is malformed, runs past the end of the file or overlaps
// another entry marks only its own slot corrupt. Reading that slot reports
// Corrupt; writing or removing it replaces the entry.
class AnvilFile {
public:
    // Consulted before every write with its file offset and size. Returning
    // false fails that write without touching the file.
    using WriteGate = std::function<bool(std::uint64_t offset, std::size_t size)>;

    AnvilFile() = default;
    ~AnvilFile() = default;

    AnvilFile(const AnvilFile&) = delete;
    AnvilFile& operator=(const AnvilFile&) = delete;
    AnvilFile(AnvilFile&&) = default;
    AnvilFile& operator=(AnvilFile&&) = default;

    // Opens <folder>/r.<x>.<z>.mca, creating the folder and an empty file if needed.
    static bool open(const std::filesystem::path& folder, RegionPos pos, AnvilFile* out, StorageError* outError);

    // *out is nullopt when the chunk was never written. Chunks flagged as external
    // are read from c.<x>.<z>.mcc beside the region file.
    bool read_chunk(ChunkPos pos, std::optional<std::vector<std::uint8_t>>* out, StorageError* outError);

    // Stores zlib-compressed; the timestamp becomes the current time.
    bool write_chunk(ChunkPos pos, std::span<const std::uint8_t> data, StorageError* outError);

    // *out is nullopt when the timestamp entry is zero.
    bool chunk_last_written(ChunkPos pos, std::optional<std::uint32_t>* out, StorageError* outError) const;

    bool remove_chunk(ChunkPos pos, StorageError* outError);

    // Slots with a usable location entry; corrupt slots are not listed.
    std::vector<LocalChunkPos> present_chunks() const;

    bool is_corrupt(LocalChunkPos local) const { return corrupt_.count(local.index()) != 0; }
    std::size_t corrupt_count() const { return corrupt_.size(); }

    void set_write_gate(WriteGate gate) { writeGate_ = std::move(gate); }

    SectorPtr location(LocalChunkPos local) const { return locations_[local.index()]; }
    std::uint32_t timestamp(LocalChunkPos local) const { return timestamps_[local.index()]; }

    bool is_open() const { return file_.is_open(); }
    RegionPos position() const { return pos_; }
    const std::filesystem::path& path() const { return path_; }
    const SectorAllocator& allocator() const { return allocator_; }

private:
    enum class EntryCommit : std::uint8_t {
        Written,
        // Nothing reached the location word.
        NotWritten,
        // The location word write failed; the table on disk may hold either value.
        Uncertain,
    };

    bool load_tables_(std::uint64_t fileSize, StorageError* outError);
    bool check_owned_(ChunkPos pos, std::size_t* outIndex, StorageError* outError) const;
    bool read_at_(std::uint64_t offset, std::uint8_t* data, std::size_t size);
    bool write_at_(std::uint64_t offset, const std::uint8_t* data, std::size_t size);
    EntryCommit write_entry_(std::size_t index, StorageError* outError);
    bool decode_payload_(ChunkPos pos, std::uint8_t tag, std::vector<std::uint8_t> payload,
                         std::optional<std::vector<std::uint8_t>>* out, StorageError* outError) const;
    bool read_external_(ChunkPos pos, std::vector<std::uint8_t>* out, StorageError* outError) const;
    void drop_external_(ChunkPos pos) const;
    std::filesystem::path external_path_(ChunkPos pos) const;
    std::string where_(ChunkPos pos) const;

    std::filesystem::path path_{};
    RegionPos pos_{};
    std::fstream file_{};

    std::array<SectorPtr, kTableEntries> locations_{};
    std::array<std::uint32_t, kTableEntries> timestamps_{};
    SectorAllocator allocator_{};

    // Slot index -> why its location entry was rejected at load.
    std::map<std::size_t, std::string> corrupt_{};
    WriteGate writeGate_{};
};

} // namespace shared::world
