#include "anvil_file.hpp"

#include "../core/log.hpp"
#include "../io/codec_error.hpp"
#include "../io/compression.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <iterator>
#include <system_error>

namespace shared::world {

namespace {

constexpr std::size_t kHeaderBytes = kSectorSize * 2;

std::uint32_t load_u32_be(const std::uint8_t* p) {
    return (static_cast<std::uint32_t>(p[0]) << 24) | (static_cast<std::uint32_t>(p[1]) << 16) |
           (static_cast<std::uint32_t>(p[2]) << 8) | static_cast<std::uint32_t>(p[3]);
}

void store_u32_be(std::uint8_t* p, std::uint32_t v) {
    p[0] = static_cast<std::uint8_t>((v >> 24) & 0xFF);
    p[1] = static_cast<std::uint8_t>((v >> 16) & 0xFF);
    p[2] = static_cast<std::uint8_t>((v >> 8) & 0xFF);
    p[3] = static_cast<std::uint8_t>(v & 0xFF);
}

std::uint32_t now_seconds() {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    const auto secs = std::chrono::duration_cast<std::chrono::seconds>(now).count();
    // Zero means "never written".
    return std::max<std::uint32_t>(1, static_cast<std::uint32_t>(secs));
}

bool fail(StorageError* outError, StorageError::Kind kind, std::string message) {
    if (outError) {
        outError->kind = kind;
        outError->message = std::move(message);
    }
    return false;
}

bool parse_i32(std::string_view s, std::int32_t* out) {
    if (s.empty()) return false;
    const char* first = s.data();
    const char* last = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(first, last, *out);
    return ec == std::errc() && ptr == last;
}

} // namespace

const char* to_string(StorageError::Kind kind) {
    switch (kind) {
        case StorageError::Kind::Io: return "io";
        case StorageError::Kind::Corrupt: return "corrupt";
    }
    return "?";
}

bool parse_region_file_name(std::string_view name, RegionPos* out) {
    if (name.size() < 8 || name.substr(0, 2) != "r." || name.substr(name.size() - 4) != ".mca") {
        return false;
    }
    const std::string_view coords = name.substr(2, name.size() - 6);
    const std::size_t dot = coords.find('.');
    if (dot == std::string_view::npos) return false;

    RegionPos pos;
    if (!parse_i32(coords.substr(0, dot), &pos.x)) return false;
    if (!parse_i32(coords.substr(dot + 1), &pos.z)) return false;
    *out = pos;
    return true;
}

// =============================================================================
// Open
// =============================================================================

bool AnvilFile::open(const std::filesystem::path& folder, RegionPos pos, AnvilFile* out, StorageError* outError) {
    namespace fs = std::filesystem;

    std::error_code ec;
    fs::create_directories(folder, ec);
    if (ec) {
        return fail(outError, StorageError::Kind::Io, "cannot create " + folder.string() + ": " + ec.message());
    }

    AnvilFile f;
    f.path_ = folder / pos.file_name();
    f.pos_ = pos;

    std::uint64_t size = 0;
    if (fs::exists(f.path_, ec)) {
        size = fs::file_size(f.path_, ec);
        if (ec) {
            return fail(outError, StorageError::Kind::Io, "cannot stat " + f.path_.string() + ": " + ec.message());
        }
    }

    if (size == 0) {
        std::ofstream create(f.path_, std::ios::binary | std::ios::trunc);
        const std::vector<char> zeros(kHeaderBytes, 0);
        create.write(zeros.data(), static_cast<std::streamsize>(zeros.size()));
        create.flush();
        if (!create) {
            return fail(outError, StorageError::Kind::Io, "cannot create " + f.path_.string());
        }
        size = kHeaderBytes;
    }

    f.file_.open(f.path_, std::ios::in | std::ios::out | std::ios::binary);
    if (!f.file_.is_open()) {
        return fail(outError, StorageError::Kind::Io, "cannot open " + f.path_.string());
    }

    if (!f.load_tables_(size, outError)) {
        return false;
    }

    *out = std::move(f);
    return true;
}

bool AnvilFile::load_tables_(std::uint64_t fileSize, StorageError* outError) {
    if (fileSize < kHeaderBytes) {
        return fail(outError, StorageError::Kind::Corrupt,
                    path_.string() + ": header truncated (" + std::to_string(fileSize) + " bytes)");
    }

    std::vector<std::uint8_t> header(kHeaderBytes);
    if (!read_at_(0, header.data(), header.size())) {
        return fail(outError, StorageError::Kind::Io, path_.string() + ": cannot read header");
    }

    allocator_ = SectorAllocator();
    corrupt_.clear();
    for (std::size_t i = 0; i < kTableEntries; ++i) {
        locations_[i] = SectorPtr::from_raw(load_u32_be(&header[i * 4]));
        timestamps_[i] = load_u32_be(&header[kSectorSize + i * 4]);
    }

    // Reserve in file order so holes become free runs.
    std::vector<std::size_t> order;
    for (std::size_t i = 0; i < kTableEntries; ++i) {
        if (locations_[i].present()) order.push_back(i);
    }
    std::sort(order.begin(), order.end(), [this](std::size_t a, std::size_t b) {
        return locations_[a].index < locations_[b].index;
    });

    // A rejected entry never reaches the allocator; the first of two
    // overlapping entries keeps its run.
    for (std::size_t i : order) {
        const SectorPtr p = locations_[i];
        const char* reason = nullptr;
        if (p.index < kDataStartSector || p.count == 0) {
            reason = "bad location entry";
        } else if (static_cast<std::uint64_t>(p.end()) * kSectorSize > fileSize) {
            reason = "sectors past end of file";
        } else if (!allocator_.reserve(p.index, p.count)) {
            reason = "overlapping sector range";
        }

        if (reason) {
            const std::string message = path_.string() + " slot " + std::to_string(i) + ": " + reason;
            shared::core::logf(0, "world", "%s (sector %u x%u), slot ignored", message.c_str(), p.index, p.count);
            corrupt_[i] = message;
        }
    }
    return true;
}

// =============================================================================
// Chunk access
// =============================================================================

bool AnvilFile::read_chunk(ChunkPos pos, std::optional<std::vector<std::uint8_t>>* out, StorageError* outError) {
    std::size_t index = 0;
    if (!check_owned_(pos, &index, outError)) return false;

    if (auto it = corrupt_.find(index); it != corrupt_.end()) {
        return fail(outError, StorageError::Kind::Corrupt, it->second);
    }

    const SectorPtr p = locations_[index];
    if (!p.present()) {
        *out = std::nullopt;
        return true;
    }

    const std::uint64_t offset = static_cast<std::uint64_t>(p.index) * kSectorSize;
    std::uint8_t head[kChunkHeaderSize];
    if (!read_at_(offset, head, sizeof(head))) {
        return fail(outError, StorageError::Kind::Corrupt, where_(pos) + ": chunk header past end of file");
    }

    const std::uint32_t length = load_u32_be(head);
    if (length == 0 || length > p.count * kSectorSize - 4) {
        return fail(outError, StorageError::Kind::Corrupt,
                    where_(pos) + ": bad chunk length " + std::to_string(length));
    }

    std::vector<std::uint8_t> payload(length - 1);
    if (!payload.empty() && !read_at_(offset + kChunkHeaderSize, payload.data(), payload.size())) {
        return fail(outError, StorageError::Kind::Corrupt, where_(pos) + ": chunk payload past end of file");
    }

    const std::uint8_t tag = head[4];
    if (tag & kExternalFlag) {
        if (!read_external_(pos, &payload, outError)) return false;
    }
    return decode_payload_(pos, static_cast<std::uint8_t>(tag & ~kExternalFlag), std::move(payload), out, outError);
}

bool AnvilFile::write_chunk(ChunkPos pos, std::span<const std::uint8_t> data, StorageError* outError) {
    std::size_t index = 0;
    if (!check_owned_(pos, &index, outError)) return false;

    const std::vector<std::uint8_t> compressed = shared::io::zlib_compress(data);
    const std::uint32_t needed = sectors_for(kChunkHeaderSize + compressed.size());
    if (needed > kMaxSectorCount) {
        return fail(outError, StorageError::Kind::Io,
                    where_(pos) + ": chunk too large (" + std::to_string(needed) + " sectors)");
    }

    std::vector<std::uint8_t> buf(static_cast<std::size_t>(needed) * kSectorSize, 0);
    store_u32_be(buf.data(), static_cast<std::uint32_t>(compressed.size() + 1));
    buf[4] = static_cast<std::uint8_t>(CompressionTag::Zlib);
    std::copy(compressed.begin(), compressed.end(), buf.begin() + kChunkHeaderSize);

    const SectorPtr old = locations_[index];
    const std::uint32_t oldTimestamp = timestamps_[index];
    // A corrupt slot's run was never reserved, so it is not ours to reuse or free.
    const bool ownsRun = old.present() && corrupt_.count(index) == 0;

    if (ownsRun && needed <= old.count) {
        if (!write_at_(static_cast<std::uint64_t>(old.index) * kSectorSize, buf.data(), buf.size())) {
            return fail(outError, StorageError::Kind::Io, where_(pos) + ": payload write failed");
        }
        locations_[index] = SectorPtr{old.index, needed};
        timestamps_[index] = now_seconds();
        if (write_entry_(index, outError) != EntryCommit::Written) {
            // Either count leaves the whole old run reserved.
            locations_[index] = old;
            timestamps_[index] = oldTimestamp;
            return false;
        }
        allocator_.shrink(old.index, old.count, needed);
        drop_external_(pos);
        return true;
    }

    const std::uint32_t start = allocator_.allocate(needed);
    if (!write_at_(static_cast<std::uint64_t>(start) * kSectorSize, buf.data(), buf.size())) {
        allocator_.release(start, needed);
        return fail(outError, StorageError::Kind::Io, where_(pos) + ": payload write failed");
    }

    locations_[index] = SectorPtr{start, needed};
    timestamps_[index] = now_seconds();
    const EntryCommit commit = write_entry_(index, outError);
    if (commit != EntryCommit::Written) {
        locations_[index] = old;
        timestamps_[index] = oldTimestamp;
        // An uncertain commit may have pointed the table at the new run; keep it reserved.
        if (commit == EntryCommit::NotWritten) {
            allocator_.release(start, needed);
        }
        return false;
    }

    corrupt_.erase(index);
    if (ownsRun) {
        allocator_.release(old.index, old.count);
    }
    drop_external_(pos);
    return true;
}

bool AnvilFile::chunk_last_written(ChunkPos pos, std::optional<std::uint32_t>* out, StorageError* outError) const {
    std::size_t index = 0;
    if (!check_owned_(pos, &index, outError)) return false;

    const std::uint32_t ts = timestamps_[index];
    *out = (ts == 0) ? std::nullopt : std::optional<std::uint32_t>(ts);
    return true;
}

bool AnvilFile::remove_chunk(ChunkPos pos, StorageError* outError) {
    std::size_t index = 0;
    if (!check_owned_(pos, &index, outError)) return false;

    const SectorPtr old = locations_[index];
    const std::uint32_t oldTimestamp = timestamps_[index];
    if (!old.present()) return true;

    const bool ownsRun = corrupt_.count(index) == 0;

    locations_[index] = SectorPtr{};
    timestamps_[index] = 0;
    if (write_entry_(index, outError) != EntryCommit::Written) {
        // The run stays reserved whichever word is on disk.
        locations_[index] = old;
        timestamps_[index] = oldTimestamp;
        return false;
    }

    corrupt_.erase(index);
    if (ownsRun) {
        allocator_.release(old.index, old.count);
    }
    drop_external_(pos);
    return true;
}

std::vector<LocalChunkPos> AnvilFile::present_chunks() const {
    std::vector<LocalChunkPos> out;
    for (std::size_t i = 0; i < kTableEntries; ++i) {
        if (locations_[i].present() && corrupt_.count(i) == 0) {
            out.push_back(LocalChunkPos::from_index(i));
        }
    }
    return out;
}

// =============================================================================
// Internals
// =============================================================================

bool AnvilFile::check_owned_(ChunkPos pos, std::size_t* outIndex, StorageError* outError) const {
    if (!file_.is_open()) {
        return fail(outError, StorageError::Kind::Io, "region file is not open");
    }
    if (!(RegionPos::from_chunk(pos) == pos_)) {
        return fail(outError, StorageError::Kind::Io, where_(pos) + ": chunk belongs to another region");
    }
    *outIndex = LocalChunkPos::from_chunk(pos).index();
    return true;
}

bool AnvilFile::read_at_(std::uint64_t offset, std::uint8_t* data, std::size_t size) {
    file_.clear();
    file_.seekg(static_cast<std::streamoff>(offset));
    file_.read(reinterpret_cast<char*>(data), static_cast<std::streamsize>(size));
    const bool ok = static_cast<bool>(file_) && file_.gcount() == static_cast<std::streamsize>(size);
    file_.clear();
    return ok;
}

bool AnvilFile::write_at_(std::uint64_t offset, const std::uint8_t* data, std::size_t size) {
    if (writeGate_ && !writeGate_(offset, size)) {
        return false;
    }
    file_.clear();
    file_.seekp(static_cast<std::streamoff>(offset));
    file_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    file_.flush();
    const bool ok = static_cast<bool>(file_);
    file_.clear();
    return ok;
}

// The timestamp goes first; the location word is the commit point.
AnvilFile::EntryCommit AnvilFile::write_entry_(std::size_t index, StorageError* outError) {
    std::uint8_t loc[4];
    std::uint8_t ts[4];
    store_u32_be(loc, locations_[index].raw());
    store_u32_be(ts, timestamps_[index]);

    const std::string slot = path_.string() + " slot " + std::to_string(index);
    if (!write_at_(kSectorSize + index * 4, ts, sizeof(ts))) {
        (void)fail(outError, StorageError::Kind::Io, slot + ": timestamp write failed");
        return EntryCommit::NotWritten;
    }
    if (!write_at_(index * 4, loc, sizeof(loc))) {
        (void)fail(outError, StorageError::Kind::Io, slot + ": location write failed");
        return EntryCommit::Uncertain;
    }
    return EntryCommit::Written;
}

bool AnvilFile::decode_payload_(ChunkPos pos, std::uint8_t tag, std::vector<std::uint8_t> payload,
                                std::optional<std::vector<std::uint8_t>>* out, StorageError* outError) const {
    try {
        switch (static_cast<CompressionTag>(tag)) {
            case CompressionTag::GZip:
                *out = shared::io::gzip_decompress_bounded(payload);
                return true;
            case CompressionTag::Zlib:
                *out = shared::io::zlib_decompress_bounded(payload);
                return true;
            case CompressionTag::None:
                *out = std::move(payload);
                return true;
        }
    } catch (const shared::io::CodecError& e) {
        return fail(outError, StorageError::Kind::Corrupt, where_(pos) + ": " + e.what());
    }

    return fail(outError, StorageError::Kind::Corrupt,
                where_(pos) + ": unknown compression tag " + std::to_string(tag));
}

std::filesystem::path AnvilFile::external_path_(ChunkPos pos) const {
    return path_.parent_path() / ("c." + std::to_string(pos.x) + "." + std::to_string(pos.z) + ".mcc");
}

bool AnvilFile::read_external_(ChunkPos pos, std::vector<std::uint8_t>* out, StorageError* outError) const {
    const std::filesystem::path ext = external_path_(pos);

    std::ifstream in(ext, std::ios::binary);
    if (!in.is_open()) {
        return fail(outError, StorageError::Kind::Corrupt, where_(pos) + ": external payload " + ext.string() + " missing");
    }

    std::vector<std::uint8_t> data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return fail(outError, StorageError::Kind::Io, where_(pos) + ": cannot read " + ext.string());
    }
    *out = std::move(data);
    return true;
}

void AnvilFile::drop_external_(ChunkPos pos) const {
    std::error_code ec;
    const std::filesystem::path ext = external_path_(pos);
    if (std::filesystem::remove(ext, ec)) {
        shared::core::logf(0, "world", "removed stale %s", ext.string().c_str());
    } else if (ec) {
        shared::core::logf(0, "world", "cannot remove %s: %s", ext.string().c_str(), ec.message().c_str());
    }
}

std::string AnvilFile::where_(ChunkPos pos) const {
    return path_.string() + " chunk (" + std::to_string(pos.x) + ", " + std::to_string(pos.z) + ")";
}

} // namespace shared::world
