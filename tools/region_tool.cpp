// region_tool - inspect and edit Anvil region files.
//
// Usage:
//   region_tool info <r.X.Z.mca>
//   region_tool extract <world-dir> <chunkX> <chunkZ> <out-file>
//   region_tool import <world-dir> <chunkX> <chunkZ> <in-file>
//
// Chunk payloads are handled as raw (decompressed) bytes; import stores them
// zlib-compressed like the server does.

#include "core/log.hpp"
#include "world/anvil_file.hpp"
#include "world/anvil_storage.hpp"

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <command> [args]\n"
              << "\n"
              << "Commands:\n"
              << "  info <r.X.Z.mca>                      List stored chunks.\n"
              << "  extract <world> <cx> <cz> <out-file>  Write a chunk's decompressed bytes.\n"
              << "  import <world> <cx> <cz> <in-file>    Store a file as a chunk.\n";
}

bool parse_coord(const char* s, std::int32_t* out) {
    try {
        std::size_t idx = 0;
        const std::string str = s;
        const int v = std::stoi(str, &idx, 10);
        if (idx != str.size()) return false;
        *out = v;
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

std::string format_time(std::uint32_t ts) {
    const std::time_t t = static_cast<std::time_t>(ts);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    if (std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm) == 0) return std::to_string(ts);
    return buf;
}

int cmd_info(const fs::path& file) {
    shared::world::RegionPos pos;
    if (!shared::world::parse_region_file_name(file.filename().string(), &pos)) {
        std::cerr << "Error: " << file << " is not named r.<x>.<z>.mca\n";
        return 1;
    }
    if (!fs::exists(file)) {
        std::cerr << "Error: " << file << " does not exist\n";
        return 1;
    }

    shared::world::AnvilFile region;
    shared::world::StorageError err;
    if (!shared::world::AnvilFile::open(file.parent_path().empty() ? fs::path(".") : file.parent_path(), pos, &region, &err)) {
        std::cerr << "Error (" << shared::world::to_string(err.kind) << "): " << err.message << "\n";
        return 1;
    }

    const auto chunks = region.present_chunks();
    std::cout << file.string() << ": region " << pos.x << "," << pos.z << ", " << chunks.size() << " chunks, "
              << region.allocator().end_sector() << " sectors used, " << region.allocator().free_sectors()
              << " free\n";

    for (const auto& local : chunks) {
        const auto loc = region.location(local);
        const std::int32_t cx = pos.x * shared::world::kRegionSize + local.x;
        const std::int32_t cz = pos.z * shared::world::kRegionSize + local.z;
        std::cout << "  chunk " << cx << "," << cz << "  sector " << loc.index << " x" << loc.count << "  written "
                  << format_time(region.timestamp(local)) << "\n";
    }
    return 0;
}

int cmd_extract(const fs::path& world, shared::world::ChunkPos pos, const fs::path& out) {
    shared::world::AnvilStorage storage(world);
    std::optional<std::vector<std::uint8_t>> data;
    shared::world::StorageError err;
    if (!storage.load_chunk(pos, &data, &err)) {
        std::cerr << "Error (" << shared::world::to_string(err.kind) << "): " << err.message << "\n";
        return 1;
    }
    if (!data) {
        std::cerr << "Error: chunk " << pos.x << "," << pos.z << " is not stored\n";
        return 1;
    }

    std::ofstream f(out, std::ios::binary | std::ios::trunc);
    f.write(reinterpret_cast<const char*>(data->data()), static_cast<std::streamsize>(data->size()));
    if (!f) {
        std::cerr << "Error: cannot write " << out << "\n";
        return 1;
    }
    std::cout << "Extracted " << data->size() << " bytes to " << out.string() << "\n";
    return 0;
}

int cmd_import(const fs::path& world, shared::world::ChunkPos pos, const fs::path& in) {
    std::ifstream f(in, std::ios::binary);
    if (!f.is_open()) {
        std::cerr << "Error: cannot read " << in << "\n";
        return 1;
    }
    const std::vector<std::uint8_t> data((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());

    shared::world::AnvilStorage storage(world);
    shared::world::StorageError err;
    if (!storage.save_chunk(pos, data, &err)) {
        std::cerr << "Error (" << shared::world::to_string(err.kind) << "): " << err.message << "\n";
        return 1;
    }
    std::cout << "Stored " << data.size() << " bytes as chunk " << pos.x << "," << pos.z << "\n";
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    shared::core::LogConfig logCfg;
    logCfg.world = false;
    if (!shared::core::configure(logCfg)) {
        return 1;
    }

    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    const std::string cmd = argv[1];
    if (cmd == "--help" || cmd == "-h") {
        print_usage(argv[0]);
        return 0;
    }

    if (cmd == "info" && argc == 3) {
        return cmd_info(argv[2]);
    }

    if ((cmd == "extract" || cmd == "import") && argc == 6) {
        shared::world::ChunkPos pos;
        if (!parse_coord(argv[3], &pos.x) || !parse_coord(argv[4], &pos.z)) {
            std::cerr << "Error: chunk coordinates must be integers.\n";
            return 1;
        }
        return (cmd == "extract") ? cmd_extract(argv[2], pos, argv[5]) : cmd_import(argv[2], pos, argv[5]);
    }

    std::cerr << "Error: bad command line.\n";
    print_usage(argv[0]);
    return 1;
}
