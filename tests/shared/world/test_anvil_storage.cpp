/**
 * @file test_anvil_storage.cpp
 * @brief Unit tests for the multi-region world store.
 */

#include <catch2/catch_test_macros.hpp>

#include "core/log.hpp"
#include "world/anvil_storage.hpp"
#include "test_utils.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <vector>

using namespace shared::world;
using test_helpers::TempDirGuard;

namespace {

using Bytes = std::vector<std::uint8_t>;

void quiet_logs() {
    shared::core::LogConfig cfg;
    cfg.enabled = false;
    (void)shared::core::configure(cfg);
}

} // namespace

TEST_CASE("Storage opens regions on first use", "[world][storage]") {
    quiet_logs();
    TempDirGuard dir("lodestone_storage");
    AnvilStorage storage(dir.path() / "region");

    REQUIRE(storage.loaded_regions() == 0);

    std::optional<Bytes> out;
    StorageError err;
    REQUIRE(storage.load_chunk({0, 0}, &out, &err));
    REQUIRE_FALSE(out.has_value());
    REQUIRE(storage.loaded_regions() == 1);
    REQUIRE(storage.is_loaded(RegionPos{0, 0}));
    REQUIRE(std::filesystem::exists(dir.path() / "region" / "r.0.0.mca"));
}

TEST_CASE("Chunks are routed to the right region file", "[world][storage]") {
    quiet_logs();
    TempDirGuard dir("lodestone_storage");
    AnvilStorage storage(dir.path());

    const ChunkPos positions[] = {{0, 0}, {31, 31}, {32, 0}, {-1, -1}, {65, -3}, {-33, 40}};
    StorageError err;
    for (std::size_t i = 0; i < std::size(positions); ++i) {
        REQUIRE(storage.save_chunk(positions[i], Bytes(10 + i, static_cast<std::uint8_t>(i)), &err));
    }

    REQUIRE(storage.loaded_regions() == 5);
    REQUIRE(storage.is_loaded(RegionPos{2, -1}));
    REQUIRE(storage.is_loaded(RegionPos{-2, 1}));
    REQUIRE(std::filesystem::exists(dir.path() / "r.-1.-1.mca"));

    for (std::size_t i = 0; i < std::size(positions); ++i) {
        std::optional<Bytes> out;
        REQUIRE(storage.load_chunk(positions[i], &out, &err));
        REQUIRE(out == Bytes(10 + i, static_cast<std::uint8_t>(i)));
    }
}

TEST_CASE("Unloading closes files and data survives", "[world][storage]") {
    quiet_logs();
    TempDirGuard dir("lodestone_storage");
    AnvilStorage storage(dir.path());

    StorageError err;
    REQUIRE(storage.save_chunk({65, -3}, Bytes{4, 5, 6}, &err));

    REQUIRE(storage.unload(RegionPos{2, -1}));
    REQUIRE_FALSE(storage.unload(RegionPos{2, -1}));
    REQUIRE(storage.loaded_regions() == 0);

    std::optional<Bytes> out;
    REQUIRE(storage.load_chunk({65, -3}, &out, &err));
    REQUIRE(out == Bytes{4, 5, 6});

    std::optional<std::uint32_t> ts;
    REQUIRE(storage.chunk_last_written({65, -3}, &ts, &err));
    REQUIRE(ts.has_value());

    storage.unload_all();
    REQUIRE(storage.loaded_regions() == 0);
}

TEST_CASE("Removing through the store", "[world][storage]") {
    quiet_logs();
    TempDirGuard dir("lodestone_storage");
    AnvilStorage storage(dir.path());

    StorageError err;
    REQUIRE(storage.save_chunk({7, 7}, Bytes{1}, &err));
    REQUIRE(storage.remove_chunk({7, 7}, &err));

    std::optional<Bytes> out;
    REQUIRE(storage.load_chunk({7, 7}, &out, &err));
    REQUIRE_FALSE(out.has_value());
}

TEST_CASE("A corrupt region file surfaces as an error", "[world][storage]") {
    quiet_logs();
    TempDirGuard dir("lodestone_storage");
    {
        std::ofstream junk(dir.path() / "r.0.0.mca", std::ios::binary);
        junk << "not a region file";
    }

    AnvilStorage storage(dir.path());
    std::optional<Bytes> out;
    StorageError err;
    REQUIRE_FALSE(storage.load_chunk({1, 1}, &out, &err));
    REQUIRE(err.kind == StorageError::Kind::Corrupt);
    REQUIRE(storage.loaded_regions() == 0);

    // Other regions still work.
    REQUIRE(storage.save_chunk({40, 0}, Bytes{1}, &err));
}
