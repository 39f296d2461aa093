#pragma once

#include "../../shared/core/log.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace server::core {

constexpr const char* kConfigEnvVar = "LODESTONE_CONFIG_PATH";
constexpr const char* kDefaultConfigPath = "lodestone.ini";

struct ServerConfig {
    struct Network {
        std::string bind{"0.0.0.0"};
        std::uint16_t port{25565};
        std::size_t maxPlayers{20};
        // Negative disables compression.
        std::int32_t compressionThreshold{256};
    } network{};

    struct World {
        std::string folder{"world"};
        int viewDistance{10};
    } world{};

    struct Status {
        std::string motd{"A Lodestone server"};
    } status{};

    struct Server {
        std::uint32_t tickRate{20};
        // 15 s at 20 ticks per second.
        std::uint32_t keepAliveTicks{300};
    } server{};

    shared::core::LogConfig logging{};
};

class Config {
public:
    Config() = default;

    bool load_from_file(const std::string& path);
    void load_from_string(const std::string& text);

    // Writes every key with its current value.
    bool save_to_file(const std::string& path, std::string* outError) const;

    const std::string& loaded_from_path() const { return loaded_from_path_; }

    const ServerConfig& get() const { return config_; }
    ServerConfig& get() { return config_; }

    // --config value if given, else $LODESTONE_CONFIG_PATH, else lodestone.ini.
    static std::string resolve_path(const char* cliPath);

    static std::string trim(std::string s);
    static std::string to_lower(std::string s);
    static bool parse_bool(const std::string& v, bool default_value);
    static int parse_int(const std::string& v, int default_value);
    // At least one player; shared by the INI key and --max-players.
    static std::size_t clamp_max_players(int v);

    // "host:port"; false leaves both outputs untouched.
    static bool parse_address(const std::string& v, std::string* outHost, std::uint16_t* outPort);

private:
    void apply_kv(const std::string& section, const std::string& key, const std::string& value);

    ServerConfig config_{};
    std::string loaded_from_path_{};
};

// Loads `path`, or writes the defaults there when the file does not exist yet.
bool load_or_create(Config& config, const std::string& path, std::string* outError);

} // namespace server::core
