#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace server::core {

namespace {

std::string strip_quotes(std::string s) {
    s = Config::trim(std::move(s));
    if (s.size() >= 2) {
        const char a = s.front();
        const char b = s.back();
        if ((a == '"' && b == '"') || (a == '\'' && b == '\'')) {
            return s.substr(1, s.size() - 2);
        }
    }
    return s;
}

const char* bool_str(bool v) {
    return v ? "true" : "false";
}

} // namespace

std::string Config::trim(std::string s) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    while (!s.empty() && is_space(static_cast<unsigned char>(s.front()))) s.erase(s.begin());
    while (!s.empty() && is_space(static_cast<unsigned char>(s.back()))) s.pop_back();

    return s;
}

std::string Config::to_lower(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

bool Config::parse_bool(const std::string& v, bool default_value) {
    std::string s = to_lower(trim(v));
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return default_value;
}

int Config::parse_int(const std::string& v, int default_value) {
    try {
        std::size_t idx = 0;
        const std::string s = trim(v);
        int out = std::stoi(s, &idx, 10);
        if (idx != s.size()) return default_value;
        return out;
    } catch (const std::logic_error&) {
        return default_value;
    }
}

std::size_t Config::clamp_max_players(int v) {
    return static_cast<std::size_t>(std::max(1, v));
}

bool Config::parse_address(const std::string& v, std::string* outHost, std::uint16_t* outPort) {
    const std::string s = trim(v);
    const auto colon = s.rfind(':');
    if (colon == std::string::npos || colon == 0) return false;

    const int port = parse_int(s.substr(colon + 1), -1);
    if (port < 0 || port > 65535) return false;

    *outHost = s.substr(0, colon);
    *outPort = static_cast<std::uint16_t>(port);
    return true;
}

std::string Config::resolve_path(const char* cliPath) {
    if (cliPath && *cliPath) return cliPath;
    if (const char* env = std::getenv(kConfigEnvVar); env && *env) return env;
    return kDefaultConfigPath;
}

void Config::apply_kv(const std::string& section, const std::string& key, const std::string& value) {
    const std::string sec = to_lower(trim(section));
    const std::string k = to_lower(trim(key));
    const std::string v = strip_quotes(value);

    if (sec == "network") {
        auto& n = config_.network;
        if (k == "bind") n.bind = v;
        else if (k == "port") n.port = static_cast<std::uint16_t>(std::clamp(parse_int(v, n.port), 0, 65535));
        else if (k == "address") parse_address(v, &n.bind, &n.port);
        else if (k == "max_players") n.maxPlayers = clamp_max_players(parse_int(v, static_cast<int>(n.maxPlayers)));
        else if (k == "compression_threshold") n.compressionThreshold = parse_int(v, n.compressionThreshold);
        return;
    }

    if (sec == "world") {
        if (k == "folder") config_.world.folder = v;
        else if (k == "view_distance") config_.world.viewDistance = std::clamp(parse_int(v, config_.world.viewDistance), 2, 32);
        return;
    }

    if (sec == "status") {
        if (k == "motd") config_.status.motd = v;
        return;
    }

    if (sec == "server") {
        auto& s = config_.server;
        if (k == "tick_rate") s.tickRate = static_cast<std::uint32_t>(std::clamp(parse_int(v, static_cast<int>(s.tickRate)), 1, 1000));
        else if (k == "keep_alive_ticks") s.keepAliveTicks = static_cast<std::uint32_t>(std::max(1, parse_int(v, static_cast<int>(s.keepAliveTicks))));
        return;
    }

    if (sec == "logging") {
        auto& l = config_.logging;
        if (k == "enabled") l.enabled = parse_bool(v, l.enabled);
        else if (k == "init") l.init = parse_bool(v, l.init);
        else if (k == "rx") l.rx = parse_bool(v, l.rx);
        else if (k == "tx") l.tx = parse_bool(v, l.tx);
        else if (k == "codec") l.codec = parse_bool(v, l.codec);
        else if (k == "world") l.world = parse_bool(v, l.world);
        else if (k == "file") l.file = v;
        return;
    }
}

void Config::load_from_string(const std::string& text) {
    std::istringstream in(text);
    std::string section;
    std::string line;

    while (std::getline(in, line)) {
        // Cut at the first # or ; (values cannot contain either).
        auto hash = line.find('#');
        auto semi = line.find(';');
        std::size_t cut = std::string::npos;
        if (hash != std::string::npos) cut = hash;
        if (semi != std::string::npos) cut = (cut == std::string::npos) ? semi : std::min(cut, semi);
        if (cut != std::string::npos) line = line.substr(0, cut);

        line = trim(line);
        if (line.empty()) continue;

        if (line.front() == '[' && line.back() == ']') {
            section = trim(line.substr(1, line.size() - 2));
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (key.empty()) continue;

        apply_kv(section, key, value);
    }
}

bool Config::load_from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return false;
    }

    std::ostringstream text;
    text << in.rdbuf();
    load_from_string(text.str());

    loaded_from_path_ = path;
    return true;
}

bool Config::save_to_file(const std::string& path, std::string* outError) const {
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        if (outError) *outError = "cannot write " + path;
        return false;
    }

    const auto& c = config_;
    out << "# Lodestone server configuration\n"
        << "\n[network]\n"
        << "bind = " << c.network.bind << "\n"
        << "port = " << c.network.port << "\n"
        << "max_players = " << c.network.maxPlayers << "\n"
        << "# -1 disables compression\n"
        << "compression_threshold = " << c.network.compressionThreshold << "\n"
        << "\n[world]\n"
        << "folder = \"" << c.world.folder << "\"\n"
        << "view_distance = " << c.world.viewDistance << "\n"
        << "\n[status]\n"
        << "motd = \"" << c.status.motd << "\"\n"
        << "\n[server]\n"
        << "tick_rate = " << c.server.tickRate << "\n"
        << "keep_alive_ticks = " << c.server.keepAliveTicks << "\n"
        << "\n[logging]\n"
        << "enabled = " << bool_str(c.logging.enabled) << "\n"
        << "init = " << bool_str(c.logging.init) << "\n"
        << "rx = " << bool_str(c.logging.rx) << "\n"
        << "tx = " << bool_str(c.logging.tx) << "\n"
        << "codec = " << bool_str(c.logging.codec) << "\n"
        << "world = " << bool_str(c.logging.world) << "\n"
        << "file = \"" << c.logging.file << "\"\n";

    out.flush();
    if (!out) {
        if (outError) *outError = "write failed: " + path;
        return false;
    }
    return true;
}

bool load_or_create(Config& config, const std::string& path, std::string* outError) {
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        if (config.load_from_file(path)) return true;
        if (outError) *outError = "cannot read " + path;
        return false;
    }
    return config.save_to_file(path, outError);
}

} // namespace server::core
