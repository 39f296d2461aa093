#include "log.hpp"

#include <cerrno>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <mutex>

namespace shared::core {

namespace {

std::mutex g_mutex;
LogConfig g_config;
std::FILE* g_file = nullptr;

bool tag_enabled(const char* tag) {
    if (std::strcmp(tag, "init") == 0) return g_config.init;
    if (std::strcmp(tag, "rx") == 0) return g_config.rx;
    if (std::strcmp(tag, "tx") == 0) return g_config.tx;
    if (std::strcmp(tag, "codec") == 0) return g_config.codec;
    if (std::strcmp(tag, "world") == 0) return g_config.world;
    return true;
}

void format_clock(char* buf, std::size_t size) {
    const std::time_t now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);
    if (std::strftime(buf, size, "%H:%M:%S", &tm) == 0) {
        std::snprintf(buf, size, "--:--:--");
    }
}

void close_file_locked() {
    if (g_file) {
        std::fclose(g_file);
        g_file = nullptr;
    }
}

} // namespace

bool configure(const LogConfig& cfg) {
    std::lock_guard<std::mutex> lock(g_mutex);
    close_file_locked();
    g_config = cfg;

    if (!cfg.enabled || cfg.file.empty()) return true;

    g_file = std::fopen(cfg.file.c_str(), "a");
    if (!g_file) {
        std::fprintf(stderr, "[lodestone] cannot open log file '%s': %s\n", cfg.file.c_str(), std::strerror(errno));
        return false;
    }
    return true;
}

void shutdown() {
    std::lock_guard<std::mutex> lock(g_mutex);
    close_file_locked();
}

const LogConfig& config() {
    return g_config;
}

void logf(std::uint64_t tick, const char* tag, const char* fmt, ...) {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (!g_config.enabled || !tag_enabled(tag)) return;

    char clock[16];
    format_clock(clock, sizeof(clock));

    va_list args;
    va_start(args, fmt);

    std::fprintf(stderr, "[lodestone][%s][%llu][%s] ", clock, static_cast<unsigned long long>(tick), tag);
    if (g_file) {
        va_list copy;
        va_copy(copy, args);
        std::fprintf(g_file, "[lodestone][%s][%llu][%s] ", clock, static_cast<unsigned long long>(tick), tag);
        std::vfprintf(g_file, fmt, copy);
        std::fputc('\n', g_file);
        std::fflush(g_file);
        va_end(copy);
    }
    std::vfprintf(stderr, fmt, args);
    std::fputc('\n', stderr);

    va_end(args);
}

} // namespace shared::core
