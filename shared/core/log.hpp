#pragma once

#include <cstdint>
#include <string>

namespace shared::core {

// Per-tag switches. Tags not listed here always print while logging is enabled.
struct LogConfig {
    bool enabled{true};
    bool init{true};
    bool rx{false};
    bool tx{false};
    bool codec{true};
    bool world{true};

    // Optional append-mode sink; stderr output is kept either way.
    std::string file;
};

// Installs the settings and (re)opens the file sink. Returns false if the file
// could not be opened; stderr logging still works in that case.
bool configure(const LogConfig& cfg);

// Closes the file sink.
void shutdown();

const LogConfig& config();

// [lodestone][HH:MM:SS][tick][tag] message
void logf(std::uint64_t tick, const char* tag, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

} // namespace shared::core
