// lodestone_ds - Lodestone dedicated server
// Headless Minecraft-protocol server over TCP with Anvil world storage.

#include "../server/core/config.hpp"
#include "../server/core/dedicated_server.hpp"
#include "../shared/core/log.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

#ifndef LODESTONE_VERSION
#define LODESTONE_VERSION "0.0.0-dev"
#endif

namespace {

volatile std::sig_atomic_t g_running = 1;

void signal_handler(int sig) {
    (void)sig;
    g_running = 0;
}

void print_banner() {
    std::cout << "\n  Lodestone Dedicated Server v" << LODESTONE_VERSION << "\n";
    std::cout << "  ============================================\n\n";
}

void print_usage(const char* progname) {
    std::cout << "Usage: " << progname << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config <file>     Config file (default: $" << server::core::kConfigEnvVar << " or "
              << server::core::kDefaultConfigPath << ")\n";
    std::cout << "  --bind <address>    Listen address (default: 0.0.0.0)\n";
    std::cout << "  --port <port>       Listen port (default: 25565)\n";
    std::cout << "  --max-players <n>   Maximum players (default: 20)\n";
    std::cout << "  --world <dir>       World folder with region files (default: world)\n";
    std::cout << "  --threshold <n>     Compression threshold, -1 disables (default: 256)\n";
    std::cout << "  --verbose           Log every packet\n";
    std::cout << "  --quiet             Disable most logging\n";
    std::cout << "  --help              Show this help message\n";
    std::cout << "\nExample:\n";
    std::cout << "  " << progname << " --port 25565 --world ./world\n";
}

struct Args {
    const char* configPath = nullptr;
    std::optional<std::string> bind;
    std::optional<std::uint16_t> port;
    std::optional<std::size_t> maxPlayers;
    std::optional<std::string> world;
    std::optional<std::int32_t> threshold;
    bool verbose = false;
    bool quiet = false;
    bool help = false;
};

Args parse_args(int argc, char* argv[]) {
    Args args;

    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            args.help = true;
        }
        else if (std::strcmp(arg, "--config") == 0 && i + 1 < argc) {
            args.configPath = argv[++i];
        }
        else if (std::strcmp(arg, "--bind") == 0 && i + 1 < argc) {
            args.bind = argv[++i];
        }
        else if (std::strcmp(arg, "--port") == 0 && i + 1 < argc) {
            args.port = static_cast<std::uint16_t>(std::atoi(argv[++i]));
        }
        else if (std::strcmp(arg, "--max-players") == 0 && i + 1 < argc) {
            args.maxPlayers = server::core::Config::clamp_max_players(std::atoi(argv[++i]));
        }
        else if (std::strcmp(arg, "--world") == 0 && i + 1 < argc) {
            args.world = argv[++i];
        }
        else if (std::strcmp(arg, "--threshold") == 0 && i + 1 < argc) {
            args.threshold = static_cast<std::int32_t>(std::atoi(argv[++i]));
        }
        else if (std::strcmp(arg, "--verbose") == 0) {
            args.verbose = true;
        }
        else if (std::strcmp(arg, "--quiet") == 0) {
            args.quiet = true;
        }
        else {
            std::cerr << "[WARNING] Unknown argument: " << arg << "\n";
        }
    }

    return args;
}

} // namespace

int main(int argc, char* argv[]) {
    print_banner();

    Args args = parse_args(argc, argv);

    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    const std::string configPath = server::core::Config::resolve_path(args.configPath);
    server::core::Config cfgFile;
    std::string error;
    if (!server::core::load_or_create(cfgFile, configPath, &error)) {
        std::cerr << "[ERROR] " << error << "\n";
        return 1;
    }
    std::cout << "[INFO] Config: " << configPath << "\n";

    server::core::ServerConfig config = cfgFile.get();
    if (args.bind) config.network.bind = *args.bind;
    if (args.port) config.network.port = *args.port;
    if (args.maxPlayers) config.network.maxPlayers = *args.maxPlayers;
    if (args.world) config.world.folder = *args.world;
    if (args.threshold) config.network.compressionThreshold = *args.threshold;

    if (args.quiet) {
        config.logging.enabled = false;
    } else if (args.verbose) {
        config.logging.rx = true;
        config.logging.tx = true;
    }

    if (!shared::core::configure(config.logging)) {
        std::cerr << "[WARNING] Logging to stderr only\n";
    }

    server::core::DedicatedServer server(config);

    server.onPlayerJoin = [](const server::core::Session::Profile& p) {
        std::cout << "[INFO] " << p.name << " joined the game\n";
    };

    server.onPlayerLeave = [](const server::core::Session::Profile& p) {
        std::cout << "[INFO] " << p.name << " left the game\n";
    };

    if (!server.start()) {
        std::cerr << "[ERROR] Failed to start server on " << config.network.bind << ":" << config.network.port << "\n";
        shared::core::shutdown();
        return 1;
    }

    std::cout << "[INFO] Server started on " << config.network.bind << ":" << server.port() << "\n";
    std::cout << "[INFO] Max players: " << config.network.maxPlayers << "\n";
    std::cout << "[INFO] World: " << config.world.folder << "\n";
    std::cout << "[INFO] Press Ctrl+C to stop\n\n";

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    while (g_running && server.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::cout << "\n[INFO] Shutting down...\n";
    server.stop();
    shared::core::shutdown();
    std::cout << "[INFO] Server stopped\n";

    return 0;
}
