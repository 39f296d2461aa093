#pragma once

// TcpServer - listens for stream connections and multiplexes them with poll(2).
// Single-threaded: every call, including the callbacks, happens on the caller's thread.

#include "tcp_connection.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace shared::transport {

class TcpServer {
public:
    TcpServer() = default;
    ~TcpServer();

    TcpServer(const TcpServer&) = delete;
    TcpServer& operator=(const TcpServer&) = delete;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    // Port 0 binds an ephemeral port; see port().
    bool start(const std::string& bindAddress, std::uint16_t port, std::size_t maxClients);

    // Closes the listener and every connection.
    void stop();

    bool is_running() const { return listenFd_ >= 0; }

    // Port actually bound.
    std::uint16_t port() const { return port_; }

    // =========================================================================
    // Event processing
    // =========================================================================

    // Accepts, reads and writes whatever is ready, then reaps finished connections.
    void poll(int timeoutMs);

    // Pushes queued output of every connection and reaps finished ones.
    void flush_all();

    // =========================================================================
    // Client management
    // =========================================================================

    const std::vector<std::shared_ptr<TcpConnection>>& connections() const { return connections_; }

    std::function<void(std::shared_ptr<TcpConnection>)> onConnect;
    std::function<void(std::shared_ptr<TcpConnection>)> onDisconnect;

private:
    void accept_all_();
    void reap_();

    int listenFd_{-1};
    std::uint16_t port_{0};
    std::size_t maxClients_{0};
    std::uint32_t nextId_{1};
    std::vector<std::shared_ptr<TcpConnection>> connections_;
};

} // namespace shared::transport
