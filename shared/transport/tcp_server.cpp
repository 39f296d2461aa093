#include "tcp_server.hpp"

#include "../core/log.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace shared::transport {

namespace {

bool set_non_blocking(int fd) {
    const int flags = ::fcntl(fd, F_GETFL, 0);
    return flags >= 0 && ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

std::string format_peer(const sockaddr_in& addr) {
    char ip[INET_ADDRSTRLEN] = {0};
    if (!::inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip))) {
        return "?";
    }
    return std::string(ip) + ":" + std::to_string(ntohs(addr.sin_port));
}

} // namespace

TcpServer::~TcpServer() {
    stop();
}

// =============================================================================
// Lifecycle
// =============================================================================

bool TcpServer::start(const std::string& bindAddress, std::uint16_t port, std::size_t maxClients) {
    if (is_running()) {
        return false;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    const std::string host = bindAddress.empty() ? "0.0.0.0" : bindAddress;
    if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        shared::core::logf(0, "init", "bad bind address '%s'", host.c_str());
        return false;
    }

    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        shared::core::logf(0, "init", "socket() failed: %s", std::strerror(errno));
        return false;
    }

    const int yes = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

    if (!set_non_blocking(fd) ||
        ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 ||
        ::listen(fd, SOMAXCONN) < 0) {
        shared::core::logf(0, "init", "cannot listen on %s:%u: %s", host.c_str(), port, std::strerror(errno));
        ::close(fd);
        return false;
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
        port_ = ntohs(bound.sin_port);
    } else {
        port_ = port;
    }

    listenFd_ = fd;
    maxClients_ = maxClients;
    shared::core::logf(0, "init", "listening on %s:%u (max %zu clients)", host.c_str(), port_, maxClients_);
    return true;
}

void TcpServer::stop() {
    if (!is_running()) {
        return;
    }

    for (auto& conn : connections_) {
        conn->close("server stopping");
        conn->flush();
        conn->shutdown();
        if (onDisconnect) {
            onDisconnect(conn);
        }
    }
    connections_.clear();

    ::close(listenFd_);
    listenFd_ = -1;
    shared::core::logf(0, "init", "listener closed");
}

// =============================================================================
// Event processing
// =============================================================================

void TcpServer::poll(int timeoutMs) {
    if (!is_running()) {
        return;
    }

    std::vector<pollfd> fds;
    fds.reserve(connections_.size() + 1);
    fds.push_back(pollfd{listenFd_, POLLIN, 0});
    for (const auto& conn : connections_) {
        short events = POLLIN;
        if (conn->wants_write()) events |= POLLOUT;
        fds.push_back(pollfd{conn->fd(), events, 0});
    }

    const int ready = ::poll(fds.data(), static_cast<nfds_t>(fds.size()), timeoutMs);
    if (ready < 0) {
        if (errno != EINTR) {
            shared::core::logf(0, "init", "poll() failed: %s", std::strerror(errno));
        }
        return;
    }

    // Connections accepted below are not in fds yet; they get polled next time.
    const std::size_t polled = fds.size() - 1;
    for (std::size_t i = 0; i < polled; ++i) {
        auto& conn = connections_[i];
        const short re = fds[i + 1].revents;
        if (re & (POLLIN | POLLHUP | POLLERR)) {
            conn->on_readable();
        }
        if (re & POLLOUT) {
            conn->flush();
        }
    }

    if (fds[0].revents & POLLIN) {
        accept_all_();
    }

    reap_();
}

void TcpServer::flush_all() {
    for (auto& conn : connections_) {
        if (conn->wants_write()) {
            conn->flush();
        }
    }
    reap_();
}

void TcpServer::accept_all_() {
    for (;;) {
        sockaddr_in addr{};
        socklen_t len = sizeof(addr);
        const int fd = ::accept(listenFd_, reinterpret_cast<sockaddr*>(&addr), &len);
        if (fd < 0) {
            if (errno == EINTR) continue;
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                shared::core::logf(0, "init", "accept() failed: %s", std::strerror(errno));
            }
            return;
        }

        const std::string peer = format_peer(addr);
        if (connections_.size() >= maxClients_) {
            shared::core::logf(0, "init", "rejecting %s: server full", peer.c_str());
            ::close(fd);
            continue;
        }
        if (!set_non_blocking(fd)) {
            shared::core::logf(0, "init", "rejecting %s: fcntl failed", peer.c_str());
            ::close(fd);
            continue;
        }

        const int yes = 1;
        ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &yes, sizeof(yes));

        auto conn = std::make_shared<TcpConnection>(fd, nextId_++, peer);
        connections_.push_back(conn);
        shared::core::logf(0, "init", "connect #%u from %s", conn->id(), peer.c_str());

        if (onConnect) {
            onConnect(conn);
        }
    }
}

void TcpServer::reap_() {
    for (auto it = connections_.begin(); it != connections_.end();) {
        auto conn = *it;
        if (!conn->finished()) {
            ++it;
            continue;
        }

        it = connections_.erase(it);
        conn->shutdown();
        shared::core::logf(0, "init", "disconnect #%u %s (%s) rx=%llu tx=%llu", conn->id(),
                           conn->peer_name().c_str(), conn->close_reason().c_str(),
                           static_cast<unsigned long long>(conn->bytes_received()),
                           static_cast<unsigned long long>(conn->bytes_sent()));
        if (onDisconnect) {
            onDisconnect(conn);
        }
    }
}

} // namespace shared::transport
