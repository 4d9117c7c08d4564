#include "socket_util.hpp"

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <fmt/format.h>

namespace platform {

Result<socket_t> listen_tcp(const std::string& host, int port, int backlog) {
    socket_t fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return Result<socket_t>::Err(fmt::format("socket() failed: {}", std::strerror(errno)));
    }

    int reuse = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        close(fd);
        return Result<socket_t>::Err(fmt::format("invalid listen address '{}'", host));
    }

    if (bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::string reason = std::strerror(errno);
        close(fd);
        return Result<socket_t>::Err(fmt::format("bind() failed for {}:{}: {}", host, port, reason));
    }

    if (listen(fd, backlog) < 0) {
        std::string reason = std::strerror(errno);
        close(fd);
        return Result<socket_t>::Err(fmt::format("listen() failed for {}:{}: {}", host, port, reason));
    }

    return Result<socket_t>::Ok(fd);
}

int bound_port(socket_t sock) {
    struct sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(sock, reinterpret_cast<struct sockaddr*>(&addr), &len) < 0) return -1;
    return ntohs(addr.sin_port);
}

int poll_socket(socket_t sock, short events, int timeout_ms) {
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
}

bool send_all(socket_t sock, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t w = send(sock, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (w < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        sent += static_cast<size_t>(w);
    }
    return true;
}

void close_socket(socket_t sock) {
    if (sock != MCB_INVALID_SOCKET) close(sock);
}

} // namespace platform
