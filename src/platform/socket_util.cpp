#include "socket_util.hpp"
#include <sys/socket.h>
#include <sys/types.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace platform {

// Try one resolved address. Returns the connected socket or -1.
static socket_t try_connect(const struct addrinfo* ai, int timeout_ms, std::string& error) {
    socket_t sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (sock < 0) {
        error = "Failed to create socket: " + std::string(strerror(errno));
        return PXRELAY_INVALID_SOCKET;
    }

    set_nonblocking(sock);

    int ret = ::connect(sock, ai->ai_addr, ai->ai_addrlen);
    if (ret < 0 && errno != EINPROGRESS) {
        error = "Failed to connect: " + std::string(strerror(errno));
        close_socket(sock);
        return PXRELAY_INVALID_SOCKET;
    }

    // Wait for non-blocking connect to complete
    if (ret < 0) {
        int revents = poll_socket(sock, POLLOUT, timeout_ms);
        if (revents == 0) {
            error = "Connection timed out";
            close_socket(sock);
            return PXRELAY_INVALID_SOCKET;
        }
        int sock_err = 0;
        socklen_t err_len = sizeof(sock_err);
        getsockopt(sock, SOL_SOCKET, SO_ERROR, &sock_err, &err_len);
        if (sock_err != 0) {
            error = "Connection failed: " + std::string(strerror(sock_err));
            close_socket(sock);
            return PXRELAY_INVALID_SOCKET;
        }
    }
    return sock;
}

socket_t connect_tcp(const std::string& host, int port, int timeout_ms, std::string& error) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    std::string port_str = std::to_string(port);
    int gai = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
    if (gai != 0 || !res) {
        error = "Failed to resolve host: " + host + " (" + gai_strerror(gai) + ")";
        return PXRELAY_INVALID_SOCKET;
    }

    socket_t sock = PXRELAY_INVALID_SOCKET;
    for (struct addrinfo* ai = res; ai; ai = ai->ai_next) {
        sock = try_connect(ai, timeout_ms, error);
        if (sock != PXRELAY_INVALID_SOCKET) break;
    }
    freeaddrinfo(res);
    return sock;
}

void set_nonblocking(socket_t sock) {
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
}

void enable_tcp_keepalive(socket_t sock) {
    int on = 1;
    setsockopt(sock, SOL_SOCKET, SO_KEEPALIVE, &on, sizeof(on));
    int keepidle = 60;
    int keepintvl = 15;
    int keepcnt = 4;
#ifdef TCP_KEEPIDLE
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPIDLE, &keepidle, sizeof(keepidle));
#endif
#ifdef TCP_KEEPINTVL
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPINTVL, &keepintvl, sizeof(keepintvl));
#endif
#ifdef TCP_KEEPCNT
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPCNT, &keepcnt, sizeof(keepcnt));
#endif
}

int poll_socket(socket_t sock, short events, int timeout_ms) {
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
}

void close_socket(socket_t sock) {
    close(sock);
}

} // namespace platform
