#include "socket_util.hpp"

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace platform {

void set_nonblocking(socket_t sock) {
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
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

socket_t connect_tcp(const std::string& host, int port, int timeout_ms, std::string& error) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    std::string service = std::to_string(port);
    int gai = getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    if (gai != 0 || !res) {
        error = "Failed to resolve host: " + host;
        return KNADMIN_INVALID_SOCKET;
    }

    socket_t sock = socket(res->ai_family, res->ai_socktype, res->ai_protocol);
    if (sock < 0) {
        freeaddrinfo(res);
        error = "Failed to create socket";
        return KNADMIN_INVALID_SOCKET;
    }
    set_nonblocking(sock);

    int ret = connect(sock, res->ai_addr, res->ai_addrlen);
    freeaddrinfo(res);
    if (ret < 0 && errno != EINPROGRESS) {
        error = "Failed to connect: " + std::string(strerror(errno));
        close_socket(sock);
        return KNADMIN_INVALID_SOCKET;
    }

    // Wait for non-blocking connect to complete
    if (ret < 0) {
        int revents = poll_socket(sock, POLLOUT, timeout_ms);
        if (revents == 0) {
            error = "Connection timed out: " + host;
            close_socket(sock);
            return KNADMIN_INVALID_SOCKET;
        }
        int sock_err = 0;
        socklen_t err_len = sizeof(sock_err);
        getsockopt(sock, SOL_SOCKET, SO_ERROR, &sock_err, &err_len);
        if (sock_err != 0) {
            error = "Connection failed: " + std::string(strerror(sock_err));
            close_socket(sock);
            return KNADMIN_INVALID_SOCKET;
        }
    }
    return sock;
}

socket_t listen_local(int port, int backlog, std::string& error) {
    socket_t fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        error = "socket() failed: " + std::string(strerror(errno));
        return KNADMIN_INVALID_SOCKET;
    }

    int reuse = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

    if (bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        error = "bind() failed for port " + std::to_string(port) + ": " + strerror(errno);
        close_socket(fd);
        return KNADMIN_INVALID_SOCKET;
    }
    if (listen(fd, backlog) < 0) {
        error = "listen() failed for port " + std::to_string(port) + ": " + strerror(errno);
        close_socket(fd);
        return KNADMIN_INVALID_SOCKET;
    }
    return fd;
}

bool is_port_open(int port) {
    socket_t sock = socket(AF_INET, SOCK_STREAM, 0);
    if (sock < 0) return false;
    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    int rc = connect(sock, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
    close_socket(sock);
    return rc == 0;
}

} // namespace platform
