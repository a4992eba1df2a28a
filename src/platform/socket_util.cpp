#include "socket_util.hpp"

#include <sys/socket.h>
#include <sys/types.h>
#include <netdb.h>
#include <netinet/in.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <algorithm>
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

// Connect one already-created socket, waiting for a non-blocking connect.
static std::string connect_one(socket_t sock, const struct addrinfo* ai, int timeout_ms) {
    set_nonblocking(sock);

    int ret = connect(sock, ai->ai_addr, ai->ai_addrlen);
    if (ret == 0) return "";
    if (errno != EINPROGRESS) {
        return std::strerror(errno);
    }

    int revents = poll_socket(sock, POLLOUT, timeout_ms);
    if (revents == 0) {
        return "connection timed out";
    }

    int sock_err = 0;
    socklen_t err_len = sizeof(sock_err);
    getsockopt(sock, SOL_SOCKET, SO_ERROR, &sock_err, &err_len);
    if (sock_err != 0) {
        return std::strerror(sock_err);
    }
    return "";
}

int remaining_ms(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    return static_cast<int>(std::max<decltype(left)>(left, 0));
}

Result<socket_t> connect_tcp(const std::string& host, int port, int timeout_ms) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    std::string service = std::to_string(port);
    int gai = getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    if (gai != 0 || !res) {
        return Result<socket_t>::Err(ErrorKind::Connection,
                                     "Failed to resolve host " + host + ": " + gai_strerror(gai));
    }

    // One budget for the whole dial, however many addresses resolve
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    std::string last_error = "no usable address";
    for (struct addrinfo* ai = res; ai; ai = ai->ai_next) {
        int budget = remaining_ms(deadline);
        if (budget == 0) {
            last_error = "connection timed out";
            break;
        }
        socket_t sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock < 0) {
            last_error = std::strerror(errno);
            continue;
        }
        std::string err = connect_one(sock, ai, budget);
        if (err.empty()) {
            freeaddrinfo(res);
            return Result<socket_t>::Ok(sock);
        }
        last_error = err;
        close_socket(sock);
    }

    freeaddrinfo(res);
    return Result<socket_t>::Err(ErrorKind::Connection,
                                 "Failed to connect to " + host + ":" + service + ": " + last_error);
}

} // namespace platform
