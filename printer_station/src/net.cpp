#include "net.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace {

int remaining_ms(std::chrono::steady_clock::time_point deadline)
{
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

}

ConnectStatus classify_connect_error(int error)
{
    switch (error) {
    case 0:
        return CONNECT_OK;
    case EINPROGRESS:
        return CONNECT_IN_PROGRESS;
    case ECONNREFUSED:
        return CONNECT_REFUSED;
    case EHOSTUNREACH:
    case ENETUNREACH:
    case EHOSTDOWN:
    case ETIMEDOUT:
        return CONNECT_UNREACHABLE;
    default:
        return CONNECT_ERROR;
    }
}

ConnectStatus tcp_connect_start(const std::string &host, uint16_t port, int &fd, int &error)
{
    struct sockaddr_in addr;

    fd = -1;
    error = 0;

    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        error = EINVAL;
        return CONNECT_ERROR;
    }

    int sock = socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (sock < 0) {
        error = errno;
        return CONNECT_ERROR;
    }

    if (connect(sock, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == 0) {
        fd = sock;
        return CONNECT_OK;
    }

    if (errno == EINPROGRESS) {
        fd = sock;
        return CONNECT_IN_PROGRESS;
    }

    error = errno;
    close(sock);
    return classify_connect_error(error);
}

ConnectStatus tcp_connect_finish(int fd, int &error)
{
    int so_error = 0;
    socklen_t len = sizeof(so_error);

    if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) {
        error = errno;
        return CONNECT_ERROR;
    }

    error = so_error;
    return classify_connect_error(so_error);
}

ConnectStatus tcp_connect(const std::string &host, uint16_t port,
                          unsigned int timeout_ms, int &fd, int &error)
{
    int sock;

    ConnectStatus status = tcp_connect_start(host, port, sock, error);
    if (status == CONNECT_IN_PROGRESS) {
        struct pollfd fds[1];
        fds[0].fd = sock;
        fds[0].events = POLLOUT;

        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        int ret;
        do {
            ret = poll(fds, 1, remaining_ms(deadline));
        } while (ret < 0 && errno == EINTR);

        if (ret < 0) {
            error = errno;
            status = CONNECT_ERROR;
        } else if (ret == 0) {
            error = ETIMEDOUT;
            status = CONNECT_UNREACHABLE;
        } else {
            status = tcp_connect_finish(sock, error);
        }
    }

    if (status != CONNECT_OK) {
        if (sock >= 0)
            close(sock);
        fd = -1;
        return status;
    }

    /* Back to blocking mode for the caller */
    int flags = fcntl(sock, F_GETFL, 0);
    if (flags < 0 || fcntl(sock, F_SETFL, flags & ~O_NONBLOCK) < 0) {
        error = errno;
        close(sock);
        fd = -1;
        return CONNECT_ERROR;
    }

    fd = sock;
    return CONNECT_OK;
}

bool send_all(int fd, const std::string &data, unsigned int timeout_ms)
{
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    size_t sent = 0;

    while (sent < data.length()) {
        struct pollfd fds[1];
        fds[0].fd = fd;
        fds[0].events = POLLOUT;

        int ret = poll(fds, 1, remaining_ms(deadline));
        if (ret < 0 && errno == EINTR)
            continue;
        if (ret <= 0)
            return false;
        if (fds[0].revents & (POLLERR | POLLHUP))
            return false;

        ssize_t n = send(fd, data.data() + sent, data.length() - sent, MSG_NOSIGNAL | MSG_DONTWAIT);
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
                continue;
            return false;
        }
        sent += n;
    }

    return true;
}

std::string connect_status_to_string(ConnectStatus status)
{
    switch (status) {
    case CONNECT_OK: return "connected";
    case CONNECT_IN_PROGRESS: return "in progress";
    case CONNECT_REFUSED: return "refused";
    case CONNECT_UNREACHABLE: return "unreachable";
    case CONNECT_ERROR: return "error";
    default: return "unknown";
    }
}
