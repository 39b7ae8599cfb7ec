#ifndef NET_HPP
#define NET_HPP

#include <cstdint>
#include <string>

enum ConnectStatus {
    CONNECT_OK,
    CONNECT_IN_PROGRESS,
    CONNECT_REFUSED,        /* host alive, nothing listening */
    CONNECT_UNREACHABLE,    /* no route, host down or timed out */
    CONNECT_ERROR,
};

/**
 * @brief Start a non-blocking TCP connection to an IPv4 host.
 *
 * @param[out] fd socket, -1 when the connection failed immediately
 * @param[out] error errno of the failure, 0 otherwise
 * @return CONNECT_OK, CONNECT_IN_PROGRESS or the failure
 */
ConnectStatus tcp_connect_start(const std::string &host, uint16_t port, int &fd, int &error);

/* Outcome of a pending connection once the socket is writable */
ConnectStatus tcp_connect_finish(int fd, int &error);

/**
 * @brief Connect with a timeout.
 *
 * @param[out] fd blocking connected socket on success
 * @return CONNECT_OK or the failure, a timeout being CONNECT_UNREACHABLE
 */
ConnectStatus tcp_connect(const std::string &host, uint16_t port,
                          unsigned int timeout_ms, int &fd, int &error);

/* Map errno of a failed connection to a status */
ConnectStatus classify_connect_error(int error);

/**
 * @brief Send all data on a connected socket within timeout_ms.
 */
bool send_all(int fd, const std::string &data, unsigned int timeout_ms);

std::string connect_status_to_string(ConnectStatus status);

#endif
