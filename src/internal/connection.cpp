/**
 * Copyright (C) 2025 FastDFS C++ Client Contributors
 *
 * FastDFS may be copied only under the terms of the GNU General
 * Public License V3, which may be found in the FastDFS source kit.
 */

#include "internal/connection.hpp"
#include "fdfs/errors.hpp"
#include <algorithm>
#include <cstdio>
#include <cstring>

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <errno.h>

#include "fastcommon/common_define.h"
#include "fastcommon/logger.h"
#include "fastcommon/sockopt.h"

namespace fdfs {
namespace internal {

// fastcommon socket helpers take an int size
static const size_t kMaxIoChunk = 1 << 30;

Connection::Connection(int sock, const Endpoint& endpoint,
                       std::chrono::seconds network_timeout)
    : sock_(sock)
    , endpoint_(endpoint)
    , network_timeout_(network_timeout)
    , last_used_(std::chrono::steady_clock::now())
    , generation_(0) {
}

Connection::~Connection() {
    close();
}

void Connection::close() {
    int sock = sock_.exchange(-1);
    if (sock >= 0) {
        ::close(sock);
    }
}

void Connection::shutdown() {
    int sock = sock_.load();
    if (sock >= 0) {
        ::shutdown(sock, SHUT_RDWR);
    }
}

bool Connection::is_open() const {
    return sock_.load() >= 0;
}

int Connection::timeout_seconds() const {
    return static_cast<int>(std::max<std::chrono::seconds::rep>(
        1, network_timeout_.count()));
}

void Connection::fail(const char* action, int err_no) {
    logError("file: " __FILE__ ", line: %d, "
             "%s server %s fail, errno: %d, error info: %s",
             __LINE__, action, endpoint_.to_string().c_str(),
             err_no, STRERROR(err_no));
    close();

    std::string message = std::string(action) + " " + endpoint_.to_string() +
                          ": " + STRERROR(err_no);
    if (err_no == ETIMEDOUT) {
        throw TimeoutException(message);
    }
    throw ConnectionException(message);
}

void Connection::send(const void* data, size_t size) {
    int sock = sock_.load();
    if (sock < 0) {
        throw ConnectionException("Connection is not open");
    }

    const char* p = static_cast<const char*>(data);
    while (size > 0) {
        size_t chunk = std::min(size, kMaxIoChunk);
        int result = tcpsenddata_nb(sock, const_cast<char*>(p),
                                    static_cast<int>(chunk), timeout_seconds());
        if (result != 0) {
            fail("send data to", result);
        }
        p += chunk;
        size -= chunk;
    }
}

void Connection::send(const std::vector<uint8_t>& data) {
    send(data.data(), data.size());
}

size_t Connection::recv_upto(void* buff, size_t size) {
    int sock = sock_.load();
    if (sock < 0) {
        throw ConnectionException("Connection is not open");
    }

    char* p = static_cast<char*>(buff);
    size_t total_received = 0;
    while (total_received < size) {
        size_t chunk = std::min(size - total_received, kMaxIoChunk);
        int count = 0;
        int result = tcprecvdata_nb_ex(sock, p + total_received,
                                       static_cast<int>(chunk),
                                       timeout_seconds(), &count);
        total_received += count;
        if (result == ENOTCONN) {
            logWarning("file: " __FILE__ ", line: %d, "
                       "server %s closed the connection, "
                       "expect %d bytes, received %d",
                       __LINE__, endpoint_.to_string().c_str(),
                       static_cast<int>(size), static_cast<int>(total_received));
            close();
            break;
        }
        if (result != 0) {
            fail("recv data from", result);
        }
    }

    return total_received;
}

void Connection::recv(void* buff, size_t size) {
    if (recv_upto(buff, size) != size) {
        throw ConnectionException("connection closed by " + endpoint_.to_string());
    }
}

std::vector<uint8_t> Connection::recv(size_t n) {
    std::vector<uint8_t> data(n);
    recv(data.data(), n);
    return data;
}

void Connection::update_last_used() {
    last_used_ = std::chrono::steady_clock::now();
}

std::shared_ptr<Connection> TcpConnector::connect(const Endpoint& endpoint,
                                                  std::chrono::seconds connect_timeout,
                                                  std::chrono::seconds network_timeout) {
    char ip_addr[FDFS_IP_ADDRESS_SIZE];
    in_addr addr;
    if (inet_pton(AF_INET, endpoint.host.c_str(), &addr) == 1) {
        snprintf(ip_addr, sizeof(ip_addr), "%s", endpoint.host.c_str());
    } else if (getIpaddrByName(endpoint.host.c_str(), ip_addr,
                               sizeof(ip_addr)) == INADDR_NONE) {
        logError("file: " __FILE__ ", line: %d, "
                 "resolve host %s fail", __LINE__, endpoint.host.c_str());
        throw ConnectionException("Failed to resolve host: " + endpoint.host);
    }

    int sock = ::socket(AF_INET, SOCK_STREAM, 0);
    if (sock < 0) {
        int err_no = errno != 0 ? errno : EMFILE;
        throw ConnectionException(std::string("Failed to create socket: ") +
                                  STRERROR(err_no));
    }

    int result = tcpsetnonblockopt(sock);
    if (result == 0) {
        int timeout = static_cast<int>(std::max<std::chrono::seconds::rep>(
            1, connect_timeout.count()));
        result = connectserverbyip_nb(sock, ip_addr, endpoint.port, timeout);
    }
    if (result != 0) {
        ::close(sock);
        logError("file: " __FILE__ ", line: %d, "
                 "connect to %s:%u fail, errno: %d, error info: %s",
                 __LINE__, ip_addr, endpoint.port, result, STRERROR(result));
        std::string message = "connect to " + endpoint.to_string() + ": " +
                              STRERROR(result);
        if (result == ETIMEDOUT) {
            throw TimeoutException(message);
        }
        throw ConnectionException(message);
    }

    return std::make_shared<Connection>(sock, endpoint, network_timeout);
}

} // namespace internal
} // namespace fdfs
