/**
 * Copyright (C) 2025 FastDFS C++ Client Contributors
 *
 * FastDFS may be copied only under the terms of the GNU General
 * Public License V3, which may be found in the FastDFS source kit.
 */

#ifndef FDFS_INTERNAL_CONNECTION_HPP
#define FDFS_INTERNAL_CONNECTION_HPP

#include "fdfs/types.hpp"
#include <atomic>
#include <string>
#include <vector>
#include <chrono>
#include <memory>

namespace fdfs {
namespace internal {

/**
 * TCP connection to a FastDFS server
 *
 * Owns the socket. Any send or receive failure closes the socket, so a
 * connection that is still open after a call is safe to reuse.
 */
class Connection {
public:
    Connection(int sock, const Endpoint& endpoint,
               std::chrono::seconds network_timeout);

    ~Connection();

    // Non-copyable
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    /**
     * Closes the connection
     */
    void close();

    /**
     * Shuts down both directions but keeps the descriptor, so a thread
     * blocked on the socket fails without the fd being reused under it.
     * The owner still closes the connection.
     */
    void shutdown();

    /**
     * Checks if connection is open
     */
    bool is_open() const;

    /**
     * Sends all bytes
     * @throws TimeoutException, ConnectionException
     */
    void send(const void* data, size_t size);
    void send(const std::vector<uint8_t>& data);

    /**
     * Receives up to size bytes, fewer only when the peer closed the
     * connection (the connection is closed then)
     * @return bytes received
     */
    size_t recv_upto(void* buff, size_t size);

    /**
     * Receives exactly size bytes
     */
    void recv(void* buff, size_t size);
    std::vector<uint8_t> recv(size_t n);

    /**
     * Gets the server address
     */
    const Endpoint& endpoint() const { return endpoint_; }

    std::chrono::steady_clock::time_point last_used() const { return last_used_; }

    void update_last_used();

    /**
     * Pool generation this connection was created in
     */
    uint64_t generation() const { return generation_; }
    void set_generation(uint64_t generation) { generation_ = generation; }

private:
    std::atomic<int> sock_;
    Endpoint endpoint_;
    std::chrono::seconds network_timeout_;
    std::chrono::steady_clock::time_point last_used_;
    uint64_t generation_;

    int timeout_seconds() const;
    [[noreturn]] void fail(const char* action, int err_no);
};

/**
 * Opens connections, the seam the pool connects through
 */
class Connector {
public:
    virtual ~Connector() = default;

    /**
     * Connects to the endpoint
     * @throws TimeoutException, ConnectionException
     */
    virtual std::shared_ptr<Connection> connect(const Endpoint& endpoint,
                                                std::chrono::seconds connect_timeout,
                                                std::chrono::seconds network_timeout) = 0;
};

/**
 * Plain TCP connector, resolves host names
 */
class TcpConnector : public Connector {
public:
    std::shared_ptr<Connection> connect(const Endpoint& endpoint,
                                        std::chrono::seconds connect_timeout,
                                        std::chrono::seconds network_timeout) override;
};

} // namespace internal
} // namespace fdfs

#endif // FDFS_INTERNAL_CONNECTION_HPP
