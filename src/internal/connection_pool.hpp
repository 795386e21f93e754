/**
 * Copyright (C) 2025 FastDFS C++ Client Contributors
 *
 * FastDFS may be copied only under the terms of the GNU General
 * Public License V3, which may be found in the FastDFS source kit.
 */

#ifndef FDFS_INTERNAL_CONNECTION_POOL_HPP
#define FDFS_INTERNAL_CONNECTION_POOL_HPP

#include "fdfs/types.hpp"
#include <string>
#include <vector>
#include <deque>
#include <unordered_set>
#include <memory>
#include <mutex>
#include <chrono>

namespace fdfs {

class EndpointSelector;

namespace internal {

class Connection;
class Connector;

// Connect attempts per make_connection, each with a fresh endpoint pick
constexpr int POOL_CONNECT_ATTEMPTS = 3;

struct PoolOptions {
    int max_conns = 10;
    std::chrono::seconds connect_timeout{5};
    std::chrono::seconds network_timeout{30};
    std::chrono::seconds idle_timeout{3600};
};

/**
 * Bounded pool of connections to a set of equivalent endpoints
 *
 * created_count() == in_use_count() + idle_count() outside of a pending
 * connect. destroy() starts a new generation, connections handed out
 * before it are closed when they come back.
 */
class ConnectionPool {
public:
    /**
     * @param connector  null for plain TCP
     * @param selector   null for uniform random choice
     * @throws ConfigException without endpoints or with max_conns < 1
     */
    ConnectionPool(std::string name,
                   std::vector<Endpoint> endpoints,
                   const PoolOptions& options,
                   std::shared_ptr<Connector> connector = nullptr,
                   std::shared_ptr<EndpointSelector> selector = nullptr);

    ~ConnectionPool();

    // Non-copyable
    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    /**
     * Reuses an idle connection or makes a new one
     * @throws ConnectionException when full or when connecting fails
     */
    std::shared_ptr<Connection> get_connection();

    /**
     * Opens a new connection, retrying POOL_CONNECT_ATTEMPTS times
     */
    std::shared_ptr<Connection> make_connection();

    /**
     * Returns a borrowed connection, closed ones are removed instead
     */
    void release(const std::shared_ptr<Connection>& conn);

    /**
     * Closes and forgets a borrowed connection
     */
    void remove(const std::shared_ptr<Connection>& conn);

    /**
     * Closes idle connections, shuts down borrowed ones and resets the
     * counters. Borrowed connections are closed when they come back.
     */
    void destroy();

    size_t created_count() const;
    size_t in_use_count() const;
    size_t idle_count() const;

    const std::string& name() const { return name_; }
    const std::vector<Endpoint>& endpoints() const { return endpoints_; }

private:
    std::string name_;
    std::vector<Endpoint> endpoints_;
    PoolOptions options_;
    std::shared_ptr<Connector> connector_;
    std::shared_ptr<EndpointSelector> selector_;

    mutable std::mutex mutex_;
    std::deque<std::shared_ptr<Connection>> idle_;
    std::unordered_set<std::shared_ptr<Connection>> in_use_;
    size_t created_;
    uint64_t generation_;

    bool is_expired(const Connection& conn) const;
    const Endpoint& pick_endpoint() const;
};

/**
 * Borrows one connection for the lifetime of the guard
 *
 * On scope exit the connection goes back to the pool only if done() was
 * called and it is still open. Any other exit removes it, so a connection
 * with unread response bytes is never reused.
 */
class PooledConnection {
public:
    explicit PooledConnection(ConnectionPool& pool);
    ~PooledConnection();

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    Connection& operator*() const { return *conn_; }
    Connection* operator->() const { return conn_.get(); }
    Connection& get() const { return *conn_; }

    /**
     * Marks the request and its whole response as transferred
     */
    void done() { done_ = true; }

private:
    ConnectionPool& pool_;
    std::shared_ptr<Connection> conn_;
    bool done_;
};

} // namespace internal
} // namespace fdfs

#endif // FDFS_INTERNAL_CONNECTION_POOL_HPP
