/**
 * Copyright (C) 2025 FastDFS C++ Client Contributors
 *
 * FastDFS may be copied only under the terms of the GNU General
 * Public License V3, which may be found in the FastDFS source kit.
 */

#include "internal/connection_pool.hpp"
#include "internal/connection.hpp"
#include "fdfs/endpoint_selector.hpp"
#include "fdfs/errors.hpp"

#include "fastcommon/logger.h"

namespace fdfs {
namespace internal {

ConnectionPool::ConnectionPool(std::string name,
                               std::vector<Endpoint> endpoints,
                               const PoolOptions& options,
                               std::shared_ptr<Connector> connector,
                               std::shared_ptr<EndpointSelector> selector)
    : name_(std::move(name))
    , endpoints_(std::move(endpoints))
    , options_(options)
    , connector_(std::move(connector))
    , selector_(std::move(selector))
    , created_(0)
    , generation_(0) {
    if (endpoints_.empty()) {
        throw ConfigException("pool " + name_ + " has no endpoints");
    }
    if (options_.max_conns < 1) {
        throw ConfigException("pool " + name_ + " max connections must be > 0");
    }
    if (!connector_) {
        connector_ = std::make_shared<TcpConnector>();
    }
    if (!selector_) {
        selector_ = std::make_shared<RandomEndpointSelector>();
    }

    logDebug("file: " __FILE__ ", line: %d, "
             "pool %s created, endpoints: %d, max connections: %d",
             __LINE__, name_.c_str(), static_cast<int>(endpoints_.size()),
             options_.max_conns);
}

ConnectionPool::~ConnectionPool() {
    destroy();
}

bool ConnectionPool::is_expired(const Connection& conn) const {
    return std::chrono::steady_clock::now() - conn.last_used() >= options_.idle_timeout;
}

std::shared_ptr<Connection> ConnectionPool::get_connection() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        while (!idle_.empty()) {
            auto conn = idle_.back();
            idle_.pop_back();

            if (conn->is_open() && !is_expired(*conn)) {
                conn->update_last_used();
                in_use_.insert(conn);
                return conn;
            }

            logDebug("file: " __FILE__ ", line: %d, "
                     "pool %s drops idle connection to %s",
                     __LINE__, name_.c_str(),
                     conn->endpoint().to_string().c_str());
            conn->close();
            --created_;
        }
    }

    return make_connection();
}

const Endpoint& ConnectionPool::pick_endpoint() const {
    size_t index = selector_->select(endpoints_.size());
    if (index >= endpoints_.size()) {
        logError("file: " __FILE__ ", line: %d, "
                 "pool %s, selector returned index %d of %d endpoints",
                 __LINE__, name_.c_str(), static_cast<int>(index),
                 static_cast<int>(endpoints_.size()));
        throw ConfigException("endpoint selector returned index " +
                              std::to_string(index) + " for " +
                              std::to_string(endpoints_.size()) + " endpoints");
    }
    return endpoints_[index];
}

std::shared_ptr<Connection> ConnectionPool::make_connection() {
    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (created_ >= static_cast<size_t>(options_.max_conns)) {
            logError("file: " __FILE__ ", line: %d, "
                     "pool %s is full, max connections: %d",
                     __LINE__, name_.c_str(), options_.max_conns);
            throw ConnectionException("too many connections in pool " + name_ +
                                      ", max: " + std::to_string(options_.max_conns));
        }
        ++created_;
        generation = generation_;
    }

    std::shared_ptr<Connection> conn;
    std::string last_error;
    for (int attempt = 1; attempt <= POOL_CONNECT_ATTEMPTS && !conn; ++attempt) {
        const Endpoint* endpoint = nullptr;
        try {
            endpoint = &pick_endpoint();
            conn = connector_->connect(*endpoint, options_.connect_timeout,
                                       options_.network_timeout);
        } catch (const ConnectionException& e) {
            last_error = e.what();
            logWarning("file: " __FILE__ ", line: %d, "
                       "pool %s, connect attempt %d to %s fail: %s",
                       __LINE__, name_.c_str(), attempt,
                       endpoint->to_string().c_str(), e.what());
        } catch (...) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (generation == generation_) {
                --created_;
            }
            throw;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (generation != generation_) {
        if (conn) {
            conn->close();
        }
        throw ConnectionException("pool " + name_ + " destroyed while connecting");
    }

    if (!conn) {
        --created_;
        logError("file: " __FILE__ ", line: %d, "
                 "pool %s, connect fail after %d attempts",
                 __LINE__, name_.c_str(), POOL_CONNECT_ATTEMPTS);
        throw ConnectionException("pool " + name_ + " failed after " +
                                  std::to_string(POOL_CONNECT_ATTEMPTS) +
                                  " attempts, last error: " + last_error);
    }

    conn->set_generation(generation);
    conn->update_last_used();
    in_use_.insert(conn);
    return conn;
}

void ConnectionPool::release(const std::shared_ptr<Connection>& conn) {
    if (!conn) {
        return;
    }
    if (!conn->is_open()) {
        remove(conn);
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (conn->generation() != generation_ || in_use_.erase(conn) == 0) {
        logDebug("file: " __FILE__ ", line: %d, "
                 "pool %s closes stale connection to %s",
                 __LINE__, name_.c_str(), conn->endpoint().to_string().c_str());
        conn->close();
        return;
    }

    conn->update_last_used();
    idle_.push_back(conn);
}

void ConnectionPool::remove(const std::shared_ptr<Connection>& conn) {
    if (!conn) {
        return;
    }
    conn->close();

    std::lock_guard<std::mutex> lock(mutex_);
    if (conn->generation() == generation_ && in_use_.erase(conn) > 0) {
        --created_;
    }
}

void ConnectionPool::destroy() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& conn : idle_) {
        conn->close();
    }
    // borrowers may be blocked on these, they close them on return
    for (auto& conn : in_use_) {
        conn->shutdown();
    }

    logDebug("file: " __FILE__ ", line: %d, "
             "pool %s destroyed, %d connections dropped",
             __LINE__, name_.c_str(), static_cast<int>(created_));

    idle_.clear();
    in_use_.clear();
    created_ = 0;
    ++generation_;
}

size_t ConnectionPool::created_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return created_;
}

size_t ConnectionPool::in_use_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_use_.size();
}

size_t ConnectionPool::idle_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return idle_.size();
}

PooledConnection::PooledConnection(ConnectionPool& pool)
    : pool_(pool)
    , conn_(pool.get_connection())
    , done_(false) {
}

PooledConnection::~PooledConnection() {
    if (done_ && conn_->is_open()) {
        pool_.release(conn_);
    } else {
        pool_.remove(conn_);
    }
}

} // namespace internal
} // namespace fdfs
