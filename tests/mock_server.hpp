/**
 * Copyright (C) 2025 FastDFS C++ Client Contributors
 *
 * FastDFS may be copied only under the terms of the GNU General
 * Public License V3, which may be found in the FastDFS source kit.
 */

#ifndef FDFS_TESTS_MOCK_SERVER_HPP
#define FDFS_TESTS_MOCK_SERVER_HPP

#include "fdfs/types.hpp"
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace fdfs {

namespace internal {
class Connection;
}

namespace test {

/**
 * Connection over one end of a socketpair, the other end is returned
 * in peer_fd and belongs to the caller
 */
std::shared_ptr<internal::Connection> make_connection_pair(
    const Endpoint& endpoint, int* peer_fd,
    std::chrono::seconds network_timeout = std::chrono::seconds(5));

/**
 * In-process tracker and storage server for one group, "group1"
 *
 * Listens on two loopback ports. The tracker always points at the
 * storage port, the storage keeps files in memory.
 */
class MockFdfsServer {
public:
    enum class Fault {
        STATUS,      // answer with a nonzero status
        BAD_CMD,     // answer with a command other than 100
        SHORT_BODY,  // announce a body, send part of it, hang up
        HUGE_LENGTH, // announce a 2^62 byte body, send two bytes, stay open
        STALL        // read the request, never answer, stay open
    };

    static constexpr const char* GROUP_NAME = "group1";

    MockFdfsServer();
    ~MockFdfsServer();

    MockFdfsServer(const MockFdfsServer&) = delete;
    MockFdfsServer& operator=(const MockFdfsServer&) = delete;

    void stop();

    Endpoint tracker_endpoint() const { return Endpoint{"127.0.0.1", tracker_port_}; }
    Endpoint storage_endpoint() const { return Endpoint{"127.0.0.1", storage_port_}; }

    /**
     * The next request with this command fails the given way
     */
    void inject(uint8_t cmd, Fault fault, uint8_t status = 0);

    bool has_file(const std::string& remote_filename) const;
    std::vector<uint8_t> file_content(const std::string& remote_filename) const;
    size_t file_count() const;

    int request_count(uint8_t cmd) const;
    int total_requests() const;
    int tracker_accepts() const { return tracker_accepts_; }
    int storage_accepts() const { return storage_accepts_; }

private:
    struct StoredFile {
        std::vector<uint8_t> content;
        Metadata metadata;
        bool appender = false;
        int64_t create_timestamp = 0;
    };

    struct Injected {
        Fault fault;
        uint8_t status;
    };

    int tracker_fd_;
    int storage_fd_;
    std::thread tracker_thread_;
    std::thread storage_thread_;
    uint16_t tracker_port_;
    uint16_t storage_port_;
    std::atomic<bool> running_;
    std::atomic<int> tracker_accepts_;
    std::atomic<int> storage_accepts_;

    mutable std::mutex mutex_;
    std::map<std::string, StoredFile> files_;
    std::map<uint8_t, Injected> injected_;
    std::map<uint8_t, int> request_counts_;
    std::set<int> client_fds_;
    std::vector<std::thread> threads_;
    int next_file_id_;

    void accept_loop(int listen_fd, std::atomic<int>* accepts);
    void serve(int fd);

    // Returns false when the connection must be dropped
    bool dispatch(int fd, uint8_t cmd, const std::vector<uint8_t>& body);

    uint8_t handle_tracker(uint8_t cmd, const std::vector<uint8_t>& body,
                           std::vector<uint8_t>& resp);
    uint8_t handle_storage(uint8_t cmd, const std::vector<uint8_t>& body,
                           std::vector<uint8_t>& resp);

    std::string new_filename(const std::string& ext_name);
};

} // namespace test
} // namespace fdfs

#endif // FDFS_TESTS_MOCK_SERVER_HPP
