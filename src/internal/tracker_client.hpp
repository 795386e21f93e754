/**
 * Copyright (C) 2025 FastDFS C++ Client Contributors
 *
 * FastDFS may be copied only under the terms of the GNU General
 * Public License V3, which may be found in the FastDFS source kit.
 */

#ifndef FDFS_INTERNAL_TRACKER_CLIENT_HPP
#define FDFS_INTERNAL_TRACKER_CLIENT_HPP

#include "fdfs/types.hpp"
#include <string>
#include <vector>

namespace fdfs {
namespace internal {

class ConnectionPool;

/**
 * Tracker requests over a pool of tracker connections
 *
 * One attempt per call, a nonzero tracker status is a ResponseException.
 */
class TrackerClient {
public:
    explicit TrackerClient(ConnectionPool& pool);

    /**
     * Storage server to upload to, any group when group_name is empty
     */
    StorageServerInfo query_storage_store(const std::string& group_name = "");

    /**
     * Storage server to change an existing file on
     */
    StorageServerInfo query_storage_update(const std::string& group_name,
                                           const std::string& remote_filename);

    /**
     * Storage server to read an existing file from
     */
    StorageServerInfo query_storage_fetch(const std::string& group_name,
                                          const std::string& remote_filename);

    GroupStat list_one_group(const std::string& group_name);

    std::vector<GroupStat> list_all_groups();

    /**
     * Storage servers of a group, only the given one when storage_id is set
     */
    std::vector<StorageStat> list_servers(const std::string& group_name,
                                          const std::string& storage_id = "");

private:
    ConnectionPool& pool_;

    StorageServerInfo query_storage(uint8_t cmd,
                                    const std::string& group_name,
                                    const std::string& remote_filename);

    std::vector<uint8_t> call(uint8_t cmd, const std::vector<uint8_t>& body,
                              int64_t expected_length, const char* what);
};

} // namespace internal
} // namespace fdfs

#endif // FDFS_INTERNAL_TRACKER_CLIENT_HPP
