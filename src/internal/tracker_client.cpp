/**
 * Copyright (C) 2025 FastDFS C++ Client Contributors
 *
 * FastDFS may be copied only under the terms of the GNU General
 * Public License V3, which may be found in the FastDFS source kit.
 */

#include "internal/tracker_client.hpp"
#include "internal/connection.hpp"
#include "internal/connection_pool.hpp"
#include "internal/protocol.hpp"
#include "fdfs/errors.hpp"

#include "fastcommon/common_define.h"
#include "fastcommon/logger.h"

namespace fdfs {
namespace internal {

TrackerClient::TrackerClient(ConnectionPool& pool)
    : pool_(pool) {
}

std::vector<uint8_t> TrackerClient::call(uint8_t cmd, const std::vector<uint8_t>& body,
                                         int64_t expected_length, const char* what) {
    PooledConnection conn(pool_);
    send_request(*conn, cmd, body);

    FrameHeader header = recv_header(*conn);
    if (header.status != 0) {
        skip_body(*conn, header);
        conn.done();
        logError("file: " __FILE__ ", line: %d, "
                 "tracker server %s, %s fail, errno: %d, error info: %s",
                 __LINE__, conn->endpoint().to_string().c_str(), what,
                 header.status, STRERROR(header.status));
        throw ResponseException(std::string(what) + " on tracker " +
                                conn->endpoint().to_string() + ": " +
                                STRERROR(header.status), header.status);
    }

    if (expected_length >= 0) {
        expect_body_length(*conn, header, expected_length, what);
    }
    std::vector<uint8_t> resp = recv_body(*conn, header);
    conn.done();
    return resp;
}

StorageServerInfo TrackerClient::query_storage_store(const std::string& group_name) {
    QueryStoreRequest req{group_name};
    uint8_t cmd = static_cast<uint8_t>(group_name.empty()
        ? TrackerCommand::SERVICE_QUERY_STORE_WITHOUT_GROUP_ONE
        : TrackerCommand::SERVICE_QUERY_STORE_WITH_GROUP_ONE);

    auto body = call(cmd, req.encode(), TRACKER_QUERY_STORAGE_STORE_BODY_LEN,
                     "query storage store");
    return StorageServerResponse::decode(body, true).server;
}

StorageServerInfo TrackerClient::query_storage(uint8_t cmd,
                                               const std::string& group_name,
                                               const std::string& remote_filename) {
    if (group_name.empty() || remote_filename.empty()) {
        throw DataException("group name and remote filename are required");
    }

    FileRequest req{group_name, remote_filename};
    auto body = call(cmd, req.encode(), TRACKER_QUERY_STORAGE_FETCH_BODY_LEN,
                     "query storage");
    return StorageServerResponse::decode(body, false).server;
}

StorageServerInfo TrackerClient::query_storage_update(const std::string& group_name,
                                                      const std::string& remote_filename) {
    return query_storage(static_cast<uint8_t>(TrackerCommand::SERVICE_QUERY_UPDATE),
                         group_name, remote_filename);
}

StorageServerInfo TrackerClient::query_storage_fetch(const std::string& group_name,
                                                     const std::string& remote_filename) {
    return query_storage(static_cast<uint8_t>(TrackerCommand::SERVICE_QUERY_FETCH_ONE),
                         group_name, remote_filename);
}

GroupStat TrackerClient::list_one_group(const std::string& group_name) {
    PacketWriter writer;
    writer.put_fixed(group_name, FDFS_GROUP_NAME_MAX_LEN);

    auto body = call(static_cast<uint8_t>(TrackerCommand::SERVER_LIST_ONE_GROUP),
                     writer.data(), TRACKER_GROUP_STAT_SIZE, "list one group");
    PacketReader reader(body);
    return decode_group_stat(reader);
}

std::vector<GroupStat> TrackerClient::list_all_groups() {
    auto body = call(static_cast<uint8_t>(TrackerCommand::SERVER_LIST_ALL_GROUPS),
                     std::vector<uint8_t>(), -1, "list all groups");
    return decode_group_stats(body);
}

std::vector<StorageStat> TrackerClient::list_servers(const std::string& group_name,
                                                     const std::string& storage_id) {
    ListServersRequest req{group_name, storage_id};
    auto body = call(static_cast<uint8_t>(TrackerCommand::SERVER_LIST_STORAGE),
                     req.encode(), -1, "list servers");
    return decode_storage_stats(body);
}

} // namespace internal
} // namespace fdfs
