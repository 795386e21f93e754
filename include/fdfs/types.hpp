/**
 * Copyright (C) 2025 FastDFS C++ Client Contributors
 *
 * FastDFS may be copied only under the terms of the GNU General
 * Public License V3, which may be found in the FastDFS source kit.
 */

#ifndef FDFS_TYPES_HPP
#define FDFS_TYPES_HPP

#include <string>
#include <map>
#include <memory>
#include <vector>
#include <chrono>
#include <cstdint>

namespace fdfs {

class EndpointSelector;

// Default network ports for FastDFS servers
constexpr uint16_t TRACKER_DEFAULT_PORT = 22122;
constexpr uint16_t STORAGE_DEFAULT_PORT = 23000;

// Protocol header size
constexpr size_t FDFS_PROTO_HEADER_LEN = 10;
constexpr size_t FDFS_PROTO_PKG_LEN_SIZE = 8;

// Field size limits
constexpr size_t FDFS_GROUP_NAME_MAX_LEN = 16;
constexpr size_t FDFS_FILE_EXT_NAME_MAX_LEN = 6;
constexpr size_t FDFS_MAX_META_NAME_LEN = 64;
constexpr size_t FDFS_MAX_META_VALUE_LEN = 256;
constexpr size_t FDFS_FILE_PREFIX_MAX_LEN = 16;
constexpr size_t FDFS_STORAGE_ID_MAX_SIZE = 16;
constexpr size_t FDFS_VERSION_SIZE = 6;
constexpr size_t FDFS_DOMAIN_NAME_MAX_SIZE = 128;
constexpr size_t FDFS_IP_ADDRESS_SIZE = 16;

// Protocol separators
constexpr char FDFS_RECORD_SEPARATOR = '\x01';
constexpr char FDFS_FIELD_SEPARATOR = '\x02';

// Command code of every response header
constexpr uint8_t FDFS_PROTO_CMD_RESP = 100;

// Tracker protocol commands
enum class TrackerCommand : uint8_t {
    SERVER_LIST_ONE_GROUP = 90,
    SERVER_LIST_ALL_GROUPS = 91,
    SERVER_LIST_STORAGE = 92,
    SERVICE_QUERY_STORE_WITHOUT_GROUP_ONE = 101,
    SERVICE_QUERY_FETCH_ONE = 102,
    SERVICE_QUERY_UPDATE = 103,
    SERVICE_QUERY_STORE_WITH_GROUP_ONE = 104
};

// Storage protocol commands
enum class StorageCommand : uint8_t {
    UPLOAD_FILE = 11,
    DELETE_FILE = 12,
    SET_METADATA = 13,
    DOWNLOAD_FILE = 14,
    GET_METADATA = 15,
    UPLOAD_SLAVE_FILE = 21,
    QUERY_FILE_INFO = 22,
    UPLOAD_APPENDER_FILE = 23,
    APPEND_FILE = 24,
    MODIFY_FILE = 34,
    TRUNCATE_FILE = 36
};

// Metadata operation flags
enum class MetadataFlag : uint8_t {
    OVERWRITE = 'O',  // Replace all existing metadata
    MERGE = 'M'       // Merge with existing metadata
};

// Metadata type alias
using Metadata = std::map<std::string, std::string>;

/**
 * Address of a tracker or storage server
 */
struct Endpoint {
    std::string host;
    uint16_t port = 0;

    std::string to_string() const {
        return host + ":" + std::to_string(port);
    }

    bool operator==(const Endpoint& other) const {
        return host == other.host && port == other.port;
    }
    bool operator<(const Endpoint& other) const {
        return host < other.host || (host == other.host && port < other.port);
    }
};

/**
 * A stored file, addressed as "group/remote_filename"
 */
struct RemoteFileId {
    std::string group_name;
    std::string filename;

    std::string to_string() const { return group_name + "/" + filename; }

    bool operator==(const RemoteFileId& other) const {
        return group_name == other.group_name && filename == other.filename;
    }
};

/**
 * Storage server resolved by a tracker
 */
struct StorageServerInfo {
    std::string group_name;
    std::string ip_addr;
    uint16_t port = 0;
    uint8_t store_path_index = 0;

    Endpoint endpoint() const { return Endpoint{ip_addr, port}; }
};

// Result of every upload flavour
struct UploadResult {
    std::string group_name;
    std::string remote_filename;
    std::string local_filename;  // empty for buffer uploads
    int64_t uploaded_size = 0;
    std::string storage_ip;

    std::string remote_file_id() const {
        return group_name + "/" + remote_filename;
    }
};

// Result of a download, to a buffer or to a local file
struct DownloadResult {
    std::string remote_file_id;
    std::vector<uint8_t> content;  // empty for downloads to file
    std::string local_filename;    // empty for downloads to buffer
    int64_t download_size = 0;
    std::string storage_ip;
};

// Confirmation of delete, append, modify, truncate and set metadata
struct OperationResult {
    std::string status;
    std::string remote_file_id;
    std::string storage_ip;
};

// File information structure
struct FileInfo {
    std::string group_name;
    std::string remote_filename;
    int64_t file_size = 0;
    int64_t create_timestamp = 0;
    uint32_t crc32 = 0;
    std::string source_ip_addr;
};

// One group as reported by the tracker
struct GroupStat {
    std::string group_name;
    int64_t total_mb = 0;
    int64_t free_mb = 0;
    int64_t trunk_free_mb = 0;
    int64_t count = 0;
    int64_t storage_port = 0;
    int64_t storage_http_port = 0;
    int64_t active_count = 0;
    int64_t current_write_server = 0;
    int64_t store_path_count = 0;
    int64_t subdir_count_per_path = 0;
    int64_t current_trunk_file_id = 0;
};

// One storage server as reported by the tracker
struct StorageStat {
    uint8_t status = 0;
    std::string id;
    std::string ip_addr;
    std::string domain_name;
    std::string src_id;
    std::string version;
    int64_t join_time = 0;
    int64_t up_time = 0;
    int64_t total_mb = 0;
    int64_t free_mb = 0;
    int64_t upload_priority = 0;
    int64_t store_path_count = 0;
    int64_t subdir_count_per_path = 0;
    int64_t current_write_path = 0;
    int64_t storage_port = 0;
    int64_t storage_http_port = 0;

    int32_t connection_alloc_count = 0;
    int32_t connection_current_count = 0;
    int32_t connection_max_count = 0;

    int64_t total_upload_count = 0;
    int64_t success_upload_count = 0;
    int64_t total_append_count = 0;
    int64_t success_append_count = 0;
    int64_t total_modify_count = 0;
    int64_t success_modify_count = 0;
    int64_t total_truncate_count = 0;
    int64_t success_truncate_count = 0;
    int64_t total_set_meta_count = 0;
    int64_t success_set_meta_count = 0;
    int64_t total_delete_count = 0;
    int64_t success_delete_count = 0;
    int64_t total_download_count = 0;
    int64_t success_download_count = 0;
    int64_t total_get_meta_count = 0;
    int64_t success_get_meta_count = 0;
    int64_t total_create_link_count = 0;
    int64_t success_create_link_count = 0;
    int64_t total_delete_link_count = 0;
    int64_t success_delete_link_count = 0;
    int64_t total_upload_bytes = 0;
    int64_t success_upload_bytes = 0;
    int64_t total_append_bytes = 0;
    int64_t success_append_bytes = 0;
    int64_t total_modify_bytes = 0;
    int64_t success_modify_bytes = 0;
    int64_t total_download_bytes = 0;
    int64_t success_download_bytes = 0;
    int64_t total_sync_in_bytes = 0;
    int64_t success_sync_in_bytes = 0;
    int64_t total_sync_out_bytes = 0;
    int64_t success_sync_out_bytes = 0;
    int64_t total_file_open_count = 0;
    int64_t success_file_open_count = 0;
    int64_t total_file_read_count = 0;
    int64_t success_file_read_count = 0;
    int64_t total_file_write_count = 0;
    int64_t success_file_write_count = 0;

    int64_t last_source_update = 0;
    int64_t last_sync_update = 0;
    int64_t last_synced_timestamp = 0;
    int64_t last_heart_beat_time = 0;

    bool if_trunk_server = false;
};

// Client configuration
struct ClientConfig {
    std::vector<Endpoint> tracker_servers;
    int max_conns = 10;
    std::chrono::seconds connect_timeout{5};
    std::chrono::seconds network_timeout{30};
    std::chrono::seconds idle_timeout{3600};

    // Picks the tracker for each new tracker connection, random when null
    std::shared_ptr<EndpointSelector> tracker_selector;
};

} // namespace fdfs

#endif // FDFS_TYPES_HPP
