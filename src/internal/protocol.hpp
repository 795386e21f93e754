/**
 * Copyright (C) 2025 FastDFS C++ Client Contributors
 *
 * FastDFS may be copied only under the terms of the GNU General
 * Public License V3, which may be found in the FastDFS source kit.
 */

#ifndef FDFS_INTERNAL_PROTOCOL_HPP
#define FDFS_INTERNAL_PROTOCOL_HPP

#include "fdfs/types.hpp"
#include <string>
#include <vector>
#include <map>

namespace fdfs {
namespace internal {

class Connection;

// Fixed response body sizes
constexpr size_t TRACKER_QUERY_STORAGE_FETCH_BODY_LEN =
    FDFS_GROUP_NAME_MAX_LEN + FDFS_IP_ADDRESS_SIZE - 1 + FDFS_PROTO_PKG_LEN_SIZE;
constexpr size_t TRACKER_QUERY_STORAGE_STORE_BODY_LEN =
    TRACKER_QUERY_STORAGE_FETCH_BODY_LEN + 1;
constexpr size_t STORAGE_FILE_INFO_BODY_LEN =
    3 * FDFS_PROTO_PKG_LEN_SIZE + FDFS_IP_ADDRESS_SIZE;
constexpr size_t TRACKER_GROUP_STAT_SIZE =
    FDFS_GROUP_NAME_MAX_LEN + 1 + 11 * FDFS_PROTO_PKG_LEN_SIZE;
constexpr size_t TRACKER_STORAGE_STAT_SIZE =
    1 + FDFS_STORAGE_ID_MAX_SIZE + FDFS_IP_ADDRESS_SIZE +
    FDFS_DOMAIN_NAME_MAX_SIZE + FDFS_STORAGE_ID_MAX_SIZE + FDFS_VERSION_SIZE +
    10 * FDFS_PROTO_PKG_LEN_SIZE + 3 * 4 + 42 * FDFS_PROTO_PKG_LEN_SIZE + 1;

// Largest variable length body read into memory
constexpr int64_t MAX_RESPONSE_BODY_LEN = 16 * 1024 * 1024;
// Largest whole file download held in memory
constexpr int64_t MAX_DOWNLOAD_BUFFER_LEN = 1024LL * 1024 * 1024;

/**
 * Protocol header structure
 */
struct FrameHeader {
    int64_t length;
    uint8_t cmd;
    uint8_t status;
};

/**
 * Encodes a protocol header
 */
std::vector<uint8_t> encode_header(int64_t length, uint8_t cmd, uint8_t status = 0);

/**
 * Decodes a protocol header
 * @throws MalformedFrameException on short input or negative length
 */
FrameHeader decode_header(const uint8_t* data, size_t size);
FrameHeader decode_header(const std::vector<uint8_t>& data);

/**
 * Appends big-endian integers and padded strings to a request body
 */
class PacketWriter {
public:
    PacketWriter() = default;
    explicit PacketWriter(size_t reserve) { buffer_.reserve(reserve); }

    PacketWriter& put_long(int64_t n);
    PacketWriter& put_int(int32_t n);
    PacketWriter& put_byte(uint8_t b);

    /**
     * Writes exactly width bytes, truncating or padding with NUL
     */
    PacketWriter& put_fixed(const std::string& s, size_t width);

    PacketWriter& put_string(const std::string& s);
    PacketWriter& put_bytes(const std::vector<uint8_t>& bytes);

    const std::vector<uint8_t>& data() const { return buffer_; }
    size_t size() const { return buffer_.size(); }
    std::vector<uint8_t> release() { return std::move(buffer_); }

private:
    std::vector<uint8_t> buffer_;
};

/**
 * Reads fields back in order, running past the end is a malformed frame
 */
class PacketReader {
public:
    PacketReader(const uint8_t* data, size_t size)
        : data_(data), size_(size), pos_(0) {}
    explicit PacketReader(const std::vector<uint8_t>& data)
        : PacketReader(data.data(), data.size()) {}

    int64_t get_long();
    int32_t get_int();
    uint8_t get_byte();

    /**
     * Reads width bytes, the value ends at the first NUL
     */
    std::string get_fixed(size_t width);

    /**
     * Reads everything left
     */
    std::string get_rest();

    size_t remaining() const { return size_ - pos_; }

private:
    const uint8_t* data_;
    size_t size_;
    size_t pos_;

    const uint8_t* take(size_t n);
};

// Group name only, empty for "any group"
struct QueryStoreRequest {
    std::string group_name;

    std::vector<uint8_t> encode() const;
    static QueryStoreRequest decode(const std::vector<uint8_t>& data);
};

// group(16) filename, shared by fetch, update, delete, get metadata and file info
struct FileRequest {
    std::string group_name;
    std::string filename;

    std::vector<uint8_t> encode() const;
    static FileRequest decode(const std::vector<uint8_t>& data);
};

// Tracker answer naming a storage server, with the store path index for stores
struct StorageServerResponse {
    StorageServerInfo server;

    std::vector<uint8_t> encode(bool with_store_path) const;
    static StorageServerResponse decode(const std::vector<uint8_t>& data,
                                        bool with_store_path);
};

// Fixed part of an upload or appender upload, the content follows
struct UploadRequest {
    uint8_t store_path_index = 0;
    int64_t file_size = 0;
    std::string ext_name;

    std::vector<uint8_t> encode() const;
    static UploadRequest decode(const std::vector<uint8_t>& data);
};

struct UploadResponse {
    std::string group_name;
    std::string remote_filename;

    std::vector<uint8_t> encode() const;
    static UploadResponse decode(const std::vector<uint8_t>& data);
};

// Fixed part of a slave upload, the content follows
struct SlaveUploadRequest {
    std::string master_filename;
    int64_t file_size = 0;
    std::string prefix_name;
    std::string ext_name;

    std::vector<uint8_t> encode() const;
    static SlaveUploadRequest decode(const std::vector<uint8_t>& data);
};

struct DownloadRequest {
    int64_t offset = 0;
    int64_t length = 0;
    std::string group_name;
    std::string filename;

    std::vector<uint8_t> encode() const;
    static DownloadRequest decode(const std::vector<uint8_t>& data);
};

struct SetMetadataRequest {
    std::string group_name;
    std::string filename;
    Metadata metadata;
    MetadataFlag flag = MetadataFlag::OVERWRITE;

    std::vector<uint8_t> encode() const;
    static SetMetadataRequest decode(const std::vector<uint8_t>& data);
};

// Fixed part of an append, the content follows
struct AppendRequest {
    std::string filename;
    int64_t file_size = 0;

    std::vector<uint8_t> encode() const;
    static AppendRequest decode(const std::vector<uint8_t>& data);
};

// Fixed part of a modify, the content follows
struct ModifyRequest {
    std::string filename;
    int64_t offset = 0;
    int64_t file_size = 0;

    std::vector<uint8_t> encode() const;
    static ModifyRequest decode(const std::vector<uint8_t>& data);
};

struct TruncateRequest {
    std::string filename;
    int64_t truncated_size = 0;

    std::vector<uint8_t> encode() const;
    static TruncateRequest decode(const std::vector<uint8_t>& data);
};

struct FileInfoResponse {
    int64_t file_size = 0;
    int64_t create_timestamp = 0;
    uint32_t crc32 = 0;
    std::string source_ip_addr;

    std::vector<uint8_t> encode() const;
    static FileInfoResponse decode(const std::vector<uint8_t>& data);
};

// Group name and an optional storage id filter
struct ListServersRequest {
    std::string group_name;
    std::string storage_id;

    std::vector<uint8_t> encode() const;
    static ListServersRequest decode(const std::vector<uint8_t>& data);
};

void encode_group_stat(const GroupStat& stat, PacketWriter& writer);
GroupStat decode_group_stat(PacketReader& reader);

/**
 * Decodes a tracker group listing, n records of TRACKER_GROUP_STAT_SIZE
 */
std::vector<GroupStat> decode_group_stats(const std::vector<uint8_t>& data);

void encode_storage_stat(const StorageStat& stat, PacketWriter& writer);
StorageStat decode_storage_stat(PacketReader& reader);

/**
 * Decodes a tracker server listing, n records of TRACKER_STORAGE_STAT_SIZE
 */
std::vector<StorageStat> decode_storage_stats(const std::vector<uint8_t>& data);

/**
 * Splits "group/remote_filename"
 * @throws DataException if either part is missing or the group is too long
 */
RemoteFileId parse_file_id(const std::string& file_id);

/**
 * Joins group name and remote filename into a file ID
 */
std::string join_file_id(const std::string& group_name,
                         const std::string& remote_filename);

/**
 * Checks metadata for separator bytes
 * @throws DataException naming the offending key
 */
void validate_metadata(const Metadata& metadata);

/**
 * Encodes metadata into FastDFS wire format
 */
std::vector<uint8_t> encode_metadata(const Metadata& metadata);

/**
 * Decodes metadata from FastDFS wire format
 */
Metadata decode_metadata(const std::vector<uint8_t>& data);

/**
 * Sends header and fixed body, content_size more bytes are announced
 * in the header and sent by the caller
 */
void send_request(Connection& conn, uint8_t cmd,
                  const std::vector<uint8_t>& body, int64_t content_size = 0);

/**
 * Receives a response header
 * @throws MalformedFrameException (connection closed) if the command is not 100
 */
FrameHeader recv_header(Connection& conn);

/**
 * Receives the whole body the header announced
 * @throws ResponseException (connection closed) if the length is above
 *         max_length or the peer stops early
 */
std::vector<uint8_t> recv_body(Connection& conn, const FrameHeader& header,
                               int64_t max_length = MAX_RESPONSE_BODY_LEN);

/**
 * Closes the connection and throws unless the body has the expected length
 */
void expect_body_length(Connection& conn, const FrameHeader& header,
                        int64_t expected, const char* what);

/**
 * Reads and drops the body of an error response
 */
void skip_body(Connection& conn, const FrameHeader& header);

} // namespace internal
} // namespace fdfs

#endif // FDFS_INTERNAL_PROTOCOL_HPP
