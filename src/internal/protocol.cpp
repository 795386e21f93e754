/**
 * Copyright (C) 2025 FastDFS C++ Client Contributors
 *
 * FastDFS may be copied only under the terms of the GNU General
 * Public License V3, which may be found in the FastDFS source kit.
 */

#include "internal/protocol.hpp"
#include "internal/connection.hpp"
#include "fdfs/errors.hpp"
#include <algorithm>
#include <cinttypes>
#include <cstring>

#include "fastcommon/logger.h"
#include "fastcommon/shared_func.h"

namespace fdfs {
namespace internal {

namespace {

int64_t StorageStat::* const kStorageStatFields[] = {
    &StorageStat::join_time,
    &StorageStat::up_time,
    &StorageStat::total_mb,
    &StorageStat::free_mb,
    &StorageStat::upload_priority,
    &StorageStat::store_path_count,
    &StorageStat::subdir_count_per_path,
    &StorageStat::current_write_path,
    &StorageStat::storage_port,
    &StorageStat::storage_http_port,
};

int32_t StorageStat::* const kStorageStatConnections[] = {
    &StorageStat::connection_alloc_count,
    &StorageStat::connection_current_count,
    &StorageStat::connection_max_count,
};

// counters and timestamps, in FDFSStorageStatBuff order
int64_t StorageStat::* const kStorageStatCounters[] = {
    &StorageStat::total_upload_count,
    &StorageStat::success_upload_count,
    &StorageStat::total_append_count,
    &StorageStat::success_append_count,
    &StorageStat::total_modify_count,
    &StorageStat::success_modify_count,
    &StorageStat::total_truncate_count,
    &StorageStat::success_truncate_count,
    &StorageStat::total_set_meta_count,
    &StorageStat::success_set_meta_count,
    &StorageStat::total_delete_count,
    &StorageStat::success_delete_count,
    &StorageStat::total_download_count,
    &StorageStat::success_download_count,
    &StorageStat::total_get_meta_count,
    &StorageStat::success_get_meta_count,
    &StorageStat::total_create_link_count,
    &StorageStat::success_create_link_count,
    &StorageStat::total_delete_link_count,
    &StorageStat::success_delete_link_count,
    &StorageStat::total_upload_bytes,
    &StorageStat::success_upload_bytes,
    &StorageStat::total_append_bytes,
    &StorageStat::success_append_bytes,
    &StorageStat::total_modify_bytes,
    &StorageStat::success_modify_bytes,
    &StorageStat::total_download_bytes,
    &StorageStat::success_download_bytes,
    &StorageStat::total_sync_in_bytes,
    &StorageStat::success_sync_in_bytes,
    &StorageStat::total_sync_out_bytes,
    &StorageStat::success_sync_out_bytes,
    &StorageStat::total_file_open_count,
    &StorageStat::success_file_open_count,
    &StorageStat::total_file_read_count,
    &StorageStat::success_file_read_count,
    &StorageStat::total_file_write_count,
    &StorageStat::success_file_write_count,
    &StorageStat::last_source_update,
    &StorageStat::last_sync_update,
    &StorageStat::last_synced_timestamp,
    &StorageStat::last_heart_beat_time,
};

int64_t GroupStat::* const kGroupStatFields[] = {
    &GroupStat::total_mb,
    &GroupStat::free_mb,
    &GroupStat::trunk_free_mb,
    &GroupStat::count,
    &GroupStat::storage_port,
    &GroupStat::storage_http_port,
    &GroupStat::active_count,
    &GroupStat::current_write_server,
    &GroupStat::store_path_count,
    &GroupStat::subdir_count_per_path,
    &GroupStat::current_trunk_file_id,
};

void expect_size(const std::vector<uint8_t>& data, size_t expected, const char* what) {
    if (data.size() != expected) {
        throw MalformedFrameException(std::string(what) + " expects " +
                                      std::to_string(expected) + " bytes, got " +
                                      std::to_string(data.size()));
    }
}

} // namespace

std::vector<uint8_t> encode_header(int64_t length, uint8_t cmd, uint8_t status) {
    std::vector<uint8_t> header(FDFS_PROTO_HEADER_LEN);
    long2buff(length, reinterpret_cast<char*>(header.data()));
    header[FDFS_PROTO_PKG_LEN_SIZE] = cmd;
    header[FDFS_PROTO_PKG_LEN_SIZE + 1] = status;
    return header;
}

FrameHeader decode_header(const uint8_t* data, size_t size) {
    if (size < FDFS_PROTO_HEADER_LEN) {
        throw MalformedFrameException("header too short, " +
                                      std::to_string(size) + " bytes");
    }

    FrameHeader header;
    header.length = buff2long(reinterpret_cast<const char*>(data));
    header.cmd = data[FDFS_PROTO_PKG_LEN_SIZE];
    header.status = data[FDFS_PROTO_PKG_LEN_SIZE + 1];
    if (header.length < 0) {
        throw MalformedFrameException("negative package length " +
                                      std::to_string(header.length));
    }
    return header;
}

FrameHeader decode_header(const std::vector<uint8_t>& data) {
    return decode_header(data.data(), data.size());
}

PacketWriter& PacketWriter::put_long(int64_t n) {
    char buff[FDFS_PROTO_PKG_LEN_SIZE];
    long2buff(n, buff);
    buffer_.insert(buffer_.end(), buff, buff + sizeof(buff));
    return *this;
}

PacketWriter& PacketWriter::put_int(int32_t n) {
    char buff[4];
    int2buff(n, buff);
    buffer_.insert(buffer_.end(), buff, buff + sizeof(buff));
    return *this;
}

PacketWriter& PacketWriter::put_byte(uint8_t b) {
    buffer_.push_back(b);
    return *this;
}

PacketWriter& PacketWriter::put_fixed(const std::string& s, size_t width) {
    size_t n = std::min(s.size(), width);
    buffer_.insert(buffer_.end(), s.begin(), s.begin() + n);
    buffer_.insert(buffer_.end(), width - n, 0);
    return *this;
}

PacketWriter& PacketWriter::put_string(const std::string& s) {
    buffer_.insert(buffer_.end(), s.begin(), s.end());
    return *this;
}

PacketWriter& PacketWriter::put_bytes(const std::vector<uint8_t>& bytes) {
    buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
    return *this;
}

const uint8_t* PacketReader::take(size_t n) {
    if (n > remaining()) {
        throw MalformedFrameException("need " + std::to_string(n) +
                                      " more bytes, " + std::to_string(remaining()) +
                                      " left");
    }
    const uint8_t* p = data_ + pos_;
    pos_ += n;
    return p;
}

int64_t PacketReader::get_long() {
    return buff2long(reinterpret_cast<const char*>(take(FDFS_PROTO_PKG_LEN_SIZE)));
}

int32_t PacketReader::get_int() {
    return buff2int(reinterpret_cast<const char*>(take(4)));
}

uint8_t PacketReader::get_byte() {
    return *take(1);
}

std::string PacketReader::get_fixed(size_t width) {
    const char* p = reinterpret_cast<const char*>(take(width));
    return std::string(p, strnlen(p, width));
}

std::string PacketReader::get_rest() {
    size_t n = remaining();
    const char* p = reinterpret_cast<const char*>(take(n));
    return std::string(p, n);
}

std::vector<uint8_t> QueryStoreRequest::encode() const {
    PacketWriter writer;
    if (!group_name.empty()) {
        writer.put_fixed(group_name, FDFS_GROUP_NAME_MAX_LEN);
    }
    return writer.release();
}

QueryStoreRequest QueryStoreRequest::decode(const std::vector<uint8_t>& data) {
    QueryStoreRequest req;
    if (!data.empty()) {
        expect_size(data, FDFS_GROUP_NAME_MAX_LEN, "query store request");
        PacketReader reader(data);
        req.group_name = reader.get_fixed(FDFS_GROUP_NAME_MAX_LEN);
    }
    return req;
}

std::vector<uint8_t> FileRequest::encode() const {
    PacketWriter writer(FDFS_GROUP_NAME_MAX_LEN + filename.size());
    writer.put_fixed(group_name, FDFS_GROUP_NAME_MAX_LEN)
          .put_string(filename);
    return writer.release();
}

FileRequest FileRequest::decode(const std::vector<uint8_t>& data) {
    PacketReader reader(data);
    FileRequest req;
    req.group_name = reader.get_fixed(FDFS_GROUP_NAME_MAX_LEN);
    req.filename = reader.get_rest();
    return req;
}

std::vector<uint8_t> StorageServerResponse::encode(bool with_store_path) const {
    PacketWriter writer(TRACKER_QUERY_STORAGE_STORE_BODY_LEN);
    writer.put_fixed(server.group_name, FDFS_GROUP_NAME_MAX_LEN)
          .put_fixed(server.ip_addr, FDFS_IP_ADDRESS_SIZE - 1)
          .put_long(server.port);
    if (with_store_path) {
        writer.put_byte(server.store_path_index);
    }
    return writer.release();
}

StorageServerResponse StorageServerResponse::decode(const std::vector<uint8_t>& data,
                                                    bool with_store_path) {
    expect_size(data, with_store_path ? TRACKER_QUERY_STORAGE_STORE_BODY_LEN
                                      : TRACKER_QUERY_STORAGE_FETCH_BODY_LEN,
                "storage server response");

    PacketReader reader(data);
    StorageServerResponse resp;
    resp.server.group_name = reader.get_fixed(FDFS_GROUP_NAME_MAX_LEN);
    resp.server.ip_addr = reader.get_fixed(FDFS_IP_ADDRESS_SIZE - 1);
    resp.server.port = static_cast<uint16_t>(reader.get_long());
    if (with_store_path) {
        resp.server.store_path_index = reader.get_byte();
    }
    return resp;
}

std::vector<uint8_t> UploadRequest::encode() const {
    PacketWriter writer(1 + FDFS_PROTO_PKG_LEN_SIZE + FDFS_FILE_EXT_NAME_MAX_LEN);
    writer.put_byte(store_path_index)
          .put_long(file_size)
          .put_fixed(ext_name, FDFS_FILE_EXT_NAME_MAX_LEN);
    return writer.release();
}

UploadRequest UploadRequest::decode(const std::vector<uint8_t>& data) {
    expect_size(data, 1 + FDFS_PROTO_PKG_LEN_SIZE + FDFS_FILE_EXT_NAME_MAX_LEN,
                "upload request");
    PacketReader reader(data);
    UploadRequest req;
    req.store_path_index = reader.get_byte();
    req.file_size = reader.get_long();
    req.ext_name = reader.get_fixed(FDFS_FILE_EXT_NAME_MAX_LEN);
    return req;
}

std::vector<uint8_t> UploadResponse::encode() const {
    PacketWriter writer;
    writer.put_fixed(group_name, FDFS_GROUP_NAME_MAX_LEN)
          .put_string(remote_filename);
    return writer.release();
}

UploadResponse UploadResponse::decode(const std::vector<uint8_t>& data) {
    if (data.size() <= FDFS_GROUP_NAME_MAX_LEN) {
        throw MalformedFrameException("upload response too short, " +
                                      std::to_string(data.size()) + " bytes");
    }
    PacketReader reader(data);
    UploadResponse resp;
    resp.group_name = reader.get_fixed(FDFS_GROUP_NAME_MAX_LEN);
    resp.remote_filename = reader.get_rest();
    return resp;
}

std::vector<uint8_t> SlaveUploadRequest::encode() const {
    PacketWriter writer;
    writer.put_long(static_cast<int64_t>(master_filename.size()))
          .put_long(file_size)
          .put_fixed(prefix_name, FDFS_FILE_PREFIX_MAX_LEN)
          .put_fixed(ext_name, FDFS_FILE_EXT_NAME_MAX_LEN)
          .put_string(master_filename);
    return writer.release();
}

SlaveUploadRequest SlaveUploadRequest::decode(const std::vector<uint8_t>& data) {
    PacketReader reader(data);
    SlaveUploadRequest req;
    int64_t master_len = reader.get_long();
    req.file_size = reader.get_long();
    req.prefix_name = reader.get_fixed(FDFS_FILE_PREFIX_MAX_LEN);
    req.ext_name = reader.get_fixed(FDFS_FILE_EXT_NAME_MAX_LEN);
    req.master_filename = reader.get_rest();
    if (master_len != static_cast<int64_t>(req.master_filename.size())) {
        throw MalformedFrameException("master filename length mismatch");
    }
    return req;
}

std::vector<uint8_t> DownloadRequest::encode() const {
    PacketWriter writer;
    writer.put_long(offset)
          .put_long(length)
          .put_fixed(group_name, FDFS_GROUP_NAME_MAX_LEN)
          .put_string(filename);
    return writer.release();
}

DownloadRequest DownloadRequest::decode(const std::vector<uint8_t>& data) {
    PacketReader reader(data);
    DownloadRequest req;
    req.offset = reader.get_long();
    req.length = reader.get_long();
    req.group_name = reader.get_fixed(FDFS_GROUP_NAME_MAX_LEN);
    req.filename = reader.get_rest();
    return req;
}

std::vector<uint8_t> SetMetadataRequest::encode() const {
    std::vector<uint8_t> meta_buff = encode_metadata(metadata);

    PacketWriter writer;
    writer.put_long(static_cast<int64_t>(filename.size()))
          .put_long(static_cast<int64_t>(meta_buff.size()))
          .put_byte(static_cast<uint8_t>(flag))
          .put_fixed(group_name, FDFS_GROUP_NAME_MAX_LEN)
          .put_string(filename)
          .put_bytes(meta_buff);
    return writer.release();
}

SetMetadataRequest SetMetadataRequest::decode(const std::vector<uint8_t>& data) {
    PacketReader reader(data);
    SetMetadataRequest req;
    int64_t name_len = reader.get_long();
    int64_t meta_len = reader.get_long();
    req.flag = static_cast<MetadataFlag>(reader.get_byte());
    req.group_name = reader.get_fixed(FDFS_GROUP_NAME_MAX_LEN);
    if (name_len < 0 || meta_len < 0 ||
        static_cast<uint64_t>(name_len) + static_cast<uint64_t>(meta_len) !=
            reader.remaining()) {
        throw MalformedFrameException("set metadata lengths mismatch");
    }
    std::string rest = reader.get_rest();
    req.filename = rest.substr(0, name_len);
    req.metadata = decode_metadata(
        std::vector<uint8_t>(rest.begin() + name_len, rest.end()));
    return req;
}

std::vector<uint8_t> AppendRequest::encode() const {
    PacketWriter writer;
    writer.put_long(static_cast<int64_t>(filename.size()))
          .put_long(file_size)
          .put_string(filename);
    return writer.release();
}

AppendRequest AppendRequest::decode(const std::vector<uint8_t>& data) {
    PacketReader reader(data);
    AppendRequest req;
    int64_t name_len = reader.get_long();
    req.file_size = reader.get_long();
    req.filename = reader.get_rest();
    if (name_len != static_cast<int64_t>(req.filename.size())) {
        throw MalformedFrameException("append filename length mismatch");
    }
    return req;
}

std::vector<uint8_t> ModifyRequest::encode() const {
    PacketWriter writer;
    writer.put_long(static_cast<int64_t>(filename.size()))
          .put_long(offset)
          .put_long(file_size)
          .put_string(filename);
    return writer.release();
}

ModifyRequest ModifyRequest::decode(const std::vector<uint8_t>& data) {
    PacketReader reader(data);
    ModifyRequest req;
    int64_t name_len = reader.get_long();
    req.offset = reader.get_long();
    req.file_size = reader.get_long();
    req.filename = reader.get_rest();
    if (name_len != static_cast<int64_t>(req.filename.size())) {
        throw MalformedFrameException("modify filename length mismatch");
    }
    return req;
}

std::vector<uint8_t> TruncateRequest::encode() const {
    PacketWriter writer;
    writer.put_long(static_cast<int64_t>(filename.size()))
          .put_long(truncated_size)
          .put_string(filename);
    return writer.release();
}

TruncateRequest TruncateRequest::decode(const std::vector<uint8_t>& data) {
    PacketReader reader(data);
    TruncateRequest req;
    int64_t name_len = reader.get_long();
    req.truncated_size = reader.get_long();
    req.filename = reader.get_rest();
    if (name_len != static_cast<int64_t>(req.filename.size())) {
        throw MalformedFrameException("truncate filename length mismatch");
    }
    return req;
}

std::vector<uint8_t> FileInfoResponse::encode() const {
    PacketWriter writer(STORAGE_FILE_INFO_BODY_LEN);
    writer.put_long(file_size)
          .put_long(create_timestamp)
          .put_long(crc32)
          .put_fixed(source_ip_addr, FDFS_IP_ADDRESS_SIZE);
    return writer.release();
}

FileInfoResponse FileInfoResponse::decode(const std::vector<uint8_t>& data) {
    expect_size(data, STORAGE_FILE_INFO_BODY_LEN, "file info response");
    PacketReader reader(data);
    FileInfoResponse resp;
    resp.file_size = reader.get_long();
    resp.create_timestamp = reader.get_long();
    resp.crc32 = static_cast<uint32_t>(reader.get_long());
    resp.source_ip_addr = reader.get_fixed(FDFS_IP_ADDRESS_SIZE);
    return resp;
}

std::vector<uint8_t> ListServersRequest::encode() const {
    PacketWriter writer;
    writer.put_fixed(group_name, FDFS_GROUP_NAME_MAX_LEN);
    if (!storage_id.empty()) {
        writer.put_fixed(storage_id, FDFS_STORAGE_ID_MAX_SIZE);
    }
    return writer.release();
}

ListServersRequest ListServersRequest::decode(const std::vector<uint8_t>& data) {
    PacketReader reader(data);
    ListServersRequest req;
    req.group_name = reader.get_fixed(FDFS_GROUP_NAME_MAX_LEN);
    if (reader.remaining() > 0) {
        req.storage_id = reader.get_fixed(reader.remaining());
    }
    return req;
}

void encode_group_stat(const GroupStat& stat, PacketWriter& writer) {
    writer.put_fixed(stat.group_name, FDFS_GROUP_NAME_MAX_LEN + 1);
    for (auto field : kGroupStatFields) {
        writer.put_long(stat.*field);
    }
}

GroupStat decode_group_stat(PacketReader& reader) {
    GroupStat stat;
    stat.group_name = reader.get_fixed(FDFS_GROUP_NAME_MAX_LEN + 1);
    for (auto field : kGroupStatFields) {
        stat.*field = reader.get_long();
    }
    return stat;
}

std::vector<GroupStat> decode_group_stats(const std::vector<uint8_t>& data) {
    if (data.size() % TRACKER_GROUP_STAT_SIZE != 0) {
        throw MalformedFrameException("group listing of " +
                                      std::to_string(data.size()) +
                                      " bytes is not a multiple of " +
                                      std::to_string(TRACKER_GROUP_STAT_SIZE));
    }

    std::vector<GroupStat> stats;
    stats.reserve(data.size() / TRACKER_GROUP_STAT_SIZE);
    PacketReader reader(data);
    while (reader.remaining() > 0) {
        stats.push_back(decode_group_stat(reader));
    }
    return stats;
}

void encode_storage_stat(const StorageStat& stat, PacketWriter& writer) {
    writer.put_byte(stat.status)
          .put_fixed(stat.id, FDFS_STORAGE_ID_MAX_SIZE)
          .put_fixed(stat.ip_addr, FDFS_IP_ADDRESS_SIZE)
          .put_fixed(stat.domain_name, FDFS_DOMAIN_NAME_MAX_SIZE)
          .put_fixed(stat.src_id, FDFS_STORAGE_ID_MAX_SIZE)
          .put_fixed(stat.version, FDFS_VERSION_SIZE);
    for (auto field : kStorageStatFields) {
        writer.put_long(stat.*field);
    }
    for (auto field : kStorageStatConnections) {
        writer.put_int(stat.*field);
    }
    for (auto field : kStorageStatCounters) {
        writer.put_long(stat.*field);
    }
    writer.put_byte(stat.if_trunk_server ? 1 : 0);
}

StorageStat decode_storage_stat(PacketReader& reader) {
    StorageStat stat;
    stat.status = reader.get_byte();
    stat.id = reader.get_fixed(FDFS_STORAGE_ID_MAX_SIZE);
    stat.ip_addr = reader.get_fixed(FDFS_IP_ADDRESS_SIZE);
    stat.domain_name = reader.get_fixed(FDFS_DOMAIN_NAME_MAX_SIZE);
    stat.src_id = reader.get_fixed(FDFS_STORAGE_ID_MAX_SIZE);
    stat.version = reader.get_fixed(FDFS_VERSION_SIZE);
    for (auto field : kStorageStatFields) {
        stat.*field = reader.get_long();
    }
    for (auto field : kStorageStatConnections) {
        stat.*field = reader.get_int();
    }
    for (auto field : kStorageStatCounters) {
        stat.*field = reader.get_long();
    }
    stat.if_trunk_server = reader.get_byte() != 0;
    return stat;
}

std::vector<StorageStat> decode_storage_stats(const std::vector<uint8_t>& data) {
    if (data.size() % TRACKER_STORAGE_STAT_SIZE != 0) {
        throw MalformedFrameException("server listing of " +
                                      std::to_string(data.size()) +
                                      " bytes is not a multiple of " +
                                      std::to_string(TRACKER_STORAGE_STAT_SIZE));
    }

    std::vector<StorageStat> stats;
    stats.reserve(data.size() / TRACKER_STORAGE_STAT_SIZE);
    PacketReader reader(data);
    while (reader.remaining() > 0) {
        stats.push_back(decode_storage_stat(reader));
    }
    return stats;
}

RemoteFileId parse_file_id(const std::string& file_id) {
    size_t pos = file_id.find('/');
    if (pos == std::string::npos || pos == 0) {
        throw DataException("Invalid file ID format: " + file_id);
    }

    RemoteFileId id;
    id.group_name = file_id.substr(0, pos);
    id.filename = file_id.substr(pos + 1);

    if (id.group_name.length() > FDFS_GROUP_NAME_MAX_LEN) {
        throw DataException("Invalid group name in file ID: " + file_id);
    }
    if (id.filename.empty()) {
        throw DataException("Invalid remote filename in file ID: " + file_id);
    }
    return id;
}

std::string join_file_id(const std::string& group_name,
                         const std::string& remote_filename) {
    return group_name + "/" + remote_filename;
}

void validate_metadata(const Metadata& metadata) {
    static const char separators[] = {FDFS_RECORD_SEPARATOR, FDFS_FIELD_SEPARATOR, 0};
    for (const auto& [key, value] : metadata) {
        if (key.empty()) {
            throw DataException("Metadata key cannot be empty");
        }
        if (key.find_first_of(separators) != std::string::npos ||
            value.find_first_of(separators) != std::string::npos) {
            throw DataException("Metadata item " + key +
                                " contains a separator byte");
        }
    }
}

std::vector<uint8_t> encode_metadata(const Metadata& metadata) {
    validate_metadata(metadata);

    std::vector<uint8_t> result;
    for (const auto& [key, value] : metadata) {
        if (!result.empty()) {
            result.push_back(FDFS_RECORD_SEPARATOR);
        }

        size_t key_len = std::min(key.length(), FDFS_MAX_META_NAME_LEN);
        size_t value_len = std::min(value.length(), FDFS_MAX_META_VALUE_LEN);
        result.insert(result.end(), key.begin(), key.begin() + key_len);
        result.push_back(FDFS_FIELD_SEPARATOR);
        result.insert(result.end(), value.begin(), value.begin() + value_len);
    }
    return result;
}

Metadata decode_metadata(const std::vector<uint8_t>& data) {
    Metadata metadata;

    auto record_begin = data.begin();
    while (record_begin < data.end()) {
        auto record_end = std::find(record_begin, data.end(),
                                    static_cast<uint8_t>(FDFS_RECORD_SEPARATOR));
        auto field_sep = std::find(record_begin, record_end,
                                   static_cast<uint8_t>(FDFS_FIELD_SEPARATOR));
        if (field_sep != record_end) {
            metadata[std::string(record_begin, field_sep)] =
                std::string(field_sep + 1, record_end);
        }

        if (record_end == data.end()) {
            break;
        }
        record_begin = record_end + 1;
    }

    return metadata;
}

void send_request(Connection& conn, uint8_t cmd,
                  const std::vector<uint8_t>& body, int64_t content_size) {
    std::vector<uint8_t> packet = encode_header(
        static_cast<int64_t>(body.size()) + content_size, cmd);
    packet.insert(packet.end(), body.begin(), body.end());
    conn.send(packet);
}

FrameHeader recv_header(Connection& conn) {
    uint8_t buff[FDFS_PROTO_HEADER_LEN];
    conn.recv(buff, sizeof(buff));

    FrameHeader header;
    try {
        header = decode_header(buff, sizeof(buff));
    } catch (const MalformedFrameException&) {
        conn.close();
        throw;
    }

    if (header.cmd != FDFS_PROTO_CMD_RESP) {
        logError("file: " __FILE__ ", line: %d, "
                 "server: %s, response cmd: %d != %d",
                 __LINE__, conn.endpoint().to_string().c_str(),
                 header.cmd, FDFS_PROTO_CMD_RESP);
        conn.close();
        throw MalformedFrameException("response cmd " +
                                      std::to_string(header.cmd) +
                                      " from " + conn.endpoint().to_string());
    }
    return header;
}

std::vector<uint8_t> recv_body(Connection& conn, const FrameHeader& header,
                               int64_t max_length) {
    if (header.length > max_length) {
        logError("file: " __FILE__ ", line: %d, "
                 "server: %s, response body length: %" PRId64
                 " exceeds max: %" PRId64,
                 __LINE__, conn.endpoint().to_string().c_str(),
                 header.length, max_length);
        conn.close();
        throw ResponseException("body length " + std::to_string(header.length) +
                                " from " + conn.endpoint().to_string() +
                                " exceeds " + std::to_string(max_length),
                                EINVAL);
    }

    std::vector<uint8_t> body(static_cast<size_t>(header.length));
    size_t received = conn.recv_upto(body.data(), body.size());
    if (received != body.size()) {
        logError("file: " __FILE__ ", line: %d, "
                 "server: %s, expect body length: %" PRId64 ", received: %d",
                 __LINE__, conn.endpoint().to_string().c_str(),
                 header.length, static_cast<int>(received));
        conn.close();
        throw ResponseException("body ended after " + std::to_string(received) +
                                " of " + std::to_string(header.length) +
                                " bytes from " + conn.endpoint().to_string(),
                                EINVAL);
    }
    return body;
}

void expect_body_length(Connection& conn, const FrameHeader& header,
                        int64_t expected, const char* what) {
    if (header.length == expected) {
        return;
    }

    logError("file: " __FILE__ ", line: %d, "
             "server: %s, %s response package length: %" PRId64
             " is invalid, expect length: %" PRId64,
             __LINE__, conn.endpoint().to_string().c_str(), what,
             header.length, expected);
    conn.close();
    throw ResponseException(std::string(what) + " body length " +
                            std::to_string(header.length) + " != " +
                            std::to_string(expected), EINVAL);
}

void skip_body(Connection& conn, const FrameHeader& header) {
    if (header.length > 0) {
        recv_body(conn, header);
    }
}

} // namespace internal
} // namespace fdfs
