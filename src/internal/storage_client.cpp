/**
 * Copyright (C) 2025 FastDFS C++ Client Contributors
 *
 * FastDFS may be copied only under the terms of the GNU General
 * Public License V3, which may be found in the FastDFS source kit.
 */

#include "internal/storage_client.hpp"
#include "internal/connection.hpp"
#include "internal/protocol.hpp"
#include "fdfs/errors.hpp"
#include <algorithm>
#include <cinttypes>
#include <fstream>

#include <sys/stat.h>
#include <unistd.h>

#include "fastcommon/common_define.h"
#include "fastcommon/logger.h"
#include "fastcommon/shared_func.h"

namespace fdfs {
namespace internal {

// Read and write size for streamed file content
static const size_t kFileChunkSize = 256 * 1024;

void check_local_file(const std::string& local_filename) {
    if (local_filename.empty()) {
        throw DataException("local filename is empty");
    }
    if (!fileExists(local_filename.c_str())) {
        throw DataException("local file " + local_filename + " does not exist",
                            ENOENT);
    }
    if (!isFile(local_filename.c_str())) {
        throw DataException("local file " + local_filename +
                            " is not a regular file");
    }
}

std::string get_file_ext_name(const std::string& filename) {
    size_t slash = filename.find_last_of('/');
    size_t dot = filename.find_last_of('.');
    if (dot == std::string::npos || dot == filename.length() - 1 ||
        (slash != std::string::npos && dot < slash)) {
        return "";
    }
    return filename.substr(dot + 1);
}

/**
 * Bytes sent after the fixed request fields
 */
struct StorageClient::Content {
    const std::vector<uint8_t>* buffer = nullptr;
    std::vector<uint8_t> loaded;
    std::string local_filename;
    int64_t size = 0;
    bool streamed = false;

    static Content from_buffer(const std::vector<uint8_t>& data) {
        if (data.empty()) {
            throw DataException("file buffer is empty");
        }
        Content content;
        content.buffer = &data;
        content.size = static_cast<int64_t>(data.size());
        return content;
    }

    static Content read_file(const std::string& local_filename) {
        check_local_file(local_filename);

        std::ifstream file(local_filename, std::ios::binary | std::ios::ate);
        if (!file.is_open()) {
            throw DataException("Cannot open file: " + local_filename, errno);
        }

        Content content;
        content.local_filename = local_filename;
        content.size = static_cast<int64_t>(file.tellg());
        file.seekg(0, std::ios::beg);
        content.loaded.resize(static_cast<size_t>(content.size));
        if (!file.read(reinterpret_cast<char*>(content.loaded.data()), content.size)) {
            throw DataException("Cannot read file: " + local_filename);
        }
        return content;
    }

    static Content stream_file(const std::string& local_filename) {
        check_local_file(local_filename);

        struct stat st;
        if (stat(local_filename.c_str(), &st) != 0) {
            throw DataException("stat file " + local_filename + " fail: " +
                                STRERROR(errno), errno);
        }

        Content content;
        content.local_filename = local_filename;
        content.size = static_cast<int64_t>(st.st_size);
        content.streamed = true;
        return content;
    }

    void send(Connection& conn) const {
        if (!streamed) {
            conn.send(buffer != nullptr ? *buffer : loaded);
            return;
        }

        // the header already announced size bytes, any shortfall desyncs
        std::ifstream file(local_filename, std::ios::binary);
        std::vector<char> buff(std::min(static_cast<size_t>(size), kFileChunkSize));
        int64_t remain = size;
        while (remain > 0 && file) {
            size_t chunk = static_cast<size_t>(
                std::min<int64_t>(remain, static_cast<int64_t>(buff.size())));
            if (!file.read(buff.data(), chunk)) {
                break;
            }
            conn.send(buff.data(), chunk);
            remain -= chunk;
        }

        if (remain > 0) {
            logError("file: " __FILE__ ", line: %d, "
                     "read local file %s fail, %" PRId64 " bytes not sent",
                     __LINE__, local_filename.c_str(), remain);
            conn.close();
            throw DataException("Cannot read file: " + local_filename, EIO);
        }
    }
};

StorageClient::StorageClient(const Endpoint& endpoint, const PoolOptions& options,
                             std::shared_ptr<Connector> connector)
    : endpoint_(endpoint)
    , pool_("storage " + endpoint.to_string(), {endpoint}, options,
            std::move(connector)) {
}

std::vector<uint8_t> StorageClient::call(uint8_t cmd, const std::vector<uint8_t>& body,
                                         const Content* content, int64_t expected_length,
                                         StatusError status_error, const char* what,
                                         int64_t max_length) {
    PooledConnection conn(pool_);
    send_request(*conn, cmd, body, content != nullptr ? content->size : 0);
    if (content != nullptr) {
        content->send(*conn);
    }

    FrameHeader header = recv_header(*conn);
    if (header.status != 0) {
        skip_body(*conn, header);
        conn.done();
        logError("file: " __FILE__ ", line: %d, "
                 "storage server %s, %s fail, errno: %d, error info: %s",
                 __LINE__, endpoint_.to_string().c_str(), what,
                 header.status, STRERROR(header.status));

        std::string message = std::string(what) + " on storage " +
                              endpoint_.to_string() + ": " + STRERROR(header.status);
        if (status_error == StatusError::DATA) {
            throw DataException(message, header.status);
        }
        throw ResponseException(message, header.status);
    }

    if (expected_length >= 0) {
        expect_body_length(*conn, header, expected_length, what);
    }
    std::vector<uint8_t> resp = recv_body(*conn, header, max_length);
    conn.done();
    return resp;
}

OperationResult StorageClient::result(const char* status, const RemoteFileId& file_id) const {
    OperationResult op;
    op.status = status;
    op.remote_file_id = file_id.to_string();
    op.storage_ip = endpoint_.host;
    return op;
}

UploadResult StorageClient::upload(StorageCommand cmd, const StorageServerInfo& server,
                                   const Content& content, const std::string& file_ext_name,
                                   const std::string& master_filename,
                                   const std::string& prefix_name,
                                   const Metadata& metadata) {
    validate_metadata(metadata);

    std::vector<uint8_t> body;
    if (cmd == StorageCommand::UPLOAD_SLAVE_FILE) {
        if (master_filename.empty()) {
            throw DataException("master filename is empty");
        }
        if (prefix_name.empty()) {
            throw DataException("prefix name can not be empty");
        }
        body = SlaveUploadRequest{master_filename, content.size, prefix_name,
                                  file_ext_name}.encode();
    } else {
        body = UploadRequest{server.store_path_index, content.size,
                             file_ext_name}.encode();
    }

    auto resp = UploadResponse::decode(call(static_cast<uint8_t>(cmd), body, &content,
                                            -1, StatusError::RESPONSE, "upload file"));

    UploadResult result;
    result.group_name = resp.group_name;
    result.remote_filename = resp.remote_filename;
    result.local_filename = content.local_filename;
    result.uploaded_size = content.size;
    result.storage_ip = endpoint_.host;

    if (!metadata.empty()) {
        RemoteFileId file_id{resp.group_name, resp.remote_filename};
        try {
            set_metadata(file_id, metadata, MetadataFlag::OVERWRITE);
        } catch (const FdfsException& e) {
            logError("file: " __FILE__ ", line: %d, "
                     "set metadata of %s fail, delete the file, error: %s",
                     __LINE__, file_id.to_string().c_str(), e.what());
            try {
                delete_file(file_id);
            } catch (const FdfsException& de) {
                logError("file: " __FILE__ ", line: %d, "
                         "delete %s fail: %s",
                         __LINE__, file_id.to_string().c_str(), de.what());
            }
            throw;
        }
    }

    return result;
}

UploadResult StorageClient::upload_by_filename(const StorageServerInfo& server,
                                               const std::string& local_filename,
                                               const Metadata& metadata) {
    return upload(StorageCommand::UPLOAD_FILE, server, Content::read_file(local_filename),
                  get_file_ext_name(local_filename), "", "", metadata);
}

UploadResult StorageClient::upload_by_file(const StorageServerInfo& server,
                                           const std::string& local_filename,
                                           const Metadata& metadata) {
    return upload(StorageCommand::UPLOAD_FILE, server, Content::stream_file(local_filename),
                  get_file_ext_name(local_filename), "", "", metadata);
}

UploadResult StorageClient::upload_by_buffer(const StorageServerInfo& server,
                                             const std::vector<uint8_t>& data,
                                             const std::string& file_ext_name,
                                             const Metadata& metadata) {
    return upload(StorageCommand::UPLOAD_FILE, server, Content::from_buffer(data),
                  file_ext_name, "", "", metadata);
}

UploadResult StorageClient::upload_appender_by_filename(const StorageServerInfo& server,
                                                        const std::string& local_filename,
                                                        const Metadata& metadata) {
    return upload(StorageCommand::UPLOAD_APPENDER_FILE, server,
                  Content::read_file(local_filename),
                  get_file_ext_name(local_filename), "", "", metadata);
}

UploadResult StorageClient::upload_appender_by_file(const StorageServerInfo& server,
                                                    const std::string& local_filename,
                                                    const Metadata& metadata) {
    return upload(StorageCommand::UPLOAD_APPENDER_FILE, server,
                  Content::stream_file(local_filename),
                  get_file_ext_name(local_filename), "", "", metadata);
}

UploadResult StorageClient::upload_appender_by_buffer(const StorageServerInfo& server,
                                                      const std::vector<uint8_t>& data,
                                                      const std::string& file_ext_name,
                                                      const Metadata& metadata) {
    return upload(StorageCommand::UPLOAD_APPENDER_FILE, server, Content::from_buffer(data),
                  file_ext_name, "", "", metadata);
}

UploadResult StorageClient::upload_slave_by_filename(const StorageServerInfo& server,
                                                     const std::string& local_filename,
                                                     const std::string& master_filename,
                                                     const std::string& prefix_name,
                                                     const Metadata& metadata) {
    return upload(StorageCommand::UPLOAD_SLAVE_FILE, server,
                  Content::read_file(local_filename), get_file_ext_name(local_filename),
                  master_filename, prefix_name, metadata);
}

UploadResult StorageClient::upload_slave_by_file(const StorageServerInfo& server,
                                                 const std::string& local_filename,
                                                 const std::string& master_filename,
                                                 const std::string& prefix_name,
                                                 const Metadata& metadata) {
    return upload(StorageCommand::UPLOAD_SLAVE_FILE, server,
                  Content::stream_file(local_filename), get_file_ext_name(local_filename),
                  master_filename, prefix_name, metadata);
}

UploadResult StorageClient::upload_slave_by_buffer(const StorageServerInfo& server,
                                                   const std::vector<uint8_t>& data,
                                                   const std::string& master_filename,
                                                   const std::string& prefix_name,
                                                   const std::string& file_ext_name,
                                                   const Metadata& metadata) {
    return upload(StorageCommand::UPLOAD_SLAVE_FILE, server, Content::from_buffer(data),
                  file_ext_name, master_filename, prefix_name, metadata);
}

DownloadResult StorageClient::download_to_file(const RemoteFileId& file_id,
                                               const std::string& local_filename,
                                               int64_t offset, int64_t length) {
    if (local_filename.empty()) {
        throw DataException("local filename is empty");
    }
    if (offset < 0 || length < 0) {
        throw DataException("offset and length must not be negative");
    }

    DownloadRequest req{offset, length, file_id.group_name, file_id.filename};
    PooledConnection conn(pool_);
    send_request(*conn, static_cast<uint8_t>(StorageCommand::DOWNLOAD_FILE), req.encode());

    FrameHeader header = recv_header(*conn);
    if (header.status != 0) {
        skip_body(*conn, header);
        conn.done();
        logError("file: " __FILE__ ", line: %d, "
                 "storage server %s, download %s fail, errno: %d, error info: %s",
                 __LINE__, endpoint_.to_string().c_str(), file_id.to_string().c_str(),
                 header.status, STRERROR(header.status));
        throw ResponseException("download file " + file_id.to_string() + ": " +
                                STRERROR(header.status), header.status);
    }
    if (length > 0 && header.length > length) {
        expect_body_length(*conn, header, length, "download file");
    }

    std::ofstream out(local_filename, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        int err_no = errno != 0 ? errno : EACCES;
        conn->close();
        throw DataException("Cannot create file: " + local_filename, err_no);
    }

    // a failed download leaves no partial file behind
    try {
        std::vector<char> buff(static_cast<size_t>(
            std::min<int64_t>(header.length, static_cast<int64_t>(kFileChunkSize))));
        int64_t remain = header.length;
        while (remain > 0) {
            size_t chunk = static_cast<size_t>(
                std::min<int64_t>(remain, static_cast<int64_t>(buff.size())));
            size_t received = conn->recv_upto(buff.data(), chunk);
            if (received != chunk) {
                logError("file: " __FILE__ ", line: %d, "
                         "storage server %s, download %s, %" PRId64
                         " of %" PRId64 " bytes missing",
                         __LINE__, endpoint_.to_string().c_str(),
                         file_id.to_string().c_str(),
                         remain - static_cast<int64_t>(received), header.length);
                conn->close();
                throw ResponseException("download body ended early from " +
                                        endpoint_.to_string(), EINVAL);
            }
            if (!out.write(buff.data(), received)) {
                conn->close();
                throw DataException("write to file " + local_filename + " fail", EIO);
            }
            remain -= received;
        }
        conn.done();

        out.close();
        if (out.fail()) {
            throw DataException("write to file " + local_filename + " fail", EIO);
        }
    } catch (const FdfsException&) {
        out.close();
        unlink(local_filename.c_str());
        throw;
    }

    DownloadResult result;
    result.remote_file_id = file_id.to_string();
    result.local_filename = local_filename;
    result.download_size = header.length;
    result.storage_ip = endpoint_.host;
    return result;
}

DownloadResult StorageClient::download_to_buffer(const RemoteFileId& file_id,
                                                 int64_t offset, int64_t length) {
    if (offset < 0 || length < 0) {
        throw DataException("offset and length must not be negative");
    }

    DownloadRequest req{offset, length, file_id.group_name, file_id.filename};
    DownloadResult result;
    result.content = call(static_cast<uint8_t>(StorageCommand::DOWNLOAD_FILE),
                          req.encode(), nullptr, -1, StatusError::RESPONSE,
                          "download file",
                          length > 0 ? length : MAX_DOWNLOAD_BUFFER_LEN);
    result.remote_file_id = file_id.to_string();
    result.download_size = static_cast<int64_t>(result.content.size());
    result.storage_ip = endpoint_.host;
    return result;
}

OperationResult StorageClient::delete_file(const RemoteFileId& file_id) {
    FileRequest req{file_id.group_name, file_id.filename};
    call(static_cast<uint8_t>(StorageCommand::DELETE_FILE), req.encode(), nullptr,
         0, StatusError::DATA, "delete file");
    return result("Delete file succeeded.", file_id);
}

OperationResult StorageClient::truncate_file(const RemoteFileId& file_id,
                                             int64_t truncated_size) {
    if (truncated_size < 0) {
        throw DataException("truncated size must not be negative");
    }

    TruncateRequest req{file_id.filename, truncated_size};
    call(static_cast<uint8_t>(StorageCommand::TRUNCATE_FILE), req.encode(), nullptr,
         0, StatusError::DATA, "truncate file");
    return result("Truncate succeeded.", file_id);
}

OperationResult StorageClient::append(const RemoteFileId& file_id, const Content& content) {
    AppendRequest req{file_id.filename, content.size};
    call(static_cast<uint8_t>(StorageCommand::APPEND_FILE), req.encode(), &content,
         0, StatusError::DATA, "append file");
    return result("Append file succeeded.", file_id);
}

OperationResult StorageClient::append_by_filename(const RemoteFileId& file_id,
                                                  const std::string& local_filename) {
    return append(file_id, Content::read_file(local_filename));
}

OperationResult StorageClient::append_by_file(const RemoteFileId& file_id,
                                              const std::string& local_filename) {
    return append(file_id, Content::stream_file(local_filename));
}

OperationResult StorageClient::append_by_buffer(const RemoteFileId& file_id,
                                                const std::vector<uint8_t>& data) {
    return append(file_id, Content::from_buffer(data));
}

OperationResult StorageClient::modify(const RemoteFileId& file_id, const Content& content,
                                      int64_t offset) {
    if (offset < 0) {
        throw DataException("modify offset must not be negative");
    }

    ModifyRequest req{file_id.filename, offset, content.size};
    call(static_cast<uint8_t>(StorageCommand::MODIFY_FILE), req.encode(), &content,
         0, StatusError::DATA, "modify file");
    return result("Modify succeeded.", file_id);
}

OperationResult StorageClient::modify_by_filename(const RemoteFileId& file_id,
                                                  const std::string& local_filename,
                                                  int64_t offset) {
    return modify(file_id, Content::read_file(local_filename), offset);
}

OperationResult StorageClient::modify_by_file(const RemoteFileId& file_id,
                                              const std::string& local_filename,
                                              int64_t offset) {
    return modify(file_id, Content::stream_file(local_filename), offset);
}

OperationResult StorageClient::modify_by_buffer(const RemoteFileId& file_id,
                                                const std::vector<uint8_t>& data,
                                                int64_t offset) {
    return modify(file_id, Content::from_buffer(data), offset);
}

Metadata StorageClient::get_metadata(const RemoteFileId& file_id) {
    FileRequest req{file_id.group_name, file_id.filename};
    return decode_metadata(call(static_cast<uint8_t>(StorageCommand::GET_METADATA),
                                req.encode(), nullptr, -1, StatusError::RESPONSE,
                                "get metadata"));
}

OperationResult StorageClient::set_metadata(const RemoteFileId& file_id,
                                            const Metadata& metadata,
                                            MetadataFlag flag) {
    SetMetadataRequest req{file_id.group_name, file_id.filename, metadata, flag};
    call(static_cast<uint8_t>(StorageCommand::SET_METADATA), req.encode(), nullptr,
         0, StatusError::RESPONSE, "set metadata");
    return result("Set metadata succeeded.", file_id);
}

FileInfo StorageClient::query_file_info(const RemoteFileId& file_id) {
    FileRequest req{file_id.group_name, file_id.filename};
    auto resp = FileInfoResponse::decode(
        call(static_cast<uint8_t>(StorageCommand::QUERY_FILE_INFO), req.encode(),
             nullptr, STORAGE_FILE_INFO_BODY_LEN, StatusError::RESPONSE,
             "query file info"));

    FileInfo info;
    info.group_name = file_id.group_name;
    info.remote_filename = file_id.filename;
    info.file_size = resp.file_size;
    info.create_timestamp = resp.create_timestamp;
    info.crc32 = resp.crc32;
    info.source_ip_addr = resp.source_ip_addr;
    return info;
}

} // namespace internal
} // namespace fdfs
