/**
 * Copyright (C) 2025 FastDFS C++ Client Contributors
 *
 * FastDFS may be copied only under the terms of the GNU General
 * Public License V3, which may be found in the FastDFS source kit.
 */

#ifndef FDFS_INTERNAL_STORAGE_CLIENT_HPP
#define FDFS_INTERNAL_STORAGE_CLIENT_HPP

#include "fdfs/types.hpp"
#include "internal/connection_pool.hpp"
#include "internal/protocol.hpp"
#include <string>
#include <vector>
#include <memory>

namespace fdfs {
namespace internal {

class Connection;
class Connector;

/**
 * Throws DataException unless path names an existing regular file
 */
void check_local_file(const std::string& local_filename);

/**
 * Extension after the last dot of the base name, empty if none
 */
std::string get_file_ext_name(const std::string& filename);

/**
 * Requests to one storage server
 *
 * Owns a single-endpoint pool. Uploads return the name the server chose,
 * every other call addresses an existing file by RemoteFileId.
 */
class StorageClient {
public:
    StorageClient(const Endpoint& endpoint, const PoolOptions& options,
                  std::shared_ptr<Connector> connector = nullptr);

    // Non-copyable
    StorageClient(const StorageClient&) = delete;
    StorageClient& operator=(const StorageClient&) = delete;

    const Endpoint& endpoint() const { return endpoint_; }
    ConnectionPool& pool() { return pool_; }

    UploadResult upload_by_filename(const StorageServerInfo& server,
                                    const std::string& local_filename,
                                    const Metadata& metadata = Metadata());
    UploadResult upload_by_file(const StorageServerInfo& server,
                                const std::string& local_filename,
                                const Metadata& metadata = Metadata());
    UploadResult upload_by_buffer(const StorageServerInfo& server,
                                  const std::vector<uint8_t>& data,
                                  const std::string& file_ext_name,
                                  const Metadata& metadata = Metadata());

    UploadResult upload_appender_by_filename(const StorageServerInfo& server,
                                             const std::string& local_filename,
                                             const Metadata& metadata = Metadata());
    UploadResult upload_appender_by_file(const StorageServerInfo& server,
                                         const std::string& local_filename,
                                         const Metadata& metadata = Metadata());
    UploadResult upload_appender_by_buffer(const StorageServerInfo& server,
                                           const std::vector<uint8_t>& data,
                                           const std::string& file_ext_name,
                                           const Metadata& metadata = Metadata());

    UploadResult upload_slave_by_filename(const StorageServerInfo& server,
                                          const std::string& local_filename,
                                          const std::string& master_filename,
                                          const std::string& prefix_name,
                                          const Metadata& metadata = Metadata());
    UploadResult upload_slave_by_file(const StorageServerInfo& server,
                                      const std::string& local_filename,
                                      const std::string& master_filename,
                                      const std::string& prefix_name,
                                      const Metadata& metadata = Metadata());
    UploadResult upload_slave_by_buffer(const StorageServerInfo& server,
                                        const std::vector<uint8_t>& data,
                                        const std::string& master_filename,
                                        const std::string& prefix_name,
                                        const std::string& file_ext_name,
                                        const Metadata& metadata = Metadata());

    /**
     * Downloads length bytes from offset, 0/0 for the whole file,
     * written to local_filename as they arrive
     */
    DownloadResult download_to_file(const RemoteFileId& file_id,
                                    const std::string& local_filename,
                                    int64_t offset = 0, int64_t length = 0);
    DownloadResult download_to_buffer(const RemoteFileId& file_id,
                                      int64_t offset = 0, int64_t length = 0);

    OperationResult delete_file(const RemoteFileId& file_id);

    OperationResult truncate_file(const RemoteFileId& file_id, int64_t truncated_size);

    OperationResult append_by_filename(const RemoteFileId& file_id,
                                       const std::string& local_filename);
    OperationResult append_by_file(const RemoteFileId& file_id,
                                   const std::string& local_filename);
    OperationResult append_by_buffer(const RemoteFileId& file_id,
                                     const std::vector<uint8_t>& data);

    OperationResult modify_by_filename(const RemoteFileId& file_id,
                                       const std::string& local_filename,
                                       int64_t offset);
    OperationResult modify_by_file(const RemoteFileId& file_id,
                                   const std::string& local_filename,
                                   int64_t offset);
    OperationResult modify_by_buffer(const RemoteFileId& file_id,
                                     const std::vector<uint8_t>& data,
                                     int64_t offset);

    Metadata get_metadata(const RemoteFileId& file_id);

    OperationResult set_metadata(const RemoteFileId& file_id,
                                 const Metadata& metadata,
                                 MetadataFlag flag = MetadataFlag::OVERWRITE);

    FileInfo query_file_info(const RemoteFileId& file_id);

private:
    struct Content;

    // Exception type a nonzero status turns into
    enum class StatusError { RESPONSE, DATA };

    Endpoint endpoint_;
    ConnectionPool pool_;

    std::vector<uint8_t> call(uint8_t cmd, const std::vector<uint8_t>& body,
                              const Content* content, int64_t expected_length,
                              StatusError status_error, const char* what,
                              int64_t max_length = MAX_RESPONSE_BODY_LEN);

    UploadResult upload(StorageCommand cmd, const StorageServerInfo& server,
                        const Content& content, const std::string& file_ext_name,
                        const std::string& master_filename,
                        const std::string& prefix_name,
                        const Metadata& metadata);

    OperationResult append(const RemoteFileId& file_id, const Content& content);

    OperationResult modify(const RemoteFileId& file_id, const Content& content,
                           int64_t offset);

    OperationResult result(const char* status, const RemoteFileId& file_id) const;
};

} // namespace internal
} // namespace fdfs

#endif // FDFS_INTERNAL_STORAGE_CLIENT_HPP
