/**
 * Copyright (C) 2025 FastDFS C++ Client Contributors
 *
 * FastDFS may be copied only under the terms of the GNU General
 * Public License V3, which may be found in the FastDFS source kit.
 */

#ifndef FDFS_CLIENT_HPP
#define FDFS_CLIENT_HPP

#include "fdfs/types.hpp"
#include "fdfs/errors.hpp"
#include <string>
#include <vector>
#include <memory>

namespace fdfs {

// Forward declarations
class ClientImpl;

/**
 * FastDFS Client
 *
 * Resolves storage servers through the trackers and talks to them over
 * pooled connections. Remote files are addressed by file IDs of the form
 * "group/remote_filename". One Client may be shared between threads.
 *
 * Example usage:
 * @code
 *   fdfs::ClientConfig config;
 *   config.tracker_servers = {{"192.168.1.100", 22122}};
 *
 *   fdfs::Client client(config);
 *
 *   auto uploaded = client.upload_by_filename("test.jpg");
 *   auto downloaded = client.download_to_buffer(uploaded.remote_file_id());
 *   client.delete_file(uploaded.remote_file_id());
 * @endcode
 */
class Client {
public:
    /**
     * Constructs a new FastDFS client with the given configuration
     * @param config Client configuration
     * @throws ConfigException if no tracker is configured
     */
    explicit Client(const ClientConfig& config);

    /**
     * Constructs a client from a client.conf file
     * @param conf_filename Path of the ini file, see load_client_config()
     * @throws ConfigException if the file is unreadable or incomplete
     */
    explicit Client(const std::string& conf_filename);

    /**
     * Destructor - closes the client and releases all resources
     */
    ~Client();

    // Non-copyable
    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    // Movable
    Client(Client&&) noexcept;
    Client& operator=(Client&&) noexcept;

    /**
     * Uploads a local file, read into memory first
     * @param local_filename Path to the local file, its extension is kept
     * @param metadata Optional metadata set right after the upload
     * @return Upload result with the new file ID
     * @throws DataException if the local file is missing or not a regular file
     * @throws ConnectionException on connection errors
     * @throws ResponseException if a server refuses the upload
     */
    UploadResult upload_by_filename(const std::string& local_filename,
                                    const Metadata* metadata = nullptr);

    /**
     * Uploads a local file, streamed in chunks
     */
    UploadResult upload_by_file(const std::string& local_filename,
                                const Metadata* metadata = nullptr);

    /**
     * Uploads data from a buffer
     * @param data File content, must not be empty
     * @param file_ext_name File extension without dot (e.g., "jpg", "txt")
     * @param metadata Optional metadata
     */
    UploadResult upload_by_buffer(const std::vector<uint8_t>& data,
                                  const std::string& file_ext_name,
                                  const Metadata* metadata = nullptr);

    /**
     * Uploads an appender file that can be appended, modified and
     * truncated later
     */
    UploadResult upload_appender_by_filename(const std::string& local_filename,
                                             const Metadata* metadata = nullptr);
    UploadResult upload_appender_by_file(const std::string& local_filename,
                                         const Metadata* metadata = nullptr);
    UploadResult upload_appender_by_buffer(const std::vector<uint8_t>& data,
                                           const std::string& file_ext_name,
                                           const Metadata* metadata = nullptr);

    /**
     * Uploads a slave file next to a master file, in the master's group
     * @param local_filename Path to the local file
     * @param master_file_id File ID of the master file
     * @param prefix_name Prefix for the slave file (e.g., "_thumb"), required
     * @param metadata Optional metadata
     * @return Upload result with the slave file ID
     */
    UploadResult upload_slave_by_filename(const std::string& local_filename,
                                          const std::string& master_file_id,
                                          const std::string& prefix_name,
                                          const Metadata* metadata = nullptr);
    UploadResult upload_slave_by_file(const std::string& local_filename,
                                      const std::string& master_file_id,
                                      const std::string& prefix_name,
                                      const Metadata* metadata = nullptr);
    UploadResult upload_slave_by_buffer(const std::vector<uint8_t>& data,
                                        const std::string& master_file_id,
                                        const std::string& prefix_name,
                                        const std::string& file_ext_name,
                                        const Metadata* metadata = nullptr);

    /**
     * Downloads a file and saves it to the local filesystem
     * @param file_id The file ID
     * @param local_filename Path where to save the file
     * @param offset Starting byte offset
     * @param length Number of bytes to download (0 means to end of file)
     */
    DownloadResult download_to_file(const std::string& file_id,
                                    const std::string& local_filename,
                                    int64_t offset = 0,
                                    int64_t length = 0);

    /**
     * Downloads a file, or a range of it, into memory
     */
    DownloadResult download_to_buffer(const std::string& file_id,
                                      int64_t offset = 0,
                                      int64_t length = 0);

    /**
     * Deletes a file from FastDFS
     * @throws DataException carrying the server status if the delete fails
     */
    OperationResult delete_file(const std::string& file_id);

    /**
     * Appends to an appender file
     */
    OperationResult append_by_filename(const std::string& file_id,
                                       const std::string& local_filename);
    OperationResult append_by_file(const std::string& file_id,
                                   const std::string& local_filename);
    OperationResult append_by_buffer(const std::string& file_id,
                                     const std::vector<uint8_t>& data);

    /**
     * Overwrites part of an appender file starting at offset
     */
    OperationResult modify_by_filename(const std::string& file_id,
                                       const std::string& local_filename,
                                       int64_t offset = 0);
    OperationResult modify_by_file(const std::string& file_id,
                                   const std::string& local_filename,
                                   int64_t offset = 0);
    OperationResult modify_by_buffer(const std::string& file_id,
                                     const std::vector<uint8_t>& data,
                                     int64_t offset = 0);

    /**
     * Truncates an appender file to specified size
     * @param file_id The appender file ID
     * @param truncated_size New file size
     */
    OperationResult truncate_file(const std::string& file_id, int64_t truncated_size);

    /**
     * Sets metadata for a file
     * @param file_id The file ID
     * @param metadata Metadata key-value pairs
     * @param flag Metadata operation flag (Overwrite or Merge)
     * @throws DataException if a key or value contains a separator byte
     * @throws ResponseException if the storage server refuses
     */
    OperationResult set_metadata(const std::string& file_id,
                                 const Metadata& metadata,
                                 MetadataFlag flag = MetadataFlag::OVERWRITE);

    /**
     * Retrieves metadata for a file
     * @param file_id The file ID
     * @return Metadata as key-value map
     */
    Metadata get_metadata(const std::string& file_id);

    /**
     * Retrieves file information including size, create time, and CRC32
     * @param file_id The file ID
     * @return FileInfo structure
     */
    FileInfo query_file_info(const std::string& file_id);

    /**
     * Checks if a file exists on the storage server
     * @param file_id The file ID
     * @return true if file exists, false otherwise
     */
    bool file_exists(const std::string& file_id);

    GroupStat list_one_group(const std::string& group_name);

    std::vector<GroupStat> list_all_groups();

    /**
     * Lists the storage servers of a group
     * @param group_name The group name
     * @param storage_id Only this server when not empty
     */
    std::vector<StorageStat> list_servers(const std::string& group_name,
                                          const std::string& storage_id = "");

    /**
     * Closes the client and releases all resources
     */
    void close();

private:
    std::unique_ptr<ClientImpl> impl_;

    // Throws ClientClosedException on a moved-from client
    ClientImpl& impl();
};

} // namespace fdfs

#endif // FDFS_CLIENT_HPP
