/**
 * Copyright (C) 2025 FastDFS C++ Client Contributors
 *
 * FastDFS may be copied only under the terms of the GNU General
 * Public License V3, which may be found in the FastDFS source kit.
 */

#include "fdfs/client.hpp"
#include "fdfs/config.hpp"
#include "internal/connection_pool.hpp"
#include "internal/protocol.hpp"
#include "internal/storage_client.hpp"
#include "internal/tracker_client.hpp"
#include <map>
#include <mutex>
#include <atomic>

namespace fdfs {

namespace {

internal::PoolOptions pool_options(const ClientConfig& config) {
    internal::PoolOptions options;
    options.max_conns = config.max_conns;
    options.connect_timeout = config.connect_timeout;
    options.network_timeout = config.network_timeout;
    options.idle_timeout = config.idle_timeout;
    return options;
}

Metadata metadata_or_empty(const Metadata* metadata) {
    if (metadata == nullptr) {
        return Metadata();
    }
    internal::validate_metadata(*metadata);
    return *metadata;
}

void check_buffer(const std::vector<uint8_t>& data) {
    if (data.empty()) {
        throw DataException("file buffer is empty");
    }
}

void check_prefix(const std::string& prefix_name) {
    if (prefix_name.empty()) {
        throw DataException("prefix name can not be empty");
    }
}

} // namespace

class ClientImpl {
public:
    explicit ClientImpl(const ClientConfig& config)
        : options_(pool_options(config))
        , tracker_pool_("tracker", config.tracker_servers, options_,
                        nullptr, config.tracker_selector)
        , tracker_(tracker_pool_)
        , closed_(false) {
    }

    ~ClientImpl() {
        close();
    }

    void close() {
        if (closed_.exchange(true)) {
            return;
        }

        tracker_pool_.destroy();
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& entry : storages_) {
            entry.second->pool().destroy();
        }
        storages_.clear();
    }

    void check_closed() const {
        if (closed_) {
            throw ClientClosedException();
        }
    }

    internal::TrackerClient& tracker() {
        check_closed();
        return tracker_;
    }

    std::shared_ptr<internal::StorageClient> get_storage(const StorageServerInfo& server) {
        std::lock_guard<std::mutex> lock(mutex_);
        check_closed();

        Endpoint endpoint = server.endpoint();
        auto it = storages_.find(endpoint);
        if (it != storages_.end()) {
            return it->second;
        }

        auto storage = std::make_shared<internal::StorageClient>(endpoint, options_);
        storages_.emplace(endpoint, storage);
        return storage;
    }

    // Storage server holding an existing file, for reads
    std::pair<RemoteFileId, std::shared_ptr<internal::StorageClient>>
    fetch_storage(const std::string& file_id) {
        RemoteFileId id = internal::parse_file_id(file_id);
        auto server = tracker().query_storage_fetch(id.group_name, id.filename);
        return {id, get_storage(server)};
    }

    // Storage server holding an existing file, for changes
    std::pair<RemoteFileId, std::shared_ptr<internal::StorageClient>>
    update_storage(const std::string& file_id) {
        RemoteFileId id = internal::parse_file_id(file_id);
        auto server = tracker().query_storage_update(id.group_name, id.filename);
        return {id, get_storage(server)};
    }

private:
    internal::PoolOptions options_;
    internal::ConnectionPool tracker_pool_;
    internal::TrackerClient tracker_;
    std::mutex mutex_;
    std::map<Endpoint, std::shared_ptr<internal::StorageClient>> storages_;
    std::atomic<bool> closed_;
};

// Client implementation

Client::Client(const ClientConfig& config) {
    // Validate configuration
    if (config.tracker_servers.empty()) {
        throw ConfigException("Tracker servers are required");
    }
    for (const auto& endpoint : config.tracker_servers) {
        if (endpoint.host.empty() || endpoint.port == 0) {
            throw ConfigException("Invalid tracker address: " + endpoint.to_string());
        }
    }

    impl_ = std::make_unique<ClientImpl>(config);
}

Client::Client(const std::string& conf_filename)
    : Client(load_client_config(conf_filename)) {
}

Client::~Client() = default;

ClientImpl& Client::impl() {
    if (!impl_) {
        throw ClientClosedException();
    }
    return *impl_;
}

Client::Client(Client&&) noexcept = default;
Client& Client::operator=(Client&&) noexcept = default;

UploadResult Client::upload_by_filename(const std::string& local_filename,
                                        const Metadata* metadata) {
    internal::check_local_file(local_filename);
    Metadata meta = metadata_or_empty(metadata);
    auto server = impl().tracker().query_storage_store();
    return impl().get_storage(server)->upload_by_filename(server, local_filename, meta);
}

UploadResult Client::upload_by_file(const std::string& local_filename,
                                    const Metadata* metadata) {
    internal::check_local_file(local_filename);
    Metadata meta = metadata_or_empty(metadata);
    auto server = impl().tracker().query_storage_store();
    return impl().get_storage(server)->upload_by_file(server, local_filename, meta);
}

UploadResult Client::upload_by_buffer(const std::vector<uint8_t>& data,
                                      const std::string& file_ext_name,
                                      const Metadata* metadata) {
    check_buffer(data);
    Metadata meta = metadata_or_empty(metadata);
    auto server = impl().tracker().query_storage_store();
    return impl().get_storage(server)->upload_by_buffer(server, data, file_ext_name, meta);
}

UploadResult Client::upload_appender_by_filename(const std::string& local_filename,
                                                 const Metadata* metadata) {
    internal::check_local_file(local_filename);
    Metadata meta = metadata_or_empty(metadata);
    auto server = impl().tracker().query_storage_store();
    return impl().get_storage(server)->upload_appender_by_filename(server, local_filename,
                                                                   meta);
}

UploadResult Client::upload_appender_by_file(const std::string& local_filename,
                                             const Metadata* metadata) {
    internal::check_local_file(local_filename);
    Metadata meta = metadata_or_empty(metadata);
    auto server = impl().tracker().query_storage_store();
    return impl().get_storage(server)->upload_appender_by_file(server, local_filename, meta);
}

UploadResult Client::upload_appender_by_buffer(const std::vector<uint8_t>& data,
                                               const std::string& file_ext_name,
                                               const Metadata* metadata) {
    check_buffer(data);
    Metadata meta = metadata_or_empty(metadata);
    auto server = impl().tracker().query_storage_store();
    return impl().get_storage(server)->upload_appender_by_buffer(server, data,
                                                                 file_ext_name, meta);
}

UploadResult Client::upload_slave_by_filename(const std::string& local_filename,
                                              const std::string& master_file_id,
                                              const std::string& prefix_name,
                                              const Metadata* metadata) {
    internal::check_local_file(local_filename);
    RemoteFileId master = internal::parse_file_id(master_file_id);
    check_prefix(prefix_name);
    Metadata meta = metadata_or_empty(metadata);

    auto server = impl().tracker().query_storage_store(master.group_name);
    return impl().get_storage(server)->upload_slave_by_filename(
        server, local_filename, master.filename, prefix_name, meta);
}

UploadResult Client::upload_slave_by_file(const std::string& local_filename,
                                          const std::string& master_file_id,
                                          const std::string& prefix_name,
                                          const Metadata* metadata) {
    internal::check_local_file(local_filename);
    RemoteFileId master = internal::parse_file_id(master_file_id);
    check_prefix(prefix_name);
    Metadata meta = metadata_or_empty(metadata);

    auto server = impl().tracker().query_storage_store(master.group_name);
    return impl().get_storage(server)->upload_slave_by_file(
        server, local_filename, master.filename, prefix_name, meta);
}

UploadResult Client::upload_slave_by_buffer(const std::vector<uint8_t>& data,
                                            const std::string& master_file_id,
                                            const std::string& prefix_name,
                                            const std::string& file_ext_name,
                                            const Metadata* metadata) {
    check_buffer(data);
    RemoteFileId master = internal::parse_file_id(master_file_id);
    check_prefix(prefix_name);
    Metadata meta = metadata_or_empty(metadata);

    auto server = impl().tracker().query_storage_store(master.group_name);
    return impl().get_storage(server)->upload_slave_by_buffer(
        server, data, master.filename, prefix_name, file_ext_name, meta);
}

DownloadResult Client::download_to_file(const std::string& file_id,
                                        const std::string& local_filename,
                                        int64_t offset,
                                        int64_t length) {
    if (local_filename.empty()) {
        throw DataException("local filename is empty");
    }
    auto [id, storage] = impl().fetch_storage(file_id);
    return storage->download_to_file(id, local_filename, offset, length);
}

DownloadResult Client::download_to_buffer(const std::string& file_id,
                                          int64_t offset,
                                          int64_t length) {
    auto [id, storage] = impl().fetch_storage(file_id);
    return storage->download_to_buffer(id, offset, length);
}

OperationResult Client::delete_file(const std::string& file_id) {
    auto [id, storage] = impl().update_storage(file_id);
    return storage->delete_file(id);
}

OperationResult Client::append_by_filename(const std::string& file_id,
                                           const std::string& local_filename) {
    internal::check_local_file(local_filename);
    auto [id, storage] = impl().update_storage(file_id);
    return storage->append_by_filename(id, local_filename);
}

OperationResult Client::append_by_file(const std::string& file_id,
                                       const std::string& local_filename) {
    internal::check_local_file(local_filename);
    auto [id, storage] = impl().update_storage(file_id);
    return storage->append_by_file(id, local_filename);
}

OperationResult Client::append_by_buffer(const std::string& file_id,
                                         const std::vector<uint8_t>& data) {
    check_buffer(data);
    auto [id, storage] = impl().update_storage(file_id);
    return storage->append_by_buffer(id, data);
}

OperationResult Client::modify_by_filename(const std::string& file_id,
                                           const std::string& local_filename,
                                           int64_t offset) {
    internal::check_local_file(local_filename);
    auto [id, storage] = impl().update_storage(file_id);
    return storage->modify_by_filename(id, local_filename, offset);
}

OperationResult Client::modify_by_file(const std::string& file_id,
                                       const std::string& local_filename,
                                       int64_t offset) {
    internal::check_local_file(local_filename);
    auto [id, storage] = impl().update_storage(file_id);
    return storage->modify_by_file(id, local_filename, offset);
}

OperationResult Client::modify_by_buffer(const std::string& file_id,
                                         const std::vector<uint8_t>& data,
                                         int64_t offset) {
    check_buffer(data);
    auto [id, storage] = impl().update_storage(file_id);
    return storage->modify_by_buffer(id, data, offset);
}

OperationResult Client::truncate_file(const std::string& file_id, int64_t truncated_size) {
    auto [id, storage] = impl().update_storage(file_id);
    return storage->truncate_file(id, truncated_size);
}

OperationResult Client::set_metadata(const std::string& file_id,
                                     const Metadata& metadata,
                                     MetadataFlag flag) {
    internal::validate_metadata(metadata);
    auto [id, storage] = impl().update_storage(file_id);
    return storage->set_metadata(id, metadata, flag);
}

Metadata Client::get_metadata(const std::string& file_id) {
    auto [id, storage] = impl().fetch_storage(file_id);
    return storage->get_metadata(id);
}

FileInfo Client::query_file_info(const std::string& file_id) {
    auto [id, storage] = impl().fetch_storage(file_id);
    return storage->query_file_info(id);
}

bool Client::file_exists(const std::string& file_id) {
    try {
        query_file_info(file_id);
        return true;
    } catch (const ResponseException& e) {
        if (e.status() == ENOENT) {
            return false;
        }
        throw;
    }
}

GroupStat Client::list_one_group(const std::string& group_name) {
    return impl().tracker().list_one_group(group_name);
}

std::vector<GroupStat> Client::list_all_groups() {
    return impl().tracker().list_all_groups();
}

std::vector<StorageStat> Client::list_servers(const std::string& group_name,
                                              const std::string& storage_id) {
    return impl().tracker().list_servers(group_name, storage_id);
}

void Client::close() {
    if (impl_) {
        impl_->close();
    }
}

} // namespace fdfs
