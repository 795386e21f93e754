/**
 * Copyright (C) 2025 FastDFS C++ Client Contributors
 *
 * FastDFS may be copied only under the terms of the GNU General
 * Public License V3, which may be found in the FastDFS source kit.
 */

#include <gtest/gtest.h>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <syslog.h>
#include <unistd.h>
#include "fdfs/client.hpp"
#include "mock_server.hpp"

#include "fastcommon/logger.h"

using namespace fdfs;
using fdfs::test::MockFdfsServer;

namespace {

std::vector<uint8_t> bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

uint8_t cmd(StorageCommand command) {
    return static_cast<uint8_t>(command);
}

uint8_t cmd(TrackerCommand command) {
    return static_cast<uint8_t>(command);
}

} // namespace

class ClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        server_ = std::make_unique<MockFdfsServer>();

        ClientConfig config;
        config.tracker_servers = {server_->tracker_endpoint()};
        config.connect_timeout = std::chrono::seconds(2);
        config.network_timeout = std::chrono::seconds(5);
        client_ = std::make_unique<Client>(config);
    }

    void TearDown() override {
        client_.reset();
        server_->stop();
        for (const auto& filename : temp_files_) {
            unlink(filename.c_str());
        }
        g_log_context.log_level = LOG_CRIT;
    }

    std::string temp_file(const std::string& content, const std::string& suffix = ".txt") {
        std::string pattern = "/tmp/fdfs_client_testXXXXXX" + suffix;
        std::vector<char> path(pattern.begin(), pattern.end());
        path.push_back('\0');
        int fd = mkstemps(path.data(), static_cast<int>(suffix.size()));
        EXPECT_GE(fd, 0);
        if (!content.empty()) {
            EXPECT_EQ(write(fd, content.data(), content.size()),
                      static_cast<ssize_t>(content.size()));
        }
        close(fd);

        temp_files_.push_back(path.data());
        return temp_files_.back();
    }

    std::string read_file(const std::string& filename) {
        std::ifstream in(filename, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in),
                           std::istreambuf_iterator<char>());
    }

    std::string remote_content(const UploadResult& uploaded) {
        auto content = server_->file_content(uploaded.remote_filename);
        return std::string(content.begin(), content.end());
    }

    std::unique_ptr<MockFdfsServer> server_;
    std::unique_ptr<Client> client_;
    std::vector<std::string> temp_files_;
};

TEST_F(ClientTest, UploadThenDownload) {
    auto uploaded = client_->upload_by_buffer(bytes("hello"), "txt");
    EXPECT_EQ(uploaded.group_name, MockFdfsServer::GROUP_NAME);
    EXPECT_EQ(uploaded.uploaded_size, 5);
    EXPECT_EQ(uploaded.storage_ip, "127.0.0.1");
    EXPECT_NE(uploaded.remote_filename.find(".txt"), std::string::npos);

    auto downloaded = client_->download_to_buffer(uploaded.remote_file_id());
    EXPECT_EQ(downloaded.content, bytes("hello"));
    EXPECT_EQ(downloaded.download_size, 5);
    EXPECT_EQ(downloaded.remote_file_id, uploaded.remote_file_id());
}

TEST_F(ClientTest, DownloadRange) {
    auto uploaded = client_->upload_by_buffer(bytes("hello"), "txt");

    EXPECT_EQ(client_->download_to_buffer(uploaded.remote_file_id(), 2, 3).content,
              bytes("llo"));
    EXPECT_EQ(client_->download_to_buffer(uploaded.remote_file_id(), 1).content,
              bytes("ello"));
}

TEST_F(ClientTest, UploadLocalFiles) {
    auto local = temp_file("local file content");

    auto by_name = client_->upload_by_filename(local);
    EXPECT_EQ(by_name.local_filename, local);
    EXPECT_EQ(remote_content(by_name), "local file content");

    auto streamed = client_->upload_by_file(local);
    EXPECT_EQ(streamed.uploaded_size, 18);
    EXPECT_EQ(remote_content(streamed), "local file content");
    EXPECT_NE(streamed.remote_filename, by_name.remote_filename);
}

TEST_F(ClientTest, DownloadToFile) {
    auto uploaded = client_->upload_by_buffer(bytes("file body"), "bin");
    auto target = temp_file("");

    auto downloaded = client_->download_to_file(uploaded.remote_file_id(), target);
    EXPECT_EQ(downloaded.local_filename, target);
    EXPECT_EQ(downloaded.download_size, 9);
    EXPECT_TRUE(downloaded.content.empty());
    EXPECT_EQ(read_file(target), "file body");

    client_->download_to_file(uploaded.remote_file_id(), target, 5, 0);
    EXPECT_EQ(read_file(target), "body");
}

TEST_F(ClientTest, MetadataOverwriteAndMerge) {
    Metadata metadata = {{"author", "fdfs"}, {"width", "1024"}};
    auto uploaded = client_->upload_by_buffer(bytes("img"), "jpg", &metadata);
    EXPECT_EQ(client_->get_metadata(uploaded.remote_file_id()), metadata);

    auto merged = client_->set_metadata(uploaded.remote_file_id(),
                                        {{"width", "800"}, {"height", "600"}},
                                        MetadataFlag::MERGE);
    EXPECT_EQ(merged.status, "Set metadata succeeded.");
    Metadata expected = {{"author", "fdfs"}, {"width", "800"}, {"height", "600"}};
    EXPECT_EQ(client_->get_metadata(uploaded.remote_file_id()), expected);

    client_->set_metadata(uploaded.remote_file_id(), {{"only", "one"}},
                          MetadataFlag::OVERWRITE);
    expected = {{"only", "one"}};
    EXPECT_EQ(client_->get_metadata(uploaded.remote_file_id()), expected);
}

TEST_F(ClientTest, FailedMetadataRemovesUpload) {
    server_->inject(cmd(StorageCommand::SET_METADATA), MockFdfsServer::Fault::STATUS, EIO);

    Metadata metadata = {{"k", "v"}};
    try {
        client_->upload_by_buffer(bytes("data"), "txt", &metadata);
        FAIL() << "upload with failing metadata succeeded";
    } catch (const ResponseException& e) {
        EXPECT_EQ(e.status(), EIO);
    }
    EXPECT_EQ(server_->request_count(cmd(StorageCommand::DELETE_FILE)), 1);
    EXPECT_EQ(server_->file_count(), 0u);
}

TEST_F(ClientTest, StatusMapping) {
    auto uploaded = client_->upload_by_buffer(bytes("hello"), "txt");

    server_->inject(cmd(StorageCommand::DOWNLOAD_FILE), MockFdfsServer::Fault::STATUS, ENOENT);
    try {
        client_->download_to_buffer(uploaded.remote_file_id());
        FAIL() << "download succeeded";
    } catch (const ResponseException& e) {
        EXPECT_EQ(e.status(), ENOENT);
    }

    server_->inject(cmd(StorageCommand::DELETE_FILE), MockFdfsServer::Fault::STATUS, ENOENT);
    try {
        client_->delete_file(uploaded.remote_file_id());
        FAIL() << "delete succeeded";
    } catch (const DataException& e) {
        EXPECT_EQ(e.status(), ENOENT);
    }

    server_->inject(cmd(TrackerCommand::SERVICE_QUERY_STORE_WITHOUT_GROUP_ONE),
                    MockFdfsServer::Fault::STATUS, ENOSPC);
    try {
        client_->upload_by_buffer(bytes("x"), "txt");
        FAIL() << "upload succeeded";
    } catch (const ResponseException& e) {
        EXPECT_EQ(e.status(), ENOSPC);
    }

    // error responses leave the connections usable
    EXPECT_TRUE(client_->file_exists(uploaded.remote_file_id()));
    EXPECT_EQ(server_->tracker_accepts(), 1);
    EXPECT_EQ(server_->storage_accepts(), 1);
}

TEST_F(ClientTest, DeleteThenFileIsGone) {
    auto uploaded = client_->upload_by_buffer(bytes("bye"), "txt");
    EXPECT_TRUE(client_->file_exists(uploaded.remote_file_id()));

    auto deleted = client_->delete_file(uploaded.remote_file_id());
    EXPECT_EQ(deleted.status, "Delete file succeeded.");
    EXPECT_EQ(deleted.remote_file_id, uploaded.remote_file_id());
    EXPECT_FALSE(server_->has_file(uploaded.remote_filename));
    EXPECT_FALSE(client_->file_exists(uploaded.remote_file_id()));
}

TEST_F(ClientTest, QueryFileInfo) {
    auto uploaded = client_->upload_by_buffer(bytes("hello"), "txt");

    auto info = client_->query_file_info(uploaded.remote_file_id());
    EXPECT_EQ(info.group_name, uploaded.group_name);
    EXPECT_EQ(info.remote_filename, uploaded.remote_filename);
    EXPECT_EQ(info.file_size, 5);
    EXPECT_GT(info.create_timestamp, 0);
    EXPECT_EQ(info.source_ip_addr, "127.0.0.1");

    EXPECT_THROW(client_->query_file_info("group1/M00/00/00/missing.txt"), ResponseException);
}

TEST_F(ClientTest, AppenderFileLifecycle) {
    auto uploaded = client_->upload_appender_by_buffer(bytes("hello"), "log");
    auto file_id = uploaded.remote_file_id();

    auto appended = client_->append_by_buffer(file_id, bytes(" world"));
    EXPECT_EQ(appended.status, "Append file succeeded.");
    EXPECT_EQ(remote_content(uploaded), "hello world");

    auto modified = client_->modify_by_buffer(file_id, bytes("HELLO"), 0);
    EXPECT_EQ(modified.status, "Modify succeeded.");
    EXPECT_EQ(remote_content(uploaded), "HELLO world");

    auto local = temp_file("!!");
    client_->append_by_filename(file_id, local);
    client_->modify_by_file(file_id, local, 5);
    EXPECT_EQ(remote_content(uploaded), "HELLO!!orld!!");

    auto truncated = client_->truncate_file(file_id, 5);
    EXPECT_EQ(truncated.status, "Truncate succeeded.");
    EXPECT_EQ(client_->download_to_buffer(file_id).content, bytes("HELLO"));
}

TEST_F(ClientTest, AppendToRegularFileIsRefused) {
    auto uploaded = client_->upload_by_buffer(bytes("fixed"), "txt");
    try {
        client_->append_by_buffer(uploaded.remote_file_id(), bytes("more"));
        FAIL() << "append to a regular file succeeded";
    } catch (const DataException& e) {
        EXPECT_EQ(e.status(), EPERM);
    }
}

TEST_F(ClientTest, SlaveUpload) {
    auto master = client_->upload_by_buffer(bytes("master"), "jpg");

    auto slave = client_->upload_slave_by_buffer(bytes("thumb"), master.remote_file_id(),
                                                 "_150x150", "jpg");
    EXPECT_EQ(slave.group_name, master.group_name);
    std::string base = master.remote_filename.substr(0, master.remote_filename.rfind('.'));
    EXPECT_EQ(slave.remote_filename, base + "_150x150.jpg");
    EXPECT_EQ(remote_content(slave), "thumb");
    EXPECT_EQ(server_->request_count(cmd(TrackerCommand::SERVICE_QUERY_STORE_WITH_GROUP_ONE)), 1);

    auto local = temp_file("small", ".jpg");
    auto from_file = client_->upload_slave_by_filename(local, master.remote_file_id(), "_s");
    EXPECT_EQ(from_file.remote_filename, base + "_s.jpg");

    EXPECT_THROW(client_->upload_slave_by_buffer(bytes("x"), master.remote_file_id(), "", "jpg"),
                 DataException);
}

TEST_F(ClientTest, ListsGroupsAndServers) {
    auto group = client_->list_one_group(MockFdfsServer::GROUP_NAME);
    EXPECT_EQ(group.group_name, MockFdfsServer::GROUP_NAME);
    EXPECT_EQ(group.storage_port, server_->storage_endpoint().port);

    auto groups = client_->list_all_groups();
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups[0].free_mb, 512);

    auto servers = client_->list_servers(MockFdfsServer::GROUP_NAME);
    ASSERT_EQ(servers.size(), 1u);
    EXPECT_EQ(servers[0].ip_addr, "127.0.0.1");
    EXPECT_EQ(servers[0].version, "6.12");

    EXPECT_EQ(client_->list_servers(MockFdfsServer::GROUP_NAME, "127.0.0.1").size(), 1u);
    EXPECT_THROW(client_->list_servers("nogroup"), ResponseException);
}

TEST_F(ClientTest, LocalValidationSendsNothing) {
    EXPECT_THROW(client_->upload_by_filename("/nonexistent/file.txt"), DataException);
    EXPECT_THROW(client_->upload_by_buffer(std::vector<uint8_t>(), "txt"), DataException);
    EXPECT_THROW(client_->download_to_buffer("no-slash"), DataException);
    EXPECT_THROW(client_->delete_file("group1/"), DataException);

    Metadata bad = {{"key", std::string("a\x01" "b")}};
    EXPECT_THROW(client_->upload_by_buffer(bytes("x"), "txt", &bad), DataException);

    EXPECT_EQ(server_->total_requests(), 0);
    EXPECT_EQ(server_->tracker_accepts(), 0);
}

TEST_F(ClientTest, RecoversFromBadFrames) {
    auto uploaded = client_->upload_by_buffer(bytes("hello"), "txt");

    server_->inject(cmd(TrackerCommand::SERVICE_QUERY_FETCH_ONE), MockFdfsServer::Fault::BAD_CMD);
    EXPECT_THROW(client_->download_to_buffer(uploaded.remote_file_id()),
                 MalformedFrameException);

    server_->inject(cmd(StorageCommand::DOWNLOAD_FILE), MockFdfsServer::Fault::SHORT_BODY);
    EXPECT_THROW(client_->download_to_buffer(uploaded.remote_file_id()), ResponseException);

    EXPECT_EQ(client_->download_to_buffer(uploaded.remote_file_id()).content, bytes("hello"));
    EXPECT_EQ(server_->tracker_accepts(), 2);
    EXPECT_EQ(server_->storage_accepts(), 2);
}

TEST_F(ClientTest, OversizedReplyDropsConnection) {
    auto uploaded = client_->upload_by_buffer(bytes("hello"), "txt");

    server_->inject(cmd(TrackerCommand::SERVER_LIST_ALL_GROUPS),
                    MockFdfsServer::Fault::HUGE_LENGTH);
    try {
        client_->list_all_groups();
        FAIL() << "oversized reply accepted";
    } catch (const ResponseException& e) {
        EXPECT_EQ(e.status(), EINVAL);
    }
    EXPECT_EQ(client_->list_all_groups().size(), 1u);
    EXPECT_EQ(server_->tracker_accepts(), 2);

    server_->inject(cmd(StorageCommand::DOWNLOAD_FILE), MockFdfsServer::Fault::HUGE_LENGTH);
    EXPECT_THROW(client_->download_to_buffer(uploaded.remote_file_id()), ResponseException);
    EXPECT_EQ(client_->download_to_buffer(uploaded.remote_file_id()).content, bytes("hello"));
    EXPECT_EQ(server_->storage_accepts(), 2);
}

TEST_F(ClientTest, NetworkTimeoutDropsConnection) {
    ClientConfig config;
    config.tracker_servers = {server_->tracker_endpoint()};
    config.connect_timeout = std::chrono::seconds(2);
    config.network_timeout = std::chrono::seconds(1);
    Client client(config);

    auto uploaded = client.upload_by_buffer(bytes("slow"), "txt");

    server_->inject(cmd(StorageCommand::DOWNLOAD_FILE), MockFdfsServer::Fault::STALL);
    auto started = std::chrono::steady_clock::now();
    EXPECT_THROW(client.download_to_buffer(uploaded.remote_file_id()), TimeoutException);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));

    EXPECT_EQ(client.download_to_buffer(uploaded.remote_file_id()).content, bytes("slow"));
    EXPECT_EQ(server_->storage_accepts(), 2);

    server_->inject(cmd(TrackerCommand::SERVICE_QUERY_FETCH_ONE), MockFdfsServer::Fault::STALL);
    EXPECT_THROW(client.file_exists(uploaded.remote_file_id()), TimeoutException);
    EXPECT_TRUE(client.file_exists(uploaded.remote_file_id()));
    EXPECT_EQ(server_->tracker_accepts(), 2);
}

TEST_F(ClientTest, FailedDownloadLeavesNoFile) {
    auto uploaded = client_->upload_by_buffer(bytes("file body"), "bin");
    auto target = temp_file("previous content");

    server_->inject(cmd(StorageCommand::DOWNLOAD_FILE), MockFdfsServer::Fault::SHORT_BODY);
    EXPECT_THROW(client_->download_to_file(uploaded.remote_file_id(), target),
                 ResponseException);
    EXPECT_NE(access(target.c_str(), F_OK), 0);

    client_->download_to_file(uploaded.remote_file_id(), target);
    EXPECT_EQ(read_file(target), "file body");
}

TEST_F(ClientTest, ReusesPooledConnections) {
    for (int i = 0; i < 5; i++) {
        auto uploaded = client_->upload_by_buffer(bytes("reuse"), "txt");
        client_->download_to_buffer(uploaded.remote_file_id());
        client_->delete_file(uploaded.remote_file_id());
    }
    EXPECT_EQ(server_->tracker_accepts(), 1);
    EXPECT_EQ(server_->storage_accepts(), 1);
}

TEST_F(ClientTest, ClosedClientRefusesOperations) {
    client_->close();
    client_->close();
    EXPECT_THROW(client_->upload_by_buffer(bytes("x"), "txt"), ClientClosedException);
    EXPECT_THROW(client_->list_all_groups(), ClientClosedException);

    Client moved(std::move(*client_));
    EXPECT_THROW(client_->file_exists("group1/M00/00/00/x"), ClientClosedException);
}

TEST_F(ClientTest, RequiresTrackers) {
    ClientConfig empty;
    EXPECT_THROW(Client client(empty), ConfigException);

    ClientConfig no_port;
    no_port.tracker_servers = {Endpoint{"127.0.0.1", 0}};
    EXPECT_THROW(Client client(no_port), ConfigException);
}

TEST_F(ClientTest, ConstructsFromConfFile) {
    auto conf = temp_file("tracker_server = 127.0.0.1:" +
                          std::to_string(server_->tracker_endpoint().port) + "\n" +
                          "network_timeout = 5\n", ".conf");

    Client client(conf);
    auto uploaded = client.upload_by_buffer(bytes("conf"), "txt");
    EXPECT_TRUE(client.file_exists(uploaded.remote_file_id()));
}
