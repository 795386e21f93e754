/**
 * Copyright (C) 2025 FastDFS C++ Client Contributors
 *
 * FastDFS may be copied only under the terms of the GNU General
 * Public License V3, which may be found in the FastDFS source kit.
 */

#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <syslog.h>
#include <unistd.h>
#include "fdfs/config.hpp"
#include "fdfs/errors.hpp"

#include "fastcommon/logger.h"

using namespace fdfs;

class ConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        // load_log_level() follows the conf, keep test output quiet
        g_log_context.log_level = LOG_CRIT;
        if (!conf_filename_.empty()) {
            unlink(conf_filename_.c_str());
        }
    }

    std::string write_conf(const std::string& content) {
        char path[] = "/tmp/fdfs_client_confXXXXXX";
        int fd = mkstemp(path);
        EXPECT_GE(fd, 0);
        close(fd);

        conf_filename_ = path;
        std::ofstream out(conf_filename_);
        out << content;
        return conf_filename_;
    }

    std::string conf_filename_;
};

TEST_F(ConfigTest, ParsesTrackersAndTimeouts) {
    auto config = load_client_config_from_buffer(
        "connect_timeout = 2\n"
        "network_timeout = 60\n"
        "connection_pool_max_idle_time = 120\n"
        "max_connections = 4\n"
        "tracker_server = 192.168.0.196:22122\n"
        "tracker_server = 192.168.0.197:22122\n");

    ASSERT_EQ(config.tracker_servers.size(), 2u);
    EXPECT_EQ(config.tracker_servers[0], (Endpoint{"192.168.0.196", 22122}));
    EXPECT_EQ(config.tracker_servers[1], (Endpoint{"192.168.0.197", 22122}));
    EXPECT_EQ(config.connect_timeout, std::chrono::seconds(2));
    EXPECT_EQ(config.network_timeout, std::chrono::seconds(60));
    EXPECT_EQ(config.idle_timeout, std::chrono::seconds(120));
    EXPECT_EQ(config.max_conns, 4);
}

TEST_F(ConfigTest, SplitsCommaSeparatedTrackersAndDropsDuplicates) {
    auto config = load_client_config_from_buffer(
        "tracker_server = 10.0.0.1:22122, 10.0.0.2:22122\n"
        "tracker_server = 10.0.0.1:22122\n"
        "tracker_server = tracker.local:22123\n");

    ASSERT_EQ(config.tracker_servers.size(), 3u);
    EXPECT_EQ(config.tracker_servers[0].host, "10.0.0.1");
    EXPECT_EQ(config.tracker_servers[1].host, "10.0.0.2");
    EXPECT_EQ(config.tracker_servers[2], (Endpoint{"tracker.local", 22123}));
}

TEST_F(ConfigTest, UsesDefaultsForMissingOrInvalidValues) {
    auto config = load_client_config_from_buffer(
        "network_timeout = 0\n"
        "max_connections = -1\n"
        "tracker_server = 10.0.0.1:22122\n");

    ClientConfig defaults;
    EXPECT_EQ(config.connect_timeout, defaults.connect_timeout);
    EXPECT_EQ(config.network_timeout, defaults.network_timeout);
    EXPECT_EQ(config.idle_timeout, defaults.idle_timeout);
    EXPECT_EQ(config.max_conns, defaults.max_conns);
}

TEST_F(ConfigTest, RequiresTrackerServer) {
    EXPECT_THROW(load_client_config_from_buffer("connect_timeout = 2\n"), ConfigException);
}

TEST_F(ConfigTest, RejectsMalformedAddresses) {
    EXPECT_THROW(load_client_config_from_buffer("tracker_server = 10.0.0.1\n"),
                 ConfigException);
    EXPECT_THROW(load_client_config_from_buffer("tracker_server = 10.0.0.1:abc\n"),
                 ConfigException);
    EXPECT_THROW(load_client_config_from_buffer("tracker_server = 10.0.0.1:70000\n"),
                 ConfigException);
}

TEST_F(ConfigTest, ParseEndpoint) {
    EXPECT_EQ(parse_endpoint("127.0.0.1:22122"), (Endpoint{"127.0.0.1", 22122}));
    EXPECT_EQ(parse_endpoint("::1:22122"), (Endpoint{"::1", 22122}));
    EXPECT_THROW(parse_endpoint(":22122"), ConfigException);
    EXPECT_THROW(parse_endpoint("127.0.0.1:"), ConfigException);
    EXPECT_THROW(parse_endpoint("127.0.0.1:0"), ConfigException);
}

TEST_F(ConfigTest, LoadsFromFile) {
    auto filename = write_conf(
        "# client.conf\n"
        "base_path = /tmp\n"
        "network_timeout = 10\n"
        "tracker_server = 127.0.0.1:22122\n");

    auto config = load_client_config(filename);
    ASSERT_EQ(config.tracker_servers.size(), 1u);
    EXPECT_EQ(config.tracker_servers[0].port, 22122);
    EXPECT_EQ(config.network_timeout, std::chrono::seconds(10));
}

TEST_F(ConfigTest, MissingFileIsConfigError) {
    EXPECT_THROW(load_client_config("/nonexistent/fdfs_client.conf"), ConfigException);
}
