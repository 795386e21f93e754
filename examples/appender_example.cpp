/**
 * Copyright (C) 2025 FastDFS C++ Client Contributors
 *
 * FastDFS may be copied only under the terms of the GNU General
 * Public License V3, which may be found in the FastDFS source kit.
 *
 * Appender files can grow after the upload: append, modify and
 * truncate all work in place on the storage server.
 */

#include "fdfs/client.hpp"
#include "fdfs/config.hpp"
#include <iostream>
#include <vector>

#include "fastcommon/logger.h"

static std::vector<uint8_t> to_bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

static void show(fdfs::Client& client, const std::string& file_id) {
    auto downloaded = client.download_to_buffer(file_id);
    std::cout << "   [" << std::string(downloaded.content.begin(), downloaded.content.end())
              << "]" << std::endl;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <tracker_address>" << std::endl;
        return 1;
    }

    log_init();
    g_log_context.log_level = LOG_ERR;

    int result = 0;
    try {
        fdfs::ClientConfig config;
        config.tracker_servers = {fdfs::parse_endpoint(argv[1])};
        fdfs::Client client(config);

        auto uploaded = client.upload_appender_by_buffer(to_bytes("Log started\n"), "log");
        std::string file_id = uploaded.remote_file_id();
        std::cout << "Appender file: " << file_id << std::endl;
        show(client, file_id);

        std::cout << client.append_by_buffer(file_id, to_bytes("entry 1\n")).status << std::endl;
        std::cout << client.append_by_buffer(file_id, to_bytes("entry 2\n")).status << std::endl;
        show(client, file_id);

        std::cout << client.modify_by_buffer(file_id, to_bytes("LOG"), 0).status << std::endl;
        show(client, file_id);

        auto info = client.query_file_info(file_id);
        std::cout << "Size now " << info.file_size << " bytes" << std::endl;

        std::cout << client.truncate_file(file_id, 12).status << std::endl;
        show(client, file_id);

        client.delete_file(file_id);
    } catch (const fdfs::FdfsException& e) {
        std::cerr << "FastDFS error: " << e.what() << std::endl;
        result = 1;
    }

    log_destroy();
    return result;
}
