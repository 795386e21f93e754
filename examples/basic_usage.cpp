/**
 * Copyright (C) 2025 FastDFS C++ Client Contributors
 *
 * FastDFS may be copied only under the terms of the GNU General
 * Public License V3, which may be found in the FastDFS source kit.
 */

#include "fdfs/client.hpp"
#include "fdfs/config.hpp"
#include <cstdio>
#include <fstream>
#include <iostream>
#include <vector>

#include "fastcommon/logger.h"

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <tracker_address>" << std::endl;
        std::cerr << "Example: " << argv[0] << " 192.168.1.100:22122" << std::endl;
        return 1;
    }

    log_init();
    g_log_context.log_level = LOG_ERR;

    int result = 0;
    try {
        fdfs::ClientConfig config;
        config.tracker_servers = {fdfs::parse_endpoint(argv[1])};
        config.max_conns = 10;

        fdfs::Client client(config);

        std::cout << "Upload a file" << std::endl;
        std::string test_file = "test.txt";
        {
            std::ofstream file(test_file);
            file << "Hello, FastDFS! This is a test file." << std::endl;
        }

        auto uploaded = client.upload_by_filename(test_file);
        std::string file_id = uploaded.remote_file_id();
        std::cout << "File ID: " << file_id << ", "
                  << uploaded.uploaded_size << " bytes on "
                  << uploaded.storage_ip << std::endl;

        std::cout << "\nUpload from buffer" << std::endl;
        std::string text = "Hello, FastDFS!";
        auto buffer_uploaded = client.upload_by_buffer(
            std::vector<uint8_t>(text.begin(), text.end()), "txt");
        std::cout << "File ID: " << buffer_uploaded.remote_file_id() << std::endl;

        std::cout << "\nDownload to memory" << std::endl;
        auto downloaded = client.download_to_buffer(file_id);
        std::cout << "Downloaded " << downloaded.download_size << " bytes: "
                  << std::string(downloaded.content.begin(), downloaded.content.end());

        std::cout << "\nDownload a range" << std::endl;
        auto range = client.download_to_buffer(file_id, 7, 7);
        std::cout << "Bytes 7..13: "
                  << std::string(range.content.begin(), range.content.end()) << std::endl;

        std::cout << "\nDownload to file" << std::endl;
        std::string downloaded_file = "downloaded.txt";
        client.download_to_file(file_id, downloaded_file);
        std::cout << "Saved to " << downloaded_file << std::endl;

        std::cout << "\nFile info" << std::endl;
        fdfs::FileInfo info = client.query_file_info(file_id);
        std::cout << "size: " << info.file_size
                  << ", create time: " << info.create_timestamp
                  << ", crc32: " << info.crc32
                  << ", source: " << info.source_ip_addr << std::endl;

        std::cout << "\nDelete" << std::endl;
        std::cout << client.delete_file(file_id).status << std::endl;
        std::cout << client.delete_file(buffer_uploaded.remote_file_id()).status << std::endl;
        std::cout << "File exists: " << (client.file_exists(file_id) ? "yes" : "no")
                  << std::endl;

        client.close();
        std::remove(test_file.c_str());
        std::remove(downloaded_file.c_str());
    } catch (const fdfs::FdfsException& e) {
        std::cerr << "FastDFS error: " << e.what() << std::endl;
        result = 1;
    }

    log_destroy();
    return result;
}
