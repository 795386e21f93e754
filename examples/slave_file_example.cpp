/**
 * Copyright (C) 2025 FastDFS C++ Client Contributors
 *
 * FastDFS may be copied only under the terms of the GNU General
 * Public License V3, which may be found in the FastDFS source kit.
 *
 * Slave files live next to a master file, in the same group, and are
 * named after it with a prefix, e.g. thumbnails of an image.
 */

#include "fdfs/client.hpp"
#include "fdfs/config.hpp"
#include <iostream>
#include <vector>

#include "fastcommon/logger.h"

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

        std::vector<uint8_t> image(4096, 0xAB);
        auto master = client.upload_by_buffer(image, "jpg");
        std::cout << "Master: " << master.remote_file_id() << std::endl;

        std::vector<std::string> file_ids;
        for (const char* prefix : {"_150x150", "_300x300", "_preview"}) {
            fdfs::Metadata metadata = {{"type", "thumbnail"}, {"master", master.remote_filename}};
            std::vector<uint8_t> thumb(512, 0xCD);
            auto slave = client.upload_slave_by_buffer(thumb, master.remote_file_id(),
                                                       prefix, "jpg", &metadata);
            std::cout << "Slave:  " << slave.remote_file_id() << std::endl;
            file_ids.push_back(slave.remote_file_id());
        }

        for (const auto& file_id : file_ids) {
            client.delete_file(file_id);
        }
        client.delete_file(master.remote_file_id());
        std::cout << "Master and slaves deleted" << std::endl;
    } catch (const fdfs::FdfsException& e) {
        std::cerr << "FastDFS error: " << e.what() << std::endl;
        result = 1;
    }

    log_destroy();
    return result;
}
