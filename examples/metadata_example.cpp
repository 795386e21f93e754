/**
 * Copyright (C) 2025 FastDFS C++ Client Contributors
 *
 * FastDFS may be copied only under the terms of the GNU General
 * Public License V3, which may be found in the FastDFS source kit.
 */

#include "fdfs/client.hpp"
#include <iostream>
#include <vector>

#include "fastcommon/logger.h"

static void print_metadata(const fdfs::Metadata& metadata) {
    for (const auto& entry : metadata) {
        std::cout << "   " << entry.first << " = " << entry.second << std::endl;
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <client.conf>" << std::endl;
        return 1;
    }

    log_init();

    int result = 0;
    try {
        // log_level in the conf file applies from here on
        fdfs::Client client{std::string(argv[1])};

        fdfs::Metadata metadata = {
            {"author", "John Doe"},
            {"width", "1920"},
            {"height", "1080"}
        };
        std::string content = "image bytes";
        auto uploaded = client.upload_by_buffer(
            std::vector<uint8_t>(content.begin(), content.end()), "jpg", &metadata);
        std::string file_id = uploaded.remote_file_id();
        std::cout << "Uploaded " << file_id << " with metadata:" << std::endl;
        print_metadata(client.get_metadata(file_id));

        client.set_metadata(file_id, {{"width", "800"}, {"format", "jpeg"}},
                            fdfs::MetadataFlag::MERGE);
        std::cout << "After merge:" << std::endl;
        print_metadata(client.get_metadata(file_id));

        client.set_metadata(file_id, {{"status", "archived"}},
                            fdfs::MetadataFlag::OVERWRITE);
        std::cout << "After overwrite:" << std::endl;
        print_metadata(client.get_metadata(file_id));

        client.delete_file(file_id);
    } catch (const fdfs::DataException& e) {
        std::cerr << "Invalid input: " << e.what() << std::endl;
        result = 1;
    } catch (const fdfs::FdfsException& e) {
        std::cerr << "FastDFS error: " << e.what() << std::endl;
        result = 1;
    }

    log_destroy();
    return result;
}
