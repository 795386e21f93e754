/**
 * Copyright (C) 2025 FastDFS C++ Client Contributors
 *
 * FastDFS may be copied only under the terms of the GNU General
 * Public License V3, which may be found in the FastDFS source kit.
 */

#include "fdfs/config.hpp"
#include "fdfs/errors.hpp"
#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <vector>

#include "fastcommon/common_define.h"
#include "fastcommon/ini_file_reader.h"
#include "fastcommon/logger.h"
#include "fastcommon/shared_func.h"

namespace fdfs {

namespace {

// Frees a loaded ini context on scope exit
class IniContextHolder {
public:
    IniContextHolder() : loaded_(false) { memset(&context_, 0, sizeof(context_)); }
    ~IniContextHolder() {
        if (loaded_) {
            iniFreeContext(&context_);
        }
    }

    IniContextHolder(const IniContextHolder&) = delete;
    IniContextHolder& operator=(const IniContextHolder&) = delete;

    IniContext* get() { return &context_; }
    void set_loaded() { loaded_ = true; }

private:
    IniContext context_;
    bool loaded_;
};

std::string trim(const std::string& s) {
    const char* spaces = " \t\r\n";
    size_t begin = s.find_first_not_of(spaces);
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(spaces);
    return s.substr(begin, end - begin + 1);
}

std::chrono::seconds get_seconds(IniContext* context, const char* name,
                                 std::chrono::seconds default_value) {
    int value = iniGetIntValue(NULL, name, context,
                               static_cast<int>(default_value.count()));
    if (value <= 0) {
        return default_value;
    }
    return std::chrono::seconds(value);
}

ClientConfig load_from_context(IniContext* context, const std::string& source) {
    ClientConfig config;

    int item_count = 0;
    IniItem* items = iniGetValuesEx(NULL, "tracker_server", context, &item_count);
    for (int i = 0; i < item_count; ++i) {
        std::string value = items[i].value;
        size_t begin = 0;
        while (begin <= value.size()) {
            size_t comma = value.find(',', begin);
            if (comma == std::string::npos) {
                comma = value.size();
            }
            std::string address = trim(value.substr(begin, comma - begin));
            if (!address.empty()) {
                Endpoint endpoint = parse_endpoint(address);
                if (std::find(config.tracker_servers.begin(),
                              config.tracker_servers.end(),
                              endpoint) == config.tracker_servers.end()) {
                    config.tracker_servers.push_back(endpoint);
                }
            }
            begin = comma + 1;
        }
    }

    if (config.tracker_servers.empty()) {
        logError("file: " __FILE__ ", line: %d, "
                 "conf %s, item \"tracker_server\" not found",
                 __LINE__, source.c_str());
        throw ConfigException("item \"tracker_server\" not found in " + source);
    }

    config.connect_timeout = get_seconds(context, "connect_timeout",
                                         config.connect_timeout);
    config.network_timeout = get_seconds(context, "network_timeout",
                                         config.network_timeout);
    config.idle_timeout = get_seconds(context, "connection_pool_max_idle_time",
                                      config.idle_timeout);

    int max_conns = iniGetIntValue(NULL, "max_connections", context,
                                   config.max_conns);
    if (max_conns > 0) {
        config.max_conns = max_conns;
    }

    load_log_level(context);

    logDebug("file: " __FILE__ ", line: %d, "
             "conf %s, tracker server count: %d, connect_timeout: %d, "
             "network_timeout: %d, max_connections: %d",
             __LINE__, source.c_str(), static_cast<int>(config.tracker_servers.size()),
             static_cast<int>(config.connect_timeout.count()),
             static_cast<int>(config.network_timeout.count()), config.max_conns);
    return config;
}

} // namespace

Endpoint parse_endpoint(const std::string& address) {
    size_t colon = address.find_last_of(':');
    if (colon == std::string::npos || colon == 0 || colon == address.size() - 1) {
        throw ConfigException("invalid server address \"" + address +
                              "\", expect host:port");
    }

    std::string port_str = address.substr(colon + 1);
    char* end = NULL;
    long port = strtol(port_str.c_str(), &end, 10);
    if (*end != '\0' || port <= 0 || port > 65535) {
        throw ConfigException("invalid port in server address \"" + address + "\"");
    }

    Endpoint endpoint;
    endpoint.host = trim(address.substr(0, colon));
    endpoint.port = static_cast<uint16_t>(port);
    if (endpoint.host.empty()) {
        throw ConfigException("empty host in server address \"" + address + "\"");
    }
    return endpoint;
}

ClientConfig load_client_config(const std::string& conf_filename) {
    IniContextHolder context;
    int result = iniLoadFromFile(conf_filename.c_str(), context.get());
    if (result != 0) {
        logError("file: " __FILE__ ", line: %d, "
                 "load conf file \"%s\" fail, ret code: %d",
                 __LINE__, conf_filename.c_str(), result);
        throw ConfigException("load conf file \"" + conf_filename + "\" fail: " +
                              STRERROR(result));
    }
    context.set_loaded();
    return load_from_context(context.get(), conf_filename);
}

ClientConfig load_client_config_from_buffer(const std::string& content) {
    // iniLoadFromBuffer parses in place
    std::vector<char> buffer(content.begin(), content.end());
    buffer.push_back('\0');

    IniContextHolder context;
    int result = iniLoadFromBuffer(buffer.data(), context.get());
    if (result != 0) {
        logError("file: " __FILE__ ", line: %d, "
                 "load conf from buffer fail, ret code: %d",
                 __LINE__, result);
        throw ConfigException(std::string("load conf from buffer fail: ") +
                              STRERROR(result));
    }
    context.set_loaded();
    return load_from_context(context.get(), "buffer");
}

} // namespace fdfs
