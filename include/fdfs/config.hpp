/**
 * Copyright (C) 2025 FastDFS C++ Client Contributors
 *
 * FastDFS may be copied only under the terms of the GNU General
 * Public License V3, which may be found in the FastDFS source kit.
 */

#ifndef FDFS_CONFIG_HPP
#define FDFS_CONFIG_HPP

#include "fdfs/types.hpp"
#include <string>

namespace fdfs {

/**
 * Loads a client.conf style ini file
 *
 * Items: connect_timeout, network_timeout, tracker_server (repeatable or
 * comma separated host:port), max_connections,
 * connection_pool_max_idle_time and log_level. The log level is applied
 * to the libfastcommon logger.
 *
 * @throws ConfigException if the file cannot be read, no tracker is
 *         configured or an address is malformed
 */
ClientConfig load_client_config(const std::string& conf_filename);

/**
 * Same as load_client_config for ini text held in memory
 */
ClientConfig load_client_config_from_buffer(const std::string& content);

/**
 * Parses "host:port"
 * @throws ConfigException when either part is missing or the port is invalid
 */
Endpoint parse_endpoint(const std::string& address);

} // namespace fdfs

#endif // FDFS_CONFIG_HPP
