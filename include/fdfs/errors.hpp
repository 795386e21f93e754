/**
 * Copyright (C) 2025 FastDFS C++ Client Contributors
 *
 * FastDFS may be copied only under the terms of the GNU General
 * Public License V3, which may be found in the FastDFS source kit.
 */

#ifndef FDFS_ERRORS_HPP
#define FDFS_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <cerrno>

namespace fdfs {

/**
 * Base exception class for FastDFS errors
 */
class FdfsException : public std::runtime_error {
public:
    explicit FdfsException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * Bad or missing client configuration
 */
class ConfigException : public FdfsException {
public:
    explicit ConfigException(const std::string& message)
        : FdfsException("Config error: " + message) {}
};

/**
 * Connect, read or write failure, or no connection left in the pool
 */
class ConnectionException : public FdfsException {
public:
    explicit ConnectionException(const std::string& message)
        : FdfsException("Connection error: " + message) {}
};

/**
 * Timeout error
 */
class TimeoutException : public ConnectionException {
public:
    explicit TimeoutException(const std::string& message)
        : ConnectionException("timeout, " + message) {}
};

/**
 * Server answered with a nonzero status, or the answer could not be parsed
 */
class ResponseException : public FdfsException {
public:
    ResponseException(const std::string& message, int status)
        : FdfsException("Response error: " + message)
        , status_(status) {}

    /**
     * Status code of the response, an errno value
     */
    int status() const { return status_; }

private:
    int status_;
};

/**
 * Frame too short, wrong response command or negative length
 */
class MalformedFrameException : public ResponseException {
public:
    explicit MalformedFrameException(const std::string& message)
        : ResponseException("malformed frame, " + message, EINVAL) {}
};

/**
 * Invalid local input, or a storage server refused to change a file
 */
class DataException : public FdfsException {
public:
    explicit DataException(const std::string& message, int status = EINVAL)
        : FdfsException("Data error: " + message)
        , status_(status) {}

    int status() const { return status_; }

private:
    int status_;
};

/**
 * Client closed error
 */
class ClientClosedException : public FdfsException {
public:
    ClientClosedException()
        : FdfsException("Client is closed") {}
};

} // namespace fdfs

#endif // FDFS_ERRORS_HPP
