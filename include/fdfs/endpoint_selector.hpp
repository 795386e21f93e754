/**
 * Copyright (C) 2025 FastDFS C++ Client Contributors
 *
 * FastDFS may be copied only under the terms of the GNU General
 * Public License V3, which may be found in the FastDFS source kit.
 */

#ifndef FDFS_ENDPOINT_SELECTOR_HPP
#define FDFS_ENDPOINT_SELECTOR_HPP

#include <atomic>
#include <cstddef>
#include <mutex>
#include <random>

namespace fdfs {

/**
 * Chooses which endpoint of a candidate set a new connection goes to
 *
 * Implementations must be safe to call from several threads.
 */
class EndpointSelector {
public:
    virtual ~EndpointSelector() = default;

    /**
     * Returns an index in [0, count), count is never 0
     */
    virtual size_t select(size_t count) = 0;
};

/**
 * Uniform random choice, the default policy
 */
class RandomEndpointSelector : public EndpointSelector {
public:
    RandomEndpointSelector();
    explicit RandomEndpointSelector(unsigned int seed);

    size_t select(size_t count) override;

private:
    std::mutex mutex_;
    std::mt19937 gen_;
};

/**
 * Cycles through the candidates in configuration order
 */
class RoundRobinEndpointSelector : public EndpointSelector {
public:
    size_t select(size_t count) override;

private:
    std::atomic<size_t> next_{0};
};

} // namespace fdfs

#endif // FDFS_ENDPOINT_SELECTOR_HPP
