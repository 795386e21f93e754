/**
 * Copyright (C) 2025 FastDFS C++ Client Contributors
 *
 * FastDFS may be copied only under the terms of the GNU General
 * Public License V3, which may be found in the FastDFS source kit.
 */

#include "fdfs/endpoint_selector.hpp"

namespace fdfs {

RandomEndpointSelector::RandomEndpointSelector()
    : gen_(std::random_device{}()) {
}

RandomEndpointSelector::RandomEndpointSelector(unsigned int seed)
    : gen_(seed) {
}

size_t RandomEndpointSelector::select(size_t count) {
    if (count <= 1) {
        return 0;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::uniform_int_distribution<size_t> dis(0, count - 1);
    return dis(gen_);
}

size_t RoundRobinEndpointSelector::select(size_t count) {
    if (count <= 1) {
        return 0;
    }
    return next_.fetch_add(1) % count;
}

} // namespace fdfs
