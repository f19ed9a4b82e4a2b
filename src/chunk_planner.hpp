#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "net/resource_prober.hpp"

// Half-open byte range [start, end) of the target resource
struct chunk {
    std::size_t id;
    std::uint64_t start;
    std::uint64_t end;

    std::uint64_t length() const {
        return end - start;
    }
};

namespace chunk_planner {

// Splits [0, total_length) into chunk_count contiguous parts; the last part
// absorbs the division remainder. chunk_count < 1 is treated as 1 and is reduced
// to total_length when the resource is smaller, so no chunk is empty.
std::vector<chunk> plan(std::uint64_t total_length, long long chunk_count);

// Plan for a probed resource: one chunk per worker times chunks_per_worker, or
// a single whole-resource chunk when the server does not honor ranges.
std::vector<chunk> plan_for(const target_resource& resource, long long worker_count,
                            long long chunks_per_worker = 1);

} // namespace chunk_planner
