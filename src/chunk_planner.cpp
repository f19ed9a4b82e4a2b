#include "chunk_planner.hpp"

namespace chunk_planner {

std::vector<chunk> plan(std::uint64_t total_length, long long chunk_count) {
    std::vector<chunk> chunks;
    if (total_length == 0)
        return chunks;

    std::uint64_t parts = chunk_count > 0 ? static_cast<std::uint64_t>(chunk_count) : 1;
    if (parts > total_length)
        parts = total_length;

    std::uint64_t base = total_length / parts;
    chunks.reserve(static_cast<std::size_t>(parts));

    std::uint64_t offset = 0;
    for (std::uint64_t i = 0; i < parts; ++i) {
        std::uint64_t end = (i == parts - 1) ? total_length : offset + base;
        chunks.push_back({static_cast<std::size_t>(i), offset, end});
        offset = end;
    }
    return chunks;
}

std::vector<chunk> plan_for(const target_resource& resource, long long worker_count,
                            long long chunks_per_worker) {
    if (!resource.supports_ranges)
        return plan(resource.total_length, 1);

    long long workers = worker_count > 0 ? worker_count : 1;
    long long per_worker = chunks_per_worker > 0 ? chunks_per_worker : 1;
    return plan(resource.total_length, workers * per_worker);
}

} // namespace chunk_planner
