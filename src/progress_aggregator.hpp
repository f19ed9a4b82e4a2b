#pragma once

#include <atomic>
#include <cstdint>

// Cumulative bytes received across all fetchers. add() and read() are lock-free;
// fetchers never serialize on each other.
class progress_aggregator {
public:
    progress_aggregator() : m_total(0) {}

    progress_aggregator(const progress_aggregator&) = delete;
    progress_aggregator& operator=(const progress_aggregator&) = delete;

    void add(std::uint64_t bytes) {
        m_total.fetch_add(bytes, std::memory_order_relaxed);
    }

    std::uint64_t read() const {
        return m_total.load(std::memory_order_relaxed);
    }

private:
    std::atomic<std::uint64_t> m_total;
};
