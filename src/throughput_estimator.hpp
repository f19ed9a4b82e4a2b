#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>

#include "transfer_error.hpp"

struct speed_sample {
    std::chrono::steady_clock::time_point time;
    std::uint64_t total_bytes;
};

// One tick's output, as handed to a reporter
struct speed_reading {
    std::chrono::system_clock::time_point timestamp;
    double bytes_per_second;
    std::uint64_t total_bytes;
};

// Sliding-window average over (time, cumulative bytes) samples. Pure: the
// caller supplies timestamps, so it runs the same against a clock or a test.
class throughput_estimator {
public:
    using clock = std::chrono::steady_clock;

    explicit throughput_estimator(
        std::chrono::milliseconds window = std::chrono::milliseconds(10000));

    // Seeds the start-of-transfer baseline. Until the window fills, rates are
    // averaged from this point.
    void start(clock::time_point now, std::uint64_t total_bytes = 0);

    // Records (now, total_bytes), evicts aged-out samples and returns bytes/s
    // between the oldest retained and the newest sample.
    double tick(clock::time_point now, std::uint64_t total_bytes);

    double current_rate() const;
    std::size_t sample_count() const {
        return m_samples.size();
    }
    std::chrono::milliseconds window() const {
        return m_window;
    }

    // timing_degenerate when the last rate came from a zero-length interval
    error_kind last_condition() const {
        return m_last_condition;
    }

    // Average rate between two samples; 0 when no time elapsed or the count went backwards.
    static double rate_between(const speed_sample& oldest, const speed_sample& newest);

private:
    std::chrono::milliseconds m_window;
    std::deque<speed_sample> m_samples;
    error_kind m_last_condition;

    void evict(clock::time_point now);
};
