#include "throughput_estimator.hpp"

throughput_estimator::throughput_estimator(std::chrono::milliseconds window)
    : m_window(window), m_last_condition(error_kind::none) {}

void throughput_estimator::start(clock::time_point now, std::uint64_t total_bytes) {
    m_samples.clear();
    m_samples.push_back({now, total_bytes});
    m_last_condition = error_kind::none;
}

double throughput_estimator::tick(clock::time_point now, std::uint64_t total_bytes) {
    m_samples.push_back({now, total_bytes});
    evict(now);
    m_last_condition = m_samples.size() >= 2 && m_samples.back().time <= m_samples.front().time
                           ? error_kind::timing_degenerate
                           : error_kind::none;
    return current_rate();
}

void throughput_estimator::evict(clock::time_point now) {
    // Keep the newest sample at or before the window boundary as the anchor, so
    // the retained span covers the full window and never shrinks below two samples.
    const auto boundary = now - m_window;
    while (m_samples.size() > 2 && m_samples[1].time <= boundary) {
        m_samples.pop_front();
    }
}

double throughput_estimator::current_rate() const {
    if (m_samples.size() < 2) {
        return 0.0;
    }
    return rate_between(m_samples.front(), m_samples.back());
}

double throughput_estimator::rate_between(const speed_sample& oldest, const speed_sample& newest) {
    double secs = std::chrono::duration<double>(newest.time - oldest.time).count();
    if (secs <= 0.0 || newest.total_bytes < oldest.total_bytes) {
        return 0.0;
    }
    return static_cast<double>(newest.total_bytes - oldest.total_bytes) / secs;
}
