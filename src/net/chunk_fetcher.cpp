#include "net/chunk_fetcher.hpp"

#include <algorithm>
#include <iostream>

void mark_failed(chunk_state& state, const std::string& message) {
    state.error_message = message;
    state.status.store(chunk_status::failed, std::memory_order_release);
}

chunk_fetcher::chunk_fetcher(http_transport& transport, const std::string& url,
                             progress_aggregator& progress,
                             const std::atomic<bool>& cancel_requested)
    : m_transport(transport), m_url(url), m_progress(progress),
      m_cancel_requested(cancel_requested) {}

std::string chunk_fetcher::range_header(const chunk& range) {
    // HTTP Range end is inclusive
    return "bytes=" + std::to_string(range.start) + "-" + std::to_string(range.end - 1);
}

bool chunk_fetcher::fetch(const chunk& range, bool ranged, chunk_state& state) {
    state.status.store(chunk_status::in_progress, std::memory_order_release);

    if (m_cancel_requested.load(std::memory_order_relaxed)) {
        mark_failed(state, "cancelled");
        return false;
    }

    const std::uint64_t expected = range.length();
    std::uint64_t received = 0;
    std::string failure;

    http_transport::request req(m_url);
    if (ranged) {
        req.headers["Range"] = range_header(range);
    }

    m_transport.set_abort_flag(&m_cancel_requested);
    auto resp = m_transport.get_stream(
        req,
        [&](const http_transport::response& r) {
            bool accepted = ranged ? r.status_code == 206
                                   : (r.status_code == 200 || r.status_code == 206);
            if (!accepted) {
                failure = "http status " + std::to_string(r.status_code);
                return false;
            }
            return true;
        },
        [&](const char*, std::size_t len) {
            if (m_cancel_requested.load(std::memory_order_relaxed)) {
                failure = "cancelled";
                return false;
            }
            std::uint64_t room = expected - received;
            std::uint64_t used = std::min<std::uint64_t>(len, room);
            if (used > 0) {
                received += used;
                state.bytes_received.store(received, std::memory_order_relaxed);
                m_progress.add(used);
            }
            if (len > room) {
                failure = "server sent more than " + std::to_string(expected) + " bytes";
                return false;
            }
            return true;
        });
    m_transport.set_abort_flag(nullptr);

    if (failure.empty()) {
        if (resp.aborted && m_cancel_requested.load(std::memory_order_relaxed)) {
            failure = "cancelled";
        } else if (resp.transport_failed()) {
            failure = "transfer error: " + resp.transport_error;
        } else if (received != expected) {
            failure = "short body: received " + std::to_string(received) + " of " +
                      std::to_string(expected) + " bytes";
        }
    }

    if (!failure.empty()) {
        std::cerr << "[chunk_fetcher] Chunk " << range.id << " failed after " << received
                  << " bytes: " << failure << std::endl;
        mark_failed(state, failure);
        return false;
    }

    state.status.store(chunk_status::completed, std::memory_order_release);
    return true;
}
