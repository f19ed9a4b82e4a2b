#pragma once

#include <atomic>
#include <cstdint>
#include <string>

#include "chunk_planner.hpp"
#include "net/http.hpp"
#include "progress_aggregator.hpp"

enum class chunk_status {
    pending,
    in_progress,
    completed,
    failed,
};

// Per-chunk record. Written only by the fetcher that owns the chunk; status and
// byte count may be read concurrently by the completion detector and ticker.
// error_message is published by the release store of status = failed.
struct chunk_state {
    std::atomic<chunk_status> status{chunk_status::pending};
    std::atomic<std::uint64_t> bytes_received{0};
    std::string error_message;
};

// Marks the chunk failed with the given reason.
void mark_failed(chunk_state& state, const std::string& message);

class chunk_fetcher {
public:
    chunk_fetcher(http_transport& transport, const std::string& url, progress_aggregator& progress,
                  const std::atomic<bool>& cancel_requested);

    // Streams `range` with a single GET and feeds every received increment to
    // the progress aggregator. `ranged` selects a Range request that must be
    // answered with 206; otherwise the whole resource is expected.
    // Returns true when the chunk completed; on false the state holds the reason.
    bool fetch(const chunk& range, bool ranged, chunk_state& state);

    static std::string range_header(const chunk& range);

private:
    http_transport& m_transport;
    std::string m_url;
    progress_aggregator& m_progress;
    const std::atomic<bool>& m_cancel_requested;
};
