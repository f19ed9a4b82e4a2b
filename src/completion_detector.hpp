#pragma once

#include <cstddef>
#include <vector>

#include "net/chunk_fetcher.hpp"

enum class transfer_outcome {
    all_chunks_completed,
    completed_with_failures,
    cancelled, // interrupted; bytes received so far are kept
    aborted,   // probe failed, no fetcher ran
};

const char* to_string(transfer_outcome outcome);

namespace completion_detector {

// True when no chunk is pending or in progress.
bool is_done(const std::vector<chunk_state>& states);

std::size_t count(const std::vector<chunk_state>& states, chunk_status status);

// Outcome once is_done() holds. Any failure makes the run
// completed_with_failures, or cancelled when a stop was requested.
transfer_outcome outcome(const std::vector<chunk_state>& states, bool cancel_requested);

} // namespace completion_detector
