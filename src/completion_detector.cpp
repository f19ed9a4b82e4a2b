#include "completion_detector.hpp"

#include <algorithm>

const char* to_string(transfer_outcome outcome) {
    switch (outcome) {
    case transfer_outcome::all_chunks_completed:
        return "all_chunks_completed";
    case transfer_outcome::completed_with_failures:
        return "completed_with_failures";
    case transfer_outcome::cancelled:
        return "cancelled";
    case transfer_outcome::aborted:
        return "aborted";
    }
    return "unknown";
}

namespace completion_detector {

bool is_done(const std::vector<chunk_state>& states) {
    return std::all_of(states.begin(), states.end(), [](const chunk_state& s) {
        chunk_status status = s.status.load(std::memory_order_acquire);
        return status == chunk_status::completed || status == chunk_status::failed;
    });
}

std::size_t count(const std::vector<chunk_state>& states, chunk_status status) {
    return static_cast<std::size_t>(
        std::count_if(states.begin(), states.end(), [status](const chunk_state& s) {
            return s.status.load(std::memory_order_acquire) == status;
        }));
}

transfer_outcome outcome(const std::vector<chunk_state>& states, bool cancel_requested) {
    if (count(states, chunk_status::failed) == 0)
        return transfer_outcome::all_chunks_completed;
    return cancel_requested ? transfer_outcome::cancelled
                            : transfer_outcome::completed_with_failures;
}

} // namespace completion_detector
