#pragma once

#include <string>

enum class error_kind {
    none,
    invalid_url,          // not a well-formed http(s) URL
    unreachable,          // DNS, connect or timeout failure
    unsupported_resource, // no usable content length
    range_unsupported,    // degraded single-stream mode, not fatal
    chunk_transfer,       // a chunk's stream failed or under-delivered
    timing_degenerate,    // zero-duration window, absorbed as zero speed
    cancelled,            // stopped on request before the transfer started
    internal,             // unexpected failure inside the tester itself
};

struct transfer_error {
    error_kind kind = error_kind::none;
    std::string message;

    bool is_set() const {
        return kind != error_kind::none;
    }
};

inline const char* to_string(error_kind kind) {
    switch (kind) {
    case error_kind::none:
        return "none";
    case error_kind::invalid_url:
        return "invalid_url";
    case error_kind::unreachable:
        return "unreachable";
    case error_kind::unsupported_resource:
        return "unsupported_resource";
    case error_kind::range_unsupported:
        return "range_unsupported";
    case error_kind::chunk_transfer:
        return "chunk_transfer";
    case error_kind::timing_degenerate:
        return "timing_degenerate";
    case error_kind::cancelled:
        return "cancelled";
    case error_kind::internal:
        return "internal";
    }
    return "unknown";
}
