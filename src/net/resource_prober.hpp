#pragma once

#include <atomic>
#include <cstdint>
#include <string>

#include "net/http.hpp"
#include "transfer_error.hpp"

struct target_resource {
    std::string url;
    std::uint64_t total_length = 0;
    bool supports_ranges = false;
};

class resource_prober {
public:
    // While *cancel_requested is true, probe requests in flight are abandoned
    // and probe() fails with error_kind::cancelled.
    explicit resource_prober(http_transport& transport,
                             const std::atomic<bool>* cancel_requested = nullptr);

    // Discovers the total length and range support of `url`.
    // Returns false with out_error set to invalid_url, unreachable,
    // unsupported_resource or cancelled when the run cannot proceed. A server without range
    // support still returns true; out_error then carries range_unsupported.
    bool probe(const std::string& url, target_resource& out, transfer_error& out_error);

    static bool is_valid_url(const std::string& url);
    static bool server_supports_ranges(const http_transport::response& resp);
    static std::uint64_t parse_content_length(const http_transport::response& resp);

private:
    http_transport& m_transport;
    const std::atomic<bool>* m_cancel_requested;

    http_transport::response probe_with_range(const std::string& url);
    bool interrupted(transfer_error& out_error) const;
};
