#include "net/resource_prober.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

#include "util/defer.hpp"

namespace {
inline std::string to_lower_copy(const std::string& s) {
    std::string r = s;
    std::transform(r.begin(), r.end(), r.begin(), ::tolower);
    return r;
}

bool is_success(int status_code) {
    return status_code >= 200 && status_code < 300;
}

// Decimal digits only; stoull alone would accept "-1" and wrap it
bool parse_length(const std::string& text, std::uint64_t& out) {
    if (text.empty() ||
        !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    out = static_cast<std::uint64_t>(std::stoull(text));
    return true;
}
} // namespace

resource_prober::resource_prober(http_transport& transport,
                                 const std::atomic<bool>* cancel_requested)
    : m_transport(transport), m_cancel_requested(cancel_requested) {}

bool resource_prober::interrupted(transfer_error& out_error) const {
    if (!m_cancel_requested || !m_cancel_requested->load(std::memory_order_relaxed))
        return false;
    out_error = {error_kind::cancelled, "probe cancelled"};
    std::cout << "[resource_prober] Probe cancelled" << std::endl;
    return true;
}

bool resource_prober::is_valid_url(const std::string& url) {
    std::string lower = to_lower_copy(url);
    std::size_t host_start = 0;
    if (lower.compare(0, 7, "http://") == 0) {
        host_start = 7;
    } else if (lower.compare(0, 8, "https://") == 0) {
        host_start = 8;
    } else {
        return false;
    }
    if (host_start >= url.size()) {
        return false;
    }
    char first = url[host_start];
    if (first == '/' || first == '?' || first == '#' || first == ':') {
        return false;
    }
    return std::none_of(url.begin(), url.end(),
                        [](unsigned char c) { return std::isspace(c) || std::iscntrl(c); });
}

bool resource_prober::server_supports_ranges(const http_transport::response& resp) {
    // If we received a 206 Partial Content or a Content-Range header, ranges are supported
    if (resp.status_code == 206)
        return true;
    auto it_cr = resp.headers.find("content-range");
    if (it_cr != resp.headers.end())
        return true;
    // Otherwise, rely on Accept-Ranges if provided ("none" means no)
    auto it = resp.headers.find("accept-ranges");
    if (it == resp.headers.end())
        return false;
    std::string v = to_lower_copy(it->second);
    return v.find("bytes") != std::string::npos;
}

std::uint64_t resource_prober::parse_content_length(const http_transport::response& resp) {
    // Prefer Content-Range total size if present (e.g., "bytes 0-0/2398523392")
    auto it_cr = resp.headers.find("content-range");
    if (it_cr != resp.headers.end()) {
        const std::string& v = it_cr->second;
        auto slash_pos = v.rfind('/');
        if (slash_pos != std::string::npos && slash_pos + 1 < v.size() && v[slash_pos + 1] != '*') {
            try {
                std::uint64_t total = 0;
                if (parse_length(v.substr(slash_pos + 1), total) && total > 0)
                    return total;
            } catch (const std::exception& e) {
                std::cerr << "[resource_prober] Error parsing content-range total: " << e.what()
                          << std::endl;
            }
        }
        // A partial response's Content-Length is the slice, not the resource
        if (resp.status_code == 206)
            return 0;
    }

    auto it = resp.headers.find("content-length");
    if (it == resp.headers.end())
        return 0;
    try {
        std::uint64_t length = 0;
        return parse_length(it->second, length) ? length : 0;
    } catch (const std::exception& e) {
        std::cerr << "[resource_prober] Error parsing content length: " << e.what() << std::endl;
        return 0;
    }
}

http_transport::response resource_prober::probe_with_range(const std::string& url) {
    // Tiny ranged GET (bytes=0-0); the body is abandoned as soon as headers arrive
    // so a server that ignores Range never streams the whole file here.
    http_transport::request req(url);
    req.headers["Range"] = "bytes=0-0";
    std::cout << "[resource_prober] Sending probe Range: " << req.headers["Range"] << std::endl;
    return m_transport.get_stream(
        req, [](const http_transport::response&) { return false; },
        [](const char*, std::size_t) { return false; });
}

bool resource_prober::probe(const std::string& url, target_resource& out,
                            transfer_error& out_error) {
    out = target_resource{};
    out_error = transfer_error{};

    if (!is_valid_url(url)) {
        out_error = {error_kind::invalid_url, "not a valid http(s) URL: " + url};
        std::cerr << "[resource_prober] " << out_error.message << std::endl;
        return false;
    }

    if (interrupted(out_error))
        return false;
    m_transport.set_abort_flag(m_cancel_requested);
    DEFER({ m_transport.set_abort_flag(nullptr); });

    std::cout << "[resource_prober] Probing " << url << std::endl;
    auto head_resp = m_transport.head(http_transport::request(url));
    if (interrupted(out_error))
        return false;
    if (head_resp.transport_failed()) {
        out_error = {error_kind::unreachable,
                     "cannot reach " + url + ": " + head_resp.transport_error};
        std::cerr << "[resource_prober] " << out_error.message << std::endl;
        return false;
    }

    std::uint64_t total_bytes = 0;
    bool ranges = false;
    int last_status = head_resp.status_code;
    if (is_success(head_resp.status_code)) {
        total_bytes = parse_content_length(head_resp);
        ranges = server_supports_ranges(head_resp);
        std::cout << "[resource_prober] HEAD status=" << head_resp.status_code
                  << ", total_bytes=" << total_bytes
                  << ", ranges_supported=" << (ranges ? "true" : "false") << std::endl;
    } else {
        std::cout << "[resource_prober] HEAD status=" << head_resp.status_code
                  << ", falling back to ranged GET" << std::endl;
    }

    if (total_bytes == 0 || !ranges) {
        auto range_resp = probe_with_range(url);
        if (interrupted(out_error))
            return false;
        if (range_resp.transport_failed()) {
            if (total_bytes == 0) {
                out_error = {error_kind::unreachable,
                             "cannot reach " + url + ": " + range_resp.transport_error};
                std::cerr << "[resource_prober] " << out_error.message << std::endl;
                return false;
            }
            std::cerr << "[resource_prober] Ranged probe failed: " << range_resp.transport_error
                      << std::endl;
        } else if (range_resp.status_code == 206) {
            ranges = true;
            std::uint64_t ranged_total = parse_content_length(range_resp);
            if (ranged_total > 0)
                total_bytes = ranged_total;
        } else if (is_success(range_resp.status_code)) {
            // Server answered the whole resource: Range is ignored
            ranges = false;
            if (total_bytes == 0)
                total_bytes = parse_content_length(range_resp);
        }
        if (!range_resp.transport_failed())
            last_status = range_resp.status_code;
        std::cout << "[resource_prober] Probe status=" << range_resp.status_code
                  << ", total_bytes=" << total_bytes
                  << ", ranges_supported=" << (ranges ? "true" : "false") << std::endl;
    }

    if (total_bytes == 0) {
        if (!is_success(last_status)) {
            out_error = {error_kind::unsupported_resource,
                         "http status " + std::to_string(last_status)};
        } else {
            out_error = {error_kind::unsupported_resource, "content length unknown or zero"};
        }
        std::cerr << "[resource_prober] " << out_error.message << std::endl;
        return false;
    }

    out.url = url;
    out.total_length = total_bytes;
    out.supports_ranges = ranges;
    if (!ranges) {
        out_error = {error_kind::range_unsupported, "server does not honor range requests"};
        std::cout << "[resource_prober] Server does not support ranges, single stream only"
                  << std::endl;
    }
    return true;
}
