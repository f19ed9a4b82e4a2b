#include "net/http.hpp"

#include <algorithm>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <curl/curl.h>

constexpr const char* USER_AGENT = "speedgauge/0.1";

namespace {
std::once_flag curl_init_flag;

void ensure_curl_initialized() {
    std::call_once(curl_init_flag, []() {
        CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            std::cerr << "[http_client] curl_global_init failed: " << curl_easy_strerror(rc)
                      << std::endl;
        }
    });
}

// Helper function to convert string to lowercase
std::string to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(), ::tolower);
    return result;
}

// Helper function to trim whitespace
std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t");
    if (first == std::string::npos)
        return "";
    size_t last = str.find_last_not_of(" \t");
    return str.substr(first, (last - first + 1));
}

void apply_header_line(std::string line, http_transport::response& resp) {
    // Remove carriage return if present
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    if (line.empty()) {
        return;
    }

    if (line.compare(0, 5, "HTTP/") == 0) {
        // New response block (first response or after a redirect / 100-continue)
        resp.headers.clear();
        std::istringstream sl(line);
        std::string version;
        int code = 0;
        sl >> version >> code;
        resp.status_code = code;
        return;
    }

    size_t colon_pos = line.find(':');
    if (colon_pos != std::string::npos) {
        std::string header_name = trim(line.substr(0, colon_pos));
        std::string header_value = trim(line.substr(colon_pos + 1));
        resp.headers[to_lower(header_name)] = header_value;
    }
}

// State shared with the libcurl callbacks for one transfer
struct transfer_context {
    http_transport::response* resp = nullptr;
    const http_transport::headers_callback_t* on_headers = nullptr;
    const http_transport::data_callback_t* on_data = nullptr;
    const std::atomic<bool>* abort_flag = nullptr;
    bool headers_delivered = false;
    bool aborted = false;
};

size_t header_callback(char* contents, size_t size, size_t nmemb, transfer_context* ctx) {
    size_t total_size = size * nmemb;
    apply_header_line(std::string(contents, total_size), *ctx->resp);
    return total_size;
}

size_t write_callback(char* contents, size_t size, size_t nmemb, transfer_context* ctx) {
    size_t total_size = size * nmemb;
    if (!ctx->headers_delivered) {
        ctx->headers_delivered = true;
        if (ctx->on_headers && *ctx->on_headers && !(*ctx->on_headers)(*ctx->resp)) {
            ctx->aborted = true;
            return 0;
        }
    }
    if (ctx->on_data && *ctx->on_data && !(*ctx->on_data)(contents, total_size)) {
        ctx->aborted = true;
        return 0;
    }
    return total_size;
}

int xferinfo_callback(transfer_context* ctx, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    if (ctx->abort_flag && ctx->abort_flag->load(std::memory_order_relaxed)) {
        ctx->aborted = true;
        return 1;
    }
    return 0;
}
} // namespace

http_client::options::options()
    : connect_timeout_seconds(10), timeout_seconds(0), stall_timeout_seconds(30),
      follow_redirects(true), user_agent(USER_AGENT) {}

class http_client::impl {
public:
    explicit impl(const options& opts) : curl_handle(nullptr), abort_flag(nullptr) {
        ensure_curl_initialized();
        curl_handle = curl_easy_init();
        if (!curl_handle) {
            throw std::runtime_error("Failed to initialize curl handle");
        }

        // Set up common curl options
        curl_easy_setopt(curl_handle, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl_handle, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl_handle, CURLOPT_XFERINFOFUNCTION, xferinfo_callback);
        curl_easy_setopt(curl_handle, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl_handle, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl_handle, CURLOPT_FOLLOWLOCATION, opts.follow_redirects ? 1L : 0L);
        curl_easy_setopt(curl_handle, CURLOPT_MAXREDIRS, opts.follow_redirects ? 5L : 0L);
        curl_easy_setopt(curl_handle, CURLOPT_CONNECTTIMEOUT, opts.connect_timeout_seconds);
        curl_easy_setopt(curl_handle, CURLOPT_TIMEOUT, opts.timeout_seconds);
        if (opts.stall_timeout_seconds > 0) {
            curl_easy_setopt(curl_handle, CURLOPT_LOW_SPEED_LIMIT, 1L);
            curl_easy_setopt(curl_handle, CURLOPT_LOW_SPEED_TIME, opts.stall_timeout_seconds);
        }
        curl_easy_setopt(curl_handle, CURLOPT_USERAGENT, opts.user_agent.c_str());
        curl_easy_setopt(curl_handle, CURLOPT_SSL_VERIFYPEER, 1L);
        curl_easy_setopt(curl_handle, CURLOPT_SSL_VERIFYHOST, 2L);
        // Prefer HTTP/2 over TLS if available (falls back automatically)
        curl_easy_setopt(curl_handle, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
    }

    ~impl() {
        if (curl_handle) {
            curl_easy_cleanup(curl_handle);
        }
    }

    // Disable copy constructor and assignment operator
    impl(const impl&) = delete;
    impl& operator=(const impl&) = delete;

    CURL* curl_handle;
    const std::atomic<bool>* abort_flag;
};

http_client::http_client() : http_client(options()) {}

http_client::http_client(const options& opts) : pimpl(std::make_unique<impl>(opts)) {}

http_client::~http_client() = default;

http_client::http_client(http_client&&) noexcept = default;
http_client& http_client::operator=(http_client&&) noexcept = default;

http_client::response http_client::head(const request& req) {
    return perform_request(req, true, nullptr, nullptr);
}

http_client::response http_client::get_stream(const request& req,
                                              const headers_callback_t& on_headers,
                                              const data_callback_t& on_data) {
    return perform_request(req, false, &on_headers, &on_data);
}

void http_client::set_abort_flag(const std::atomic<bool>* flag) {
    pimpl->abort_flag = flag;
}

transport_factory_t http_client::factory(const options& opts) {
    return [opts]() -> std::unique_ptr<http_transport> {
        return std::make_unique<http_client>(opts);
    };
}

http_client::response http_client::perform_request(const request& req, bool head_only,
                                                   const headers_callback_t* on_headers,
                                                   const data_callback_t* on_data) {
    response resp;
    transfer_context ctx;
    ctx.resp = &resp;
    ctx.on_headers = on_headers;
    ctx.on_data = on_data;
    ctx.abort_flag = pimpl->abort_flag;

    print_request_details(req, head_only ? "HEAD" : "GET");

    // Set URL
    curl_easy_setopt(pimpl->curl_handle, CURLOPT_URL, req.url.c_str());

    // Set callback data
    curl_easy_setopt(pimpl->curl_handle, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(pimpl->curl_handle, CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(pimpl->curl_handle, CURLOPT_XFERINFODATA, &ctx);

    // Set HTTP method
    if (head_only) {
        curl_easy_setopt(pimpl->curl_handle, CURLOPT_NOBODY, 1L);
    } else {
        curl_easy_setopt(pimpl->curl_handle, CURLOPT_NOBODY, 0L);
        curl_easy_setopt(pimpl->curl_handle, CURLOPT_HTTPGET, 1L);
    }

    // Set custom headers
    struct curl_slist* header_list = nullptr;
    for (const auto& header : req.headers) {
        std::string header_string = header.first + ": " + header.second;
        header_list = curl_slist_append(header_list, header_string.c_str());
    }
    curl_easy_setopt(pimpl->curl_handle, CURLOPT_HTTPHEADER, header_list);

    // Perform the request
    CURLcode res = curl_easy_perform(pimpl->curl_handle);

    // Clean up headers and clear from handle to avoid dangling pointer across requests
    curl_easy_setopt(pimpl->curl_handle, CURLOPT_HTTPHEADER, nullptr);
    if (header_list) {
        curl_slist_free_all(header_list);
        header_list = nullptr;
    }

    resp.aborted = ctx.aborted;
    if (res != CURLE_OK) {
        resp.transport_code = static_cast<int>(res);
        resp.transport_error = curl_easy_strerror(res);
        HTTP_CLIENT_LOG(std::cerr << "curl_easy_perform() failed: " << resp.transport_error
                                  << std::endl);
        if (!resp.aborted) {
            return resp;
        }
    }

    // Get status code
    long status_code = 0;
    if (curl_easy_getinfo(pimpl->curl_handle, CURLINFO_RESPONSE_CODE, &status_code) == CURLE_OK &&
        status_code != 0) {
        resp.status_code = static_cast<int>(status_code);
    }

    // Log effective URL after redirects
    char* effective_url = nullptr;
    if (curl_easy_getinfo(pimpl->curl_handle, CURLINFO_EFFECTIVE_URL, &effective_url) == CURLE_OK &&
        effective_url) {
        HTTP_CLIENT_LOG(std::cout << "Effective URL: " << effective_url << std::endl);
    }

    // Empty bodies never reach the write callback; hand the headers over now
    if (!head_only && !ctx.headers_delivered && !resp.aborted && on_headers && *on_headers) {
        ctx.headers_delivered = true;
        (*on_headers)(resp);
    }

    print_response_details(resp);

    return resp;
}

void http_client::parse_response_headers(const std::string& header_string, response& resp) {
    std::istringstream stream(header_string);
    std::string line;

    while (std::getline(stream, line)) {
        apply_header_line(line, resp);
    }
}

void http_client::print_request_details(const request& req, const char* method) {
    HTTP_CLIENT_LOG(std::cout << "\n=== HTTP REQUEST ===" << std::endl);
    HTTP_CLIENT_LOG(std::cout << "Method: " << method << std::endl);
    HTTP_CLIENT_LOG(std::cout << "URL: " << req.url << std::endl);

    if (!req.headers.empty()) {
        HTTP_CLIENT_LOG(std::cout << "Headers:" << std::endl);
        for (const auto& header : req.headers) {
            HTTP_CLIENT_LOG(std::cout << "  " << header.first << ": " << header.second
                                      << std::endl);
        }
    }
    HTTP_CLIENT_LOG(std::cout << "===================\n" << std::endl);
}

void http_client::print_response_details(const response& resp) {
    HTTP_CLIENT_LOG(std::cout << "\n=== HTTP RESPONSE ===" << std::endl);
    HTTP_CLIENT_LOG(std::cout << "Status Code: " << resp.status_code << std::endl);

    if (!resp.headers.empty()) {
        HTTP_CLIENT_LOG(std::cout << "Headers:" << std::endl);
        for (const auto& header : resp.headers) {
            HTTP_CLIENT_LOG(std::cout << "  " << header.first << ": " << header.second
                                      << std::endl);
        }
    }
    HTTP_CLIENT_LOG(std::cout << "====================\n" << std::endl);
}
