#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>

// Logging control: define HTTP_CLIENT_ENABLE_LOG to enable client logs
#ifdef HTTP_CLIENT_ENABLE_LOG
#include <iostream>
#define HTTP_CLIENT_LOG(stmt)                                                                      \
    do {                                                                                           \
        stmt;                                                                                      \
    } while (0)
#else
#define HTTP_CLIENT_LOG(stmt)                                                                      \
    do {                                                                                           \
    } while (0)
#endif

// Minimal transport surface the prober and fetchers need. One instance is used
// by one thread at a time.
class http_transport {
public:
    struct response {
        int status_code;
        std::map<std::string, std::string> headers; // names lowercased
        int transport_code;                         // CURLcode, 0 on success
        std::string transport_error;
        bool aborted; // stopped by a callback or the abort flag

        response() : status_code(0), transport_code(0), aborted(false) {}

        bool transport_failed() const {
            return transport_code != 0 && !aborted;
        }
    };

    struct request {
        std::string url;
        std::map<std::string, std::string> headers;

        request(const std::string& url) : url(url) {}
    };

    // Invoked once with the final header block, before the first body byte.
    // Returning false abandons the transfer.
    using headers_callback_t = std::function<bool(const response& resp)>;
    // Invoked for every body increment as it arrives. Returning false abandons the transfer.
    using data_callback_t = std::function<bool(const char* data, std::size_t len)>;

    virtual ~http_transport() = default;

    virtual response head(const request& req) = 0;
    virtual response get_stream(const request& req, const headers_callback_t& on_headers,
                                const data_callback_t& on_data) = 0;

    // While *flag is true any transfer in progress is abandoned, including one
    // that is stalled waiting for the peer. Pass nullptr to detach.
    virtual void set_abort_flag(const std::atomic<bool>* flag) = 0;
};

using transport_factory_t = std::function<std::unique_ptr<http_transport>()>;

class http_client : public http_transport {
public:
    struct options {
        long connect_timeout_seconds;
        long timeout_seconds;       // whole request, 0 = unlimited
        long stall_timeout_seconds; // abort when no byte arrives for this long, 0 = never
        bool follow_redirects;
        std::string user_agent;

        options();
    };

    http_client();
    explicit http_client(const options& opts);
    ~http_client() override;

    // Disable copy constructor and assignment operator
    http_client(const http_client&) = delete;
    http_client& operator=(const http_client&) = delete;

    // Enable move constructor and assignment operator
    http_client(http_client&&) noexcept;
    http_client& operator=(http_client&&) noexcept;

    response head(const request& req) override;
    response get_stream(const request& req, const headers_callback_t& on_headers,
                        const data_callback_t& on_data) override;
    void set_abort_flag(const std::atomic<bool>* flag) override;

    // Returns a factory producing independently configured clients, one per thread.
    static transport_factory_t factory(const options& opts);

    // Folds raw header text into resp. A status line starts a new block, so after
    // redirects only the final response's headers remain.
    static void parse_response_headers(const std::string& header_string, response& resp);

private:
    class impl;
    std::unique_ptr<impl> pimpl;

    response perform_request(const request& req, bool head_only,
                             const headers_callback_t* on_headers, const data_callback_t* on_data);
    void print_request_details(const request& req, const char* method);
    void print_response_details(const response& resp);
};
