#pragma once

#include <string>

#include "bandwidth_test.hpp"
#include "net/http.hpp"

struct config {
    int workers;
    int chunks_per_worker;
    long tick_interval_ms;
    long window_seconds;
    long connect_timeout_seconds;
    long stall_timeout_seconds;
    bool follow_redirects;
    std::string user_agent;
    bool json_output;

    config();
};

// Number of hardware threads, between 1 and bandwidth_test::max_workers
int default_worker_count();

// Applies the keys present in a JSON object on top of cfg. Unknown keys are ignored.
bool apply_config_json(const std::string& text, config& cfg, std::string& err);
bool load_config_file(const std::string& path, config& cfg, std::string& err);
bool validate_config(const config& cfg, std::string& err);

bandwidth_test::options make_test_options(const config& cfg);
http_client::options make_client_options(const config& cfg);
