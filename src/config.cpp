#include "config.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <thread>

#include <nlohmann/json.hpp>

namespace {
template <typename T>
bool read_key(const nlohmann::json& j, const char* key, T& out, std::string& err) {
    if (!j.contains(key))
        return true;
    try {
        out = j.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        err = std::string("invalid value for '") + key + "': " + e.what();
        return false;
    }
    return true;
}
} // namespace

config::config()
    : workers(default_worker_count()), chunks_per_worker(1), tick_interval_ms(1000),
      window_seconds(10), connect_timeout_seconds(10), stall_timeout_seconds(30),
      follow_redirects(true), user_agent(http_client::options().user_agent), json_output(false) {}

int default_worker_count() {
    unsigned int n = std::thread::hardware_concurrency();
    if (n == 0)
        return 1;
    return static_cast<int>(std::min<unsigned int>(n, bandwidth_test::max_workers));
}

bool apply_config_json(const std::string& text, config& cfg, std::string& err) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        err = std::string("malformed JSON: ") + e.what();
        return false;
    }
    if (!j.is_object()) {
        err = "configuration must be a JSON object";
        return false;
    }

    config updated = cfg;
    if (!read_key(j, "workers", updated.workers, err) ||
        !read_key(j, "chunks_per_worker", updated.chunks_per_worker, err) ||
        !read_key(j, "tick_interval_ms", updated.tick_interval_ms, err) ||
        !read_key(j, "window_seconds", updated.window_seconds, err) ||
        !read_key(j, "connect_timeout_seconds", updated.connect_timeout_seconds, err) ||
        !read_key(j, "stall_timeout_seconds", updated.stall_timeout_seconds, err) ||
        !read_key(j, "follow_redirects", updated.follow_redirects, err) ||
        !read_key(j, "user_agent", updated.user_agent, err) ||
        !read_key(j, "json_output", updated.json_output, err)) {
        return false;
    }
    if (!validate_config(updated, err))
        return false;

    cfg = updated;
    return true;
}

bool load_config_file(const std::string& path, config& cfg, std::string& err) {
    std::ifstream file(path);
    if (!file.is_open()) {
        err = "cannot open config file: " + path;
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (!apply_config_json(buffer.str(), cfg, err)) {
        err = path + ": " + err;
        return false;
    }
    return true;
}

bool validate_config(const config& cfg, std::string& err) {
    if (cfg.workers > bandwidth_test::max_workers) {
        err = "workers must not exceed " + std::to_string(bandwidth_test::max_workers);
        return false;
    }
    if (cfg.chunks_per_worker < 1) {
        err = "chunks_per_worker must be at least 1";
        return false;
    }
    const long long workers = cfg.workers > 0 ? cfg.workers : 1;
    if (workers * cfg.chunks_per_worker > bandwidth_test::max_chunks) {
        err = "workers * chunks_per_worker must not exceed " +
              std::to_string(bandwidth_test::max_chunks);
        return false;
    }
    if (cfg.tick_interval_ms <= 0) {
        err = "tick_interval_ms must be positive";
        return false;
    }
    if (cfg.window_seconds <= 0) {
        err = "window_seconds must be positive";
        return false;
    }
    if (cfg.connect_timeout_seconds < 0 || cfg.stall_timeout_seconds < 0) {
        err = "timeouts must not be negative";
        return false;
    }
    return true;
}

bandwidth_test::options make_test_options(const config& cfg) {
    bandwidth_test::options opts;
    opts.worker_count = cfg.workers > 0 ? cfg.workers : 1;
    opts.chunks_per_worker = cfg.chunks_per_worker;
    opts.tick_interval = std::chrono::milliseconds(cfg.tick_interval_ms);
    opts.window = std::chrono::seconds(cfg.window_seconds);
    return opts;
}

http_client::options make_client_options(const config& cfg) {
    http_client::options opts;
    opts.connect_timeout_seconds = cfg.connect_timeout_seconds;
    opts.timeout_seconds = 0;
    opts.stall_timeout_seconds = cfg.stall_timeout_seconds;
    opts.follow_redirects = cfg.follow_redirects;
    opts.user_agent = cfg.user_agent;
    return opts;
}
