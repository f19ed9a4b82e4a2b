#include <catch2/catch.hpp>

#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <thread>

#include "bandwidth_test.hpp"
#include "fake_transport.hpp"

namespace {
const std::string kUrl = "http://speed.example.test/1000.bin";

bandwidth_test::options make_options(int workers, int chunks_per_worker = 1) {
    bandwidth_test::options opts;
    opts.worker_count = workers;
    opts.chunks_per_worker = chunks_per_worker;
    opts.tick_interval = std::chrono::milliseconds(10);
    opts.window = std::chrono::milliseconds(1000);
    return opts;
}

std::uint64_t completed_bytes(const bandwidth_test::transfer_report& report) {
    std::uint64_t sum = 0;
    for (const auto& c : report.chunks) {
        if (c.status == chunk_status::completed)
            sum += c.bytes_received;
    }
    return sum;
}
} // namespace

TEST_CASE("four workers download the whole resource") {
    fake_server server;
    bandwidth_test test(server.factory());

    auto report = test.run(kUrl, make_options(4), nullptr);

    REQUIRE(report.outcome == transfer_outcome::all_chunks_completed);
    REQUIRE(report.all_bytes_received());
    REQUIRE_FALSE(report.degraded);
    REQUIRE(report.total_length == 1000);
    REQUIRE(report.bytes_received == 1000);
    REQUIRE(report.worker_count == 4);
    REQUIRE(report.chunks.size() == 4);
    REQUIRE(completed_bytes(report) == report.bytes_received);
    REQUIRE(server.count_requests("GET bytes=") == 4);
    REQUIRE(server.count_requests("GET bytes=750-999") == 1);
}

TEST_CASE("no range support falls back to one plain GET") {
    fake_server server;
    server.supports_ranges = false;
    server.advertise_ranges = false;
    bandwidth_test test(server.factory());

    auto report = test.run(kUrl, make_options(8), nullptr);

    REQUIRE(report.outcome == transfer_outcome::all_chunks_completed);
    REQUIRE(report.degraded);
    REQUIRE(report.probe_status.kind == error_kind::range_unsupported);
    REQUIRE(report.worker_count == 1);
    REQUIRE(report.chunks.size() == 1);
    REQUIRE(report.bytes_received == 1000);
    auto requests = server.requests();
    REQUIRE(std::count(requests.begin(), requests.end(), std::string("GET")) == 1);
}

TEST_CASE("a failing chunk keeps its partial bytes and the run finishes") {
    fake_server server;
    server.fail_range_start = 250;
    server.fail_after = 100;
    bandwidth_test test(server.factory());

    auto report = test.run(kUrl, make_options(4), nullptr);

    REQUIRE(report.outcome == transfer_outcome::completed_with_failures);
    REQUIRE_FALSE(report.all_bytes_received());
    REQUIRE(report.bytes_received == 850);

    std::size_t failed = 0;
    for (const auto& c : report.chunks) {
        if (c.status != chunk_status::failed)
            continue;
        ++failed;
        REQUIRE(c.range.start == 250);
        REQUIRE(c.bytes_received == 100);
        REQUIRE(c.error.kind == error_kind::chunk_transfer);
        REQUIRE_FALSE(c.error.message.empty());
    }
    REQUIRE(failed == 1);
}

TEST_CASE("probe failures abort before any fetch") {
    fake_server server;
    bandwidth_test test(server.factory());

    SECTION("unreachable") {
        server.unreachable = true;
        auto report = test.run(kUrl, make_options(4), nullptr);
        REQUIRE(report.outcome == transfer_outcome::aborted);
        REQUIRE(report.probe_status.kind == error_kind::unreachable);
        REQUIRE(report.chunks.empty());
        REQUIRE(server.count_requests("GET") == 0);
    }

    SECTION("empty resource") {
        server.size = 0;
        auto report = test.run(kUrl, make_options(4), nullptr);
        REQUIRE(report.outcome == transfer_outcome::aborted);
        REQUIRE(report.probe_status.kind == error_kind::unsupported_resource);
        REQUIRE(report.bytes_received == 0);
    }

    SECTION("invalid URL") {
        auto report = test.run("not a url", make_options(4), nullptr);
        REQUIRE(report.outcome == transfer_outcome::aborted);
        REQUIRE(report.probe_status.kind == error_kind::invalid_url);
        REQUIRE(server.requests().empty());
    }
}

TEST_CASE("worker count is clamped to the chunk plan") {
    fake_server server;

    SECTION("zero workers still download with one") {
        bandwidth_test test(server.factory());
        auto report = test.run(kUrl, make_options(0), nullptr);
        REQUIRE(report.outcome == transfer_outcome::all_chunks_completed);
        REQUIRE(report.chunks.size() == 1);
        REQUIRE(report.worker_count == 1);
    }

    SECTION("more workers than bytes") {
        server.size = 3;
        bandwidth_test test(server.factory());
        auto report = test.run(kUrl, make_options(8), nullptr);
        REQUIRE(report.outcome == transfer_outcome::all_chunks_completed);
        REQUIRE(report.chunks.size() == 3);
        REQUIRE(report.worker_count == 3);
        REQUIRE(report.bytes_received == 3);
    }
}

TEST_CASE("workers drain a larger chunk pool with one transport each") {
    fake_server server;
    bandwidth_test test(server.factory());

    auto report = test.run(kUrl, make_options(2, 4), nullptr);

    REQUIRE(report.outcome == transfer_outcome::all_chunks_completed);
    REQUIRE(report.chunks.size() == 8);
    REQUIRE(report.worker_count == 2);
    REQUIRE(report.bytes_received == 1000);
    // one for the probe, one per worker
    REQUIRE(server.transports_created.load() <= 3);
    REQUIRE(server.count_requests("GET bytes=") == 8);
}

TEST_CASE("cancelling a stalled transfer stops every fetcher") {
    fake_server server;
    server.stall_after = 100;
    bandwidth_test test(server.factory());

    std::mutex samples_mutex;
    std::vector<std::uint64_t> totals;
    std::thread canceller([&]() {
        while (server.stalled.load() < 4) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        test.cancel();
    });

    auto report = test.run(kUrl, make_options(4), [&](const speed_reading& reading) {
        std::lock_guard<std::mutex> lk(samples_mutex);
        totals.push_back(reading.total_bytes);
    });
    canceller.join();

    REQUIRE(test.cancel_requested());
    REQUIRE(report.outcome == transfer_outcome::cancelled);
    REQUIRE(report.bytes_received == 400);
    for (const auto& c : report.chunks) {
        REQUIRE(c.status == chunk_status::failed);
        REQUIRE(c.error.message == "cancelled");
    }

    std::lock_guard<std::mutex> lk(samples_mutex);
    REQUIRE_FALSE(totals.empty());
    for (std::size_t i = 1; i < totals.size(); ++i) {
        REQUIRE(totals[i - 1] <= totals[i]);
    }
    REQUIRE(totals.back() <= 400);
}

TEST_CASE("cancel before run sends no request") {
    fake_server server;
    bandwidth_test test(server.factory());
    test.cancel();

    auto report = test.run(kUrl, make_options(4), nullptr);

    REQUIRE(report.outcome == transfer_outcome::cancelled);
    REQUIRE(report.probe_status.kind == error_kind::cancelled);
    REQUIRE(report.bytes_received == 0);
    REQUIRE(report.chunks.empty());
    REQUIRE(server.requests().empty());
}

TEST_CASE("cancelling while the range check stalls returns promptly") {
    fake_server server;
    server.advertise_ranges = false;
    server.stall_after = 0;
    bandwidth_test test(server.factory());

    std::thread canceller([&]() {
        while (server.stalled.load() == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        test.cancel();
    });
    auto started = std::chrono::steady_clock::now();
    auto report = test.run(kUrl, make_options(4), nullptr);
    canceller.join();

    REQUIRE(report.outcome == transfer_outcome::cancelled);
    REQUIRE(report.probe_status.kind == error_kind::cancelled);
    REQUIRE(report.chunks.empty());
    // the fake gives up on its own after 5 s
    REQUIRE(std::chrono::steady_clock::now() - started < std::chrono::seconds(4));
    REQUIRE(server.requests() == std::vector<std::string>{"HEAD", "GET bytes=0-0"});
}

TEST_CASE("a transport that cannot be created aborts the run with a report") {
    transport_factory_t factory = []() -> std::unique_ptr<http_transport> {
        throw std::runtime_error("Failed to initialize curl handle");
    };
    bandwidth_test test(factory);

    bandwidth_test::transfer_report report;
    REQUIRE_NOTHROW(report = test.run(kUrl, make_options(4), nullptr));

    REQUIRE(report.outcome == transfer_outcome::aborted);
    REQUIRE(report.probe_status.kind == error_kind::unreachable);
    REQUIRE(report.probe_status.message == "Failed to initialize curl handle");
    REQUIRE(report.chunks.empty());
}

TEST_CASE("oversized chunk pools are clamped") {
    fake_server server;
    server.size = 1000000000000ULL;
    server.stall_after = 0;
    bandwidth_test test(server.factory());

    std::thread canceller([&]() {
        while (server.stalled.load() < 2) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        test.cancel();
    });
    auto report = test.run(kUrl, make_options(2, 1000000000), nullptr);
    canceller.join();

    REQUIRE(report.outcome == transfer_outcome::cancelled);
    REQUIRE(report.worker_count == 2);
    REQUIRE(report.chunks.size() == static_cast<std::size_t>(bandwidth_test::max_chunks));
    REQUIRE(report.bytes_received == 0);
}

TEST_CASE("transport construction errors fail chunks instead of the run") {
    fake_server server;
    int created = 0;
    std::mutex created_mutex;
    transport_factory_t factory = [&]() -> std::unique_ptr<http_transport> {
        std::lock_guard<std::mutex> lk(created_mutex);
        if (created++ == 0)
            return std::make_unique<fake_transport>(server);
        throw std::runtime_error("Failed to initialize CURL");
    };
    bandwidth_test test(factory);

    auto report = test.run(kUrl, make_options(2), nullptr);

    REQUIRE(report.outcome == transfer_outcome::completed_with_failures);
    REQUIRE(report.bytes_received == 0);
    for (const auto& c : report.chunks) {
        REQUIRE(c.status == chunk_status::failed);
        REQUIRE(c.error.message == "Failed to initialize CURL");
    }
}
