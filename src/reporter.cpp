#include "reporter.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

#include "util/byte_utils.hpp"

reporter::reporter(std::ostream& out, bool json_output) : m_out(out), m_json_output(json_output) {}

std::string reporter::format_timestamp(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm local{};
    localtime_r(&t, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

std::string reporter::format_speed(double bytes_per_second) {
    auto bps = bytes_per_second > 0.0 ? static_cast<std::uint64_t>(bytes_per_second) : 0;
    std::ostringstream oss;
    oss << bps << " B/s, " << bps / byte_utils::KIB << " KB/s, " << bps / byte_utils::MIB
        << " MB/s";
    return oss.str();
}

std::string reporter::format_reading(const speed_reading& reading) {
    return "[" + format_timestamp(reading.timestamp) +
           "] Average speed: " + format_speed(reading.bytes_per_second);
}

nlohmann::json reporter::reading_to_json(const speed_reading& reading) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  reading.timestamp.time_since_epoch())
                  .count();
    return nlohmann::json{{"type", "reading"},
                          {"timestamp_ms", ms},
                          {"bytes_per_second", reading.bytes_per_second},
                          {"total_bytes", reading.total_bytes}};
}

nlohmann::json reporter::report_to_json(const bandwidth_test::transfer_report& report) {
    nlohmann::json j{{"type", "summary"},
                     {"outcome", to_string(report.outcome)},
                     {"degraded", report.degraded},
                     {"total_length", report.total_length},
                     {"bytes_received", report.bytes_received},
                     {"workers", report.worker_count},
                     {"elapsed_ms", report.elapsed.count()},
                     {"average_bytes_per_second", report.average_bytes_per_second},
                     {"window_bytes_per_second", report.window_bytes_per_second}};
    if (report.outcome == transfer_outcome::aborted) {
        j["error"] = {{"kind", to_string(report.probe_status.kind)},
                      {"message", report.probe_status.message}};
    }
    nlohmann::json failed = nlohmann::json::array();
    for (const auto& c : report.chunks) {
        if (c.status != chunk_status::failed)
            continue;
        failed.push_back(nlohmann::json{{"id", c.range.id},
                                        {"start", c.range.start},
                                        {"end", c.range.end},
                                        {"bytes_received", c.bytes_received},
                                        {"error", c.error.message}});
    }
    j["failed_chunks"] = failed;
    return j;
}

void reporter::print_reading(const speed_reading& reading) {
    if (m_json_output) {
        m_out << reading_to_json(reading).dump() << std::endl;
    } else {
        m_out << format_reading(reading) << std::endl;
    }
}

void reporter::print_summary(const bandwidth_test::transfer_report& report) {
    if (m_json_output) {
        m_out << report_to_json(report).dump() << std::endl;
        return;
    }

    if (report.outcome == transfer_outcome::aborted) {
        m_out << "Probe failed (" << to_string(report.probe_status.kind)
              << "): " << report.probe_status.message << std::endl;
        return;
    }

    if (report.degraded) {
        m_out << "Note: server does not honor range requests; measured over a single stream"
              << std::endl;
    }

    double secs = std::chrono::duration<double>(report.elapsed).count();
    std::ostringstream overall;
    overall.setf(std::ios::fixed);
    overall.precision(1);
    overall << byte_utils::format_bytes(report.bytes_received) << " in " << secs << " s ("
            << byte_utils::format_rate(report.average_bytes_per_second) << " overall)";

    switch (report.outcome) {
    case transfer_outcome::all_chunks_completed:
        m_out << "Download completed: " << report.bytes_received
              << " bytes downloaded at an average speed of "
              << format_speed(report.window_bytes_per_second) << std::endl;
        break;
    case transfer_outcome::completed_with_failures:
        m_out << "Download finished with failures: " << report.bytes_received << " of "
              << report.total_length << " bytes at an average speed of "
              << format_speed(report.window_bytes_per_second) << std::endl;
        break;
    case transfer_outcome::cancelled:
        m_out << "Download cancelled: " << report.bytes_received << " of " << report.total_length
              << " bytes at an average speed of " << format_speed(report.window_bytes_per_second)
              << std::endl;
        break;
    case transfer_outcome::aborted:
        break;
    }
    m_out << "  " << overall.str() << std::endl;

    if (report.outcome == transfer_outcome::completed_with_failures) {
        for (const auto& c : report.chunks) {
            if (c.status != chunk_status::failed)
                continue;
            m_out << "  chunk " << c.range.id << " [" << c.range.start << ", " << c.range.end
                  << "): " << c.error.message << " (" << c.bytes_received << " bytes)"
                  << std::endl;
        }
    }
}
