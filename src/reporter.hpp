#pragma once

#include <chrono>
#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

#include "bandwidth_test.hpp"
#include "throughput_estimator.hpp"

// Prints readings and the final report, either as the classic text lines or as
// one JSON object per line.
class reporter {
public:
    reporter(std::ostream& out, bool json_output);

    void print_reading(const speed_reading& reading);
    void print_summary(const bandwidth_test::transfer_report& report);

    static std::string format_timestamp(std::chrono::system_clock::time_point tp);
    static std::string format_reading(const speed_reading& reading);
    static std::string format_speed(double bytes_per_second);
    static nlohmann::json reading_to_json(const speed_reading& reading);
    static nlohmann::json report_to_json(const bandwidth_test::transfer_report& report);

private:
    std::ostream& m_out;
    bool m_json_output;
};
