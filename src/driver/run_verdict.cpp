/**
 * @file run_verdict.cpp
 * @brief Threshold evaluation and JSON rendering of run verdicts
 */

#include <loadgen/driver/run_verdict.hpp>
#include <loadgen/metrics/metrics_json.hpp>

#include <sstream>

namespace loadgen::driver {

auto evaluate_thresholds(const metrics::metrics_snapshot& snapshot,
                         const core::load_config& config)
    -> std::vector<threshold_violation> {
    std::vector<threshold_violation> violations;

    if (snapshot.attempted == 0) {
        violations.push_back({thresholds::attempted, 1.0, 0.0});
    }

    if (snapshot.error_rate && *snapshot.error_rate > config.max_error_rate) {
        violations.push_back(
            {thresholds::error_rate, config.max_error_rate, *snapshot.error_rate});
    }

    if (snapshot.percentiles_defined && snapshot.p95_ms &&
        *snapshot.p95_ms > config.max_p95_latency_ms) {
        violations.push_back(
            {thresholds::p95_latency, config.max_p95_latency_ms, *snapshot.p95_ms});
    }

    if (config.min_throughput_ratio) {
        const double floor = *config.min_throughput_ratio * config.effective_rate();
        if (snapshot.throughput < floor) {
            violations.push_back({thresholds::throughput, floor, snapshot.throughput});
        }
    }

    return violations;
}

auto to_json(const run_verdict& verdict) -> std::string {
    using metrics::escape_json_string;
    using metrics::json_number;

    std::ostringstream oss;
    oss << "{"
        << R"("run_id":")" << escape_json_string(verdict.run_id) << "\""
        << R"(,"passed":)" << (verdict.passed ? "true" : "false")
        << R"(,"cancelled":)" << (verdict.cancelled ? "true" : "false")
        << R"(,"planned_sends":)" << verdict.planned_sends
        << R"(,"effective_rate":)" << json_number(verdict.effective_rate)
        << R"(,"violations":[)";

    bool first = true;
    for (const auto& v : verdict.violations) {
        if (!first) {
            oss << ",";
        }
        first = false;
        oss << R"({"name":")" << escape_json_string(v.name) << "\""
            << R"(,"limit":)" << json_number(v.limit)
            << R"(,"observed":)" << json_number(v.observed) << "}";
    }

    oss << "]"
        << R"(,"snapshot":)" << metrics::to_json(verdict.snapshot)
        << "}";
    return oss.str();
}

}  // namespace loadgen::driver
