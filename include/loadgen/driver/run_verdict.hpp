/**
 * @file run_verdict.hpp
 * @brief Pass/fail decision of a load run
 *
 * A run_verdict is the externally observable result of load_driver::execute.
 * Consumers (report generators, CI gates) read it; nothing mutates it after
 * the driver returns it.
 */

#pragma once

#include <loadgen/core/load_config.hpp>
#include <loadgen/metrics/metrics_snapshot.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace loadgen::driver {

/**
 * @brief Names of the thresholds a run can violate
 */
namespace thresholds {
    inline constexpr const char* error_rate = "errorRate";
    inline constexpr const char* p95_latency = "p95Latency";
    inline constexpr const char* throughput = "throughput";
    inline constexpr const char* attempted = "attempted";
}  // namespace thresholds

/**
 * @brief One violated threshold
 */
struct threshold_violation {
    /// One of the names in driver::thresholds
    std::string name;

    /// Configured bound
    double limit{0.0};

    /// Value observed in the final snapshot
    double observed{0.0};
};

/**
 * @brief Final result of a run
 */
struct run_verdict {
    std::string run_id;

    /// true when violations is empty
    bool passed{false};

    /// true when the run was stopped by load_driver::cancel()
    bool cancelled{false};

    /// Final snapshot the verdict was evaluated on
    metrics::metrics_snapshot snapshot;

    /// Violated thresholds, in evaluation order
    std::vector<threshold_violation> violations;

    /// Sends the configuration asked for
    std::size_t planned_sends{0};

    /// Submission rate the run was paced at
    double effective_rate{0.0};

    [[nodiscard]] auto violated(const std::string& name) const -> bool {
        for (const auto& v : violations) {
            if (v.name == name) {
                return true;
            }
        }
        return false;
    }
};

/**
 * @brief Compare a snapshot against the thresholds of a configuration
 *
 * Checks, in order:
 * - attempted: no send was recorded
 * - errorRate: error_rate > max_error_rate
 * - p95Latency: p95 > max_p95_latency_ms (skipped when percentiles are
 *   undefined)
 * - throughput: throughput < min_throughput_ratio * effective_rate (only
 *   when min_throughput_ratio is set)
 */
[[nodiscard]] auto evaluate_thresholds(const metrics::metrics_snapshot& snapshot,
                                       const core::load_config& config)
    -> std::vector<threshold_violation>;

/**
 * @brief Convert run_verdict to JSON string
 */
[[nodiscard]] auto to_json(const run_verdict& verdict) -> std::string;

}  // namespace loadgen::driver
