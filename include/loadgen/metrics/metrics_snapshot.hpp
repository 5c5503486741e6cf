/**
 * @file metrics_snapshot.hpp
 * @brief Point-in-time aggregate of a run's send outcomes
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace loadgen::metrics {

/**
 * @brief Aggregate statistics computed by metrics_collector::snapshot
 *
 * A snapshot is a value: it is recomputed from the recorded outcomes on
 * every call and is never updated in place.
 *
 * Latency statistics cover successful sends only. With zero successes
 * percentiles_defined is false and all latency fields are empty.
 */
struct metrics_snapshot {
    /// Run the snapshot was computed for
    std::string run_id;

    /// Logical sends recorded
    std::size_t attempted{0};

    /// Sends that ended in success
    std::size_t succeeded{0};

    /// Sends that ended in any failure kind
    std::size_t failed{0};

    /// @name Failure breakdown
    /// @{
    std::size_t network_errors{0};
    std::size_t timeouts{0};
    std::size_t protocol_rejections{0};
    /// @}

    /// Sends that needed more than one attempt
    std::size_t retried{0};

    /// failed / attempted; empty when attempted == 0
    std::optional<double> error_rate;

    /// false when there are no successful samples
    bool percentiles_defined{false};

    /// @name Latency in milliseconds
    /// @{
    std::optional<double> p50_ms;
    std::optional<double> p95_ms;
    std::optional<double> p99_ms;
    std::optional<double> mean_ms;
    std::optional<double> min_ms;
    std::optional<double> max_ms;
    /// @}

    /// Successes per second since the first recorded outcome
    double throughput{0.0};

    /// Successes per second over the trailing window
    double window_throughput{0.0};

    /// Trailing window used for window_throughput
    std::chrono::milliseconds window{0};

    /// Time from the first recorded outcome to the snapshot
    std::chrono::milliseconds elapsed{0};

    [[nodiscard]] auto is_consistent() const noexcept -> bool {
        return attempted == succeeded + failed &&
               failed == network_errors + timeouts + protocol_rejections;
    }
};

}  // namespace loadgen::metrics
