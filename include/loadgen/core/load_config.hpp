/**
 * @file load_config.hpp
 * @brief Parameters of one load run
 *
 * A load_config is built once (usually by driver::config_loader), validated,
 * and then only read for the duration of the run.
 */

#pragma once

#include <loadgen/client/protocol_client.hpp>

#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace loadgen::core {

/**
 * @brief Run parameters for the load driver and the dispatcher
 */
struct load_config {
    // =========================================================================
    // Target
    // =========================================================================

    /// Server under test (targetHost, targetPort, targetIdentity, localIdentity)
    client::target_endpoint target;

    // =========================================================================
    // Load Shape
    // =========================================================================

    /// Baseline submission rate in sends per second (targetRate)
    double target_rate{0.0};

    /// Factor applied to target_rate (loadMultiplier)
    double load_multiplier{1.0};

    /// Number of parallel workers (concurrency)
    std::size_t concurrency{1};

    /// Run length in seconds (durationSeconds); exclusive with total_count
    std::optional<double> duration_seconds;

    /// Number of sends (totalCount); exclusive with duration_seconds
    std::optional<std::size_t> total_count;

    /// Per-attempt timeout (timeoutMs)
    std::chrono::milliseconds timeout{30000};

    /// Additional attempts for transient failures (retryCount)
    std::uint32_t retry_count{0};

    /// Pause between attempts of one send (retryDelayMs)
    std::chrono::milliseconds retry_delay{0};

    // =========================================================================
    // Thresholds
    // =========================================================================

    /// Highest acceptable failed/attempted ratio (maxErrorRate)
    double max_error_rate{0.0};

    /// Highest acceptable p95 latency in milliseconds (maxP95LatencyMs)
    double max_p95_latency_ms{0.0};

    /// Lowest acceptable throughput as a fraction of the effective rate
    /// (minThroughputRatio)
    std::optional<double> min_throughput_ratio;

    // =========================================================================
    // Payloads
    // =========================================================================

    /// Directory scanned by the dataset catalog (datasetRoot)
    std::string dataset_root;

    /// Number of payloads sampled from the catalog (sampleSize); all when empty
    std::optional<std::size_t> sample_size;

    /// Seed for payload sampling (sampleSeed)
    std::uint64_t sample_seed{0};

    // =========================================================================
    // Run Control
    // =========================================================================

    /// C-ECHO the target before sending (verifyConnectivity)
    bool verify_connectivity{true};

    /// Interval of progress log lines; zero disables them (progressIntervalSeconds)
    std::chrono::seconds progress_interval{5};

    /**
     * @brief Submission rate actually applied by the pacing gate
     */
    [[nodiscard]] auto effective_rate() const noexcept -> double {
        return target_rate * load_multiplier;
    }

    /**
     * @brief Number of sends the run is expected to submit
     *
     * total_count when set, otherwise round(effective_rate * duration).
     */
    [[nodiscard]] auto planned_sends() const noexcept -> std::size_t {
        if (total_count) {
            return *total_count;
        }
        if (duration_seconds) {
            const auto planned = std::llround(effective_rate() * *duration_seconds);
            return planned > 0 ? static_cast<std::size_t>(planned) : 0;
        }
        return 0;
    }
};

}  // namespace loadgen::core
