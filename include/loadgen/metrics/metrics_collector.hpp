/**
 * @file metrics_collector.hpp
 * @brief Thread-safe sink for send outcomes of one load run
 *
 * Dispatcher workers call record() concurrently; the driver (or a progress
 * reporter) calls snapshot() at any time, including while sends are still
 * being recorded.
 *
 * Thread Safety:
 * - record() holds the lock only for an append
 * - snapshot() holds the lock only to copy the compact sample store; sorting
 *   and aggregation run outside it
 */

#pragma once

#include <loadgen/core/result.hpp>
#include <loadgen/metrics/metrics_snapshot.hpp>
#include <loadgen/metrics/send_outcome.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace loadgen::metrics {

/**
 * @brief Options for metrics_collector
 */
struct collector_options {
    /// Trailing window for metrics_snapshot::window_throughput
    std::chrono::milliseconds throughput_window{std::chrono::seconds{10}};
};

/**
 * @brief Collects send outcomes for exactly one run
 */
class metrics_collector {
public:
    using clock = std::chrono::steady_clock;

    explicit metrics_collector(std::string run_id, collector_options options = {});

    metrics_collector(const metrics_collector&) = delete;
    metrics_collector& operator=(const metrics_collector&) = delete;

    /**
     * @brief Record the terminal outcome of one logical send
     *
     * @return run_id_mismatch if the outcome belongs to another run
     */
    [[nodiscard]] auto record(const send_outcome& outcome) -> VoidResult;

    /**
     * @brief Aggregate all outcomes recorded so far, as of now
     */
    [[nodiscard]] auto snapshot() const -> metrics_snapshot;

    /**
     * @brief Aggregate all outcomes recorded so far, as of the given time
     */
    [[nodiscard]] auto snapshot_at(clock::time_point now) const -> metrics_snapshot;

    [[nodiscard]] auto run_id() const noexcept -> const std::string& { return run_id_; }

    [[nodiscard]] auto recorded_count() const -> std::size_t;

    /**
     * @brief Nearest-rank percentile of an ascending sample set
     *
     * Returns the value at rank ceil(p * n) - 1 clamped to [0, n - 1], or
     * std::nullopt for an empty set.
     */
    [[nodiscard]] static auto percentile(const std::vector<double>& sorted, double p)
        -> std::optional<double>;

private:
    struct sample {
        outcome_kind kind;
        std::chrono::microseconds latency;
        clock::time_point completed_at;
        std::uint32_t attempts;
    };

    std::string run_id_;
    collector_options options_;

    mutable std::mutex mutex_;
    std::vector<sample> samples_;
    std::optional<clock::time_point> first_recorded_at_;
};

}  // namespace loadgen::metrics
