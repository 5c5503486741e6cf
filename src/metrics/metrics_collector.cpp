/**
 * @file metrics_collector.cpp
 * @brief Implementation of metrics_collector
 */

#include <loadgen/metrics/metrics_collector.hpp>

#include <algorithm>
#include <cmath>
#include <numeric>

namespace loadgen::metrics {

namespace {

constexpr std::chrono::microseconds kMinElapsed{1000};

[[nodiscard]] auto to_seconds(std::chrono::microseconds d) -> double {
    return std::chrono::duration<double>(d).count();
}

}  // namespace

metrics_collector::metrics_collector(std::string run_id, collector_options options)
    : run_id_(std::move(run_id)), options_(options) {}

// =============================================================================
// Recording
// =============================================================================

auto metrics_collector::record(const send_outcome& outcome) -> VoidResult {
    if (outcome.run_id != run_id_) {
        return loadgen_void_error(
            error_codes::run_id_mismatch,
            "Outcome of run '" + outcome.run_id + "' offered to collector of run '" +
                run_id_ + "'");
    }

    const auto completed_at = outcome.completed_at == clock::time_point{}
                                  ? clock::now()
                                  : outcome.completed_at;

    std::lock_guard<std::mutex> lock(mutex_);
    samples_.push_back({outcome.kind, outcome.latency, completed_at, outcome.attempts});
    if (!first_recorded_at_ || completed_at < *first_recorded_at_) {
        first_recorded_at_ = completed_at;
    }
    return ok();
}

auto metrics_collector::recorded_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return samples_.size();
}

// =============================================================================
// Aggregation
// =============================================================================

auto metrics_collector::percentile(const std::vector<double>& sorted, double p)
    -> std::optional<double> {
    if (sorted.empty()) {
        return std::nullopt;
    }

    const auto n = static_cast<double>(sorted.size());
    // Small epsilon keeps exact products such as 0.95 * 20 on rank 19
    const auto rank = static_cast<long long>(std::ceil(p * n - 1e-9)) - 1;
    const auto index = std::clamp<long long>(
        rank, 0, static_cast<long long>(sorted.size()) - 1);
    return sorted[static_cast<std::size_t>(index)];
}

auto metrics_collector::snapshot() const -> metrics_snapshot {
    return snapshot_at(clock::now());
}

auto metrics_collector::snapshot_at(clock::time_point now) const -> metrics_snapshot {
    std::vector<sample> samples;
    std::optional<clock::time_point> first;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        samples = samples_;
        first = first_recorded_at_;
    }

    metrics_snapshot snap;
    snap.run_id = run_id_;
    snap.window = options_.throughput_window;
    snap.attempted = samples.size();

    std::vector<double> latencies;
    latencies.reserve(samples.size());

    for (const auto& s : samples) {
        if (s.attempts > 1) {
            ++snap.retried;
        }
        switch (s.kind) {
            case outcome_kind::success:
                ++snap.succeeded;
                latencies.push_back(std::chrono::duration<double, std::milli>(s.latency).count());
                break;
            case outcome_kind::network_error:
                ++snap.failed;
                ++snap.network_errors;
                break;
            case outcome_kind::timeout:
                ++snap.failed;
                ++snap.timeouts;
                break;
            case outcome_kind::protocol_rejected:
                ++snap.failed;
                ++snap.protocol_rejections;
                break;
        }
    }

    if (snap.attempted > 0) {
        snap.error_rate = static_cast<double>(snap.failed) / static_cast<double>(snap.attempted);
    }

    if (!latencies.empty()) {
        std::sort(latencies.begin(), latencies.end());
        snap.percentiles_defined = true;
        snap.p50_ms = percentile(latencies, 0.50);
        snap.p95_ms = percentile(latencies, 0.95);
        snap.p99_ms = percentile(latencies, 0.99);
        snap.min_ms = latencies.front();
        snap.max_ms = latencies.back();
        snap.mean_ms = std::accumulate(latencies.begin(), latencies.end(), 0.0) /
                       static_cast<double>(latencies.size());
    }

    if (first) {
        const auto elapsed = std::max(
            kMinElapsed,
            std::chrono::duration_cast<std::chrono::microseconds>(now - *first));
        snap.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed);
        snap.throughput = static_cast<double>(snap.succeeded) / to_seconds(elapsed);

        const auto window = std::max(
            kMinElapsed,
            std::min(elapsed, std::chrono::duration_cast<std::chrono::microseconds>(
                                  options_.throughput_window)));
        const auto window_start = now - window;
        const auto in_window = std::count_if(
            samples.begin(), samples.end(), [&](const sample& s) {
                return s.kind == outcome_kind::success && s.completed_at >= window_start &&
                       s.completed_at <= now;
            });
        snap.window_throughput = static_cast<double>(in_window) / to_seconds(window);
    }

    return snap;
}

}  // namespace loadgen::metrics
