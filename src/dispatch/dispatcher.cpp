/**
 * @file dispatcher.cpp
 * @brief Implementation of dispatcher
 */

#include <loadgen/dispatch/dispatcher.hpp>
#include <loadgen/integration/thread_pool_adapter.hpp>

#include <algorithm>
#include <chrono>
#include <exception>
#include <future>
#include <string>

namespace loadgen::dispatch {

using clock = std::chrono::steady_clock;

// =============================================================================
// Run State
// =============================================================================

/**
 * @brief Per-run data shared by the workers of one run
 *
 * Everything here is read-only during the run except next_ticket (atomic)
 * and the collector and gate, which synchronize internally.
 */
struct dispatcher::run_state {
    const std::vector<catalog::payload_descriptor>& payloads;
    const core::load_config& config;
    metrics::metrics_collector& collector;
    pacing_gate& gate;
    std::size_t total_sends;
    std::atomic<std::size_t> next_ticket{0};
};

// =============================================================================
// Construction
// =============================================================================

dispatcher::dispatcher(std::shared_ptr<client::protocol_client> client,
                       std::shared_ptr<integration::thread_pool_interface> pool,
                       std::shared_ptr<di::ILogger> logger)
    : client_(std::move(client)),
      pool_(std::move(pool)),
      logger_(logger ? std::move(logger) : di::null_logger()) {}

// =============================================================================
// Run
// =============================================================================

auto dispatcher::run(const std::vector<catalog::payload_descriptor>& payloads,
                     const core::load_config& config,
                     metrics::metrics_collector& collector) -> VoidResult {
    pacing_options options;
    options.rate = config.effective_rate();
    pacing_gate gate(options);
    return run(payloads, config, collector, gate);
}

auto dispatcher::run(const std::vector<catalog::payload_descriptor>& payloads,
                     const core::load_config& config,
                     metrics::metrics_collector& collector,
                     pacing_gate& gate) -> VoidResult {
    if (!client_) {
        return loadgen_void_error(error_codes::invalid_argument,
                                  "Dispatcher has no protocol client");
    }
    if (payloads.empty()) {
        return loadgen_void_error(error_codes::invalid_argument, "No payloads to dispatch");
    }
    if (config.concurrency == 0) {
        return loadgen_void_error(error_codes::invalid_argument,
                                  "Concurrency must be at least 1");
    }

    std::unique_lock<std::mutex> run_lock(run_mutex_, std::try_to_lock);
    if (!run_lock.owns_lock()) {
        return loadgen_void_error(error_codes::dispatch_failed,
                                  "Dispatcher is already running");
    }

    {
        std::lock_guard<std::mutex> lock(cancel_mutex_);
        if (cancelled_.load()) {
            logger_->info("Dispatch skipped: run already cancelled");
            return ok();
        }
        active_gate_ = &gate;
    }
    completed_.store(0);

    const auto total_sends = config.planned_sends();
    const auto worker_count = std::min(config.concurrency, total_sends);

    auto pool = pool_;
    if (!pool) {
        integration::thread_pool_config pool_config;
        pool_config.min_threads = std::max<std::size_t>(worker_count, 1);
        pool_config.max_threads = pool_config.min_threads;
        pool_config.pool_name = "loadgen_dispatch";
        pool = std::make_shared<integration::thread_pool_adapter>(pool_config);
    }

    const auto detach_gate = [this] {
        std::lock_guard<std::mutex> lock(cancel_mutex_);
        active_gate_ = nullptr;
    };

    if (worker_count > 0) {
        bool started = false;
        std::string reason = "start returned false";
        try {
            started = pool->start();
        } catch (const std::exception& e) {
            reason = e.what();
        }
        if (!started) {
            detach_gate();
            return loadgen_void_error(
                error_codes::pool_unavailable,
                loadgen::compat::format("Failed to start worker pool: {}", reason));
        }
    }

    logger_->info_fmt("Dispatching {} sends to {} with {} workers at {}/s",
                      total_sends, config.target.to_string(), worker_count,
                      config.effective_rate());

    run_state state{payloads, config, collector, gate, total_sends};
    std::vector<std::future<void>> workers;
    workers.reserve(worker_count);
    bool submit_failed = false;

    for (std::size_t i = 0; i < worker_count; ++i) {
        try {
            workers.push_back(pool->submit([this, &state] { worker_loop(state); }));
        } catch (const std::exception& e) {
            logger_->error_fmt("Failed to submit dispatch worker {}: {}", i, e.what());
            submit_failed = true;
            break;
        }
    }

    // Workers that did start must not wait for tickets nobody will serve
    if (submit_failed) {
        gate.close();
    }

    bool worker_failed = false;
    for (auto& worker : workers) {
        try {
            worker.get();
        } catch (const std::exception& e) {
            logger_->error_fmt("Dispatch worker terminated: {}", e.what());
            worker_failed = true;
        }
    }

    if (!pool_) {
        pool->shutdown(true);
    }
    detach_gate();

    logger_->info_fmt("Dispatch finished: {} of {} sends recorded{}",
                      completed_.load(), total_sends,
                      cancelled_.load() ? " (cancelled)" : "");

    if (submit_failed || worker_failed) {
        return loadgen_void_error(error_codes::dispatch_failed,
                                  "Not all dispatch workers ran to completion");
    }
    return ok();
}

// =============================================================================
// Workers
// =============================================================================

void dispatcher::worker_loop(run_state& state) {
    while (!cancelled_.load()) {
        const auto ticket = state.next_ticket.fetch_add(1);
        if (ticket >= state.total_sends) {
            break;
        }

        const auto admitted = state.gate.acquire();
        if (admitted != admission::admitted) {
            logger_->debug_fmt("Worker stopping at ticket {}: gate {}", ticket,
                               to_string(admitted));
            break;
        }

        const auto& payload = state.payloads[ticket % state.payloads.size()];
        const auto outcome = send_with_retry(payload, state);

        auto recorded = state.collector.record(outcome);
        if (recorded.is_err()) {
            logger_->error_fmt("Dropping outcome of {}: {}", payload.path.string(),
                               recorded.error().message);
            continue;
        }
        completed_.fetch_add(1);
    }
}

auto dispatcher::attempt(const catalog::payload_descriptor& payload,
                         const run_state& state) -> client::send_result {
    try {
        return client_->send(state.config.target, payload, state.config.timeout);
    } catch (const std::exception& e) {
        return client::send_result::failure(metrics::outcome_kind::network_error,
                                            std::string{"Client exception: "} + e.what());
    }
}

auto dispatcher::send_with_retry(const catalog::payload_descriptor& payload,
                                 const run_state& state) -> metrics::send_outcome {
    const auto& config = state.config;
    const auto started = clock::now();

    client::send_result result;
    std::uint32_t attempts = 0;

    while (true) {
        ++attempts;
        const auto attempt_start = clock::now();
        result = attempt(payload, state);
        const auto attempt_time = clock::now() - attempt_start;

        // A reply that arrives after the budget is a timeout; rejections stay terminal
        if (attempt_time > config.timeout &&
            (result.kind == metrics::outcome_kind::success ||
             result.kind == metrics::outcome_kind::network_error)) {
            result.kind = metrics::outcome_kind::timeout;
            result.detail = loadgen::compat::format(
                "No response within {} ms", config.timeout.count());
        }

        if (!metrics::is_retryable(result.kind) || attempts > config.retry_count ||
            cancelled_.load()) {
            break;
        }

        logger_->debug_fmt("Retrying {} after {} (attempt {} of {})",
                           payload.path.string(), metrics::to_string(result.kind),
                           attempts + 1, config.retry_count + 1);

        if (config.retry_delay.count() > 0) {
            std::unique_lock<std::mutex> lock(cancel_mutex_);
            if (cancel_cv_.wait_for(lock, config.retry_delay,
                                    [this] { return cancelled_.load(); })) {
                break;
            }
        }
    }

    const auto finished = clock::now();

    metrics::send_outcome outcome;
    outcome.run_id = state.collector.run_id();
    outcome.kind = result.kind;
    outcome.latency = std::chrono::duration_cast<std::chrono::microseconds>(finished - started);
    outcome.completed_at = finished;
    outcome.attempts = attempts;
    outcome.payload = payload.path;
    outcome.detail = std::move(result.detail);
    outcome.dimse_status = result.dimse_status;
    return outcome;
}

// =============================================================================
// Cancellation
// =============================================================================

void dispatcher::cancel() {
    {
        std::lock_guard<std::mutex> lock(cancel_mutex_);
        cancelled_.store(true);
        if (active_gate_ != nullptr) {
            active_gate_->close();
        }
    }
    cancel_cv_.notify_all();
}

auto dispatcher::is_cancelled() const noexcept -> bool {
    return cancelled_.load();
}

auto dispatcher::completed_sends() const noexcept -> std::size_t {
    return completed_.load();
}

}  // namespace loadgen::dispatch
