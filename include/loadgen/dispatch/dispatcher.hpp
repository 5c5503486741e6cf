/**
 * @file dispatcher.hpp
 * @brief Concurrent C-STORE dispatcher with pacing, timeouts and retries
 *
 * The dispatcher runs `concurrency` worker tasks on a thread pool. Each
 * worker repeatedly claims a send ticket, waits for the pacing gate, sends
 * the ticket's payload through the protocol_client (retrying transient
 * failures) and records exactly one send_outcome in the collector.
 *
 * @example
 * @code
 * auto client = std::make_shared<client::dcmtk_protocol_client>();
 * dispatch::dispatcher dispatcher(client);
 *
 * metrics::metrics_collector collector("run-1");
 * auto result = dispatcher.run(payloads, config, collector);
 * auto snap = collector.snapshot();
 * @endcode
 */

#pragma once

#include <loadgen/catalog/payload_descriptor.hpp>
#include <loadgen/client/protocol_client.hpp>
#include <loadgen/core/load_config.hpp>
#include <loadgen/core/result.hpp>
#include <loadgen/di/ilogger.hpp>
#include <loadgen/dispatch/pacing_gate.hpp>
#include <loadgen/integration/thread_pool_interface.hpp>
#include <loadgen/metrics/metrics_collector.hpp>

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

namespace loadgen::dispatch {

/**
 * @brief Runs the sends of one load run across a worker pool
 *
 * Cancellation is cooperative and sticky: after cancel() the current run
 * drains (in-flight sends complete and are recorded, no new ones start) and
 * later calls to run() return immediately. Use a new dispatcher per run.
 *
 * Thread Safety: cancel(), is_cancelled() and completed_sends() may be
 * called from any thread while run() is executing.
 */
class dispatcher {
public:
    /**
     * @brief Construct a dispatcher
     *
     * @param client Protocol client used by all workers
     * @param pool Worker pool; when null, a thread_pool_adapter sized to
     *             the run's concurrency is created for each run
     * @param logger Logger; defaults to a null logger
     */
    explicit dispatcher(std::shared_ptr<client::protocol_client> client,
                        std::shared_ptr<integration::thread_pool_interface> pool = nullptr,
                        std::shared_ptr<di::ILogger> logger = nullptr);

    ~dispatcher() = default;

    dispatcher(const dispatcher&) = delete;
    dispatcher& operator=(const dispatcher&) = delete;

    /**
     * @brief Send config.planned_sends() payloads, paced at config.effective_rate()
     *
     * Blocks until all sends are recorded or the run is cancelled.
     *
     * @return invalid_argument for an unusable setup, dispatch_failed if the
     *         worker pool could not run the workers; per-send failures are
     *         recorded in the collector and never fail the call
     */
    [[nodiscard]] auto run(const std::vector<catalog::payload_descriptor>& payloads,
                           const core::load_config& config,
                           metrics::metrics_collector& collector) -> VoidResult;

    /**
     * @brief Same as run() but admits sends through a caller-owned gate
     *
     * The driver uses this overload to give the gate a run deadline.
     */
    [[nodiscard]] auto run(const std::vector<catalog::payload_descriptor>& payloads,
                           const core::load_config& config,
                           metrics::metrics_collector& collector,
                           pacing_gate& gate) -> VoidResult;

    /**
     * @brief Signal cancellation to the running (and any later) run
     */
    void cancel();

    [[nodiscard]] auto is_cancelled() const noexcept -> bool;

    /// Sends recorded by the current or last run
    [[nodiscard]] auto completed_sends() const noexcept -> std::size_t;

private:
    struct run_state;

    void worker_loop(run_state& state);

    [[nodiscard]] auto send_with_retry(const catalog::payload_descriptor& payload,
                                       const run_state& state) -> metrics::send_outcome;

    [[nodiscard]] auto attempt(const catalog::payload_descriptor& payload,
                               const run_state& state) -> client::send_result;

    std::shared_ptr<client::protocol_client> client_;
    std::shared_ptr<integration::thread_pool_interface> pool_;
    std::shared_ptr<di::ILogger> logger_;

    std::mutex run_mutex_;
    std::mutex cancel_mutex_;
    std::condition_variable cancel_cv_;
    pacing_gate* active_gate_{nullptr};
    std::atomic<bool> cancelled_{false};
    std::atomic<std::size_t> completed_{0};
};

}  // namespace loadgen::dispatch
