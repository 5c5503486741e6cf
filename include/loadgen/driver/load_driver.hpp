/**
 * @file load_driver.hpp
 * @brief Orchestrates one load run from configuration to verdict
 *
 * The driver validates the configuration, selects payloads from the dataset
 * catalog, checks that the target answers C-ECHO, paces the dispatcher at
 * the effective rate for a fixed duration or count, and evaluates the final
 * metrics snapshot against the configured thresholds.
 *
 * @example
 * @code
 * auto client = std::make_shared<client::dcmtk_protocol_client>();
 * driver::load_driver driver(client);
 *
 * catalog::dataset_catalog catalog;
 * auto verdict = driver.execute(config, catalog);
 * if (verdict.is_ok() && !verdict.value().passed) {
 *     for (const auto& v : verdict.value().violations) {
 *         std::cout << v.name << " limit=" << v.limit << "\n";
 *     }
 * }
 * @endcode
 */

#pragma once

#include <loadgen/catalog/dataset_catalog.hpp>
#include <loadgen/catalog/payload_descriptor.hpp>
#include <loadgen/client/protocol_client.hpp>
#include <loadgen/core/load_config.hpp>
#include <loadgen/core/result.hpp>
#include <loadgen/di/ilogger.hpp>
#include <loadgen/driver/run_verdict.hpp>
#include <loadgen/integration/thread_pool_interface.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace loadgen::dispatch {
class dispatcher;
}  // namespace loadgen::dispatch

namespace loadgen::driver {

/**
 * @brief Lifecycle of a load_driver
 *
 * idle -> running -> completed | cancelled | failed
 */
enum class driver_state {
    idle,
    running,
    completed,
    cancelled,
    failed
};

[[nodiscard]] constexpr auto to_string(driver_state state) noexcept -> std::string_view {
    switch (state) {
        case driver_state::idle:
            return "idle";
        case driver_state::running:
            return "running";
        case driver_state::completed:
            return "completed";
        case driver_state::cancelled:
            return "cancelled";
        case driver_state::failed:
            return "failed";
    }
    return "unknown";
}

/**
 * @brief Top-level orchestrator of a load run
 *
 * A driver runs one execution at a time. After the run finishes (in any
 * terminal state) reset() makes it usable again.
 *
 * The driver fails only for problems found before the first send:
 * configuration errors, an empty or missing catalog, an unreachable target
 * or a worker pool that cannot start. Failed sends are metrics and only
 * affect the verdict.
 *
 * Thread Safety: cancel() and state() may be called from any thread.
 */
class load_driver {
public:
    /**
     * @brief Construct a driver
     *
     * @param client Protocol client used for the pre-check and all sends
     * @param pool Worker pool passed to the dispatcher; when null the
     *             dispatcher creates one per run
     * @param logger Logger; defaults to a null logger
     */
    explicit load_driver(std::shared_ptr<client::protocol_client> client,
                         std::shared_ptr<integration::thread_pool_interface> pool = nullptr,
                         std::shared_ptr<di::ILogger> logger = nullptr);

    ~load_driver();

    load_driver(const load_driver&) = delete;
    load_driver& operator=(const load_driver&) = delete;

    /**
     * @brief Run a load test against payloads discovered under config.dataset_root
     *
     * When config.sample_size is set, that many payloads are sampled from the
     * discovered set with config.sample_seed.
     *
     * @return The verdict, or a config, catalog, insufficient_data,
     *         target_unreachable or dispatch error; the driver is then failed
     */
    [[nodiscard]] auto execute(const core::load_config& config,
                               const catalog::dataset_catalog& catalog)
        -> Result<run_verdict>;

    /**
     * @brief Run a load test over an already selected payload set
     */
    [[nodiscard]] auto execute(const core::load_config& config,
                               const std::vector<catalog::payload_descriptor>& payloads)
        -> Result<run_verdict>;

    /**
     * @brief Stop a running execution
     *
     * In-flight sends complete and are recorded; the verdict is evaluated on
     * what was recorded and carries cancelled = true. No effect unless the
     * driver is running.
     */
    void cancel();

    /**
     * @brief Return a finished driver to idle
     *
     * @return invalid_driver_state while running
     */
    [[nodiscard]] auto reset() -> VoidResult;

    [[nodiscard]] auto state() const noexcept -> driver_state;

private:
    [[nodiscard]] auto begin() -> VoidResult;

    [[nodiscard]] auto fail(const error_info& error) -> Result<run_verdict>;

    [[nodiscard]] auto run(const core::load_config& config,
                           const std::vector<catalog::payload_descriptor>& payloads)
        -> Result<run_verdict>;

    [[nodiscard]] static auto make_run_id() -> std::string;

    std::shared_ptr<client::protocol_client> client_;
    std::shared_ptr<integration::thread_pool_interface> pool_;
    std::shared_ptr<di::ILogger> logger_;

    std::atomic<driver_state> state_{driver_state::idle};

    std::mutex mutex_;
    std::shared_ptr<dispatch::dispatcher> active_;
    bool cancel_requested_{false};
};

}  // namespace loadgen::driver
