/**
 * @file load_driver.cpp
 * @brief Implementation of load_driver
 */

#include <loadgen/driver/load_driver.hpp>
#include <loadgen/dispatch/dispatcher.hpp>
#include <loadgen/dispatch/pacing_gate.hpp>
#include <loadgen/driver/config_loader.hpp>
#include <loadgen/integration/logger_adapter.hpp>
#include <loadgen/metrics/metrics_collector.hpp>

#include <chrono>
#include <condition_variable>
#include <exception>
#include <random>
#include <thread>

namespace loadgen::driver {

namespace {

using clock = std::chrono::steady_clock;

/**
 * @brief Logs a snapshot line at a fixed interval while a run is active
 */
class progress_reporter {
public:
    progress_reporter(const metrics::metrics_collector& collector,
                      std::chrono::seconds interval,
                      std::size_t planned_sends,
                      di::ILogger& logger)
        : collector_(collector),
          interval_(interval),
          planned_sends_(planned_sends),
          logger_(logger) {
        if (interval_.count() > 0) {
            running_ = true;
            thread_ = std::thread([this] { loop(); });
        }
    }

    ~progress_reporter() { stop(); }

    progress_reporter(const progress_reporter&) = delete;
    progress_reporter& operator=(const progress_reporter&) = delete;

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_ = false;
        }
        cv_.notify_all();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

private:
    void loop() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (running_) {
            if (cv_.wait_for(lock, interval_, [this] { return !running_; })) {
                break;
            }
            const auto snap = collector_.snapshot();
            logger_.info_fmt("Progress: {}/{} sent, {} ok, {} failed, {:.2f}/s, p95 {} ms",
                             snap.attempted, planned_sends_, snap.succeeded, snap.failed,
                             snap.throughput,
                             snap.p95_ms ? loadgen::compat::format("{:.1f}", *snap.p95_ms)
                                         : std::string{"n/a"});
        }
    }

    const metrics::metrics_collector& collector_;
    std::chrono::seconds interval_;
    std::size_t planned_sends_;
    di::ILogger& logger_;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool running_{false};
    std::thread thread_;
};

}  // namespace

// =============================================================================
// Construction
// =============================================================================

load_driver::load_driver(std::shared_ptr<client::protocol_client> client,
                         std::shared_ptr<integration::thread_pool_interface> pool,
                         std::shared_ptr<di::ILogger> logger)
    : client_(std::move(client)),
      pool_(std::move(pool)),
      logger_(logger ? std::move(logger) : di::null_logger()) {}

load_driver::~load_driver() = default;

// =============================================================================
// Execution
// =============================================================================

auto load_driver::execute(const core::load_config& config,
                          const catalog::dataset_catalog& catalog)
    -> Result<run_verdict> {
    auto started = begin();
    if (started.is_err()) {
        return Result<run_verdict>::err(started.error());
    }

    auto valid = config_loader::validate(config);
    if (valid.is_err()) {
        return fail(valid.error());
    }

    if (config.dataset_root.empty()) {
        return fail(error_info{error_codes::config_missing_key,
                               "Missing required configuration key: datasetRoot",
                               "loadgen", "datasetRoot"});
    }

    auto discovered = catalog.discover(config.dataset_root);
    if (discovered.is_err()) {
        return fail(discovered.error());
    }

    if (!config.sample_size) {
        return run(config, discovered.value());
    }

    auto sampled = catalog::dataset_catalog::sample(discovered.value(), *config.sample_size,
                                                    config.sample_seed);
    if (sampled.is_err()) {
        return fail(sampled.error());
    }
    logger_->info_fmt("Sampled {} of {} payloads (seed {})", sampled.value().size(),
                      discovered.value().size(), config.sample_seed);
    return run(config, sampled.value());
}

auto load_driver::execute(const core::load_config& config,
                          const std::vector<catalog::payload_descriptor>& payloads)
    -> Result<run_verdict> {
    auto started = begin();
    if (started.is_err()) {
        return Result<run_verdict>::err(started.error());
    }

    auto valid = config_loader::validate(config);
    if (valid.is_err()) {
        return fail(valid.error());
    }

    if (payloads.empty()) {
        return fail(error_info{error_codes::catalog_empty, "No payloads to send", "loadgen"});
    }

    return run(config, payloads);
}

auto load_driver::run(const core::load_config& config,
                      const std::vector<catalog::payload_descriptor>& payloads)
    -> Result<run_verdict> {
    if (!client_) {
        return fail(error_info{error_codes::invalid_argument,
                               "Load driver has no protocol client", "loadgen"});
    }

    const auto run_id = make_run_id();
    const auto target = config.target.to_string();
    const auto planned = config.planned_sends();

    if (config.verify_connectivity) {
        bool reachable = false;
        try {
            reachable = client_->echo(config.target);
        } catch (const std::exception& e) {
            logger_->warn_fmt("C-ECHO to {} threw: {}", target, e.what());
        }
        if (!reachable) {
            logger_->error_fmt("Target {} did not answer C-ECHO", target);
            integration::logger_adapter::log_target_unreachable(run_id, target);
            return fail(error_info{error_codes::target_unreachable,
                                   "Target did not answer C-ECHO: " + target, "loadgen"});
        }
    }

    metrics::metrics_collector collector(run_id);

    dispatch::pacing_options pacing;
    pacing.rate = config.effective_rate();
    if (config.duration_seconds) {
        pacing.deadline = clock::now() + std::chrono::duration_cast<clock::duration>(
                                             std::chrono::duration<double>(*config.duration_seconds));
    }
    dispatch::pacing_gate gate(pacing);

    auto runner = std::make_shared<dispatch::dispatcher>(client_, pool_, logger_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_ = runner;
        if (cancel_requested_) {
            runner->cancel();
        }
    }

    logger_->info_fmt("Run {} started: {} sends to {} at {}/s with {} workers", run_id,
                      planned, target, config.effective_rate(), config.concurrency);
    integration::logger_adapter::log_run_started(run_id, target, config.effective_rate(),
                                                 config.concurrency, planned);

    auto dispatched = [&]() -> VoidResult {
        try {
            progress_reporter progress(collector, config.progress_interval, planned, *logger_);
            return runner->run(payloads, config, collector, gate);
        } catch (const std::exception& e) {
            return loadgen_void_error(error_codes::dispatch_failed,
                                      loadgen::compat::format("Dispatch aborted: {}", e.what()));
        }
    }();

    bool cancelled = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_.reset();
        cancelled = runner->is_cancelled();
    }

    if (dispatched.is_err()) {
        return fail(dispatched.error());
    }

    run_verdict verdict;
    verdict.run_id = run_id;
    verdict.snapshot = collector.snapshot();
    verdict.violations = evaluate_thresholds(verdict.snapshot, config);
    verdict.passed = verdict.violations.empty();
    verdict.cancelled = cancelled;
    verdict.planned_sends = planned;
    verdict.effective_rate = config.effective_rate();

    for (const auto& v : verdict.violations) {
        logger_->warn_fmt("Threshold {} violated: observed {} limit {}", v.name, v.observed,
                          v.limit);
    }
    logger_->info_fmt("Run {} {}: {} attempted, {} succeeded, {} failed, {:.2f}/s",
                      run_id, verdict.passed ? "passed" : "failed",
                      verdict.snapshot.attempted, verdict.snapshot.succeeded,
                      verdict.snapshot.failed, verdict.snapshot.throughput);

    integration::run_audit_summary summary;
    summary.run_id = run_id;
    summary.target = target;
    summary.attempted = verdict.snapshot.attempted;
    summary.succeeded = verdict.snapshot.succeeded;
    summary.failed = verdict.snapshot.failed;
    summary.throughput = verdict.snapshot.throughput;
    summary.passed = verdict.passed;
    summary.cancelled = cancelled;
    summary.elapsed = verdict.snapshot.elapsed;
    integration::logger_adapter::log_run_completed(summary);

    state_.store(cancelled ? driver_state::cancelled : driver_state::completed);
    return Result<run_verdict>::ok(std::move(verdict));
}

// =============================================================================
// State
// =============================================================================

auto load_driver::begin() -> VoidResult {
    std::lock_guard<std::mutex> lock(mutex_);
    auto expected = driver_state::idle;
    if (!state_.compare_exchange_strong(expected, driver_state::running)) {
        return loadgen_void_error(
            error_codes::invalid_driver_state,
            loadgen::compat::format("Cannot execute from state {}", to_string(expected)));
    }
    cancel_requested_ = false;
    return ok();
}

auto load_driver::fail(const error_info& error) -> Result<run_verdict> {
    logger_->error_fmt("Run failed before dispatch: {}", error.message);
    state_.store(driver_state::failed);
    return Result<run_verdict>::err(error);
}

void load_driver::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.load() != driver_state::running) {
        return;
    }
    cancel_requested_ = true;
    if (active_) {
        active_->cancel();
    }
    logger_->info("Run cancellation requested");
}

auto load_driver::reset() -> VoidResult {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.load() == driver_state::running) {
        return loadgen_void_error(error_codes::invalid_driver_state,
                                  "Cannot reset a running driver");
    }
    state_.store(driver_state::idle);
    cancel_requested_ = false;
    return ok();
}

auto load_driver::state() const noexcept -> driver_state {
    return state_.load();
}

auto load_driver::make_run_id() -> std::string {
    static std::mt19937_64 gen{std::random_device{}()};
    static std::mutex gen_mutex;

    const auto timestamp = std::chrono::duration_cast<std::chrono::milliseconds>(
                               std::chrono::system_clock::now().time_since_epoch())
                               .count();
    std::uint64_t suffix = 0;
    {
        std::lock_guard<std::mutex> lock(gen_mutex);
        suffix = gen() % 100000;
    }
    return loadgen::compat::format("run-{}-{:05}", timestamp, suffix);
}

}  // namespace loadgen::driver
