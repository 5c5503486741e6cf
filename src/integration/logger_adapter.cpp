/**
 * @file logger_adapter.cpp
 * @brief Implementation of the load-run logging adapter
 */

#include <loadgen/integration/logger_adapter.hpp>

#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/interfaces/logger_types.h>
#include <kcenon/logger/writers/console_writer.h>
#include <kcenon/logger/writers/rotating_file_writer.h>

#include <atomic>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <system_error>

namespace loadgen::integration {

namespace {

[[nodiscard]] auto format_rate(double value) -> std::string {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << value;
    return oss.str();
}

}  // namespace

// =============================================================================
// Implementation Class
// =============================================================================

class logger_adapter::impl {
public:
    impl() = default;
    ~impl() { shutdown(); }

    void initialize(const logger_config& config) {
        std::lock_guard lock(mutex_);

        if (initialized_) {
            return;
        }

        config_ = config;
        min_level_.store(config.min_level);

        if (config.enable_file || config.enable_audit_log) {
            std::error_code ec;
            std::filesystem::create_directories(config.log_directory, ec);
            if (ec) {
                // Fall back to console-only output
                config_.enable_file = false;
                config_.enable_audit_log = false;
            }
        }

        logger_ = std::make_unique<kcenon::logger::logger>(
            config_.async_mode, config_.buffer_size);
        logger_->set_min_level(convert_log_level(config_.min_level));

        if (config_.enable_console) {
            logger_->add_writer(std::make_unique<kcenon::logger::console_writer>());
        }

        if (config_.enable_file) {
            auto log_path = config_.log_directory / "loadgen.log";
            logger_->add_writer(std::make_unique<kcenon::logger::rotating_file_writer>(
                log_path.string(),
                config_.max_file_size_mb * 1024 * 1024,
                config_.max_files));
        }

        logger_->start();

        if (config_.enable_audit_log) {
            audit_log_path_ = config_.log_directory / "audit.json";
        }

        initialized_ = true;
    }

    void shutdown() {
        std::lock_guard lock(mutex_);

        if (!initialized_) {
            return;
        }

        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }

        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const noexcept -> bool {
        return initialized_.load();
    }

    void log(log_level level, const std::string& message) {
        std::lock_guard lock(mutex_);
        if (!initialized_ || !logger_ || !is_level_enabled(level)) {
            return;
        }
        logger_->log(convert_log_level(level), message);
    }

    [[nodiscard]] auto is_level_enabled(log_level level) const noexcept -> bool {
        return level != log_level::off &&
               static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void flush() {
        std::lock_guard lock(mutex_);
        if (logger_) {
            logger_->flush();
        }
    }

    void set_min_level(log_level level) {
        min_level_.store(level);
        std::lock_guard lock(mutex_);
        if (logger_) {
            logger_->set_min_level(convert_log_level(level));
        }
    }

    [[nodiscard]] auto get_min_level() const noexcept -> log_level {
        return min_level_.load();
    }

    [[nodiscard]] auto get_config() const -> const logger_config& { return config_; }

    void write_audit_log(const std::string& event_type,
                         const std::string& outcome,
                         const std::map<std::string, std::string>& fields) {
        if (!initialized_ || !config_.enable_audit_log) {
            return;
        }

        std::lock_guard lock(audit_mutex_);

        std::ofstream file(audit_log_path_, std::ios::app);
        if (!file) {
            return;
        }

        std::ostringstream json;
        json << "{";
        json << "\"timestamp\":\"" << format_iso8601() << "\",";
        json << "\"event_type\":\"" << escape_json(event_type) << "\",";
        json << "\"outcome\":\"" << escape_json(outcome) << "\"";

        for (const auto& [key, value] : fields) {
            json << ",\"" << escape_json(key) << "\":\"" << escape_json(value) << "\"";
        }

        json << "}\n";

        file << json.str();
        file.flush();
    }

private:
    [[nodiscard]] static auto convert_log_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace:
                return kcenon::logger::log_level::trace;
            case log_level::debug:
                return kcenon::logger::log_level::debug;
            case log_level::info:
                return kcenon::logger::log_level::info;
            case log_level::warn:
                return kcenon::logger::log_level::warn;
            case log_level::error:
                return kcenon::logger::log_level::error;
            case log_level::fatal:
                return kcenon::logger::log_level::fatal;
            case log_level::off:
            default:
                return kcenon::logger::log_level::off;
        }
    }

    [[nodiscard]] static auto format_iso8601() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) %
                  1000;

        std::tm tm_val{};
#ifdef _WIN32
        gmtime_s(&tm_val, &time_t_val);
#else
        gmtime_r(&time_t_val, &tm_val);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S");
        oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
        return oss.str();
    }

    [[nodiscard]] static auto escape_json(const std::string& str) -> std::string {
        std::ostringstream oss;
        for (char c : str) {
            switch (c) {
                case '"':
                    oss << "\\\"";
                    break;
                case '\\':
                    oss << "\\\\";
                    break;
                case '\n':
                    oss << "\\n";
                    break;
                case '\r':
                    oss << "\\r";
                    break;
                case '\t':
                    oss << "\\t";
                    break;
                default:
                    if (static_cast<unsigned char>(c) < 32) {
                        oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                            << static_cast<int>(c) << std::dec;
                    } else {
                        oss << c;
                    }
                    break;
            }
        }
        return oss.str();
    }

    mutable std::mutex mutex_;
    mutable std::mutex audit_mutex_;
    std::atomic<bool> initialized_{false};
    std::atomic<log_level> min_level_{log_level::info};
    logger_config config_;
    std::unique_ptr<kcenon::logger::logger> logger_;
    std::filesystem::path audit_log_path_;
};

// =============================================================================
// Static Member Initialization
// =============================================================================

std::unique_ptr<logger_adapter::impl> logger_adapter::pimpl_ =
    std::make_unique<logger_adapter::impl>();

// =============================================================================
// Initialization
// =============================================================================

void logger_adapter::initialize(const logger_config& config) {
    pimpl_->initialize(config);
}

void logger_adapter::shutdown() { pimpl_->shutdown(); }

auto logger_adapter::is_initialized() noexcept -> bool {
    return pimpl_->is_initialized();
}

// =============================================================================
// Standard Logging
// =============================================================================

void logger_adapter::log(log_level level, const std::string& message) {
    pimpl_->log(level, message);
}

auto logger_adapter::is_level_enabled(log_level level) noexcept -> bool {
    return pimpl_->is_level_enabled(level);
}

void logger_adapter::flush() { pimpl_->flush(); }

// =============================================================================
// Run Audit Logging
// =============================================================================

void logger_adapter::log_run_started(const std::string& run_id,
                                     const std::string& target,
                                     double target_rate,
                                     std::size_t concurrency,
                                     std::size_t planned_sends) {
    info("Load run {} started: target={} rate={}/s concurrency={} planned={}",
         run_id, target, format_rate(target_rate), concurrency, planned_sends);

    write_audit_log("RUN_STARTED", "success",
                    {{"run_id", run_id},
                     {"target", target},
                     {"target_rate", format_rate(target_rate)},
                     {"concurrency", std::to_string(concurrency)},
                     {"planned_sends", std::to_string(planned_sends)}});
}

void logger_adapter::log_run_completed(const run_audit_summary& summary) {
    const char* outcome = summary.cancelled ? "cancelled"
                          : summary.passed  ? "passed"
                                            : "failed";

    if (summary.passed) {
        info("Load run {} {}: attempted={} succeeded={} failed={} throughput={}/s",
             summary.run_id, outcome, summary.attempted, summary.succeeded,
             summary.failed, format_rate(summary.throughput));
    } else {
        warn("Load run {} {}: attempted={} succeeded={} failed={} throughput={}/s",
             summary.run_id, outcome, summary.attempted, summary.succeeded,
             summary.failed, format_rate(summary.throughput));
    }

    write_audit_log("RUN_COMPLETED", outcome,
                    {{"run_id", summary.run_id},
                     {"target", summary.target},
                     {"attempted", std::to_string(summary.attempted)},
                     {"succeeded", std::to_string(summary.succeeded)},
                     {"failed", std::to_string(summary.failed)},
                     {"throughput", format_rate(summary.throughput)},
                     {"elapsed_ms", std::to_string(summary.elapsed.count())}});
}

void logger_adapter::log_target_unreachable(const std::string& run_id,
                                            const std::string& target) {
    error("Load run {} aborted: C-ECHO to {} failed", run_id, target);

    write_audit_log("TARGET_UNREACHABLE", "failure",
                    {{"run_id", run_id}, {"target", target}});
}

// =============================================================================
// Configuration
// =============================================================================

void logger_adapter::set_min_level(log_level level) {
    pimpl_->set_min_level(level);
}

auto logger_adapter::get_min_level() noexcept -> log_level {
    return pimpl_->get_min_level();
}

auto logger_adapter::get_config() -> const logger_config& {
    return pimpl_->get_config();
}

// =============================================================================
// Private Helpers
// =============================================================================

void logger_adapter::write_audit_log(
    const std::string& event_type,
    const std::string& outcome,
    const std::map<std::string, std::string>& fields) {
    pimpl_->write_audit_log(event_type, outcome, fields);
}

auto logger_adapter::log_level_to_string(log_level level) -> std::string {
    switch (level) {
        case log_level::trace:
            return "TRACE";
        case log_level::debug:
            return "DEBUG";
        case log_level::info:
            return "INFO";
        case log_level::warn:
            return "WARN";
        case log_level::error:
            return "ERROR";
        case log_level::fatal:
            return "FATAL";
        case log_level::off:
        default:
            return "OFF";
    }
}

}  // namespace loadgen::integration
