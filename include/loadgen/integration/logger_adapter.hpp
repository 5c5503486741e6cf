/**
 * @file logger_adapter.hpp
 * @brief Adapter for load-run logging and audit trail using logger_system
 *
 * This file provides the logger_adapter class for integrating loadgen with
 * the kcenon logger_system. It supports:
 * - Console and rotating file output
 * - Level filtering shared with the injectable ILogger wrappers
 * - A JSON-lines audit trail of load runs (start, completion, unreachable target)
 *
 * @see di/ilogger.hpp for the injectable interface
 */

#pragma once

#include <loadgen/compat/format.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <string>

namespace loadgen::integration {

// ─────────────────────────────────────────────────────
// Log Level
// ─────────────────────────────────────────────────────

/**
 * @brief Log severity levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5,
    off = 6
};

// ─────────────────────────────────────────────────────
// Configuration
// ─────────────────────────────────────────────────────

/**
 * @brief Configuration options for the logger adapter
 */
struct logger_config {
    /// Directory for log files
    std::filesystem::path log_directory{"logs"};

    /// Minimum log level to output
    log_level min_level{log_level::info};

    /// Enable console output
    bool enable_console{true};

    /// Enable rotating file output (loadgen.log)
    bool enable_file{true};

    /// Enable the JSON-lines run audit trail (audit.json)
    bool enable_audit_log{true};

    /// Maximum log file size in megabytes before rotation
    std::size_t max_file_size_mb{50};

    /// Maximum number of rotated log files to keep
    std::size_t max_files{5};

    /// Use asynchronous logging
    bool async_mode{true};

    /// Buffer size for async logging
    std::size_t buffer_size{8192};
};

// ─────────────────────────────────────────────────────
// Run Audit Records
// ─────────────────────────────────────────────────────

/**
 * @brief Summary of a run used for the RUN_COMPLETED audit record
 */
struct run_audit_summary {
    std::string run_id;
    std::string target;
    std::size_t attempted{0};
    std::size_t succeeded{0};
    std::size_t failed{0};
    double throughput{0.0};
    bool passed{false};
    bool cancelled{false};
    std::chrono::milliseconds elapsed{0};
};

// ─────────────────────────────────────────────────────
// Logger Adapter Class
// ─────────────────────────────────────────────────────

/**
 * @brief Static facade over logger_system
 *
 * Calls made before initialize() (or after shutdown()) are dropped, so
 * library code can log unconditionally.
 *
 * Thread Safety: All methods are thread-safe.
 */
class logger_adapter {
public:
    // ─────────────────────────────────────────────────────
    // Initialization
    // ─────────────────────────────────────────────────────

    /**
     * @brief Initialize the logger with configuration
     *
     * Subsequent calls while initialized are ignored.
     */
    static void initialize(const logger_config& config);

    /**
     * @brief Flush pending output and stop the logger
     */
    static void shutdown();

    [[nodiscard]] static auto is_initialized() noexcept -> bool;

    // ─────────────────────────────────────────────────────
    // Standard Logging
    // ─────────────────────────────────────────────────────

    template <typename... Args>
    static void trace(loadgen::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_level_enabled(log_level::trace)) {
            log(log_level::trace, loadgen::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    static void debug(loadgen::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_level_enabled(log_level::debug)) {
            log(log_level::debug, loadgen::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    static void info(loadgen::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_level_enabled(log_level::info)) {
            log(log_level::info, loadgen::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    static void warn(loadgen::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_level_enabled(log_level::warn)) {
            log(log_level::warn, loadgen::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    static void error(loadgen::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_level_enabled(log_level::error)) {
            log(log_level::error, loadgen::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    /**
     * @brief Log a pre-formatted message at the given level
     */
    static void log(log_level level, const std::string& message);

    [[nodiscard]] static auto is_level_enabled(log_level level) noexcept -> bool;

    static void flush();

    // ─────────────────────────────────────────────────────
    // Run Audit Logging
    // ─────────────────────────────────────────────────────

    /**
     * @brief Record the start of a load run
     * @param run_id Identifier of the run
     * @param target Target endpoint as "AE@host:port"
     * @param target_rate Effective submission rate (sends per second)
     * @param concurrency Worker count
     * @param planned_sends Number of sends the run intends to make
     */
    static void log_run_started(const std::string& run_id,
                                const std::string& target,
                                double target_rate,
                                std::size_t concurrency,
                                std::size_t planned_sends);

    /**
     * @brief Record the end of a load run with its aggregate result
     */
    static void log_run_completed(const run_audit_summary& summary);

    /**
     * @brief Record a failed connectivity pre-check
     */
    static void log_target_unreachable(const std::string& run_id,
                                       const std::string& target);

    // ─────────────────────────────────────────────────────
    // Configuration
    // ─────────────────────────────────────────────────────

    static void set_min_level(log_level level);

    [[nodiscard]] static auto get_min_level() noexcept -> log_level;

    [[nodiscard]] static auto get_config() -> const logger_config&;

    [[nodiscard]] static auto log_level_to_string(log_level level) -> std::string;

private:
    static void write_audit_log(const std::string& event_type,
                                const std::string& outcome,
                                const std::map<std::string, std::string>& fields);

    class impl;
    static std::unique_ptr<impl> pimpl_;
};

}  // namespace loadgen::integration
