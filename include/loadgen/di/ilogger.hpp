/**
 * @file ilogger.hpp
 * @brief Logger interface for dependency injection
 *
 * Provides the ILogger interface and its implementations (NullLogger,
 * LoggerService). Components take a std::shared_ptr<ILogger> and fall back
 * to null_logger() when none is supplied.
 */

#pragma once

#include <loadgen/integration/logger_adapter.hpp>
#include <loadgen/compat/format.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace loadgen::di {

// =============================================================================
// Logger Interface
// =============================================================================

/**
 * @brief Abstract logger interface for dependency injection
 *
 * Thread Safety: implementations must be callable from all dispatcher
 * workers concurrently.
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void trace(std::string_view message) = 0;
    virtual void debug(std::string_view message) = 0;
    virtual void info(std::string_view message) = 0;
    virtual void warn(std::string_view message) = 0;
    virtual void error(std::string_view message) = 0;

    /**
     * @brief Check if a log level is enabled
     * @param level The level to check
     * @return true if messages at this level will be logged
     */
    [[nodiscard]] virtual bool is_enabled(integration::log_level level) const noexcept = 0;

    // =========================================================================
    // Formatted Logging (Convenience Templates)
    // =========================================================================

    template <typename... Args>
    void trace_fmt(loadgen::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(integration::log_level::trace)) {
            trace(loadgen::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void debug_fmt(loadgen::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(integration::log_level::debug)) {
            debug(loadgen::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void info_fmt(loadgen::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(integration::log_level::info)) {
            info(loadgen::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void warn_fmt(loadgen::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(integration::log_level::warn)) {
            warn(loadgen::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void error_fmt(loadgen::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(integration::log_level::error)) {
            error(loadgen::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

protected:
    ILogger() = default;
    ILogger(const ILogger&) = default;
    ILogger& operator=(const ILogger&) = default;
    ILogger(ILogger&&) = default;
    ILogger& operator=(ILogger&&) = default;
};

// =============================================================================
// Null Logger Implementation
// =============================================================================

/**
 * @brief No-op logger used when no logger is injected
 */
class NullLogger final : public ILogger {
public:
    NullLogger() = default;
    ~NullLogger() override = default;

    void trace(std::string_view /*message*/) override {}
    void debug(std::string_view /*message*/) override {}
    void info(std::string_view /*message*/) override {}
    void warn(std::string_view /*message*/) override {}
    void error(std::string_view /*message*/) override {}

    [[nodiscard]] bool is_enabled(integration::log_level /*level*/) const noexcept override {
        return false;
    }
};

// =============================================================================
// Logger Service Implementation
// =============================================================================

/**
 * @brief ILogger that delegates to the static logger_adapter
 *
 * An optional prefix (for example "[dispatcher] ") is prepended to every
 * message so log lines can be traced back to their component.
 */
class LoggerService final : public ILogger {
public:
    LoggerService() = default;
    explicit LoggerService(std::string prefix) : prefix_(std::move(prefix)) {}
    ~LoggerService() override = default;

    void trace(std::string_view message) override {
        write(integration::log_level::trace, message);
    }

    void debug(std::string_view message) override {
        write(integration::log_level::debug, message);
    }

    void info(std::string_view message) override {
        write(integration::log_level::info, message);
    }

    void warn(std::string_view message) override {
        write(integration::log_level::warn, message);
    }

    void error(std::string_view message) override {
        write(integration::log_level::error, message);
    }

    [[nodiscard]] bool is_enabled(integration::log_level level) const noexcept override {
        return integration::logger_adapter::is_level_enabled(level);
    }

private:
    void write(integration::log_level level, std::string_view message) {
        integration::logger_adapter::log(level, prefix_ + std::string{message});
    }

    std::string prefix_;
};

// =============================================================================
// Global Null Logger Instance
// =============================================================================

/**
 * @brief Get a shared null logger instance
 * @return Shared pointer to NullLogger
 */
[[nodiscard]] inline std::shared_ptr<ILogger> null_logger() {
    static auto instance = std::make_shared<NullLogger>();
    return instance;
}

}  // namespace loadgen::di
