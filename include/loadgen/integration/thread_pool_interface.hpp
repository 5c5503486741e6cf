/**
 * @file thread_pool_interface.hpp
 * @brief Abstract interface for the worker pool used by the dispatcher
 *
 * The dispatcher receives its pool through this interface so tests can
 * inject a mock_thread_pool instead of a real thread_system pool.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <string>

namespace loadgen::integration {

/**
 * @brief Configuration options for a worker pool
 */
struct thread_pool_config {
    /// Number of worker threads started with the pool
    std::size_t min_threads{4};

    /// Upper bound for worker threads
    std::size_t max_threads{16};

    /// Idle time before surplus workers are released
    std::chrono::milliseconds idle_timeout{30000};

    /// Pool name, used as the thread_system pool title
    std::string pool_name{"loadgen_pool"};
};

/**
 * @brief Abstract interface for thread pool operations
 *
 * Thread Safety: implementations must be safe for concurrent submission.
 */
class thread_pool_interface {
public:
    virtual ~thread_pool_interface() = default;

    // =========================================================================
    // Lifecycle Management
    // =========================================================================

    /**
     * @brief Start the thread pool
     *
     * Safe to call multiple times; subsequent calls are no-ops if running.
     *
     * @return true if started successfully or already running
     */
    [[nodiscard]] virtual auto start() -> bool = 0;

    [[nodiscard]] virtual auto is_running() const noexcept -> bool = 0;

    /**
     * @brief Shutdown the thread pool
     * @param wait_for_completion If true, waits for pending tasks to complete
     */
    virtual void shutdown(bool wait_for_completion = true) = 0;

    // =========================================================================
    // Task Submission
    // =========================================================================

    /**
     * @brief Submit a task for execution
     *
     * @param task The task to execute
     * @return Future that completes when the task finishes; it carries any
     *         exception the task threw
     *
     * @throws std::runtime_error if the pool cannot accept the task
     */
    [[nodiscard]] virtual auto submit(std::function<void()> task)
        -> std::future<void> = 0;

    // =========================================================================
    // Statistics
    // =========================================================================

    [[nodiscard]] virtual auto get_thread_count() const -> std::size_t = 0;

    [[nodiscard]] virtual auto get_pending_task_count() const -> std::size_t = 0;

protected:
    thread_pool_interface() = default;

    thread_pool_interface(const thread_pool_interface&) = delete;
    thread_pool_interface& operator=(const thread_pool_interface&) = delete;

    thread_pool_interface(thread_pool_interface&&) = default;
    thread_pool_interface& operator=(thread_pool_interface&&) = default;
};

}  // namespace loadgen::integration
