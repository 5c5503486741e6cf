/**
 * @file thread_pool_adapter.hpp
 * @brief thread_system-backed implementation of thread_pool_interface
 */

#pragma once

#include <loadgen/integration/thread_pool_interface.hpp>

#include <memory>
#include <mutex>

// Forward declaration
namespace kcenon::thread {
class thread_pool;
}

namespace loadgen::integration {

/**
 * @class thread_pool_adapter
 * @brief Adapts kcenon::thread::thread_pool to thread_pool_interface
 *
 * The pool starts config.min_threads workers. The dispatcher sizes the
 * config to its concurrency so every worker task gets its own thread.
 *
 * @example
 * @code
 * thread_pool_config config;
 * config.min_threads = 8;
 * auto pool = std::make_shared<thread_pool_adapter>(config);
 * dispatch::dispatcher d(client, pool);
 * @endcode
 */
class thread_pool_adapter final : public thread_pool_interface {
public:
    /**
     * @brief Construct adapter with configuration
     *
     * The pool is not started until start() or the first submit().
     */
    explicit thread_pool_adapter(const thread_pool_config& config);

    /**
     * @brief Wrap an existing thread_system pool
     * @throws std::invalid_argument if pool is null
     */
    explicit thread_pool_adapter(std::shared_ptr<kcenon::thread::thread_pool> pool);

    /**
     * @brief Destructor - stops the pool after draining pending tasks
     */
    ~thread_pool_adapter() override;

    thread_pool_adapter(const thread_pool_adapter&) = delete;
    thread_pool_adapter& operator=(const thread_pool_adapter&) = delete;
    thread_pool_adapter(thread_pool_adapter&&) = delete;
    thread_pool_adapter& operator=(thread_pool_adapter&&) = delete;

    // =========================================================================
    // thread_pool_interface
    // =========================================================================

    [[nodiscard]] auto start() -> bool override;
    [[nodiscard]] auto is_running() const noexcept -> bool override;
    void shutdown(bool wait_for_completion = true) override;

    [[nodiscard]] auto submit(std::function<void()> task)
        -> std::future<void> override;

    [[nodiscard]] auto get_thread_count() const -> std::size_t override;
    [[nodiscard]] auto get_pending_task_count() const -> std::size_t override;

    // =========================================================================
    // Adapter-specific Methods
    // =========================================================================

    [[nodiscard]] auto get_config() const noexcept -> const thread_pool_config&;

private:
    [[nodiscard]] auto start_locked() -> bool;

    thread_pool_config config_;
    std::shared_ptr<kcenon::thread::thread_pool> pool_;
    mutable std::mutex mutex_;
    bool initialized_{false};
};

}  // namespace loadgen::integration
