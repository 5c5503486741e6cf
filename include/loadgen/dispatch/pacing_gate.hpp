/**
 * @file pacing_gate.hpp
 * @brief Leaky-bucket admission control for send submissions
 *
 * Workers call acquire() before each send. The gate hands out time slots
 * spaced 1/rate apart, so the aggregate admission rate approximates the
 * target rate no matter how many workers are waiting. A burst allowance
 * lets up to `burst` slots be granted back-to-back after an idle period.
 *
 * Waiting is done on a condition variable with a deadline, so close()
 * (run cancellation) wakes every waiter immediately.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>

namespace loadgen::dispatch {

/**
 * @brief Result of a pacing_gate::acquire call
 */
enum class admission {
    admitted,          ///< Slot granted, the caller may send
    closed,            ///< Gate closed (cancelled) before the slot was reached
    deadline_reached   ///< Next slot would fall at or after the gate deadline
};

[[nodiscard]] constexpr auto to_string(admission a) noexcept -> std::string_view {
    switch (a) {
        case admission::admitted:
            return "admitted";
        case admission::closed:
            return "closed";
        case admission::deadline_reached:
            return "deadline_reached";
    }
    return "unknown";
}

/**
 * @brief Options for pacing_gate
 */
struct pacing_options {
    /// Admissions per second; 0 disables pacing
    double rate{0.0};

    /// Slots that may be granted without spacing after idle time
    std::size_t burst{1};

    /// No slot is granted at or after this time
    std::optional<std::chrono::steady_clock::time_point> deadline;
};

/**
 * @brief Thread-safe rate limiter shared by dispatcher workers
 */
class pacing_gate {
public:
    using clock = std::chrono::steady_clock;

    explicit pacing_gate(pacing_options options);

    pacing_gate(const pacing_gate&) = delete;
    pacing_gate& operator=(const pacing_gate&) = delete;

    /**
     * @brief Reserve the next slot and wait until it arrives
     *
     * The wait ends early when the gate is closed. A reserved slot that is
     * abandoned because of close() is not handed to another caller.
     */
    [[nodiscard]] auto acquire() -> admission;

    /**
     * @brief Close the gate and wake all waiters
     */
    void close();

    [[nodiscard]] auto is_closed() const -> bool;

    /// Number of admissions granted so far
    [[nodiscard]] auto admitted_count() const -> std::uint64_t;

    /// Spacing between consecutive slots (zero when pacing is disabled)
    [[nodiscard]] auto period() const noexcept -> clock::duration { return period_; }

private:
    pacing_options options_;
    clock::duration period_{};

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<clock::time_point> next_slot_;
    std::uint64_t admitted_{0};
    bool closed_{false};
};

}  // namespace loadgen::dispatch
