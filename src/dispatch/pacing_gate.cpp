/**
 * @file pacing_gate.cpp
 * @brief Implementation of pacing_gate
 */

#include <loadgen/dispatch/pacing_gate.hpp>

#include <algorithm>

namespace loadgen::dispatch {

pacing_gate::pacing_gate(pacing_options options) : options_(options) {
    if (options_.burst == 0) {
        options_.burst = 1;
    }
    if (options_.rate > 0.0) {
        period_ = std::chrono::duration_cast<clock::duration>(
            std::chrono::duration<double>(1.0 / options_.rate));
    }
}

auto pacing_gate::acquire() -> admission {
    std::unique_lock<std::mutex> lock(mutex_);
    if (closed_) {
        return admission::closed;
    }

    const auto now = clock::now();
    auto slot = now;
    if (period_ > clock::duration::zero() && next_slot_) {
        const auto burst_credit = period_ * static_cast<clock::rep>(options_.burst - 1);
        slot = std::max(*next_slot_, now - burst_credit);
    }

    if (options_.deadline && slot >= *options_.deadline) {
        return admission::deadline_reached;
    }
    next_slot_ = slot + period_;

    if (cv_.wait_until(lock, slot, [this] { return closed_; })) {
        return admission::closed;
    }

    ++admitted_;
    return admission::admitted;
}

void pacing_gate::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

auto pacing_gate::is_closed() const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

auto pacing_gate::admitted_count() const -> std::uint64_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return admitted_;
}

}  // namespace loadgen::dispatch
