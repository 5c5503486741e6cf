/**
 * @file send_outcome.hpp
 * @brief Outcome of one logical C-STORE send
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace loadgen::metrics {

/**
 * @brief Closed classification of a send attempt
 */
enum class outcome_kind {
    success,            ///< Server stored the dataset (success or warning status)
    network_error,      ///< Connection refused, reset or association failure on transport
    timeout,            ///< No response within the per-call timeout
    protocol_rejected   ///< Server answered but refused the association or the store
};

[[nodiscard]] constexpr auto to_string(outcome_kind kind) noexcept -> std::string_view {
    switch (kind) {
        case outcome_kind::success:
            return "Success";
        case outcome_kind::network_error:
            return "NetworkError";
        case outcome_kind::timeout:
            return "Timeout";
        case outcome_kind::protocol_rejected:
            return "ProtocolRejected";
    }
    return "Unknown";
}

/**
 * @brief Retry policy table
 *
 * Transport faults are transient; a rejection means the server or the data
 * is at fault and repeating the send cannot change the answer.
 */
[[nodiscard]] constexpr auto is_retryable(outcome_kind kind) noexcept -> bool {
    switch (kind) {
        case outcome_kind::network_error:
        case outcome_kind::timeout:
            return true;
        case outcome_kind::success:
        case outcome_kind::protocol_rejected:
            return false;
    }
    return false;
}

/**
 * @brief Result of one logical send, including all of its retries
 *
 * Created once by a dispatcher worker when the retry sequence ends and
 * handed to metrics_collector::record.
 */
struct send_outcome {
    using clock = std::chrono::steady_clock;

    /// Run the outcome belongs to
    std::string run_id;

    /// Terminal classification
    outcome_kind kind{outcome_kind::success};

    /// Cumulative wall time across all attempts
    std::chrono::microseconds latency{0};

    /// Completion time of the last attempt
    clock::time_point completed_at{};

    /// Number of attempts made (1 = no retry)
    std::uint32_t attempts{1};

    /// Payload that was sent
    std::filesystem::path payload;

    /// Error detail from the protocol client, if any
    std::optional<std::string> detail;

    /// DIMSE status returned by the server, if it answered
    std::optional<std::uint16_t> dimse_status;

    [[nodiscard]] auto is_success() const noexcept -> bool {
        return kind == outcome_kind::success;
    }

    [[nodiscard]] auto latency_ms() const noexcept -> double {
        return std::chrono::duration<double, std::milli>(latency).count();
    }
};

}  // namespace loadgen::metrics
