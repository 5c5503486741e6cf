/**
 * @file dcmtk_protocol_client.hpp
 * @brief protocol_client implemented with DCMTK's DcmSCU
 *
 * Every send() opens its own association, proposes the payload's SOP class
 * with the payload's transfer syntax (plus explicit and implicit little
 * endian), stores the file and releases the association.
 *
 * One attempt runs against a single deadline: connect and association
 * negotiation split the timeout, and the DIMSE exchange gets what is left.
 * DCMTK counts timeouts in whole seconds, so each phase rounds up to one.
 */

#pragma once

#include <loadgen/client/protocol_client.hpp>
#include <loadgen/di/ilogger.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>

namespace loadgen::client {

/**
 * @brief Options for dcmtk_protocol_client
 */
struct dcmtk_client_options {
    /// Maximum PDU size we accept from the peer
    std::uint32_t max_pdu_size{16384};

    /// Deadline for the whole echo() exchange
    std::chrono::milliseconds echo_timeout{std::chrono::seconds{10}};
};

/**
 * @brief DCMTK-based storage SCU
 *
 * Thread Safety: send() and echo() create a DcmSCU per call and share no
 * state, so they can be called from any number of threads.
 */
class dcmtk_protocol_client final : public protocol_client {
public:
    explicit dcmtk_protocol_client(dcmtk_client_options options = {},
                                   std::shared_ptr<di::ILogger> logger = nullptr);

    [[nodiscard]] auto echo(const target_endpoint& target) -> bool override;

    [[nodiscard]] auto send(const target_endpoint& target,
                            const catalog::payload_descriptor& payload,
                            std::chrono::milliseconds timeout) -> send_result override;

    /// Whole-second timeouts for the connect and ACSE phases of one attempt
    struct association_budget {
        std::uint32_t connect_seconds{1};
        std::uint32_t acse_seconds{1};
    };

    /**
     * @brief Split an attempt timeout between connect and association negotiation
     */
    [[nodiscard]] static auto split_attempt_budget(std::chrono::milliseconds timeout)
        -> association_budget;

    /**
     * @brief Whole seconds left until @p deadline, or nullopt once it has passed
     */
    [[nodiscard]] static auto remaining_seconds(std::chrono::steady_clock::time_point deadline,
                                                std::chrono::steady_clock::time_point now)
        -> std::optional<std::uint32_t>;

    /// Only 0x0000 answers a C-ECHO successfully
    [[nodiscard]] static constexpr auto is_echo_success(std::uint16_t status) noexcept -> bool {
        return status == 0x0000;
    }

    /**
     * @brief Whether a DIMSE C-STORE status counts as stored
     *
     * 0x0000 and the warning statuses 0xB000, 0xB006 and 0xB007 are
     * successes; everything else is a rejection.
     */
    [[nodiscard]] static constexpr auto is_store_success(std::uint16_t status) noexcept -> bool {
        return status == 0x0000 || status == 0xB000 || status == 0xB006 || status == 0xB007;
    }

private:
    dcmtk_client_options options_;
    std::shared_ptr<di::ILogger> logger_;
};

}  // namespace loadgen::client
