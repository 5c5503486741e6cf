/**
 * @file protocol_client.hpp
 * @brief Boundary to the DICOM network implementation
 *
 * The load engine never negotiates associations or encodes PDUs itself; it
 * calls a protocol_client. dcmtk_protocol_client is the production
 * implementation, tests inject scripted fakes.
 */

#pragma once

#include <loadgen/catalog/payload_descriptor.hpp>
#include <loadgen/metrics/send_outcome.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace loadgen::client {

/**
 * @brief Server under test
 */
struct target_endpoint {
    /// Host name or IP address of the storage SCP
    std::string host;

    /// TCP port of the storage SCP
    std::uint16_t port{104};

    /// Called AE title (the server's identity)
    std::string called_ae;

    /// Calling AE title (our identity)
    std::string calling_ae{"PERF_SENDER"};

    /// "CALLED@host:port"
    [[nodiscard]] auto to_string() const -> std::string {
        return called_ae + "@" + host + ":" + std::to_string(port);
    }
};

/**
 * @brief Result of a single C-STORE attempt
 */
struct send_result {
    /// Classification of the attempt
    metrics::outcome_kind kind{metrics::outcome_kind::success};

    /// DIMSE status of the C-STORE response, if one arrived
    std::optional<std::uint16_t> dimse_status;

    /// Error text for failed attempts
    std::optional<std::string> detail;

    [[nodiscard]] static auto success(std::uint16_t status = 0x0000) -> send_result {
        return {metrics::outcome_kind::success, status, std::nullopt};
    }

    [[nodiscard]] static auto failure(metrics::outcome_kind kind, std::string detail,
                                      std::optional<std::uint16_t> status = std::nullopt)
        -> send_result {
        return {kind, status, std::move(detail)};
    }
};

/**
 * @brief Abstract DICOM client used by the dispatcher and the driver
 *
 * Thread Safety: send() is called concurrently from every dispatcher
 * worker. Implementations must not share an association between calls.
 */
class protocol_client {
public:
    virtual ~protocol_client() = default;

    /**
     * @brief C-ECHO the target
     * @return true if the target answered with success
     */
    [[nodiscard]] virtual auto echo(const target_endpoint& target) -> bool = 0;

    /**
     * @brief C-STORE one payload over a fresh association
     *
     * @param target Server under test
     * @param payload File to send
     * @param timeout Budget for this attempt (connect, negotiate, store)
     */
    [[nodiscard]] virtual auto send(const target_endpoint& target,
                                    const catalog::payload_descriptor& payload,
                                    std::chrono::milliseconds timeout) -> send_result = 0;

protected:
    protocol_client() = default;
    protocol_client(const protocol_client&) = default;
    protocol_client& operator=(const protocol_client&) = default;
};

}  // namespace loadgen::client
