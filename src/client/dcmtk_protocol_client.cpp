/**
 * @file dcmtk_protocol_client.cpp
 * @brief Implementation of dcmtk_protocol_client
 */

#include <loadgen/client/dcmtk_protocol_client.hpp>
#include <loadgen/catalog/dicom_header_reader.hpp>

#include <dcmtk/config/osconfig.h>
#include <dcmtk/dcmdata/dcuid.h>
#include <dcmtk/dcmnet/assoc.h>
#include <dcmtk/dcmnet/cond.h>
#include <dcmtk/dcmnet/dimse.h>
#include <dcmtk/dcmnet/scu.h>
#include <dcmtk/ofstd/offname.h>
#include <dcmtk/ofstd/ofstd.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace loadgen::client {

namespace {

using metrics::outcome_kind;

/**
 * @brief Map a DCMTK condition to an outcome kind
 */
[[nodiscard]] auto classify_condition(const OFCondition& cond) -> outcome_kind {
    if (cond == DUL_ASSOCIATIONREJECTED ||
        cond == NET_EC_NoAcceptablePresentationContexts) {
        return outcome_kind::protocol_rejected;
    }
    if (cond == DUL_READTIMEOUT || cond == DIMSE_NODATAAVAILABLE) {
        return outcome_kind::timeout;
    }
    return outcome_kind::network_error;
}

void configure(DcmSCU& scu, const target_endpoint& target,
               const dcmtk_protocol_client::association_budget& budget,
               std::uint32_t max_pdu_size) {
    scu.setAETitle(target.calling_ae.c_str());
    scu.setPeerAETitle(target.called_ae.c_str());
    scu.setPeerHostName(target.host.c_str());
    scu.setPeerPort(target.port);

    scu.setConnectionTimeout(static_cast<Sint32>(budget.connect_seconds));
    scu.setACSETimeout(budget.acse_seconds);
    scu.setDIMSETimeout(budget.acse_seconds);
    scu.setDIMSEBlockingMode(DIMSE_NONBLOCKING);
    scu.setMaxReceivePDULength(max_pdu_size);
}

/**
 * @brief Owns a requestor network and the association opened on it
 *
 * An association still open on destruction is aborted.
 */
class echo_session {
public:
    echo_session() = default;
    ~echo_session() {
        if (assoc_) {
            ASC_abortAssociation(assoc_);
            ASC_destroyAssociation(&assoc_);
        }
        if (params_) {
            ASC_destroyAssociationParameters(&params_);
        }
        if (net_) {
            ASC_dropNetwork(&net_);
        }
    }

    echo_session(const echo_session&) = delete;
    echo_session& operator=(const echo_session&) = delete;

    auto open(const target_endpoint& target,
              const dcmtk_protocol_client::association_budget& budget,
              std::uint32_t max_pdu_size) -> OFCondition {
        OFCondition cond = ASC_initializeNetwork(
            NET_REQUESTOR, 0, static_cast<int>(budget.acse_seconds), &net_);
        if (cond.bad()) {
            return cond;
        }
        cond = ASC_createAssociationParameters(&params_, static_cast<long>(max_pdu_size));
        if (cond.bad()) {
            return cond;
        }
        cond = ASC_setAPTitles(params_, target.calling_ae.c_str(), target.called_ae.c_str(),
                               nullptr);
        if (cond.bad()) {
            return cond;
        }
        const auto peer = target.host + ":" + std::to_string(target.port);
        cond = ASC_setPresentationAddresses(params_, OFStandard::getHostName().c_str(),
                                            peer.c_str());
        if (cond.bad()) {
            return cond;
        }

        const char* syntaxes[] = {UID_LittleEndianExplicitTransferSyntax,
                                  UID_LittleEndianImplicitTransferSyntax};
        cond = ASC_addPresentationContext(params_, 1, UID_VerificationSOPClass, syntaxes, 2);
        if (cond.bad()) {
            return cond;
        }

        dcmConnectionTimeout.set(static_cast<Sint32>(budget.connect_seconds));

        // The association takes the parameters over, even when the request fails
        cond = ASC_requestAssociation(net_, params_, &assoc_);
        if (assoc_) {
            params_ = nullptr;
        }
        if (cond.bad()) {
            return cond;
        }
        if (ASC_countAcceptedPresentationContexts(assoc_->params) == 0) {
            return NET_EC_NoAcceptablePresentationContexts;
        }
        return EC_Normal;
    }

    auto echo(int timeout_seconds, DIC_US& status) -> OFCondition {
        DcmDataset* status_detail = nullptr;
        OFCondition cond = DIMSE_echoUser(assoc_, assoc_->nextMsgID++, DIMSE_NONBLOCKING,
                                          timeout_seconds, &status, &status_detail);
        delete status_detail;
        return cond;
    }

    void release() {
        if (assoc_) {
            ASC_releaseAssociation(assoc_);
            ASC_destroyAssociation(&assoc_);
        }
    }

private:
    T_ASC_Network* net_{nullptr};
    T_ASC_Parameters* params_{nullptr};
    T_ASC_Association* assoc_{nullptr};
};

[[nodiscard]] auto proposed_syntaxes(const std::string& payload_syntax) -> OFList<OFString> {
    OFList<OFString> syntaxes;
    if (!payload_syntax.empty()) {
        syntaxes.push_back(payload_syntax.c_str());
    }
    if (payload_syntax != catalog::kExplicitVrLittleEndian) {
        syntaxes.push_back(UID_LittleEndianExplicitTransferSyntax);
    }
    if (payload_syntax != catalog::kImplicitVrLittleEndian) {
        syntaxes.push_back(UID_LittleEndianImplicitTransferSyntax);
    }
    return syntaxes;
}

}  // namespace

auto dcmtk_protocol_client::split_attempt_budget(std::chrono::milliseconds timeout)
    -> association_budget {
    const auto half_ms = std::max<std::int64_t>(timeout.count(), 0) / 2;
    const auto seconds =
        static_cast<std::uint32_t>(std::max<std::int64_t>(1, (half_ms + 999) / 1000));
    return association_budget{seconds, seconds};
}

auto dcmtk_protocol_client::remaining_seconds(std::chrono::steady_clock::time_point deadline,
                                              std::chrono::steady_clock::time_point now)
    -> std::optional<std::uint32_t> {
    if (now >= deadline) {
        return std::nullopt;
    }
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    return static_cast<std::uint32_t>(std::max<std::int64_t>(1, (left.count() + 999) / 1000));
}

dcmtk_protocol_client::dcmtk_protocol_client(dcmtk_client_options options,
                                             std::shared_ptr<di::ILogger> logger)
    : options_(options),
      logger_(logger ? std::move(logger) : di::null_logger()) {}

// =============================================================================
// C-ECHO
// =============================================================================

auto dcmtk_protocol_client::echo(const target_endpoint& target) -> bool {
    const auto deadline = std::chrono::steady_clock::now() + options_.echo_timeout;

    echo_session session;
    OFCondition cond =
        session.open(target, split_attempt_budget(options_.echo_timeout), options_.max_pdu_size);
    if (cond.bad()) {
        logger_->warn_fmt("C-ECHO to {} failed: {}", target.to_string(), cond.text());
        return false;
    }

    const auto dimse_seconds = remaining_seconds(deadline, std::chrono::steady_clock::now());
    if (!dimse_seconds) {
        logger_->warn_fmt("C-ECHO to {} timed out during association", target.to_string());
        return false;
    }

    DIC_US status = 0xFFFF;
    cond = session.echo(static_cast<int>(*dimse_seconds), status);
    if (cond.bad()) {
        logger_->warn_fmt("C-ECHO to {} failed: {}", target.to_string(), cond.text());
        return false;
    }
    session.release();

    if (!is_echo_success(status)) {
        logger_->warn_fmt("C-ECHO to {} answered status 0x{:04X}", target.to_string(), status);
        return false;
    }

    logger_->debug_fmt("C-ECHO to {} succeeded", target.to_string());
    return true;
}

// =============================================================================
// C-STORE
// =============================================================================

auto dcmtk_protocol_client::send(const target_endpoint& target,
                                 const catalog::payload_descriptor& payload,
                                 std::chrono::milliseconds timeout) -> send_result {
    if (payload.sop_class_uid.empty()) {
        return send_result::failure(outcome_kind::protocol_rejected,
                                    "Payload has no SOP Class UID: " + payload.path.string());
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    DcmSCU scu;
    configure(scu, target, split_attempt_budget(timeout), options_.max_pdu_size);

    OFCondition cond = scu.addPresentationContext(
        payload.sop_class_uid.c_str(), proposed_syntaxes(payload.transfer_syntax_uid));
    if (cond.bad()) {
        return send_result::failure(outcome_kind::protocol_rejected,
                                    std::string{"Cannot propose presentation context: "} +
                                        cond.text());
    }

    cond = scu.initNetwork();
    if (cond.bad()) {
        return send_result::failure(outcome_kind::network_error,
                                    std::string{"Network initialization failed: "} + cond.text());
    }

    cond = scu.negotiateAssociation();
    if (cond.bad()) {
        return send_result::failure(classify_condition(cond),
                                    std::string{"Association failed: "} + cond.text());
    }

    const T_ASC_PresentationContextID context_id = scu.findAnyPresentationContextID(
        payload.sop_class_uid.c_str(), payload.transfer_syntax_uid.c_str());
    if (context_id == 0) {
        scu.releaseAssociation();
        return send_result::failure(outcome_kind::protocol_rejected,
                                    "No accepted presentation context for " +
                                        payload.sop_class_uid);
    }

    // DIMSE gets only what negotiation left of the attempt
    const auto dimse_seconds = remaining_seconds(deadline, std::chrono::steady_clock::now());
    if (!dimse_seconds) {
        scu.abortAssociation();
        return send_result::failure(outcome_kind::timeout,
                                    "Attempt deadline passed during association");
    }
    scu.setDIMSETimeout(*dimse_seconds);

    Uint16 status = 0;
    cond = scu.sendSTORERequest(context_id, OFFilename(payload.path.string().c_str()),
                                nullptr, status);
    if (cond.bad()) {
        const auto kind = classify_condition(cond);
        scu.abortAssociation();
        return send_result::failure(kind, std::string{"C-STORE failed: "} + cond.text());
    }

    scu.releaseAssociation();

    if (!is_store_success(status)) {
        logger_->debug_fmt("C-STORE of {} rejected with status 0x{:04X}",
                           payload.path.string(), status);
        return send_result::failure(
            outcome_kind::protocol_rejected,
            loadgen::compat::format("C-STORE status 0x{:04X}", status), status);
    }

    return send_result::success(status);
}

}  // namespace loadgen::client
