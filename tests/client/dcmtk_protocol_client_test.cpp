/**
 * @file dcmtk_protocol_client_test.cpp
 * @brief Tests for the DCMTK-backed protocol client that need no running SCP
 */

#include <loadgen/client/dcmtk_protocol_client.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>

using namespace loadgen;
using namespace loadgen::client;
using namespace std::chrono_literals;
using metrics::outcome_kind;

namespace {

/// Loopback port nothing listens on
auto closed_target() -> target_endpoint {
    target_endpoint target;
    target.host = "127.0.0.1";
    target.port = 1;
    target.called_ae = "NOBODY";
    return target;
}

auto ct_payload() -> catalog::payload_descriptor {
    catalog::payload_descriptor payload;
    payload.path = "missing.dcm";
    payload.sop_class_uid = "1.2.840.10008.5.1.4.1.1.2";
    payload.sop_instance_uid = "1.2.826.0.1.3680043.2.1125.1";
    payload.transfer_syntax_uid = "1.2.840.10008.1.2.1";
    payload.modality = "CT";
    return payload;
}

}  // namespace

TEST_CASE("C-STORE status classification", "[client][dcmtk][status]") {
    CHECK(dcmtk_protocol_client::is_store_success(0x0000));

    // Warnings: coercion, elements discarded, dataset mismatch
    CHECK(dcmtk_protocol_client::is_store_success(0xB000));
    CHECK(dcmtk_protocol_client::is_store_success(0xB006));
    CHECK(dcmtk_protocol_client::is_store_success(0xB007));

    // Refused: out of resources, SOP class not supported; errors
    CHECK_FALSE(dcmtk_protocol_client::is_store_success(0xA700));
    CHECK_FALSE(dcmtk_protocol_client::is_store_success(0x0122));
    CHECK_FALSE(dcmtk_protocol_client::is_store_success(0xA900));
    CHECK_FALSE(dcmtk_protocol_client::is_store_success(0xC000));
    CHECK_FALSE(dcmtk_protocol_client::is_store_success(0x0110));
}

TEST_CASE("C-ECHO status classification", "[client][dcmtk][status]") {
    CHECK(dcmtk_protocol_client::is_echo_success(0x0000));
    CHECK_FALSE(dcmtk_protocol_client::is_echo_success(0x0110));
    CHECK_FALSE(dcmtk_protocol_client::is_echo_success(0x0122));
    CHECK_FALSE(dcmtk_protocol_client::is_echo_success(0xB000));
    CHECK_FALSE(dcmtk_protocol_client::is_echo_success(0xC000));
}

TEST_CASE("attempt timeout budget", "[client][dcmtk][timeout]") {
    using clock = std::chrono::steady_clock;

    SECTION("connect and negotiation split the attempt") {
        const auto budget = dcmtk_protocol_client::split_attempt_budget(6000ms);
        CHECK(budget.connect_seconds == 3);
        CHECK(budget.acse_seconds == 3);
    }

    SECTION("short attempts round up to one second per phase") {
        const auto budget = dcmtk_protocol_client::split_attempt_budget(500ms);
        CHECK(budget.connect_seconds == 1);
        CHECK(budget.acse_seconds == 1);
    }

    SECTION("DIMSE only gets what is left of the deadline") {
        const auto now = clock::now();
        const auto deadline = now + 5000ms;

        CHECK(dcmtk_protocol_client::remaining_seconds(deadline, now) == 5u);
        CHECK(dcmtk_protocol_client::remaining_seconds(deadline, now + 3500ms) == 2u);
        CHECK(dcmtk_protocol_client::remaining_seconds(deadline, now + 4990ms) == 1u);
        CHECK_FALSE(dcmtk_protocol_client::remaining_seconds(deadline, deadline).has_value());
        CHECK_FALSE(
            dcmtk_protocol_client::remaining_seconds(deadline, now + 6000ms).has_value());
    }
}

TEST_CASE("dcmtk_protocol_client against a closed port", "[client][dcmtk][network]") {
    dcmtk_client_options options;
    options.echo_timeout = 2s;
    dcmtk_protocol_client client(options);

    SECTION("echo reports unreachable within its deadline") {
        const auto started = std::chrono::steady_clock::now();
        CHECK_FALSE(client.echo(closed_target()));
        CHECK(std::chrono::steady_clock::now() - started < 5s);
    }

    SECTION("send is a network error") {
        const auto result = client.send(closed_target(), ct_payload(), 2000ms);
        CHECK(result.kind == outcome_kind::network_error);
        CHECK_FALSE(result.dimse_status.has_value());
        REQUIRE(result.detail.has_value());
        CHECK_FALSE(result.detail->empty());
    }
}

TEST_CASE("dcmtk_protocol_client refuses payloads without a SOP class",
          "[client][dcmtk][payload]") {
    dcmtk_protocol_client client;
    auto payload = ct_payload();
    payload.sop_class_uid.clear();

    const auto result = client.send(closed_target(), payload, 1000ms);
    CHECK(result.kind == outcome_kind::protocol_rejected);
}
