/**
 * @file dispatcher_test.cpp
 * @brief Unit tests for the concurrent C-STORE dispatcher
 */

#include <loadgen/dispatch/dispatcher.hpp>

#include "mocks/fake_protocol_client.hpp"
#include "mocks/mock_thread_pool.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace loadgen;
using namespace loadgen::dispatch;
using namespace std::chrono_literals;
using loadgen::client::testing::fake_protocol_client;
using loadgen::integration::testing::mock_thread_pool;
using metrics::outcome_kind;

namespace {

auto make_payloads(std::size_t count) -> std::vector<catalog::payload_descriptor> {
    std::vector<catalog::payload_descriptor> payloads;
    for (std::size_t i = 0; i < count; ++i) {
        catalog::payload_descriptor d;
        d.path = "payload_" + std::to_string(i) + ".dcm";
        d.size_bytes = 1024;
        d.modality = "CT";
        payloads.push_back(d);
    }
    return payloads;
}

auto make_config(std::size_t total, std::size_t concurrency) -> core::load_config {
    core::load_config config;
    config.target.host = "127.0.0.1";
    config.target.port = 11112;
    config.target.called_ae = "PACS";
    config.target_rate = 1000.0;
    config.concurrency = concurrency;
    config.total_count = total;
    config.max_error_rate = 0.0;
    config.max_p95_latency_ms = 1000.0;
    return config;
}

auto threaded_pool() -> std::shared_ptr<mock_thread_pool> {
    auto pool = std::make_shared<mock_thread_pool>();
    pool->set_mode(mock_thread_pool::execution_mode::threaded);
    return pool;
}

}  // namespace

// =============================================================================
// Basic Dispatch
// =============================================================================

TEST_CASE("dispatcher records one outcome per send", "[dispatch][run]") {
    auto client = std::make_shared<fake_protocol_client>();
    auto pool = threaded_pool();
    dispatcher dispatcher(client, pool);
    metrics::metrics_collector collector("run-basic");

    const auto config = make_config(25, 4);
    auto result = dispatcher.run(make_payloads(5), config, collector);
    REQUIRE(result.is_ok());

    const auto snap = collector.snapshot();
    CHECK(snap.attempted == 25);
    CHECK(snap.succeeded == 25);
    CHECK(snap.failed == 0);
    CHECK(client->attempt_count() == 25);
    CHECK(dispatcher.completed_sends() == 25);
    CHECK(pool->get_submitted_task_count() == 4);
    CHECK(client->last_timeout_ms() == config.timeout.count());
}

TEST_CASE("dispatcher cycles through payloads", "[dispatch][run]") {
    auto client = std::make_shared<fake_protocol_client>();
    dispatcher dispatcher(client, std::make_shared<mock_thread_pool>());
    metrics::metrics_collector collector("run-cycle");

    auto result = dispatcher.run(make_payloads(3), make_config(7, 1), collector);
    REQUIRE(result.is_ok());

    std::map<std::string, int> per_payload;
    for (const auto& path : client->sent_paths()) {
        ++per_payload[path];
    }
    CHECK(per_payload["payload_0.dcm"] == 3);
    CHECK(per_payload["payload_1.dcm"] == 2);
    CHECK(per_payload["payload_2.dcm"] == 2);
}

TEST_CASE("dispatcher workers run concurrently", "[dispatch][concurrency]") {
    auto client = std::make_shared<fake_protocol_client>(50ms);
    dispatcher dispatcher(client, threaded_pool());
    metrics::metrics_collector collector("run-concurrent");

    auto config = make_config(8, 4);
    config.target_rate = 0.0;  // unpaced

    const auto start = std::chrono::steady_clock::now();
    REQUIRE(dispatcher.run(make_payloads(2), config, collector).is_ok());
    const auto elapsed = std::chrono::steady_clock::now() - start;

    CHECK(collector.snapshot().attempted == 8);
    CHECK(client->max_in_flight() >= 2);
    CHECK(client->max_in_flight() <= 4);
    CHECK(elapsed < 400ms);
}

TEST_CASE("dispatcher never starts more workers than sends", "[dispatch][run]") {
    auto client = std::make_shared<fake_protocol_client>();
    auto pool = threaded_pool();
    dispatcher dispatcher(client, pool);
    metrics::metrics_collector collector("run-few");

    REQUIRE(dispatcher.run(make_payloads(1), make_config(2, 16), collector).is_ok());
    CHECK(pool->get_submitted_task_count() == 2);
    CHECK(collector.snapshot().attempted == 2);
}

TEST_CASE("dispatcher paces submissions", "[dispatch][pacing]") {
    auto client = std::make_shared<fake_protocol_client>();
    dispatcher dispatcher(client, threaded_pool());
    metrics::metrics_collector collector("run-paced");

    auto config = make_config(10, 5);
    config.target_rate = 20.0;

    const auto start = std::chrono::steady_clock::now();
    REQUIRE(dispatcher.run(make_payloads(3), config, collector).is_ok());
    const auto elapsed = std::chrono::steady_clock::now() - start;

    // Five workers, yet ten sends at 20/s still need about 450 ms
    CHECK(elapsed >= 420ms);
    CHECK(collector.snapshot().attempted == 10);
}

TEST_CASE("dispatcher with its own thread_system pool", "[dispatch][pool]") {
    auto client = std::make_shared<fake_protocol_client>(5ms);
    dispatcher dispatcher(client);
    metrics::metrics_collector collector("run-own-pool");

    REQUIRE(dispatcher.run(make_payloads(2), make_config(12, 3), collector).is_ok());
    CHECK(collector.snapshot().attempted == 12);
    CHECK(collector.snapshot().succeeded == 12);
}

// =============================================================================
// Retries
// =============================================================================

TEST_CASE("dispatcher retries transient failures", "[dispatch][retry]") {
    auto client = std::make_shared<fake_protocol_client>(20ms);
    dispatcher dispatcher(client, std::make_shared<mock_thread_pool>());
    metrics::metrics_collector collector("run-retry");

    auto config = make_config(1, 1);

    SECTION("two failures then success with retry_count 2") {
        client->set_script(fake_protocol_client::fail_first(2, outcome_kind::network_error));
        config.retry_count = 2;

        REQUIRE(dispatcher.run(make_payloads(1), config, collector).is_ok());

        const auto snap = collector.snapshot();
        CHECK(client->attempt_count() == 3);
        CHECK(snap.attempted == 1);
        CHECK(snap.succeeded == 1);
        CHECK(snap.retried == 1);
        // Latency is cumulative over the three 20 ms attempts
        REQUIRE(snap.p50_ms.has_value());
        CHECK(*snap.p50_ms >= 59.0);
        CHECK(*snap.p50_ms < 500.0);
    }

    SECTION("timeouts are retried") {
        client->set_script(fake_protocol_client::fail_first(1, outcome_kind::timeout));
        config.retry_count = 1;

        REQUIRE(dispatcher.run(make_payloads(1), config, collector).is_ok());
        CHECK(client->attempt_count() == 2);
        CHECK(collector.snapshot().succeeded == 1);
    }

    SECTION("retry budget exhausted") {
        client->set_script(fake_protocol_client::always(outcome_kind::network_error));
        config.retry_count = 2;

        REQUIRE(dispatcher.run(make_payloads(1), config, collector).is_ok());

        const auto snap = collector.snapshot();
        CHECK(client->attempt_count() == 3);
        CHECK(snap.attempted == 1);
        CHECK(snap.failed == 1);
        CHECK(snap.network_errors == 1);
    }

    SECTION("protocol rejection is terminal") {
        client->set_script(fake_protocol_client::always(outcome_kind::protocol_rejected));
        config.retry_count = 3;

        REQUIRE(dispatcher.run(make_payloads(1), config, collector).is_ok());

        const auto snap = collector.snapshot();
        CHECK(client->attempt_count() == 1);
        CHECK(snap.failed == 1);
        CHECK(snap.protocol_rejections == 1);
        CHECK(snap.retried == 0);
    }

    SECTION("retry delay counts toward latency") {
        client->set_script(fake_protocol_client::fail_first(1, outcome_kind::network_error));
        config.retry_count = 1;
        config.retry_delay = 100ms;

        REQUIRE(dispatcher.run(make_payloads(1), config, collector).is_ok());

        const auto snap = collector.snapshot();
        CHECK(snap.succeeded == 1);
        CHECK(*snap.p50_ms >= 139.0);
    }
}

TEST_CASE("retry table", "[dispatch][retry]") {
    CHECK(metrics::is_retryable(outcome_kind::network_error));
    CHECK(metrics::is_retryable(outcome_kind::timeout));
    CHECK_FALSE(metrics::is_retryable(outcome_kind::protocol_rejected));
    CHECK_FALSE(metrics::is_retryable(outcome_kind::success));
}

// =============================================================================
// Classification at the worker boundary
// =============================================================================

TEST_CASE("dispatcher classifies late and failing attempts", "[dispatch][classify]") {
    SECTION("reply after the timeout counts as timeout") {
        auto client = std::make_shared<fake_protocol_client>(80ms);
        dispatcher dispatcher(client, std::make_shared<mock_thread_pool>());
        metrics::metrics_collector collector("run-late");

        auto config = make_config(1, 1);
        config.timeout = 20ms;

        REQUIRE(dispatcher.run(make_payloads(1), config, collector).is_ok());
        const auto snap = collector.snapshot();
        CHECK(snap.timeouts == 1);
        CHECK(snap.succeeded == 0);
    }

    SECTION("late rejection stays a rejection") {
        auto client = std::make_shared<fake_protocol_client>(80ms);
        client->set_script(fake_protocol_client::always(outcome_kind::protocol_rejected));
        dispatcher dispatcher(client, std::make_shared<mock_thread_pool>());
        metrics::metrics_collector collector("run-late-reject");

        auto config = make_config(1, 1);
        config.timeout = 20ms;

        REQUIRE(dispatcher.run(make_payloads(1), config, collector).is_ok());
        CHECK(collector.snapshot().protocol_rejections == 1);
    }

    SECTION("client exception becomes a network error") {
        auto client = std::make_shared<fake_protocol_client>();
        client->set_throw_on_send(true);
        dispatcher dispatcher(client, std::make_shared<mock_thread_pool>());
        metrics::metrics_collector collector("run-throw");

        REQUIRE(dispatcher.run(make_payloads(1), make_config(3, 1), collector).is_ok());
        const auto snap = collector.snapshot();
        CHECK(snap.attempted == 3);
        CHECK(snap.network_errors == 3);
    }
}

// =============================================================================
// Cancellation
// =============================================================================

TEST_CASE("dispatcher cancellation drains in-flight sends", "[dispatch][cancel]") {
    auto client = std::make_shared<fake_protocol_client>(20ms);
    dispatcher dispatcher(client, threaded_pool());
    metrics::metrics_collector collector("run-cancel");

    auto config = make_config(1000, 4);
    config.target_rate = 50.0;

    std::thread canceller([&] {
        std::this_thread::sleep_for(200ms);
        dispatcher.cancel();
    });

    const auto start = std::chrono::steady_clock::now();
    auto result = dispatcher.run(make_payloads(3), config, collector);
    const auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    REQUIRE(result.is_ok());
    CHECK(dispatcher.is_cancelled());
    CHECK(elapsed < 2s);

    const auto snap = collector.snapshot();
    CHECK(snap.attempted > 0);
    CHECK(snap.attempted < 1000);
    CHECK(snap.attempted == dispatcher.completed_sends());
    CHECK(snap.attempted == client->attempt_count());

    SECTION("later runs return immediately") {
        metrics::metrics_collector second("run-after-cancel");
        REQUIRE(dispatcher.run(make_payloads(3), config, second).is_ok());
        CHECK(second.snapshot().attempted == 0);
    }
}

TEST_CASE("dispatcher cancellation stops retries", "[dispatch][cancel][retry]") {
    auto client = std::make_shared<fake_protocol_client>(5ms);
    client->set_script(fake_protocol_client::always(outcome_kind::network_error));
    dispatcher dispatcher(client, threaded_pool());
    metrics::metrics_collector collector("run-cancel-retry");

    auto config = make_config(1, 1);
    config.retry_count = 10;
    config.retry_delay = 5s;

    std::thread canceller([&] {
        std::this_thread::sleep_for(100ms);
        dispatcher.cancel();
    });

    const auto start = std::chrono::steady_clock::now();
    REQUIRE(dispatcher.run(make_payloads(1), config, collector).is_ok());
    canceller.join();

    CHECK(std::chrono::steady_clock::now() - start < 2s);
    CHECK(client->attempt_count() == 1);
    const auto snap = collector.snapshot();
    CHECK(snap.attempted == 1);
    CHECK(snap.network_errors == 1);
}

// =============================================================================
// Errors
// =============================================================================

TEST_CASE("dispatcher rejects unusable setups", "[dispatch][error]") {
    auto client = std::make_shared<fake_protocol_client>();
    metrics::metrics_collector collector("run-errors");

    SECTION("empty payloads") {
        dispatcher dispatcher(client, std::make_shared<mock_thread_pool>());
        auto result = dispatcher.run({}, make_config(1, 1), collector);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::invalid_argument);
    }

    SECTION("zero concurrency") {
        dispatcher dispatcher(client, std::make_shared<mock_thread_pool>());
        auto result = dispatcher.run(make_payloads(1), make_config(1, 0), collector);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::invalid_argument);
    }

    SECTION("no client") {
        dispatcher dispatcher(nullptr, std::make_shared<mock_thread_pool>());
        auto result = dispatcher.run(make_payloads(1), make_config(1, 1), collector);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::invalid_argument);
    }

    SECTION("pool does not start") {
        auto pool = std::make_shared<mock_thread_pool>();
        pool->set_should_fail_start(true);
        dispatcher dispatcher(client, pool);
        auto result = dispatcher.run(make_payloads(1), make_config(1, 1), collector);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::pool_unavailable);
        CHECK(client->attempt_count() == 0);
    }

    SECTION("pool throws while starting") {
        auto pool = std::make_shared<mock_thread_pool>();
        pool->set_should_throw_on_start(true);
        dispatcher dispatcher(client, pool);
        auto result = dispatcher.run(make_payloads(1), make_config(1, 1), collector);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::pool_unavailable);
        CHECK(result.error().message.find("vector::reserve") != std::string::npos);
        CHECK(client->attempt_count() == 0);
    }

    SECTION("pool refuses tasks") {
        auto pool = std::make_shared<mock_thread_pool>();
        pool->set_should_fail(true);
        dispatcher dispatcher(client, pool);
        auto result = dispatcher.run(make_payloads(1), make_config(4, 2), collector);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::dispatch_failed);
    }

    CHECK(collector.snapshot().attempted == 0);
}
