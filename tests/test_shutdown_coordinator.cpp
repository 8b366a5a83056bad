#include <catch2/catch_test_macros.hpp>
#include "server/shutdown_coordinator.hpp"
#include "config/config_loader.hpp"
#include "mocks/mock_llm_backend.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace promptshield;
using promptshield::testing::MockLlmBackend;

TEST_CASE("ShutdownCoordinator: enter and leave before shutdown", "[shutdown]") {
    ShutdownCoordinator sc;
    CHECK(sc.try_enter_request());
    CHECK(sc.in_flight_count() == 1);
    CHECK(sc.try_enter_request());
    CHECK(sc.in_flight_count() == 2);
    sc.leave_request();
    sc.leave_request();
    CHECK(sc.in_flight_count() == 0);
}

TEST_CASE("ShutdownCoordinator: new requests rejected after shutdown", "[shutdown]") {
    ShutdownCoordinator sc;
    REQUIRE(sc.try_enter_request());
    sc.initiate_shutdown();

    CHECK(sc.is_shutting_down());
    CHECK_FALSE(sc.try_enter_request());

    // The request already admitted still completes
    CHECK(sc.in_flight_count() == 1);
    sc.leave_request();
    CHECK(sc.in_flight_count() == 0);
}

TEST_CASE("ShutdownCoordinator: guard leaves on scope exit", "[shutdown]") {
    ShutdownCoordinator sc;
    {
        REQUIRE(sc.try_enter_request());
        ShutdownGuard guard{&sc};
        CHECK(sc.in_flight_count() == 1);
    }
    CHECK(sc.in_flight_count() == 0);

    ShutdownGuard empty{nullptr};
    (void)empty;
}

TEST_CASE("ShutdownCoordinator: drain", "[shutdown]") {
    SECTION("Returns immediately with nothing in flight") {
        ShutdownCoordinator sc(ShutdownCoordinator::Config{std::chrono::milliseconds(100)});
        sc.initiate_shutdown();
        const auto start = std::chrono::steady_clock::now();
        CHECK(sc.wait_for_drain());
        CHECK(std::chrono::steady_clock::now() - start < std::chrono::milliseconds(50));
    }

    SECTION("Blocks until the last request leaves") {
        ShutdownCoordinator sc(ShutdownCoordinator::Config{std::chrono::milliseconds(5000)});
        REQUIRE(sc.try_enter_request());

        std::atomic<bool> drained{false};
        std::thread drain_thread([&] {
            sc.initiate_shutdown();
            drained = sc.wait_for_drain();
        });

        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        CHECK_FALSE(drained.load());

        sc.leave_request();
        drain_thread.join();
        CHECK(drained.load());
    }

    SECTION("Times out with a stuck request") {
        ShutdownCoordinator sc(ShutdownCoordinator::Config{std::chrono::milliseconds(50)});
        REQUIRE(sc.try_enter_request());
        sc.initiate_shutdown();

        const auto start = std::chrono::steady_clock::now();
        CHECK_FALSE(sc.wait_for_drain());
        CHECK(std::chrono::steady_clock::now() - start >= std::chrono::milliseconds(40));
        CHECK(sc.in_flight_count() == 1);
        sc.leave_request();
    }
}

TEST_CASE("ShutdownCoordinator: cancel in-flight backend calls", "[shutdown][cancel]") {
    ShutdownCoordinator sc(ShutdownCoordinator::Config{std::chrono::milliseconds(50)});
    MockLlmBackend backend;
    backend.set_delay(std::chrono::seconds(10));

    LlmResponse response;
    bool scope_cancelled = false;
    std::thread request([&] {
        if (!sc.try_enter_request()) return;
        ShutdownGuard guard{&sc};
        ShutdownCoordinator::RequestScope scope(sc);
        response = backend.complete(LlmRequest{}, scope.stop_token());
        scope_cancelled = scope.cancelled();
    });

    while (backend.call_count() == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    sc.initiate_shutdown();
    CHECK_FALSE(sc.wait_for_drain());

    const auto start = std::chrono::steady_clock::now();
    sc.cancel_in_flight();
    request.join();

    CHECK(std::chrono::steady_clock::now() - start < std::chrono::seconds(2));
    CHECK(response.cancelled);
    CHECK(response.error == "Request cancelled");
    CHECK(scope_cancelled);
    CHECK(sc.in_flight_count() == 0);

    // Scopes opened after the cancel start out stopped
    ShutdownCoordinator::RequestScope late(sc);
    CHECK(late.stop_token().stop_requested());
}

TEST_CASE("ShutdownCoordinator: request scopes cancel independently", "[shutdown][cancel]") {
    ShutdownCoordinator sc;
    ShutdownCoordinator::RequestScope first(sc);
    ShutdownCoordinator::RequestScope second(sc);

    first.cancel();
    CHECK(first.stop_token().stop_requested());
    CHECK_FALSE(second.stop_token().stop_requested());

    sc.cancel_in_flight();
    CHECK(second.stop_token().stop_requested());
}

TEST_CASE("ShutdownCoordinator: disconnected clients cancel only their request", "[shutdown][cancel]") {
    ShutdownCoordinator::Config cfg;
    cfg.disconnect_poll_interval = std::chrono::milliseconds(5);
    ShutdownCoordinator sc(cfg);

    std::atomic<bool> first_gone{false};
    ShutdownCoordinator::RequestScope first(sc, [&] { return first_gone.load(); });
    ShutdownCoordinator::RequestScope second(sc, [] { return false; });

    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    CHECK_FALSE(first.cancelled());

    first_gone = true;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (!first.cancelled() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    CHECK(first.cancelled());
    CHECK_FALSE(second.cancelled());
    CHECK(sc.disconnect_cancellations() == 1);
}

TEST_CASE("ShutdownCoordinator: concurrent enter/leave/shutdown", "[shutdown]") {
    ShutdownCoordinator sc(ShutdownCoordinator::Config{std::chrono::milliseconds(2000)});

    std::atomic<int> entered{0};
    std::atomic<int> rejected{0};
    std::vector<std::thread> threads;

    for (int i = 0; i < 20; ++i) {
        threads.emplace_back([&] {
            if (sc.try_enter_request()) {
                entered.fetch_add(1);
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
                sc.leave_request();
            } else {
                rejected.fetch_add(1);
            }
        });
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    sc.initiate_shutdown();

    for (auto& t : threads) t.join();

    CHECK(sc.wait_for_drain());
    CHECK(sc.in_flight_count() == 0);
    CHECK((entered.load() + rejected.load()) == 20);
}

TEST_CASE("ShutdownCoordinator: timeout from TOML", "[shutdown][config]") {
    const auto result = ConfigLoader::load_from_string("[server]\nshutdown_timeout_ms = 15000\n");
    REQUIRE(result.success);
    CHECK(result.config.server.shutdown_timeout_ms == 15000);
    CHECK(result.config.server.disconnect_poll_ms == 50);
}
