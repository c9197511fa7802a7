#include <catch2/catch_test_macros.hpp>
#include "server/shutdown_coordinator.hpp"

#include <atomic>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace hookrelay;

namespace {

ShutdownCoordinator::Config with_timeout(int ms) {
    ShutdownCoordinator::Config cfg;
    cfg.drain_timeout = std::chrono::milliseconds(ms);
    return cfg;
}

} // namespace

TEST_CASE("ShutdownCoordinator: try_enter succeeds before shutdown", "[shutdown]") {
    ShutdownCoordinator sc;
    CHECK(sc.try_enter_request());
    CHECK(sc.in_flight_count() == 1);
    sc.leave_request();
    CHECK(sc.in_flight_count() == 0);
}

TEST_CASE("ShutdownCoordinator: try_enter fails after shutdown", "[shutdown]") {
    ShutdownCoordinator sc(with_timeout(100));
    sc.initiate_shutdown();
    CHECK_FALSE(sc.try_enter_request());
    CHECK(sc.is_shutting_down());
}

TEST_CASE("ShutdownCoordinator: hooks run once, in order, after the drain", "[shutdown]") {
    ShutdownCoordinator sc(with_timeout(5000));
    std::vector<std::string> order;
    std::atomic<uint32_t> in_flight_at_hook{99};

    sc.add_stop_hook("http", [&] {
        order.emplace_back("http");
        in_flight_at_hook = sc.in_flight_count();
    });
    sc.add_stop_hook("workers", [&] { order.emplace_back("workers"); });
    sc.add_stop_hook("sweeper", [&] { order.emplace_back("sweeper"); });

    REQUIRE(sc.try_enter_request());
    std::thread request([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        sc.leave_request();
    });

    sc.initiate_shutdown();
    request.join();

    CHECK(order == std::vector<std::string>{"http", "workers", "sweeper"});
    CHECK(in_flight_at_hook.load() == 0);

    sc.initiate_shutdown();
    CHECK(order.size() == 3);
}

TEST_CASE("ShutdownCoordinator: failing hook does not stop the others", "[shutdown]") {
    ShutdownCoordinator sc(with_timeout(100));
    bool second_ran = false;
    sc.add_stop_hook("broken", [] { throw std::runtime_error("stop failed"); });
    sc.add_stop_hook("next", [&] { second_ran = true; });

    sc.initiate_shutdown();
    CHECK(second_ran);
}

TEST_CASE("ShutdownCoordinator: hooks still run when the drain times out", "[shutdown]") {
    ShutdownCoordinator sc(with_timeout(50));
    bool ran = false;
    sc.add_stop_hook("workers", [&] { ran = true; });

    REQUIRE(sc.try_enter_request());
    const auto start = std::chrono::steady_clock::now();
    sc.initiate_shutdown();
    const auto elapsed = std::chrono::steady_clock::now() - start;

    CHECK(ran);
    CHECK(elapsed >= std::chrono::milliseconds(40));
    CHECK(sc.in_flight_count() == 1);
    sc.leave_request();
}

TEST_CASE("ShutdownCoordinator: wait_for_drain returns immediately when idle", "[shutdown]") {
    ShutdownCoordinator sc(with_timeout(100));
    sc.initiate_shutdown();

    const auto start = std::chrono::steady_clock::now();
    CHECK(sc.wait_for_drain());
    CHECK(std::chrono::steady_clock::now() - start < std::chrono::milliseconds(50));
}

TEST_CASE("ShutdownCoordinator: concurrent enter/leave/shutdown", "[shutdown]") {
    ShutdownCoordinator sc(with_timeout(2000));

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
