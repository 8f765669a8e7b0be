#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"

#include "warm_transfer/core/shutdown_watcher.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace std::chrono_literals;
using warm_transfer::ShutdownWatcher;
using warm_transfer::testing::wait_until;

TEST_CASE("shutdown watcher runs the callback once the flag is raised") {
    std::atomic<bool> requested{false};
    std::atomic<int> calls{0};
    ShutdownWatcher watcher(requested, [&calls]() { ++calls; }, 5ms);

    requested = true;
    REQUIRE(wait_until([&]() { return calls == 1; }));
    watcher.stop();
    REQUIRE(calls == 1);
}

TEST_CASE("shutdown watcher is joined when the owning scope unwinds") {
    std::atomic<bool> requested{false};
    std::atomic<int> calls{0};
    auto run_and_fail = [&]() {
        ShutdownWatcher watcher(requested, [&calls]() { ++calls; }, 5ms);
        throw std::runtime_error("event loop failed");
    };

    REQUIRE_THROWS_AS(run_and_fail(), std::runtime_error);
    requested = true;
    std::this_thread::sleep_for(30ms);
    REQUIRE(calls == 0);
}
