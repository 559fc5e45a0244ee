#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include <catch2/catch.hpp>

#include "remote_fleet/admission_gate.hpp"

using namespace remote_fleet;

TEST_CASE("AdmissionGate caps simultaneous holders") {
    AdmissionGate gate{2};
    std::atomic<int> holders{0};
    std::atomic<int> max_holders{0};

    std::vector<std::thread> list_threads;
    for (int index = 0; index < 6; ++index) {
        list_threads.emplace_back([&]() {
            gate.acquire();
            const int now_holding = ++holders;
            int observed = max_holders.load();
            while (now_holding > observed && !max_holders.compare_exchange_weak(observed, now_holding)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            --holders;
            gate.release();
        });
    }
    for (std::thread& worker : list_threads) {
        worker.join();
    }

    REQUIRE(max_holders.load() <= 2);
    REQUIRE(gate.peak_in_flight() <= 2);
    REQUIRE(gate.peak_in_flight() >= 1);
    REQUIRE(gate.in_flight() == 0);
}

TEST_CASE("AdmissionGate gives up at the deadline") {
    AdmissionGate gate{1};
    gate.acquire();

    const TimePoint started_at = SteadyClock::now();
    REQUIRE_FALSE(gate.acquire_until(started_at + std::chrono::milliseconds(50)));
    REQUIRE(SteadyClock::now() - started_at >= std::chrono::milliseconds(45));

    gate.release();
    REQUIRE(gate.acquire_until(SteadyClock::now() + std::chrono::milliseconds(50)));
    gate.release();
}

TEST_CASE("AdmissionGate treats zero capacity as one") {
    AdmissionGate gate{0};
    REQUIRE(gate.capacity() == 1);
}
