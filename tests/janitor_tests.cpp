// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <courier/core/janitor.hpp>
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <vector>

using namespace courier::core;
using namespace std::chrono_literals;

TEST_CASE("Janitor runs posted jobs", "[janitor]") {
    Janitor janitor;
    std::atomic<int> runs{0};

    SECTION("Immediate jobs") {
        for (int i = 0; i < 10; ++i) {
            janitor.post([&runs] { ++runs; });
        }
        janitor.drain();
        CHECK(runs == 10);
        CHECK(janitor.pending() == 0);
    }

    SECTION("Delayed jobs run in due-time order") {
        std::mutex mutex;
        std::vector<int> order;
        auto record = [&](int n) {
            return [&, n] {
                auto lock = std::lock_guard(mutex);
                order.push_back(n);
            };
        };

        janitor.post(record(3), 60ms);
        janitor.post(record(2), 30ms);
        janitor.post(record(1));
        janitor.drain();

        CHECK(order == std::vector<int>{1, 2, 3});
    }

    SECTION("A throwing job does not stop the worker") {
        janitor.post([] { throw std::runtime_error("boom"); });
        janitor.post([&runs] { ++runs; });
        janitor.drain();
        CHECK(runs == 1);
    }

    SECTION("Non-standard exceptions are contained too") {
        janitor.post([] { throw 42; });
        janitor.post([&runs] { ++runs; });
        janitor.drain();
        CHECK(runs == 1);
    }

    SECTION("Drain on an idle janitor returns at once") {
        janitor.drain();
        CHECK(janitor.pending() == 0);
    }
}

TEST_CASE("Janitor drops pending jobs on destruction", "[janitor]") {
    std::atomic<int> runs{0};
    {
        Janitor janitor;
        janitor.post([&runs] { ++runs; }, 10s);
        CHECK(janitor.pending() == 1);
    }
    CHECK(runs == 0);
}
