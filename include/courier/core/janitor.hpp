// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <stop_token>
#include <thread>

namespace courier::core {

// Runs fire-and-forget engine work (resume, cancel, erase) off the caller's
// thread. Jobs run one at a time in due-time order; a job that throws
// anything is logged and dropped.
class Janitor {
public:
    using Job = std::function<void()>;

    Janitor();
    ~Janitor();

    Janitor(const Janitor&) = delete;
    Janitor& operator=(const Janitor&) = delete;
    Janitor(Janitor&&) = delete;
    Janitor& operator=(Janitor&&) = delete;

    // Queue a job to run once `delay` has elapsed
    void post(Job job, std::chrono::milliseconds delay = std::chrono::milliseconds{0});

    // Block until every queued job, delayed ones included, has run
    void drain() noexcept;

    [[nodiscard]] std::size_t pending() const noexcept;

private:
    void run(std::stop_token stoken) noexcept;

    std::multimap<std::chrono::steady_clock::time_point, Job> jobs_;
    bool busy_{false};
    mutable std::mutex mutex_;
    std::condition_variable_any wake_;
    std::condition_variable_any idle_;
    std::jthread worker_;
};

} // namespace courier::core
