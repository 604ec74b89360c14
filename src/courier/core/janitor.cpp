// Copyright (c) 2026 changcheng967. All rights reserved.

#include <courier/core/janitor.hpp>
#include <courier/core/logging.hpp>
#include <exception>

namespace courier::core {

namespace chrono = std::chrono;

Janitor::Janitor()
    : worker_([this](std::stop_token stoken) { run(stoken); }) {}

Janitor::~Janitor() {
    worker_.request_stop();
    if (worker_.joinable()) {
        worker_.join();
    }

    if (!jobs_.empty()) {
        logger()->debug("janitor: dropping {} pending job(s) on shutdown", jobs_.size());
    }
}

void Janitor::post(Job job, chrono::milliseconds delay) {
    {
        auto lock = std::lock_guard(mutex_);
        jobs_.emplace(chrono::steady_clock::now() + delay, std::move(job));
    }
    wake_.notify_all();
}

void Janitor::drain() noexcept {
    auto lock = std::unique_lock(mutex_);
    idle_.wait(lock, [this] { return jobs_.empty() && !busy_; });
}

std::size_t Janitor::pending() const noexcept {
    auto lock = std::lock_guard(mutex_);
    return jobs_.size() + (busy_ ? 1 : 0);
}

void Janitor::run(std::stop_token stoken) noexcept {
    auto lock = std::unique_lock(mutex_);

    while (!stoken.stop_requested()) {
        if (jobs_.empty()) {
            wake_.wait(lock, stoken, [this] { return !jobs_.empty(); });
            continue;
        }

        auto due = jobs_.begin()->first;
        if (chrono::steady_clock::now() < due) {
            // Wake early if an earlier job is posted meanwhile
            wake_.wait_until(lock, stoken, due, [this, due] {
                return !jobs_.empty() && jobs_.begin()->first < due;
            });
            continue;
        }

        auto job = std::move(jobs_.begin()->second);
        jobs_.erase(jobs_.begin());
        busy_ = true;
        lock.unlock();

        try {
            job();
        } catch (const std::exception& e) {
            logger()->warn("janitor: background job failed: {}", e.what());
        } catch (...) {
            logger()->warn("janitor: background job failed with a non-standard exception");
        }

        lock.lock();
        busy_ = false;
        if (jobs_.empty()) {
            idle_.notify_all();
        }
    }

    // Let drain() callers go if we stop with work left
    idle_.notify_all();
}

} // namespace courier::core
