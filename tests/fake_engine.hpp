// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <courier/core/download.hpp>
#include <courier/core/janitor.hpp>
#include <courier/core/prefs.hpp>
#include <courier/core/registrar.hpp>
#include <courier/core/visibility.hpp>
#include <courier/engine/engine.hpp>
#include <courier/engine/error.hpp>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace courier::test {

// In-memory engine. Records every call; safe to use from the janitor thread.
class FakeEngine : public engine::Engine {
public:
    using DispatchResult = std::expected<engine::ExternalId, std::error_code>;

    std::expected<engine::EngineStatus, std::error_code> search(engine::ExternalId id) override {
        auto lock = std::lock_guard(mutex_);
        ++search_calls;
        if (search_error) {
            return std::unexpected(*search_error);
        }
        auto it = entries.find(id);
        if (it == entries.end()) {
            return std::unexpected(make_error_code(engine::EngineErrc::not_found));
        }
        return it->second;
    }

    DispatchResult dispatch(const engine::DispatchRequest& request) override {
        std::shared_future<void> gate;
        {
            auto lock = std::lock_guard(mutex_);
            requests.push_back(request);
            gate = dispatch_gate_;
        }
        entered_.notify_all();
        if (gate.valid()) {
            gate.wait();
        }

        auto lock = std::lock_guard(mutex_);
        if (!dispatch_results.empty()) {
            auto result = dispatch_results.front();
            dispatch_results.pop_front();
            if (result) {
                add_entry(*result);
            }
            return result;
        }
        auto id = next_id++;
        add_entry(id);
        return id;
    }

    std::error_code resume(engine::ExternalId id) override {
        auto lock = std::lock_guard(mutex_);
        resumed.push_back(id);
        return resume_result;
    }

    std::error_code pause(engine::ExternalId id) override {
        auto lock = std::lock_guard(mutex_);
        paused.push_back(id);
        return pause_result;
    }

    std::error_code cancel(engine::ExternalId id) override {
        auto lock = std::lock_guard(mutex_);
        canceled.push_back(id);
        return cancel_result;
    }

    std::error_code erase(engine::ExternalId id) override {
        auto lock = std::lock_guard(mutex_);
        erased.push_back(id);
        if (erase_result) {
            return erase_result;
        }
        entries.erase(id);
        return {};
    }

    void set_visibility(bool visible) noexcept override {
        auto lock = std::lock_guard(mutex_);
        visibility.push_back(visible);
    }

    engine::EngineTraits traits() const noexcept override { return engine_traits; }

    // Hold every dispatch() until release_dispatch()
    void block_dispatch() {
        auto lock = std::lock_guard(mutex_);
        dispatch_release_ = std::promise<void>();
        dispatch_gate_ = dispatch_release_.get_future().share();
    }

    void release_dispatch() {
        auto lock = std::lock_guard(mutex_);
        dispatch_release_.set_value();
        dispatch_gate_ = {};
    }

    // Wait until `count` dispatch calls have been entered
    bool wait_for_dispatches(std::size_t count,
                             std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        auto lock = std::unique_lock(mutex_);
        return entered_.wait_for(lock, timeout, [&] { return requests.size() >= count; });
    }

    engine::EngineStatus& entry(engine::ExternalId id) {
        auto lock = std::lock_guard(mutex_);
        return entries[id];
    }

    std::size_t dispatch_count() const {
        auto lock = std::lock_guard(mutex_);
        return requests.size();
    }

    // Plain state; touch only while no janitor job is pending
    std::map<engine::ExternalId, engine::EngineStatus> entries;
    std::deque<DispatchResult> dispatch_results;
    std::vector<engine::DispatchRequest> requests;
    std::vector<engine::ExternalId> resumed;
    std::vector<engine::ExternalId> paused;
    std::vector<engine::ExternalId> canceled;
    std::vector<engine::ExternalId> erased;
    std::vector<bool> visibility;

    std::optional<std::error_code> search_error;
    std::error_code resume_result;
    std::error_code pause_result;
    std::error_code cancel_result;
    std::error_code erase_result;
    engine::EngineTraits engine_traits;

    engine::ExternalId next_id{100};
    std::size_t search_calls{0};

private:
    void add_entry(engine::ExternalId id) {
        engine::EngineStatus status;
        status.id = id;
        status.state = engine::TransferState::in_progress;
        entries[id] = status;
    }

    mutable std::mutex mutex_;
    std::condition_variable entered_;
    std::promise<void> dispatch_release_;
    std::shared_future<void> dispatch_gate_;
};

// Registrar that only records what it was told
class RecordingRegistrar : public core::Registrar {
public:
    struct Change {
        core::DownloadState from;
        core::DownloadState to;
    };

    void set_dirty(core::Download&) override { ++dirty_marks; }

    void changed_state(core::Download& download, core::DownloadState old_state,
                       core::DownloadState new_state) override {
        changes.push_back({old_state, new_state});
        if (on_change) {
            on_change(download, new_state);
        }
    }

    void add_external_id(engine::ExternalId id, core::Download& download) override {
        routes[id] = &download;
    }

    void remove_external_id(engine::ExternalId id) override { routes.erase(id); }

    void start_download(core::Download& download) override {
        ++forced_starts;
        last_start = download.start();
    }

    std::function<void(core::Download&, core::DownloadState)> on_change;

    std::size_t dirty_marks{0};
    std::vector<Change> changes;
    std::map<engine::ExternalId, core::Download*> routes;
    std::size_t forced_starts{0};
    std::error_code last_start;
};

inline core::Prefs test_prefs() {
    core::Prefs prefs;
    prefs.erase_grace = std::chrono::milliseconds{0};
    prefs.flush_interval = std::chrono::milliseconds{50};
    return prefs;
}

// Everything a standalone Download needs
struct Harness {
    FakeEngine engine;
    RecordingRegistrar registrar;
    core::Prefs prefs = test_prefs();
    core::VisibilitySuppressor visibility{engine};
    core::Janitor janitor;

    core::DownloadServices services() {
        return {registrar, engine, janitor, visibility, prefs};
    }

    std::unique_ptr<core::Download> make(std::string url = "https://example.com/file.zip") {
        core::DownloadOptions options;
        options.url = std::move(url);
        options.dest = "/tmp/file.zip";
        return std::make_unique<core::Download>(services(), std::move(options));
    }

    std::unique_ptr<core::Download> make(core::DownloadOptions options) {
        return std::make_unique<core::Download>(services(), std::move(options));
    }

    std::unique_ptr<core::Download> make_in(core::DownloadState state,
                                           engine::ExternalId external_id = 0) {
        store::Snapshot snap;
        snap.url = "https://example.com/file.zip";
        snap.dest = "/tmp/file.zip";
        snap.state = state;
        snap.external_id = external_id;
        snap.written = 10;
        snap.total_size = 20;
        snap.server_name = "file.zip";
        return core::Download::from_snapshot(services(), snap);
    }
};

} // namespace courier::test
