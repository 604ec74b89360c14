// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <courier/core/download.hpp>
#include <courier/core/janitor.hpp>
#include <courier/core/prefs.hpp>
#include <courier/core/registrar.hpp>
#include <courier/core/visibility.hpp>
#include <courier/engine/engine.hpp>
#include <courier/store/persistent_store.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <system_error>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace courier::core {

using StateCallback = std::function<void(const Download&, DownloadState, DownloadState)>;

// Owns the task collection, routes engine events by external id and
// persists dirty tasks in coalesced batches.
//
// Not thread-safe: drive it from one thread (the host's event loop). The
// engine and the store must outlive the manager.
class DownloadManager final : public Registrar {
public:
    using Clock = std::chrono::steady_clock;

    DownloadManager(engine::Engine& engine, store::PersistentStore& store, Prefs prefs);
    ~DownloadManager() override;

    DownloadManager(const DownloadManager&) = delete;
    DownloadManager& operator=(const DownloadManager&) = delete;

    // Open the store and restore every persisted task
    [[nodiscard]] std::error_code init() noexcept;

    // New QUEUED task at the end of the queue
    Download& add(DownloadOptions options);

    // Cancel, forget and delete from the store
    [[nodiscard]] std::error_code remove(const std::vector<Download*>& downloads) noexcept;

    [[nodiscard]] Download* find(std::int64_t id) const noexcept;
    [[nodiscard]] Download* find_by_external_id(engine::ExternalId id) const noexcept;

    // Tasks in position order
    [[nodiscard]] std::vector<Download*> downloads() const;
    [[nodiscard]] std::size_t size() const noexcept { return downloads_.size(); }

    // Engine reported a change for `id`
    void on_engine_changed(engine::ExternalId id) noexcept;

    // Engine forgot `id`
    void on_engine_erased(engine::ExternalId id) noexcept;

    // maybe_missing() on every dispatched task; returns how many went MISSING
    std::size_t reconcile() noexcept;

    // Start QUEUED tasks while fewer than Prefs::concurrent_downloads run;
    // returns how many were started
    std::size_t schedule() noexcept;

    // Persist every dirty task now
    [[nodiscard]] std::error_code flush() noexcept;

    // Timer hook: flush once the oldest dirty mark is flush_interval old,
    // then run a scheduling pass if a state change asked for one
    [[nodiscard]] std::error_code tick(Clock::time_point now = Clock::now()) noexcept;

    [[nodiscard]] std::size_t dirty_count() const noexcept { return dirty_.size(); }
    [[nodiscard]] std::size_t running_count() const noexcept;

    void on_state_changed(StateCallback callback) { callbacks_.push_back(std::move(callback)); }

    [[nodiscard]] const Prefs& prefs() const noexcept { return prefs_; }
    [[nodiscard]] Janitor& janitor() noexcept { return janitor_; }

    // Registrar
    void set_dirty(Download& download) override;
    void changed_state(Download& download, DownloadState old_state,
                       DownloadState new_state) override;
    void add_external_id(engine::ExternalId id, Download& download) override;
    void remove_external_id(engine::ExternalId id) override;
    void start_download(Download& download) override;

private:
    [[nodiscard]] DownloadServices services() noexcept;
    void forget(Download& download) noexcept;

    engine::Engine& engine_;
    store::PersistentStore& store_;
    Prefs prefs_;

    VisibilitySuppressor visibility_;

    std::vector<std::unique_ptr<Download>> downloads_;
    std::unordered_map<engine::ExternalId, Download*> by_external_id_;
    std::unordered_set<Download*> dirty_;
    std::optional<Clock::time_point> dirty_since_;
    bool schedule_pending_{false};
    std::int64_t next_position_{0};

    std::vector<StateCallback> callbacks_;

    // Last: background cleanup may still reference the engine
    Janitor janitor_;
};

} // namespace courier::core
