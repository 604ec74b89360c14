// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <courier/core/download_state.hpp>
#include <courier/core/error.hpp>
#include <courier/core/janitor.hpp>
#include <courier/core/prefs.hpp>
#include <courier/core/registrar.hpp>
#include <courier/core/visibility.hpp>
#include <courier/engine/engine.hpp>
#include <courier/store/snapshot.hpp>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <thread>

namespace courier::core {

// Collaborators shared by every Download of one manager
struct DownloadServices {
    Registrar& registrar;
    engine::Engine& engine;
    Janitor& janitor;
    VisibilitySuppressor& visibility;
    const Prefs& prefs;
};

// Request attributes, fixed at creation
struct DownloadOptions {
    std::string url;
    std::string dest;
    std::optional<std::string> post_data;
    std::string referrer;
    bool is_private{false};
};

// One delegated download task.
//
// Driven from the owner's thread; only start() may be entered concurrently,
// and concurrent calls share a single dispatch.
class Download {
public:
    Download(DownloadServices services, DownloadOptions options);

    Download(const Download&) = delete;
    Download& operator=(const Download&) = delete;
    Download(Download&&) = delete;
    Download& operator=(Download&&) = delete;

    [[nodiscard]] static std::unique_ptr<Download>
    from_snapshot(DownloadServices services, const store::Snapshot& snapshot);

    // Dispatch a QUEUED task to the engine, adopting a stale dispatch from a
    // previous session when the engine still has it. Returns invalid_state
    // when not QUEUED, or when re-entered from the thread already running
    // start() (e.g. from a state observer), and dispatch_failed when the
    // engine refused the transfer (the task is then CANCELED with the
    // engine's message).
    [[nodiscard]] std::error_code start() noexcept;

    // Re-queue; `forced` asks the registrar to dispatch right away
    void resume(bool forced = false) noexcept;

    // control_failed if the engine refused, the task then stays RUNNING
    [[nodiscard]] std::error_code pause() noexcept;

    void cancel() noexcept;

    // Engine lost track of the transfer; applies in any state
    void set_missing() noexcept;

    // Returns true if the task turned MISSING
    [[nodiscard]] bool maybe_missing() noexcept;

    void adopt_size(const engine::EngineStatus& status) noexcept;

    // Pull the engine's status and map it onto the local state
    void update_state_from_engine() noexcept;

    void change_state(DownloadState new_state) noexcept;
    void mark_dirty() noexcept;

    [[nodiscard]] store::Snapshot to_snapshot() const;
    [[nodiscard]] std::string describe() const;

    [[nodiscard]] std::int64_t id() const noexcept { return id_; }
    void id(std::int64_t id) noexcept { id_ = id; }

    [[nodiscard]] std::int64_t position() const noexcept { return position_; }
    void position(std::int64_t position) noexcept { position_ = position; }

    [[nodiscard]] engine::ExternalId external_id() const noexcept { return external_id_; }
    [[nodiscard]] bool is_dispatched() const noexcept { return external_id_ != 0; }

    [[nodiscard]] DownloadState state() const noexcept { return state_; }
    [[nodiscard]] const std::string& error() const noexcept { return error_; }
    [[nodiscard]] std::uint64_t written() const noexcept { return written_; }
    [[nodiscard]] std::uint64_t total_size() const noexcept { return total_size_; }
    [[nodiscard]] const std::string& server_name() const noexcept { return server_name_; }

    [[nodiscard]] const std::string& url() const noexcept { return options_.url; }
    [[nodiscard]] const std::string& dest() const noexcept { return options_.dest; }
    [[nodiscard]] const std::optional<std::string>& post_data() const noexcept { return options_.post_data; }
    [[nodiscard]] const std::string& referrer() const noexcept { return options_.referrer; }
    [[nodiscard]] bool is_private() const noexcept { return options_.is_private; }

private:
    [[nodiscard]] std::error_code do_start() noexcept;

    // Returns true if the engine still runs or can resume the old dispatch
    [[nodiscard]] bool adopt_stale_dispatch() noexcept;

    [[nodiscard]] engine::DispatchRequest build_request() const;

    // Unregister the current dispatch and clean it up in the background
    void drop_dispatch() noexcept;
    void remove_from_engine(engine::ExternalId id) noexcept;

    void reset() noexcept;

    DownloadServices services_;
    DownloadOptions options_;

    std::int64_t id_{-1};
    std::int64_t position_{-1};
    engine::ExternalId external_id_{0};
    DownloadState state_{DownloadState::queued};
    std::string error_;
    std::uint64_t written_{0};
    std::uint64_t total_size_{0};
    std::string server_name_;

    std::shared_future<std::error_code> start_inflight_;
    std::thread::id start_owner_;
    std::mutex start_mutex_;
};

} // namespace courier::core
