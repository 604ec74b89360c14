// Copyright (c) 2026 changcheng967. All rights reserved.

#include <courier/core/download.hpp>
#include <courier/core/config.hpp>
#include <courier/core/logging.hpp>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <thread>
#include <utility>

namespace courier::core {

namespace {

// Last path component; the engine may report either separator
std::string file_name_of(const std::string& path) {
    auto pos = path.find_last_of("/\\");
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

} // namespace

//=============================================================================
// Construction and persistence
//=============================================================================

Download::Download(DownloadServices services, DownloadOptions options)
    : services_(services)
    , options_(std::move(options)) {}

std::unique_ptr<Download>
Download::from_snapshot(DownloadServices services, const store::Snapshot& snapshot) {
    DownloadOptions options;
    options.url = snapshot.url;
    options.dest = snapshot.dest;
    options.post_data = snapshot.post_data;
    options.referrer = snapshot.referrer;

    auto download = std::make_unique<Download>(services, std::move(options));
    download->id_ = snapshot.id;
    download->position_ = snapshot.position;
    download->external_id_ = snapshot.external_id;
    download->state_ = snapshot.state;
    download->error_ = snapshot.error;
    download->written_ = snapshot.written;
    download->total_size_ = snapshot.total_size;
    download->server_name_ = snapshot.server_name;
    return download;
}

store::Snapshot Download::to_snapshot() const {
    store::Snapshot snap;
    snap.id = id_;
    snap.external_id = external_id_;
    snap.state = state_;
    snap.position = position_;
    snap.error = error_;
    snap.written = written_;
    snap.total_size = total_size_;
    snap.server_name = server_name_;
    snap.url = options_.url;
    snap.dest = options_.dest;
    snap.post_data = options_.post_data;
    snap.referrer = options_.referrer;
    return snap;
}

std::string Download::describe() const {
    return fmt::format("Download(id={}, ext={}, state={}, url={})",
                       id_, external_id_, to_string(state_), options_.url);
}

//=============================================================================
// State bookkeeping
//=============================================================================

void Download::mark_dirty() noexcept {
    services_.registrar.set_dirty(*this);
}

void Download::change_state(DownloadState new_state) noexcept {
    auto old_state = state_;
    if (old_state == new_state) {
        return;
    }

    state_ = new_state;
    error_.clear();
    logger()->trace("{}: {} -> {}", describe(), to_string(old_state), to_string(new_state));
    services_.registrar.changed_state(*this, old_state, new_state);
    mark_dirty();
}

void Download::reset() noexcept {
    external_id_ = 0;
    written_ = 0;
    total_size_ = 0;
    server_name_.clear();
}

void Download::adopt_size(const engine::EngineStatus& status) noexcept {
    written_ = static_cast<std::uint64_t>(std::max<std::int64_t>(0, status.bytes_received));

    auto total = (status.file_size && *status.file_size >= 0)
        ? *status.file_size
        : status.total_bytes;
    total_size_ = static_cast<std::uint64_t>(std::max<std::int64_t>(0, total));
}

//=============================================================================
// Dispatch
//=============================================================================

std::error_code Download::start() noexcept {
    const auto self = std::this_thread::get_id();
    std::promise<std::error_code> promise;
    std::shared_future<std::error_code> joined;
    bool reentered = false;
    {
        auto lock = std::lock_guard(start_mutex_);
        if (start_inflight_.valid()) {
            // Joining our own call would wait forever
            reentered = start_owner_ == self;
            if (!reentered) {
                joined = start_inflight_;
            }
        } else {
            start_inflight_ = promise.get_future().share();
            start_owner_ = self;
        }
    }

    if (reentered) {
        logger()->debug("{}: start re-entered during dispatch, deferring", describe());
        return make_error_code(CourierErrc::invalid_state);
    }
    if (joined.valid()) {
        return joined.get();
    }

    auto result = do_start();
    {
        auto lock = std::lock_guard(start_mutex_);
        start_inflight_ = {};
        start_owner_ = {};
    }
    promise.set_value(result);
    return result;
}

std::error_code Download::do_start() noexcept {
    if (state_ != DownloadState::queued) {
        logger()->debug("{}: start refused, not queued", describe());
        return make_error_code(CourierErrc::invalid_state);
    }

    if (external_id_ != 0 && adopt_stale_dispatch()) {
        return {};
    }

    // Adopting may have moved us on
    if (state_ != DownloadState::queued) {
        return make_error_code(CourierErrc::invalid_state);
    }

    logger()->info("starting {}", describe());
    change_state(DownloadState::running);

    std::expected<engine::ExternalId, std::error_code> result;
    try {
        auto request = build_request();

        auto scope = services_.visibility.suppress();
        result = services_.engine.dispatch(request);
        if (!result && request.has_header(REFERRER_HEADER)) {
            logger()->warn("{}: dispatch failed ({}), retrying without referrer",
                           describe(), result.error().message());
            request.remove_header(REFERRER_HEADER);
            result = services_.engine.dispatch(request);
        }
    } catch (const std::exception& e) {
        logger()->error("{}: cannot build dispatch request: {}", describe(), e.what());
        result = std::unexpected(make_error_code(engine::EngineErrc::invalid_request));
    }

    if (!result) {
        auto message = result.error().message();
        logger()->error("failed to start {}: {}", describe(), message);
        change_state(DownloadState::canceled);
        // An observer may already have re-queued the task
        if (state_ == DownloadState::canceled) {
            error_ = message;
        }
        return make_error_code(CourierErrc::dispatch_failed);
    }

    external_id_ = *result;
    services_.registrar.add_external_id(external_id_, *this);
    mark_dirty();
    return {};
}

bool Download::adopt_stale_dispatch() noexcept {
    const auto id = external_id_;
    auto status = services_.engine.search(id);

    if (status && status->state == engine::TransferState::in_progress) {
        change_state(DownloadState::running);
        update_state_from_engine();
        return true;
    }

    if (status && status->can_resume) {
        auto& engine = services_.engine;
        services_.janitor.post([&engine, id] {
            if (auto ec = engine.resume(id)) {
                logger()->warn("resume of engine download {} failed: {}", id, ec.message());
            }
        });
        change_state(DownloadState::running);
        return true;
    }

    logger()->info("{}: dropping stale dispatch: {}", describe(),
                   status ? std::string("cannot resume") : status.error().message());
    drop_dispatch();
    return false;
}

engine::DispatchRequest Download::build_request() const {
    const auto traits = services_.engine.traits();

    engine::DispatchRequest request;
    request.filename = options_.dest;
    request.conflict_action = services_.prefs.conflict_action;
    request.save_as = false;
    request.url = options_.url;

    if (options_.is_private && traits.private_dispatch) {
        request.incognito = true;
    }
    if (options_.post_data) {
        request.method = std::string(POST_METHOD);
        request.body = *options_.post_data;
    }
    if (!options_.referrer.empty() && traits.request_headers) {
        request.headers.push_back({std::string(REFERRER_HEADER), options_.referrer});
    }
    return request;
}

//=============================================================================
// Control
//=============================================================================

void Download::resume(bool forced) noexcept {
    if (!permits(Capability::forcable, state_)) {
        return;
    }
    if (state_ != DownloadState::queued) {
        change_state(DownloadState::queued);
    }
    if (forced) {
        services_.registrar.start_download(*this);
    }
}

std::error_code Download::pause() noexcept {
    if (!permits(Capability::pausable, state_)) {
        return {};
    }

    if (state_ == DownloadState::running && external_id_ != 0) {
        if (auto ec = services_.engine.pause(external_id_)) {
            logger()->error("pause {}: {}", describe(), ec.message());
            return make_error_code(CourierErrc::control_failed);
        }
    }

    change_state(DownloadState::paused);
    return {};
}

void Download::cancel() noexcept {
    if (!permits(Capability::cancelable, state_)) {
        return;
    }
    drop_dispatch();
    reset();
    change_state(DownloadState::canceled);
}

void Download::set_missing() noexcept {
    drop_dispatch();
    reset();
    change_state(DownloadState::missing);
}

void Download::drop_dispatch() noexcept {
    if (external_id_ == 0) {
        return;
    }
    auto id = std::exchange(external_id_, 0);
    services_.registrar.remove_external_id(id);
    remove_from_engine(id);
}

void Download::remove_from_engine(engine::ExternalId id) noexcept {
    auto& engine = services_.engine;

    services_.janitor.post([&engine, id] {
        if (auto ec = engine.cancel(id)) {
            logger()->debug("cancel of engine download {}: {}", id, ec.message());
        }
    });

    // Some engines finish canceling asynchronously and refuse an early erase
    services_.janitor.post([&engine, id] {
        if (auto ec = engine.erase(id)) {
            logger()->warn("erase of engine download {} failed: {}", id, ec.message());
        }
    }, services_.prefs.erase_grace);
}

//=============================================================================
// Reconciliation
//=============================================================================

bool Download::maybe_missing() noexcept {
    if (external_id_ == 0) {
        return false;
    }

    auto status = services_.engine.search(external_id_);
    if (!status) {
        if (status.error() != engine::EngineErrc::not_found) {
            logger()->error("{}: status query failed: {}", describe(), status.error().message());
        }
        set_missing();
        return true;
    }
    return false;
}

void Download::update_state_from_engine() noexcept {
    auto status = external_id_ != 0
        ? services_.engine.search(external_id_)
        : std::expected<engine::EngineStatus, std::error_code>(
              std::unexpect, make_error_code(engine::EngineErrc::not_found));

    if (!status) {
        logger()->error("{}: failed to handle engine state: {}", describe(), status.error().message());
        set_missing();
        return;
    }

    logger()->debug("{}: engine reports {}{}", describe(), engine::to_string(status->state),
                    status->paused ? " (paused)" : "");

    server_name_ = file_name_of(status->filename);
    adopt_size(*status);
    mark_dirty();

    switch (status->state) {
        case engine::TransferState::in_progress:
            if (status->error && !status->error->empty()) {
                cancel();
                error_ = *status->error;
            } else {
                change_state(DownloadState::running);
            }
            break;

        case engine::TransferState::interrupted:
            if (status->paused) {
                change_state(DownloadState::paused);
            } else {
                cancel();
                error_ = status->error.value_or(std::string{});
            }
            break;

        case engine::TransferState::complete:
            change_state(DownloadState::done);
            break;
    }
}

} // namespace courier::core
