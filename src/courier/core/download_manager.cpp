// Copyright (c) 2026 changcheng967. All rights reserved.

#include <courier/core/download_manager.hpp>
#include <courier/core/logging.hpp>
#include <algorithm>

namespace courier::core {

DownloadManager::DownloadManager(engine::Engine& engine, store::PersistentStore& store, Prefs prefs)
    : engine_(engine)
    , store_(store)
    , prefs_(std::move(prefs))
    , visibility_(engine) {}

DownloadManager::~DownloadManager() {
    if (!dirty_.empty()) {
        if (auto ec = flush()) {
            logger()->error("lost {} unsaved download(s) on shutdown: {}", dirty_.size(), ec.message());
        }
    }
}

DownloadServices DownloadManager::services() noexcept {
    return {*this, engine_, janitor_, visibility_, prefs_};
}

//=============================================================================
// Collection
//=============================================================================

std::error_code DownloadManager::init() noexcept {
    if (auto ec = store_.initialize()) {
        return ec;
    }

    auto items = store_.get_all();
    if (!items) {
        return items.error();
    }

    for (const auto& snap : *items) {
        auto download = Download::from_snapshot(services(), snap);
        next_position_ = std::max(next_position_, snap.position + 1);
        if (download->is_dispatched()) {
            by_external_id_[download->external_id()] = download.get();
        }
        downloads_.push_back(std::move(download));
    }

    logger()->info("restored {} download(s) from {}", items->size(), store_.path());
    schedule_pending_ = true;
    return {};
}

Download& DownloadManager::add(DownloadOptions options) {
    auto download = std::make_unique<Download>(services(), std::move(options));
    download->position(next_position_++);

    auto& ref = *download;
    downloads_.push_back(std::move(download));
    logger()->debug("added {}", ref.describe());

    set_dirty(ref);
    schedule_pending_ = true;
    return ref;
}

std::error_code DownloadManager::remove(const std::vector<Download*>& downloads) noexcept {
    std::vector<Download*> owned;
    for (auto* download : downloads) {
        auto it = std::find_if(downloads_.begin(), downloads_.end(),
                               [download](const auto& d) { return d.get() == download; });
        if (it != downloads_.end()) {
            owned.push_back(download);
        }
    }

    if (auto ec = store_.delete_items(owned)) {
        logger()->error("cannot delete {} download(s) from the store: {}", owned.size(), ec.message());
        return ec;
    }

    for (auto* download : owned) {
        download->cancel();
        forget(*download);
    }
    return {};
}

void DownloadManager::forget(Download& download) noexcept {
    if (download.is_dispatched()) {
        // Finished tasks keep their engine entry
        by_external_id_.erase(download.external_id());
    }
    dirty_.erase(&download);
    if (dirty_.empty()) {
        dirty_since_.reset();
    }

    std::erase_if(downloads_, [&download](const auto& d) { return d.get() == &download; });
}

Download* DownloadManager::find(std::int64_t id) const noexcept {
    if (id < 0) {
        return nullptr;
    }
    auto it = std::find_if(downloads_.begin(), downloads_.end(),
                           [id](const auto& d) { return d->id() == id; });
    return it == downloads_.end() ? nullptr : it->get();
}

Download* DownloadManager::find_by_external_id(engine::ExternalId id) const noexcept {
    auto it = by_external_id_.find(id);
    return it == by_external_id_.end() ? nullptr : it->second;
}

std::vector<Download*> DownloadManager::downloads() const {
    std::vector<Download*> result;
    result.reserve(downloads_.size());
    for (const auto& d : downloads_) {
        result.push_back(d.get());
    }
    std::stable_sort(result.begin(), result.end(),
                     [](const Download* a, const Download* b) { return a->position() < b->position(); });
    return result;
}

std::size_t DownloadManager::running_count() const noexcept {
    return static_cast<std::size_t>(std::count_if(downloads_.begin(), downloads_.end(),
        [](const auto& d) { return d->state() == DownloadState::running; }));
}

//=============================================================================
// Engine events
//=============================================================================

void DownloadManager::on_engine_changed(engine::ExternalId id) noexcept {
    auto* download = find_by_external_id(id);
    if (!download) {
        logger()->debug("ignoring change of unknown engine download {}", id);
        return;
    }
    download->update_state_from_engine();
}

void DownloadManager::on_engine_erased(engine::ExternalId id) noexcept {
    auto* download = find_by_external_id(id);
    if (!download) {
        return;
    }
    logger()->info("engine forgot {}", download->describe());
    download->set_missing();
}

std::size_t DownloadManager::reconcile() noexcept {
    std::size_t missing = 0;
    for (auto* download : downloads()) {
        if (download->maybe_missing()) {
            ++missing;
        }
    }
    if (missing > 0) {
        logger()->info("reconcile: {} download(s) went missing", missing);
    }
    return missing;
}

//=============================================================================
// Scheduling and persistence
//=============================================================================

std::size_t DownloadManager::schedule() noexcept {
    auto running = running_count();
    std::size_t started = 0;

    for (auto* download : downloads()) {
        if (running >= prefs_.concurrent_downloads) {
            break;
        }
        if (download->state() != DownloadState::queued) {
            continue;
        }

        if (auto ec = download->start()) {
            logger()->warn("could not start {}: {}", download->describe(), ec.message());
            continue;
        }
        if (download->state() == DownloadState::running) {
            ++running;
            ++started;
        }
    }

    schedule_pending_ = false;
    return started;
}

std::error_code DownloadManager::flush() noexcept {
    if (dirty_.empty()) {
        return {};
    }

    std::vector<Download*> batch(dirty_.begin(), dirty_.end());
    if (auto ec = store_.save_items(batch)) {
        logger()->error("saving {} download(s) failed: {}", batch.size(), ec.message());
        return ec;
    }

    logger()->trace("saved {} download(s)", batch.size());
    dirty_.clear();
    dirty_since_.reset();
    return {};
}

std::error_code DownloadManager::tick(Clock::time_point now) noexcept {
    std::error_code result;
    if (dirty_since_ && now - *dirty_since_ >= prefs_.flush_interval) {
        result = flush();
    }
    if (schedule_pending_) {
        schedule();
    }
    return result;
}

//=============================================================================
// Registrar
//=============================================================================

void DownloadManager::set_dirty(Download& download) {
    dirty_.insert(&download);
    if (!dirty_since_) {
        dirty_since_ = Clock::now();
    }
}

void DownloadManager::changed_state(Download& download, DownloadState old_state,
                                    DownloadState new_state) {
    schedule_pending_ = true;

    for (const auto& callback : callbacks_) {
        try {
            callback(download, old_state, new_state);
        } catch (const std::exception& e) {
            logger()->error("state callback failed: {}", e.what());
        }
    }
}

void DownloadManager::add_external_id(engine::ExternalId id, Download& download) {
    by_external_id_[id] = &download;
    logger()->debug("engine download {} -> {}", id, download.describe());
}

void DownloadManager::remove_external_id(engine::ExternalId id) {
    by_external_id_.erase(id);
}

void DownloadManager::start_download(Download& download) {
    auto ec = download.start();
    if (ec == CourierErrc::invalid_state && download.state() == DownloadState::queued) {
        // Its own start() is still on the stack; the next pass dispatches it
        schedule_pending_ = true;
        return;
    }
    if (ec) {
        logger()->warn("forced start of {} failed: {}", download.describe(), ec.message());
    }
}

} // namespace courier::core
