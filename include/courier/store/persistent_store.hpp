// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <courier/store/snapshot.hpp>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <vector>

struct sqlite3;

namespace courier::core {
class Download;
}

namespace courier::store {

// SQLite-backed queue of task snapshots.
//
// One table keyed by an auto-assigned local id with an index on position.
// Every mutating call is a single transaction: either all rows land or none.
class PersistentStore {
public:
    // ":memory:" keeps the database in memory
    explicit PersistentStore(std::string path);
    ~PersistentStore();

    PersistentStore(const PersistentStore&) = delete;
    PersistentStore& operator=(const PersistentStore&) = delete;

    // Open and migrate; later calls are no-ops once open
    [[nodiscard]] std::error_code initialize() noexcept;

    // All snapshots in position order
    [[nodiscard]] std::expected<std::vector<Snapshot>, std::error_code> get_all() noexcept;

    // Upsert every non-private task. RUNNING and RETRYING tasks are stored as
    // QUEUED. New rows' ids are written back once the batch commits.
    [[nodiscard]] std::error_code save_items(const std::vector<core::Download*>& items) noexcept;

    // Delete every non-private task that has a local id
    [[nodiscard]] std::error_code delete_items(const std::vector<core::Download*>& items) noexcept;

    // Upsert raw snapshots; new ids are written back into `snapshots`
    [[nodiscard]] std::error_code save_snapshots(std::vector<Snapshot>& snapshots) noexcept;

    [[nodiscard]] std::error_code delete_ids(const std::vector<std::int64_t>& ids) noexcept;

    [[nodiscard]] std::expected<std::size_t, std::error_code> count() noexcept;

    // On-disk schema version, 0 when not open
    [[nodiscard]] std::int32_t schema_version() const noexcept;

    [[nodiscard]] bool is_open() const noexcept;
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

    void close() noexcept;

private:
    struct DbCloser {
        void operator()(sqlite3* db) const noexcept;
    };

    [[nodiscard]] std::error_code open_locked() noexcept;
    [[nodiscard]] std::error_code migrate_locked() noexcept;
    [[nodiscard]] std::error_code save_locked(std::vector<Snapshot>& snapshots,
                                              std::vector<std::int64_t>& assigned) noexcept;

    std::string path_;
    std::unique_ptr<sqlite3, DbCloser> db_;
    std::int32_t version_{0};
    mutable std::mutex mutex_;
};

} // namespace courier::store
