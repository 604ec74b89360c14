// Copyright (c) 2026 changcheng967. All rights reserved.

#include <courier/store/persistent_store.hpp>
#include <courier/store/error.hpp>
#include <courier/core/config.hpp>
#include <courier/core/download.hpp>
#include <courier/core/logging.hpp>
#include <sqlite3.h>
#include <string_view>

namespace courier::store {

namespace {

struct StatementDeleter {
    void operator()(sqlite3_stmt* stmt) const noexcept { sqlite3_finalize(stmt); }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

std::error_code exec(sqlite3* db, const char* sql,
                     StoreErrc on_error = StoreErrc::statement_failed) noexcept {
    char* message = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &message) != SQLITE_OK) {
        core::logger()->error("store: {} failed: {}", sql, message ? message : sqlite3_errmsg(db));
        sqlite3_free(message);
        return make_error_code(on_error);
    }
    return {};
}

std::expected<Statement, std::error_code> prepare(sqlite3* db, std::string_view sql) noexcept {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql.data(), static_cast<int>(sql.size()), &raw, nullptr) != SQLITE_OK) {
        core::logger()->error("store: cannot prepare \"{}\": {}", sql, sqlite3_errmsg(db));
        return std::unexpected(make_error_code(StoreErrc::statement_failed));
    }
    return Statement(raw);
}

// Rolls back unless commit() succeeded
class Transaction {
public:
    explicit Transaction(sqlite3* db) noexcept : db_(db) {}

    ~Transaction() {
        if (active_) {
            (void)exec(db_, "ROLLBACK");
        }
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    [[nodiscard]] std::error_code begin() noexcept {
        if (auto ec = exec(db_, "BEGIN IMMEDIATE")) {
            return ec;
        }
        active_ = true;
        return {};
    }

    [[nodiscard]] std::error_code commit() noexcept {
        if (auto ec = exec(db_, "COMMIT", StoreErrc::commit_failed)) {
            return ec;
        }
        active_ = false;
        return {};
    }

private:
    sqlite3* db_;
    bool active_{false};
};

std::int32_t read_user_version(sqlite3* db) noexcept {
    auto stmt = prepare(db, "PRAGMA user_version");
    if (!stmt || sqlite3_step(stmt->get()) != SQLITE_ROW) {
        return -1;
    }
    return sqlite3_column_int(stmt->get(), 0);
}

} // namespace

void PersistentStore::DbCloser::operator()(sqlite3* db) const noexcept {
    sqlite3_close_v2(db);
}

PersistentStore::PersistentStore(std::string path)
    : path_(std::move(path)) {}

PersistentStore::~PersistentStore() = default;

//=============================================================================
// Lifecycle
//=============================================================================

std::error_code PersistentStore::initialize() noexcept {
    auto lock = std::lock_guard(mutex_);
    return open_locked();
}

std::error_code PersistentStore::open_locked() noexcept {
    if (db_) {
        return {};
    }

    sqlite3* raw = nullptr;
    int rc = sqlite3_open_v2(path_.c_str(), &raw,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    std::unique_ptr<sqlite3, DbCloser> db(raw);
    if (rc != SQLITE_OK) {
        core::logger()->error("store: cannot open {}: {}", path_,
                              raw ? sqlite3_errmsg(raw) : sqlite3_errstr(rc));
        return make_error_code(StoreErrc::open_failed);
    }

    sqlite3_busy_timeout(db.get(), static_cast<int>(core::DB_BUSY_TIMEOUT.count()));

    db_ = std::move(db);
    if (auto ec = migrate_locked()) {
        db_.reset();
        version_ = 0;
        return ec;
    }

    core::logger()->debug("store: opened {} (schema {})", path_, version_);
    return {};
}

std::error_code PersistentStore::migrate_locked() noexcept {
    auto version = read_user_version(db_.get());
    if (version < 0) {
        return make_error_code(StoreErrc::open_failed);
    }
    if (version > core::SCHEMA_VERSION) {
        core::logger()->error("store: {} has schema {}, newest known is {}",
                              path_, version, core::SCHEMA_VERSION);
        return make_error_code(StoreErrc::version_too_new);
    }
    if (version == core::SCHEMA_VERSION) {
        version_ = version;
        return {};
    }

    Transaction tx(db_.get());
    if (auto ec = tx.begin()) {
        return ec;
    }

    switch (version) {
        case 0:
            if (exec(db_.get(),
                     "CREATE TABLE queue ("
                     "id INTEGER PRIMARY KEY AUTOINCREMENT, "
                     "position INTEGER NOT NULL, "
                     "body TEXT NOT NULL)",
                     StoreErrc::migration_failed)) {
                return make_error_code(StoreErrc::migration_failed);
            }
            if (exec(db_.get(), "CREATE INDEX by_position ON queue(position)",
                     StoreErrc::migration_failed)) {
                return make_error_code(StoreErrc::migration_failed);
            }
            break;
        default:
            break;
    }

    auto pragma = "PRAGMA user_version = " + std::to_string(core::SCHEMA_VERSION);
    if (exec(db_.get(), pragma.c_str(), StoreErrc::migration_failed)) {
        return make_error_code(StoreErrc::migration_failed);
    }
    if (auto ec = tx.commit()) {
        return ec;
    }

    core::logger()->info("store: migrated {} from schema {} to {}", path_, version, core::SCHEMA_VERSION);
    version_ = core::SCHEMA_VERSION;
    return {};
}

void PersistentStore::close() noexcept {
    auto lock = std::lock_guard(mutex_);
    db_.reset();
    version_ = 0;
}

bool PersistentStore::is_open() const noexcept {
    auto lock = std::lock_guard(mutex_);
    return db_ != nullptr;
}

std::int32_t PersistentStore::schema_version() const noexcept {
    auto lock = std::lock_guard(mutex_);
    return version_;
}

//=============================================================================
// Queries
//=============================================================================

std::expected<std::vector<Snapshot>, std::error_code> PersistentStore::get_all() noexcept {
    auto lock = std::lock_guard(mutex_);
    if (auto ec = open_locked()) {
        return std::unexpected(ec);
    }

    auto stmt = prepare(db_.get(),
                        "SELECT id, body FROM queue INDEXED BY by_position ORDER BY position, id");
    if (!stmt) {
        return std::unexpected(stmt.error());
    }

    std::vector<Snapshot> items;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt->get())) == SQLITE_ROW) {
        auto id = sqlite3_column_int64(stmt->get(), 0);
        const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt->get(), 1));
        auto size = static_cast<std::size_t>(sqlite3_column_bytes(stmt->get(), 1));

        auto snap = Snapshot::deserialize(std::string_view(text ? text : "", size));
        if (!snap) {
            core::logger()->warn("store: skipping unreadable row {}", id);
            continue;
        }
        snap->id = id;
        items.push_back(std::move(*snap));
    }

    if (rc != SQLITE_DONE) {
        core::logger()->error("store: reading queue failed: {}", sqlite3_errmsg(db_.get()));
        return std::unexpected(make_error_code(StoreErrc::statement_failed));
    }
    return items;
}

std::expected<std::size_t, std::error_code> PersistentStore::count() noexcept {
    auto lock = std::lock_guard(mutex_);
    if (auto ec = open_locked()) {
        return std::unexpected(ec);
    }

    auto stmt = prepare(db_.get(), "SELECT COUNT(*) FROM queue");
    if (!stmt) {
        return std::unexpected(stmt.error());
    }
    if (sqlite3_step(stmt->get()) != SQLITE_ROW) {
        return std::unexpected(make_error_code(StoreErrc::statement_failed));
    }
    return static_cast<std::size_t>(sqlite3_column_int64(stmt->get(), 0));
}

//=============================================================================
// Batches
//=============================================================================

std::error_code PersistentStore::save_locked(std::vector<Snapshot>& snapshots,
                                             std::vector<std::int64_t>& assigned) noexcept {
    assigned.assign(snapshots.size(), -1);

    auto update = prepare(db_.get(), "INSERT OR REPLACE INTO queue (id, position, body) VALUES (?1, ?2, ?3)");
    auto insert = prepare(db_.get(), "INSERT INTO queue (position, body) VALUES (?1, ?2)");
    if (!update) return update.error();
    if (!insert) return insert.error();

    Transaction tx(db_.get());
    if (auto ec = tx.begin()) {
        return ec;
    }

    for (std::size_t i = 0; i < snapshots.size(); ++i) {
        const auto& snap = snapshots[i];
        std::string body;
        try {
            body = snap.serialize();
        } catch (const std::exception& e) {
            core::logger()->error("store: cannot serialize {}: {}", snap.url, e.what());
            return make_error_code(StoreErrc::corrupt_record);
        }

        sqlite3_stmt* stmt = nullptr;
        if (snap.id >= 0) {
            stmt = update->get();
            sqlite3_bind_int64(stmt, 1, snap.id);
            sqlite3_bind_int64(stmt, 2, snap.position);
            sqlite3_bind_text(stmt, 3, body.c_str(), static_cast<int>(body.size()), SQLITE_TRANSIENT);
        } else {
            stmt = insert->get();
            sqlite3_bind_int64(stmt, 1, snap.position);
            sqlite3_bind_text(stmt, 2, body.c_str(), static_cast<int>(body.size()), SQLITE_TRANSIENT);
        }

        int rc = sqlite3_step(stmt);
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
        if (rc != SQLITE_DONE) {
            core::logger()->error("store: saving {} failed: {}", snap.url, sqlite3_errmsg(db_.get()));
            return make_error_code(StoreErrc::statement_failed);
        }

        if (snap.id < 0) {
            assigned[i] = sqlite3_last_insert_rowid(db_.get());
        }
    }

    return tx.commit();
}

std::error_code PersistentStore::save_snapshots(std::vector<Snapshot>& snapshots) noexcept {
    if (snapshots.empty()) {
        return {};
    }

    auto lock = std::lock_guard(mutex_);
    if (auto ec = open_locked()) {
        return ec;
    }

    std::vector<std::int64_t> assigned;
    if (auto ec = save_locked(snapshots, assigned)) {
        return ec;
    }

    for (std::size_t i = 0; i < snapshots.size(); ++i) {
        if (assigned[i] >= 0) {
            snapshots[i].id = assigned[i];
        }
    }
    return {};
}

std::error_code PersistentStore::save_items(const std::vector<core::Download*>& items) noexcept {
    std::vector<core::Download*> saved;
    std::vector<Snapshot> snapshots;
    try {
        saved.reserve(items.size());
        snapshots.reserve(items.size());
        for (auto* item : items) {
            if (!item || item->is_private()) {
                continue;
            }
            auto snap = item->to_snapshot();
            // A crash mid-transfer must come back queued, not "running"
            if (snap.state == core::DownloadState::running ||
                snap.state == core::DownloadState::retrying) {
                snap.state = core::DownloadState::queued;
            }
            snapshots.push_back(std::move(snap));
            saved.push_back(item);
        }
    } catch (const std::bad_alloc&) {
        return std::make_error_code(std::errc::not_enough_memory);
    }

    if (snapshots.empty()) {
        return {};
    }

    auto lock = std::lock_guard(mutex_);
    if (auto ec = open_locked()) {
        return ec;
    }

    std::vector<std::int64_t> assigned;
    if (auto ec = save_locked(snapshots, assigned)) {
        return ec;
    }

    for (std::size_t i = 0; i < saved.size(); ++i) {
        if (assigned[i] >= 0) {
            saved[i]->id(assigned[i]);
        }
    }
    return {};
}

std::error_code PersistentStore::delete_ids(const std::vector<std::int64_t>& ids) noexcept {
    if (ids.empty()) {
        return {};
    }

    auto lock = std::lock_guard(mutex_);
    if (auto ec = open_locked()) {
        return ec;
    }

    auto stmt = prepare(db_.get(), "DELETE FROM queue WHERE id = ?1");
    if (!stmt) {
        return stmt.error();
    }

    Transaction tx(db_.get());
    if (auto ec = tx.begin()) {
        return ec;
    }

    for (auto id : ids) {
        sqlite3_bind_int64(stmt->get(), 1, id);
        int rc = sqlite3_step(stmt->get());
        sqlite3_reset(stmt->get());
        if (rc != SQLITE_DONE) {
            core::logger()->error("store: deleting row {} failed: {}", id, sqlite3_errmsg(db_.get()));
            return make_error_code(StoreErrc::statement_failed);
        }
    }

    return tx.commit();
}

std::error_code PersistentStore::delete_items(const std::vector<core::Download*>& items) noexcept {
    if (items.empty()) {
        return {};
    }

    std::vector<std::int64_t> ids;
    try {
        for (const auto* item : items) {
            if (item && !item->is_private() && item->id() >= 0) {
                ids.push_back(item->id());
            }
        }
    } catch (const std::bad_alloc&) {
        return std::make_error_code(std::errc::not_enough_memory);
    }
    return delete_ids(ids);
}

} // namespace courier::store
