// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string>

namespace courier::store {

enum class StoreErrc {
    success = 0,
    open_failed,
    migration_failed,
    version_too_new,
    statement_failed,
    commit_failed,
    corrupt_record,
    closed,
};

namespace detail {

struct StoreErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "courier::store";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<StoreErrc>(ev)) {
            case StoreErrc::success:           return "Success";
            case StoreErrc::open_failed:       return "Cannot open database";
            case StoreErrc::migration_failed:  return "Schema migration failed";
            case StoreErrc::version_too_new:   return "Database was written by a newer version";
            case StoreErrc::statement_failed:  return "Statement failed";
            case StoreErrc::commit_failed:     return "Commit failed";
            case StoreErrc::corrupt_record:    return "Corrupt record";
            case StoreErrc::closed:            return "Database closed";
            default:                           return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::StoreErrcCategory& store_errc_category() noexcept {
    static detail::StoreErrcCategory category;
    return category;
}

inline std::error_code make_error_code(StoreErrc e) noexcept {
    return {static_cast<int>(e), store_errc_category()};
}

} // namespace courier::store

namespace std {

template<>
struct is_error_code_enum<courier::store::StoreErrc> : true_type {};

} // namespace std
