// Copyright (c) 2026 changcheng967. All rights reserved.

#include <courier/core/prefs.hpp>
#include <courier/core/logging.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace courier::core {

namespace {

using json = nlohmann::json;

template<typename T>
void read_key(const json& j, const char* key, T& out) {
    if (auto it = j.find(key); it != j.end() && !it->is_null()) {
        out = it->get<T>();
    }
}

} // namespace

std::expected<Prefs, std::error_code> Prefs::load(std::string_view path) noexcept {
    std::ifstream file{std::string(path)};
    if (!file) {
        return std::unexpected(std::make_error_code(std::errc::no_such_file_or_directory));
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return parse(ss.str());
}

std::expected<Prefs, std::error_code> Prefs::parse(std::string_view text) noexcept {
    try {
        auto j = json::parse(text);
        if (!j.is_object()) {
            return std::unexpected(std::make_error_code(std::errc::invalid_argument));
        }

        Prefs prefs;
        read_key(j, "conflictAction", prefs.conflict_action);
        read_key(j, "concurrentDownloads", prefs.concurrent_downloads);
        read_key(j, "database", prefs.database);
        read_key(j, "logLevel", prefs.log_level);

        std::int64_t ms = prefs.flush_interval.count();
        read_key(j, "flushIntervalMs", ms);
        prefs.flush_interval = std::chrono::milliseconds{std::max<std::int64_t>(0, ms)};

        ms = prefs.erase_grace.count();
        read_key(j, "eraseGraceMs", ms);
        prefs.erase_grace = std::chrono::milliseconds{std::max<std::int64_t>(0, ms)};

        if (prefs.concurrent_downloads == 0) {
            prefs.concurrent_downloads = 1;
        }
        return prefs;
    } catch (const json::exception& e) {
        logger()->error("prefs: {}", e.what());
        return std::unexpected(std::make_error_code(std::errc::invalid_argument));
    }
}

std::string Prefs::dump() const {
    json j;
    j["conflictAction"] = conflict_action;
    j["concurrentDownloads"] = concurrent_downloads;
    j["flushIntervalMs"] = flush_interval.count();
    j["eraseGraceMs"] = erase_grace.count();
    j["database"] = database;
    j["logLevel"] = log_level;
    return j.dump(2);
}

std::error_code Prefs::save(std::string_view path) const noexcept {
    try {
        std::filesystem::path p(path);
        if (p.has_parent_path()) {
            std::filesystem::create_directories(p.parent_path());
        }

        std::ofstream file(p, std::ios::trunc);
        if (!file) {
            return std::make_error_code(std::errc::permission_denied);
        }
        file << dump() << '\n';
        return file ? std::error_code{} : std::make_error_code(std::errc::io_error);
    } catch (const std::exception& e) {
        logger()->error("prefs: cannot save {}: {}", path, e.what());
        return std::make_error_code(std::errc::io_error);
    }
}

} // namespace courier::core
