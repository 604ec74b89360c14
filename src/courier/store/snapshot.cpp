// Copyright (c) 2026 changcheng967. All rights reserved.

#include <courier/store/snapshot.hpp>
#include <courier/store/error.hpp>
#include <courier/core/logging.hpp>
#include <nlohmann/json.hpp>

namespace courier::core {

NLOHMANN_JSON_SERIALIZE_ENUM(DownloadState, {
    {DownloadState::queued, "queued"},
    {DownloadState::running, "running"},
    {DownloadState::paused, "paused"},
    {DownloadState::retrying, "retrying"},
    {DownloadState::canceled, "canceled"},
    {DownloadState::missing, "missing"},
    {DownloadState::done, "done"},
})

} // namespace courier::core

namespace courier::store {

using json = nlohmann::json;

std::string Snapshot::serialize() const {
    json j;
    j["manId"] = external_id;
    j["state"] = state;
    j["position"] = position;
    j["error"] = error;
    j["written"] = written;
    j["totalSize"] = total_size;
    j["serverName"] = server_name;
    j["url"] = url;
    j["dest"] = dest;
    if (post_data) {
        j["postData"] = *post_data;
    }
    if (!referrer.empty()) {
        j["referrer"] = referrer;
    }
    // Engine-reported names need not be UTF-8; invalid bytes become U+FFFD
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::expected<Snapshot, std::error_code> Snapshot::deserialize(std::string_view body) noexcept {
    try {
        auto j = json::parse(body);
        if (!j.is_object() || !j.contains("url") || !j.contains("state")) {
            return std::unexpected(make_error_code(StoreErrc::corrupt_record));
        }

        // The enum mapping would silently fall back to the first entry
        auto state_name = j.at("state").get<std::string>();
        if (!core::parse_state(state_name)) {
            return std::unexpected(make_error_code(StoreErrc::corrupt_record));
        }

        Snapshot snap;
        snap.state = j.at("state").get<core::DownloadState>();
        snap.url = j.at("url").get<std::string>();
        snap.external_id = j.value("manId", engine::ExternalId{0});
        snap.position = j.value("position", std::int64_t{-1});
        snap.error = j.value("error", std::string{});
        snap.written = j.value("written", std::uint64_t{0});
        snap.total_size = j.value("totalSize", std::uint64_t{0});
        snap.server_name = j.value("serverName", std::string{});
        snap.dest = j.value("dest", std::string{});
        snap.referrer = j.value("referrer", std::string{});
        if (auto it = j.find("postData"); it != j.end() && it->is_string()) {
            snap.post_data = it->get<std::string>();
        }
        return snap;
    } catch (const json::exception& e) {
        core::logger()->warn("snapshot: unreadable record: {}", e.what());
        return std::unexpected(make_error_code(StoreErrc::corrupt_record));
    }
}

} // namespace courier::store
