// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <courier/core/download_state.hpp>
#include <courier/engine/engine.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace courier::store {

// Persisted form of a Download. The local id is the row key and is not part
// of the serialized body.
struct Snapshot {
    std::int64_t id{-1};
    engine::ExternalId external_id{0};
    core::DownloadState state{core::DownloadState::queued};
    std::int64_t position{-1};
    std::string error;
    std::uint64_t written{0};
    std::uint64_t total_size{0};
    std::string server_name;

    std::string url;
    std::string dest;
    std::optional<std::string> post_data;
    std::string referrer;

    // JSON object text
    [[nodiscard]] std::string serialize() const;

    [[nodiscard]] static std::expected<Snapshot, std::error_code>
    deserialize(std::string_view body) noexcept;
};

} // namespace courier::store
