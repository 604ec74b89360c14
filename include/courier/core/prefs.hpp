// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <courier/core/config.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>

namespace courier::core {

// User preferences, stored as a flat JSON object
struct Prefs {
    std::string conflict_action{DEFAULT_CONFLICT_ACTION};
    std::uint32_t concurrent_downloads{CONCURRENT_DOWNLOADS};
    std::chrono::milliseconds flush_interval{FLUSH_INTERVAL};
    std::chrono::milliseconds erase_grace{ERASE_GRACE_DELAY};
    std::string database{DEFAULT_DATABASE};
    std::string log_level{DEFAULT_LOG_LEVEL};

    // Keys absent from the file keep their defaults
    [[nodiscard]] static std::expected<Prefs, std::error_code>
    load(std::string_view path) noexcept;

    [[nodiscard]] static std::expected<Prefs, std::error_code>
    parse(std::string_view json) noexcept;

    [[nodiscard]] std::error_code save(std::string_view path) const noexcept;

    [[nodiscard]] std::string dump() const;
};

} // namespace courier::core
