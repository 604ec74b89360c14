// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <chrono>
#include <string_view>

namespace courier::core {

constexpr std::chrono::milliseconds ERASE_GRACE_DELAY{1000};        // cancel -> erase
constexpr std::chrono::milliseconds FLUSH_INTERVAL{500};            // dirty -> save_items
constexpr std::uint32_t CONCURRENT_DOWNLOADS = 3;

constexpr std::string_view DEFAULT_CONFLICT_ACTION = "uniquify";
constexpr std::string_view DEFAULT_DATABASE = "courier.db";
constexpr std::string_view DEFAULT_LOG_LEVEL = "info";

constexpr std::string_view REFERRER_HEADER = "Referer";
constexpr std::string_view POST_METHOD = "POST";

// Persistence
constexpr std::int32_t SCHEMA_VERSION = 1;
constexpr std::chrono::milliseconds DB_BUSY_TIMEOUT{5000};

constexpr std::string_view LOGGER_NAME = "courier";

} // namespace courier::core
