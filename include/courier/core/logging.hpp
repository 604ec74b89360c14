// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>
#include <string_view>

namespace courier::core {

// Configure the shared "courier" logger: colored console plus an optional
// log file. Safe to call more than once; the last call wins.
void init_logging(spdlog::level::level_enum level = spdlog::level::info,
                  const std::string& file = {});

// Shared logger; created with console output on first use if
// init_logging() was never called.
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

// "warn" -> spdlog::level::warn, unknown names map to info
[[nodiscard]] spdlog::level::level_enum parse_level(std::string_view name) noexcept;

} // namespace courier::core
