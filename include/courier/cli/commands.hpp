// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <courier/core/prefs.hpp>
#include <courier/store/persistent_store.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace courier::cli {

// CLI result
using CliResult = std::expected<int, std::error_code>;

// Command line arguments
struct CliArgs {
    std::string command;
    std::vector<std::int64_t> ids;
    std::string database;
    std::string config;
    bool verbose{false};
    bool version{false};
    bool help{false};
    bool bad_argument{false};
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]) noexcept;

// Print stored downloads in queue order
[[nodiscard]] CliResult list(store::PersistentStore& store) noexcept;

// Delete stored downloads by local id
[[nodiscard]] CliResult remove(store::PersistentStore& store,
                               const std::vector<std::int64_t>& ids) noexcept;

// Rewrite RUNNING and RETRYING rows as QUEUED. Rows saved through
// PersistentStore::save_items are already stored as QUEUED; this repairs
// rows written as raw snapshots.
[[nodiscard]] CliResult requeue(store::PersistentStore& store) noexcept;

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace courier::cli
