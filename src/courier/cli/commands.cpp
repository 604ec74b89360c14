// Copyright (c) 2026 changcheng967. All rights reserved.

#include <courier/cli/commands.hpp>
#include <courier/core/download_state.hpp>
#include <courier/version.hpp>
#include <sqlite3.h>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <sstream>

using namespace courier::core;
using namespace courier::store;

namespace courier::cli {

namespace {

std::string format_bytes(std::uint64_t bytes) {
    constexpr const char* UNITS[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < std::size(UNITS)) {
        value /= 1024.0;
        ++unit;
    }

    std::ostringstream ss;
    ss << std::fixed << std::setprecision(unit == 0 ? 0 : 1) << value << ' ' << UNITS[unit];
    return ss.str();
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) noexcept {
    CliArgs args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }
        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
            continue;
        }
        if (arg == "-d" || arg == "--database") {
            if (i + 1 < argc) {
                args.database = argv[++i];
            } else {
                args.bad_argument = true;
            }
            continue;
        }
        if (arg == "-c" || arg == "--config") {
            if (i + 1 < argc) {
                args.config = argv[++i];
            } else {
                args.bad_argument = true;
            }
            continue;
        }
        if (arg.starts_with("-")) {
            args.bad_argument = true;
            continue;
        }

        if (args.command.empty()) {
            args.command = arg;
            continue;
        }

        // Remaining positionals are row ids
        char* end = nullptr;
        auto id = std::strtoll(arg.c_str(), &end, 10);
        if (end == nullptr || *end != '\0' || id < 0) {
            args.bad_argument = true;
            continue;
        }
        args.ids.push_back(id);
    }

    return args;
}

//=============================================================================
// Commands
//=============================================================================

CliResult list(PersistentStore& store) noexcept {
    auto items = store.get_all();
    if (!items) {
        std::cerr << "Error: " << items.error().message() << std::endl;
        return std::unexpected(items.error());
    }

    if (items->empty()) {
        std::cout << "Queue is empty" << std::endl;
        return 0;
    }

    std::cout << std::left
              << std::setw(6) << "ID"
              << std::setw(6) << "POS"
              << std::setw(10) << "STATE"
              << std::setw(22) << "PROGRESS"
              << "URL" << '\n';

    for (const auto& snap : *items) {
        std::string progress = format_bytes(snap.written);
        if (snap.total_size > 0) {
            progress += " / " + format_bytes(snap.total_size);
        }

        std::cout << std::left
                  << std::setw(6) << snap.id
                  << std::setw(6) << snap.position
                  << std::setw(10) << to_string(snap.state)
                  << std::setw(22) << progress
                  << snap.url << '\n';

        if (!snap.dest.empty()) {
            std::cout << "      -> " << snap.dest << '\n';
        }
        if (!snap.error.empty()) {
            std::cout << "      error: " << snap.error << '\n';
        }
    }
    std::cout << items->size() << " download(s)" << std::endl;
    return 0;
}

CliResult remove(PersistentStore& store, const std::vector<std::int64_t>& ids) noexcept {
    if (ids.empty()) {
        std::cerr << "Error: remove needs at least one id" << std::endl;
        return 1;
    }

    if (auto ec = store.delete_ids(ids)) {
        std::cerr << "Error: " << ec.message() << std::endl;
        return std::unexpected(ec);
    }

    std::cout << "Removed " << ids.size() << " row(s)" << std::endl;
    return 0;
}

CliResult requeue(PersistentStore& store) noexcept {
    auto items = store.get_all();
    if (!items) {
        std::cerr << "Error: " << items.error().message() << std::endl;
        return std::unexpected(items.error());
    }

    std::vector<Snapshot> changed;
    for (auto& snap : *items) {
        if (snap.state == DownloadState::running || snap.state == DownloadState::retrying) {
            snap.state = DownloadState::queued;
            changed.push_back(std::move(snap));
        }
    }

    if (auto ec = store.save_snapshots(changed)) {
        std::cerr << "Error: " << ec.message() << std::endl;
        return std::unexpected(ec);
    }

    std::cout << "Requeued " << changed.size() << " download(s)" << std::endl;
    return 0;
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "Courier " << program_name << " - inspect a download queue database\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <COMMAND> [ID]...\n";
    std::cout << "\n";
    std::cout << "COMMANDS:\n";
    std::cout << "  list                    Show stored downloads in queue order\n";
    std::cout << "  remove <ID>...          Delete stored downloads\n";
    std::cout << "  requeue                 Rewrite rows stored as running/retrying as queued\n";
    std::cout << "                          (only rows written as raw snapshots, e.g. by\n";
    std::cout << "                          other tools; the queue saves them as queued)\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -V, --verbose           Enable debug logging\n";
    std::cout << "  -d, --database <FILE>   Queue database (default: from config)\n";
    std::cout << "  -c, --config <FILE>     Preferences file (JSON)\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " list\n";
    std::cout << "  " << program_name << " -d ~/.courier/queue.db remove 3 7\n";
}

void print_version() noexcept {
    std::cout << "Courier " << courier::version.to_string()
              << " (built " << courier::BUILD_DATE << ' ' << courier::BUILD_TIME << ')' << std::endl;
    std::cout << "Built with C++23, SQLite " << sqlite3_libversion() << ", spdlog, nlohmann::json\n";
}

} // namespace courier::cli
