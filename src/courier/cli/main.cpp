// Copyright (c) 2026 changcheng967. All rights reserved.

#include <courier/cli/commands.hpp>
#include <courier/core/logging.hpp>
#include <courier/core/prefs.hpp>
#include <courier/store/persistent_store.hpp>
#include <courier/version.hpp>
#include <cstdlib>
#include <exception>
#include <iostream>

using namespace courier::cli;

// Terminate handler to catch exceptions in noexcept functions
static void courier_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();  // Prevent re-entrant abort
    }
    in_terminate = true;

    std::cerr << "FATAL: std::terminate called!" << std::endl;
    if (auto current = std::current_exception()) {
        try {
            std::rethrow_exception(current);
        } catch (const std::exception& e) {
            std::cerr << "Exception: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "Unknown exception in noexcept context" << std::endl;
        }
    }
    std::cerr << "Aborting..." << std::endl;
    std::abort();
}

int main(int argc, char* argv[]) {
    std::set_terminate(courier_terminate_handler);
    CliArgs args = parse_args(argc, argv);

    if (args.help) {
        print_help(argv[0]);
        return 0;
    }

    if (args.version) {
        print_version();
        return 0;
    }

    if (args.command.empty() || args.bad_argument) {
        std::cerr << "Error: " << (args.command.empty() ? "No command specified" : "Bad argument") << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return 1;
    }

    courier::core::Prefs prefs;
    if (!args.config.empty()) {
        auto loaded = courier::core::Prefs::load(args.config);
        if (!loaded) {
            std::cerr << "Error: cannot read " << args.config << ": " << loaded.error().message() << std::endl;
            return 1;
        }
        prefs = std::move(*loaded);
    }

    courier::core::init_logging(args.verbose ? spdlog::level::debug
                                             : courier::core::parse_level(prefs.log_level));

    courier::store::PersistentStore store(args.database.empty() ? prefs.database : args.database);
    if (auto ec = store.initialize()) {
        std::cerr << "Error: cannot open " << store.path() << ": " << ec.message() << std::endl;
        return 1;
    }

    CliResult result;
    if (args.command == "list") {
        result = list(store);
    } else if (args.command == "remove") {
        result = remove(store, args.ids);
    } else if (args.command == "requeue") {
        result = requeue(store);
    } else {
        std::cerr << "Error: Unknown command: " << args.command << std::endl;
        return 1;
    }

    return result ? *result : 1;
}
