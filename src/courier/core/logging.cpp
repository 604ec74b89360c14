// Copyright (c) 2026 changcheng967. All rights reserved.

#include <courier/core/logging.hpp>
#include <courier/core/config.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <filesystem>
#include <memory>
#include <mutex>
#include <vector>

namespace courier::core {

namespace {

std::mutex logger_mutex;
std::shared_ptr<spdlog::logger> shared_logger;

std::shared_ptr<spdlog::logger> make_logger(spdlog::level::level_enum level,
                                            const std::string& file) {
    std::vector<spdlog::sink_ptr> sinks;

    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
    sinks.push_back(console);

    if (!file.empty()) {
        std::filesystem::path p(file);
        if (p.has_parent_path()) {
            std::filesystem::create_directories(p.parent_path());
        }
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(file, false);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
        sinks.push_back(file_sink);
    }

    auto log = std::make_shared<spdlog::logger>(std::string(LOGGER_NAME), sinks.begin(), sinks.end());
    log->set_level(level);
    log->flush_on(spdlog::level::warn);
    return log;
}

} // namespace

void init_logging(spdlog::level::level_enum level, const std::string& file) {
    auto log = make_logger(level, file);
    auto lock = std::lock_guard(logger_mutex);
    shared_logger = std::move(log);
}

std::shared_ptr<spdlog::logger> logger() {
    auto lock = std::lock_guard(logger_mutex);
    if (!shared_logger) {
        shared_logger = make_logger(spdlog::level::info, {});
    }
    return shared_logger;
}

spdlog::level::level_enum parse_level(std::string_view name) noexcept {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off") return spdlog::level::off;
    return spdlog::level::info;
}

} // namespace courier::core
