/// @file log.cpp
/// @brief Namespaced logger registry
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#include "log.h"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <mutex>
#include <string>

namespace blankline_cpp {

namespace {

std::mutex gLoggerMutex;
bool gLevelConfigured = false;

spdlog::sink_ptr sharedSink() {
    static spdlog::sink_ptr sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    return sink;
}

} // namespace

std::shared_ptr<spdlog::logger> logger(std::string const& name) {
    std::lock_guard<std::mutex> lock(gLoggerMutex);
    if (!gLevelConfigured) {
        spdlog::set_level(spdlog::level::warn);
        gLevelConfigured = true;
    }
    if (auto existing = spdlog::get(name)) {
        return existing;
    }
    auto created = std::make_shared<spdlog::logger>(name, sharedSink());
    spdlog::initialize_logger(created);
    created->set_pattern("[%n] [%l] %v");
    return created;
}

void setLogLevel(spdlog::level::level_enum level) {
    std::lock_guard<std::mutex> lock(gLoggerMutex);
    gLevelConfigured = true;
    spdlog::set_level(level);
}

} // namespace blankline_cpp
