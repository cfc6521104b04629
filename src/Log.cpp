/**
 * @file Log.cpp
 * @brief Library logger setup
 */

#include "persondir/Log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace persondir {

namespace {

constexpr const char* kLoggerName = "persondir";

std::shared_ptr<spdlog::logger> create_logger() {
    // Another component may already have registered the name.
    if (auto existing = spdlog::get(kLoggerName)) {
        return existing;
    }
    auto log = spdlog::stderr_color_mt(kLoggerName);
    log->set_level(spdlog::level::info);
    log->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
    return log;
}

} // anonymous namespace

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = create_logger();
    return instance;
}

void set_log_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace persondir
