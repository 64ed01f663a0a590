/*
 * logging.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "logging.hpp"

#include <string>

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace oxide::log {

namespace {

auto createLogger() -> std::shared_ptr<spdlog::logger> {
    const std::string name(LOGGER_NAME);
    if (auto existing = spdlog::get(name)) {
        return existing;
    }
    try {
        return spdlog::stderr_color_mt(name);
    } catch (const spdlog::spdlog_ex&) {
        // Registered by someone else between the lookup and the creation
        if (auto existing = spdlog::get(name)) {
            return existing;
        }
        throw;
    }
}

}  // namespace

auto getLogger() -> std::shared_ptr<spdlog::logger> {
    static const std::shared_ptr<spdlog::logger> LOGGER = createLogger();
    return LOGGER;
}

void initLogging() {
    auto logger = getLogger();
    spdlog::cfg::load_env_levels();
    logger->debug("oxide logging initialised at level {}",
                  spdlog::level::to_string_view(logger->level()));
}

void setLevel(spdlog::level::level_enum level) { getLogger()->set_level(level); }

}  // namespace oxide::log
