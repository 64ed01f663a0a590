/*
 * logging.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-10-19

Description: Shared spdlog logger used by the oxide library

**************************************************/

#ifndef OXIDE_LOG_LOGGING_HPP
#define OXIDE_LOG_LOGGING_HPP

#include <memory>
#include <string_view>

#include <spdlog/common.h>
#include <spdlog/logger.h>

namespace oxide::log {

inline constexpr std::string_view LOGGER_NAME = "oxide";

/**
 * @brief Returns the library logger, registering it with spdlog on first
 * use.
 *
 * The logger writes to stderr and starts at the global spdlog level.
 * Creation is thread-safe.
 */
[[nodiscard]] auto getLogger() -> std::shared_ptr<spdlog::logger>;

/**
 * @brief Creates the library logger and applies log levels from the
 * SPDLOG_LEVEL environment variable, e.g. `SPDLOG_LEVEL=oxide=debug`.
 */
void initLogging();

/**
 * @brief Sets the level of the library logger only.
 */
void setLevel(spdlog::level::level_enum level);

}  // namespace oxide::log

#endif  // OXIDE_LOG_LOGGING_HPP
