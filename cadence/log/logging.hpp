/*
 * logging.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Centralized spdlog configuration for cadence

**************************************************/

#ifndef CADENCE_LOG_LOGGING_HPP
#define CADENCE_LOG_LOGGING_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace cadence::log {

inline constexpr std::string_view DEFAULT_LOGGER_NAME = "cadence";

/**
 * @brief Settings for the default logger.
 */
struct LogConfig {
    std::string level = "info";  ///< trace/debug/info/warn/error/critical/off
    std::string file;            ///< Rotating log file, empty for stdout only
    size_t maxFileSize = 1048576;  ///< Bytes per file before rotation
    size_t maxFiles = 10;          ///< Rotated files kept
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";
};

/**
 * @brief Parses a level name, case-insensitive. "warning" is accepted as an
 * alias of "warn".
 *
 * @throws cadence::error::InvalidArgument If the name is unknown.
 */
[[nodiscard]] auto parseLevel(std::string_view name)
    -> spdlog::level::level_enum;

/**
 * @brief Installs the "cadence" logger as spdlog's default logger.
 *
 * The logger always writes to a colored stdout sink and, when config.file is
 * set, to a rotating file sink as well. Calling it again replaces the
 * previous logger.
 *
 * @return The installed logger.
 * @throws cadence::error::InvalidArgument If the level name is unknown.
 * @throws spdlog::spdlog_ex If the log file cannot be opened.
 */
auto initLogging(const LogConfig& config) -> std::shared_ptr<spdlog::logger>;

}  // namespace cadence::log

#endif  // CADENCE_LOG_LOGGING_HPP
