/*
 * logging.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Centralized spdlog configuration for cadence

**************************************************/

#include "logging.hpp"

#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "cadence/error/exception.hpp"
#include "cadence/utils/string.hpp"

namespace cadence::log {

auto parseLevel(std::string_view name) -> spdlog::level::level_enum {
    const std::string lowered = utils::toLower(utils::trim(name));
    if (lowered == "trace") {
        return spdlog::level::trace;
    }
    if (lowered == "debug") {
        return spdlog::level::debug;
    }
    if (lowered == "info") {
        return spdlog::level::info;
    }
    if (lowered == "warn" || lowered == "warning") {
        return spdlog::level::warn;
    }
    if (lowered == "error") {
        return spdlog::level::err;
    }
    if (lowered == "critical") {
        return spdlog::level::critical;
    }
    if (lowered == "off") {
        return spdlog::level::off;
    }
    THROW_INVALID_ARGUMENT("Unknown log level: ", name);
}

auto initLogging(const LogConfig& config) -> std::shared_ptr<spdlog::logger> {
    const auto level = parseLevel(config.level);

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!config.file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file, config.maxFileSize, config.maxFiles));
    }

    auto logger = std::make_shared<spdlog::logger>(
        std::string(DEFAULT_LOGGER_NAME), sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->set_pattern(config.pattern);
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger);
    spdlog::debug("Logging initialized: level={}, file={}", config.level,
                  config.file.empty() ? "<stdout>" : config.file);
    return logger;
}

}  // namespace cadence::log
