/*
 * config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Scheduler and logging configuration from JSON and environment

**************************************************/

#ifndef CADENCE_CONFIG_CONFIG_HPP
#define CADENCE_CONFIG_CONFIG_HPP

#include <string>

#include <nlohmann/json.hpp>

#include "cadence/log/logging.hpp"
#include "cadence/schedule/options.hpp"

namespace cadence::config {

using json = nlohmann::json;

/**
 * @brief Everything needed to bring up a scheduler.
 *
 * JSON layout, every key optional:
 * @code
 * {
 *   "scheduler": {"tick_interval_ms": 1000, "worker_threads": 4,
 *                 "max_instances": 1, "cron_search_years": 4},
 *   "log": {"level": "info", "file": "", "max_file_size": 1048576,
 *           "max_files": 10, "pattern": "..."}
 * }
 * @endcode
 */
struct CadenceConfig {
    schedule::SchedulerOptions scheduler;
    log::LogConfig log;

    /**
     * @brief Reads a configuration, keeping defaults for absent keys.
     * Unknown keys are ignored.
     *
     * @throws cadence::error::ConfigurationError On a wrong type or an out
     * of range value.
     */
    static auto fromJson(const json& jsonObj) -> CadenceConfig;

    /**
     * @brief Reads a JSON configuration file.
     *
     * @throws cadence::error::ConfigurationError If the file cannot be read
     * or does not hold a valid configuration.
     */
    static auto load(const std::string& path) -> CadenceConfig;

    /**
     * @brief Overrides settings from CADENCE_TICK_MS, CADENCE_WORKERS,
     * CADENCE_MAX_INSTANCES, CADENCE_LOG_LEVEL and CADENCE_LOG_FILE.
     * Unset variables leave the current value alone.
     *
     * @throws cadence::error::ConfigurationError On a malformed value.
     */
    void applyEnvironment();

    [[nodiscard]] auto toJson() const -> json;
};

}  // namespace cadence::config

#endif  // CADENCE_CONFIG_CONFIG_HPP
