/*
 * config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Scheduler and logging configuration from JSON and environment

**************************************************/

#include "config.hpp"

#include <cstdlib>
#include <fstream>
#include <limits>
#include <optional>
#include <string_view>

#include <spdlog/spdlog.h>

#include "cadence/error/exception.hpp"
#include "cadence/utils/string.hpp"

namespace cadence::config {

namespace {

template <typename T>
auto readKey(const json& section, std::string_view sectionName,
             const char* key) -> std::optional<T> {
    if (!section.contains(key)) {
        return std::nullopt;
    }
    try {
        return section.at(key).get<T>();
    } catch (const json::exception& e) {
        THROW_CONFIGURATION_ERROR("Invalid value for '", sectionName, ".", key,
                                  "': ", e.what());
    }
}

auto readPositive(const json& section, std::string_view sectionName,
                  const char* key) -> std::optional<long long> {
    auto value = readKey<long long>(section, sectionName, key);
    if (value && *value <= 0) {
        THROW_CONFIGURATION_ERROR("'", sectionName, ".", key,
                                  "' must be positive, got ", *value);
    }
    return value;
}

auto readPositiveInt(const json& section, std::string_view sectionName,
                     const char* key) -> std::optional<int> {
    auto value = readPositive(section, sectionName, key);
    if (!value) {
        return std::nullopt;
    }
    if (*value > std::numeric_limits<int>::max()) {
        THROW_CONFIGURATION_ERROR("'", sectionName, ".", key,
                                  "' is too large, got ", *value);
    }
    return static_cast<int>(*value);
}

auto section(const json& jsonObj, const char* name) -> json {
    if (!jsonObj.contains(name)) {
        return json::object();
    }
    const auto& value = jsonObj.at(name);
    if (!value.is_object()) {
        THROW_CONFIGURATION_ERROR("Section '", name, "' must be an object");
    }
    return value;
}

auto readEnvPositive(const char* name) -> std::optional<int> {
    const char* raw = std::getenv(name);
    if (raw == nullptr) {
        return std::nullopt;
    }
    auto value = utils::parseInt(utils::trim(raw));
    if (!value || *value <= 0) {
        THROW_CONFIGURATION_ERROR("Environment variable ", name,
                                  " must be a positive integer, got '", raw,
                                  "'");
    }
    spdlog::debug("Configuration override {}={}", name, *value);
    return value;
}

}  // namespace

auto CadenceConfig::fromJson(const json& jsonObj) -> CadenceConfig {
    if (!jsonObj.is_object()) {
        THROW_CONFIGURATION_ERROR("Configuration must be a JSON object");
    }

    CadenceConfig config;

    const auto scheduler = section(jsonObj, "scheduler");
    if (auto tick = readPositive(scheduler, "scheduler", "tick_interval_ms")) {
        config.scheduler.tickInterval = std::chrono::milliseconds(*tick);
    }
    if (auto workers = readPositive(scheduler, "scheduler", "worker_threads")) {
        config.scheduler.workerThreads = static_cast<size_t>(*workers);
    }
    if (auto instances =
            readPositiveInt(scheduler, "scheduler", "max_instances")) {
        config.scheduler.maxInstances = *instances;
    }
    if (auto years =
            readPositiveInt(scheduler, "scheduler", "cron_search_years")) {
        config.scheduler.cronSearchYears = *years;
    }

    const auto logSection = section(jsonObj, "log");
    if (auto level = readKey<std::string>(logSection, "log", "level")) {
        try {
            (void)log::parseLevel(*level);
        } catch (const error::InvalidArgument& e) {
            THROW_CONFIGURATION_ERROR("Invalid 'log.level': ",
                                      e.getMessage());
        }
        config.log.level = *level;
    }
    if (auto file = readKey<std::string>(logSection, "log", "file")) {
        config.log.file = *file;
    }
    if (auto size = readPositive(logSection, "log", "max_file_size")) {
        config.log.maxFileSize = static_cast<size_t>(*size);
    }
    if (auto files = readPositive(logSection, "log", "max_files")) {
        config.log.maxFiles = static_cast<size_t>(*files);
    }
    if (auto pattern = readKey<std::string>(logSection, "log", "pattern")) {
        config.log.pattern = *pattern;
    }
    return config;
}

auto CadenceConfig::load(const std::string& path) -> CadenceConfig {
    spdlog::info("Loading configuration from {}", path);
    std::ifstream file(path);
    if (!file.is_open()) {
        THROW_CONFIGURATION_ERROR("Failed to open configuration file: ", path);
    }

    json jsonObj;
    try {
        file >> jsonObj;
    } catch (const json::parse_error& e) {
        THROW_CONFIGURATION_ERROR("Malformed configuration file ", path, ": ",
                                  e.what());
    }
    return fromJson(jsonObj);
}

void CadenceConfig::applyEnvironment() {
    if (auto tick = readEnvPositive("CADENCE_TICK_MS")) {
        scheduler.tickInterval = std::chrono::milliseconds(*tick);
    }
    if (auto workers = readEnvPositive("CADENCE_WORKERS")) {
        scheduler.workerThreads = static_cast<size_t>(*workers);
    }
    if (auto instances = readEnvPositive("CADENCE_MAX_INSTANCES")) {
        scheduler.maxInstances = *instances;
    }
    if (const char* level = std::getenv("CADENCE_LOG_LEVEL")) {
        try {
            (void)log::parseLevel(level);
        } catch (const error::InvalidArgument& e) {
            THROW_CONFIGURATION_ERROR("Invalid CADENCE_LOG_LEVEL: ",
                                      e.getMessage());
        }
        log.level = level;
    }
    if (const char* file = std::getenv("CADENCE_LOG_FILE")) {
        log.file = file;
    }
}

auto CadenceConfig::toJson() const -> json {
    return json{
        {"scheduler",
         {{"tick_interval_ms", scheduler.tickInterval.count()},
          {"worker_threads", scheduler.workerThreads},
          {"max_instances", scheduler.maxInstances},
          {"cron_search_years", scheduler.cronSearchYears}}},
        {"log",
         {{"level", log.level},
          {"file", log.file},
          {"max_file_size", log.maxFileSize},
          {"max_files", log.maxFiles},
          {"pattern", log.pattern}}}};
}

}  // namespace cadence::config
