/*
 * time.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Wall-clock helpers for triggers and job snapshots

**************************************************/

#ifndef CADENCE_UTILS_TIME_HPP
#define CADENCE_UTILS_TIME_HPP

#include <chrono>
#include <ctime>
#include <optional>
#include <string>
#include <string_view>

#include "cadence/error/exception.hpp"

namespace cadence::utils {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

class TimeConvertException : public cadence::error::Exception {
public:
    using cadence::error::Exception::Exception;
};

#define THROW_TIME_CONVERT_ERROR(...)                                 \
    throw cadence::utils::TimeConvertException(                       \
        CADENCE_FILE_NAME, CADENCE_FILE_LINE, CADENCE_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Thread-safe localtime.
 *
 * @return The broken-down local time, or std::nullopt if the C library
 * rejects the value.
 */
[[nodiscard]] auto safeLocalTime(std::time_t time) -> std::optional<std::tm>;

/**
 * @brief Converts a time point to broken-down local time.
 *
 * @throws TimeConvertException If the conversion fails.
 */
[[nodiscard]] auto toLocalTm(TimePoint timePoint) -> std::tm;

/**
 * @brief Converts broken-down local time to a time point.
 *
 * tm_isdst is reset to -1 so the C library decides whether daylight saving
 * applies. Out-of-range fields are normalized the way mktime does.
 *
 * @throws TimeConvertException If mktime cannot represent the value.
 */
[[nodiscard]] auto fromLocalTm(std::tm tm) -> TimePoint;

/**
 * @brief Formats a time point in local time with strftime syntax.
 *
 * @throws TimeConvertException If the format is empty or conversion fails.
 */
[[nodiscard]] auto formatTimePoint(
    TimePoint timePoint, std::string_view format = "%Y-%m-%d %H:%M:%S%z")
    -> std::string;

/**
 * @brief Drops the sub-second part of a time point.
 */
[[nodiscard]] auto truncateToSeconds(TimePoint timePoint) -> TimePoint;

/**
 * @brief Formats a duration as H:MM:SS, prefixing "N days, " when needed.
 */
[[nodiscard]] auto formatDuration(std::chrono::seconds duration)
    -> std::string;

}  // namespace cadence::utils

#endif  // CADENCE_UTILS_TIME_HPP
