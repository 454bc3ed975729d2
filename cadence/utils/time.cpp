/*
 * time.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Wall-clock helpers for triggers and job snapshots

**************************************************/

#include "time.hpp"

#include <array>
#include <iomanip>
#include <sstream>

namespace cadence::utils {
namespace {
constexpr size_t K_BUFFER_SIZE = 80;
constexpr long long K_SECONDS_PER_DAY = 86400;
constexpr long long K_SECONDS_PER_HOUR = 3600;
constexpr long long K_SECONDS_PER_MINUTE = 60;
}  // namespace

auto safeLocalTime(std::time_t time) -> std::optional<std::tm> {
    std::tm result{};
#ifdef _WIN32
    if (localtime_s(&result, &time) != 0) {
        return std::nullopt;
    }
#else
    if (localtime_r(&time, &result) == nullptr) {
        return std::nullopt;
    }
#endif
    return result;
}

auto toLocalTm(TimePoint timePoint) -> std::tm {
    auto time = Clock::to_time_t(timePoint);
    auto tm = safeLocalTime(time);
    if (!tm) {
        THROW_TIME_CONVERT_ERROR("Failed to convert timestamp ", time,
                                 " to local time");
    }
    return *tm;
}

auto fromLocalTm(std::tm tm) -> TimePoint {
    tm.tm_isdst = -1;
    std::time_t time = std::mktime(&tm);
    if (time == static_cast<std::time_t>(-1)) {
        THROW_TIME_CONVERT_ERROR("mktime failed for ", tm.tm_year + 1900, "-",
                                 tm.tm_mon + 1, "-", tm.tm_mday, " ",
                                 tm.tm_hour, ":", tm.tm_min, ":", tm.tm_sec);
    }
    return Clock::from_time_t(time);
}

auto formatTimePoint(TimePoint timePoint, std::string_view format)
    -> std::string {
    if (format.empty()) {
        THROW_TIME_CONVERT_ERROR("Empty format string provided");
    }

    std::tm timeStruct = toLocalTm(timePoint);
    std::array<char, K_BUFFER_SIZE> buffer{};
    std::string fmt(format);
    if (std::strftime(buffer.data(), buffer.size(), fmt.c_str(),
                      &timeStruct) == 0) {
        THROW_TIME_CONVERT_ERROR("strftime failed with format: ", fmt);
    }
    return std::string(buffer.data());
}

auto truncateToSeconds(TimePoint timePoint) -> TimePoint {
    return std::chrono::time_point_cast<std::chrono::seconds>(timePoint);
}

auto formatDuration(std::chrono::seconds duration) -> std::string {
    long long total = duration.count();
    bool negative = total < 0;
    if (negative) {
        total = -total;
    }

    long long days = total / K_SECONDS_PER_DAY;
    total %= K_SECONDS_PER_DAY;
    long long hours = total / K_SECONDS_PER_HOUR;
    total %= K_SECONDS_PER_HOUR;
    long long minutes = total / K_SECONDS_PER_MINUTE;
    long long seconds = total % K_SECONDS_PER_MINUTE;

    std::ostringstream oss;
    if (negative) {
        oss << '-';
    }
    if (days > 0) {
        oss << days << (days == 1 ? " day, " : " days, ");
    }
    oss << hours << ':' << std::setfill('0') << std::setw(2) << minutes << ':'
        << std::setw(2) << seconds;
    return oss.str();
}

}  // namespace cadence::utils
