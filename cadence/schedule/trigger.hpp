/*
 * trigger.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Trigger types and next fire time computation

**************************************************/

#ifndef CADENCE_SCHEDULE_TRIGGER_HPP
#define CADENCE_SCHEDULE_TRIGGER_HPP

#include <array>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

#include "cadence/schedule/cron_field.hpp"
#include "cadence/utils/time.hpp"

namespace cadence::schedule {

using json = nlohmann::json;
using utils::Clock;
using utils::TimePoint;

inline constexpr int DEFAULT_CRON_SEARCH_YEARS = 4;

// Longest interval period; keeps nanosecond clock arithmetic in range.
inline constexpr std::chrono::hours MAX_INTERVAL_PERIOD{24 * 366 * 100};

/**
 * @brief Fires exactly once at `at`.
 */
struct OnceTrigger {
    TimePoint at;
};

/**
 * @brief Fires every `period`, aligned on `start`.
 */
struct IntervalTrigger {
    std::chrono::milliseconds period;
    TimePoint start;
};

/**
 * @brief Field expressions of a cron trigger. Fields left empty are filled
 * in by CronTrigger (see there).
 */
struct CronSpec {
    std::optional<std::string> year;
    std::optional<std::string> month;
    std::optional<std::string> day;
    std::optional<std::string> week;
    std::optional<std::string> dayOfWeek;
    std::optional<std::string> hour;
    std::optional<std::string> minute;
    std::optional<std::string> second;

    /**
     * @brief Builds a spec from a five field crontab line
     * ("minute hour day month day_of_week") or one of the shortcuts
     * @yearly, @annually, @monthly, @weekly, @daily, @midnight, @hourly.
     *
     * The day_of_week field uses this library's numbering (0 = Monday);
     * weekday names are the portable choice.
     *
     * @throws cadence::error::InvalidArgument If the line does not have five
     * fields or names an unknown shortcut.
     */
    static auto fromCrontab(std::string_view expression) -> CronSpec;

    [[nodiscard]] auto get(CronFieldKind kind) const
        -> const std::optional<std::string>&;
};

/**
 * @brief Calendar trigger matching local wall-clock time.
 *
 * A candidate time fires when every field matches (logical AND). Fields not
 * given in the spec are filled in the way classic cron-style schedulers do:
 * fields more significant than the least significant given field match any
 * value, less significant ones default to their minimum (month and day to 1,
 * hour, minute and second to 0; week and day_of_week stay unconstrained).
 * Thus `hour=7, minute=0` fires once a day at 07:00:00.
 */
class CronTrigger {
public:
    /**
     * @param spec Field expressions.
     * @param searchYears Forward search window of nextFireTime().
     * @throws cadence::error::InvalidArgument If a field is malformed or
     * searchYears is not positive.
     */
    explicit CronTrigger(const CronSpec& spec,
                         int searchYears = DEFAULT_CRON_SEARCH_YEARS);

    [[nodiscard]] auto spec() const -> const CronSpec& { return spec_; }
    [[nodiscard]] auto field(CronFieldKind kind) const -> const CronField&;
    [[nodiscard]] auto searchYears() const noexcept -> int {
        return searchYears_;
    }

    /**
     * @brief Earliest matching time strictly after reference.
     *
     * @throws cadence::error::NoMatchError If nothing matches within the
     * search window.
     */
    [[nodiscard]] auto nextAfter(TimePoint reference) const -> TimePoint;

private:
    CronSpec spec_;
    int searchYears_;
    std::array<std::optional<CronField>, CRON_FIELD_COUNT> fields_;
};

using Trigger = std::variant<OnceTrigger, IntervalTrigger, CronTrigger>;

[[nodiscard]] auto makeOnce(TimePoint at) -> Trigger;

/**
 * @throws cadence::error::InvalidArgument If period is not positive or
 * longer than MAX_INTERVAL_PERIOD.
 */
[[nodiscard]] auto makeInterval(std::chrono::milliseconds period,
                                std::optional<TimePoint> start = std::nullopt)
    -> Trigger;

/**
 * @throws cadence::error::InvalidArgument If a field is malformed.
 */
[[nodiscard]] auto makeCron(const CronSpec& spec,
                            int searchYears = DEFAULT_CRON_SEARCH_YEARS)
    -> Trigger;

/**
 * @brief Earliest fire time strictly after reference.
 *
 * Pure function of its arguments. Returns std::nullopt when the trigger can
 * never fire again, which only happens to a OnceTrigger whose time is not
 * after reference.
 *
 * @throws cadence::error::NoMatchError If a cron search exceeds its window.
 */
[[nodiscard]] auto nextFireTime(const Trigger& trigger, TimePoint reference)
    -> std::optional<TimePoint>;

/**
 * @brief "date", "interval" or "cron".
 */
[[nodiscard]] auto triggerKind(const Trigger& trigger) -> std::string_view;

/**
 * @brief Short human readable summary, e.g. "interval[0:10:00]" or
 * "cron[hour='7', minute='0']".
 */
[[nodiscard]] auto describe(const Trigger& trigger) -> std::string;

[[nodiscard]] auto toJson(const Trigger& trigger) -> json;

}  // namespace cadence::schedule

#endif  // CADENCE_SCHEDULE_TRIGGER_HPP
