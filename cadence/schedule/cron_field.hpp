/*
 * cron_field.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Parsed cron field constraints

**************************************************/

#ifndef CADENCE_SCHEDULE_CRON_FIELD_HPP
#define CADENCE_SCHEDULE_CRON_FIELD_HPP

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cadence::schedule {

/**
 * @brief Time units a cron trigger can constrain, most significant first.
 */
enum class CronFieldKind {
    Year,
    Month,
    Day,
    Week,
    DayOfWeek,
    Hour,
    Minute,
    Second
};

inline constexpr size_t CRON_FIELD_COUNT = 8;

inline constexpr std::array<CronFieldKind, CRON_FIELD_COUNT> CRON_FIELD_ORDER{
    CronFieldKind::Year,      CronFieldKind::Month, CronFieldKind::Day,
    CronFieldKind::Week,      CronFieldKind::DayOfWeek,
    CronFieldKind::Hour,      CronFieldKind::Minute, CronFieldKind::Second};

struct CronFieldRange {
    int min;
    int max;
};

[[nodiscard]] auto fieldName(CronFieldKind kind) -> std::string_view;
[[nodiscard]] auto fieldRange(CronFieldKind kind) -> CronFieldRange;

/**
 * @brief One cron field compiled into the set of values it allows.
 *
 * Accepted syntax, as a comma separated list of terms:
 *   - `*` and `*&#47;n`
 *   - `a`, `a-b`, `a-b/n` and `a/n` (from a to the field maximum)
 *   - month names `jan`..`dec` and weekday names `mon`..`sun`
 *
 * Weekdays are numbered 0 (Monday) to 6 (Sunday). The week field is the ISO
 * 8601 week number.
 */
class CronField {
public:
    /**
     * @brief Compiles a field expression.
     *
     * @param kind The time unit constrained by the field.
     * @param expression The field text, e.g. "*&#47;15" or "mon-fri".
     * @param isDefault Whether the value was filled in rather than given.
     * @throws cadence::error::InvalidArgument If the expression is malformed
     * or a value is outside the unit's range.
     */
    CronField(CronFieldKind kind, std::string_view expression,
              bool isDefault = false);

    [[nodiscard]] auto kind() const noexcept -> CronFieldKind { return kind_; }
    [[nodiscard]] auto expression() const -> const std::string& {
        return expression_;
    }
    [[nodiscard]] auto isDefault() const noexcept -> bool { return isDefault_; }
    [[nodiscard]] auto isWildcard() const noexcept -> bool {
        return wildcard_;
    }

    [[nodiscard]] auto matches(int value) const -> bool;

    /**
     * @brief Smallest allowed value that is >= from, if any.
     */
    [[nodiscard]] auto nextValue(int from) const -> std::optional<int>;

private:
    void parseTerm(std::string_view term);
    [[nodiscard]] auto parseValue(std::string_view text) const -> int;

    CronFieldKind kind_;
    std::string expression_;
    bool isDefault_;
    bool wildcard_ = false;
    CronFieldRange range_;
    std::vector<bool> allowed_;
};

}  // namespace cadence::schedule

#endif  // CADENCE_SCHEDULE_CRON_FIELD_HPP
