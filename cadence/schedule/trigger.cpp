/*
 * trigger.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Trigger types and next fire time computation

**************************************************/

#include "trigger.hpp"

#include <algorithm>
#include <sstream>
#include <unordered_map>
#include <vector>

#include "cadence/error/exception.hpp"
#include "cadence/utils/string.hpp"

namespace cadence::schedule {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

const std::unordered_map<std::string, std::string> CRONTAB_SHORTCUTS = {
    {"@yearly", "0 0 1 1 *"},  {"@annually", "0 0 1 1 *"},
    {"@monthly", "0 0 1 * *"}, {"@weekly", "0 0 * * sun"},
    {"@daily", "0 0 * * *"},   {"@midnight", "0 0 * * *"},
    {"@hourly", "0 * * * *"}};

auto defaultExpression(CronFieldKind kind) -> std::string_view {
    switch (kind) {
        case CronFieldKind::Month:
        case CronFieldKind::Day:
            return "1";
        case CronFieldKind::Hour:
        case CronFieldKind::Minute:
        case CronFieldKind::Second:
            return "0";
        default:
            return "*";
    }
}

// Local calendar time, one second resolution.
struct Civil {
    int year;
    int month;
    int day;
    int hour;
    int minute;
    int second;
};

auto toCivil(const std::tm& tm) -> Civil {
    return {tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
            tm.tm_hour,        tm.tm_min,     tm.tm_sec};
}

auto toTm(const Civil& civil) -> std::tm {
    std::tm tm{};
    tm.tm_year = civil.year - 1900;
    tm.tm_mon = civil.month - 1;
    tm.tm_mday = civil.day;
    tm.tm_hour = civil.hour;
    tm.tm_min = civil.minute;
    tm.tm_sec = civil.second;
    return tm;
}

auto sameCivil(const Civil& a, const Civil& b) -> bool {
    return a.year == b.year && a.month == b.month && a.day == b.day &&
           a.hour == b.hour && a.minute == b.minute && a.second == b.second;
}

auto daysInMonth(int year, int month) -> int {
    const std::chrono::year_month_day_last last{
        std::chrono::year{year} /
        std::chrono::month{static_cast<unsigned>(month)} / std::chrono::last};
    return static_cast<int>(static_cast<unsigned>(last.day()));
}

auto toSysDays(const Civil& civil) -> std::chrono::sys_days {
    return std::chrono::sys_days{
        std::chrono::year{civil.year} /
        std::chrono::month{static_cast<unsigned>(civil.month)} /
        std::chrono::day{static_cast<unsigned>(civil.day)}};
}

// 0 = Monday ... 6 = Sunday
auto weekdayIndex(std::chrono::sys_days date) -> int {
    return static_cast<int>(std::chrono::weekday{date}.iso_encoding()) - 1;
}

auto isoWeek(std::chrono::sys_days date) -> int {
    // The ISO week belongs to the year of its Thursday.
    const std::chrono::sys_days thursday =
        date + std::chrono::days{3 - weekdayIndex(date)};
    const std::chrono::year_month_day thursdayDate{thursday};
    const std::chrono::sys_days firstOfYear{thursdayDate.year() /
                                            std::chrono::January / 1};
    return static_cast<int>((thursday - firstOfYear).count() / 7) + 1;
}

void resetTime(Civil& civil) {
    civil.hour = 0;
    civil.minute = 0;
    civil.second = 0;
}

void nextDay(Civil& civil) {
    ++civil.day;
    resetTime(civil);
}

void nextHour(Civil& civil) {
    civil.minute = 0;
    civil.second = 0;
    if (++civil.hour > 23) {
        nextDay(civil);
    }
}

void nextMinute(Civil& civil) {
    civil.second = 0;
    if (++civil.minute > 59) {
        nextHour(civil);
    }
}

void nextSecond(Civil& civil) {
    if (++civil.second > 59) {
        nextMinute(civil);
    }
}

auto quote(const std::string& text) -> std::string { return "'" + text + "'"; }

}  // namespace

auto CronSpec::fromCrontab(std::string_view expression) -> CronSpec {
    std::string line = utils::toLower(utils::trim(expression));
    if (utils::startsWith(line, "@")) {
        auto it = CRONTAB_SHORTCUTS.find(line);
        if (it == CRONTAB_SHORTCUTS.end()) {
            THROW_INVALID_ARGUMENT("Unknown crontab shortcut: ", line);
        }
        line = it->second;
    }

    std::istringstream stream(line);
    std::vector<std::string> fields;
    std::string token;
    while (stream >> token) {
        fields.push_back(token);
    }
    if (fields.size() != 5) {
        THROW_INVALID_ARGUMENT("Crontab expression needs 5 fields, got ",
                               fields.size(), ": ", expression);
    }

    CronSpec spec;
    spec.minute = fields[0];
    spec.hour = fields[1];
    spec.day = fields[2];
    spec.month = fields[3];
    spec.dayOfWeek = fields[4];
    return spec;
}

auto CronSpec::get(CronFieldKind kind) const
    -> const std::optional<std::string>& {
    switch (kind) {
        case CronFieldKind::Year:
            return year;
        case CronFieldKind::Month:
            return month;
        case CronFieldKind::Day:
            return day;
        case CronFieldKind::Week:
            return week;
        case CronFieldKind::DayOfWeek:
            return dayOfWeek;
        case CronFieldKind::Hour:
            return hour;
        case CronFieldKind::Minute:
            return minute;
        case CronFieldKind::Second:
            break;
    }
    return second;
}

CronTrigger::CronTrigger(const CronSpec& spec, int searchYears)
    : spec_(spec), searchYears_(searchYears) {
    if (searchYears_ <= 0) {
        THROW_INVALID_ARGUMENT("Cron search window must be positive, got ",
                               searchYears_);
    }

    // Index of the least significant field given explicitly.
    int lastGiven = -1;
    for (size_t i = 0; i < CRON_FIELD_COUNT; ++i) {
        if (spec_.get(CRON_FIELD_ORDER[i]).has_value()) {
            lastGiven = static_cast<int>(i);
        }
    }

    for (size_t i = 0; i < CRON_FIELD_COUNT; ++i) {
        const auto kind = CRON_FIELD_ORDER[i];
        const auto& given = spec_.get(kind);
        if (given) {
            fields_[i].emplace(kind, *given, false);
        } else if (static_cast<int>(i) > lastGiven && lastGiven >= 0) {
            fields_[i].emplace(kind, defaultExpression(kind), true);
        } else {
            fields_[i].emplace(kind, "*", true);
        }
    }
}

auto CronTrigger::field(CronFieldKind kind) const -> const CronField& {
    return *fields_[static_cast<size_t>(kind)];
}

auto CronTrigger::nextAfter(TimePoint reference) const -> TimePoint {
    const auto& years = field(CronFieldKind::Year);
    const auto& months = field(CronFieldKind::Month);
    const auto& days = field(CronFieldKind::Day);
    const auto& weeks = field(CronFieldKind::Week);
    const auto& weekdays = field(CronFieldKind::DayOfWeek);
    const auto& hours = field(CronFieldKind::Hour);
    const auto& minutes = field(CronFieldKind::Minute);
    const auto& seconds = field(CronFieldKind::Second);

    const TimePoint start =
        utils::truncateToSeconds(reference) + std::chrono::seconds(1);
    Civil candidate = toCivil(utils::toLocalTm(start));
    const int lastYear = std::min(candidate.year + searchYears_,
                                  fieldRange(CronFieldKind::Year).max);

    while (true) {
        if (candidate.year > lastYear) {
            THROW_NO_MATCH_ERROR("No fire time within ", searchYears_,
                                 " years after ",
                                 utils::formatTimePoint(reference));
        }

        // Normalize day overflow produced by the carries below.
        if (candidate.month > 12) {
            ++candidate.year;
            candidate.month = 1;
            candidate.day = 1;
            resetTime(candidate);
            continue;
        }
        if (candidate.day > daysInMonth(candidate.year, candidate.month)) {
            ++candidate.month;
            candidate.day = 1;
            resetTime(candidate);
            continue;
        }

        if (!years.matches(candidate.year)) {
            auto next = years.nextValue(candidate.year + 1);
            if (!next) {
                THROW_NO_MATCH_ERROR("Year field '", years.expression(),
                                     "' allows no year after ",
                                     candidate.year);
            }
            candidate = {*next, 1, 1, 0, 0, 0};
            continue;
        }

        if (!months.matches(candidate.month)) {
            auto next = months.nextValue(candidate.month + 1);
            if (next) {
                candidate.month = *next;
            } else {
                ++candidate.year;
                candidate.month = 1;
            }
            candidate.day = 1;
            resetTime(candidate);
            continue;
        }

        const auto date = toSysDays(candidate);
        if (!days.matches(candidate.day) || !weeks.matches(isoWeek(date)) ||
            !weekdays.matches(weekdayIndex(date))) {
            nextDay(candidate);
            continue;
        }

        if (!hours.matches(candidate.hour)) {
            auto next = hours.nextValue(candidate.hour + 1);
            if (next) {
                candidate.hour = *next;
                candidate.minute = 0;
                candidate.second = 0;
            } else {
                nextDay(candidate);
            }
            continue;
        }

        if (!minutes.matches(candidate.minute)) {
            auto next = minutes.nextValue(candidate.minute + 1);
            if (next) {
                candidate.minute = *next;
                candidate.second = 0;
            } else {
                nextHour(candidate);
            }
            continue;
        }

        if (!seconds.matches(candidate.second)) {
            auto next = seconds.nextValue(candidate.second + 1);
            if (next) {
                candidate.second = *next;
            } else {
                nextMinute(candidate);
            }
            continue;
        }

        // A local time may not exist (DST gap) or repeat (DST fold).
        const TimePoint resolved = utils::fromLocalTm(toTm(candidate));
        if (resolved > reference &&
            sameCivil(toCivil(utils::toLocalTm(resolved)), candidate)) {
            return resolved;
        }
        nextSecond(candidate);
    }
}

auto makeOnce(TimePoint at) -> Trigger { return OnceTrigger{at}; }

auto makeInterval(std::chrono::milliseconds period,
                  std::optional<TimePoint> start) -> Trigger {
    if (period <= std::chrono::milliseconds::zero()) {
        THROW_INVALID_ARGUMENT("Interval period must be positive, got ",
                               period.count(), "ms");
    }
    if (period > MAX_INTERVAL_PERIOD) {
        THROW_INVALID_ARGUMENT("Interval period of ", period.count(),
                               "ms exceeds the maximum of ",
                               MAX_INTERVAL_PERIOD.count(), "h");
    }
    return IntervalTrigger{period, start.value_or(Clock::now())};
}

auto makeCron(const CronSpec& spec, int searchYears) -> Trigger {
    return CronTrigger(spec, searchYears);
}

auto nextFireTime(const Trigger& trigger, TimePoint reference)
    -> std::optional<TimePoint> {
    return std::visit(
        Overloaded{
            [reference](const OnceTrigger& once) -> std::optional<TimePoint> {
                if (once.at > reference) {
                    return once.at;
                }
                return std::nullopt;
            },
            [reference](
                const IntervalTrigger& interval) -> std::optional<TimePoint> {
                if (reference < interval.start) {
                    return interval.start;
                }
                const auto period =
                    std::chrono::duration_cast<Clock::duration>(
                        interval.period);
                const auto elapsed = reference - interval.start;
                const auto ticks = elapsed / period + 1;
                return interval.start + ticks * period;
            },
            [reference](const CronTrigger& cron) -> std::optional<TimePoint> {
                return cron.nextAfter(reference);
            }},
        trigger);
}

auto triggerKind(const Trigger& trigger) -> std::string_view {
    return std::visit(Overloaded{[](const OnceTrigger&) { return "date"; },
                                 [](const IntervalTrigger&) {
                                     return "interval";
                                 },
                                 [](const CronTrigger&) { return "cron"; }},
                      trigger);
}

auto describe(const Trigger& trigger) -> std::string {
    return std::visit(
        Overloaded{
            [](const OnceTrigger& once) {
                return "date[" + utils::formatTimePoint(once.at) + "]";
            },
            [](const IntervalTrigger& interval) {
                return "interval[" +
                       utils::formatDuration(
                           std::chrono::duration_cast<std::chrono::seconds>(
                               interval.period)) +
                       "]";
            },
            [](const CronTrigger& cron) {
                std::string out = "cron[";
                bool first = true;
                for (auto kind : CRON_FIELD_ORDER) {
                    const auto& field = cron.field(kind);
                    if (field.isDefault()) {
                        continue;
                    }
                    if (!first) {
                        out += ", ";
                    }
                    out += std::string(fieldName(kind)) + "=" +
                           quote(field.expression());
                    first = false;
                }
                return out + "]";
            }},
        trigger);
}

auto toJson(const Trigger& trigger) -> json {
    return std::visit(
        Overloaded{
            [](const OnceTrigger& once) {
                return json{{"type", "date"},
                            {"run_date", utils::formatTimePoint(once.at)}};
            },
            [](const IntervalTrigger& interval) {
                return json{{"type", "interval"},
                            {"period_ms", interval.period.count()},
                            {"start_date",
                             utils::formatTimePoint(interval.start)}};
            },
            [](const CronTrigger& cron) {
                json out{{"type", "cron"}};
                for (auto kind : CRON_FIELD_ORDER) {
                    const auto& field = cron.field(kind);
                    if (!field.isDefault()) {
                        out[std::string(fieldName(kind))] = field.expression();
                    }
                }
                return out;
            }},
        trigger);
}

}  // namespace cadence::schedule
