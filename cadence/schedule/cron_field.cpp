/*
 * cron_field.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Parsed cron field constraints

**************************************************/

#include "cron_field.hpp"

#include <algorithm>
#include <unordered_map>

#include "cadence/error/exception.hpp"
#include "cadence/utils/string.hpp"

namespace cadence::schedule {

namespace {
const std::unordered_map<std::string, int> MONTH_NAMES = {
    {"jan", 1}, {"feb", 2}, {"mar", 3}, {"apr", 4},  {"may", 5},  {"jun", 6},
    {"jul", 7}, {"aug", 8}, {"sep", 9}, {"oct", 10}, {"nov", 11}, {"dec", 12}};

const std::unordered_map<std::string, int> WEEKDAY_NAMES = {
    {"mon", 0}, {"tue", 1}, {"wed", 2}, {"thu", 3},
    {"fri", 4}, {"sat", 5}, {"sun", 6}};
}  // namespace

auto fieldName(CronFieldKind kind) -> std::string_view {
    switch (kind) {
        case CronFieldKind::Year:
            return "year";
        case CronFieldKind::Month:
            return "month";
        case CronFieldKind::Day:
            return "day";
        case CronFieldKind::Week:
            return "week";
        case CronFieldKind::DayOfWeek:
            return "day_of_week";
        case CronFieldKind::Hour:
            return "hour";
        case CronFieldKind::Minute:
            return "minute";
        case CronFieldKind::Second:
            return "second";
    }
    return "unknown";
}

auto fieldRange(CronFieldKind kind) -> CronFieldRange {
    switch (kind) {
        case CronFieldKind::Year:
            return {1970, 2099};
        case CronFieldKind::Month:
            return {1, 12};
        case CronFieldKind::Day:
            return {1, 31};
        case CronFieldKind::Week:
            return {1, 53};
        case CronFieldKind::DayOfWeek:
            return {0, 6};
        case CronFieldKind::Hour:
            return {0, 23};
        case CronFieldKind::Minute:
        case CronFieldKind::Second:
            return {0, 59};
    }
    return {0, 0};
}

CronField::CronField(CronFieldKind kind, std::string_view expression,
                     bool isDefault)
    : kind_(kind),
      expression_(utils::toLower(utils::trim(expression))),
      isDefault_(isDefault),
      range_(fieldRange(kind)),
      allowed_(static_cast<size_t>(range_.max - range_.min + 1), false) {
    if (expression_.empty()) {
        THROW_INVALID_ARGUMENT("Empty expression for cron field '",
                               fieldName(kind_), "'");
    }

    wildcard_ = expression_ == "*";
    for (const auto& term : utils::splitString(expression_, ',')) {
        parseTerm(utils::trim(term));
    }
}

auto CronField::matches(int value) const -> bool {
    if (value < range_.min || value > range_.max) {
        return false;
    }
    return allowed_[static_cast<size_t>(value - range_.min)];
}

auto CronField::nextValue(int from) const -> std::optional<int> {
    for (int value = std::max(from, range_.min); value <= range_.max;
         ++value) {
        if (allowed_[static_cast<size_t>(value - range_.min)]) {
            return value;
        }
    }
    return std::nullopt;
}

void CronField::parseTerm(std::string_view term) {
    if (term.empty()) {
        THROW_INVALID_ARGUMENT("Empty term in cron field '", fieldName(kind_),
                               "': ", expression_);
    }

    int step = 1;
    std::string_view body = term;
    if (auto slash = term.find('/'); slash != std::string_view::npos) {
        auto parsedStep = utils::parseInt(term.substr(slash + 1));
        if (!parsedStep || *parsedStep <= 0) {
            THROW_INVALID_ARGUMENT("Invalid step in cron field '",
                                   fieldName(kind_), "': ", term);
        }
        if (*parsedStep > range_.max - range_.min) {
            THROW_INVALID_ARGUMENT("Step ", *parsedStep,
                                   " exceeds the range of cron field '",
                                   fieldName(kind_), "': ", term);
        }
        step = *parsedStep;
        body = term.substr(0, slash);
    }

    int first = range_.min;
    int last = range_.max;
    if (body != "*") {
        if (auto dash = body.find('-'); dash != std::string_view::npos) {
            first = parseValue(body.substr(0, dash));
            last = parseValue(body.substr(dash + 1));
            if (first > last) {
                THROW_INVALID_ARGUMENT("Descending range in cron field '",
                                       fieldName(kind_), "': ", term);
            }
        } else {
            first = parseValue(body);
            // "a/n" runs to the end of the range; a lone "a" is one value.
            last = term.find('/') != std::string_view::npos ? range_.max
                                                            : first;
        }
    }

    for (int value = first;; value += step) {
        allowed_[static_cast<size_t>(value - range_.min)] = true;
        if (last - value < step) {
            break;
        }
    }
}

auto CronField::parseValue(std::string_view text) const -> int {
    std::string key(text);
    if (kind_ == CronFieldKind::Month) {
        if (auto it = MONTH_NAMES.find(key); it != MONTH_NAMES.end()) {
            return it->second;
        }
    } else if (kind_ == CronFieldKind::DayOfWeek) {
        if (auto it = WEEKDAY_NAMES.find(key); it != WEEKDAY_NAMES.end()) {
            return it->second;
        }
    }

    auto value = utils::parseInt(text);
    if (!value) {
        THROW_INVALID_ARGUMENT("Invalid value '", text, "' in cron field '",
                               fieldName(kind_), "'");
    }
    if (*value < range_.min || *value > range_.max) {
        THROW_INVALID_ARGUMENT("Value ", *value, " out of range [",
                               range_.min, ", ", range_.max,
                               "] for cron field '", fieldName(kind_), "'");
    }
    return *value;
}

}  // namespace cadence::schedule
