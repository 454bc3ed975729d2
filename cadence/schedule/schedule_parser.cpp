/*
 * schedule_parser.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Natural-language schedule parser

**************************************************/

#include "schedule_parser.hpp"

#include <chrono>
#include <utility>

#include <spdlog/spdlog.h>

#include "cadence/error/exception.hpp"
#include "cadence/utils/string.hpp"

namespace cadence::schedule {

namespace {

constexpr std::string_view TRAILING_PUNCTUATION = ".,;!?";

struct WallTime {
    int hour;
    int minute;
};

auto argument(const std::smatch& match) -> std::string {
    return utils::trim(match[1].str(), TRAILING_PUNCTUATION);
}

// Counts are capped so that count * unit stays within MAX_INTERVAL_PERIOD.
template <typename Unit>
auto parseCount(const std::string& token) -> Unit {
    auto value = utils::parseInt(token);
    if (!value || *value <= 0) {
        THROW_UNPARSABLE_SCHEDULE("Expected a positive number, got '", token,
                                  "'");
    }
    constexpr auto LIMIT =
        std::chrono::duration_cast<Unit>(MAX_INTERVAL_PERIOD).count();
    if (*value > LIMIT) {
        THROW_UNPARSABLE_SCHEDULE("Number ", *value, " is too large, at most ",
                                  LIMIT, " allowed");
    }
    return Unit(*value);
}

auto parseWallTime(const std::string& token) -> WallTime {
    auto parts = utils::splitString(token, ':');
    if (parts.empty() || parts.size() > 2) {
        THROW_UNPARSABLE_SCHEDULE("Expected H or H:MM, got '", token, "'");
    }

    auto hour = utils::parseInt(parts[0]);
    std::optional<int> minute = 0;
    if (parts.size() == 2) {
        minute = parts[1].size() <= 2 ? utils::parseInt(parts[1])
                                      : std::nullopt;
    }

    if (!hour || !minute || parts[0].empty() || parts[0].size() > 2 ||
        *hour < 0 || *hour > 23 || *minute < 0 || *minute > 59) {
        THROW_UNPARSABLE_SCHEDULE("Invalid time of day '", token, "'");
    }
    return {*hour, *minute};
}

auto makeRule(std::string name, const char* selector, const char* extractor,
              ScheduleParser::Builder build) -> ScheduleParser::Rule {
    constexpr auto FLAGS =
        std::regex::ECMAScript | std::regex::icase | std::regex::optimize;
    return {std::move(name), std::regex(selector, FLAGS),
            std::regex(extractor, FLAGS), std::move(build)};
}

}  // namespace

ScheduleParser::ScheduleParser(int cronSearchYears) {
    rules_.push_back(makeRule(
        "daily", R"(\b(every\s+day|daily)\s+at\b)",
        R"(\b(?:every\s+day|daily)\s+at\s+(\S+))",
        [cronSearchYears](const std::smatch& match, TimePoint) {
            const auto time = parseWallTime(argument(match));
            CronSpec spec;
            spec.hour = std::to_string(time.hour);
            spec.minute = std::to_string(time.minute);
            return makeCron(spec, cronSearchYears);
        }));

    rules_.push_back(makeRule(
        "every_minutes", R"(\bevery\b.*\bminutes?\b)",
        R"(\bevery\s+(\S+)\s+minutes?\b)",
        [](const std::smatch& match, TimePoint now) {
            return makeInterval(
                parseCount<std::chrono::minutes>(argument(match)), now);
        }));

    rules_.push_back(makeRule(
        "every_hours", R"(\bevery\b.*\bhours?\b)",
        R"(\bevery\s+(\S+)\s+hours?\b)",
        [](const std::smatch& match, TimePoint now) {
            return makeInterval(
                parseCount<std::chrono::hours>(argument(match)), now);
        }));

    rules_.push_back(makeRule(
        "tomorrow", R"(\btomorrow\s+at\b)", R"(\btomorrow\s+at\s+(\S+))",
        [](const std::smatch& match, TimePoint now) {
            const auto time = parseWallTime(argument(match));
            std::tm tm = utils::toLocalTm(now);
            tm.tm_mday += 1;
            tm.tm_hour = time.hour;
            tm.tm_min = time.minute;
            tm.tm_sec = 0;
            return makeOnce(utils::fromLocalTm(tm));
        }));

    rules_.push_back(makeRule(
        "in_minutes", R"(\bin\b.*\bminutes?\b)",
        R"(\bin\s+(\S+)\s+minutes?\b)",
        [](const std::smatch& match, TimePoint now) {
            return makeOnce(now +
                            parseCount<std::chrono::minutes>(argument(match)));
        }));

    rules_.push_back(makeRule(
        "in_hours", R"(\bin\b.*\bhours?\b)", R"(\bin\s+(\S+)\s+hours?\b)",
        [](const std::smatch& match, TimePoint now) {
            return makeOnce(now +
                            parseCount<std::chrono::hours>(argument(match)));
        }));
}

auto ScheduleParser::parse(std::string_view text) const -> Trigger {
    return parse(text, Clock::now());
}

auto ScheduleParser::parse(std::string_view text, TimePoint now) const
    -> Trigger {
    const std::string normalized = utils::toLower(utils::trim(text));
    if (normalized.empty()) {
        THROW_UNPARSABLE_SCHEDULE("Empty schedule text");
    }

    for (const auto& rule : rules_) {
        if (!std::regex_search(normalized, rule.selector)) {
            continue;
        }

        std::smatch match;
        if (!std::regex_search(normalized, match, rule.extractor)) {
            THROW_UNPARSABLE_SCHEDULE("Schedule '", text,
                                      "' looks like rule '", rule.name,
                                      "' but its argument is missing");
        }

        try {
            auto trigger = rule.build(match, now);
            spdlog::debug("Parsed schedule '{}' with rule '{}' as {}", text,
                          rule.name, describe(trigger));
            return trigger;
        } catch (const error::UnparsableScheduleError&) {
            throw;
        } catch (const error::Exception& e) {
            THROW_UNPARSABLE_SCHEDULE("Schedule '", text, "' (rule '",
                                      rule.name, "'): ", e.getMessage());
        }
    }

    THROW_UNPARSABLE_SCHEDULE("Unrecognized schedule: '", text, "'");
}

auto ScheduleParser::ruleNames() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(rules_.size());
    for (const auto& rule : rules_) {
        names.push_back(rule.name);
    }
    return names;
}

}  // namespace cadence::schedule
