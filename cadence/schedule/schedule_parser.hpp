/*
 * schedule_parser.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Natural-language schedule parser

**************************************************/

#ifndef CADENCE_SCHEDULE_SCHEDULE_PARSER_HPP
#define CADENCE_SCHEDULE_SCHEDULE_PARSER_HPP

#include <functional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "cadence/schedule/trigger.hpp"

namespace cadence::schedule {

/**
 * @brief Turns a small set of spoken phrasings into triggers.
 *
 * Rules are tried in a fixed order and the first rule whose keywords occur in
 * the text wins:
 *   1. "every day at <time>" / "daily at <time>"  -> cron hour/minute
 *   2. "every <N> minutes"                        -> interval
 *   3. "every <N> hours"                          -> interval
 *   4. "tomorrow at <time>"                       -> once
 *   5. "in <N> minutes"                           -> once
 *   6. "in <N> hours"                             -> once
 *
 * `<time>` is `H` or `H:MM` in 24 hour local time. Matching ignores case.
 * Once a rule is selected, a missing or malformed number or time is an error;
 * parsing never falls through to a later rule.
 */
class ScheduleParser {
public:
    using Builder =
        std::function<Trigger(const std::smatch& match, TimePoint now)>;

    struct Rule {
        std::string name;
        std::regex selector;   ///< Keywords that select the rule
        std::regex extractor;  ///< Captures the rule's argument as group 1
        Builder build;
    };

    /**
     * @param cronSearchYears Search window given to the cron triggers built
     * by the daily rule.
     */
    explicit ScheduleParser(int cronSearchYears = DEFAULT_CRON_SEARCH_YEARS);

    /**
     * @brief Parses text relative to the current time.
     *
     * @throws cadence::error::UnparsableScheduleError
     */
    [[nodiscard]] auto parse(std::string_view text) const -> Trigger;

    /**
     * @brief Parses text relative to now.
     *
     * @throws cadence::error::UnparsableScheduleError
     */
    [[nodiscard]] auto parse(std::string_view text, TimePoint now) const
        -> Trigger;

    /**
     * @brief Rule names in priority order.
     */
    [[nodiscard]] auto ruleNames() const -> std::vector<std::string>;

private:
    std::vector<Rule> rules_;
};

}  // namespace cadence::schedule

#endif  // CADENCE_SCHEDULE_SCHEDULE_PARSER_HPP
