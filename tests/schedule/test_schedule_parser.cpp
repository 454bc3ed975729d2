#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <string>
#include <variant>
#include <vector>

#include "cadence/error/exception.hpp"
#include "cadence/schedule/schedule_parser.hpp"

using namespace cadence::schedule;
using namespace std::chrono_literals;
using cadence::error::UnparsableScheduleError;

class ScheduleParserTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        setenv("TZ", "UTC", 1);
        tzset();
    }

    static auto at(int y, unsigned m, unsigned d, int hh = 0, int mm = 0)
        -> TimePoint {
        return std::chrono::sys_days{std::chrono::year{y} /
                                     std::chrono::month{m} /
                                     std::chrono::day{d}} +
               std::chrono::hours(hh) + std::chrono::minutes(mm);
    }

    ScheduleParser parser;
    // Monday 2024-01-15 10:00 UTC
    const TimePoint now = at(2024, 1, 15, 10);
};

TEST_F(ScheduleParserTest, EveryDayAt) {
    const auto trigger = parser.parse("every day at 7:00", now);
    ASSERT_TRUE(std::holds_alternative<CronTrigger>(trigger));
    const auto& spec = std::get<CronTrigger>(trigger).spec();
    EXPECT_EQ(spec.hour, "7");
    EXPECT_EQ(spec.minute, "0");
    EXPECT_EQ(nextFireTime(trigger, now), at(2024, 1, 16, 7));
}

TEST_F(ScheduleParserTest, DailyAtIgnoresCaseAndPunctuation) {
    const auto trigger = parser.parse("  Remind me DAILY at 19:30. ", now);
    ASSERT_TRUE(std::holds_alternative<CronTrigger>(trigger));
    EXPECT_EQ(nextFireTime(trigger, now), at(2024, 1, 15, 19, 30));
}

TEST_F(ScheduleParserTest, EveryNMinutes) {
    const auto trigger = parser.parse("every 10 minutes", now);
    ASSERT_TRUE(std::holds_alternative<IntervalTrigger>(trigger));
    const auto& interval = std::get<IntervalTrigger>(trigger);
    EXPECT_EQ(interval.period, 10min);
    EXPECT_EQ(interval.start, now);
    EXPECT_EQ(nextFireTime(trigger, now), now + 10min);
}

TEST_F(ScheduleParserTest, EveryNHours) {
    const auto trigger = parser.parse("check the mail every 2 hours", now);
    ASSERT_TRUE(std::holds_alternative<IntervalTrigger>(trigger));
    EXPECT_EQ(std::get<IntervalTrigger>(trigger).period, 2h);
}

TEST_F(ScheduleParserTest, SingularUnits) {
    EXPECT_EQ(std::get<IntervalTrigger>(parser.parse("every 1 minute", now))
                  .period,
              1min);
    EXPECT_EQ(std::get<OnceTrigger>(parser.parse("in 1 hour", now)).at,
              now + 1h);
}

TEST_F(ScheduleParserTest, TomorrowAt) {
    const auto trigger = parser.parse("tomorrow at 8", now);
    ASSERT_TRUE(std::holds_alternative<OnceTrigger>(trigger));
    EXPECT_EQ(std::get<OnceTrigger>(trigger).at, at(2024, 1, 16, 8));
}

TEST_F(ScheduleParserTest, TomorrowAtRollsOverMonth) {
    const auto trigger = parser.parse("tomorrow at 6:45", at(2024, 1, 31, 22));
    EXPECT_EQ(std::get<OnceTrigger>(trigger).at, at(2024, 2, 1, 6, 45));
}

TEST_F(ScheduleParserTest, InNMinutesAndHours) {
    EXPECT_EQ(std::get<OnceTrigger>(parser.parse("in 30 minutes", now)).at,
              now + 30min);
    EXPECT_EQ(std::get<OnceTrigger>(parser.parse("in 2 hours!", now)).at,
              now + 2h);
}

TEST_F(ScheduleParserTest, RulePriority) {
    EXPECT_EQ(parser.ruleNames(),
              (std::vector<std::string>{"daily", "every_minutes",
                                        "every_hours", "tomorrow",
                                        "in_minutes", "in_hours"}));
    // "every ... minutes" is tried before "in ... minutes".
    EXPECT_TRUE(std::holds_alternative<IntervalTrigger>(
        parser.parse("every 5 minutes in the kitchen", now)));
}

TEST_F(ScheduleParserTest, SelectedRuleDoesNotFallThrough) {
    EXPECT_THROW((void)parser.parse("every day at noon", now),
                 UnparsableScheduleError);
    EXPECT_THROW((void)parser.parse("every few minutes", now),
                 UnparsableScheduleError);
    EXPECT_THROW((void)parser.parse("every day at", now),
                 UnparsableScheduleError);
}

TEST_F(ScheduleParserTest, RejectsInvalidNumbersAndTimes) {
    EXPECT_THROW((void)parser.parse("every day at 25:00", now),
                 UnparsableScheduleError);
    EXPECT_THROW((void)parser.parse("every day at 7:60", now),
                 UnparsableScheduleError);
    EXPECT_THROW((void)parser.parse("tomorrow at 7:5:1", now),
                 UnparsableScheduleError);
    EXPECT_THROW((void)parser.parse("in 0 minutes", now),
                 UnparsableScheduleError);
    EXPECT_THROW((void)parser.parse("every -3 hours", now),
                 UnparsableScheduleError);
}

TEST_F(ScheduleParserTest, RejectsOversizedCounts) {
    EXPECT_THROW((void)parser.parse("every 3000000 hours", now),
                 UnparsableScheduleError);
    EXPECT_THROW((void)parser.parse("in 3000000 hours", now),
                 UnparsableScheduleError);
    EXPECT_THROW((void)parser.parse("every 2000000000 minutes", now),
                 UnparsableScheduleError);
    EXPECT_THROW((void)parser.parse("in 2000000000 minutes", now),
                 UnparsableScheduleError);

    const auto trigger = parser.parse("every 876000 hours", now);
    EXPECT_EQ(nextFireTime(trigger, now), now + std::chrono::hours(876000));
}

TEST_F(ScheduleParserTest, RejectsUnrecognizedText) {
    EXPECT_THROW((void)parser.parse("", now), UnparsableScheduleError);
    EXPECT_THROW((void)parser.parse("   ", now), UnparsableScheduleError);
    EXPECT_THROW((void)parser.parse("whenever you like", now),
                 UnparsableScheduleError);
    EXPECT_THROW((void)parser.parse("next friday", now),
                 UnparsableScheduleError);
    EXPECT_THROW((void)parser.parse("nonsense text"),
                 UnparsableScheduleError);
}

TEST_F(ScheduleParserTest, DefaultsToCurrentTime) {
    const auto before = Clock::now();
    const auto trigger = parser.parse("in 30 minutes");
    const auto after = Clock::now();
    ASSERT_TRUE(std::holds_alternative<OnceTrigger>(trigger));
    const auto when = std::get<OnceTrigger>(trigger).at;
    EXPECT_GE(when, before + 30min);
    EXPECT_LE(when, after + 30min);
}
