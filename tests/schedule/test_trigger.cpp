#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <variant>

#include "cadence/error/exception.hpp"
#include "cadence/schedule/trigger.hpp"

using namespace cadence::schedule;
using namespace std::chrono_literals;
using cadence::error::InvalidArgument;
using cadence::error::NoMatchError;

class TriggerTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        setenv("TZ", "UTC", 1);
        tzset();
    }

    static auto at(int y, unsigned m, unsigned d, int hh = 0, int mm = 0,
                   int ss = 0) -> TimePoint {
        return std::chrono::sys_days{std::chrono::year{y} /
                                     std::chrono::month{m} /
                                     std::chrono::day{d}} +
               std::chrono::hours(hh) + std::chrono::minutes(mm) +
               std::chrono::seconds(ss);
    }

    static auto cron(const CronSpec& spec, int searchYears = 4) -> Trigger {
        return makeCron(spec, searchYears);
    }
};

TEST_F(TriggerTest, OnceFiresOnlyBeforeItsTime) {
    const auto when = at(2024, 5, 1, 12);
    const auto trigger = makeOnce(when);
    EXPECT_EQ(nextFireTime(trigger, at(2024, 5, 1, 11)), when);
    EXPECT_EQ(nextFireTime(trigger, when), std::nullopt);
    EXPECT_EQ(nextFireTime(trigger, at(2024, 5, 2)), std::nullopt);
}

TEST_F(TriggerTest, IntervalAlignsOnStart) {
    const auto start = at(2024, 5, 1, 12);
    const auto trigger = makeInterval(10s, start);
    EXPECT_EQ(nextFireTime(trigger, start - 5s), start);
    EXPECT_EQ(nextFireTime(trigger, start), start + 10s);
    EXPECT_EQ(nextFireTime(trigger, start + 25s), start + 30s);
    EXPECT_EQ(nextFireTime(trigger, start + 30s), start + 40s);
}

TEST_F(TriggerTest, IntervalSuccessiveFiresAreOnePeriodApart) {
    const auto trigger = makeInterval(7min, at(2024, 1, 1));
    auto previous = *nextFireTime(trigger, at(2024, 1, 1, 3, 2, 1));
    for (int i = 0; i < 20; ++i) {
        const auto next = *nextFireTime(trigger, previous);
        EXPECT_EQ(next - previous, 7min);
        previous = next;
    }
}

TEST_F(TriggerTest, IntervalRejectsNonPositivePeriod) {
    EXPECT_THROW((void)makeInterval(0ms), InvalidArgument);
    EXPECT_THROW((void)makeInterval(-5s), InvalidArgument);
}

TEST_F(TriggerTest, IntervalRejectsPeriodBeyondMaximum) {
    EXPECT_THROW((void)makeInterval(std::chrono::hours(3000000)),
                 InvalidArgument);
    EXPECT_THROW((void)makeInterval(std::chrono::milliseconds::max()),
                 InvalidArgument);

    const auto start = at(2024, 1, 1);
    const auto trigger = makeInterval(MAX_INTERVAL_PERIOD, start);
    EXPECT_EQ(nextFireTime(trigger, start), start + MAX_INTERVAL_PERIOD);
}

TEST_F(TriggerTest, DailyCronTodayOrTomorrow) {
    CronSpec spec;
    spec.hour = "7";
    spec.minute = "0";
    const auto trigger = cron(spec);
    EXPECT_EQ(nextFireTime(trigger, at(2024, 1, 15, 6, 0)),
              at(2024, 1, 15, 7, 0));
    EXPECT_EQ(nextFireTime(trigger, at(2024, 1, 15, 7, 0)),
              at(2024, 1, 16, 7, 0));
    EXPECT_EQ(nextFireTime(trigger, at(2024, 1, 15, 8, 30)),
              at(2024, 1, 16, 7, 0));
}

TEST_F(TriggerTest, CronCrossesMonthAndYearEnds) {
    CronSpec spec;
    spec.hour = "7";
    spec.minute = "0";
    const auto trigger = cron(spec);
    EXPECT_EQ(nextFireTime(trigger, at(2024, 2, 29, 9)), at(2024, 3, 1, 7));
    EXPECT_EQ(nextFireTime(trigger, at(2024, 12, 31, 9)), at(2025, 1, 1, 7));
}

TEST_F(TriggerTest, CronMinuteStep) {
    CronSpec spec;
    spec.minute = "*/15";
    const auto trigger = cron(spec);
    EXPECT_EQ(nextFireTime(trigger, at(2024, 1, 15, 10, 7, 30)),
              at(2024, 1, 15, 10, 15));
    EXPECT_EQ(nextFireTime(trigger, at(2024, 1, 15, 10, 45)),
              at(2024, 1, 15, 11, 0));
}

TEST_F(TriggerTest, CronWeekdaysSkipWeekend) {
    CronSpec spec;
    spec.dayOfWeek = "mon-fri";
    spec.hour = "9";
    const auto trigger = cron(spec);
    // 2024-01-13 is a Saturday.
    EXPECT_EQ(nextFireTime(trigger, at(2024, 1, 13, 10)), at(2024, 1, 15, 9));
}

TEST_F(TriggerTest, CronIsoWeek) {
    CronSpec spec;
    spec.week = "1";
    spec.dayOfWeek = "mon";
    const auto trigger = cron(spec);
    // ISO week 1 of 2025 starts on Monday 2024-12-30.
    EXPECT_EQ(nextFireTime(trigger, at(2024, 6, 1)), at(2024, 12, 30));
}

TEST_F(TriggerTest, CronFieldsAreAnded) {
    CronSpec spec;
    spec.day = "13";
    spec.dayOfWeek = "fri";
    const auto trigger = cron(spec, 10);
    // First Friday the 13th after 2024-01-01.
    EXPECT_EQ(nextFireTime(trigger, at(2024, 1, 1)), at(2024, 9, 13));
}

TEST_F(TriggerTest, CronImpossibleDateRaisesNoMatch) {
    CronSpec spec;
    spec.month = "2";
    spec.day = "31";
    const auto trigger = cron(spec);
    EXPECT_THROW((void)nextFireTime(trigger, at(2024, 1, 1)), NoMatchError);
}

TEST_F(TriggerTest, CronYearOutsideWindow) {
    CronSpec spec;
    spec.year = "2030";
    EXPECT_THROW((void)nextFireTime(cron(spec, 4), at(2024, 1, 1)),
                 NoMatchError);
    EXPECT_EQ(nextFireTime(cron(spec, 10), at(2024, 1, 1)), at(2030, 1, 1));
}

TEST_F(TriggerTest, CronDefaultsLessSignificantFields) {
    CronSpec spec;
    spec.day = "15";
    const CronTrigger trigger(spec);
    EXPECT_TRUE(trigger.field(CronFieldKind::Month).isWildcard());
    EXPECT_EQ(trigger.field(CronFieldKind::Hour).expression(), "0");
    EXPECT_TRUE(trigger.field(CronFieldKind::Hour).isDefault());
    EXPECT_TRUE(trigger.field(CronFieldKind::DayOfWeek).isWildcard());
    EXPECT_EQ(trigger.nextAfter(at(2024, 1, 20)), at(2024, 2, 15));
}

TEST_F(TriggerTest, CronRejectsBadFields) {
    CronSpec spec;
    spec.hour = "25";
    EXPECT_THROW((void)cron(spec), InvalidArgument);
    EXPECT_THROW(CronTrigger(CronSpec{}, 0), InvalidArgument);
}

TEST_F(TriggerTest, CrontabLines) {
    const auto spec = CronSpec::fromCrontab("30 7 * * mon");
    EXPECT_EQ(spec.minute, "30");
    EXPECT_EQ(spec.hour, "7");
    EXPECT_EQ(spec.dayOfWeek, "mon");
    EXPECT_FALSE(spec.second.has_value());
    EXPECT_EQ(nextFireTime(cron(spec), at(2024, 1, 13)), at(2024, 1, 15, 7, 30));
}

TEST_F(TriggerTest, CrontabShortcuts) {
    EXPECT_EQ(nextFireTime(cron(CronSpec::fromCrontab("@hourly")),
                           at(2024, 1, 1, 10, 5)),
              at(2024, 1, 1, 11));
    EXPECT_EQ(nextFireTime(cron(CronSpec::fromCrontab("@daily")),
                           at(2024, 1, 1, 10)),
              at(2024, 1, 2));
    // 2024-01-07 is a Sunday.
    EXPECT_EQ(nextFireTime(cron(CronSpec::fromCrontab("@weekly")),
                           at(2024, 1, 3)),
              at(2024, 1, 7));
    EXPECT_EQ(nextFireTime(cron(CronSpec::fromCrontab("@yearly")),
                           at(2024, 3, 1)),
              at(2025, 1, 1));
    EXPECT_THROW((void)CronSpec::fromCrontab("@never"), InvalidArgument);
    EXPECT_THROW((void)CronSpec::fromCrontab("* * *"), InvalidArgument);
}

TEST_F(TriggerTest, KindsAndDescriptions) {
    CronSpec spec;
    spec.hour = "7";
    spec.minute = "0";
    const auto daily = cron(spec);
    const auto interval = makeInterval(10min, at(2024, 1, 1));
    const auto once = makeOnce(at(2024, 1, 2, 3, 4, 5));

    EXPECT_EQ(triggerKind(daily), "cron");
    EXPECT_EQ(triggerKind(interval), "interval");
    EXPECT_EQ(triggerKind(once), "date");

    EXPECT_EQ(describe(daily), "cron[hour='7', minute='0']");
    EXPECT_EQ(describe(interval), "interval[0:10:00]");
    EXPECT_EQ(describe(once), "date[2024-01-02 03:04:05+0000]");
}

TEST_F(TriggerTest, JsonForm) {
    CronSpec spec;
    spec.dayOfWeek = "mon";
    spec.hour = "9";
    const auto cronJson = toJson(cron(spec));
    EXPECT_EQ(cronJson["type"], "cron");
    EXPECT_EQ(cronJson["day_of_week"], "mon");
    EXPECT_EQ(cronJson["hour"], "9");
    EXPECT_FALSE(cronJson.contains("minute"));

    const auto intervalJson = toJson(makeInterval(90s, at(2024, 1, 1)));
    EXPECT_EQ(intervalJson["type"], "interval");
    EXPECT_EQ(intervalJson["period_ms"], 90000);
    EXPECT_EQ(intervalJson["start_date"], "2024-01-01 00:00:00+0000");

    const auto onceJson = toJson(makeOnce(at(2024, 1, 1, 8)));
    EXPECT_EQ(onceJson["type"], "date");
    EXPECT_EQ(onceJson["run_date"], "2024-01-01 08:00:00+0000");
}
