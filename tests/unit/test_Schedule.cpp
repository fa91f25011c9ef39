#include <gtest/gtest.h>
#include "model/Schedule.hpp"

#include <nlohmann/json.hpp>

using cs::model::Schedule;

TEST(ScheduleTest, DefaultIsHourlyAtMinuteZero) {
    const Schedule s;
    EXPECT_EQ(s.toCronLine(), "00 * * * *");
    EXPECT_TRUE(s.validate().empty());
}

TEST(ScheduleTest, AcceptsCommonCronSyntax) {
    const Schedule s{"*/15", "1-5", "1,15", "jan", "mon-fri"};
    EXPECT_TRUE(s.validate().empty());
}

TEST(ScheduleTest, RejectsOutOfRangeFields) {
    const Schedule s{"61", "24", "0", "13", "8"};
    const auto errors = s.validate();
    EXPECT_TRUE(errors.has("minute"));
    EXPECT_TRUE(errors.has("hour"));
    EXPECT_TRUE(errors.has("dom"));
    EXPECT_TRUE(errors.has("month"));
    EXPECT_TRUE(errors.has("dow"));
}

TEST(ScheduleTest, DbFormatUsesFlatColumns) {
    const Schedule s{"5", "4", "3", "2", "1"};
    nlohmann::json record = {{"schedule", {{"minute", "5"}}}};
    s.toDbFormat(record);

    EXPECT_FALSE(record.contains("schedule"));
    EXPECT_EQ(record["minute"], "5");
    EXPECT_EQ(record["hour"], "4");
    EXPECT_EQ(record["daymonth"], "3");
    EXPECT_EQ(record["month"], "2");
    EXPECT_EQ(record["dayweek"], "1");
    EXPECT_EQ(Schedule::fromDbFormat(record), s);
}
