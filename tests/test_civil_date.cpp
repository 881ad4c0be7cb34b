#include <gtest/gtest.h>
#include "civil_date.hpp"

using tokenwarden::CivilDate;

TEST(CivilDateTest, parses_and_formats_canonical_dates) {
    auto d = CivilDate::parse("2024-06-10");
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->year, 2024);
    EXPECT_EQ(d->month, 6u);
    EXPECT_EQ(d->day, 10u);
    EXPECT_EQ(d->to_string(), "2024-06-10");
}

TEST(CivilDateTest, rejects_malformed_strings) {
    EXPECT_FALSE(CivilDate::parse("2024-13-40").has_value());
    EXPECT_FALSE(CivilDate::parse("2024-00-10").has_value());
    EXPECT_FALSE(CivilDate::parse("2024-06-00").has_value());
    EXPECT_FALSE(CivilDate::parse("2024-6-10").has_value());
    EXPECT_FALSE(CivilDate::parse("2024/06/10").has_value());
    EXPECT_FALSE(CivilDate::parse("2024-06-10 ").has_value());
    EXPECT_FALSE(CivilDate::parse("tomorrow").has_value());
    EXPECT_FALSE(CivilDate::parse("").has_value());
}

TEST(CivilDateTest, respects_month_lengths_and_leap_years) {
    EXPECT_TRUE(CivilDate::parse("2024-02-29").has_value());
    EXPECT_FALSE(CivilDate::parse("2023-02-29").has_value());
    EXPECT_TRUE(CivilDate::parse("2000-02-29").has_value());
    EXPECT_FALSE(CivilDate::parse("1900-02-29").has_value());
    EXPECT_FALSE(CivilDate::parse("2024-04-31").has_value());
    EXPECT_TRUE(CivilDate::parse("2024-12-31").has_value());
}

TEST(CivilDateTest, day_arithmetic_crosses_month_and_year) {
    auto d = *CivilDate::parse("2023-12-31");
    EXPECT_EQ(d.add_days(1).to_string(), "2024-01-01");
    EXPECT_EQ(CivilDate::parse("2024-02-28")->add_days(1).to_string(), "2024-02-29");
    EXPECT_EQ(CivilDate::parse("2024-03-01")->add_days(-1).to_string(), "2024-02-29");
    EXPECT_EQ(CivilDate::parse("1970-01-01")->to_days(), 0);
    EXPECT_EQ(tokenwarden::days_between(*CivilDate::parse("2024-01-01"),
                                        *CivilDate::parse("2025-01-01")), 366);
}

TEST(CivilDateTest, ordering_is_by_calendar_day) {
    auto a = *CivilDate::parse("2024-06-10");
    auto b = *CivilDate::parse("2024-06-11");
    EXPECT_TRUE(a < b);
    EXPECT_TRUE(a <= a);
    EXPECT_FALSE(b <= a);
    EXPECT_EQ(a, CivilDate::from_days(a.to_days()));
}
