#include "critpath/calendar/work_calendar.hpp"

#include "gtest/gtest.h"

#include "test_utils.hpp"

#include <array>

using namespace critpath;
using critpath::test::jan;
using critpath::test::person_id;

class WorkCalendarTest : public ::testing::Test {
protected:
  WorkCalendar cal_ = *WorkCalendar::create(kDefaultWorkWeek);
};

TEST_F(WorkCalendarTest, DefaultWeekIsSundayToThursday) {
  EXPECT_TRUE(cal_.is_working_day(jan(7)));   // Sun
  EXPECT_TRUE(cal_.is_working_day(jan(11)));  // Thu
  EXPECT_FALSE(cal_.is_working_day(jan(12))); // Fri
  EXPECT_FALSE(cal_.is_working_day(jan(13))); // Sat
}

TEST_F(WorkCalendarTest, EmptyWeekIsRejected) {
  auto result = WorkCalendar::create(WorkWeek{});
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::InvalidCalendar));
}

TEST_F(WorkCalendarTest, AddZeroReturnsSameDate) {
  EXPECT_EQ(cal_.add_working_days(jan(7), 0), jan(7));
  EXPECT_EQ(cal_.add_working_days(jan(12), 0), jan(12));
}

TEST_F(WorkCalendarTest, AddSkipsWeekend) {
  EXPECT_EQ(cal_.add_working_days(jan(7), 2), jan(9));
  EXPECT_EQ(cal_.add_working_days(jan(10), 2), jan(14));
  EXPECT_EQ(cal_.add_working_days(jan(14), -1), jan(11));
  EXPECT_EQ(cal_.add_working_days(jan(9), -2), jan(7));
}

TEST_F(WorkCalendarTest, CountIsHalfOpenAndSigned) {
  EXPECT_EQ(cal_.count_working_days(jan(7), jan(7)), 0);
  EXPECT_EQ(cal_.count_working_days(jan(7), jan(14)), 5);
  EXPECT_EQ(cal_.count_working_days(jan(14), jan(7)), -5);
  EXPECT_EQ(cal_.count_working_days(jan(12), jan(14)), 0);
}

TEST_F(WorkCalendarTest, CountInvertsAdd) {
  for (int n = 0; n < 15; ++n) {
    EXPECT_EQ(cal_.count_working_days(jan(8), cal_.add_working_days(jan(8), n)), n);
  }
}

TEST_F(WorkCalendarTest, NextAndPreviousWorkingDay) {
  EXPECT_EQ(cal_.next_working_day(jan(12)), jan(14));
  EXPECT_EQ(cal_.next_working_day(jan(9)), jan(9));
  EXPECT_EQ(cal_.previous_working_day(jan(13)), jan(11));
}

TEST_F(WorkCalendarTest, HolidaysAreNotWorkingDays) {
  std::array holidays{jan(9), jan(8), jan(9)};
  auto cal = *WorkCalendar::create(kDefaultWorkWeek, holidays);

  EXPECT_FALSE(cal.is_working_day(jan(8)));
  EXPECT_EQ(cal.non_working_dates().size(), 2);
  EXPECT_EQ(cal.add_working_days(jan(7), 1), jan(10));
  EXPECT_EQ(cal.count_working_days(jan(7), jan(14)), 3);
}

TEST_F(WorkCalendarTest, ExpandCalendarExceptions) {
  std::array exceptions{
      CalendarException{jan(10), jan(11), CalendarExceptionType::Holiday, "feast"},
      CalendarException{jan(8), std::nullopt, CalendarExceptionType::NonWorking, ""},
      CalendarException{jan(11), std::nullopt, CalendarExceptionType::Holiday, ""},
  };
  auto dates = expand_calendar_exceptions(exceptions);
  ASSERT_EQ(dates.size(), 3);
  EXPECT_EQ(dates[0], jan(8));
  EXPECT_EQ(dates[1], jan(10));
  EXPECT_EQ(dates[2], jan(11));
}

TEST_F(WorkCalendarTest, ExpandTimeOffKeepsApprovedForMember) {
  std::array time_off{
      TimeOff{person_id("alice"), jan(8), jan(9), TimeOffStatus::Approved},
      TimeOff{person_id("alice"), jan(15), jan(15), TimeOffStatus::Pending},
      TimeOff{person_id("bob"), jan(10), jan(10), TimeOffStatus::Approved},
  };
  auto dates = expand_time_off(time_off, person_id("alice"));
  ASSERT_EQ(dates.size(), 2);
  EXPECT_EQ(dates[0], jan(8));
  EXPECT_EQ(dates[1], jan(9));
}

TEST_F(WorkCalendarTest, DerivedCalendarsLeaveBaseUntouched) {
  std::array off{jan(8)};
  auto personal = cal_.with_time_off(off).with_work_days(make_work_week({1, 2}));

  EXPECT_FALSE(personal.is_working_day(jan(8)));
  EXPECT_TRUE(personal.is_working_day(jan(9)));
  EXPECT_FALSE(personal.is_working_day(jan(7)));
  EXPECT_TRUE(cal_.is_working_day(jan(8)));

  auto same = cal_.with_work_days(WorkWeek{});
  EXPECT_EQ(same.work_days(), kDefaultWorkWeek);
}

TEST(DateTest, ParseAndFormat) {
  auto d = parse_date("2024-01-07");
  ASSERT_TRUE(d.has_value());
  EXPECT_EQ(*d, jan(7));
  EXPECT_EQ(format_date(*d), "2024-01-07");
  EXPECT_EQ(weekday_index(*d), 0u);

  EXPECT_FALSE(parse_date("2024-02-30").has_value());
  EXPECT_FALSE(parse_date("2024/01/07").has_value());
  EXPECT_FALSE(parse_date("24-01-07").has_value());
}
