#pragma once

#include "critpath/core/error.hpp"
#include "critpath/model/entities.hpp"
#include "critpath/util/date.hpp"

#include <span>
#include <vector>

namespace critpath {

// Weekly working pattern plus a set of non-working dates.
//
// Date arithmetic counts working days only. add_working_days(d, 0) returns d
// even when d is not a working day; callers roll a non-working start forward
// with next_working_day() first when their policy requires it.
class WorkCalendar {
public:
  // Fails with Error::InvalidCalendar when the week has no working day.
  [[nodiscard]] static auto create(WorkWeek work_days,
                                   std::span<const Date> non_working = {})
      -> Result<WorkCalendar>;

  [[nodiscard]] auto is_working_day(Date date) const -> bool;

  // n < 0 steps backward.
  [[nodiscard]] auto add_working_days(Date date, int n) const -> Date;

  // Working days in [start, end); negative when end < start.
  [[nodiscard]] auto count_working_days(Date start, Date end) const -> int;

  [[nodiscard]] auto next_working_day(Date date) const -> Date;
  [[nodiscard]] auto previous_working_day(Date date) const -> Date;

  // Derived calendar for one person: same holidays plus `dates`.
  [[nodiscard]] auto with_time_off(std::span<const Date> dates) const
      -> WorkCalendar;
  // Empty `week` keeps the current pattern.
  [[nodiscard]] auto with_work_days(WorkWeek week) const -> WorkCalendar;

  [[nodiscard]] auto work_days() const noexcept -> WorkWeek {
    return work_days_;
  }
  [[nodiscard]] auto non_working_dates() const noexcept
      -> std::span<const Date> {
    return non_working_;
  }

private:
  WorkCalendar(WorkWeek work_days, std::vector<Date> non_working);

  WorkWeek work_days_;
  std::vector<Date> non_working_;  // sorted, unique
};

// Expands holiday / non-working exceptions into individual dates, sorted and
// de-duplicated.
[[nodiscard]] auto expand_calendar_exceptions(
    std::span<const CalendarException> exceptions) -> std::vector<Date>;

// Approved time off for one person, expanded to individual dates.
[[nodiscard]] auto expand_time_off(std::span<const TimeOff> time_off,
                                   const PersonId& member) -> std::vector<Date>;

}  // namespace critpath
