#include "critpath/calendar/work_calendar.hpp"

#include <algorithm>
#include <ranges>

namespace critpath {

namespace {

auto normalize(std::vector<Date> dates) -> std::vector<Date> {
  std::ranges::sort(dates);
  auto [first, last] = std::ranges::unique(dates);
  dates.erase(first, last);
  return dates;
}

auto append_range(std::vector<Date>& out, Date first, Date last) -> void {
  for (Date d = first; d <= last; d = add_days(d, 1)) {
    out.push_back(d);
  }
}

}  // namespace

WorkCalendar::WorkCalendar(WorkWeek work_days, std::vector<Date> non_working)
    : work_days_(work_days), non_working_(normalize(std::move(non_working))) {}

auto WorkCalendar::create(WorkWeek work_days, std::span<const Date> non_working)
    -> Result<WorkCalendar> {
  if (work_days.none()) {
    return fail(Error::InvalidCalendar);
  }
  return WorkCalendar{work_days,
                      std::vector<Date>(non_working.begin(), non_working.end())};
}

auto WorkCalendar::is_working_day(Date date) const -> bool {
  if (!work_days_.test(weekday_index(date))) {
    return false;
  }
  return !std::ranges::binary_search(non_working_, date);
}

auto WorkCalendar::add_working_days(Date date, int n) const -> Date {
  const int step = n < 0 ? -1 : 1;
  int remaining = n < 0 ? -n : n;
  Date current = date;
  while (remaining > 0) {
    current = add_days(current, step);
    if (is_working_day(current)) {
      --remaining;
    }
  }
  return current;
}

auto WorkCalendar::count_working_days(Date start, Date end) const -> int {
  if (end < start) {
    return -count_working_days(end, start);
  }
  int count = 0;
  for (Date d = start; d < end; d = add_days(d, 1)) {
    if (is_working_day(d)) {
      ++count;
    }
  }
  return count;
}

auto WorkCalendar::next_working_day(Date date) const -> Date {
  Date current = date;
  while (!is_working_day(current)) {
    current = add_days(current, 1);
  }
  return current;
}

auto WorkCalendar::previous_working_day(Date date) const -> Date {
  Date current = date;
  while (!is_working_day(current)) {
    current = add_days(current, -1);
  }
  return current;
}

auto WorkCalendar::with_time_off(std::span<const Date> dates) const
    -> WorkCalendar {
  std::vector<Date> merged = non_working_;
  merged.insert(merged.end(), dates.begin(), dates.end());
  return WorkCalendar{work_days_, std::move(merged)};
}

auto WorkCalendar::with_work_days(WorkWeek week) const -> WorkCalendar {
  return WorkCalendar{week.none() ? work_days_ : week, non_working_};
}

auto expand_calendar_exceptions(std::span<const CalendarException> exceptions)
    -> std::vector<Date> {
  std::vector<Date> dates;
  for (const auto& ex : exceptions) {
    Date last = ex.end_date.value_or(ex.date);
    if (last < ex.date) {
      last = ex.date;
    }
    append_range(dates, ex.date, last);
  }
  return normalize(std::move(dates));
}

auto expand_time_off(std::span<const TimeOff> time_off, const PersonId& member)
    -> std::vector<Date> {
  std::vector<Date> dates;
  for (const auto& to : time_off |
                            std::views::filter([&](const TimeOff& t) {
                              return t.member_id == member &&
                                     t.status == TimeOffStatus::Approved;
                            })) {
    append_range(dates, to.start_date, to.end_date);
  }
  return normalize(std::move(dates));
}

}  // namespace critpath
