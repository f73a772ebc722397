#pragma once

#include "critpath/model/types.hpp"
#include "critpath/util/date.hpp"
#include "critpath/util/id.hpp"

#include <bitset>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

namespace critpath {

// Bit i set means weekday i (0 = Sunday) is a working day.
using WorkWeek = std::bitset<7>;

[[nodiscard]] inline auto make_work_week(std::initializer_list<unsigned> days)
    -> WorkWeek {
  WorkWeek week;
  for (unsigned d : days) {
    if (d < 7) week.set(d);
  }
  return week;
}

// Sunday through Thursday
inline const WorkWeek kDefaultWorkWeek = make_work_week({0, 1, 2, 3, 4});

inline constexpr double kDefaultHoursPerDay = 8.0;

// Upper bound on durations and lags, in working days (about 380 years of a
// five-day week). Larger values are rejected before any date arithmetic.
inline constexpr int kMaxWorkingDays = 100'000;
inline constexpr double kMaxTaskHours = kMaxWorkingDays * 24.0;

// Set by the constraint resolver when a predecessor forces a later start
// than the task's own start constraint.
struct ConstraintOverride {
  Date constraint_date;
  Date effective_start;
  TaskId predecessor_id;
  std::string predecessor_title;
};

struct DeadlineViolation {
  Date constraint_date;
  Date finish;
  int days_late{0};
};

struct Task {
  TaskId id;
  std::string title;
  std::optional<PhaseId> phase_id;
  TaskStatus status{TaskStatus::Pending};
  TaskPriority priority{TaskPriority::Medium};

  double duration{1.0};  // working days
  std::optional<double> estimated_hours;
  std::optional<PersonId> assignee_id;

  ConstraintType constraint_type{ConstraintType::None};
  std::optional<Date> constraint_date;
  SchedulingMode scheduling_mode{SchedulingMode::Auto};
  std::optional<Date> start_date;  // pinned start for manual tasks

  // Scheduling outputs. Ignored on input.
  std::optional<Date> es;
  std::optional<Date> ef;
  std::optional<Date> ls;
  std::optional<Date> lf;
  int slack{0};
  bool is_critical{false};

  std::optional<ConstraintOverride> constraint_override;
  std::optional<DeadlineViolation> deadline_violation;
};

struct Dependency {
  TaskId predecessor_id;
  TaskId successor_id;
  DependencyType type{DependencyType::FinishToStart};
  int lag_days{0};
};

struct CalendarException {
  Date date;
  std::optional<Date> end_date;  // inclusive
  CalendarExceptionType type{CalendarExceptionType::Holiday};
  std::string name;
};

struct TeamMember {
  PersonId id;
  std::string name;
  double work_hours_per_day{kDefaultHoursPerDay};
  WorkWeek work_days;  // empty: follow the project calendar
  std::optional<double> hourly_rate;
};

struct TimeOff {
  PersonId member_id;
  Date start_date;
  Date end_date;  // inclusive
  TimeOffStatus status{TimeOffStatus::Approved};
};

struct TaskAssignment {
  TaskId task_id;
  PersonId person_id;
  double allocated_hours{0.0};  // 0: derive from the task
};

struct ProjectPhase {
  PhaseId id;
  std::string name;
  int phase_order{0};
  PhaseStatus status{PhaseStatus::Pending};
  int task_count{0};
  int completed_task_count{0};
};

}  // namespace critpath
