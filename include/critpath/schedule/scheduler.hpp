#pragma once

#include "critpath/model/entities.hpp"
#include "critpath/schedule/resource_leveler.hpp"
#include "critpath/schedule/schedule_error.hpp"

#include <optional>
#include <span>
#include <vector>

namespace critpath {

struct ScheduleOptions {
  double default_hours_per_day{kDefaultHoursPerDay};
};

struct Schedule {
  std::vector<Task> tasks;  // input order, scheduling fields filled in
  std::vector<TaskId> critical_path_ids;
  std::optional<Date> project_end_date;  // nullopt for an empty project
  std::vector<Allocation> allocations;   // empty unless leveling ran
};

// Pure CPM: validate, forward pass, backward pass, slack, constraints.
// Fails without partial output on dangling references, cycles, invalid or
// out of range durations and lags, or an empty work week.
[[nodiscard]] auto compute_schedule(std::span<const Task> tasks,
                                    std::span<const Dependency> dependencies,
                                    Date project_start, WorkWeek work_days,
                                    std::span<const Date> holidays)
    -> ScheduleOutcome<Schedule>;

// CPM followed by resource leveling when at least one team member is given
// and at least one task is assigned; otherwise identical to
// compute_schedule().
[[nodiscard]] auto compute_schedule_with_resources(
    std::span<const Task> tasks, std::span<const Dependency> dependencies,
    Date project_start, WorkWeek work_days, std::span<const Date> holidays,
    std::span<const TeamMember> team_members, std::span<const TimeOff> time_off,
    std::span<const TaskAssignment> assignments = {},
    const ScheduleOptions& options = {}) -> ScheduleOutcome<Schedule>;

// Structural checks only (ids, durations, graph). Used before any date
// arithmetic and by `critpath validate`.
[[nodiscard]] auto validate_inputs(std::span<const Task> tasks,
                                   std::span<const Dependency> dependencies,
                                   std::span<const TaskAssignment> assignments = {})
    -> ScheduleOutcome<void>;

}  // namespace critpath
