#include "critpath/schedule/scheduler.hpp"

#include "critpath/calendar/work_calendar.hpp"
#include "critpath/graph/dependency_graph.hpp"
#include "critpath/schedule/constraint_resolver.hpp"
#include "critpath/schedule/cpm_engine.hpp"
#include "critpath/util/log.hpp"

#include <cmath>
#include <format>
#include <unordered_set>

namespace critpath {

namespace {

[[nodiscard]] auto is_valid_amount(double v, double limit) noexcept -> bool {
  return std::isfinite(v) && v >= 0.0 && v <= limit;
}

auto check_records(std::span<const Task> tasks,
                   std::span<const Dependency> dependencies,
                   std::span<const TaskAssignment> assignments)
    -> ScheduleOutcome<void> {
  std::unordered_set<TaskId> seen;
  for (const auto& task : tasks) {
    if (task.id.empty()) {
      return schedule_fail(Error::InvalidArgument, "task with empty id");
    }
    if (!seen.insert(task.id).second) {
      return schedule_fail(Error::AlreadyExists,
                           std::format("duplicate task id '{}'", task.id),
                           task.id);
    }
    if (!is_valid_amount(task.duration, kMaxWorkingDays)) {
      return schedule_fail(
          Error::InvalidDuration,
          std::format("task '{}' has invalid duration {}", task.id,
                      task.duration),
          task.id);
    }
    if (task.estimated_hours &&
        !is_valid_amount(*task.estimated_hours, kMaxTaskHours)) {
      return schedule_fail(
          Error::InvalidDuration,
          std::format("task '{}' has invalid estimated hours {}", task.id,
                      *task.estimated_hours),
          task.id);
    }
  }
  for (const auto& dep : dependencies) {
    if (dep.lag_days < -kMaxWorkingDays || dep.lag_days > kMaxWorkingDays) {
      return schedule_fail(
          Error::InvalidDuration,
          std::format("dependency '{}' -> '{}' has out of range lag {}",
                      dep.predecessor_id, dep.successor_id, dep.lag_days),
          dep.successor_id);
    }
  }
  for (const auto& a : assignments) {
    if (!is_valid_amount(a.allocated_hours, kMaxTaskHours)) {
      return schedule_fail(
          Error::InvalidDuration,
          std::format("assignment of '{}' to '{}' has invalid hours {}",
                      a.task_id, a.person_id, a.allocated_hours),
          a.task_id);
    }
  }
  return {};
}

auto prepare_graph(std::span<const Task> tasks,
                   std::span<const Dependency> dependencies,
                   std::span<const TaskAssignment> assignments)
    -> ScheduleOutcome<DependencyGraph> {
  if (auto r = check_records(tasks, dependencies, assignments); !r) {
    return std::unexpected{std::move(r.error())};
  }
  auto graph = DependencyGraph::build(tasks, dependencies);
  if (auto r = graph.validate(); !r) {
    return std::unexpected{std::move(r.error())};
  }
  return graph;
}

auto run_schedule(std::span<const Task> tasks,
                  std::span<const Dependency> dependencies, Date project_start,
                  WorkWeek work_days, std::span<const Date> holidays,
                  const ResourcePool* pool) -> ScheduleOutcome<Schedule> {
  std::span<const TaskAssignment> assignments =
      pool != nullptr ? pool->assignments : std::span<const TaskAssignment>{};
  auto graph = prepare_graph(tasks, dependencies, assignments);
  if (!graph) {
    log::error("schedule rejected: {}", graph.error().message);
    return std::unexpected{std::move(graph.error())};
  }

  auto calendar = WorkCalendar::create(work_days, holidays);
  if (!calendar) {
    return schedule_fail(Error::InvalidCalendar,
                         "work week must contain at least one working day");
  }

  Schedule schedule;
  if (tasks.empty()) {
    return schedule;
  }

  CpmEngine cpm(*graph, *calendar);
  auto result = cpm.run(tasks, project_start);
  schedule.tasks = std::move(result.tasks);
  schedule.critical_path_ids = std::move(result.critical_path_ids);
  schedule.project_end_date = result.project_end;

  if (pool != nullptr && ResourceLeveler::is_applicable(tasks, *pool)) {
    ResourceLeveler leveler(*graph, *calendar, *pool);
    schedule.allocations = leveler.level(schedule.tasks);
    schedule.critical_path_ids = cpm.mark_critical(schedule.tasks);
    schedule.project_end_date = latest_finish(schedule.tasks);
  }

  ConstraintResolver resolver(*calendar);
  for (auto& task : schedule.tasks) {
    task.deadline_violation = resolver.check_deadline(task, *task.ef);
  }
  return schedule;
}

}  // namespace

auto validate_inputs(std::span<const Task> tasks,
                     std::span<const Dependency> dependencies,
                     std::span<const TaskAssignment> assignments)
    -> ScheduleOutcome<void> {
  auto graph = prepare_graph(tasks, dependencies, assignments);
  if (!graph) {
    return std::unexpected{std::move(graph.error())};
  }
  return {};
}

auto compute_schedule(std::span<const Task> tasks,
                      std::span<const Dependency> dependencies,
                      Date project_start, WorkWeek work_days,
                      std::span<const Date> holidays)
    -> ScheduleOutcome<Schedule> {
  return run_schedule(tasks, dependencies, project_start, work_days, holidays,
                      nullptr);
}

auto compute_schedule_with_resources(
    std::span<const Task> tasks, std::span<const Dependency> dependencies,
    Date project_start, WorkWeek work_days, std::span<const Date> holidays,
    std::span<const TeamMember> team_members, std::span<const TimeOff> time_off,
    std::span<const TaskAssignment> assignments, const ScheduleOptions& options)
    -> ScheduleOutcome<Schedule> {
  ResourcePool pool{team_members, time_off, assignments,
                    options.default_hours_per_day};
  return run_schedule(tasks, dependencies, project_start, work_days, holidays,
                      &pool);
}

}  // namespace critpath
