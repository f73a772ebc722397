#pragma once

#include "critpath/calendar/work_calendar.hpp"
#include "critpath/graph/dependency_graph.hpp"
#include "critpath/model/entities.hpp"
#include "critpath/schedule/constraint_resolver.hpp"

#include <optional>
#include <span>
#include <vector>

namespace critpath {

// Whole working days a task occupies; fractional durations round up.
[[nodiscard]] auto duration_days(const Task& task) -> int;

// Manual tasks with a start date keep it; predecessors do not move them.
[[nodiscard]] inline auto is_pinned(const Task& task) noexcept -> bool {
  return task.scheduling_mode == SchedulingMode::Manual &&
         task.start_date.has_value();
}

struct CpmResult {
  std::vector<Task> tasks;  // same order as the input
  std::vector<TaskId> critical_path_ids;
  std::optional<Date> project_end;
};

// Forward and backward passes over a validated graph whose node i is the
// task at input position i.
class CpmEngine {
public:
  CpmEngine(const DependencyGraph& graph, const WorkCalendar& calendar);

  [[nodiscard]] auto run(std::span<const Task> tasks, Date project_start) const
      -> CpmResult;

  auto forward_pass(std::vector<Task>& tasks, Date project_start) const -> void;
  auto backward_pass(std::vector<Task>& tasks, Date project_end) const -> void;

  // Recomputes slack and criticality; returns critical ids in topological
  // order.
  auto mark_critical(std::vector<Task>& tasks) const -> std::vector<TaskId>;

  [[nodiscard]] auto order() const noexcept -> std::span<const NodeIndex> {
    return order_;
  }

private:
  const DependencyGraph& graph_;
  const WorkCalendar& calendar_;
  ConstraintResolver resolver_;
  std::vector<NodeIndex> order_;
};

// Latest early finish across all tasks.
[[nodiscard]] auto latest_finish(std::span<const Task> tasks)
    -> std::optional<Date>;

}  // namespace critpath
