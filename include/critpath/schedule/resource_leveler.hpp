#pragma once

#include "critpath/calendar/work_calendar.hpp"
#include "critpath/graph/dependency_graph.hpp"
#include "critpath/model/entities.hpp"

#include <optional>
#include <span>
#include <vector>

namespace critpath {

// One reserved block of a person's time. [start, finish) on that person's
// calendar.
struct Allocation {
  PersonId person_id;
  TaskId task_id;
  Date start;
  Date finish;
  int days{0};
  double hours{0.0};
  std::optional<double> cost;
};

struct ResourcePool {
  std::span<const TeamMember> team_members;
  std::span<const TimeOff> time_off;
  std::span<const TaskAssignment> assignments;
  double default_hours_per_day{kDefaultHoursPerDay};
};

// Single deterministic first-fit pass that serializes each person's work.
//
// Tasks are released in list-scheduling order: among tasks whose
// predecessors are placed, the smallest (CPM early start, topological level,
// priority, input position) goes next. A single-assignee task takes the dates
// of its person's block; a multi-assignee task keeps its release dates and
// only reserves time in each assignee's ledger.
class ResourceLeveler {
public:
  ResourceLeveler(const DependencyGraph& graph, const WorkCalendar& calendar,
                  ResourcePool pool);

  [[nodiscard]] static auto is_applicable(std::span<const Task> tasks,
                                          const ResourcePool& pool) -> bool;

  // `tasks` carry CPM output in graph node order. Rewrites es/ef of tasks
  // moved by leveling; ls/lf are left at their CPM values.
  [[nodiscard]] auto level(std::vector<Task>& tasks) const
      -> std::vector<Allocation>;

private:
  const DependencyGraph& graph_;
  const WorkCalendar& calendar_;
  ResourcePool pool_;
};

}  // namespace critpath
