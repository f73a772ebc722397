#include "critpath/schedule/cpm_engine.hpp"

#include "critpath/schedule/dependency_kind.hpp"
#include "critpath/util/log.hpp"

#include <algorithm>
#include <cmath>
#include <ranges>

namespace critpath {

auto duration_days(const Task& task) -> int {
  if (!(task.duration > 0.0)) {
    return 0;
  }
  return static_cast<int>(std::ceil(task.duration));
}

auto latest_finish(std::span<const Task> tasks) -> std::optional<Date> {
  std::optional<Date> end;
  for (const auto& task : tasks) {
    if (task.ef && (!end || *task.ef > *end)) {
      end = task.ef;
    }
  }
  return end;
}

CpmEngine::CpmEngine(const DependencyGraph& graph, const WorkCalendar& calendar)
    : graph_(graph),
      calendar_(calendar),
      resolver_(calendar),
      order_(graph.topological_order()) {}

auto CpmEngine::run(std::span<const Task> tasks, Date project_start) const
    -> CpmResult {
  CpmResult result;
  result.tasks.assign(tasks.begin(), tasks.end());
  if (result.tasks.empty()) {
    return result;
  }

  forward_pass(result.tasks, project_start);
  result.project_end = latest_finish(result.tasks);
  backward_pass(result.tasks, *result.project_end);
  result.critical_path_ids = mark_critical(result.tasks);

  log::debug("cpm: {} tasks, {} edges, end {}, {} critical", tasks.size(),
             graph_.edge_count(), format_date(*result.project_end),
             result.critical_path_ids.size());
  return result;
}

auto CpmEngine::forward_pass(std::vector<Task>& tasks, Date project_start) const
    -> void {
  const Date base = calendar_.next_working_day(project_start);

  for (NodeIndex node : order_) {
    Task& task = tasks[node];
    const int dur = duration_days(task);
    task.constraint_override.reset();
    task.deadline_violation.reset();

    if (is_pinned(task)) {
      task.es = calendar_.next_working_day(*task.start_date);
      task.ef = calendar_.add_working_days(*task.es, dur);
      continue;
    }

    Date start = base;
    const Task* driver = nullptr;
    for (auto edge_idx : graph_.incoming(node)) {
      const Edge& e = graph_.edge(edge_idx);
      const Task& pred = tasks[e.from];
      Date bound = successor_start_bound(e.type, calendar_,
                                         Window{*pred.es, *pred.ef},
                                         e.lag_days, dur);
      if (bound > start) {
        start = bound;
        driver = &pred;
      }
    }
    start = calendar_.next_working_day(start);

    auto resolved = resolver_.resolve_start(task, start, driver);
    task.es = resolved.start;
    task.ef = calendar_.add_working_days(resolved.start, dur);
    task.constraint_override = std::move(resolved.override_info);
  }
}

auto CpmEngine::backward_pass(std::vector<Task>& tasks, Date project_end) const
    -> void {
  for (NodeIndex node : order_ | std::views::reverse) {
    Task& task = tasks[node];
    const int dur = duration_days(task);

    if (is_pinned(task)) {
      task.ls = task.es;
      task.lf = task.ef;
      continue;
    }

    Date finish = project_end;
    for (auto edge_idx : graph_.outgoing(node)) {
      const Edge& e = graph_.edge(edge_idx);
      const Task& succ = tasks[e.to];
      Date bound = predecessor_finish_bound(e.type, calendar_,
                                            Window{*succ.ls, *succ.lf},
                                            e.lag_days, dur);
      finish = std::min(finish, bound);
    }

    task.lf = finish;
    task.ls = calendar_.add_working_days(finish, -dur);
  }
}

auto CpmEngine::mark_critical(std::vector<Task>& tasks) const
    -> std::vector<TaskId> {
  std::vector<TaskId> critical;
  for (NodeIndex node : order_) {
    Task& task = tasks[node];
    task.slack = calendar_.count_working_days(*task.es, *task.ls);
    task.is_critical = task.slack <= 0;
    if (task.is_critical) {
      critical.push_back(task.id);
    }
  }
  return critical;
}

}  // namespace critpath
