#pragma once

#include "critpath/model/entities.hpp"
#include "critpath/util/date.hpp"
#include "critpath/util/id.hpp"

#include <algorithm>
#include <span>
#include <string>
#include <string_view>

namespace critpath::test {

[[nodiscard]] inline auto task_id(std::string_view s) -> TaskId {
  return TaskId{std::string{s}};
}

[[nodiscard]] inline auto phase_id(std::string_view s) -> PhaseId {
  return PhaseId{std::string{s}};
}

[[nodiscard]] inline auto person_id(std::string_view s) -> PersonId {
  return PersonId{std::string{s}};
}

// 2024-01-07 is a Sunday, the first working day of the default week.
[[nodiscard]] inline auto jan(unsigned day) -> Date {
  return make_date(2024, 1, day);
}

[[nodiscard]] inline auto make_task(std::string_view id, double duration)
    -> Task {
  Task t;
  t.id = task_id(id);
  t.title = std::string{id};
  t.duration = duration;
  return t;
}

[[nodiscard]] inline auto make_dep(std::string_view from, std::string_view to,
                                   DependencyType type = DependencyType::FinishToStart,
                                   int lag = 0) -> Dependency {
  return Dependency{task_id(from), task_id(to), type, lag};
}

[[nodiscard]] inline auto make_member(std::string_view id,
                                      double hours_per_day = kDefaultHoursPerDay)
    -> TeamMember {
  TeamMember m;
  m.id = person_id(id);
  m.name = std::string{id};
  m.work_hours_per_day = hours_per_day;
  return m;
}

[[nodiscard]] inline auto find_task(std::span<const Task> tasks,
                                    std::string_view id) -> const Task& {
  return *std::ranges::find(tasks, task_id(id), &Task::id);
}

}  // namespace critpath::test
