#include "critpath/schedule/resource_leveler.hpp"

#include "critpath/schedule/cpm_engine.hpp"
#include "critpath/schedule/dependency_kind.hpp"
#include "critpath/util/log.hpp"

#include <algorithm>
#include <cmath>
#include <set>
#include <tuple>
#include <unordered_map>

namespace critpath {

namespace {

struct Person {
  const TeamMember* member;
  WorkCalendar calendar;
  double hours_per_day;
  std::set<Date> occupied;
};

struct Demand {
  PersonId person;
  double allocated_hours{0.0};
};

// critical sorts first
[[nodiscard]] constexpr auto priority_rank(TaskPriority p) noexcept -> int {
  return -static_cast<int>(p);
}

using ReadyKey = std::tuple<Date, std::uint32_t, int, NodeIndex>;

auto effective_hours_per_day(const TeamMember& m, double fallback) -> double {
  if (std::isfinite(m.work_hours_per_day) && m.work_hours_per_day > 0.0) {
    return m.work_hours_per_day;
  }
  log::warn("team member '{}' has no usable work_hours_per_day, using {}",
            m.id, fallback);
  return fallback;
}

// Assignees without explicit hours share the task estimate evenly; without
// an estimate each works the whole duration.
auto demand_hours(const Task& task, const Demand& demand, double hours_per_day,
                  std::size_t sharing) -> double {
  if (demand.allocated_hours > 0.0) {
    return demand.allocated_hours;
  }
  if (task.estimated_hours && *task.estimated_hours > 0.0) {
    return *task.estimated_hours / static_cast<double>(sharing);
  }
  return duration_days(task) * hours_per_day;
}

auto demand_days(double hours, double hours_per_day) -> int {
  double days = std::ceil(hours / hours_per_day);
  if (days > kMaxWorkingDays) {
    log::warn("demand of {}h at {}h/day capped at {} days", hours,
              hours_per_day, kMaxWorkingDays);
    return kMaxWorkingDays;
  }
  return static_cast<int>(days);
}

// Earliest run of `days` free working days of `p` starting on or after
// `floor`; marks them occupied.
auto reserve(Person& p, Date floor, int days) -> Window {
  if (days <= 0) {
    return {floor, floor};
  }

  Date candidate = p.calendar.next_working_day(floor);
  for (;;) {
    Date day = candidate;
    bool clash = false;
    for (int taken = 0; taken < days; ++taken) {
      if (taken > 0) {
        day = p.calendar.add_working_days(day, 1);
      }
      if (p.occupied.contains(day)) {
        clash = true;
        break;
      }
    }
    if (!clash) {
      break;
    }
    candidate = p.calendar.next_working_day(add_days(day, 1));
  }

  Date day = candidate;
  for (int taken = 0; taken < days; ++taken) {
    p.occupied.insert(day);
    day = p.calendar.add_working_days(day, 1);
  }
  return {candidate, day};
}

}  // namespace

ResourceLeveler::ResourceLeveler(const DependencyGraph& graph,
                                 const WorkCalendar& calendar,
                                 ResourcePool pool)
    : graph_(graph), calendar_(calendar), pool_(pool) {}

auto ResourceLeveler::is_applicable(std::span<const Task> tasks,
                                    const ResourcePool& pool) -> bool {
  if (pool.team_members.empty()) {
    return false;
  }
  return !pool.assignments.empty() ||
         std::ranges::any_of(tasks, [](const Task& t) {
           return t.assignee_id.has_value() && !t.assignee_id->empty();
         });
}

auto ResourceLeveler::level(std::vector<Task>& tasks) const
    -> std::vector<Allocation> {
  std::unordered_map<PersonId, Person> people;
  for (const auto& m : pool_.team_members) {
    auto time_off = expand_time_off(pool_.time_off, m.id);
    people.try_emplace(
        m.id, Person{&m,
                     calendar_.with_work_days(m.work_days).with_time_off(time_off),
                     effective_hours_per_day(m, pool_.default_hours_per_day),
                     {}});
  }

  // Assignment records replace the legacy single assignee.
  std::vector<std::vector<Demand>> demands(tasks.size());
  for (const auto& a : pool_.assignments) {
    NodeIndex idx = graph_.get_index(a.task_id);
    if (idx == kInvalidNode) {
      log::warn("assignment for unknown task '{}' ignored", a.task_id);
      continue;
    }
    demands[idx].push_back({a.person_id, a.allocated_hours});
  }
  for (NodeIndex i = 0; i < tasks.size(); ++i) {
    if (demands[i].empty() && tasks[i].assignee_id &&
        !tasks[i].assignee_id->empty()) {
      demands[i].push_back({*tasks[i].assignee_id, 0.0});
    }
    std::erase_if(demands[i], [&](const Demand& d) {
      if (people.contains(d.person)) {
        return false;
      }
      log::warn("task '{}': assignee '{}' is not a team member, ignored",
                tasks[i].id, d.person);
      return true;
    });
  }

  const auto levels = graph_.topological_levels();
  std::vector<Date> cpm_start(tasks.size());
  std::vector<std::size_t> pending(tasks.size());
  std::set<ReadyKey> ready;
  for (NodeIndex i = 0; i < tasks.size(); ++i) {
    cpm_start[i] = *tasks[i].es;
    pending[i] = graph_.incoming(i).size();
    if (pending[i] == 0) {
      ready.emplace(cpm_start[i], levels[i], priority_rank(tasks[i].priority), i);
    }
  }

  std::vector<Allocation> ledger;
  std::size_t moved = 0;
  while (!ready.empty()) {
    NodeIndex node = std::get<3>(*ready.begin());
    ready.erase(ready.begin());
    Task& task = tasks[node];
    const int dur = duration_days(task);

    Date release = cpm_start[node];
    if (!is_pinned(task)) {
      for (auto edge_idx : graph_.incoming(node)) {
        const Edge& e = graph_.edge(edge_idx);
        const Task& pred = tasks[e.from];
        release = std::max(release, successor_start_bound(
                                        e.type, calendar_,
                                        Window{*pred.es, *pred.ef}, e.lag_days,
                                        dur));
      }
      release = calendar_.next_working_day(release);
    }

    const auto sharing = static_cast<std::size_t>(std::ranges::count_if(
        demands[node], [](const Demand& d) { return d.allocated_hours <= 0.0; }));

    std::optional<Window> own_block;
    for (const auto& demand : demands[node]) {
      Person& person = people.at(demand.person);
      double hours = demand_hours(task, demand, person.hours_per_day, sharing);
      int days = demand_days(hours, person.hours_per_day);
      Window block = reserve(person, release, days);

      if (demands[node].size() == 1) {
        own_block = block;
      }
      if (days == 0) {
        continue;
      }

      std::optional<double> cost;
      if (person.member->hourly_rate) {
        cost = hours * *person.member->hourly_rate;
      }
      ledger.push_back(Allocation{demand.person, task.id, block.start,
                                  block.finish, days, hours, cost});
    }

    if (!is_pinned(task)) {
      Window placed = own_block.value_or(
          Window{release, calendar_.add_working_days(release, dur)});
      if (placed.start != *task.es) {
        ++moved;
        log::debug("leveling moved '{}' from {} to {}", task.id,
                   format_date(*task.es), format_date(placed.start));
      }
      task.es = placed.start;
      task.ef = placed.finish;
    }

    for (auto edge_idx : graph_.outgoing(node)) {
      NodeIndex next = graph_.edge(edge_idx).to;
      if (--pending[next] == 0) {
        ready.emplace(cpm_start[next], levels[next],
                      priority_rank(tasks[next].priority), next);
      }
    }
  }

  log::debug("leveling: {} people, {} allocations, {} tasks moved",
             people.size(), ledger.size(), moved);
  return ledger;
}

}  // namespace critpath
