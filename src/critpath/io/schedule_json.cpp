#include "critpath/io/schedule_json.hpp"

#include "critpath/util/date.hpp"

namespace critpath {

using json = nlohmann::json;

namespace {

auto date_or_null(const std::optional<Date>& date) -> json {
  if (!date) {
    return nullptr;
  }
  return format_date(*date);
}

auto override_to_json(const std::optional<ConstraintOverride>& o) -> json {
  if (!o) {
    return nullptr;
  }
  return {{"constraint_date", format_date(o->constraint_date)},
          {"effective_start", format_date(o->effective_start)},
          {"predecessor_id", o->predecessor_id.str()},
          {"predecessor_title", o->predecessor_title}};
}

auto violation_to_json(const std::optional<DeadlineViolation>& v) -> json {
  if (!v) {
    return nullptr;
  }
  return {{"constraint_date", format_date(v->constraint_date)},
          {"finish", format_date(v->finish)},
          {"days_late", v->days_late}};
}

auto task_to_json(const Task& task) -> json {
  return {{"id", task.id.str()},
          {"title", task.title},
          {"duration", task.duration},
          {"es", date_or_null(task.es)},
          {"ef", date_or_null(task.ef)},
          {"ls", date_or_null(task.ls)},
          {"lf", date_or_null(task.lf)},
          {"slack", task.slack},
          {"is_critical", task.is_critical},
          {"constraint_override", override_to_json(task.constraint_override)},
          {"deadline_violation", violation_to_json(task.deadline_violation)}};
}

auto allocation_to_json(const Allocation& a) -> json {
  json j = {{"person_id", a.person_id.str()},
            {"task_id", a.task_id.str()},
            {"start", format_date(a.start)},
            {"finish", format_date(a.finish)},
            {"days", a.days},
            {"hours", a.hours}};
  j["cost"] = a.cost ? json(*a.cost) : json(nullptr);
  return j;
}

}  // namespace

auto schedule_to_json(const Schedule& schedule) -> json {
  json tasks = json::array();
  for (const auto& task : schedule.tasks) {
    tasks.push_back(task_to_json(task));
  }

  json critical = json::array();
  for (const auto& id : schedule.critical_path_ids) {
    critical.push_back(id.str());
  }

  json allocations = json::array();
  for (const auto& a : schedule.allocations) {
    allocations.push_back(allocation_to_json(a));
  }

  return {{"project_end_date", date_or_null(schedule.project_end_date)},
          {"critical_path", critical},
          {"tasks", tasks},
          {"allocations", allocations}};
}

auto phase_locks_to_json(const PhaseLockMap& locks,
                         std::span<const ProjectPhase> phases) -> json {
  json out = json::array();
  for (const auto& phase : sorted_by_order(phases)) {
    auto it = locks.find(phase.id);
    if (it == locks.end()) {
      continue;
    }
    const auto& info = it->second;
    json j = {{"phase_id", phase.id.str()},
              {"name", phase.name},
              {"order", phase.phase_order},
              {"is_locked", info.is_locked},
              {"reason", std::string(to_string_view(info.reason))}};
    j["blocked_by_phase_id"] = info.blocked_by_phase_id
                                   ? json(info.blocked_by_phase_id->str())
                                   : json(nullptr);
    j["blocked_by_phase_name"] = info.blocked_by_phase_name
                                     ? json(*info.blocked_by_phase_name)
                                     : json(nullptr);
    out.push_back(std::move(j));
  }
  return out;
}

auto schedule_error_to_json(const ScheduleError& error) -> json {
  json j = {{"code", error.error_code().message()},
            {"message", error.message}};
  j["task_id"] = error.task_id ? json(error.task_id->str()) : json(nullptr);
  json cycle = json::array();
  for (const auto& id : error.cycle) {
    cycle.push_back(id.str());
  }
  j["cycle"] = cycle;
  return {{"error", j}};
}

}  // namespace critpath
