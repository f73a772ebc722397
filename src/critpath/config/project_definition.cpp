#include "critpath/config/project_definition.hpp"

#include "critpath/config/yaml_utils.hpp"
#include "critpath/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <format>
#include <fstream>
#include <sstream>
#include <unordered_set>

namespace critpath {

namespace {

struct DependencyEntry {
  TaskId task_id;
  DependencyType type{DependencyType::FinishToStart};
  int lag_days{0};
};

struct AssigneeEntry {
  PersonId person_id;
  double hours{0.0};
};

struct TaskEntry {
  Task task;
  std::vector<DependencyEntry> dependencies;
  std::vector<AssigneeEntry> assignees;
};

// Unknown names are a conversion failure rather than a silent default.
template <typename E>
[[nodiscard]] auto decode_enum(const YAML::Node& node, std::string_view key,
                               E& out) -> bool {
  auto field = node[std::string(key)];
  if (!field) {
    return true;
  }
  if (!field.IsScalar()) {
    return false;
  }
  const auto& name = field.Scalar();
  E value = parse<E>(name);
  if (to_string_view(value) != name) {
    return false;
  }
  out = value;
  return true;
}

template <typename T>
auto assign_optional(const YAML::Node& node, std::string_view key,
                     std::optional<T>& out) -> void {
  if (auto field = node[std::string(key)]; field && !field.IsNull()) {
    out = field.as<T>();
  }
}

}  // namespace

}  // namespace critpath

namespace YAML {

template <>
struct convert<critpath::DependencyEntry> {
  static bool decode(const Node& node, critpath::DependencyEntry& dep) {
    if (node.IsScalar()) {
      dep.task_id = critpath::TaskId{node.as<std::string>()};
      return true;
    }
    if (!node.IsMap()) {
      return false;
    }
    dep.task_id =
        critpath::TaskId{critpath::yaml_get_or<std::string>(node, "task", "")};
    dep.lag_days = critpath::yaml_get_or(node, "lag", 0);
    return critpath::decode_enum(node, "type", dep.type);
  }
};

template <>
struct convert<critpath::AssigneeEntry> {
  static bool decode(const Node& node, critpath::AssigneeEntry& a) {
    if (node.IsScalar()) {
      a.person_id = critpath::PersonId{node.as<std::string>()};
      return true;
    }
    if (!node.IsMap()) {
      return false;
    }
    a.person_id = critpath::PersonId{
        critpath::yaml_get_or<std::string>(node, "member", "")};
    a.hours = critpath::yaml_get_or(node, "hours", 0.0);
    return true;
  }
};

template <>
struct convert<critpath::TaskEntry> {
  static bool decode(const Node& node, critpath::TaskEntry& e) {
    if (!node.IsMap()) {
      return false;
    }
    auto& t = e.task;
    t.id = critpath::TaskId{critpath::yaml_get_or<std::string>(node, "id", "")};
    t.title = critpath::yaml_get_or<std::string>(node, "title", "");
    if (auto phase = node["phase"]) {
      t.phase_id = phase.as<critpath::PhaseId>();
    }
    t.duration = critpath::yaml_get_or(node, "duration", 1.0);
    critpath::assign_optional(node, "estimated_hours", t.estimated_hours);
    critpath::assign_optional(node, "start_date", t.start_date);

    if (!critpath::decode_enum(node, "status", t.status) ||
        !critpath::decode_enum(node, "priority", t.priority) ||
        !critpath::decode_enum(node, "mode", t.scheduling_mode)) {
      return false;
    }

    if (auto constraint = node["constraint"]) {
      if (!constraint.IsMap() ||
          !critpath::decode_enum(constraint, "type", t.constraint_type)) {
        return false;
      }
      critpath::assign_optional(constraint, "date", t.constraint_date);
    }

    // A scalar assignee is the single legacy owner; a list creates
    // assignment records.
    if (auto assignee = node["assignee"]) {
      if (assignee.IsScalar()) {
        t.assignee_id = assignee.as<critpath::PersonId>();
      } else {
        e.assignees = assignee.as<std::vector<critpath::AssigneeEntry>>();
      }
    }
    if (auto deps = node["dependencies"]) {
      e.dependencies = deps.as<std::vector<critpath::DependencyEntry>>();
    }
    return true;
  }
};

template <>
struct convert<critpath::CalendarException> {
  static bool decode(const Node& node, critpath::CalendarException& c) {
    if (!node.IsMap() || !node["date"]) {
      return false;
    }
    c.date = node["date"].as<critpath::Date>();
    critpath::assign_optional(node, "end_date", c.end_date);
    c.name = critpath::yaml_get_or<std::string>(node, "name", "");
    return critpath::decode_enum(node, "type", c.type);
  }
};

template <>
struct convert<critpath::TeamMember> {
  static bool decode(const Node& node, critpath::TeamMember& m) {
    if (!node.IsMap()) {
      return false;
    }
    m.id = critpath::PersonId{critpath::yaml_get_or<std::string>(node, "id", "")};
    m.name = critpath::yaml_get_or<std::string>(node, "name", "");
    m.work_hours_per_day =
        critpath::yaml_get_or(node, "hours_per_day", critpath::kDefaultHoursPerDay);
    m.work_days = critpath::yaml_get_or(node, "work_days", critpath::WorkWeek{});
    critpath::assign_optional(node, "hourly_rate", m.hourly_rate);
    return true;
  }
};

template <>
struct convert<critpath::TimeOff> {
  static bool decode(const Node& node, critpath::TimeOff& t) {
    if (!node.IsMap() || !node["start_date"]) {
      return false;
    }
    t.member_id = critpath::PersonId{
        critpath::yaml_get_or<std::string>(node, "member", "")};
    t.start_date = node["start_date"].as<critpath::Date>();
    t.end_date = critpath::yaml_get_or(node, "end_date", t.start_date);
    return critpath::decode_enum(node, "status", t.status);
  }
};

template <>
struct convert<critpath::ProjectPhase> {
  static bool decode(const Node& node, critpath::ProjectPhase& p) {
    if (!node.IsMap()) {
      return false;
    }
    p.id = critpath::PhaseId{critpath::yaml_get_or<std::string>(node, "id", "")};
    p.name = critpath::yaml_get_or<std::string>(node, "name", "");
    p.phase_order = critpath::yaml_get_or(node, "order", 0);
    return critpath::decode_enum(node, "status", p.status);
  }
};

template <>
struct convert<critpath::ProjectDefinition> {
  static bool decode(const Node& node, critpath::ProjectDefinition& d) {
    if (!node.IsMap() || !node["start_date"]) {
      return false;
    }
    d.name = critpath::yaml_get_or<std::string>(node, "name", "");
    d.id = critpath::yaml_get_or<std::string>(node, "id", d.name);
    d.start_date = node["start_date"].as<critpath::Date>();
    critpath::assign_optional(node, "work_days", d.work_days);

    if (auto v = node["calendar_exceptions"]) {
      d.calendar_exceptions = v.as<std::vector<critpath::CalendarException>>();
    }
    if (auto v = node["team_members"]) {
      d.team_members = v.as<std::vector<critpath::TeamMember>>();
    }
    if (auto v = node["time_off"]) {
      d.time_off = v.as<std::vector<critpath::TimeOff>>();
    }
    if (auto v = node["phases"]) {
      d.phases = v.as<std::vector<critpath::ProjectPhase>>();
    }

    if (auto tasks = node["tasks"]) {
      for (auto& entry : tasks.as<std::vector<critpath::TaskEntry>>()) {
        for (const auto& dep : entry.dependencies) {
          d.dependencies.push_back(critpath::Dependency{
              dep.task_id, entry.task.id, dep.type, dep.lag_days});
        }
        for (const auto& a : entry.assignees) {
          d.assignments.push_back(
              critpath::TaskAssignment{entry.task.id, a.person_id, a.hours});
        }
        d.tasks.push_back(std::move(entry.task));
      }
    }
    return true;
  }
};

}  // namespace YAML

namespace critpath {

namespace {

template <typename Range, typename Proj>
auto check_unique_ids(const Range& items, Proj id_of, std::string_view what,
                      std::vector<std::string>& errors) -> void {
  std::unordered_set<std::string> seen;
  for (const auto& item : items) {
    const auto& id = id_of(item);
    if (id.empty()) {
      errors.push_back(std::format("{} ID cannot be empty", what));
      continue;
    }
    if (!seen.insert(id.str()).second) {
      errors.push_back(std::format("Duplicate {} ID: '{}'", what, id));
    }
  }
}

auto validate_definition(const ProjectDefinition& def)
    -> std::vector<std::string> {
  std::vector<std::string> errors;

  check_unique_ids(def.tasks, [](const Task& t) -> const TaskId& { return t.id; },
                   "task", errors);
  check_unique_ids(def.phases,
                   [](const ProjectPhase& p) -> const PhaseId& { return p.id; },
                   "phase", errors);
  check_unique_ids(def.team_members,
                   [](const TeamMember& m) -> const PersonId& { return m.id; },
                   "team member", errors);

  std::unordered_set<PhaseId> phase_ids;
  for (const auto& phase : def.phases) {
    phase_ids.insert(phase.id);
  }
  for (const auto& task : def.tasks) {
    if (task.phase_id && !phase_ids.contains(*task.phase_id)) {
      errors.push_back(std::format("Task '{}': phase '{}' not found", task.id,
                                   *task.phase_id));
    }
    if (task.constraint_type != ConstraintType::None && !task.constraint_date) {
      errors.push_back(
          std::format("Task '{}': constraint '{}' needs a date", task.id,
                      to_string_view(task.constraint_type)));
    }
  }

  for (const auto& off : def.time_off) {
    if (off.end_date < off.start_date) {
      errors.push_back(std::format("Time off for '{}' ends before it starts",
                                   off.member_id));
    }
  }
  for (const auto& ex : def.calendar_exceptions) {
    if (ex.end_date && *ex.end_date < ex.date) {
      errors.push_back(std::format("Calendar exception on {} ends before it starts",
                                   format_date(ex.date)));
    }
  }
  if (def.work_days && def.work_days->none()) {
    errors.emplace_back("work_days must contain at least one day");
  }

  return errors;
}

}  // namespace

auto ProjectDefinitionLoader::load_from_file(std::string_view path)
    -> Result<ProjectDefinition> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open project file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  auto result = load_from_string(buffer.str());
  if (result) {
    result->source_file = path_str;
  }
  return result;
}

auto ProjectDefinitionLoader::load_from_string(std::string_view yaml_str)
    -> Result<ProjectDefinition> {
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || root.IsNull()) {
      log::error("Failed to parse YAML: empty or invalid content");
      return fail(Error::ParseError);
    }

    ProjectDefinition def = root.as<ProjectDefinition>();

    auto errors = validate_definition(def);
    if (!errors.empty()) {
      for (const auto& err : errors) {
        log::error("Project validation error: {}", err);
      }
      return fail(Error::InvalidArgument);
    }

    log::debug("loaded project '{}': {} tasks, {} dependencies, {} members",
               def.name, def.tasks.size(), def.dependencies.size(),
               def.team_members.size());
    return ok(std::move(def));
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }
}

}  // namespace critpath
