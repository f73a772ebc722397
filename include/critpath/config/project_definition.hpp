#pragma once

#include "critpath/core/error.hpp"
#include "critpath/model/entities.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace critpath {

// One project as read from a YAML file. Dependencies and assignments are
// declared on the tasks in the file and flattened into their own lists here.
struct ProjectDefinition {
  std::string id;
  std::string name;
  Date start_date;
  std::optional<WorkWeek> work_days;  // nullopt: engine configuration decides
  std::vector<CalendarException> calendar_exceptions;
  std::vector<TeamMember> team_members;
  std::vector<TimeOff> time_off;
  std::vector<ProjectPhase> phases;
  std::vector<Task> tasks;
  std::vector<Dependency> dependencies;
  std::vector<TaskAssignment> assignments;
  std::string source_file;
};

class ProjectDefinitionLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<ProjectDefinition>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<ProjectDefinition>;
};

}  // namespace critpath
