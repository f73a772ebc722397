#pragma once

#include <string>

namespace critpath::cli {

struct ScheduleCommandOptions {
  std::string project_file;
  std::string config_file;
  bool json{false};
  bool no_level{false};
};

struct ValidateOptions {
  std::string project_file;
  std::string config_file;
};

struct PhasesOptions {
  std::string project_file;
  std::string config_file;
  bool json{false};
};

[[nodiscard]] auto cmd_schedule(const ScheduleCommandOptions& opts) -> int;
[[nodiscard]] auto cmd_validate(const ValidateOptions& opts) -> int;
[[nodiscard]] auto cmd_phases(const PhasesOptions& opts) -> int;

}  // namespace critpath::cli
