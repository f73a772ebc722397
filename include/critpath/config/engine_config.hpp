#pragma once

#include "critpath/model/entities.hpp"

#include <string>

namespace critpath {

struct LoggingConfig {
  std::string level{"warn"};
  std::string file;  // empty: stderr
};

struct CalendarConfig {
  WorkWeek work_days{kDefaultWorkWeek};
  double default_hours_per_day{kDefaultHoursPerDay};
};

struct LevelingConfig {
  bool enabled{true};
};

struct EngineConfig {
  LoggingConfig logging;
  CalendarConfig calendar;
  LevelingConfig leveling;
};

}  // namespace critpath
