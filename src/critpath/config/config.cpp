#include "critpath/config/config.hpp"

#include "critpath/config/yaml_utils.hpp"
#include "critpath/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <cmath>
#include <fstream>
#include <sstream>
#include <vector>

namespace YAML {

template <>
struct convert<critpath::LoggingConfig> {
  static bool decode(const Node& node, critpath::LoggingConfig& l) {
    if (!node.IsMap()) {
      return false;
    }
    l.level = critpath::yaml_get_or<std::string>(node, "level", "warn");
    l.file = critpath::yaml_get_or<std::string>(node, "file", "");
    return true;
  }
};

template <>
struct convert<critpath::CalendarConfig> {
  static bool decode(const Node& node, critpath::CalendarConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    c.work_days = critpath::yaml_get_or(node, "work_days", critpath::kDefaultWorkWeek);
    c.default_hours_per_day = critpath::yaml_get_or(
        node, "default_hours_per_day", critpath::kDefaultHoursPerDay);
    return true;
  }
};

template <>
struct convert<critpath::LevelingConfig> {
  static bool decode(const Node& node, critpath::LevelingConfig& l) {
    if (!node.IsMap()) {
      return false;
    }
    l.enabled = critpath::yaml_get_or(node, "enabled", true);
    return true;
  }
};

template <>
struct convert<critpath::EngineConfig> {
  static bool decode(const Node& node, critpath::EngineConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    if (auto logging = node["logging"]) {
      c.logging = logging.as<critpath::LoggingConfig>();
    }
    if (auto calendar = node["calendar"]) {
      c.calendar = calendar.as<critpath::CalendarConfig>();
    }
    if (auto leveling = node["leveling"]) {
      c.leveling = leveling.as<critpath::LevelingConfig>();
    }
    return true;
  }
};

}  // namespace YAML

namespace critpath {

namespace {

void to_yaml(YAML::Emitter& out, const LoggingConfig& l) {
  out << YAML::BeginMap;
  yaml_emit(out, "level", l.level);
  if (!l.file.empty()) {
    yaml_emit(out, "file", l.file);
  }
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const CalendarConfig& c) {
  out << YAML::BeginMap;
  out << YAML::Key << "work_days" << YAML::Value << YAML::Flow
      << YAML::BeginSeq;
  for (std::size_t day = 0; day < c.work_days.size(); ++day) {
    if (c.work_days.test(day)) {
      out << static_cast<int>(day);
    }
  }
  out << YAML::EndSeq;
  yaml_emit(out, "default_hours_per_day", c.default_hours_per_day);
  out << YAML::EndMap;
}

auto validate_config(const EngineConfig& config) -> std::vector<std::string> {
  std::vector<std::string> errors;
  if (config.calendar.work_days.none()) {
    errors.emplace_back("calendar.work_days must contain at least one day");
  }
  if (!std::isfinite(config.calendar.default_hours_per_day) ||
      config.calendar.default_hours_per_day <= 0.0) {
    errors.emplace_back("calendar.default_hours_per_day must be positive");
  }
  return errors;
}

}  // namespace

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<EngineConfig> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open config file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<EngineConfig> {
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || root.IsNull()) {
      log::error("Failed to parse YAML: empty or invalid content");
      return fail(Error::ParseError);
    }
    EngineConfig config = root.as<EngineConfig>();

    auto errors = validate_config(config);
    if (!errors.empty()) {
      for (const auto& err : errors) {
        log::error("Config validation error: {}", err);
      }
      return fail(Error::InvalidArgument);
    }
    return ok(std::move(config));
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto ConfigLoader::to_string(const EngineConfig& config) -> std::string {
  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "logging" << YAML::Value;
  to_yaml(out, config.logging);
  out << YAML::Key << "calendar" << YAML::Value;
  to_yaml(out, config.calendar);
  out << YAML::Key << "leveling" << YAML::Value << YAML::BeginMap;
  yaml_emit(out, "enabled", config.leveling.enabled);
  out << YAML::EndMap;
  out << YAML::EndMap;
  return out.c_str();
}

auto apply_logging(const LoggingConfig& config) -> Result<void> {
  log::set_level(config.level);
  if (config.file.empty()) {
    log::logger().use_stderr();
    return ok();
  }
  if (!log::logger().open_file(config.file)) {
    log::error("Failed to open log file: {}", config.file);
    return fail(Error::FileOpenFailed);
  }
  return ok();
}

}  // namespace critpath
