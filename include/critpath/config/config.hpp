#pragma once

#include "critpath/config/engine_config.hpp"
#include "critpath/core/error.hpp"

#include <string>
#include <string_view>

namespace critpath {

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<EngineConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<EngineConfig>;
  [[nodiscard]] static auto to_string(const EngineConfig& config)
      -> std::string;
};

// Routes the process logger according to `config.logging`.
auto apply_logging(const LoggingConfig& config) -> Result<void>;

}  // namespace critpath
