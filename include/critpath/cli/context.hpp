#pragma once

#include "critpath/config/config.hpp"
#include "critpath/config/project_definition.hpp"

#include <optional>
#include <string>

namespace critpath::cli {

struct CommandContext {
  EngineConfig config;
  ProjectDefinition project;
};

// Loads the optional engine config (applying its logging section) and the
// project file. Prints the failure and returns nullopt on error.
[[nodiscard]] auto load_context(const std::string& config_file,
                                const std::string& project_file)
    -> std::optional<CommandContext>;

}  // namespace critpath::cli
