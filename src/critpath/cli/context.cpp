#include "critpath/cli/context.hpp"

#include <print>

namespace critpath::cli {

auto load_context(const std::string& config_file,
                  const std::string& project_file)
    -> std::optional<CommandContext> {
  CommandContext ctx;
  if (!config_file.empty()) {
    auto config = ConfigLoader::load_from_file(config_file);
    if (!config) {
      std::println(stderr, "Error: Failed to load config: {}",
                   config.error().message());
      return std::nullopt;
    }
    ctx.config = std::move(*config);
  }
  if (auto r = apply_logging(ctx.config.logging); !r) {
    std::println(stderr, "Error: {}", r.error().message());
    return std::nullopt;
  }

  if (project_file.empty()) {
    std::println(stderr, "Error: Project file required. Use -p <file>");
    return std::nullopt;
  }
  auto project = ProjectDefinitionLoader::load_from_file(project_file);
  if (!project) {
    std::println(stderr, "Error: Failed to load project: {}",
                 project.error().message());
    return std::nullopt;
  }
  ctx.project = std::move(*project);
  return ctx;
}

}  // namespace critpath::cli
