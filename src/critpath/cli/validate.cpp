#include "critpath/cli/commands.hpp"
#include "critpath/cli/context.hpp"
#include "critpath/schedule/scheduler.hpp"

#include <print>

namespace critpath::cli {

auto cmd_validate(const ValidateOptions& opts) -> int {
  auto ctx = load_context(opts.config_file, opts.project_file);
  if (!ctx) {
    return 1;
  }
  const auto& project = ctx->project;
  std::println("Validating {}...\n", opts.project_file);

  auto r = validate_inputs(project.tasks, project.dependencies,
                           project.assignments);
  if (!r) {
    const auto& err = r.error();
    std::println("✗ {} - {}", project.name, err.message);
    if (err.code == Error::CycleDetected && !err.cycle.empty()) {
      std::print("  cycle:");
      for (const auto& id : err.cycle) {
        std::print(" {} ->", id);
      }
      std::println(" {}", err.cycle.front());
    } else if (err.task_id) {
      std::println("  task: {}", *err.task_id);
    }
    return 1;
  }

  std::println("✓ {} - Valid ({} tasks, {} dependencies)", project.name,
               project.tasks.size(), project.dependencies.size());
  return 0;
}

}  // namespace critpath::cli
