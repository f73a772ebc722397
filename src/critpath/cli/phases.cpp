#include "critpath/cli/commands.hpp"
#include "critpath/cli/context.hpp"
#include "critpath/io/schedule_json.hpp"
#include "critpath/phase/phase_lock.hpp"

#include <print>

namespace critpath::cli {

auto cmd_phases(const PhasesOptions& opts) -> int {
  auto ctx = load_context(opts.config_file, opts.project_file);
  if (!ctx) {
    return 1;
  }
  const auto& project = ctx->project;
  auto locks = evaluate_phase_locks(project.phases, project.tasks);

  if (opts.json) {
    std::println("{}", phase_locks_to_json(locks, project.phases).dump(2));
    return 0;
  }

  if (project.phases.empty()) {
    std::println("{} has no phases", project.name);
    return 0;
  }

  auto phases = sorted_by_order(refresh_phase_counts(project.phases, project.tasks));
  for (const auto& phase : phases) {
    const auto& info = locks.at(phase.id);
    std::print("{} {:<3} {:<24} {}/{} done  {}", info.is_locked ? "✗" : "✓",
               phase.phase_order, phase.name, phase.completed_task_count,
               phase.task_count, to_string_view(info.reason));
    if (info.blocked_by_phase_name) {
      std::print(" (waiting on {})", *info.blocked_by_phase_name);
    }
    std::println("");
  }
  return 0;
}

}  // namespace critpath::cli
