#include "critpath/phase/phase_lock.hpp"

#include <algorithm>

namespace critpath {

namespace {

[[nodiscard]] auto phase_complete(const PhaseId& phase,
                                  std::span<const Task> tasks) -> bool {
  return std::ranges::all_of(tasks, [&](const Task& t) {
    return !t.phase_id || *t.phase_id != phase || t.status == TaskStatus::Done;
  });
}

}  // namespace

auto sorted_by_order(std::span<const ProjectPhase> phases)
    -> std::vector<ProjectPhase> {
  std::vector<ProjectPhase> sorted(phases.begin(), phases.end());
  std::ranges::stable_sort(sorted, {}, &ProjectPhase::phase_order);
  return sorted;
}

auto evaluate_phase_locks(std::span<const ProjectPhase> phases,
                          std::span<const Task> tasks) -> PhaseLockMap {
  PhaseLockMap locks;
  if (phases.empty()) {
    return locks;
  }

  auto sorted = sorted_by_order(phases);
  locks.emplace(sorted.front().id,
                PhaseLockInfo{sorted.front().id, false, LockReason::FirstPhase,
                              std::nullopt, std::nullopt});

  for (std::size_t i = 1; i < sorted.size(); ++i) {
    const auto& current = sorted[i];
    const auto& previous = sorted[i - 1];

    PhaseLockInfo info{current.id, false, LockReason::PreviousPhaseComplete,
                       std::nullopt, std::nullopt};
    if (!phase_complete(previous.id, tasks)) {
      info.is_locked = true;
      info.reason = LockReason::PreviousPhaseIncomplete;
      info.blocked_by_phase_id = previous.id;
      info.blocked_by_phase_name = previous.name;
    }
    locks.insert_or_assign(current.id, std::move(info));
  }
  return locks;
}

auto is_phase_locked(const PhaseId& phase_id,
                     std::span<const ProjectPhase> phases,
                     std::span<const Task> tasks) -> bool {
  auto locks = evaluate_phase_locks(phases, tasks);
  auto it = locks.find(phase_id);
  return it != locks.end() && it->second.is_locked;
}

auto refresh_phase_counts(std::span<const ProjectPhase> phases,
                          std::span<const Task> tasks)
    -> std::vector<ProjectPhase> {
  std::vector<ProjectPhase> out(phases.begin(), phases.end());
  for (auto& phase : out) {
    phase.task_count = 0;
    phase.completed_task_count = 0;
    for (const auto& task : tasks) {
      if (!task.phase_id || *task.phase_id != phase.id) {
        continue;
      }
      ++phase.task_count;
      if (task.status == TaskStatus::Done) {
        ++phase.completed_task_count;
      }
    }
  }
  return out;
}

}  // namespace critpath
