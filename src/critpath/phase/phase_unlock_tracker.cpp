#include "critpath/phase/phase_unlock_tracker.hpp"

#include "critpath/util/log.hpp"

#include <algorithm>

namespace critpath {

auto PhaseUnlockTracker::observe(std::string_view project_id,
                                 const PhaseLockMap& locks,
                                 std::span<const ProjectPhase> phases)
    -> std::vector<PhaseUnlockedEvent> {
  std::vector<PhaseUnlockedEvent> events;
  if (locks.empty()) {
    return events;
  }

  if (project_id_ != project_id) {
    if (project_id_) {
      log::debug("phase tracker: project switched from '{}' to '{}'",
                 *project_id_, project_id);
    }
    project_id_ = std::string(project_id);
    previous_ = locks;
    return events;
  }
  if (!previous_) {
    previous_ = locks;
    return events;
  }

  for (const auto& [phase_id, current] : locks) {
    auto prev = previous_->find(phase_id);
    if (prev == previous_->end() || !prev->second.is_locked ||
        current.is_locked) {
      continue;
    }
    const auto& before = prev->second;
    auto phase = std::ranges::find(phases, phase_id, &ProjectPhase::id);
    if (phase == phases.end() || !before.blocked_by_phase_id ||
        !before.blocked_by_phase_name) {
      continue;
    }
    log::info("phase '{}' unlocked, '{}' completed", phase->name,
              *before.blocked_by_phase_name);
    events.push_back(PhaseUnlockedEvent{phase_id, phase->name,
                                        *before.blocked_by_phase_id,
                                        *before.blocked_by_phase_name});
  }

  std::ranges::sort(events, {}, [](const PhaseUnlockedEvent& e) {
    return e.phase_id;
  });
  previous_ = locks;
  return events;
}

auto PhaseUnlockTracker::reset() noexcept -> void {
  project_id_.reset();
  previous_.reset();
}

}  // namespace critpath
