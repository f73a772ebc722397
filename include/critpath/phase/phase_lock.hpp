#pragma once

#include "critpath/model/entities.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace critpath {

enum class LockReason : std::uint8_t {
  FirstPhase,
  PreviousPhaseComplete,
  PreviousPhaseIncomplete,
};

[[nodiscard]] constexpr auto to_string_view(LockReason r) noexcept
    -> std::string_view {
  switch (r) {
    case LockReason::FirstPhase: return "first_phase";
    case LockReason::PreviousPhaseComplete: return "previous_phase_complete";
    case LockReason::PreviousPhaseIncomplete: return "previous_phase_incomplete";
  }
  std::unreachable();
}

struct PhaseLockInfo {
  PhaseId phase_id;
  bool is_locked{false};
  LockReason reason{LockReason::FirstPhase};
  std::optional<PhaseId> blocked_by_phase_id;
  std::optional<std::string> blocked_by_phase_name;
};

using PhaseLockMap = std::unordered_map<PhaseId, PhaseLockInfo>;

// A phase is locked while any task of the phase immediately before it (by
// phase_order) is not done. The first phase is never locked, a phase without
// tasks never blocks, tasks without a phase are ignored.
[[nodiscard]] auto evaluate_phase_locks(std::span<const ProjectPhase> phases,
                                        std::span<const Task> tasks)
    -> PhaseLockMap;

// False for unknown phase ids.
[[nodiscard]] auto is_phase_locked(const PhaseId& phase_id,
                                   std::span<const ProjectPhase> phases,
                                   std::span<const Task> tasks) -> bool;

// Copies of `phases` with task_count and completed_task_count recomputed.
[[nodiscard]] auto refresh_phase_counts(std::span<const ProjectPhase> phases,
                                        std::span<const Task> tasks)
    -> std::vector<ProjectPhase>;

// Phases ordered by phase_order; equal orders keep their input order.
[[nodiscard]] auto sorted_by_order(std::span<const ProjectPhase> phases)
    -> std::vector<ProjectPhase>;

}  // namespace critpath
