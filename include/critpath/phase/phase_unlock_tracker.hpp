#pragma once

#include "critpath/phase/phase_lock.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace critpath {

struct PhaseUnlockedEvent {
  PhaseId phase_id;
  std::string phase_name;
  PhaseId completed_phase_id;
  std::string completed_phase_name;
};

// Turns successive lock maps of one project into "phase unlocked" events.
// The first map seen for a project is only a baseline. Not thread-safe; one
// tracker per observer.
class PhaseUnlockTracker {
public:
  auto observe(std::string_view project_id, const PhaseLockMap& locks,
               std::span<const ProjectPhase> phases)
      -> std::vector<PhaseUnlockedEvent>;

  auto reset() noexcept -> void;

  [[nodiscard]] auto has_baseline() const noexcept -> bool {
    return previous_.has_value();
  }

private:
  std::optional<std::string> project_id_;
  std::optional<PhaseLockMap> previous_;
};

}  // namespace critpath
