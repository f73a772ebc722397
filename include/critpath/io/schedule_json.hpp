#pragma once

#include "critpath/phase/phase_lock.hpp"
#include "critpath/schedule/schedule_error.hpp"
#include "critpath/schedule/scheduler.hpp"

#include <nlohmann/json.hpp>

#include <span>

namespace critpath {

// Dates are "YYYY-MM-DD"; absent optional fields are null.
[[nodiscard]] auto schedule_to_json(const Schedule& schedule) -> nlohmann::json;

// One entry per phase in phase_order.
[[nodiscard]] auto phase_locks_to_json(const PhaseLockMap& locks,
                                       std::span<const ProjectPhase> phases)
    -> nlohmann::json;

[[nodiscard]] auto schedule_error_to_json(const ScheduleError& error)
    -> nlohmann::json;

}  // namespace critpath
