#pragma once

#include "critpath/calendar/work_calendar.hpp"
#include "critpath/model/entities.hpp"

#include <optional>

namespace critpath {

struct StartResolution {
  Date start;
  std::optional<ConstraintOverride> override_info;
};

// Applies per-task date constraints on top of dependency-driven dates.
// Dependencies always win over start constraints; deadlines are only
// reported.
class ConstraintResolver {
public:
  explicit ConstraintResolver(const WorkCalendar& calendar)
      : calendar_(calendar) {}

  // `dependency_start` is the start implied by project start and
  // predecessors; `driver` is the predecessor that produced it, or null when
  // the project start did.
  [[nodiscard]] auto resolve_start(const Task& task, Date dependency_start,
                                   const Task* driver) const
      -> StartResolution;

  [[nodiscard]] auto check_deadline(const Task& task, Date finish) const
      -> std::optional<DeadlineViolation>;

  [[nodiscard]] static auto has_start_constraint(const Task& task) noexcept
      -> bool {
    return task.constraint_date &&
           (task.constraint_type == ConstraintType::StartNoEarlierThan ||
            task.constraint_type == ConstraintType::MustStartOn);
  }

private:
  const WorkCalendar& calendar_;
};

}  // namespace critpath
