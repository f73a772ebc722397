#include "critpath/schedule/constraint_resolver.hpp"

#include "critpath/util/log.hpp"

namespace critpath {

auto ConstraintResolver::resolve_start(const Task& task, Date dependency_start,
                                       const Task* driver) const
    -> StartResolution {
  if (!has_start_constraint(task)) {
    return {dependency_start, std::nullopt};
  }

  Date floor = calendar_.next_working_day(*task.constraint_date);
  if (floor >= dependency_start) {
    return {floor, std::nullopt};
  }
  if (driver == nullptr) {
    return {dependency_start, std::nullopt};
  }

  log::info("task '{}': {} on {} overridden by predecessor '{}', starts {}",
            task.id, to_string_view(task.constraint_type),
            format_date(*task.constraint_date), driver->id,
            format_date(dependency_start));
  return {dependency_start,
          ConstraintOverride{*task.constraint_date, dependency_start,
                             driver->id, driver->title}};
}

auto ConstraintResolver::check_deadline(const Task& task, Date finish) const
    -> std::optional<DeadlineViolation> {
  if (task.constraint_type != ConstraintType::FinishNoLaterThan ||
      !task.constraint_date) {
    return std::nullopt;
  }
  if (finish <= *task.constraint_date) {
    return std::nullopt;
  }

  int late = calendar_.count_working_days(*task.constraint_date, finish);
  log::info("task '{}' finishes {} after its deadline {} ({} working days)",
            task.id, format_date(finish), format_date(*task.constraint_date),
            late);
  return DeadlineViolation{*task.constraint_date, finish, late};
}

}  // namespace critpath
