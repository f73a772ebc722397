#pragma once

#include "critpath/core/error.hpp"
#include "critpath/util/id.hpp"

#include <expected>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace critpath {

// Structural failure of a schedule computation. Carries enough context for
// the caller to point at the offending record.
struct ScheduleError {
  Error code{Error::Unknown};
  std::string message;
  std::optional<TaskId> task_id;
  std::vector<TaskId> cycle;

  [[nodiscard]] auto error_code() const -> std::error_code {
    return make_error_code(code);
  }
};

template <typename T>
using ScheduleOutcome = std::expected<T, ScheduleError>;

[[nodiscard]] inline auto schedule_fail(Error code, std::string message,
                                        std::optional<TaskId> task_id = {},
                                        std::vector<TaskId> cycle = {})
    -> std::unexpected<ScheduleError> {
  return std::unexpected{ScheduleError{code, std::move(message),
                                       std::move(task_id), std::move(cycle)}};
}

}  // namespace critpath
