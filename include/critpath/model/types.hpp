#pragma once

#include <cstdint>
#include <string_view>
#include <utility>

namespace critpath {

enum class TaskStatus : std::uint8_t { Pending, InProgress, Done };

enum class TaskPriority : std::uint8_t { Low, Medium, High, Critical };

enum class DependencyType : std::uint8_t {
  FinishToStart,
  StartToStart,
  FinishToFinish,
  StartToFinish,
};

enum class ConstraintType : std::uint8_t {
  None,
  StartNoEarlierThan,
  MustStartOn,
  FinishNoLaterThan,
};

enum class SchedulingMode : std::uint8_t { Auto, Manual };

enum class CalendarExceptionType : std::uint8_t { Holiday, NonWorking };

enum class TimeOffStatus : std::uint8_t { Pending, Approved, Rejected };

enum class PhaseStatus : std::uint8_t { Pending, Active, Completed };

[[nodiscard]] constexpr auto to_string_view(TaskStatus s) noexcept
    -> std::string_view {
  switch (s) {
    case TaskStatus::Pending: return "pending";
    case TaskStatus::InProgress: return "in_progress";
    case TaskStatus::Done: return "done";
  }
  std::unreachable();
}

[[nodiscard]] constexpr auto to_string_view(TaskPriority p) noexcept
    -> std::string_view {
  switch (p) {
    case TaskPriority::Low: return "low";
    case TaskPriority::Medium: return "medium";
    case TaskPriority::High: return "high";
    case TaskPriority::Critical: return "critical";
  }
  std::unreachable();
}

[[nodiscard]] constexpr auto to_string_view(DependencyType t) noexcept
    -> std::string_view {
  switch (t) {
    case DependencyType::FinishToStart: return "FS";
    case DependencyType::StartToStart: return "SS";
    case DependencyType::FinishToFinish: return "FF";
    case DependencyType::StartToFinish: return "SF";
  }
  std::unreachable();
}

[[nodiscard]] constexpr auto to_string_view(ConstraintType c) noexcept
    -> std::string_view {
  switch (c) {
    case ConstraintType::None: return "none";
    case ConstraintType::StartNoEarlierThan: return "start_no_earlier_than";
    case ConstraintType::MustStartOn: return "must_start_on";
    case ConstraintType::FinishNoLaterThan: return "finish_no_later_than";
  }
  std::unreachable();
}

[[nodiscard]] constexpr auto to_string_view(SchedulingMode m) noexcept
    -> std::string_view {
  switch (m) {
    case SchedulingMode::Auto: return "auto";
    case SchedulingMode::Manual: return "manual";
  }
  std::unreachable();
}

[[nodiscard]] constexpr auto to_string_view(CalendarExceptionType t) noexcept
    -> std::string_view {
  switch (t) {
    case CalendarExceptionType::Holiday: return "holiday";
    case CalendarExceptionType::NonWorking: return "non_working";
  }
  std::unreachable();
}

[[nodiscard]] constexpr auto to_string_view(TimeOffStatus s) noexcept
    -> std::string_view {
  switch (s) {
    case TimeOffStatus::Pending: return "pending";
    case TimeOffStatus::Approved: return "approved";
    case TimeOffStatus::Rejected: return "rejected";
  }
  std::unreachable();
}

[[nodiscard]] constexpr auto to_string_view(PhaseStatus s) noexcept
    -> std::string_view {
  switch (s) {
    case PhaseStatus::Pending: return "pending";
    case PhaseStatus::Active: return "active";
    case PhaseStatus::Completed: return "completed";
  }
  std::unreachable();
}

// Unknown names fall back to the type's default value; callers that must
// reject unknown input compare to_string_view(parse<T>(s)) against s.
template <typename T>
[[nodiscard]] auto parse(std::string_view s) noexcept -> T;

template <>
[[nodiscard]] inline auto parse<TaskStatus>(std::string_view s) noexcept
    -> TaskStatus {
  if (s == "in_progress") return TaskStatus::InProgress;
  if (s == "done") return TaskStatus::Done;
  return TaskStatus::Pending;
}

template <>
[[nodiscard]] inline auto parse<TaskPriority>(std::string_view s) noexcept
    -> TaskPriority {
  if (s == "low") return TaskPriority::Low;
  if (s == "high") return TaskPriority::High;
  if (s == "critical") return TaskPriority::Critical;
  return TaskPriority::Medium;
}

template <>
[[nodiscard]] inline auto parse<DependencyType>(std::string_view s) noexcept
    -> DependencyType {
  if (s == "SS") return DependencyType::StartToStart;
  if (s == "FF") return DependencyType::FinishToFinish;
  if (s == "SF") return DependencyType::StartToFinish;
  return DependencyType::FinishToStart;
}

template <>
[[nodiscard]] inline auto parse<ConstraintType>(std::string_view s) noexcept
    -> ConstraintType {
  if (s == "start_no_earlier_than") return ConstraintType::StartNoEarlierThan;
  if (s == "must_start_on") return ConstraintType::MustStartOn;
  if (s == "finish_no_later_than") return ConstraintType::FinishNoLaterThan;
  return ConstraintType::None;
}

template <>
[[nodiscard]] inline auto parse<SchedulingMode>(std::string_view s) noexcept
    -> SchedulingMode {
  if (s == "manual") return SchedulingMode::Manual;
  return SchedulingMode::Auto;
}

template <>
[[nodiscard]] inline auto parse<CalendarExceptionType>(
    std::string_view s) noexcept -> CalendarExceptionType {
  if (s == "non_working") return CalendarExceptionType::NonWorking;
  return CalendarExceptionType::Holiday;
}

template <>
[[nodiscard]] inline auto parse<TimeOffStatus>(std::string_view s) noexcept
    -> TimeOffStatus {
  if (s == "pending") return TimeOffStatus::Pending;
  if (s == "rejected") return TimeOffStatus::Rejected;
  return TimeOffStatus::Approved;
}

template <>
[[nodiscard]] inline auto parse<PhaseStatus>(std::string_view s) noexcept
    -> PhaseStatus {
  if (s == "active") return PhaseStatus::Active;
  if (s == "completed") return PhaseStatus::Completed;
  return PhaseStatus::Pending;
}

}  // namespace critpath
