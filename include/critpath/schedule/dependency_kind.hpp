#pragma once

#include "critpath/calendar/work_calendar.hpp"
#include "critpath/model/types.hpp"
#include "critpath/util/date.hpp"

#include <variant>

namespace critpath {

// Half-open occupancy [start, finish) of a task on the calendar.
struct Window {
  Date start;
  Date finish;
};

// Each dependency type knows how it bounds the successor going forward and
// the predecessor going backward. `duration` is always the duration of the
// task whose bound is being computed.
struct FinishToStart {
  [[nodiscard]] static auto earliest_start(const WorkCalendar& cal,
                                           const Window& pred, int lag,
                                           int /*duration*/) -> Date {
    return cal.add_working_days(pred.finish, lag);
  }
  [[nodiscard]] static auto latest_finish(const WorkCalendar& cal,
                                          const Window& succ, int lag,
                                          int /*duration*/) -> Date {
    return cal.add_working_days(succ.start, -lag);
  }
};

struct StartToStart {
  [[nodiscard]] static auto earliest_start(const WorkCalendar& cal,
                                           const Window& pred, int lag,
                                           int /*duration*/) -> Date {
    return cal.add_working_days(pred.start, lag);
  }
  [[nodiscard]] static auto latest_finish(const WorkCalendar& cal,
                                          const Window& succ, int lag,
                                          int duration) -> Date {
    return cal.add_working_days(cal.add_working_days(succ.start, -lag),
                                duration);
  }
};

struct FinishToFinish {
  [[nodiscard]] static auto earliest_start(const WorkCalendar& cal,
                                           const Window& pred, int lag,
                                           int duration) -> Date {
    return cal.add_working_days(cal.add_working_days(pred.finish, lag),
                                -duration);
  }
  [[nodiscard]] static auto latest_finish(const WorkCalendar& cal,
                                          const Window& succ, int lag,
                                          int /*duration*/) -> Date {
    return cal.add_working_days(succ.finish, -lag);
  }
};

struct StartToFinish {
  [[nodiscard]] static auto earliest_start(const WorkCalendar& cal,
                                           const Window& pred, int lag,
                                           int duration) -> Date {
    return cal.add_working_days(cal.add_working_days(pred.start, lag),
                                -duration);
  }
  [[nodiscard]] static auto latest_finish(const WorkCalendar& cal,
                                          const Window& succ, int lag,
                                          int duration) -> Date {
    return cal.add_working_days(cal.add_working_days(succ.finish, -lag),
                                duration);
  }
};

using DependencyKind =
    std::variant<FinishToStart, StartToStart, FinishToFinish, StartToFinish>;

[[nodiscard]] constexpr auto make_dependency_kind(DependencyType type) noexcept
    -> DependencyKind {
  switch (type) {
    case DependencyType::FinishToStart: return FinishToStart{};
    case DependencyType::StartToStart: return StartToStart{};
    case DependencyType::FinishToFinish: return FinishToFinish{};
    case DependencyType::StartToFinish: return StartToFinish{};
  }
  return FinishToStart{};
}

// Lower bound on the successor's start implied by one dependency.
[[nodiscard]] inline auto successor_start_bound(DependencyType type,
                                                const WorkCalendar& cal,
                                                const Window& pred, int lag,
                                                int successor_duration)
    -> Date {
  return std::visit(
      [&](const auto& kind) {
        return kind.earliest_start(cal, pred, lag, successor_duration);
      },
      make_dependency_kind(type));
}

// Upper bound on the predecessor's finish implied by one dependency.
[[nodiscard]] inline auto predecessor_finish_bound(DependencyType type,
                                                   const WorkCalendar& cal,
                                                   const Window& succ, int lag,
                                                   int predecessor_duration)
    -> Date {
  return std::visit(
      [&](const auto& kind) {
        return kind.latest_finish(cal, succ, lag, predecessor_duration);
      },
      make_dependency_kind(type));
}

}  // namespace critpath
