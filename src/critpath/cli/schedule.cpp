#include "critpath/calendar/work_calendar.hpp"
#include "critpath/cli/commands.hpp"
#include "critpath/cli/context.hpp"
#include "critpath/io/schedule_json.hpp"
#include "critpath/schedule/scheduler.hpp"

#include <print>

namespace critpath::cli {

namespace {

auto opt_date(const std::optional<Date>& d) -> std::string {
  return d ? format_date(*d) : std::string("-");
}

void print_error(const ScheduleError& err) {
  std::println(stderr, "Error: {} ({})", err.message,
               err.error_code().message());
}

void print_table(const ProjectDefinition& project, const Schedule& schedule) {
  std::println("Schedule for {} (start {})\n", project.name,
               format_date(project.start_date));
  std::println("{:<14} {:<28} {:<10} {:<10} {:<10} {:<10} {:>6}  {}", "ID",
               "TITLE", "ES", "EF", "LS", "LF", "SLACK", "CRIT");
  for (const auto& t : schedule.tasks) {
    std::println("{:<14} {:<28} {:<10} {:<10} {:<10} {:<10} {:>6}  {}",
                 t.id, t.title, opt_date(t.es), opt_date(t.ef), opt_date(t.ls),
                 opt_date(t.lf), t.slack, t.is_critical ? "*" : "");
  }

  std::println("\nProject end: {}", opt_date(schedule.project_end_date));
  std::print("Critical path:");
  for (const auto& id : schedule.critical_path_ids) {
    std::print(" {}", id);
  }
  std::println("");

  for (const auto& t : schedule.tasks) {
    if (t.constraint_override) {
      const auto& o = *t.constraint_override;
      std::println("! {} wanted to start {} but '{}' moves it to {}", t.id,
                   format_date(o.constraint_date), o.predecessor_title,
                   format_date(o.effective_start));
    }
    if (t.deadline_violation) {
      const auto& v = *t.deadline_violation;
      std::println("✗ {} finishes {}, {} working day(s) after {}", t.id,
                   format_date(v.finish), v.days_late,
                   format_date(v.constraint_date));
    }
  }

  if (!schedule.allocations.empty()) {
    std::println("\nAllocations:");
    for (const auto& a : schedule.allocations) {
      std::print("  {:<12} {:<14} {} .. {}  {} day(s) {:.1f}h", a.person_id,
                 a.task_id, format_date(a.start), format_date(a.finish),
                 a.days, a.hours);
      if (a.cost) {
        std::print("  cost {:.2f}", *a.cost);
      }
      std::println("");
    }
  }
}

}  // namespace

auto cmd_schedule(const ScheduleCommandOptions& opts) -> int {
  auto ctx = load_context(opts.config_file, opts.project_file);
  if (!ctx) {
    return 1;
  }
  const auto& project = ctx->project;
  const auto& config = ctx->config;

  auto work_days = project.work_days.value_or(config.calendar.work_days);
  auto holidays = expand_calendar_exceptions(project.calendar_exceptions);
  ScheduleOptions options{config.calendar.default_hours_per_day};

  bool level = config.leveling.enabled && !opts.no_level;
  auto result =
      level ? compute_schedule_with_resources(
                  project.tasks, project.dependencies, project.start_date,
                  work_days, holidays, project.team_members, project.time_off,
                  project.assignments, options)
            : compute_schedule(project.tasks, project.dependencies,
                               project.start_date, work_days, holidays);
  if (!result) {
    if (opts.json) {
      std::println("{}", schedule_error_to_json(result.error()).dump(2));
    } else {
      print_error(result.error());
    }
    return 1;
  }

  if (opts.json) {
    std::println("{}", schedule_to_json(*result).dump(2));
  } else {
    print_table(project, *result);
  }
  return 0;
}

}  // namespace critpath::cli
