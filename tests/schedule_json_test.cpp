#include "critpath/io/schedule_json.hpp"

#include "gtest/gtest.h"

#include "test_utils.hpp"

#include <vector>

using namespace critpath;
using critpath::test::jan;
using critpath::test::make_dep;
using critpath::test::make_member;
using critpath::test::make_task;
using critpath::test::person_id;
using critpath::test::phase_id;
using critpath::test::task_id;

TEST(ScheduleJsonTest, TaskFieldsAndNulls) {
  std::vector<Task> tasks{make_task("A", 2), make_task("B", 3)};
  std::vector<Dependency> deps{make_dep("A", "B")};
  auto schedule = compute_schedule(tasks, deps, jan(7), kDefaultWorkWeek, {});
  ASSERT_TRUE(schedule.has_value());

  auto j = schedule_to_json(*schedule);
  ASSERT_TRUE(j["tasks"].is_array());
  ASSERT_EQ(j["tasks"].size(), 2);

  const auto& a = j["tasks"][0];
  EXPECT_EQ(a["id"], "A");
  EXPECT_EQ(a["es"], "2024-01-07");
  EXPECT_EQ(a["ef"], "2024-01-09");
  EXPECT_EQ(a["slack"], 0);
  EXPECT_TRUE(a["is_critical"].get<bool>());
  EXPECT_TRUE(a["constraint_override"].is_null());
  EXPECT_TRUE(a["deadline_violation"].is_null());

  EXPECT_EQ(j["critical_path"], nlohmann::json::array({"A", "B"}));
  EXPECT_TRUE(j["allocations"].empty());
  EXPECT_EQ(j["project_end_date"], j["tasks"][1]["ef"]);
}

TEST(ScheduleJsonTest, EmptyScheduleHasNullEnd) {
  auto j = schedule_to_json(Schedule{});
  EXPECT_TRUE(j["project_end_date"].is_null());
  EXPECT_TRUE(j["tasks"].is_array());
  EXPECT_TRUE(j["tasks"].empty());
}

TEST(ScheduleJsonTest, DeadlineViolationAndCost) {
  auto late = make_task("A", 5);
  late.constraint_type = ConstraintType::FinishNoLaterThan;
  late.constraint_date = jan(9);
  late.assignee_id = person_id("alice");
  std::vector<Task> tasks{late};

  auto alice = make_member("alice");
  alice.hourly_rate = 50.0;
  std::vector<TeamMember> team{alice};

  auto schedule = compute_schedule_with_resources(tasks, {}, jan(7),
                                                  kDefaultWorkWeek, {}, team, {});
  ASSERT_TRUE(schedule.has_value());
  auto j = schedule_to_json(*schedule);

  const auto& violation = j["tasks"][0]["deadline_violation"];
  ASSERT_TRUE(violation.is_object());
  EXPECT_EQ(violation["constraint_date"], "2024-01-09");
  EXPECT_GT(violation["days_late"].get<int>(), 0);

  ASSERT_EQ(j["allocations"].size(), 1);
  EXPECT_EQ(j["allocations"][0]["person_id"], "alice");
  EXPECT_DOUBLE_EQ(j["allocations"][0]["cost"].get<double>(), 40.0 * 50.0);
}

TEST(ScheduleJsonTest, PhaseLocksInOrder) {
  ProjectPhase build;
  build.id = phase_id("build");
  build.name = "Build";
  build.phase_order = 2;
  ProjectPhase design;
  design.id = phase_id("design");
  design.name = "Design";
  design.phase_order = 1;
  std::vector<ProjectPhase> phases{build, design};

  auto t = make_task("t1", 1);
  t.phase_id = phase_id("design");
  std::vector<Task> tasks{t};

  auto j = phase_locks_to_json(evaluate_phase_locks(phases, tasks), phases);
  ASSERT_EQ(j.size(), 2);
  EXPECT_EQ(j[0]["phase_id"], "design");
  EXPECT_FALSE(j[0]["is_locked"].get<bool>());
  EXPECT_EQ(j[0]["reason"], "first_phase");
  EXPECT_TRUE(j[0]["blocked_by_phase_id"].is_null());

  EXPECT_EQ(j[1]["phase_id"], "build");
  EXPECT_TRUE(j[1]["is_locked"].get<bool>());
  EXPECT_EQ(j[1]["reason"], "previous_phase_incomplete");
  EXPECT_EQ(j[1]["blocked_by_phase_id"], "design");
  EXPECT_EQ(j[1]["blocked_by_phase_name"], "Design");
}

TEST(ScheduleJsonTest, CycleError) {
  std::vector<Task> tasks{make_task("A", 1), make_task("B", 1)};
  std::vector<Dependency> deps{make_dep("A", "B"), make_dep("B", "A")};
  auto schedule = compute_schedule(tasks, deps, jan(7), kDefaultWorkWeek, {});
  ASSERT_FALSE(schedule.has_value());

  auto j = schedule_error_to_json(schedule.error());
  ASSERT_TRUE(j.contains("error"));
  const auto& err = j["error"];
  EXPECT_EQ(err["code"], make_error_code(Error::CycleDetected).message());
  EXPECT_FALSE(err["message"].get<std::string>().empty());
  EXPECT_EQ(err["cycle"].size(), 2);
}
