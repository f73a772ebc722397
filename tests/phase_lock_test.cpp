#include "critpath/phase/phase_lock.hpp"
#include "critpath/phase/phase_unlock_tracker.hpp"

#include "gtest/gtest.h"

#include "test_utils.hpp"

#include <vector>

using namespace critpath;
using critpath::test::make_task;
using critpath::test::phase_id;

namespace {

auto make_phase(std::string_view id, int order) -> ProjectPhase {
  ProjectPhase p;
  p.id = phase_id(id);
  p.name = std::string{id} + " phase";
  p.phase_order = order;
  return p;
}

auto in_phase(std::string_view id, std::string_view phase,
              TaskStatus status = TaskStatus::Pending) -> Task {
  auto t = make_task(id, 1);
  t.phase_id = phase_id(phase);
  t.status = status;
  return t;
}

}  // namespace

class PhaseLockTest : public ::testing::Test {
protected:
  std::vector<ProjectPhase> phases_{make_phase("P2", 2), make_phase("P1", 1)};
  std::vector<Task> tasks_{in_phase("t1", "P1")};
};

TEST_F(PhaseLockTest, NoPhases) {
  EXPECT_TRUE(evaluate_phase_locks({}, tasks_).empty());
}

TEST_F(PhaseLockTest, PendingTaskLocksNextPhase) {
  auto locks = evaluate_phase_locks(phases_, tasks_);
  ASSERT_EQ(locks.size(), 2);

  const auto& p1 = locks.at(phase_id("P1"));
  EXPECT_FALSE(p1.is_locked);
  EXPECT_EQ(p1.reason, LockReason::FirstPhase);

  const auto& p2 = locks.at(phase_id("P2"));
  EXPECT_TRUE(p2.is_locked);
  EXPECT_EQ(p2.reason, LockReason::PreviousPhaseIncomplete);
  EXPECT_EQ(p2.blocked_by_phase_id, phase_id("P1"));
  EXPECT_EQ(p2.blocked_by_phase_name, "P1 phase");
}

TEST_F(PhaseLockTest, CompletingTaskUnlocks) {
  tasks_[0].status = TaskStatus::Done;
  auto locks = evaluate_phase_locks(phases_, tasks_);

  const auto& p2 = locks.at(phase_id("P2"));
  EXPECT_FALSE(p2.is_locked);
  EXPECT_EQ(p2.reason, LockReason::PreviousPhaseComplete);
  EXPECT_FALSE(p2.blocked_by_phase_id.has_value());
  EXPECT_FALSE(p2.blocked_by_phase_name.has_value());
}

TEST_F(PhaseLockTest, InputIsNotReordered) {
  (void)evaluate_phase_locks(phases_, tasks_);
  EXPECT_EQ(phases_[0].id, phase_id("P2"));
}

TEST_F(PhaseLockTest, EmptyPhaseDoesNotBlock) {
  phases_.push_back(make_phase("P3", 3));
  tasks_[0].status = TaskStatus::Done;
  auto locks = evaluate_phase_locks(phases_, tasks_);
  EXPECT_FALSE(locks.at(phase_id("P3")).is_locked);
}

TEST_F(PhaseLockTest, OnlyImmediatePredecessorCounts) {
  phases_.push_back(make_phase("P3", 3));
  tasks_.push_back(in_phase("t2", "P2", TaskStatus::Done));
  auto locks = evaluate_phase_locks(phases_, tasks_);
  EXPECT_TRUE(locks.at(phase_id("P2")).is_locked);
  EXPECT_FALSE(locks.at(phase_id("P3")).is_locked);
}

TEST_F(PhaseLockTest, TasksWithoutPhaseAreIgnored) {
  tasks_[0].status = TaskStatus::Done;
  tasks_.push_back(make_task("loose", 1));
  EXPECT_FALSE(is_phase_locked(phase_id("P2"), phases_, tasks_));
}

TEST_F(PhaseLockTest, InProgressStillLocks) {
  tasks_[0].status = TaskStatus::InProgress;
  EXPECT_TRUE(is_phase_locked(phase_id("P2"), phases_, tasks_));
  EXPECT_FALSE(is_phase_locked(phase_id("unknown"), phases_, tasks_));
}

TEST_F(PhaseLockTest, EqualOrdersKeepInputOrder) {
  std::vector phases{make_phase("B", 1), make_phase("A", 1)};
  std::vector tasks{in_phase("t", "B")};
  auto locks = evaluate_phase_locks(phases, tasks);
  EXPECT_EQ(locks.at(phase_id("B")).reason, LockReason::FirstPhase);
  EXPECT_TRUE(locks.at(phase_id("A")).is_locked);
}

TEST_F(PhaseLockTest, EvaluationIsIdempotent) {
  auto first = evaluate_phase_locks(phases_, tasks_);
  auto second = evaluate_phase_locks(phases_, tasks_);
  for (const auto& [id, info] : first) {
    const auto& other = second.at(id);
    EXPECT_EQ(info.is_locked, other.is_locked);
    EXPECT_EQ(info.reason, other.reason);
    EXPECT_EQ(info.blocked_by_phase_id, other.blocked_by_phase_id);
  }
}

TEST_F(PhaseLockTest, RefreshCounts) {
  tasks_.push_back(in_phase("t2", "P1", TaskStatus::Done));
  tasks_.push_back(in_phase("t3", "P2"));
  auto phases = refresh_phase_counts(phases_, tasks_);
  ASSERT_EQ(phases.size(), 2);
  EXPECT_EQ(phases[0].task_count, 1);
  EXPECT_EQ(phases[0].completed_task_count, 0);
  EXPECT_EQ(phases[1].task_count, 2);
  EXPECT_EQ(phases[1].completed_task_count, 1);
}

TEST(LockReasonTest, Names) {
  EXPECT_EQ(to_string_view(LockReason::FirstPhase), "first_phase");
  EXPECT_EQ(to_string_view(LockReason::PreviousPhaseComplete),
            "previous_phase_complete");
  EXPECT_EQ(to_string_view(LockReason::PreviousPhaseIncomplete),
            "previous_phase_incomplete");
}

class PhaseUnlockTrackerTest : public PhaseLockTest {
protected:
  PhaseUnlockTracker tracker_;
};

TEST_F(PhaseUnlockTrackerTest, FirstObservationIsBaseline) {
  auto events = tracker_.observe("proj", evaluate_phase_locks(phases_, tasks_),
                                 phases_);
  EXPECT_TRUE(events.empty());
  EXPECT_TRUE(tracker_.has_baseline());
}

TEST_F(PhaseUnlockTrackerTest, UnlockProducesEvent) {
  (void)tracker_.observe("proj", evaluate_phase_locks(phases_, tasks_), phases_);
  tasks_[0].status = TaskStatus::Done;
  auto events = tracker_.observe("proj", evaluate_phase_locks(phases_, tasks_),
                                 phases_);

  ASSERT_EQ(events.size(), 1);
  EXPECT_EQ(events[0].phase_id, phase_id("P2"));
  EXPECT_EQ(events[0].phase_name, "P2 phase");
  EXPECT_EQ(events[0].completed_phase_id, phase_id("P1"));
  EXPECT_EQ(events[0].completed_phase_name, "P1 phase");

  auto repeat = tracker_.observe("proj", evaluate_phase_locks(phases_, tasks_),
                                 phases_);
  EXPECT_TRUE(repeat.empty());
}

TEST_F(PhaseUnlockTrackerTest, ProjectSwitchResetsBaseline) {
  (void)tracker_.observe("a", evaluate_phase_locks(phases_, tasks_), phases_);
  tasks_[0].status = TaskStatus::Done;
  auto events = tracker_.observe("b", evaluate_phase_locks(phases_, tasks_),
                                 phases_);
  EXPECT_TRUE(events.empty());
}

TEST_F(PhaseUnlockTrackerTest, EmptyMapIsIgnored) {
  (void)tracker_.observe("proj", evaluate_phase_locks(phases_, tasks_), phases_);
  EXPECT_TRUE(tracker_.observe("proj", PhaseLockMap{}, phases_).empty());

  tasks_[0].status = TaskStatus::Done;
  auto events = tracker_.observe("proj", evaluate_phase_locks(phases_, tasks_),
                                 phases_);
  EXPECT_EQ(events.size(), 1);
}

TEST_F(PhaseUnlockTrackerTest, ResetForgetsBaseline) {
  (void)tracker_.observe("proj", evaluate_phase_locks(phases_, tasks_), phases_);
  tracker_.reset();
  EXPECT_FALSE(tracker_.has_baseline());

  tasks_[0].status = TaskStatus::Done;
  EXPECT_TRUE(tracker_.observe("proj", evaluate_phase_locks(phases_, tasks_),
                               phases_)
                  .empty());
}
