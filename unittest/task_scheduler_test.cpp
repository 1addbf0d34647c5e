// ============================================================================
// TASK SCHEDULER UNIT TESTS
// ============================================================================
// Tests for posted tasks, timers, cancellation and fault isolation
// ============================================================================

#include <gtest/gtest.h>
#include <pooldispatch/core/common/errors.hpp>
#include <pooldispatch/core/utils/task_scheduler.hpp>
#include <stdexcept>
#include <vector>

using namespace PoolDispatch;

class TaskSchedulerTest : public ::testing::Test {
protected:
    TaskScheduler scheduler{1000};
    std::vector<int> order;
};

TEST_F(TaskSchedulerTest, PostedTasksRunFifoOnNextRun) {
    scheduler.post([this] { order.push_back(1); });
    scheduler.post([this] { order.push_back(2); });
    EXPECT_TRUE(order.empty());

    EXPECT_EQ(scheduler.runDue(1000), 2u);
    EXPECT_EQ(order, (std::vector<int>{1, 2}));
    EXPECT_EQ(scheduler.pendingPosted(), 0u);
}

TEST_F(TaskSchedulerTest, TaskPostedDuringRunWaitsForNextRun) {
    scheduler.post([this] {
        order.push_back(1);
        scheduler.post([this] { order.push_back(2); });
    });

    scheduler.runDue(1000);
    EXPECT_EQ(order, (std::vector<int>{1}));
    scheduler.runDue(1000);
    EXPECT_EQ(order, (std::vector<int>{1, 2}));
}

TEST_F(TaskSchedulerTest, TimerFiresOnlyWhenDeadlineReached) {
    scheduler.scheduleAfter(std::chrono::milliseconds(100), [this] { order.push_back(7); });

    scheduler.runDue(1050);
    EXPECT_TRUE(order.empty());
    EXPECT_EQ(scheduler.pendingTimers(), 1u);

    scheduler.runDue(1100);
    EXPECT_EQ(order, (std::vector<int>{7}));
    EXPECT_EQ(scheduler.pendingTimers(), 0u);
}

TEST_F(TaskSchedulerTest, TimersRunInDeadlineOrderThenSchedulingOrder) {
    scheduler.scheduleAt(1300, [this] { order.push_back(3); });
    scheduler.scheduleAt(1100, [this] { order.push_back(1); });
    scheduler.scheduleAt(1100, [this] { order.push_back(2); });

    scheduler.runDue(2000);
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST_F(TaskSchedulerTest, DelayIsRelativeToLatestRunTime) {
    scheduler.runDue(5000);
    scheduler.scheduleAfter(std::chrono::milliseconds(10), [this] { order.push_back(1); });

    scheduler.runDue(5009);
    EXPECT_TRUE(order.empty());
    scheduler.runDue(5010);
    EXPECT_EQ(order.size(), 1u);
    EXPECT_EQ(scheduler.now(), 5010u);
}

TEST_F(TaskSchedulerTest, CancelPreventsExecutionAndIsIdempotent) {
    auto id = scheduler.scheduleAfter(std::chrono::milliseconds(5), [this] { order.push_back(1); });

    EXPECT_TRUE(scheduler.cancel(id));
    EXPECT_FALSE(scheduler.cancel(id));
    EXPECT_FALSE(scheduler.cancel(TaskScheduler::kInvalidTask));

    scheduler.runDue(2000);
    EXPECT_TRUE(order.empty());
}

TEST_F(TaskSchedulerTest, TaskCanCancelLaterTimerInSamePass) {
    TaskScheduler::TaskId second = TaskScheduler::kInvalidTask;
    scheduler.scheduleAt(1001, [this, &second] {
        order.push_back(1);
        scheduler.cancel(second);
    });
    second = scheduler.scheduleAt(1002, [this] { order.push_back(2); });

    scheduler.runDue(1005);
    EXPECT_EQ(order, (std::vector<int>{1}));
}

TEST_F(TaskSchedulerTest, ThrowingTaskDoesNotStopPass) {
    scheduler.post([] { throw std::runtime_error("task failure"); });
    scheduler.post([this] { order.push_back(1); });

    EXPECT_NO_THROW(scheduler.runDue(1000));
    EXPECT_EQ(order, (std::vector<int>{1}));
}

TEST_F(TaskSchedulerTest, EmptyTasksAreRejected) {
    EXPECT_THROW(scheduler.post(nullptr), CoreError);
    EXPECT_THROW(scheduler.scheduleAfter(std::chrono::milliseconds(1), nullptr), CoreError);
}

TEST_F(TaskSchedulerTest, ClearDropsPendingWork) {
    scheduler.post([this] { order.push_back(1); });
    scheduler.scheduleAfter(std::chrono::milliseconds(1), [this] { order.push_back(2); });

    scheduler.clear();
    EXPECT_EQ(scheduler.runDue(5000), 0u);
    EXPECT_TRUE(order.empty());
}
