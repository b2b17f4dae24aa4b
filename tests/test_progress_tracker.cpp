#include <gtest/gtest.h>

#include "ProgressTracker.h"

TEST(ProgressTrackerTest, Percentage_IsZeroWithoutItems)
{
    ProgressTracker tracker(0);
    tracker.update(3);
    EXPECT_DOUBLE_EQ(tracker.percentage(), 0.0);
    EXPECT_EQ(tracker.completedItems(), 0);
}

TEST(ProgressTrackerTest, Percentage_FollowsCompletedItems)
{
    ProgressTracker tracker(4);
    tracker.update(1);
    EXPECT_DOUBLE_EQ(tracker.percentage(), 25.0);
    tracker.update(4);
    EXPECT_DOUBLE_EQ(tracker.percentage(), 100.0);
}

TEST(ProgressTrackerTest, Update_NeverExceedsTotal)
{
    ProgressTracker tracker(3);
    tracker.update(10);
    EXPECT_EQ(tracker.completedItems(), 3);
    EXPECT_DOUBLE_EQ(tracker.percentage(), 100.0);
}

TEST(ProgressTrackerTest, Update_IsMonotonic)
{
    ProgressTracker tracker(10);
    tracker.update(6);
    tracker.update(2);
    tracker.update(-5);
    EXPECT_EQ(tracker.completedItems(), 6);
}

TEST(ProgressTrackerTest, Update_EmptyLabelKeepsCurrentLabel)
{
    ProgressTracker tracker(2);
    tracker.update(1, "a.txt");
    tracker.update(2);
    EXPECT_EQ(tracker.currentItemLabel(), QString("a.txt"));
}

TEST(ProgressTrackerTest, Errors_AreAppendOnlyInOrder)
{
    ProgressTracker tracker(3);
    tracker.addError("first");
    tracker.addError("second");
    EXPECT_EQ(tracker.errors(), QStringList({"first", "second"}));
}

TEST(ProgressTrackerTest, EstimatedRemaining_UnknownBeforeFirstItem)
{
    ProgressTracker tracker(5);
    EXPECT_EQ(tracker.estimatedRemainingMs(1000), ProgressTracker::unknownRemaining);
}

TEST(ProgressTrackerTest, EstimatedRemaining_UsesAverageRate)
{
    ProgressTracker tracker(10);
    tracker.update(2);
    // 2 items in 1000 ms leaves 8 items at 500 ms each.
    EXPECT_EQ(tracker.estimatedRemainingMs(1000), 4000);
}
