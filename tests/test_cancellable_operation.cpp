#include <gtest/gtest.h>

#include <QThread>

#include <memory>

#include "CancellableOperation.h"
#include "TestHelpers.h"

class CancellableOperationTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        operation = std::make_unique<CancellableOperation>("Uploading Files", 4);
        QObject::connect(operation.get(), &CancellableOperation::statusReported,
                         [this](const QString &label, qreal percent) {
                             labels.append(label);
                             percents.append(percent);
                             threads.append(QThread::currentThread());
                         });
    }

    std::unique_ptr<CancellableOperation> operation;
    QStringList labels;
    QList<qreal> percents;
    QList<QThread *> threads;
};

// ============================================================================
// Cancellation flag
// ============================================================================

TEST_F(CancellableOperationTest, RequestCancel_IsIdempotentAndSticky)
{
    int notifications = 0;
    QObject::connect(operation.get(), &CancellableOperation::cancelRequested, [&notifications]() {
        ++notifications;
    });

    EXPECT_FALSE(operation->isCancelled());
    operation->requestCancel();
    operation->requestCancel();

    EXPECT_TRUE(operation->isCancelled());
    EXPECT_EQ(notifications, 1);
}

TEST_F(CancellableOperationTest, IsCancelled_VisibleFromOtherThread)
{
    operation->requestCancel();

    bool seen = false;
    std::unique_ptr<QThread> thread(QThread::create([this, &seen]() {
        seen = operation->isCancelled();
    }));
    thread->start();
    ASSERT_TRUE(thread->wait(5000));
    EXPECT_TRUE(seen);
}

// ============================================================================
// Status reporting
// ============================================================================

TEST_F(CancellableOperationTest, ReportStatus_PercentIsClampedAndMonotonic)
{
    operation->reportStatus("a", 40.0);
    operation->reportStatus("b", 20.0);
    operation->reportStatus("c", 250.0);
    operation->reportStatus("d", -10.0);

    ASSERT_EQ(percents.size(), 4);
    EXPECT_DOUBLE_EQ(percents.at(0), 40.0);
    EXPECT_DOUBLE_EQ(percents.at(1), 40.0);
    EXPECT_DOUBLE_EQ(percents.at(2), 100.0);
    EXPECT_DOUBLE_EQ(percents.at(3), CancellableOperation::noPercent);
    EXPECT_EQ(operation->status().currentItemLabel(), QString("d"));
}

TEST_F(CancellableOperationTest, ReportStatus_FromWorkerIsDeliveredOnOwnerThreadInOrder)
{
    std::unique_ptr<QThread> worker(QThread::create([this]() {
        for (int index = 0; index < 5; ++index) {
            operation->reportStatus(QString("item %1").arg(index), index * 20.0);
        }
    }));
    worker->start();
    ASSERT_TRUE(worker->wait(5000));

    // Nothing runs on the worker; delivery waits for the owner's event loop.
    EXPECT_TRUE(labels.isEmpty());
    ASSERT_TRUE(TestHelpers::waitUntil([this]() { return labels.size() == 5; }));

    EXPECT_EQ(labels, QStringList({"item 0", "item 1", "item 2", "item 3", "item 4"}));
    for (QThread *thread : threads) {
        EXPECT_EQ(thread, QThread::currentThread());
    }
}

TEST_F(CancellableOperationTest, RecordCompletedAndErrors_UpdateSnapshot)
{
    operation->recordCompleted(2);
    operation->recordError("b.txt: failed");
    operation->recordCompleted(1);

    const ProgressTracker status = operation->status();
    EXPECT_EQ(status.totalItems(), 4);
    EXPECT_EQ(status.completedItems(), 2);
    EXPECT_EQ(status.errors(), QStringList({"b.txt: failed"}));
}
