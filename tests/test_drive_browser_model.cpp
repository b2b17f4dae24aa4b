#include <gtest/gtest.h>

#include <QDir>
#include <QTemporaryDir>

#include <atomic>
#include <memory>

#include "AppSettings.h"
#include "DriveBrowserModel.h"
#include "FakeRemoteStorage.h"
#include "TestHelpers.h"

class DriveBrowserModelTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ASSERT_TRUE(tempDir.isValid());
        settings = std::make_unique<AppSettings>(QDir(tempDir.path()).filePath("gdman.ini"));
        model = std::make_unique<DriveBrowserModel>(&storage, settings.get());

        QObject::connect(model.get(), &DriveBrowserModel::errorOccurred, [this](const QString &title, const QString &message) {
            errors.append(title + QLatin1String(": ") + message);
        });
        QObject::connect(model.get(), &DriveBrowserModel::operationSummary, [this](const QString &title, const QString &message) {
            summaries.append(title + QLatin1String(": ") + message);
        });
        QObject::connect(model.get(), &DriveBrowserModel::operationFinished, [this](const QVariantMap &result) {
            finished.append(result);
        });
    }

    void TearDown() override
    {
        released = true;
        model.reset();
    }

    bool refreshAndWait()
    {
        model->refresh();
        return TestHelpers::waitUntil([this]() { return !model->loading(); });
    }

    bool waitForBatch()
    {
        return TestHelpers::waitUntil([this]() { return !model->operationInProgress() && !finished.isEmpty(); });
    }

    int rowOf(const QString &title) const
    {
        for (int row = 0; row < model->rowCount(); ++row) {
            if (model->entryAt(row).title() == title) {
                return row;
            }
        }
        return -1;
    }

    QTemporaryDir tempDir;
    FakeRemoteStorage storage;
    std::unique_ptr<AppSettings> settings;
    std::unique_ptr<DriveBrowserModel> model;
    QStringList errors;
    QStringList summaries;
    QVector<QVariantMap> finished;
    std::atomic<bool> released{false};
};

// ============================================================================
// Listing and navigation
// ============================================================================

TEST_F(DriveBrowserModelTest, Refresh_ListsFoldersFirstInNameOrder)
{
    storage.addFile("zeta.txt");
    storage.addFolder("Photos");
    storage.addFile("Alpha.txt");
    storage.addFolder("archive");

    ASSERT_TRUE(refreshAndWait());

    ASSERT_EQ(model->rowCount(), 4);
    EXPECT_EQ(model->entryAt(0).title(), QString("archive"));
    EXPECT_EQ(model->entryAt(1).title(), QString("Photos"));
    EXPECT_EQ(model->entryAt(2).title(), QString("Alpha.txt"));
    EXPECT_EQ(model->entryAt(3).title(), QString("zeta.txt"));
    EXPECT_EQ(model->itemCountText(), QString("2 folders, 2 files"));
    EXPECT_EQ(model->statusText(), QString("Loaded 4 items"));
    EXPECT_TRUE(model->connected());

    const QModelIndex folderIndex = model->index(0, 0);
    EXPECT_EQ(model->data(folderIndex, DriveBrowserModel::SizeTextRole).toString(), QString("-"));
    EXPECT_TRUE(model->data(folderIndex, DriveBrowserModel::IsFolderRole).toBool());
}

TEST_F(DriveBrowserModelTest, ActivateFolder_NavigatesAndBackReturns)
{
    const QString photos = storage.addFolder("Photos");
    storage.addFile("beach.jpg", photos);
    storage.addFile("root.txt");
    ASSERT_TRUE(refreshAndWait());

    model->activate(rowOf("Photos"));
    ASSERT_TRUE(TestHelpers::waitUntil([this]() { return !model->loading(); }));

    EXPECT_EQ(model->currentFolderId(), photos);
    EXPECT_EQ(model->currentFolderName(), QString("Photos"));
    EXPECT_TRUE(model->canGoBack());
    ASSERT_EQ(model->rowCount(), 1);
    EXPECT_EQ(model->entryAt(0).title(), QString("beach.jpg"));

    model->goBack();
    ASSERT_TRUE(TestHelpers::waitUntil([this]() { return !model->loading(); }));
    EXPECT_EQ(model->currentFolderId(), DriveEntry::rootFolderId());
    EXPECT_FALSE(model->canGoBack());
    EXPECT_EQ(model->rowCount(), 2);
}

TEST_F(DriveBrowserModelTest, ActivateStaleRowWhileListingPending_IsIgnored)
{
    const QString first = storage.addFolder("First");
    const QString second = storage.addFolder("Second");
    ASSERT_TRUE(refreshAndWait());
    std::atomic<bool> entered{false};
    storage.setCallHook([this, &entered, first](const QString &call) {
        if (call == QStringLiteral("list::%1").arg(first)) {
            entered = true;
            while (!released) {
                QThread::msleep(1);
            }
        }
    });

    model->activate(rowOf("First"));
    ASSERT_TRUE(TestHelpers::waitUntil([&entered]() { return entered.load(); }));
    // The rows still belong to the root listing.
    model->activate(rowOf("Second"));

    EXPECT_EQ(model->currentFolderId(), first);
    released = true;
    ASSERT_TRUE(TestHelpers::waitUntil([this]() { return !model->loading(); }));
    EXPECT_FALSE(storage.calls().contains(QStringLiteral("list::%1").arg(second)));

    model->goBack();
    EXPECT_EQ(model->currentFolderId(), DriveEntry::rootFolderId());
    EXPECT_FALSE(model->canGoBack());
}

TEST_F(DriveBrowserModelTest, ActivateFile_EmitsFileActivated)
{
    const QString id = storage.addFile("notes.txt");
    ASSERT_TRUE(refreshAndWait());

    QString activatedId;
    QObject::connect(model.get(), &DriveBrowserModel::fileActivated, [&activatedId](const QString &fileId, const QString &) {
        activatedId = fileId;
    });
    model->activate(0);

    EXPECT_EQ(activatedId, id);
    EXPECT_EQ(model->currentFolderId(), DriveEntry::rootFolderId());
}

TEST_F(DriveBrowserModelTest, ListingFailure_KeepsRowsAndReportsError)
{
    storage.addFile("kept.txt");
    const QString ghost = storage.addFolder("ghost");
    ASSERT_TRUE(refreshAndWait());
    const int ghostRow = rowOf("ghost");
    ASSERT_GE(ghostRow, 0);

    // The folder disappears remotely before it is opened.
    RemoteError removeError;
    ASSERT_TRUE(storage.remove(ghost, &removeError));

    model->activate(ghostRow);
    ASSERT_TRUE(TestHelpers::waitUntil([this]() { return !model->loading() && !errors.isEmpty(); }));

    EXPECT_EQ(model->statusText(), QString("Error loading folder"));
    EXPECT_TRUE(errors.first().startsWith("Error: Failed to load folder contents:"));
    EXPECT_EQ(model->currentFolderId(), ghost);
    EXPECT_EQ(model->rowCount(), 2);
    EXPECT_TRUE(model->connected());
}

TEST_F(DriveBrowserModelTest, ConnectionFailure_EmitsConnectionError)
{
    storage.setConnectionError(RemoteError::Authentication, "Credentials file not found");

    model->connectToDrive();
    ASSERT_TRUE(TestHelpers::waitUntil([this]() { return !errors.isEmpty(); }));

    EXPECT_TRUE(errors.first().startsWith("Connection Error: Failed to connect to Google Drive:"));
    EXPECT_TRUE(errors.first().contains("Credentials file not found"));
    EXPECT_FALSE(model->connected());
    EXPECT_FALSE(storage.calls().contains("list::root"));
}

TEST_F(DriveBrowserModelTest, ConnectionSuccess_ListsRoot)
{
    storage.addFile("a.txt");

    model->connectToDrive();
    ASSERT_TRUE(TestHelpers::waitUntil([this]() { return model->rowCount() == 1 && !model->loading(); }));

    EXPECT_TRUE(model->connected());
    EXPECT_TRUE(errors.isEmpty());
}

// ============================================================================
// Selection
// ============================================================================

TEST_F(DriveBrowserModelTest, Selection_SingleMultiAndAll)
{
    storage.addFile("a.txt");
    storage.addFile("b.txt");
    storage.addFile("c.txt");
    ASSERT_TRUE(refreshAndWait());

    model->select(0, false);
    model->select(2, true);
    EXPECT_EQ(model->selectedCount(), 2);
    EXPECT_TRUE(model->isSelected(2));
    EXPECT_EQ(model->selectedRows(), QVariantList({0, 2}));

    model->select(2, true);
    EXPECT_FALSE(model->isSelected(2));

    model->select(1, false);
    EXPECT_EQ(model->selectedRows(), QVariantList({1}));

    model->selectAll();
    EXPECT_EQ(model->selectedCount(), 3);
    EXPECT_TRUE(model->data(model->index(1, 0), DriveBrowserModel::SelectedRole).toBool());

    model->clearSelection();
    EXPECT_EQ(model->selectedCount(), 0);
}

TEST_F(DriveBrowserModelTest, Refresh_DropsSelectionOfVanishedEntries)
{
    const QString keep = storage.addFile("keep.txt");
    const QString drop = storage.addFile("drop.txt");
    ASSERT_TRUE(refreshAndWait());
    model->selectAll();

    RemoteError error;
    ASSERT_TRUE(storage.remove(drop, &error));
    ASSERT_TRUE(refreshAndWait());

    ASSERT_EQ(model->selectedCount(), 1);
    EXPECT_EQ(model->selectedEntries().first().id(), keep);
}

// ============================================================================
// Batches
// ============================================================================

TEST_F(DriveBrowserModelTest, Delete_RequiresConfirmationWhenEnabled)
{
    storage.addFile("a.txt");
    ASSERT_TRUE(refreshAndWait());
    model->selectAll();

    const QVariantMap result = model->deleteSelected(false);

    EXPECT_FALSE(result.value("ok").toBool());
    EXPECT_TRUE(result.value("confirmationRequired").toBool());
    EXPECT_EQ(result.value("count").toInt(), 1);
    EXPECT_FALSE(model->operationInProgress());
}

TEST_F(DriveBrowserModelTest, Delete_WithoutSelectionIsRejected)
{
    const QVariantMap result = model->deleteSelected(true);
    EXPECT_FALSE(result.value("ok").toBool());
    EXPECT_EQ(result.value("error").toString(), QString("Please select items to delete"));
}

TEST_F(DriveBrowserModelTest, Delete_ConfirmedRemovesAndSummarizes)
{
    const QString a = storage.addFile("a.txt");
    const QString folder = storage.addFolder("old");
    storage.addFile("inside.txt", folder);
    ASSERT_TRUE(refreshAndWait());
    model->selectAll();

    const QVariantMap result = model->deleteSelected(true);
    ASSERT_TRUE(result.value("ok").toBool());
    EXPECT_EQ(result.value("total").toInt(), 2);
    ASSERT_TRUE(waitForBatch());
    ASSERT_TRUE(TestHelpers::waitUntil([this]() { return !model->loading(); }));

    EXPECT_FALSE(storage.contains(a));
    EXPECT_FALSE(storage.contains(folder));
    ASSERT_EQ(summaries.size(), 1);
    EXPECT_EQ(summaries.first(), QString("Delete Complete: Successfully deleted 2 items"));
    EXPECT_EQ(model->selectedCount(), 0);
    EXPECT_EQ(model->rowCount(), 0);
}

TEST_F(DriveBrowserModelTest, Download_SkipsFoldersAndRemembersTarget)
{
    storage.addFolder("docs");
    storage.addFile("report.txt", DriveEntry::rootFolderId(), "quarterly");
    ASSERT_TRUE(refreshAndWait());
    model->selectAll();

    const QString target = QDir(tempDir.path()).filePath("downloads");
    const QVariantMap result = model->startDownloadSelected(target);
    ASSERT_TRUE(result.value("ok").toBool()) << result.value("error").toString().toStdString();
    EXPECT_EQ(result.value("total").toInt(), 1);
    ASSERT_TRUE(waitForBatch());

    EXPECT_EQ(TestHelpers::readFile(QDir(target).filePath("report.txt")), QByteArray("quarterly"));
    EXPECT_EQ(settings->lastDownloadPath(), target);
    ASSERT_EQ(summaries.size(), 1);
    EXPECT_TRUE(summaries.first().startsWith("Download Complete: Successfully downloaded 1 file to:"));
}

TEST_F(DriveBrowserModelTest, Download_OnlyFoldersSelectedIsRejected)
{
    storage.addFolder("docs");
    ASSERT_TRUE(refreshAndWait());
    model->selectAll();

    const QVariantMap result = model->startDownloadSelected(tempDir.path());
    EXPECT_FALSE(result.value("ok").toBool());
    EXPECT_EQ(result.value("error").toString(),
              QString("Please select files to download (folders cannot be downloaded)"));
    EXPECT_TRUE(storage.calls().filter("download:").isEmpty());
}

TEST_F(DriveBrowserModelTest, UploadFiles_ReportsPartialFailure)
{
    const QString good = QDir(tempDir.path()).filePath("good.txt");
    const QString bad = QDir(tempDir.path()).filePath("bad.txt");
    ASSERT_TRUE(TestHelpers::writeFile(good, "1"));
    ASSERT_TRUE(TestHelpers::writeFile(bad, "2"));
    storage.failOn("bad.txt", RemoteError::Remote, "quota exceeded");

    const QVariantMap result = model->startUploadFiles({good, bad});
    ASSERT_TRUE(result.value("ok").toBool());
    ASSERT_TRUE(waitForBatch());

    ASSERT_EQ(summaries.size(), 1);
    EXPECT_TRUE(summaries.first().contains("Successfully uploaded 1 file"));
    EXPECT_TRUE(summaries.first().contains("1 item could not be processed."));
    EXPECT_FALSE(storage.findChild(DriveEntry::rootFolderId(), "good.txt").isEmpty());
}

TEST_F(DriveBrowserModelTest, UploadFolder_MissingPathIsRejectedBeforeRemoteCalls)
{
    const QVariantMap result = model->startUploadFolder(QDir(tempDir.path()).filePath("nope"));
    EXPECT_FALSE(result.value("ok").toBool());
    EXPECT_TRUE(storage.calls().isEmpty());
}

TEST_F(DriveBrowserModelTest, FatalError_AbortsBatchAndDisconnects)
{
    const QString first = QDir(tempDir.path()).filePath("first.txt");
    const QString second = QDir(tempDir.path()).filePath("second.txt");
    ASSERT_TRUE(TestHelpers::writeFile(first, "1"));
    ASSERT_TRUE(TestHelpers::writeFile(second, "2"));
    storage.failOn("first.txt", RemoteError::Authentication, "Token has been revoked");

    ASSERT_TRUE(model->startUploadFiles({first, second}).value("ok").toBool());
    ASSERT_TRUE(waitForBatch());

    EXPECT_TRUE(storage.calls().filter("upload:second.txt").isEmpty());
    EXPECT_TRUE(summaries.isEmpty());
    ASSERT_FALSE(errors.isEmpty());
    EXPECT_TRUE(errors.last().contains("Token has been revoked"));
    EXPECT_FALSE(model->connected());
    EXPECT_EQ(model->statusText(), QString("Operation stopped"));
}

TEST_F(DriveBrowserModelTest, SecondBatchWhileRunningIsRejected)
{
    const QString file = QDir(tempDir.path()).filePath("slow.txt");
    ASSERT_TRUE(TestHelpers::writeFile(file, "x"));
    std::atomic<bool> entered{false};
    storage.setCallHook([this, &entered](const QString &call) {
        if (call.startsWith("upload:")) {
            entered = true;
            while (!released) {
                QThread::msleep(1);
            }
        }
    });

    ASSERT_TRUE(model->startUploadFiles({file}).value("ok").toBool());
    ASSERT_TRUE(TestHelpers::waitUntil([&entered]() { return entered.load(); }));
    EXPECT_TRUE(model->operationInProgress());
    EXPECT_EQ(model->operationTitle(), QString("Uploading Files"));

    const QVariantMap second = model->startUploadFiles({file});
    EXPECT_FALSE(second.value("ok").toBool());
    EXPECT_EQ(second.value("error").toString(), QString("Another operation is already running"));

    released = true;
    ASSERT_TRUE(waitForBatch());
    EXPECT_EQ(storage.calls().filter("upload:").size(), 1);
}

TEST_F(DriveBrowserModelTest, Cancel_StopsBeforeNextItemWithoutSummary)
{
    QStringList paths;
    for (const QString &name : {QString("one.txt"), QString("two.txt"), QString("three.txt")}) {
        const QString path = QDir(tempDir.path()).filePath(name);
        ASSERT_TRUE(TestHelpers::writeFile(path, "x"));
        paths.append(path);
    }
    std::atomic<bool> entered{false};
    storage.setCallHook([this, &entered](const QString &call) {
        if (call.startsWith("upload:one.txt")) {
            entered = true;
            while (!released) {
                QThread::msleep(1);
            }
        }
    });

    ASSERT_TRUE(model->startUploadFiles(paths).value("ok").toBool());
    ASSERT_TRUE(TestHelpers::waitUntil([&entered]() { return entered.load(); }));
    model->cancelOperation();
    EXPECT_EQ(model->statusText(), QString("Cancelling..."));
    released = true;
    ASSERT_TRUE(waitForBatch());

    EXPECT_TRUE(finished.first().value("cancelled").toBool());
    EXPECT_EQ(finished.first().value("succeeded").toInt(), 1);
    EXPECT_EQ(storage.calls().filter("upload:").size(), 1);
    EXPECT_TRUE(summaries.isEmpty());
    EXPECT_EQ(model->statusText(), QString("Operation cancelled"));
}

TEST_F(DriveBrowserModelTest, Progress_ReportsRemainingTimeWhileRunning)
{
    QStringList paths;
    for (const QString &name : {QString("one.txt"), QString("two.txt"), QString("three.txt")}) {
        const QString path = QDir(tempDir.path()).filePath(name);
        ASSERT_TRUE(TestHelpers::writeFile(path, "x"));
        paths.append(path);
    }
    storage.setCallHook([this](const QString &call) {
        if (call.startsWith("upload:one.txt")) {
            QThread::msleep(20);
        } else if (call.startsWith("upload:three.txt")) {
            while (!released) {
                QThread::msleep(1);
            }
        }
    });

    ASSERT_TRUE(model->startUploadFiles(paths).value("ok").toBool());
    ASSERT_TRUE(TestHelpers::waitUntil([this]() { return model->operationLabel().contains("three.txt"); }));

    EXPECT_TRUE(model->operationRemainingText().startsWith("About ")) << model->operationRemainingText().toStdString();
    EXPECT_TRUE(model->operationRemainingText().endsWith(" remaining"));

    released = true;
    ASSERT_TRUE(waitForBatch());
    EXPECT_TRUE(model->operationRemainingText().isEmpty());
}

// ============================================================================
// Shutdown
// ============================================================================

TEST_F(DriveBrowserModelTest, Destroy_WaitsForPendingListing)
{
    std::atomic<bool> entered{false};
    std::atomic<bool> listingReturned{false};
    storage.setCallHook([this, &entered, &listingReturned](const QString &call) {
        if (call == QStringLiteral("list::root")) {
            entered = true;
            while (!released) {
                QThread::msleep(1);
            }
            QThread::msleep(20);
            listingReturned = true;
        }
    });

    model->refresh();
    ASSERT_TRUE(TestHelpers::waitUntil([&entered]() { return entered.load(); }));
    std::unique_ptr<QThread> releaser(QThread::create([this]() {
        QThread::msleep(50);
        released = true;
    }));
    releaser->start();

    model.reset();

    EXPECT_TRUE(listingReturned.load());
    ASSERT_TRUE(releaser->wait(5000));
}

TEST_F(DriveBrowserModelTest, Destroy_DuringBatchStopsAfterCurrentItem)
{
    QStringList paths;
    for (const QString &name : {QString("one.txt"), QString("two.txt")}) {
        const QString path = QDir(tempDir.path()).filePath(name);
        ASSERT_TRUE(TestHelpers::writeFile(path, "x"));
        paths.append(path);
    }
    std::atomic<bool> entered{false};
    storage.setCallHook([this, &entered](const QString &call) {
        if (call.startsWith("upload:one.txt")) {
            entered = true;
            while (!released) {
                QThread::msleep(1);
            }
        }
    });

    ASSERT_TRUE(model->startUploadFiles(paths).value("ok").toBool());
    ASSERT_TRUE(TestHelpers::waitUntil([&entered]() { return entered.load(); }));
    std::unique_ptr<QThread> releaser(QThread::create([this]() {
        QThread::msleep(50);
        released = true;
    }));
    releaser->start();

    model.reset();

    const int uploadsAtShutdown = storage.calls().filter("upload:").size();
    EXPECT_EQ(uploadsAtShutdown, 1);
    EXPECT_FALSE(storage.findChild(DriveEntry::rootFolderId(), "one.txt").isEmpty());
    ASSERT_TRUE(releaser->wait(5000));
    QThread::msleep(20);
    EXPECT_EQ(storage.calls().filter("upload:").size(), uploadsAtShutdown);
}

// ============================================================================
// Single actions
// ============================================================================

TEST_F(DriveBrowserModelTest, CreateFolder_EmptyNameIsRejected)
{
    const QVariantMap result = model->createFolder("   ");
    EXPECT_FALSE(result.value("ok").toBool());
    EXPECT_EQ(result.value("error").toString(), QString("Folder name cannot be empty"));
    EXPECT_TRUE(storage.calls().isEmpty());
}

TEST_F(DriveBrowserModelTest, CreateFolder_CreatesUnderCurrentFolderAndRefreshes)
{
    QString createdName;
    QObject::connect(model.get(), &DriveBrowserModel::folderCreated, [&createdName](const QString &, const QString &name) {
        createdName = name;
    });

    ASSERT_TRUE(model->createFolder("  Reports ").value("ok").toBool());
    ASSERT_TRUE(TestHelpers::waitUntil([this]() { return model->rowCount() == 1 && !model->loading(); }));

    EXPECT_EQ(createdName, QString("Reports"));
    EXPECT_TRUE(storage.calls().contains("createFolder:Reports:root"));
    EXPECT_TRUE(model->entryAt(0).isFolder());
}

TEST_F(DriveBrowserModelTest, RequestInfo_EmitsMetadata)
{
    storage.addFile("notes.txt", DriveEntry::rootFolderId(), "hello");
    ASSERT_TRUE(refreshAndWait());

    QVariantMap info;
    QObject::connect(model.get(), &DriveBrowserModel::infoReady, [&info](const QVariantMap &value) { info = value; });
    model->requestInfo(0);
    ASSERT_TRUE(TestHelpers::waitUntil([&info]() { return !info.isEmpty(); }));

    EXPECT_EQ(info.value("title").toString(), QString("notes.txt"));
    EXPECT_FALSE(info.value("isFolder").toBool());
    EXPECT_EQ(info.value("mimeType").toString(), QString("text/plain"));
    EXPECT_EQ(info.value("parentId").toString(), DriveEntry::rootFolderId());
}

TEST_F(DriveBrowserModelTest, LocalSummary_CountsTree)
{
    const QString root = QDir(tempDir.path()).filePath("upload");
    ASSERT_TRUE(TestHelpers::writeFile(QDir(root).filePath("a.txt"), "12"));
    ASSERT_TRUE(TestHelpers::writeFile(QDir(root).filePath("sub/b.txt"), "345"));

    const QVariantMap summary = model->localSummary(root);

    ASSERT_TRUE(summary.value("ok").toBool());
    EXPECT_EQ(summary.value("name").toString(), QString("upload"));
    EXPECT_EQ(summary.value("files").toInt(), 2);
    EXPECT_EQ(summary.value("folders").toInt(), 1);
}
