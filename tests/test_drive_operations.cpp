#include <gtest/gtest.h>

#include <QTemporaryDir>

#include "DriveOperations.h"
#include "FakeRemoteStorage.h"
#include "TestHelpers.h"

using DriveOperations::BatchKind;

class DriveOperationsTest : public ::testing::Test {
protected:
    QTemporaryDir tempDir;
    FakeRemoteStorage storage;
};

// ============================================================================
// Batch builders
// ============================================================================

TEST_F(DriveOperationsTest, DownloadItems_SkipFoldersAndSanitizeNames)
{
    const QVector<DriveEntry> entries = {
        DriveEntry::create("1", "Photos", 0, QString(), DriveEntry::folderMimeType()),
        DriveEntry::create("2", "report: final?.pdf", 10, QString(), "application/pdf"),
    };

    const QVector<BatchItem> items = DriveOperations::downloadItems(entries, tempDir.path());

    ASSERT_EQ(items.size(), 1);
    EXPECT_EQ(items.first().remoteId, QString("2"));
    EXPECT_EQ(items.first().localPath, QDir(tempDir.path()).filePath("report_ final_.pdf"));
}

TEST_F(DriveOperationsTest, DownloadItems_SameTitlesGetDistinctTargets)
{
    const QVector<DriveEntry> entries = {
        DriveEntry::create("1", "notes.txt", 1, QString(), "text/plain"),
        DriveEntry::create("2", "notes.txt", 2, QString(), "text/plain"),
        DriveEntry::create("3", "Notes.TXT", 3, QString(), "text/plain"),
        DriveEntry::create("4", "README", 4, QString(), "text/plain"),
        DriveEntry::create("5", "README", 5, QString(), "text/plain"),
    };

    const QVector<BatchItem> items = DriveOperations::downloadItems(entries, tempDir.path());

    ASSERT_EQ(items.size(), 5);
    const QDir dir(tempDir.path());
    EXPECT_EQ(items.at(0).localPath, dir.filePath("notes.txt"));
    EXPECT_EQ(items.at(1).localPath, dir.filePath("notes (1).txt"));
    EXPECT_EQ(items.at(2).localPath, dir.filePath("Notes (2).TXT"));
    EXPECT_EQ(items.at(3).localPath, dir.filePath("README"));
    EXPECT_EQ(items.at(4).localPath, dir.filePath("README (1)"));
}

TEST_F(DriveOperationsTest, DownloadItems_DuplicateOfLongTitleStaysWithinNameLimit)
{
    const QString longTitle = QString(251, QLatin1Char('x')) + QStringLiteral(".txt");
    const QVector<DriveEntry> entries = {
        DriveEntry::create("1", longTitle, 1, QString(), "text/plain"),
        DriveEntry::create("2", longTitle, 2, QString(), "text/plain"),
    };

    const QVector<BatchItem> items = DriveOperations::downloadItems(entries, tempDir.path());

    ASSERT_EQ(items.size(), 2);
    const QString second = QFileInfo(items.at(1).localPath).fileName();
    EXPECT_NE(items.at(0).localPath, items.at(1).localPath);
    EXPECT_EQ(second.size(), 255);
    EXPECT_TRUE(second.endsWith(" (1).txt"));
}

TEST_F(DriveOperationsTest, DeleteItems_IncludeFolders)
{
    const QVector<DriveEntry> entries = {
        DriveEntry::create("1", "Photos", 0, QString(), DriveEntry::folderMimeType()),
        DriveEntry::create("2", "a.txt", 1, QString(), "text/plain"),
    };

    const QVector<BatchItem> items = DriveOperations::deleteItems(entries);
    ASSERT_EQ(items.size(), 2);
    EXPECT_TRUE(items.at(0).isFolder);
    EXPECT_FALSE(items.at(1).isFolder);
}

TEST_F(DriveOperationsTest, UploadAction_MissingLocalFile_FailsBeforeRemoteCall)
{
    const QVector<BatchItem> items = DriveOperations::uploadItems({QDir(tempDir.path()).filePath("missing.txt")});
    ASSERT_EQ(items.size(), 1);
    EXPECT_EQ(items.first().label, QString("missing.txt"));

    RemoteError error;
    const bool ok = DriveOperations::uploadAction(&storage, "root")(items.first(), &error);

    EXPECT_FALSE(ok);
    EXPECT_EQ(error.kind, RemoteError::Validation);
    EXPECT_TRUE(storage.calls().isEmpty());
}

TEST_F(DriveOperationsTest, UploadAction_UploadsIntoParent)
{
    const QString path = QDir(tempDir.path()).filePath("notes.txt");
    ASSERT_TRUE(TestHelpers::writeFile(path, "hello"));
    const QString parent = storage.addFolder("Docs");

    RemoteError error;
    EXPECT_TRUE(DriveOperations::uploadAction(&storage, parent)(DriveOperations::uploadItems({path}).first(), &error));
    EXPECT_FALSE(storage.findChild(parent, "notes.txt").isEmpty());
}

TEST_F(DriveOperationsTest, DownloadAndDeleteActions_UseRemoteId)
{
    const QString id = storage.addFile("a.txt", "root", "content");
    const QVector<DriveEntry> entries = {DriveEntry::create(id, "a.txt", 7, QString(), "text/plain")};

    RemoteError error;
    const BatchItem download = DriveOperations::downloadItems(entries, tempDir.path()).first();
    ASSERT_TRUE(DriveOperations::downloadAction(&storage)(download, &error));
    EXPECT_EQ(TestHelpers::readFile(download.localPath), QByteArray("content"));

    const BatchItem removal = DriveOperations::deleteItems(entries).first();
    ASSERT_TRUE(DriveOperations::deleteAction(&storage)(removal, &error));
    EXPECT_FALSE(storage.contains(id));
}

// ============================================================================
// Summaries
// ============================================================================

TEST_F(DriveOperationsTest, SummaryMessage_Pluralizes)
{
    EXPECT_EQ(DriveOperations::summaryMessage(BatchKind::UploadFiles, 1, 0), QString("Successfully uploaded 1 file"));
    EXPECT_EQ(DriveOperations::summaryMessage(BatchKind::UploadFiles, 2, 0), QString("Successfully uploaded 2 files"));
    EXPECT_EQ(DriveOperations::summaryMessage(BatchKind::Delete, 3, 0), QString("Successfully deleted 3 items"));
    EXPECT_EQ(DriveOperations::summaryMessage(BatchKind::UploadFolder, 4, 0, "photos"),
              QString("Successfully uploaded folder: photos"));
    EXPECT_EQ(DriveOperations::summaryMessage(BatchKind::Download, 1, 0, "/tmp/out"),
              QString("Successfully downloaded 1 file to:\n/tmp/out"));
}

TEST_F(DriveOperationsTest, SummaryMessage_MentionsFailures)
{
    EXPECT_EQ(DriveOperations::summaryMessage(BatchKind::Delete, 2, 1),
              QString("Successfully deleted 2 items\n\n1 item could not be processed."));
}

TEST_F(DriveOperationsTest, Titles)
{
    EXPECT_EQ(DriveOperations::summaryTitle(BatchKind::UploadFiles), QString("Upload Complete"));
    EXPECT_EQ(DriveOperations::summaryTitle(BatchKind::UploadFolder), QString("Upload Complete"));
    EXPECT_EQ(DriveOperations::summaryTitle(BatchKind::Download), QString("Download Complete"));
    EXPECT_EQ(DriveOperations::summaryTitle(BatchKind::Delete), QString("Delete Complete"));
    EXPECT_EQ(DriveOperations::operationTitle(BatchKind::Download), QString("Downloading Files"));
}
