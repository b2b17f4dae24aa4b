#pragma once

#include <QString>
#include <QStringList>
#include <QVector>

#include "DriveEntry.h"
#include "OperationRunner.h"

class RemoteStorageService;

namespace DriveOperations {

enum class BatchKind {
    UploadFiles,
    UploadFolder,
    Download,
    Delete
};

QVector<BatchItem> uploadItems(const QStringList &localPaths);
BatchAction uploadAction(RemoteStorageService *service, const QString &parentId);

QVector<BatchItem> downloadItems(const QVector<DriveEntry> &entries, const QString &targetDir);
BatchAction downloadAction(RemoteStorageService *service);

QVector<BatchItem> deleteItems(const QVector<DriveEntry> &entries);
BatchAction deleteAction(RemoteStorageService *service);

QString operationTitle(BatchKind kind);
QString summaryTitle(BatchKind kind);
QString summaryMessage(BatchKind kind, int succeeded, int failed, const QString &detail = QString());
QString pluralize(int count, const QString &singular, const QString &plural);

} // namespace DriveOperations
