/************************************************************************\

    Gdman - Google Drive manager
    Copyright (C) 2026 Jango73

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.

\************************************************************************/

#include "DriveOperations.h"

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QSet>

#include "FormatUtils.h"
#include "RemoteStorageService.h"

namespace {

QString translate(const char *text)
{
    return QCoreApplication::translate("DriveOperations", text);
}

struct DownloadNameConstants {
    static constexpr int maxFileNameLength = 255;
    static constexpr int maxExtensionLength = 32;
};

// Appends " (n)" before the extension until the name is unused in this batch.
QString uniqueFileName(const QString &fileName, QSet<QString> &usedNames)
{
    const int dot = fileName.lastIndexOf(QLatin1Char('.'));
    const bool hasExtension = dot > 0 && fileName.size() - dot <= DownloadNameConstants::maxExtensionLength;
    const QString stem = hasExtension ? fileName.left(dot) : fileName;
    const QString extension = hasExtension ? fileName.mid(dot) : QString();

    QString candidate = fileName;
    for (int suffix = 1; usedNames.contains(candidate.toLower()); ++suffix) {
        const QString marker = QStringLiteral(" (%1)").arg(suffix);
        const int stemLength = DownloadNameConstants::maxFileNameLength - marker.size() - extension.size();
        candidate = stem.left(stemLength) + marker + extension;
    }
    usedNames.insert(candidate.toLower());
    return candidate;
}

} // namespace

namespace DriveOperations {

QVector<BatchItem> uploadItems(const QStringList &localPaths)
{
    QVector<BatchItem> items;
    items.reserve(localPaths.size());
    for (const QString &path : localPaths) {
        BatchItem item;
        item.verb = translate("Uploading");
        item.label = QFileInfo(path).fileName();
        if (item.label.isEmpty()) {
            item.label = path;
        }
        item.localPath = path;
        items.append(item);
    }
    return items;
}

/**
 * @brief Uploads one local file into a remote folder.
 * @param service Remote service used for the call.
 * @param parentId Remote folder receiving the files.
 * @return Action that validates the local file before any remote call.
 */
BatchAction uploadAction(RemoteStorageService *service, const QString &parentId)
{
    return [service, parentId](const BatchItem &item, RemoteError *error) {
        const QFileInfo info(item.localPath);
        if (!info.exists() || !info.isFile()) {
            error->set(RemoteError::Validation, translate("File not found: %1").arg(item.localPath));
            return false;
        }
        return !service->upload(item.localPath, parentId, error).isEmpty();
    };
}

QVector<BatchItem> downloadItems(const QVector<DriveEntry> &entries, const QString &targetDir)
{
    QVector<BatchItem> items;
    QSet<QString> usedNames;
    const QDir dir(targetDir);
    for (const DriveEntry &entry : entries) {
        if (entry.isFolder()) {
            continue;
        }
        BatchItem item;
        item.verb = translate("Downloading");
        item.label = entry.title();
        item.remoteId = entry.id();
        item.localPath = dir.filePath(uniqueFileName(FormatUtils::sanitizeFileName(entry.title()), usedNames));
        items.append(item);
    }
    return items;
}

BatchAction downloadAction(RemoteStorageService *service)
{
    return [service](const BatchItem &item, RemoteError *error) {
        return service->download(item.remoteId, item.localPath, error);
    };
}

QVector<BatchItem> deleteItems(const QVector<DriveEntry> &entries)
{
    QVector<BatchItem> items;
    items.reserve(entries.size());
    for (const DriveEntry &entry : entries) {
        BatchItem item;
        item.verb = translate("Deleting");
        item.label = entry.title();
        item.remoteId = entry.id();
        item.isFolder = entry.isFolder();
        items.append(item);
    }
    return items;
}

BatchAction deleteAction(RemoteStorageService *service)
{
    return [service](const BatchItem &item, RemoteError *error) {
        return service->remove(item.remoteId, error);
    };
}

QString operationTitle(BatchKind kind)
{
    switch (kind) {
    case BatchKind::UploadFiles:
        return translate("Uploading Files");
    case BatchKind::UploadFolder:
        return translate("Uploading Folder");
    case BatchKind::Download:
        return translate("Downloading Files");
    case BatchKind::Delete:
        return translate("Deleting Items");
    }
    return QString();
}

QString summaryTitle(BatchKind kind)
{
    switch (kind) {
    case BatchKind::UploadFiles:
    case BatchKind::UploadFolder:
        return translate("Upload Complete");
    case BatchKind::Download:
        return translate("Download Complete");
    case BatchKind::Delete:
        return translate("Delete Complete");
    }
    return QString();
}

QString pluralize(int count, const QString &singular, const QString &plural)
{
    return QStringLiteral("%1 %2").arg(count).arg(count == 1 ? singular : plural);
}

/**
 * @brief Formats the completion summary shown after a successful batch.
 * @param kind Batch kind.
 * @param succeeded Number of items that succeeded.
 * @param failed Number of items that failed.
 * @param detail Folder name for folder uploads, target folder for downloads.
 * @return Human readable summary.
 */
QString summaryMessage(BatchKind kind, int succeeded, int failed, const QString &detail)
{
    QString message;
    switch (kind) {
    case BatchKind::UploadFiles:
        message = translate("Successfully uploaded %1")
            .arg(pluralize(succeeded, translate("file"), translate("files")));
        break;
    case BatchKind::UploadFolder:
        message = translate("Successfully uploaded folder: %1").arg(detail);
        break;
    case BatchKind::Download:
        message = translate("Successfully downloaded %1 to:\n%2")
            .arg(pluralize(succeeded, translate("file"), translate("files")), detail);
        break;
    case BatchKind::Delete:
        message = translate("Successfully deleted %1")
            .arg(pluralize(succeeded, translate("item"), translate("items")));
        break;
    }
    if (failed > 0) {
        message += QLatin1String("\n\n")
            + translate("%1 could not be processed.")
                  .arg(pluralize(failed, translate("item"), translate("items")));
    }
    return message;
}

} // namespace DriveOperations
