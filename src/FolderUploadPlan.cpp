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

#include "FolderUploadPlan.h"

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QHash>

#include <memory>

#include "RemoteStorageService.h"

namespace {

QString childKey(const QString &parentKey, const QString &name)
{
    if (parentKey == FolderUploadPlan::rootKey()) {
        return name;
    }
    return parentKey + QLatin1Char('/') + name;
}

QString translate(const char *text)
{
    return QCoreApplication::translate("FolderUploadPlan", text);
}

} // namespace

/**
 * @brief Builds the ordered create-folder and upload-file steps for a local tree.
 * @param localFolder Local directory to mirror remotely.
 * @param error Optional output error message.
 * @return A valid plan, or an invalid one when the folder cannot be read.
 *
 * Steps are in pre-order: a directory's remote folder is created before any
 * of its children. Within a directory the files come first, then each
 * subdirectory followed by its own subtree, both in name order.
 */
FolderUploadPlan FolderUploadPlan::build(const QString &localFolder, QString *error)
{
    FolderUploadPlan plan;
    const QFileInfo info(localFolder);
    if (localFolder.isEmpty() || !info.exists() || !info.isDir()) {
        if (error) {
            *error = translate("Folder not found: %1").arg(localFolder);
        }
        return plan;
    }
    if (!info.isReadable()) {
        if (error) {
            *error = translate("No read permission for %1").arg(localFolder);
        }
        return plan;
    }

    plan.m_localRoot = QDir::cleanPath(info.absoluteFilePath());
    plan.m_rootName = QFileInfo(plan.m_localRoot).fileName();
    if (plan.m_rootName.isEmpty()) {
        plan.m_rootName = plan.m_localRoot;
    }

    BatchItem rootStep;
    rootStep.verb = translate("Creating folder");
    rootStep.label = plan.m_rootName;
    rootStep.localPath = plan.m_localRoot;
    rootStep.key = rootKey();
    rootStep.isFolder = true;
    plan.m_steps.append(rootStep);
    plan.m_folderCount = 1;

    plan.appendDirectory(plan.m_localRoot, rootKey());
    return plan;
}

void FolderUploadPlan::appendDirectory(const QString &absolutePath, const QString &key)
{
    const QDir dir(absolutePath);
    const QFileInfoList files = dir.entryInfoList(QDir::Files | QDir::Hidden | QDir::NoDotAndDotDot, QDir::Name);
    for (const QFileInfo &file : files) {
        BatchItem step;
        step.verb = translate("Uploading");
        step.key = childKey(key, file.fileName());
        step.label = step.key;
        step.parentKey = key;
        step.localPath = file.absoluteFilePath();
        m_steps.append(step);
        m_fileCount += 1;
    }

    // Symlinked directories are skipped so a link cycle cannot recurse forever.
    const QFileInfoList folders = dir.entryInfoList(QDir::Dirs | QDir::Hidden | QDir::NoDotAndDotDot | QDir::NoSymLinks,
                                                    QDir::Name);
    for (const QFileInfo &folder : folders) {
        BatchItem step;
        step.verb = translate("Creating folder");
        step.key = childKey(key, folder.fileName());
        step.label = step.key;
        step.parentKey = key;
        step.localPath = folder.absoluteFilePath();
        step.isFolder = true;
        m_steps.append(step);
        m_folderCount += 1;
        appendDirectory(folder.absoluteFilePath(), step.key);
    }
}

bool FolderUploadPlan::isValid() const
{
    return !m_steps.isEmpty();
}

QString FolderUploadPlan::localRoot() const
{
    return m_localRoot;
}

QString FolderUploadPlan::rootName() const
{
    return m_rootName;
}

QVector<BatchItem> FolderUploadPlan::steps() const
{
    return m_steps;
}

int FolderUploadPlan::fileCount() const
{
    return m_fileCount;
}

int FolderUploadPlan::folderCount() const
{
    return m_folderCount;
}

QString FolderUploadPlan::rootKey()
{
    return QStringLiteral(".");
}

/**
 * @brief Returns the per-step action, resolving parents through the folders created so far.
 * @param service Remote service used for every step.
 * @param destinationParentId Remote folder receiving the top-level folder.
 * @return Action suitable for an OperationRunner over steps().
 */
BatchAction FolderUploadPlan::action(RemoteStorageService *service, const QString &destinationParentId) const
{
    auto folderIds = std::make_shared<QHash<QString, QString>>();
    return [service, destinationParentId, folderIds](const BatchItem &item, RemoteError *error) {
        QString parentId = destinationParentId;
        if (!item.parentKey.isEmpty()) {
            parentId = folderIds->value(item.parentKey);
            if (parentId.isEmpty()) {
                error->set(RemoteError::Validation,
                           translate("Parent folder %1 was not created").arg(item.parentKey));
                return false;
            }
        }

        if (item.isFolder) {
            QString name = QFileInfo(item.localPath).fileName();
            if (name.isEmpty()) {
                name = item.label;
            }
            const QString folderId = service->createFolder(name, parentId, error);
            if (folderId.isEmpty()) {
                return false;
            }
            folderIds->insert(item.key, folderId);
            return true;
        }

        if (!QFileInfo(item.localPath).isFile()) {
            error->set(RemoteError::Validation, translate("File not found: %1").arg(item.localPath));
            return false;
        }
        return !service->upload(item.localPath, parentId, error).isEmpty();
    };
}
