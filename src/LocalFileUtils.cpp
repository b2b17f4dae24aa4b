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

#include "LocalFileUtils.h"

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QUrl>

namespace {

void accumulateEntryCounts(const QString &path, LocalFileUtils::EntryCounts &counts)
{
    const QDir dir(path);
    const QFileInfoList entries = dir.entryInfoList(
        QDir::AllEntries | QDir::Hidden | QDir::System | QDir::NoDotAndDotDot,
        QDir::NoSort);
    for (const QFileInfo &entry : entries) {
        if (entry.isDir()) {
            if (entry.isSymLink()) {
                continue;
            }
            counts.folderCount += 1;
            accumulateEntryCounts(entry.absoluteFilePath(), counts);
        } else {
            counts.fileCount += 1;
            counts.totalBytes += entry.size();
        }
    }
}

} // namespace

namespace LocalFileUtils {

bool validateReadablePath(const QString &path, QString *error)
{
    const QFileInfo info(path);
    if (path.isEmpty() || !info.exists()) {
        if (error) {
            *error = QCoreApplication::translate("LocalFileUtils", "File or directory does not exist");
        }
        return false;
    }
    if (!info.isFile() && !info.isDir()) {
        if (error) {
            *error = QCoreApplication::translate("LocalFileUtils", "Path is neither a file nor directory");
        }
        return false;
    }
    if (!info.isReadable()) {
        if (error) {
            *error = QCoreApplication::translate("LocalFileUtils", "No read permission for this path");
        }
        return false;
    }
    return true;
}

EntryCounts countEntries(const QString &path)
{
    EntryCounts counts;
    const QFileInfo info(path);
    if (!info.exists()) {
        return counts;
    }
    if (!info.isDir()) {
        counts.fileCount = 1;
        counts.totalBytes = info.size();
        return counts;
    }
    accumulateEntryCounts(info.absoluteFilePath(), counts);
    return counts;
}

bool ensureDirectory(const QString &path, QString *error)
{
    if (QDir(path).exists()) {
        return true;
    }
    if (!QDir().mkpath(path)) {
        if (error) {
            *error = QCoreApplication::translate("LocalFileUtils", "Cannot create folder %1").arg(path);
        }
        return false;
    }
    return true;
}

/**
 * @brief Converts a QML file URL or a plain path to a local path.
 * @param pathOrUrl "file:///..." URL or local path.
 * @return Cleaned local path, or an empty string for empty input.
 */
QString toLocalPath(const QString &pathOrUrl)
{
    const QString trimmed = pathOrUrl.trimmed();
    if (trimmed.isEmpty()) {
        return QString();
    }
    if (trimmed.startsWith(QLatin1String("file:"))) {
        return QDir::cleanPath(QUrl(trimmed).toLocalFile());
    }
    return QDir::cleanPath(trimmed);
}

QStringList toLocalPaths(const QStringList &pathsOrUrls)
{
    QStringList paths;
    for (const QString &entry : pathsOrUrls) {
        const QString path = toLocalPath(entry);
        if (!path.isEmpty()) {
            paths.append(path);
        }
    }
    return paths;
}

} // namespace LocalFileUtils
