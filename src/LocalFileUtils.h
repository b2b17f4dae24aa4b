#pragma once

#include <QString>
#include <QStringList>
#include <QtGlobal>

namespace LocalFileUtils {

struct EntryCounts {
    int fileCount = 0;
    int folderCount = 0;
    qint64 totalBytes = 0;
};

bool validateReadablePath(const QString &path, QString *error);
EntryCounts countEntries(const QString &path);
bool ensureDirectory(const QString &path, QString *error);
QString toLocalPath(const QString &pathOrUrl);
QStringList toLocalPaths(const QStringList &pathsOrUrls);

} // namespace LocalFileUtils
