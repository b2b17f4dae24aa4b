#pragma once

#include <QString>
#include <QtGlobal>

namespace FormatUtils {

QString formatFileSize(qint64 bytes);
QString formatDateTime(const QString &isoTimestamp);
QString fileTypeDescription(const QString &mimeType);
QString sanitizeFileName(const QString &fileName);
QString formatDuration(qint64 seconds);
QString itemCountText(int folderCount, int fileCount);

} // namespace FormatUtils
