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

#include "FormatUtils.h"

#include <QCoreApplication>
#include <QDateTime>
#include <QHash>
#include <QStringList>
#include <QTimeZone>

namespace {

struct FormatConstants {
    static constexpr qreal unitStep = 1024.0;
    static constexpr int maxFileNameLength = 255;
    static constexpr int maxExtensionLength = 32;
    static constexpr int timestampPrefixLength = 16;
    static constexpr qint64 secondsPerMinute = 60;
    static constexpr qint64 secondsPerHour = 3600;
};

QString translate(const char *text)
{
    return QCoreApplication::translate("FormatUtils", text);
}

const QHash<QString, QString> &knownTypes()
{
    static const QHash<QString, QString> types = {
        {QStringLiteral("application/pdf"), QStringLiteral("PDF Document")},
        {QStringLiteral("application/msword"), QStringLiteral("Word Document")},
        {QStringLiteral("application/vnd.openxmlformats-officedocument.wordprocessingml.document"), QStringLiteral("Word Document")},
        {QStringLiteral("application/vnd.ms-excel"), QStringLiteral("Excel Spreadsheet")},
        {QStringLiteral("application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"), QStringLiteral("Excel Spreadsheet")},
        {QStringLiteral("application/vnd.ms-powerpoint"), QStringLiteral("PowerPoint Presentation")},
        {QStringLiteral("application/vnd.openxmlformats-officedocument.presentationml.presentation"), QStringLiteral("PowerPoint Presentation")},
        {QStringLiteral("text/plain"), QStringLiteral("Text File")},
        {QStringLiteral("text/html"), QStringLiteral("HTML File")},
        {QStringLiteral("text/css"), QStringLiteral("CSS File")},
        {QStringLiteral("text/javascript"), QStringLiteral("JavaScript File")},
        {QStringLiteral("application/json"), QStringLiteral("JSON File")},
        {QStringLiteral("application/xml"), QStringLiteral("XML File")},
        {QStringLiteral("text/csv"), QStringLiteral("CSV File")},
        {QStringLiteral("image/jpeg"), QStringLiteral("JPEG Image")},
        {QStringLiteral("image/jpg"), QStringLiteral("JPEG Image")},
        {QStringLiteral("image/png"), QStringLiteral("PNG Image")},
        {QStringLiteral("image/gif"), QStringLiteral("GIF Image")},
        {QStringLiteral("image/bmp"), QStringLiteral("BMP Image")},
        {QStringLiteral("image/svg+xml"), QStringLiteral("SVG Image")},
        {QStringLiteral("image/tiff"), QStringLiteral("TIFF Image")},
        {QStringLiteral("audio/mpeg"), QStringLiteral("MP3 Audio")},
        {QStringLiteral("audio/wav"), QStringLiteral("WAV Audio")},
        {QStringLiteral("audio/ogg"), QStringLiteral("OGG Audio")},
        {QStringLiteral("audio/flac"), QStringLiteral("FLAC Audio")},
        {QStringLiteral("video/mp4"), QStringLiteral("MP4 Video")},
        {QStringLiteral("video/avi"), QStringLiteral("AVI Video")},
        {QStringLiteral("video/mov"), QStringLiteral("MOV Video")},
        {QStringLiteral("video/wmv"), QStringLiteral("WMV Video")},
        {QStringLiteral("video/mkv"), QStringLiteral("MKV Video")},
        {QStringLiteral("application/zip"), QStringLiteral("ZIP Archive")},
        {QStringLiteral("application/x-rar-compressed"), QStringLiteral("RAR Archive")},
        {QStringLiteral("application/x-tar"), QStringLiteral("TAR Archive")},
        {QStringLiteral("application/gzip"), QStringLiteral("GZIP Archive")},
        {QStringLiteral("application/x-7z-compressed"), QStringLiteral("7Z Archive")},
        {QStringLiteral("application/vnd.google-apps.folder"), QStringLiteral("Folder")},
        {QStringLiteral("application/vnd.google-apps.document"), QStringLiteral("Google Doc")},
        {QStringLiteral("application/vnd.google-apps.spreadsheet"), QStringLiteral("Google Sheet")},
        {QStringLiteral("application/vnd.google-apps.presentation"), QStringLiteral("Google Slides")},
        {QStringLiteral("application/vnd.google-apps.drawing"), QStringLiteral("Google Drawing")},
        {QStringLiteral("application/vnd.google-apps.form"), QStringLiteral("Google Form")},
    };
    return types;
}

QString titleCase(const QString &text)
{
    QString result = text.toLower();
    bool capitalizeNext = true;
    for (QChar &ch : result) {
        if (ch.isLetter()) {
            if (capitalizeNext) {
                ch = ch.toUpper();
            }
            capitalizeNext = false;
        } else {
            capitalizeNext = true;
        }
    }
    return result;
}

bool isInvalidFileNameChar(QChar ch)
{
    static const QString invalid = QStringLiteral("<>:\"/\\|?*");
    return ch.unicode() < 0x20 || invalid.contains(ch);
}

} // namespace

namespace FormatUtils {

QString formatFileSize(qint64 bytes)
{
    if (bytes <= 0) {
        return QStringLiteral("0 B");
    }

    static const QStringList units = {
        QStringLiteral("B"), QStringLiteral("KB"), QStringLiteral("MB"),
        QStringLiteral("GB"), QStringLiteral("TB"), QStringLiteral("PB"),
    };
    qreal size = static_cast<qreal>(bytes);
    for (const QString &unit : units) {
        if (size < FormatConstants::unitStep) {
            if (unit == units.first()) {
                return QStringLiteral("%1 %2").arg(bytes).arg(unit);
            }
            return QStringLiteral("%1 %2").arg(size, 0, 'f', 1).arg(unit);
        }
        size /= FormatConstants::unitStep;
    }
    return QStringLiteral("%1 %2").arg(size * FormatConstants::unitStep, 0, 'f', 1).arg(units.last());
}

/**
 * @brief Formats a Drive ISO-8601 timestamp for display in local time.
 * @param isoTimestamp Timestamp such as 2024-03-01T10:15:30.000Z.
 * @return yyyy-MM-dd HH:mm, "-" for empty input, or a trimmed fallback for malformed input.
 */
QString formatDateTime(const QString &isoTimestamp)
{
    if (isoTimestamp.isEmpty()) {
        return QStringLiteral("-");
    }

    QDateTime dateTime = QDateTime::fromString(isoTimestamp, Qt::ISODateWithMs);
    if (!dateTime.isValid()) {
        dateTime = QDateTime::fromString(isoTimestamp, Qt::ISODate);
    }
    if (!dateTime.isValid()) {
        return isoTimestamp.left(FormatConstants::timestampPrefixLength).replace(QLatin1Char('T'), QLatin1Char(' '));
    }
    if (dateTime.timeSpec() == Qt::LocalTime) {
        // Timestamps without an offset are UTC.
        dateTime.setTimeZone(QTimeZone::utc());
    }
    return dateTime.toLocalTime().toString(QStringLiteral("yyyy-MM-dd HH:mm"));
}

QString fileTypeDescription(const QString &mimeType)
{
    if (mimeType.isEmpty()) {
        return translate("Unknown");
    }

    const auto known = knownTypes().constFind(mimeType);
    if (known != knownTypes().constEnd()) {
        return known.value();
    }

    const int slash = mimeType.indexOf(QLatin1Char('/'));
    if (slash > 0) {
        const QString family = mimeType.left(slash);
        if (family == QLatin1String("image") || family == QLatin1String("audio")
            || family == QLatin1String("video") || family == QLatin1String("text")) {
            return titleCase(family) + QLatin1String(" File");
        }
    }

    QString fallback = mimeType;
    fallback.remove(QStringLiteral("application/"));
    fallback.replace(QLatin1Char('/'), QLatin1Char(' '));
    return titleCase(fallback);
}

/**
 * @brief Makes a remote title usable as a local file name.
 * @param fileName Remote title.
 * @return Name without reserved characters, at most 255 characters long.
 */
QString sanitizeFileName(const QString &fileName)
{
    QString sanitized = fileName;
    for (QChar &ch : sanitized) {
        if (isInvalidFileNameChar(ch)) {
            ch = QLatin1Char('_');
        }
    }

    int start = 0;
    int end = sanitized.size();
    const auto trimmable = [](QChar ch) { return ch == QLatin1Char('.') || ch == QLatin1Char(' '); };
    while (start < end && trimmable(sanitized.at(start))) {
        ++start;
    }
    while (end > start && trimmable(sanitized.at(end - 1))) {
        --end;
    }
    sanitized = sanitized.mid(start, end - start);

    if (sanitized.isEmpty()) {
        return QStringLiteral("untitled");
    }

    if (sanitized.size() > FormatConstants::maxFileNameLength) {
        const int dot = sanitized.lastIndexOf(QLatin1Char('.'));
        // An overlong suffix is not an extension worth keeping.
        const bool hasExtension = dot > 0 && sanitized.size() - dot <= FormatConstants::maxExtensionLength;
        const QString extension = hasExtension ? sanitized.mid(dot) : QString();
        const QString stem = hasExtension ? sanitized.left(dot) : sanitized;
        sanitized = stem.left(FormatConstants::maxFileNameLength - extension.size()) + extension;
    }
    return sanitized;
}

QString formatDuration(qint64 seconds)
{
    if (seconds < 0) {
        return translate("Unknown");
    }
    if (seconds < FormatConstants::secondsPerMinute) {
        return QStringLiteral("%1s").arg(seconds);
    }
    if (seconds < FormatConstants::secondsPerHour) {
        return QStringLiteral("%1m %2s")
            .arg(seconds / FormatConstants::secondsPerMinute)
            .arg(seconds % FormatConstants::secondsPerMinute);
    }
    return QStringLiteral("%1h %2m")
        .arg(seconds / FormatConstants::secondsPerHour)
        .arg((seconds % FormatConstants::secondsPerHour) / FormatConstants::secondsPerMinute);
}

QString itemCountText(int folderCount, int fileCount)
{
    const QString folders = folderCount == 1 ? translate("1 folder") : translate("%1 folders").arg(folderCount);
    const QString files = fileCount == 1 ? translate("1 file") : translate("%1 files").arg(fileCount);
    if (folderCount > 0 && fileCount > 0) {
        return folders + QLatin1String(", ") + files;
    }
    if (folderCount > 0) {
        return folders;
    }
    if (fileCount > 0) {
        return files;
    }
    return translate("Empty");
}

} // namespace FormatUtils
