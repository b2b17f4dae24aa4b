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

#include "DriveEntry.h"

#include <QCollator>
#include <QCoreApplication>
#include <QJsonArray>

#include <algorithm>

namespace {
constexpr char rootId[] = "root";
constexpr char folderType[] = "application/vnd.google-apps.folder";
}

/**
 * @brief Builds a validated entry snapshot.
 * @param id Remote identifier, must not be empty.
 * @param title Display name, must not be empty.
 * @param size Size in bytes, forced to 0 for folders.
 * @param modifiedTimestamp ISO-8601 modification time or empty.
 * @param mimeType Remote mime type, may be empty.
 * @param parentId Parent folder identifier, root when empty.
 * @param error Optional output error message.
 * @return A valid entry, or an invalid one when validation fails.
 */
DriveEntry DriveEntry::create(const QString &id,
                              const QString &title,
                              qint64 size,
                              const QString &modifiedTimestamp,
                              const QString &mimeType,
                              const QString &parentId,
                              QString *error)
{
    if (id.isEmpty()) {
        if (error) {
            *error = QCoreApplication::translate("DriveEntry", "File ID cannot be empty");
        }
        return DriveEntry();
    }
    if (title.isEmpty()) {
        if (error) {
            *error = QCoreApplication::translate("DriveEntry", "File title cannot be empty");
        }
        return DriveEntry();
    }

    DriveEntry entry;
    entry.m_id = id;
    entry.m_title = title;
    entry.m_mimeType = mimeType;
    entry.m_size = isFolderMimeType(mimeType) ? 0 : qMax<qint64>(0, size);
    entry.m_modifiedTimestamp = modifiedTimestamp;
    entry.m_parentId = parentId.isEmpty() ? rootFolderId() : parentId;
    return entry;
}

/**
 * @brief Builds an entry from a Drive v3 file resource.
 * @param object JSON file resource.
 * @param fallbackParentId Parent used when the resource lists no parents.
 * @param error Optional output error message.
 * @return A valid entry, or an invalid one when validation fails.
 */
DriveEntry DriveEntry::fromJson(const QJsonObject &object, const QString &fallbackParentId, QString *error)
{
    const QJsonArray parents = object.value(QStringLiteral("parents")).toArray();
    const QString parentId = parents.isEmpty() ? fallbackParentId : parents.first().toString();
    // Drive reports int64 fields as decimal strings.
    const qint64 size = object.value(QStringLiteral("size")).toString().toLongLong();
    return create(object.value(QStringLiteral("id")).toString(),
                  object.value(QStringLiteral("name")).toString(),
                  size,
                  object.value(QStringLiteral("modifiedTime")).toString(),
                  object.value(QStringLiteral("mimeType")).toString(),
                  parentId,
                  error);
}

QString DriveEntry::rootFolderId()
{
    return QString::fromLatin1(rootId);
}

QString DriveEntry::folderMimeType()
{
    return QString::fromLatin1(folderType);
}

bool DriveEntry::isFolderMimeType(const QString &mimeType)
{
    return mimeType == QLatin1String(folderType);
}

/**
 * @brief Orders entries folders first, then by case-insensitive title.
 * @param entries Entries to sort in place.
 */
void DriveEntry::sortForListing(QVector<DriveEntry> &entries)
{
    QCollator collator;
    collator.setCaseSensitivity(Qt::CaseInsensitive);
    std::stable_sort(entries.begin(), entries.end(), [&collator](const DriveEntry &left, const DriveEntry &right) {
        if (left.isFolder() != right.isFolder()) {
            return left.isFolder();
        }
        return collator.compare(left.title(), right.title()) < 0;
    });
}

bool DriveEntry::isValid() const
{
    return !m_id.isEmpty() && !m_title.isEmpty();
}

QString DriveEntry::id() const
{
    return m_id;
}

QString DriveEntry::title() const
{
    return m_title;
}

qint64 DriveEntry::size() const
{
    return m_size;
}

QString DriveEntry::modifiedTimestamp() const
{
    return m_modifiedTimestamp;
}

QString DriveEntry::mimeType() const
{
    return m_mimeType;
}

bool DriveEntry::isFolder() const
{
    return isFolderMimeType(m_mimeType);
}

QString DriveEntry::parentId() const
{
    return m_parentId;
}
