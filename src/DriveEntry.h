#pragma once

#include <QJsonObject>
#include <QMetaType>
#include <QString>
#include <QVector>

class DriveEntry
{
public:
    DriveEntry() = default;

    static DriveEntry create(const QString &id,
                             const QString &title,
                             qint64 size,
                             const QString &modifiedTimestamp,
                             const QString &mimeType,
                             const QString &parentId = rootFolderId(),
                             QString *error = nullptr);
    static DriveEntry fromJson(const QJsonObject &object, const QString &fallbackParentId, QString *error = nullptr);

    static QString rootFolderId();
    static QString folderMimeType();
    static bool isFolderMimeType(const QString &mimeType);
    static void sortForListing(QVector<DriveEntry> &entries);

    bool isValid() const;
    QString id() const;
    QString title() const;
    qint64 size() const;
    QString modifiedTimestamp() const;
    QString mimeType() const;
    bool isFolder() const;
    QString parentId() const;

private:
    QString m_id;
    QString m_title;
    qint64 m_size = 0;
    QString m_modifiedTimestamp;
    QString m_mimeType;
    QString m_parentId;
};

Q_DECLARE_METATYPE(DriveEntry)
