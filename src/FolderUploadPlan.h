#pragma once

#include <QString>
#include <QVector>

#include "OperationRunner.h"

class RemoteStorageService;

class FolderUploadPlan
{
public:
    static FolderUploadPlan build(const QString &localFolder, QString *error);

    bool isValid() const;
    QString localRoot() const;
    QString rootName() const;
    QVector<BatchItem> steps() const;
    int fileCount() const;
    int folderCount() const;

    BatchAction action(RemoteStorageService *service, const QString &destinationParentId) const;

    static QString rootKey();

private:
    void appendDirectory(const QString &absolutePath, const QString &key);

    QString m_localRoot;
    QString m_rootName;
    QVector<BatchItem> m_steps;
    int m_fileCount = 0;
    int m_folderCount = 0;
};
