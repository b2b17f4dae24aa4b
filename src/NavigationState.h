#pragma once

#include <QPair>
#include <QString>
#include <QVector>

class NavigationState
{
public:
    using Location = QPair<QString, QString>;

    NavigationState();

    QString currentFolderId() const;
    QString currentFolderName() const;
    QVector<Location> history() const;
    bool canGoBack() const;
    bool isAtRoot() const;

    void navigateInto(const QString &folderId, const QString &folderName);
    bool goBack();
    void goHome();

    static QString rootFolderName();

private:
    QString m_currentFolderId;
    QString m_currentFolderName;
    QVector<Location> m_history;
};
