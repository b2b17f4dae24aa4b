#pragma once

#include <QByteArray>
#include <QJsonObject>
#include <QMutex>
#include <QNetworkReply>
#include <QObject>
#include <QString>
#include <QUrl>

#include <functional>

#include "DriveCredentials.h"
#include "RemoteStorageService.h"

class QIODevice;
class QNetworkAccessManager;
class QNetworkRequest;

/**
 * @brief Google Drive v3 REST implementation of RemoteStorageService.
 *
 * Calls block the calling thread on a local event loop and are meant to be
 * issued from worker threads. Token state is shared between threads.
 */
class GoogleDriveClient : public QObject, public RemoteStorageService
{
    Q_OBJECT

public:
    explicit GoogleDriveClient(const QString &credentialsFile, QObject *parent = nullptr);

    QString credentialsFile() const;
    void setCredentialsFile(const QString &path);

    bool testConnection(RemoteError *error) override;
    QVector<DriveEntry> listChildren(const QString &folderId, RemoteError *error) override;
    QString upload(const QString &localPath, const QString &parentId, RemoteError *error) override;
    bool download(const QString &id, const QString &localPath, RemoteError *error) override;
    QString createFolder(const QString &name, const QString &parentId, RemoteError *error) override;
    bool remove(const QString &id, RemoteError *error) override;
    DriveEntry getInfo(const QString &id, RemoteError *error) override;

    static QString errorMessageFromBody(const QByteArray &body);
    static RemoteError::Kind errorKindForStatus(int httpStatus);

private:
    struct HttpReply {
        int status = 0;
        QByteArray body;
        bool timedOut = false;
        QNetworkReply::NetworkError networkError = QNetworkReply::NoError;
        QString errorString;

        bool succeeded() const { return !timedOut && status >= 200 && status < 300; }
    };

    using RequestSender = std::function<QNetworkReply *(QNetworkAccessManager &, QNetworkRequest &)>;

    HttpReply authorizedCall(const QUrl &url, const RequestSender &send, bool transfer, QIODevice *sink, RemoteError *error);
    HttpReply execute(QNetworkRequest request, const RequestSender &send, bool transfer, QIODevice *sink);
    bool checkReply(const HttpReply &reply, const QString &context, RemoteError *error) const;
    QJsonObject parseObject(const HttpReply &reply, const QString &context, RemoteError *error) const;

    QString accessToken(RemoteError *error);
    bool refreshAccessToken(RemoteError *error);
    void invalidateAccessToken(const QString &rejectedToken);
    bool loadCredentialsLocked(RemoteError *error);

    static QUrl filesUrl(const QString &path = QString());
    static QUrl uploadUrl();

    mutable QMutex m_mutex;
    QString m_credentialsFile;
    DriveCredentials m_credentials;
    bool m_credentialsLoaded = false;
};
