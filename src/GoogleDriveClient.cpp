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

#include "GoogleDriveClient.h"

#include <QDir>
#include <QEventLoop>
#include <QFile>
#include <QFileInfo>
#include <QHttpMultiPart>
#include <QJsonArray>
#include <QJsonDocument>
#include <QMimeDatabase>
#include <QMutexLocker>
#include <QNetworkAccessManager>
#include <QNetworkRequest>
#include <QSaveFile>
#include <QTimer>
#include <QUrlQuery>

#include "Logging.h"

namespace {

struct DriveClientConstants {
    static constexpr int metadataTimeoutMs = 30000;
    static constexpr int transferIdleTimeoutMs = 120000;
    static constexpr int listPageSize = 1000;
    static constexpr int httpUnauthorized = 401;
    static constexpr int httpNotFound = 404;
};

const char *const entryFields = "id,name,mimeType,size,modifiedTime,parents";

QString authorizationHeader(const QString &token)
{
    return QStringLiteral("Bearer %1").arg(token);
}

} // namespace

GoogleDriveClient::GoogleDriveClient(const QString &credentialsFile, QObject *parent)
    : QObject(parent)
    , m_credentialsFile(credentialsFile)
{
}

QString GoogleDriveClient::credentialsFile() const
{
    QMutexLocker locker(&m_mutex);
    return m_credentialsFile;
}

void GoogleDriveClient::setCredentialsFile(const QString &path)
{
    QMutexLocker locker(&m_mutex);
    if (path == m_credentialsFile) {
        return;
    }
    m_credentialsFile = path;
    m_credentials = DriveCredentials();
    m_credentialsLoaded = false;
    qCInfo(lcDrive) << "Credentials file set to" << path;
}

bool GoogleDriveClient::testConnection(RemoteError *error)
{
    QUrl url = filesUrl();
    QUrlQuery query;
    query.addQueryItem("q", "'root' in parents and trashed=false");
    query.addQueryItem("pageSize", "1");
    query.addQueryItem("fields", "files(id)");
    url.setQuery(query);

    const HttpReply reply = authorizedCall(url, [](QNetworkAccessManager &manager, QNetworkRequest &request) {
        return manager.get(request);
    }, false, nullptr, error);
    if (!checkReply(reply, tr("Connection test"), error)) {
        return false;
    }
    qCInfo(lcDrive) << "Connected to Google Drive";
    return true;
}

/**
 * @brief Lists the non-trashed children of a folder, following every result page.
 * @param folderId Remote folder id, "root" for the drive root.
 * @param error Output error.
 * @return Entries in server order; invalid records are skipped.
 */
QVector<DriveEntry> GoogleDriveClient::listChildren(const QString &folderId, RemoteError *error)
{
    QVector<DriveEntry> entries;
    if (folderId.isEmpty()) {
        error->set(RemoteError::Validation, tr("Folder ID cannot be empty"));
        return entries;
    }

    QString pageToken;
    do {
        QUrl url = filesUrl();
        QUrlQuery query;
        query.addQueryItem("q", QStringLiteral("'%1' in parents and trashed=false").arg(folderId));
        query.addQueryItem("pageSize", QString::number(DriveClientConstants::listPageSize));
        query.addQueryItem("fields", QStringLiteral("nextPageToken,files(%1)").arg(entryFields));
        if (!pageToken.isEmpty()) {
            query.addQueryItem("pageToken", pageToken);
        }
        url.setQuery(query);

        const HttpReply reply = authorizedCall(url, [](QNetworkAccessManager &manager, QNetworkRequest &request) {
            return manager.get(request);
        }, false, nullptr, error);
        const QJsonObject page = parseObject(reply, tr("List folder"), error);
        if (error->isSet()) {
            return QVector<DriveEntry>();
        }

        const QJsonArray files = page.value("files").toArray();
        for (const QJsonValue &value : files) {
            QString entryError;
            const DriveEntry entry = DriveEntry::fromJson(value.toObject(), folderId, &entryError);
            if (!entry.isValid()) {
                qCWarning(lcDrive) << "Skipping invalid entry in" << folderId << ":" << entryError;
                continue;
            }
            entries.append(entry);
        }
        pageToken = page.value("nextPageToken").toString();
    } while (!pageToken.isEmpty());

    qCDebug(lcDrive) << "Listed" << entries.size() << "entries in" << folderId;
    return entries;
}

/**
 * @brief Uploads a local file with a multipart request.
 * @param localPath File to upload.
 * @param parentId Destination folder id.
 * @param error Output error.
 * @return Id of the created remote file, or an empty string on failure.
 */
QString GoogleDriveClient::upload(const QString &localPath, const QString &parentId, RemoteError *error)
{
    const QFileInfo info(localPath);
    if (!info.exists() || !info.isFile()) {
        error->set(RemoteError::Validation, tr("File not found: %1").arg(localPath));
        return QString();
    }

    QJsonObject metadata;
    metadata.insert("name", info.fileName());
    metadata.insert("parents", QJsonArray{parentId.isEmpty() ? DriveEntry::rootFolderId() : parentId});
    const QByteArray metadataJson = QJsonDocument(metadata).toJson(QJsonDocument::Compact);
    const QString mimeType = QMimeDatabase().mimeTypeForFile(info).name();

    QUrl url = uploadUrl();
    QUrlQuery query;
    query.addQueryItem("uploadType", "multipart");
    query.addQueryItem("fields", "id");
    url.setQuery(query);

    const HttpReply reply = authorizedCall(url, [localPath, metadataJson, mimeType](QNetworkAccessManager &manager,
                                                                                      QNetworkRequest &request) -> QNetworkReply * {
        auto *multiPart = new QHttpMultiPart(QHttpMultiPart::RelatedType);

        QHttpPart metadataPart;
        metadataPart.setHeader(QNetworkRequest::ContentTypeHeader, "application/json; charset=UTF-8");
        metadataPart.setBody(metadataJson);
        multiPart->append(metadataPart);

        auto *file = new QFile(localPath, multiPart);
        if (!file->open(QIODevice::ReadOnly)) {
            qCWarning(lcDrive) << "Cannot open" << localPath << ":" << file->errorString();
            delete multiPart;
            return nullptr;
        }
        QHttpPart mediaPart;
        mediaPart.setHeader(QNetworkRequest::ContentTypeHeader, mimeType);
        mediaPart.setBodyDevice(file);
        multiPart->append(mediaPart);

        QNetworkReply *networkReply = manager.post(request, multiPart);
        multiPart->setParent(networkReply);
        return networkReply;
    }, true, nullptr, error);

    const QJsonObject created = parseObject(reply, tr("Upload %1").arg(info.fileName()), error);
    if (error->isSet()) {
        return QString();
    }
    const QString id = created.value("id").toString();
    if (id.isEmpty()) {
        error->set(RemoteError::Remote, tr("Upload of %1 returned no file ID").arg(info.fileName()));
        return QString();
    }
    qCInfo(lcDrive) << "Uploaded" << localPath << "as" << id;
    return id;
}

/**
 * @brief Streams a remote file to disk.
 *
 * The target is only replaced once the whole body has been received.
 */
bool GoogleDriveClient::download(const QString &id, const QString &localPath, RemoteError *error)
{
    if (id.isEmpty()) {
        error->set(RemoteError::Validation, tr("File ID cannot be empty"));
        return false;
    }

    const QFileInfo target(localPath);
    if (!QDir().mkpath(target.absolutePath())) {
        error->set(RemoteError::Validation, tr("Cannot create folder: %1").arg(target.absolutePath()));
        return false;
    }

    QSaveFile file(localPath);
    if (!file.open(QIODevice::WriteOnly)) {
        error->set(RemoteError::Validation, tr("Cannot write %1: %2").arg(localPath, file.errorString()));
        return false;
    }

    QUrl url = filesUrl(id);
    QUrlQuery query;
    query.addQueryItem("alt", "media");
    url.setQuery(query);

    const HttpReply reply = authorizedCall(url, [](QNetworkAccessManager &manager, QNetworkRequest &request) {
        return manager.get(request);
    }, true, &file, error);
    if (!checkReply(reply, tr("Download %1").arg(target.fileName()), error)) {
        file.cancelWriting();
        return false;
    }
    if (!file.commit()) {
        error->set(RemoteError::Validation, tr("Cannot write %1: %2").arg(localPath, file.errorString()));
        return false;
    }
    qCInfo(lcDrive) << "Downloaded" << id << "to" << localPath;
    return true;
}

QString GoogleDriveClient::createFolder(const QString &name, const QString &parentId, RemoteError *error)
{
    const QString trimmed = name.trimmed();
    if (trimmed.isEmpty()) {
        error->set(RemoteError::Validation, tr("Folder name cannot be empty"));
        return QString();
    }

    QJsonObject metadata;
    metadata.insert("name", trimmed);
    metadata.insert("mimeType", DriveEntry::folderMimeType());
    metadata.insert("parents", QJsonArray{parentId.isEmpty() ? DriveEntry::rootFolderId() : parentId});
    const QByteArray payload = QJsonDocument(metadata).toJson(QJsonDocument::Compact);

    QUrl url = filesUrl();
    QUrlQuery query;
    query.addQueryItem("fields", "id");
    url.setQuery(query);

    const HttpReply reply = authorizedCall(url, [payload](QNetworkAccessManager &manager, QNetworkRequest &request) {
        request.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");
        return manager.post(request, payload);
    }, false, nullptr, error);
    const QJsonObject created = parseObject(reply, tr("Create folder %1").arg(trimmed), error);
    if (error->isSet()) {
        return QString();
    }
    const QString id = created.value("id").toString();
    if (id.isEmpty()) {
        error->set(RemoteError::Remote, tr("Folder creation returned no ID"));
        return QString();
    }
    qCInfo(lcDrive) << "Created folder" << trimmed << "as" << id;
    return id;
}

bool GoogleDriveClient::remove(const QString &id, RemoteError *error)
{
    if (id.isEmpty()) {
        error->set(RemoteError::Validation, tr("File ID cannot be empty"));
        return false;
    }
    const HttpReply reply = authorizedCall(filesUrl(id), [](QNetworkAccessManager &manager, QNetworkRequest &request) {
        return manager.deleteResource(request);
    }, false, nullptr, error);
    if (!checkReply(reply, tr("Delete"), error)) {
        return false;
    }
    qCInfo(lcDrive) << "Deleted" << id;
    return true;
}

DriveEntry GoogleDriveClient::getInfo(const QString &id, RemoteError *error)
{
    if (id.isEmpty()) {
        error->set(RemoteError::Validation, tr("File ID cannot be empty"));
        return DriveEntry();
    }

    QUrl url = filesUrl(id);
    QUrlQuery query;
    query.addQueryItem("fields", entryFields);
    url.setQuery(query);

    const HttpReply reply = authorizedCall(url, [](QNetworkAccessManager &manager, QNetworkRequest &request) {
        return manager.get(request);
    }, false, nullptr, error);
    const QJsonObject object = parseObject(reply, tr("File info"), error);
    if (error->isSet()) {
        return DriveEntry();
    }

    QString entryError;
    const DriveEntry entry = DriveEntry::fromJson(object, DriveEntry::rootFolderId(), &entryError);
    if (!entry.isValid()) {
        error->set(RemoteError::Remote, entryError);
    }
    return entry;
}

/**
 * @brief Extracts Google's error.message from an error response body.
 */
QString GoogleDriveClient::errorMessageFromBody(const QByteArray &body)
{
    const QJsonDocument doc = QJsonDocument::fromJson(body);
    if (!doc.isObject()) {
        return QString();
    }
    const QJsonValue errorValue = doc.object().value("error");
    if (errorValue.isObject()) {
        return errorValue.toObject().value("message").toString();
    }
    // The token endpoint reports {"error": "invalid_grant", "error_description": ...}.
    const QString description = doc.object().value("error_description").toString();
    return description.isEmpty() ? errorValue.toString() : description;
}

RemoteError::Kind GoogleDriveClient::errorKindForStatus(int httpStatus)
{
    if (httpStatus == 0) {
        return RemoteError::Connectivity;
    }
    if (httpStatus == DriveClientConstants::httpUnauthorized) {
        return RemoteError::Authentication;
    }
    if (httpStatus == DriveClientConstants::httpNotFound) {
        return RemoteError::NotFound;
    }
    return RemoteError::Remote;
}

/**
 * @brief Sends a request with a bearer token, retrying once after a refresh on 401.
 * @param url Target URL.
 * @param send Issues the request on the given manager; may be called twice.
 * @param transfer True for uploads and downloads, which use an inactivity timeout.
 * @param sink Optional device receiving a successful response body.
 * @param error Output error, set when no token could be obtained.
 * @return Raw reply, to be checked by the caller.
 */
GoogleDriveClient::HttpReply GoogleDriveClient::authorizedCall(const QUrl &url,
                                                               const RequestSender &send,
                                                               bool transfer,
                                                               QIODevice *sink,
                                                               RemoteError *error)
{
    HttpReply reply;
    for (int attempt = 0; attempt < 2; ++attempt) {
        const QString token = accessToken(error);
        if (token.isEmpty()) {
            return HttpReply();
        }

        QNetworkRequest request(url);
        request.setRawHeader("Authorization", authorizationHeader(token).toUtf8());
        reply = execute(request, send, transfer, sink);
        if (reply.status != DriveClientConstants::httpUnauthorized || attempt > 0) {
            break;
        }
        qCInfo(lcDrive) << "Access token rejected, refreshing";
        invalidateAccessToken(token);
    }
    return reply;
}

GoogleDriveClient::HttpReply GoogleDriveClient::execute(QNetworkRequest request,
                                                        const RequestSender &send,
                                                        bool transfer,
                                                        QIODevice *sink)
{
    HttpReply result;
    QNetworkAccessManager manager;
    QNetworkReply *reply = send(manager, request);
    if (!reply) {
        result.errorString = tr("Request could not be started");
        return result;
    }

    const int timeoutMs = transfer ? DriveClientConstants::transferIdleTimeoutMs
                                   : DriveClientConstants::metadataTimeoutMs;
    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    QObject::connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    if (transfer) {
        const auto restart = [&timer, timeoutMs]() { timer.start(timeoutMs); };
        QObject::connect(reply, &QNetworkReply::uploadProgress, &timer, restart);
        QObject::connect(reply, &QNetworkReply::downloadProgress, &timer, restart);
    }
    if (sink) {
        QObject::connect(reply, &QNetworkReply::readyRead, &loop, [reply, sink, &result]() {
            const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
            if (status >= 200 && status < 300) {
                sink->write(reply->readAll());
            } else {
                result.body += reply->readAll();
            }
        });
    }
    timer.start(timeoutMs);
    loop.exec();

    if (!reply->isFinished()) {
        result.timedOut = true;
        reply->abort();
    } else {
        result.status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        result.networkError = reply->error();
        result.errorString = reply->errorString();
        const QByteArray remaining = reply->readAll();
        if (sink && result.succeeded()) {
            sink->write(remaining);
        } else {
            result.body += remaining;
        }
    }
    reply->deleteLater();
    return result;
}

bool GoogleDriveClient::checkReply(const HttpReply &reply, const QString &context, RemoteError *error) const
{
    if (error->isSet()) {
        return false;
    }
    if (reply.timedOut) {
        error->set(RemoteError::Connectivity, tr("%1: request timed out").arg(context));
    } else if (reply.status == 0) {
        error->set(RemoteError::Connectivity, tr("%1: %2").arg(context, reply.errorString));
    } else if (!reply.succeeded()) {
        QString message = errorMessageFromBody(reply.body);
        if (message.isEmpty()) {
            message = tr("HTTP %1").arg(reply.status);
        }
        error->set(errorKindForStatus(reply.status), tr("%1: %2").arg(context, message));
    } else {
        return true;
    }
    qCWarning(lcDrive) << error->message;
    return false;
}

QJsonObject GoogleDriveClient::parseObject(const HttpReply &reply, const QString &context, RemoteError *error) const
{
    if (!checkReply(reply, context, error)) {
        return QJsonObject();
    }
    const QJsonDocument doc = QJsonDocument::fromJson(reply.body);
    if (!doc.isObject()) {
        error->set(RemoteError::Remote, tr("%1: unexpected response").arg(context));
        qCWarning(lcDrive) << error->message;
        return QJsonObject();
    }
    return doc.object();
}

QString GoogleDriveClient::accessToken(RemoteError *error)
{
    QMutexLocker locker(&m_mutex);
    if (!loadCredentialsLocked(error)) {
        return QString();
    }
    if (!m_credentials.isAccessTokenValid() && !refreshAccessToken(error)) {
        return QString();
    }
    return m_credentials.accessToken();
}

/**
 * @brief Exchanges the refresh token for a new access token. Called with m_mutex held.
 */
bool GoogleDriveClient::refreshAccessToken(RemoteError *error)
{
    if (!m_credentials.canRefresh()) {
        error->set(RemoteError::Authentication, tr("Credentials in %1 cannot be refreshed").arg(m_credentialsFile));
        qCWarning(lcDrive) << error->message;
        return false;
    }

    QUrlQuery form;
    form.addQueryItem("client_id", m_credentials.clientId());
    form.addQueryItem("client_secret", m_credentials.clientSecret());
    form.addQueryItem("refresh_token", m_credentials.refreshToken());
    form.addQueryItem("grant_type", "refresh_token");
    const QByteArray payload = form.toString(QUrl::FullyEncoded).toUtf8();

    QNetworkRequest request{QUrl(m_credentials.tokenUri())};
    const HttpReply reply = execute(request, [payload](QNetworkAccessManager &manager, QNetworkRequest &tokenRequest) {
        tokenRequest.setHeader(QNetworkRequest::ContentTypeHeader, "application/x-www-form-urlencoded");
        return manager.post(tokenRequest, payload);
    }, false, nullptr);

    RemoteError requestError;
    const QJsonObject object = parseObject(reply, tr("Token refresh"), &requestError);
    const QString token = object.value("access_token").toString();
    if (requestError.isSet() || token.isEmpty()) {
        // Lost connectivity is not a credential problem.
        const RemoteError::Kind kind = requestError.kind == RemoteError::Connectivity
            ? RemoteError::Connectivity
            : RemoteError::Authentication;
        error->set(kind, requestError.isSet() ? requestError.message : tr("Token refresh returned no access token"));
        return false;
    }

    const int expiresIn = object.value("expires_in").toInt();
    m_credentials.setAccessToken(token, QDateTime::currentDateTimeUtc().addSecs(expiresIn));
    QString saveError;
    if (!m_credentials.save(m_credentialsFile, &saveError)) {
        qCWarning(lcDrive) << saveError;
    }
    qCInfo(lcDrive) << "Access token refreshed, valid for" << expiresIn << "seconds";
    return true;
}

void GoogleDriveClient::invalidateAccessToken(const QString &rejectedToken)
{
    QMutexLocker locker(&m_mutex);
    // Another thread may already have replaced it.
    if (m_credentials.accessToken() == rejectedToken) {
        m_credentials.setAccessToken(QString(), QDateTime());
    }
}

bool GoogleDriveClient::loadCredentialsLocked(RemoteError *error)
{
    if (m_credentialsLoaded) {
        return true;
    }
    QString loadError;
    DriveCredentials credentials = DriveCredentials::load(m_credentialsFile, &loadError);
    if (!credentials.isComplete()) {
        error->set(RemoteError::Authentication, loadError.isEmpty()
            ? tr("Credentials file %1 is incomplete").arg(m_credentialsFile)
            : loadError);
        qCWarning(lcDrive) << error->message;
        return false;
    }
    m_credentials = credentials;
    m_credentialsLoaded = true;
    qCInfo(lcDrive) << "Loaded credentials from" << m_credentialsFile;
    return true;
}

QUrl GoogleDriveClient::filesUrl(const QString &path)
{
    QString url = QStringLiteral("https://www.googleapis.com/drive/v3/files");
    if (!path.isEmpty()) {
        url += QLatin1Char('/') + QString::fromUtf8(QUrl::toPercentEncoding(path));
    }
    return QUrl(url);
}

QUrl GoogleDriveClient::uploadUrl()
{
    return QUrl(QStringLiteral("https://www.googleapis.com/upload/drive/v3/files"));
}
