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

#include "DriveCredentials.h"

#include <QFile>
#include <QFileInfo>
#include <QDir>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSaveFile>
#include <QTimeZone>

#include "Logging.h"

namespace {

struct CredentialConstants {
    static constexpr qint64 expiryMarginSecs = 60;
};

constexpr char clientIdKey[] = "client_id";
constexpr char clientSecretKey[] = "client_secret";
constexpr char refreshTokenKey[] = "refresh_token";
constexpr char accessTokenKey[] = "access_token";
constexpr char tokenExpiryKey[] = "token_expiry";
constexpr char tokenUriKey[] = "token_uri";

} // namespace

QString DriveCredentials::defaultTokenUri()
{
    return QStringLiteral("https://oauth2.googleapis.com/token");
}

/**
 * @brief Reads a credentials file.
 * @param filePath JSON file holding client and token fields.
 * @param error Optional output error message.
 * @return Loaded credentials; check isComplete() before use.
 */
DriveCredentials DriveCredentials::load(const QString &filePath, QString *error)
{
    DriveCredentials credentials;
    QFile file(filePath);
    if (!file.exists()) {
        if (error) {
            *error = QString("Credentials file not found: %1").arg(filePath);
        }
        return credentials;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        if (error) {
            *error = QString("Cannot read credentials file: %1").arg(file.errorString());
        }
        return credentials;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (error) {
            *error = QString("Invalid credentials file: %1").arg(parseError.errorString());
        }
        return credentials;
    }

    const QJsonObject object = doc.object();
    credentials.m_clientId = object.value(clientIdKey).toString();
    credentials.m_clientSecret = object.value(clientSecretKey).toString();
    credentials.m_refreshToken = object.value(refreshTokenKey).toString();
    credentials.m_accessToken = object.value(accessTokenKey).toString();
    const QString expiry = object.value(tokenExpiryKey).toString();
    if (!expiry.isEmpty()) {
        credentials.m_tokenExpiry = QDateTime::fromString(expiry, Qt::ISODate);
        if (credentials.m_tokenExpiry.isValid() && credentials.m_tokenExpiry.timeSpec() == Qt::LocalTime) {
            credentials.m_tokenExpiry.setTimeZone(QTimeZone::utc());
        }
    }
    const QString tokenUri = object.value(tokenUriKey).toString();
    if (!tokenUri.isEmpty()) {
        credentials.m_tokenUri = tokenUri;
    }

    if (!credentials.isComplete() && error) {
        *error = QString("Credentials file is missing client_id, client_secret or refresh_token");
    }
    return credentials;
}

/**
 * @brief Writes the credentials atomically so a refreshed token survives restarts.
 */
bool DriveCredentials::save(const QString &filePath, QString *error) const
{
    QJsonObject object;
    object.insert(clientIdKey, m_clientId);
    object.insert(clientSecretKey, m_clientSecret);
    object.insert(refreshTokenKey, m_refreshToken);
    object.insert(tokenUriKey, m_tokenUri);
    if (!m_accessToken.isEmpty()) {
        object.insert(accessTokenKey, m_accessToken);
    }
    if (m_tokenExpiry.isValid()) {
        object.insert(tokenExpiryKey, m_tokenExpiry.toUTC().toString(Qt::ISODate));
    }

    QDir().mkpath(QFileInfo(filePath).absolutePath());
    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        if (error) {
            *error = QString("Cannot write credentials file: %1").arg(file.errorString());
        }
        return false;
    }
    file.write(QJsonDocument(object).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        if (error) {
            *error = QString("Cannot write credentials file: %1").arg(file.errorString());
        }
        return false;
    }
    file.setPermissions(QFileDevice::ReadOwner | QFileDevice::WriteOwner);
    qCDebug(lcDrive) << "Saved credentials to" << filePath;
    return true;
}

bool DriveCredentials::isComplete() const
{
    return !m_clientId.isEmpty() && !m_clientSecret.isEmpty() && !m_refreshToken.isEmpty();
}

bool DriveCredentials::canRefresh() const
{
    return isComplete() && !m_tokenUri.isEmpty();
}

bool DriveCredentials::isAccessTokenValid(const QDateTime &now) const
{
    if (m_accessToken.isEmpty() || !m_tokenExpiry.isValid()) {
        return false;
    }
    return now.secsTo(m_tokenExpiry) > CredentialConstants::expiryMarginSecs;
}

void DriveCredentials::setAccessToken(const QString &token, const QDateTime &expiry)
{
    m_accessToken = token;
    m_tokenExpiry = expiry.toUTC();
}
