#pragma once

#include <QDateTime>
#include <QString>

/**
 * @brief OAuth client and token material stored in the credentials file.
 */
class DriveCredentials
{
public:
    static DriveCredentials load(const QString &filePath, QString *error = nullptr);
    bool save(const QString &filePath, QString *error = nullptr) const;

    static QString defaultTokenUri();

    bool isComplete() const;
    bool canRefresh() const;
    bool isAccessTokenValid(const QDateTime &now = QDateTime::currentDateTimeUtc()) const;

    QString clientId() const { return m_clientId; }
    QString clientSecret() const { return m_clientSecret; }
    QString refreshToken() const { return m_refreshToken; }
    QString accessToken() const { return m_accessToken; }
    QDateTime tokenExpiry() const { return m_tokenExpiry; }
    QString tokenUri() const { return m_tokenUri; }

    void setClientId(const QString &value) { m_clientId = value; }
    void setClientSecret(const QString &value) { m_clientSecret = value; }
    void setRefreshToken(const QString &value) { m_refreshToken = value; }
    void setAccessToken(const QString &token, const QDateTime &expiry);
    void setTokenUri(const QString &value) { m_tokenUri = value; }

private:
    QString m_clientId;
    QString m_clientSecret;
    QString m_refreshToken;
    QString m_accessToken;
    QDateTime m_tokenExpiry;
    QString m_tokenUri = defaultTokenUri();
};
