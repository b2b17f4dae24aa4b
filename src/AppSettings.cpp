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

#include "AppSettings.h"

#include <QDir>
#include <QSettings>
#include <QStandardPaths>

#include "Logging.h"

namespace {
constexpr char lastDownloadPathKey[] = "last_download_path";
constexpr char autoRefreshKey[] = "auto_refresh";
constexpr char confirmOperationsKey[] = "confirm_operations";
constexpr char credentialsFileKey[] = "credentials_file";
constexpr char logLevelKey[] = "log_level";
constexpr char windowGeometryKey[] = "window_geometry";
constexpr char defaultLogLevel[] = "INFO";
constexpr char credentialsFileName[] = "mycreds.json";
}

AppSettings::AppSettings(QObject *parent)
    : QObject(parent)
    , m_settings(std::make_unique<QSettings>(QSettings::IniFormat, QSettings::UserScope, "Gdman", "Gdman"))
{
}

AppSettings::AppSettings(const QString &filePath, QObject *parent)
    : QObject(parent)
    , m_settings(std::make_unique<QSettings>(filePath, QSettings::IniFormat))
{
}

AppSettings::~AppSettings() = default;

QString AppSettings::lastDownloadPath() const
{
    return readValue(QLatin1String(lastDownloadPathKey)).toString();
}

void AppSettings::setLastDownloadPath(const QString &path)
{
    const QString cleaned = QDir::cleanPath(path);
    if (cleaned == lastDownloadPath()) {
        return;
    }
    writeValue(QLatin1String(lastDownloadPathKey), cleaned);
    emit lastDownloadPathChanged();
}

bool AppSettings::autoRefresh() const
{
    return readValue(QLatin1String(autoRefreshKey)).toBool();
}

void AppSettings::setAutoRefresh(bool enabled)
{
    if (enabled == autoRefresh()) {
        return;
    }
    writeValue(QLatin1String(autoRefreshKey), enabled);
    emit autoRefreshChanged();
}

bool AppSettings::confirmOperations() const
{
    return readValue(QLatin1String(confirmOperationsKey)).toBool();
}

void AppSettings::setConfirmOperations(bool enabled)
{
    if (enabled == confirmOperations()) {
        return;
    }
    writeValue(QLatin1String(confirmOperationsKey), enabled);
    emit confirmOperationsChanged();
}

QString AppSettings::credentialsFile() const
{
    return readValue(QLatin1String(credentialsFileKey)).toString();
}

void AppSettings::setCredentialsFile(const QString &path)
{
    const QString trimmed = path.trimmed();
    if (trimmed == credentialsFile()) {
        return;
    }
    writeValue(QLatin1String(credentialsFileKey), trimmed);
    emit credentialsFileChanged();
}

QString AppSettings::logLevel() const
{
    return readValue(QLatin1String(logLevelKey)).toString();
}

void AppSettings::setLogLevel(const QString &level)
{
    const QString normalized = level.trimmed().toUpper();
    if (normalized == logLevel()) {
        return;
    }
    writeValue(QLatin1String(logLevelKey), normalized);
    emit logLevelChanged();
}

QRect AppSettings::windowGeometry() const
{
    const QRect geometry = readValue(QLatin1String(windowGeometryKey)).toRect();
    return geometry.isValid() ? geometry : defaultWindowGeometry();
}

void AppSettings::setWindowGeometry(const QRect &geometry)
{
    if (!geometry.isValid() || geometry == windowGeometry()) {
        return;
    }
    writeValue(QLatin1String(windowGeometryKey), geometry);
    emit windowGeometryChanged();
}

QString AppSettings::fileName() const
{
    return m_settings->fileName();
}

/**
 * @brief Restores every key to its default value.
 */
void AppSettings::resetToDefaults()
{
    setLastDownloadPath(defaultDownloadPath());
    setAutoRefresh(true);
    setConfirmOperations(true);
    setCredentialsFile(defaultCredentialsFile());
    setLogLevel(QLatin1String(defaultLogLevel));
    setWindowGeometry(defaultWindowGeometry());
    qCInfo(lcSettings) << "Configuration reset to defaults";
}

/**
 * @brief Returns the default for a configuration key.
 * @param key One of the recognized configuration keys.
 * @return Default value, or an invalid QVariant for unknown keys.
 */
QVariant AppSettings::defaultValue(const QString &key) const
{
    if (key == QLatin1String(lastDownloadPathKey)) {
        return defaultDownloadPath();
    }
    if (key == QLatin1String(autoRefreshKey) || key == QLatin1String(confirmOperationsKey)) {
        return true;
    }
    if (key == QLatin1String(credentialsFileKey)) {
        return defaultCredentialsFile();
    }
    if (key == QLatin1String(logLevelKey)) {
        return QString::fromLatin1(defaultLogLevel);
    }
    if (key == QLatin1String(windowGeometryKey)) {
        return defaultWindowGeometry();
    }
    return QVariant();
}

QString AppSettings::defaultDownloadPath()
{
    const QString downloads = QStandardPaths::writableLocation(QStandardPaths::DownloadLocation);
    return downloads.isEmpty() ? QDir(QDir::homePath()).filePath(QStringLiteral("Downloads")) : downloads;
}

QString AppSettings::defaultCredentialsFile()
{
    const QString dataDir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    return QDir(dataDir.isEmpty() ? QDir::homePath() : dataDir).filePath(QLatin1String(credentialsFileName));
}

QRect AppSettings::defaultWindowGeometry()
{
    return QRect(0, 0, 1000, 700);
}

QVariant AppSettings::readValue(const QString &key) const
{
    return m_settings->value(key, defaultValue(key));
}

bool AppSettings::writeValue(const QString &key, const QVariant &value)
{
    m_settings->setValue(key, value);
    m_settings->sync();
    if (m_settings->status() != QSettings::NoError) {
        qCWarning(lcSettings) << "Failed to save" << key << "to" << m_settings->fileName();
        return false;
    }
    qCDebug(lcSettings) << "Saved" << key;
    return true;
}
