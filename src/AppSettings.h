#pragma once

#include <QObject>
#include <QRect>
#include <QString>
#include <QVariant>

#include <memory>

class QSettings;

class AppSettings : public QObject
{
    Q_OBJECT
    Q_PROPERTY(QString lastDownloadPath READ lastDownloadPath WRITE setLastDownloadPath NOTIFY lastDownloadPathChanged)
    Q_PROPERTY(bool autoRefresh READ autoRefresh WRITE setAutoRefresh NOTIFY autoRefreshChanged)
    Q_PROPERTY(bool confirmOperations READ confirmOperations WRITE setConfirmOperations NOTIFY confirmOperationsChanged)
    Q_PROPERTY(QString credentialsFile READ credentialsFile WRITE setCredentialsFile NOTIFY credentialsFileChanged)
    Q_PROPERTY(QString logLevel READ logLevel WRITE setLogLevel NOTIFY logLevelChanged)
    Q_PROPERTY(QRect windowGeometry READ windowGeometry WRITE setWindowGeometry NOTIFY windowGeometryChanged)

public:
    explicit AppSettings(QObject *parent = nullptr);
    explicit AppSettings(const QString &filePath, QObject *parent = nullptr);
    ~AppSettings() override;

    QString lastDownloadPath() const;
    void setLastDownloadPath(const QString &path);

    bool autoRefresh() const;
    void setAutoRefresh(bool enabled);

    bool confirmOperations() const;
    void setConfirmOperations(bool enabled);

    QString credentialsFile() const;
    void setCredentialsFile(const QString &path);

    QString logLevel() const;
    void setLogLevel(const QString &level);

    QRect windowGeometry() const;
    void setWindowGeometry(const QRect &geometry);

    QString fileName() const;

    Q_INVOKABLE void resetToDefaults();
    Q_INVOKABLE QVariant defaultValue(const QString &key) const;

    static QString defaultDownloadPath();
    static QString defaultCredentialsFile();
    static QRect defaultWindowGeometry();

signals:
    void lastDownloadPathChanged();
    void autoRefreshChanged();
    void confirmOperationsChanged();
    void credentialsFileChanged();
    void logLevelChanged();
    void windowGeometryChanged();

private:
    QVariant readValue(const QString &key) const;
    bool writeValue(const QString &key, const QVariant &value);

    std::unique_ptr<QSettings> m_settings;
};
