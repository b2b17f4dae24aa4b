#pragma once

#include <QAbstractListModel>
#include <QPointer>
#include <QStringList>
#include <QThreadPool>
#include <QVariantMap>
#include <QVector>

#include "DriveEntry.h"
#include "DriveOperations.h"
#include "NavigationState.h"

class AppSettings;
class CancellableOperation;
class OperationRunner;
class QThread;
class RemoteStorageService;

class DriveBrowserModel : public QAbstractListModel
{
    Q_OBJECT
    Q_PROPERTY(QString currentFolderId READ currentFolderId NOTIFY locationChanged)
    Q_PROPERTY(QString currentFolderName READ currentFolderName NOTIFY locationChanged)
    Q_PROPERTY(bool canGoBack READ canGoBack NOTIFY locationChanged)
    Q_PROPERTY(bool loading READ loading NOTIFY loadingChanged)
    Q_PROPERTY(bool connected READ connected NOTIFY connectedChanged)
    Q_PROPERTY(QString statusText READ statusText NOTIFY statusTextChanged)
    Q_PROPERTY(QString itemCountText READ itemCountText NOTIFY itemCountTextChanged)
    Q_PROPERTY(int selectedCount READ selectedCount NOTIFY selectionChanged)
    Q_PROPERTY(bool operationInProgress READ operationInProgress NOTIFY operationInProgressChanged)
    Q_PROPERTY(QString operationTitle READ operationTitle NOTIFY operationInProgressChanged)
    Q_PROPERTY(QString operationLabel READ operationLabel NOTIFY operationProgressChanged)
    Q_PROPERTY(qreal operationPercent READ operationPercent NOTIFY operationProgressChanged)
    Q_PROPERTY(QString operationRemainingText READ operationRemainingText NOTIFY operationProgressChanged)

public:
    enum Role {
        IdRole = Qt::UserRole + 1,
        TitleRole,
        IsFolderRole,
        SizeRole,
        SizeTextRole,
        ModifiedRole,
        TypeDescriptionRole,
        SelectedRole
    };

    explicit DriveBrowserModel(RemoteStorageService *service, AppSettings *settings, QObject *parent = nullptr);
    ~DriveBrowserModel() override;

    QString currentFolderId() const;
    QString currentFolderName() const;
    bool canGoBack() const;
    bool loading() const;
    bool connected() const;
    QString statusText() const;
    QString itemCountText() const;
    int selectedCount() const;
    bool operationInProgress() const;
    QString operationTitle() const;
    QString operationLabel() const;
    qreal operationPercent() const;
    QString operationRemainingText() const;

    DriveEntry entryAt(int row) const;
    QVector<DriveEntry> selectedEntries() const;

    int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    QVariant data(const QModelIndex &index, int role = Qt::DisplayRole) const override;
    QHash<int, QByteArray> roleNames() const override;

    Q_INVOKABLE void connectToDrive();
    Q_INVOKABLE void refresh();
    Q_INVOKABLE void activate(int row);
    Q_INVOKABLE void goBack();
    Q_INVOKABLE void goHome();

    Q_INVOKABLE void select(int row, bool multi);
    Q_INVOKABLE bool isSelected(int row) const;
    Q_INVOKABLE void selectAll();
    Q_INVOKABLE void clearSelection();
    Q_INVOKABLE QVariantList selectedRows() const;

    Q_INVOKABLE QVariantMap startUploadFiles(const QStringList &paths);
    Q_INVOKABLE QVariantMap startUploadFolder(const QString &folderPath);
    Q_INVOKABLE QVariantMap startDownloadSelected(const QString &targetDir);
    Q_INVOKABLE QVariantMap deleteSelected(bool confirmed);
    Q_INVOKABLE void cancelOperation();

    Q_INVOKABLE QVariantMap createFolder(const QString &name);
    Q_INVOKABLE void requestInfo(int row);
    Q_INVOKABLE QVariantMap localSummary(const QString &path) const;

signals:
    void locationChanged();
    void loadingChanged();
    void connectedChanged();
    void statusTextChanged();
    void itemCountTextChanged();
    void selectionChanged();
    void operationInProgressChanged();
    void operationProgressChanged();

    void operationFinished(QVariantMap result);
    void operationSummary(const QString &title, const QString &message);
    void errorOccurred(const QString &title, const QString &message);
    void fileActivated(const QString &id, const QString &title);
    void infoReady(QVariantMap info);
    void folderCreated(const QString &id, const QString &name);

private:
    QVariantMap startBatch(DriveOperations::BatchKind kind,
                           const QVector<BatchItem> &items,
                           BatchAction action,
                           const QString &detail);
    void finishBatch(DriveOperations::BatchKind kind, const QString &detail, const QVariantMap &result);
    void applyEntries(const QVector<DriveEntry> &entries);
    void navigationChanged();
    void setLoading(bool loading);
    void setConnected(bool connected);
    void setStatusText(const QString &text);
    void setOperationProgress(const QString &label, qreal percent);
    void notifySelectionChanged();
    bool autoRefreshEnabled() const;

    RemoteStorageService *m_service = nullptr;
    QPointer<AppSettings> m_settings;
    NavigationState m_navigation;
    QVector<DriveEntry> m_entries;
    QStringList m_selectedIds;
    QString m_itemCountText;
    QString m_statusText;
    bool m_loading = false;
    bool m_connected = false;
    int m_generation = 0;
    QString m_listedFolderId;
    QThreadPool m_pool;

    QThread *m_operationThread = nullptr;
    CancellableOperation *m_operation = nullptr;
    QPointer<OperationRunner> m_operationRunner;
    QString m_operationLabel;
    qreal m_operationPercent = 0.0;
    QString m_operationRemainingText;
};
