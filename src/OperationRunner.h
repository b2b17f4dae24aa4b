#pragma once

#include <QObject>
#include <QString>
#include <QVariantMap>
#include <QVector>

#include <functional>

#include "RemoteStorageService.h"

class CancellableOperation;

struct BatchItem {
    QString verb;
    QString label;
    QString remoteId;
    QString localPath;
    // Folder uploads only: relative path of this step and of its parent directory.
    QString key;
    QString parentKey;
    bool isFolder = false;
};

using BatchAction = std::function<bool(const BatchItem &item, RemoteError *error)>;

class OperationRunner : public QObject
{
    Q_OBJECT

public:
    explicit OperationRunner(CancellableOperation *operation,
                             const QVector<BatchItem> &items,
                             BatchAction action,
                             QObject *parent = nullptr);

    void setAutoRefresh(bool enabled);
    bool autoRefresh() const;

    static qreal startedPercent(int index, int total);

public slots:
    void start();

signals:
    void completed(QVariantMap summary);
    void refreshRequested();
    void finished(QVariantMap result);

private:
    bool runItem(const BatchItem &item, RemoteError *error);
    QString itemLabel(const BatchItem &item, int index, int total) const;
    QString itemError(const BatchItem &item, const RemoteError &error) const;

    CancellableOperation *m_operation = nullptr;
    QVector<BatchItem> m_items;
    BatchAction m_action;
    bool m_autoRefresh = false;
};
