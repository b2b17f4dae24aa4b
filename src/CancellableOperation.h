#pragma once

#include <QAtomicInt>
#include <QMutex>
#include <QObject>
#include <QString>

#include "ProgressTracker.h"

class CancellableOperation : public QObject
{
    Q_OBJECT

public:
    static constexpr qreal noPercent = -1.0;

    explicit CancellableOperation(const QString &title, int totalItems, QObject *parent = nullptr);

    QString title() const;
    int totalItems() const;

    bool isCancelled() const;
    ProgressTracker status() const;

    void reportStatus(const QString &label, qreal percent = noPercent);
    void recordCompleted(int completedItems);
    void recordError(const QString &error);

public slots:
    void requestCancel();

signals:
    void statusReported(const QString &label, qreal percent);
    void cancelRequested();

private:
    void publishStatus(const QString &label, qreal percent);

    const QString m_title;
    QAtomicInt m_cancelled = 0;
    mutable QMutex m_mutex;
    ProgressTracker m_tracker;
    qreal m_lastPercent = 0.0;
};
