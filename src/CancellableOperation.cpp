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

#include "CancellableOperation.h"

#include <QMetaObject>
#include <QMutexLocker>
#include <QThread>

#include "Logging.h"

namespace {
struct OperationConstants {
    static constexpr int notCancelled = 0;
    static constexpr int cancelled = 1;
    static constexpr qreal zeroPercent = 0.0;
    static constexpr qreal fullPercent = 100.0;
};
} // namespace

/**
 * @brief Creates the status and cancellation holder of one batch job.
 * @param title Human readable operation title.
 * @param totalItems Number of work items, fixed for the lifetime of the operation.
 * @param parent Parent QObject, normally living on the GUI thread.
 */
CancellableOperation::CancellableOperation(const QString &title, int totalItems, QObject *parent)
    : QObject(parent)
    , m_title(title)
    , m_tracker(totalItems)
{
}

QString CancellableOperation::title() const
{
    return m_title;
}

int CancellableOperation::totalItems() const
{
    QMutexLocker locker(&m_mutex);
    return m_tracker.totalItems();
}

/**
 * @brief Sets the cancellation flag. The flag is never reset.
 */
void CancellableOperation::requestCancel()
{
    if (m_cancelled.testAndSetOrdered(OperationConstants::notCancelled, OperationConstants::cancelled)) {
        qCInfo(lcOperations) << "Cancellation requested for" << m_title;
        emit cancelRequested();
    }
}

bool CancellableOperation::isCancelled() const
{
    return m_cancelled.loadAcquire() != OperationConstants::notCancelled;
}

/**
 * @brief Returns a snapshot of the progress counters.
 * @return Copy of the tracker taken under the status lock.
 */
ProgressTracker CancellableOperation::status() const
{
    QMutexLocker locker(&m_mutex);
    return m_tracker;
}

/**
 * @brief Records the current activity and notifies listeners on the operation thread.
 * @param label Description of the current activity.
 * @param percent Explicit percentage, or noPercent to keep the previous value.
 *
 * Percentages are clamped to [0, 100] and never move backwards. When called
 * from a worker thread the notification is queued to the thread owning the
 * operation, so listeners never run on the worker.
 */
void CancellableOperation::reportStatus(const QString &label, qreal percent)
{
    qreal published = noPercent;
    {
        QMutexLocker locker(&m_mutex);
        m_tracker.setCurrentItemLabel(label);
        if (percent >= OperationConstants::zeroPercent) {
            const qreal bounded = qBound(OperationConstants::zeroPercent, percent, OperationConstants::fullPercent);
            m_lastPercent = qMax(m_lastPercent, bounded);
            published = m_lastPercent;
        }
    }

    if (QThread::currentThread() == thread()) {
        publishStatus(label, published);
        return;
    }
    QMetaObject::invokeMethod(this, [this, label, published]() {
        publishStatus(label, published);
    }, Qt::QueuedConnection);
}

void CancellableOperation::recordCompleted(int completedItems)
{
    QMutexLocker locker(&m_mutex);
    m_tracker.update(completedItems);
}

void CancellableOperation::recordError(const QString &error)
{
    QMutexLocker locker(&m_mutex);
    m_tracker.addError(error);
}

void CancellableOperation::publishStatus(const QString &label, qreal percent)
{
    emit statusReported(label, percent);
}
