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

#include "OperationRunner.h"

#include <QStringList>

#include <exception>

#include "CancellableOperation.h"
#include "Logging.h"

namespace {
struct RunnerConstants {
    static constexpr int emptyCount = 0;
    static constexpr int singleStep = 1;
    static constexpr qreal fullPercent = 100.0;
};
} // namespace

/**
 * @brief Creates a batch runner for an ordered list of work items.
 * @param operation Status and cancellation holder, must outlive start().
 * @param items Work items, processed strictly in this order.
 * @param action Per-item remote action.
 * @param parent Parent QObject for ownership.
 */
OperationRunner::OperationRunner(CancellableOperation *operation,
                                 const QVector<BatchItem> &items,
                                 BatchAction action,
                                 QObject *parent)
    : QObject(parent)
    , m_operation(operation)
    , m_items(items)
    , m_action(std::move(action))
{
}

void OperationRunner::setAutoRefresh(bool enabled)
{
    m_autoRefresh = enabled;
}

bool OperationRunner::autoRefresh() const
{
    return m_autoRefresh;
}

/**
 * @brief Percentage shown while item index is in flight.
 * @param index Zero-based index of the item being started.
 * @param total Number of items in the batch.
 * @return index / total * 100, the share of items processed before this one.
 */
qreal OperationRunner::startedPercent(int index, int total)
{
    if (total <= RunnerConstants::emptyCount) {
        return 0.0;
    }
    return static_cast<qreal>(index) / static_cast<qreal>(total) * RunnerConstants::fullPercent;
}

/**
 * @brief Runs the batch and emits completion signals.
 *
 * Cancellation is checked before each item. Per-item failures are recorded
 * and the batch continues; a fatal error stops it immediately.
 */
void OperationRunner::start()
{
    QVariantMap result;
    result.insert("ok", false);

    const int total = m_items.size();
    result.insert("total", total);
    if (!m_operation || !m_action || total <= RunnerConstants::emptyCount) {
        result.insert("error", tr("Nothing to process"));
        emit finished(result);
        return;
    }

    qCInfo(lcOperations) << "Starting" << m_operation->title() << "with" << total << "items";

    int attempted = RunnerConstants::emptyCount;
    int succeeded = RunnerConstants::emptyCount;
    int failed = RunnerConstants::emptyCount;
    bool fatal = false;
    QString fatalError;
    QStringList errors;

    for (int index = 0; index < total; ++index) {
        if (m_operation->isCancelled()) {
            break;
        }

        const BatchItem &item = m_items.at(index);
        m_operation->reportStatus(itemLabel(item, index, total), startedPercent(index, total));
        attempted += RunnerConstants::singleStep;

        RemoteError error;
        if (runItem(item, &error)) {
            succeeded += RunnerConstants::singleStep;
            m_operation->recordCompleted(attempted);
            continue;
        }

        const QString message = itemError(item, error);
        m_operation->recordCompleted(attempted);
        if (error.isFatal()) {
            fatal = true;
            fatalError = message;
            qCCritical(lcOperations) << "Fatal error, stopping" << m_operation->title() << ":" << message;
            break;
        }
        failed += RunnerConstants::singleStep;
        errors.append(message);
        m_operation->recordError(message);
        qCWarning(lcOperations) << message;
    }

    const bool cancelled = m_operation->isCancelled();
    const int skipped = total - attempted;
    const qreal finalPercent = startedPercent(attempted, total);

    if (fatal) {
        m_operation->reportStatus(tr("Stopped: %1").arg(fatalError), finalPercent);
    } else if (cancelled) {
        m_operation->reportStatus(tr("Cancelled after %1 of %2 items").arg(attempted).arg(total), finalPercent);
    } else {
        m_operation->reportStatus(tr("Finished: %1 succeeded, %2 failed").arg(succeeded).arg(failed), finalPercent);
    }

    result.insert("attempted", attempted);
    result.insert("succeeded", succeeded);
    result.insert("failed", failed);
    result.insert("skipped", skipped);
    result.insert("errors", errors);
    result.insert("fatal", fatal);
    if (cancelled) {
        result.insert("cancelled", true);
    }
    if (fatal) {
        result.insert("error", fatalError);
    } else if (!errors.isEmpty()) {
        result.insert("error", errors.first());
    } else if (cancelled) {
        result.insert("error", tr("Operation cancelled"));
    }
    result.insert("ok", failed == RunnerConstants::emptyCount && !cancelled && !fatal);

    qCInfo(lcOperations) << m_operation->title() << "done:" << succeeded << "succeeded," << failed << "failed,"
                         << skipped << "skipped" << (cancelled ? "(cancelled)" : "");

    if (succeeded > RunnerConstants::emptyCount && !cancelled && !fatal) {
        emit completed(result);
        if (m_autoRefresh) {
            emit refreshRequested();
        }
    }
    emit finished(result);
}

bool OperationRunner::runItem(const BatchItem &item, RemoteError *error)
{
    try {
        return m_action(item, error);
    } catch (const std::exception &e) {
        error->set(RemoteError::Remote, QString::fromLocal8Bit(e.what()));
        return false;
    }
}

QString OperationRunner::itemLabel(const BatchItem &item, int index, int total) const
{
    return tr("%1: %2 (%3/%4)").arg(item.verb, item.label).arg(index + RunnerConstants::singleStep).arg(total);
}

QString OperationRunner::itemError(const BatchItem &item, const RemoteError &error) const
{
    const QString reason = error.message.isEmpty() ? tr("Operation failed") : error.message;
    return tr("%1: %2").arg(item.label, reason);
}
