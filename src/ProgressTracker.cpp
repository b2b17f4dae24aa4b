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

#include "ProgressTracker.h"

namespace {
struct ProgressConstants {
    static constexpr int emptyCount = 0;
    static constexpr qreal zeroPercent = 0.0;
    static constexpr qreal fullPercent = 100.0;
};
} // namespace

ProgressTracker::ProgressTracker(int totalItems)
    : m_totalItems(qMax(ProgressConstants::emptyCount, totalItems))
{
    m_timer.start();
}

int ProgressTracker::totalItems() const
{
    return m_totalItems;
}

int ProgressTracker::completedItems() const
{
    return m_completedItems;
}

QString ProgressTracker::currentItemLabel() const
{
    return m_currentItemLabel;
}

QStringList ProgressTracker::errors() const
{
    return m_errors;
}

/**
 * @brief Records progress, keeping the completed count monotonic and bounded.
 * @param completed Items fully processed so far.
 * @param label Current item label, left unchanged when empty.
 */
void ProgressTracker::update(int completed, const QString &label)
{
    const int bounded = qBound(ProgressConstants::emptyCount, completed, m_totalItems);
    m_completedItems = qMax(m_completedItems, bounded);
    if (!label.isEmpty()) {
        m_currentItemLabel = label;
    }
}

void ProgressTracker::setCurrentItemLabel(const QString &label)
{
    m_currentItemLabel = label;
}

void ProgressTracker::addError(const QString &error)
{
    m_errors.append(error);
}

qreal ProgressTracker::percentage() const
{
    if (m_totalItems <= ProgressConstants::emptyCount) {
        return ProgressConstants::zeroPercent;
    }
    return static_cast<qreal>(m_completedItems) / static_cast<qreal>(m_totalItems) * ProgressConstants::fullPercent;
}

qint64 ProgressTracker::elapsedMs() const
{
    return m_timer.elapsed();
}

qint64 ProgressTracker::estimatedRemainingMs() const
{
    return estimatedRemainingMs(elapsedMs());
}

/**
 * @brief Estimates remaining time from the average rate so far.
 * @param elapsedMs Time spent since the tracker started.
 * @return Remaining milliseconds, or unknownRemaining before the first completed item.
 */
qint64 ProgressTracker::estimatedRemainingMs(qint64 elapsedMs) const
{
    if (m_completedItems <= ProgressConstants::emptyCount || elapsedMs <= 0) {
        return unknownRemaining;
    }
    const qreal rate = static_cast<qreal>(m_completedItems) / static_cast<qreal>(elapsedMs);
    const int remainingItems = m_totalItems - m_completedItems;
    return static_cast<qint64>(static_cast<qreal>(remainingItems) / rate);
}
