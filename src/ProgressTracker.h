#pragma once

#include <QElapsedTimer>
#include <QString>
#include <QStringList>

class ProgressTracker
{
public:
    static constexpr qint64 unknownRemaining = -1;

    explicit ProgressTracker(int totalItems = 0);

    int totalItems() const;
    int completedItems() const;
    QString currentItemLabel() const;
    QStringList errors() const;

    void update(int completed, const QString &label = QString());
    void setCurrentItemLabel(const QString &label);
    void addError(const QString &error);

    qreal percentage() const;
    qint64 elapsedMs() const;
    qint64 estimatedRemainingMs() const;
    qint64 estimatedRemainingMs(qint64 elapsedMs) const;

private:
    int m_totalItems = 0;
    int m_completedItems = 0;
    QString m_currentItemLabel;
    QStringList m_errors;
    QElapsedTimer m_timer;
};
