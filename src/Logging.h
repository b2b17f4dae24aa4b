#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(lcApp)
Q_DECLARE_LOGGING_CATEGORY(lcDrive)
Q_DECLARE_LOGGING_CATEGORY(lcOperations)
Q_DECLARE_LOGGING_CATEGORY(lcNavigation)
Q_DECLARE_LOGGING_CATEGORY(lcSettings)

namespace Logging {

bool install(const QString &logFilePath);
bool applyLevel(const QString &level);
QString normalizeLevel(const QString &level);
QString filterRulesForLevel(const QString &level);

} // namespace Logging
