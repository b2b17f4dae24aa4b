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

#include "Logging.h"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QMutexLocker>
#include <QStringList>
#include <QTextStream>

#include <cstdio>

Q_LOGGING_CATEGORY(lcApp, "gdman.app")
Q_LOGGING_CATEGORY(lcDrive, "gdman.drive")
Q_LOGGING_CATEGORY(lcOperations, "gdman.operations")
Q_LOGGING_CATEGORY(lcNavigation, "gdman.navigation")
Q_LOGGING_CATEGORY(lcSettings, "gdman.settings")

namespace {

struct LogSink {
    QMutex mutex;
    QFile file;
};

LogSink &sink()
{
    static LogSink instance;
    return instance;
}

const char *levelName(QtMsgType type)
{
    switch (type) {
    case QtDebugMsg:
        return "DEBUG";
    case QtInfoMsg:
        return "INFO";
    case QtWarningMsg:
        return "WARNING";
    case QtCriticalMsg:
        return "ERROR";
    case QtFatalMsg:
        return "CRITICAL";
    }
    return "INFO";
}

void writeMessage(QtMsgType type, const QMessageLogContext &context, const QString &message)
{
    const QString category = context.category ? QString::fromLatin1(context.category) : QStringLiteral("default");
    const QString line = QStringLiteral("%1 - %2 - %3: %4\n")
        .arg(QDateTime::currentDateTime().toString(Qt::ISODateWithMs),
             QString::fromLatin1(levelName(type)),
             category,
             message);
    const QByteArray bytes = line.toUtf8();

    LogSink &target = sink();
    QMutexLocker locker(&target.mutex);
    std::fputs(bytes.constData(), stderr);
    if (target.file.isOpen()) {
        target.file.write(bytes);
        target.file.flush();
    }
}

} // namespace

namespace Logging {

/**
 * @brief Routes Qt messages to stderr and to an appended log file.
 * @param logFilePath Log file to append to; stderr only when empty.
 * @return True when the log file is open, false otherwise.
 */
bool install(const QString &logFilePath)
{
    bool fileOpen = false;
    {
        LogSink &target = sink();
        QMutexLocker locker(&target.mutex);
        if (target.file.isOpen()) {
            target.file.close();
        }
        if (!logFilePath.isEmpty()) {
            QDir().mkpath(QFileInfo(logFilePath).absolutePath());
            target.file.setFileName(logFilePath);
            fileOpen = target.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text);
        }
    }
    qInstallMessageHandler(writeMessage);
    return fileOpen;
}

QString normalizeLevel(const QString &level)
{
    const QString upper = level.trimmed().toUpper();
    if (upper == QLatin1String("WARN")) {
        return QStringLiteral("WARNING");
    }
    static const QStringList known = {
        QStringLiteral("DEBUG"),
        QStringLiteral("INFO"),
        QStringLiteral("WARNING"),
        QStringLiteral("ERROR"),
        QStringLiteral("CRITICAL"),
    };
    return known.contains(upper) ? upper : QString();
}

/**
 * @brief Builds QLoggingCategory filter rules for the gdman categories.
 * @param level One of DEBUG, INFO, WARNING, ERROR or CRITICAL.
 * @return Filter rules text, INFO rules for unknown levels.
 */
QString filterRulesForLevel(const QString &level)
{
    QString normalized = normalizeLevel(level);
    if (normalized.isEmpty()) {
        normalized = QStringLiteral("INFO");
    }

    const bool debug = normalized == QLatin1String("DEBUG");
    const bool info = debug || normalized == QLatin1String("INFO");
    const bool warning = info || normalized == QLatin1String("WARNING");
    const auto flag = [](bool enabled) {
        return enabled ? QStringLiteral("true") : QStringLiteral("false");
    };

    // ERROR and CRITICAL both map to Qt's critical level, which stays enabled.
    QStringList rules;
    rules << QStringLiteral("gdman.*.debug=%1").arg(flag(debug));
    rules << QStringLiteral("gdman.*.info=%1").arg(flag(info));
    rules << QStringLiteral("gdman.*.warning=%1").arg(flag(warning));
    rules << QStringLiteral("gdman.*.critical=true");
    return rules.join(QLatin1Char('\n'));
}

/**
 * @brief Applies a textual log level to all gdman categories.
 * @param level Requested level, case-insensitive.
 * @return True when the level was recognized, false when INFO was used instead.
 */
bool applyLevel(const QString &level)
{
    const bool known = !normalizeLevel(level).isEmpty();
    QLoggingCategory::setFilterRules(filterRulesForLevel(level));
    if (!known) {
        qCWarning(lcApp) << "Unknown log level" << level << "- using INFO";
    }
    return known;
}

} // namespace Logging
