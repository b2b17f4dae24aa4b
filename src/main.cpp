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

#include <QDir>
#include <QGuiApplication>
#include <QQmlApplicationEngine>
#include <QQmlContext>
#include <QQuickWindow>
#include <QStandardPaths>

#include "AppSettings.h"
#include "DriveBrowserModel.h"
#include "GoogleDriveClient.h"
#include "Logging.h"

int main(int argc, char *argv[])
{
    QGuiApplication app(argc, argv);
    app.setOrganizationName("Gdman");
    app.setApplicationName("Gdman");

    const QString dataDir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    QDir().mkpath(dataDir);
    const QString logFile = QDir(dataDir).filePath("gdman.log");
    if (!Logging::install(logFile)) {
        qCWarning(lcApp) << "Cannot open log file" << logFile << "logging to stderr only";
    }

    AppSettings settings;
    Logging::applyLevel(settings.logLevel());
    QObject::connect(&settings, &AppSettings::logLevelChanged, &settings, [&settings]() {
        Logging::applyLevel(settings.logLevel());
    });
    qCInfo(lcApp) << "Starting, settings in" << settings.fileName();

    GoogleDriveClient client(settings.credentialsFile());
    QObject::connect(&settings, &AppSettings::credentialsFileChanged, &client, [&settings, &client]() {
        client.setCredentialsFile(settings.credentialsFile());
    });

    DriveBrowserModel driveModel(&client, &settings);

    QQmlApplicationEngine engine;
    engine.rootContext()->setContextProperty("appSettings", &settings);
    engine.rootContext()->setContextProperty("driveModel", &driveModel);
    const QUrl url(u"qrc:/Gdman/qml/App/Main.qml"_qs);
    QObject::connect(
        &engine,
        &QQmlApplicationEngine::objectCreated,
        &app,
        [url](QObject *obj, const QUrl &objUrl) {
            if (!obj && url == objUrl) {
                QCoreApplication::exit(-1);
            }
        },
        Qt::QueuedConnection);

    engine.load(url);
    if (engine.rootObjects().isEmpty()) {
        return -1;
    }

    auto *window = qobject_cast<QQuickWindow *>(engine.rootObjects().constFirst());
    if (window) {
        window->setGeometry(settings.windowGeometry());
        QObject::connect(&app, &QCoreApplication::aboutToQuit, &settings, [window, &settings]() {
            settings.setWindowGeometry(window->geometry());
        });
    }

    driveModel.connectToDrive();
    const int code = app.exec();
    qCInfo(lcApp) << "Exiting with code" << code;
    return code;
}
