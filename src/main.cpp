
/************************************************************************\

    Lumio - Media browser
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

#include <QGuiApplication>
#include <QQmlApplicationEngine>
#include <QQmlContext>

#include "BrowserSettings.h"
#include "CancellationToken.h"
#include "MediaBrowser.h"
#include "MediaLoader.h"
#include "NotificationModel.h"

int main(int argc, char *argv[])
{
    QGuiApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("Lumio"));
    QCoreApplication::setApplicationName(QStringLiteral("Lumio"));

    qRegisterMetaType<MediaPayload>();
    qRegisterMetaType<MediaLoadResult>();
    qRegisterMetaType<Notification>();

    const CancellationTokenPtr shutdownToken = CancellationTokenPtr::create();
    QObject::connect(&app, &QCoreApplication::aboutToQuit, &app, [shutdownToken]() {
        shutdownToken->cancel();
    });

    BrowserSettings browserSettings;
    NotificationModel notificationModel;
    ThreadedMediaLoader mediaLoader;
    MediaBrowser mediaBrowser(&browserSettings, &notificationModel, &mediaLoader);
    mediaBrowser.setCancellationToken(shutdownToken);

    QQmlApplicationEngine engine;
    engine.rootContext()->setContextProperty("browserSettings", &browserSettings);
    engine.rootContext()->setContextProperty("notificationModel", &notificationModel);
    engine.rootContext()->setContextProperty("mediaBrowser", &mediaBrowser);
    const QUrl url(QStringLiteral("qrc:/Lumio/qml/Main.qml"));
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

    const QStringList arguments = app.arguments();
    const QString startPath = arguments.size() > 1 ? arguments.at(1) : browserSettings.lastOpenedPath();
    mediaBrowser.open(startPath);

    return app.exec();
}
