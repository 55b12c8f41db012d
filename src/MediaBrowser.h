#pragma once

#include <QObject>
#include <QSize>
#include <QString>
#include <QUrl>

#include "CancellationToken.h"
#include "MediaTypes.h"
#include "NavigationCursor.h"

class BrowserSettings;
class LoadOrchestrator;
class MediaLoader;
class NotificationModel;

class MediaBrowser : public QObject
{
    Q_OBJECT

    Q_PROPERTY(QString currentPath READ currentPath NOTIFY currentChanged)
    Q_PROPERTY(QUrl currentUrl READ currentUrl NOTIFY currentChanged)
    Q_PROPERTY(bool currentIsVideo READ currentIsVideo NOTIFY currentChanged)
    Q_PROPERTY(QSize currentSize READ currentSize NOTIFY currentChanged)
    Q_PROPERTY(bool busy READ busy NOTIFY busyChanged)
    Q_PROPERTY(bool imagesOnly READ imagesOnly WRITE setImagesOnly NOTIFY imagesOnlyChanged)
    Q_PROPERTY(bool hasNext READ hasNext NOTIFY navigationInfoChanged)
    Q_PROPERTY(bool hasPrevious READ hasPrevious NOTIFY navigationInfoChanged)
    Q_PROPERTY(int currentIndex READ currentIndex NOTIFY navigationInfoChanged)
    Q_PROPERTY(int totalCount READ totalCount NOTIFY navigationInfoChanged)
    Q_PROPERTY(int filteredCount READ filteredCount NOTIFY navigationInfoChanged)

public:
    MediaBrowser(BrowserSettings *settings,
                 NotificationModel *notifications,
                 MediaLoader *loader,
                 QObject *parent = nullptr);

    QString currentPath() const;
    QUrl currentUrl() const;
    bool currentIsVideo() const;
    QSize currentSize() const;
    bool busy() const;

    bool imagesOnly() const;
    void setImagesOnly(bool enabled);

    bool hasNext() const;
    bool hasPrevious() const;
    int currentIndex() const;
    int totalCount() const;
    int filteredCount() const;

    NavigationInfo navigationInfo() const;
    const NavigationCursor &cursor() const;
    LoadOrchestrator *orchestrator() const;

    void setCancellationToken(const CancellationTokenPtr &token);

    Q_INVOKABLE bool next();
    Q_INVOKABLE bool previous();
    Q_INVOKABLE bool open(const QString &path);
    Q_INVOKABLE bool openUrl(const QUrl &url);

signals:
    void currentChanged();
    void busyChanged();
    void imagesOnlyChanged();
    void navigationInfoChanged();

private slots:
    void handleMediaReady(const QString &path, const MediaPayload &payload);
    void applySettings();

private:
    BrowserSettings *m_settings = nullptr;
    NavigationCursor m_cursor;
    LoadOrchestrator *m_orchestrator = nullptr;

    QString m_currentPath;
    MediaPayload m_currentPayload;
};
