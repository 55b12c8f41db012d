#pragma once

#include <QObject>
#include <QSet>
#include <QString>
#include <QStringList>

#include "CancellationToken.h"
#include "DirectoryIndex.h"
#include "MaxSkipAttempts.h"
#include "MediaTypes.h"
#include "PrefetchCache.h"

class MediaLoader;
class NavigationCursor;
class SkipAggregator;

class LoadOrigin
{
public:
    enum Type {
        DirectOpen = 0,
        Navigation
    };

    LoadOrigin() = default;

    static LoadOrigin directOpen();
    static LoadOrigin navigation(NavigationDirection direction);

    Type type() const;
    bool isNavigation() const;
    NavigationDirection direction() const;
    int skipAttempts() const;
    QStringList skippedFiles() const;

    void recordSkip(const QString &fileName);

private:
    Type m_type = DirectOpen;
    NavigationDirection m_direction = NavigationDirection::Next;
    int m_skipAttempts = 0;
    QStringList m_skippedFiles;
};

class LoadOrchestrator : public QObject
{
    Q_OBJECT

public:
    enum State {
        Idle = 0,
        Loading
    };
    Q_ENUM(State)

    LoadOrchestrator(NavigationCursor *cursor, MediaLoader *loader, QObject *parent = nullptr);

    State state() const;
    QString tentativeTarget() const;
    LoadOrigin origin() const;
    quint64 currentRequestId() const;

    MaxSkipAttempts maxSkipAttempts() const;
    void setMaxSkipAttempts(MaxSkipAttempts attempts);

    NavigationMode navigationMode() const;
    void setNavigationMode(NavigationMode mode);

    SortOrder sortOrder() const;
    void setSortOrder(SortOrder order);

    void setCancellationToken(const CancellationTokenPtr &token);

    PrefetchCache &prefetchCache();
    const PrefetchCache &prefetchCache() const;

    bool requestNavigation(NavigationDirection direction);
    bool openPath(const QString &path);

signals:
    void stateChanged();
    void mediaReady(const QString &path, const MediaPayload &payload);
    void loadFailed(const QString &path, const QString &message);
    void navigationExhausted(const QStringList &skippedFiles);
    void notificationRequested(const Notification &notification);

private slots:
    void handleLoadFinished(quint64 requestId, const QString &path, const MediaLoadResult &result);
    void handlePrefetchFinished(const QString &path, const MediaLoadResult &result);

private:
    QString peekCandidate(NavigationDirection direction, int steps) const;
    void dispatch(const QString &path);
    void triggerPrefetch();
    void supersedeGesture();
    void returnToIdle();
    void setState(State state);
    void notify(Notification::Kind kind, const QString &messageKey, const QVariantMap &args, const QString &text);

    NavigationCursor *m_cursor = nullptr;
    MediaLoader *m_loader = nullptr;
    SkipAggregator *m_skipAggregator = nullptr;
    CancellationTokenPtr m_cancellationToken;

    State m_state = Idle;
    LoadOrigin m_origin;
    QString m_tentativeTarget;
    quint64 m_generation = 0;
    DirectoryIndex m_pendingIndex;
    bool m_hasPendingIndex = false;

    PrefetchCache m_prefetchCache;
    QSet<QString> m_prefetchInFlight;

    MaxSkipAttempts m_maxSkipAttempts;
    NavigationMode m_navigationMode = NavigationMode::AllMedia;
    SortOrder m_sortOrder = SortOrder::Alphabetical;
};
