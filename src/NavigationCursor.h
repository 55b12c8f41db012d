#pragma once

#include <QString>

#include <functional>

#include "DateRangeFilter.h"
#include "DirectoryIndex.h"
#include "MediaTypes.h"

class CursorPosition
{
public:
    enum State {
        Unresolved = 0,
        Indexed
    };

    CursorPosition() = default;

    static CursorPosition indexed(int index);
    static CursorPosition unresolved(const QString &path);

    State state() const;
    bool isIndexed() const;
    int index() const;
    QString path() const;

    bool operator==(const CursorPosition &other) const;
    bool operator!=(const CursorPosition &other) const;

private:
    State m_state = Unresolved;
    int m_index = -1;
    QString m_path;
};

/**
 * Position over one DirectoryIndex.
 *
 * Two protocols are offered and must not be mixed within one gesture:
 * - peek/confirm: peek*() never mutate, confirmNavigation() commits a path
 *   once the media behind it is known to load;
 * - eager: navigateNext()/navigatePrevious() move immediately and bypass
 *   any load failure handling.
 */
class NavigationCursor
{
public:
    NavigationCursor() = default;

    const DirectoryIndex &index() const;
    void setIndex(const DirectoryIndex &index);
    DirectoryScanResult rescan(SortOrder order);

    CursorPosition position() const;
    QString currentPath() const;
    int currentIndex() const;

    MediaTypeFilter typeFilter() const;
    void setTypeFilter(MediaTypeFilter filter);
    DateRangeFilter dateFilter() const;
    void setDateFilter(const DateRangeFilter &filter);
    bool filterActive() const;
    bool matchesFilter(const MediaEntry &entry) const;
    int filteredCount() const;

    QString peekNext() const;
    QString peekPrevious() const;
    QString peekNthNext(int steps) const;
    QString peekNthPrevious(int steps) const;
    QString peekNthNextImage(int steps) const;
    QString peekNthPreviousImage(int steps) const;
    QString peekNthNextFiltered(int steps) const;
    QString peekNthPreviousFiltered(int steps) const;

    void confirmNavigation(const QString &path);

    QString navigateNext();
    QString navigatePrevious();

    NavigationInfo navigationInfo() const;

private:
    int stepIndex(NavigationDirection direction, int offset) const;
    QString peekNthMatching(NavigationDirection direction,
                            int steps,
                            const std::function<bool(const MediaEntry &)> &accept) const;

    DirectoryIndex m_index;
    CursorPosition m_position;
    MediaTypeFilter m_typeFilter = MediaTypeFilter::All;
    DateRangeFilter m_dateFilter;
};
