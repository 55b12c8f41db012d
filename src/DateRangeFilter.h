#pragma once

#include <QDateTime>

#include "MediaTypes.h"

enum class DateFilterField {
    Modified = 0,
    Created
};

// Inclusive date bounds on one timestamp of a media entry; an invalid bound is open.
class DateRangeFilter
{
public:
    DateRangeFilter() = default;
    DateRangeFilter(DateFilterField field, const QDateTime &start, const QDateTime &end);

    DateFilterField field() const;
    QDateTime start() const;
    QDateTime end() const;

    bool isActive() const;
    bool matchesTime(const QDateTime &time) const;
    bool matches(const MediaEntry &entry) const;

    bool operator==(const DateRangeFilter &other) const;
    bool operator!=(const DateRangeFilter &other) const;

private:
    DateFilterField m_field = DateFilterField::Modified;
    QDateTime m_start;
    QDateTime m_end;
};
