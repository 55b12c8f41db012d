
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

#include "DateRangeFilter.h"

DateRangeFilter::DateRangeFilter(DateFilterField field, const QDateTime &start, const QDateTime &end)
    : m_field(field)
    , m_start(start)
    , m_end(end)
{
}

DateFilterField DateRangeFilter::field() const
{
    return m_field;
}

QDateTime DateRangeFilter::start() const
{
    return m_start;
}

QDateTime DateRangeFilter::end() const
{
    return m_end;
}

bool DateRangeFilter::isActive() const
{
    return m_start.isValid() || m_end.isValid();
}

/**
 * @brief Checks a timestamp against both bounds, inclusive.
 * @param time Timestamp to check. An invalid timestamp only passes an inactive filter.
 * @return True when the timestamp lies within the range.
 */
bool DateRangeFilter::matchesTime(const QDateTime &time) const
{
    if (!isActive()) {
        return true;
    }
    if (!time.isValid()) {
        return false;
    }
    if (m_start.isValid() && time < m_start) {
        return false;
    }
    if (m_end.isValid() && time > m_end) {
        return false;
    }
    return true;
}

bool DateRangeFilter::matches(const MediaEntry &entry) const
{
    return matchesTime(m_field == DateFilterField::Created ? entry.created : entry.modified);
}

bool DateRangeFilter::operator==(const DateRangeFilter &other) const
{
    return m_field == other.m_field && m_start == other.m_start && m_end == other.m_end;
}

bool DateRangeFilter::operator!=(const DateRangeFilter &other) const
{
    return !(*this == other);
}
