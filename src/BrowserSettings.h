#pragma once

#include <QDateTime>
#include <QObject>
#include <QString>

#include "DateRangeFilter.h"
#include "MaxSkipAttempts.h"
#include "MediaTypes.h"

class BrowserSettings : public QObject
{
    Q_OBJECT
    Q_PROPERTY(int sortOrder READ sortOrderValue WRITE setSortOrderValue NOTIFY sortOrderChanged)
    Q_PROPERTY(int maxSkipAttempts READ maxSkipAttemptsValue WRITE setMaxSkipAttemptsValue NOTIFY maxSkipAttemptsChanged)
    Q_PROPERTY(int typeFilter READ typeFilterValue WRITE setTypeFilterValue NOTIFY typeFilterChanged)
    Q_PROPERTY(int dateFilterField READ dateFilterFieldValue WRITE setDateFilterFieldValue NOTIFY dateFilterChanged)
    Q_PROPERTY(QDateTime dateFilterStart READ dateFilterStart WRITE setDateFilterStart NOTIFY dateFilterChanged)
    Q_PROPERTY(QDateTime dateFilterEnd READ dateFilterEnd WRITE setDateFilterEnd NOTIFY dateFilterChanged)
    Q_PROPERTY(QString lastOpenedPath READ lastOpenedPath WRITE setLastOpenedPath NOTIFY lastOpenedPathChanged)

public:
    explicit BrowserSettings(QObject *parent = nullptr);
    explicit BrowserSettings(const QString &fileName, QObject *parent = nullptr);

    SortOrder sortOrder() const;
    void setSortOrder(SortOrder order);

    MaxSkipAttempts maxSkipAttempts() const;
    void setMaxSkipAttempts(MaxSkipAttempts attempts);

    MediaTypeFilter typeFilter() const;
    void setTypeFilter(MediaTypeFilter filter);

    DateRangeFilter dateFilter() const;
    void setDateFilter(const DateRangeFilter &filter);

    QString lastOpenedPath() const;
    void setLastOpenedPath(const QString &path);

    int sortOrderValue() const;
    void setSortOrderValue(int value);
    int maxSkipAttemptsValue() const;
    void setMaxSkipAttemptsValue(int value);
    int typeFilterValue() const;
    void setTypeFilterValue(int value);
    int dateFilterFieldValue() const;
    void setDateFilterFieldValue(int value);
    QDateTime dateFilterStart() const;
    void setDateFilterStart(const QDateTime &start);
    QDateTime dateFilterEnd() const;
    void setDateFilterEnd(const QDateTime &end);

    Q_INVOKABLE void clearDateFilter();

signals:
    void sortOrderChanged();
    void maxSkipAttemptsChanged();
    void typeFilterChanged();
    void dateFilterChanged();
    void lastOpenedPathChanged();

private:
    void loadFromSettings();
    void saveValue(const QString &key, const QVariant &value) const;

    QString m_fileName;
    SortOrder m_sortOrder = SortOrder::Alphabetical;
    MaxSkipAttempts m_maxSkipAttempts;
    MediaTypeFilter m_typeFilter = MediaTypeFilter::All;
    DateRangeFilter m_dateFilter;
    QString m_lastOpenedPath;
};
