#pragma once

#include <QHash>
#include <QString>
#include <QVector>

#include "MediaTypes.h"

struct DirectoryScanResult;
struct FirstMediaResult;

class DirectoryIndex
{
public:
    DirectoryIndex() = default;

    static DirectoryScanResult scan(const QString &path, SortOrder order);
    static FirstMediaResult scanFirstMedia(const QString &directory, SortOrder order);
    static QString normalizePath(const QString &path);

    QString directory() const;
    SortOrder sortOrder() const;

    int size() const;
    bool isEmpty() const;
    const MediaEntry &at(int index) const;
    int indexOf(const QString &path) const;
    bool contains(const QString &path) const;
    const QVector<MediaEntry> &entries() const;

private:
    static void sortEntries(QVector<MediaEntry> &entries, SortOrder order);

    QString m_directory;
    SortOrder m_sortOrder = SortOrder::Alphabetical;
    QVector<MediaEntry> m_entries;
    QHash<QString, int> m_positions;
};

struct DirectoryScanResult {
    bool ok = false;
    DirectoryIndex index;
    QString error;
};

struct FirstMediaResult {
    bool ok = false;
    QString path;
    QString error;
};
