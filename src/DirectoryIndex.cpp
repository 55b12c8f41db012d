
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

#include "DirectoryIndex.h"

#include <QCollator>
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <algorithm>

#include "Logging.h"
#include "MediaTypeDetector.h"

namespace {

/**
 * @brief Resolves the folder to list for a scan request.
 * @param path File or folder path given by the caller.
 * @return Absolute folder path, or an empty string when the path does not exist.
 */
QString resolveDirectory(const QString &path)
{
    const QFileInfo info(path);
    if (!info.exists()) {
        return QString();
    }
    if (info.isDir()) {
        return QDir::cleanPath(info.absoluteFilePath());
    }
    return QDir::cleanPath(info.absolutePath());
}

} // namespace

/**
 * @brief Scans the folder of a file, or a folder itself, for recognized media.
 * @param path File whose siblings to list, or folder whose children to list.
 * @param order Sort order applied to the resulting entries.
 * @return Scan result holding the new index, or an error message.
 */
DirectoryScanResult DirectoryIndex::scan(const QString &path, SortOrder order)
{
    DirectoryScanResult result;
    if (path.isEmpty()) {
        result.error = QCoreApplication::translate("DirectoryIndex", "No path to scan");
        return result;
    }

    const QString directoryPath = resolveDirectory(path);
    if (directoryPath.isEmpty()) {
        result.error = QCoreApplication::translate("DirectoryIndex", "Path not found: %1").arg(path);
        qCWarning(lcScan) << "scan failed, missing path" << path;
        return result;
    }

    const QFileInfo directoryInfo(directoryPath);
    const QDir dir(directoryPath);
    if (!dir.exists() || !directoryInfo.isReadable() || !directoryInfo.isExecutable()) {
        result.error = QCoreApplication::translate("DirectoryIndex", "Cannot read folder: %1").arg(directoryPath);
        qCWarning(lcScan) << "scan failed, unreadable folder" << directoryPath;
        return result;
    }

    const QFileInfoList infos = dir.entryInfoList(QDir::Files | QDir::Hidden | QDir::NoDotAndDotDot, QDir::NoSort);

    QVector<MediaEntry> entries;
    entries.reserve(infos.size());
    for (const QFileInfo &info : infos) {
        const QString filePath = QDir::cleanPath(info.absoluteFilePath());
        const MediaKind kind = MediaTypeDetector::classify(filePath);
        if (kind == MediaKind::Unsupported) {
            continue;
        }
        MediaEntry entry;
        entry.path = filePath;
        entry.fileName = info.fileName();
        entry.kind = kind;
        entry.modified = info.lastModified();
        entry.created = info.birthTime().isValid() ? info.birthTime() : info.lastModified();
        entries.append(entry);
    }

    sortEntries(entries, order);

    DirectoryIndex index;
    index.m_directory = directoryPath;
    index.m_sortOrder = order;
    index.m_entries = entries;
    index.m_positions.reserve(entries.size());
    for (int i = 0; i < index.m_entries.size(); ++i) {
        index.m_positions.insert(index.m_entries.at(i).path, i);
    }

    qCDebug(lcScan) << "scanned" << directoryPath << "found" << index.size() << "media entries";

    result.ok = true;
    result.index = index;
    return result;
}

/**
 * @brief Scans a folder and returns its first media entry in sort order.
 * @param directory Folder to scan.
 * @param order Sort order used to pick the first entry.
 * @return Result with the first media path, empty when the folder holds no media.
 */
FirstMediaResult DirectoryIndex::scanFirstMedia(const QString &directory, SortOrder order)
{
    FirstMediaResult result;
    const DirectoryScanResult scanned = scan(directory, order);
    if (!scanned.ok) {
        result.error = scanned.error;
        return result;
    }
    result.ok = true;
    if (!scanned.index.isEmpty()) {
        result.path = scanned.index.at(0).path;
    }
    return result;
}

QString DirectoryIndex::normalizePath(const QString &path)
{
    if (path.isEmpty()) {
        return QString();
    }
    return QDir::cleanPath(QFileInfo(path).absoluteFilePath());
}

QString DirectoryIndex::directory() const
{
    return m_directory;
}

SortOrder DirectoryIndex::sortOrder() const
{
    return m_sortOrder;
}

int DirectoryIndex::size() const
{
    return m_entries.size();
}

bool DirectoryIndex::isEmpty() const
{
    return m_entries.isEmpty();
}

const MediaEntry &DirectoryIndex::at(int index) const
{
    return m_entries.at(index);
}

int DirectoryIndex::indexOf(const QString &path) const
{
    return m_positions.value(normalizePath(path), -1);
}

bool DirectoryIndex::contains(const QString &path) const
{
    return indexOf(path) >= 0;
}

const QVector<MediaEntry> &DirectoryIndex::entries() const
{
    return m_entries;
}

void DirectoryIndex::sortEntries(QVector<MediaEntry> &entries, SortOrder order)
{
    QCollator collator;
    collator.setCaseSensitivity(Qt::CaseInsensitive);

    auto compare = [&](const MediaEntry &left, const MediaEntry &right) {
        switch (order) {
        case SortOrder::ModifiedDate:
            if (left.modified != right.modified) {
                return left.modified < right.modified;
            }
            break;
        case SortOrder::CreatedDate:
            if (left.created != right.created) {
                return left.created < right.created;
            }
            break;
        case SortOrder::Alphabetical:
        default:
            break;
        }

        const int byName = collator.compare(left.fileName, right.fileName);
        if (byName != 0) {
            return byName < 0;
        }
        return left.fileName < right.fileName;
    };

    std::sort(entries.begin(), entries.end(), compare);
}
