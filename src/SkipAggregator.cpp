
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

#include "SkipAggregator.h"

namespace {
struct SkipAggregatorConstants {
    static constexpr int maxListedFiles = 5;
    static constexpr int maxFileNameLength = 32;
    static constexpr int autoDismissMs = 8000;
};

const char skippedFilesKey[] = "notification-skipped-corrupted-files";
} // namespace

SkipAggregator::SkipAggregator(QObject *parent)
    : QObject(parent)
{
}

/**
 * @brief Shortens a file name to the display limit, marking the cut with an ellipsis.
 * @param fileName File name to shorten.
 * @return The file name, truncated when longer than the limit.
 */
QString SkipAggregator::truncateFileName(const QString &fileName)
{
    if (fileName.size() <= SkipAggregatorConstants::maxFileNameLength) {
        return fileName;
    }
    int cut = SkipAggregatorConstants::maxFileNameLength - 1;
    if (fileName.at(cut - 1).isHighSurrogate()) {
        cut -= 1;
    }
    return fileName.left(cut) + QChar(0x2026);
}

/**
 * @brief Renders skipped file names as one line for a notification.
 * @param fileNames File names in the order they were skipped.
 * @return Comma separated names, with a "+N more" suffix past the display cap.
 */
QString SkipAggregator::formatSkippedFiles(const QStringList &fileNames)
{
    if (fileNames.isEmpty()) {
        return QString();
    }

    QStringList shown;
    const int listed = qMin(int(fileNames.size()), SkipAggregatorConstants::maxListedFiles);
    shown.reserve(listed);
    for (int i = 0; i < listed; ++i) {
        shown.append(truncateFileName(fileNames.at(i)));
    }

    QString text = shown.join(QStringLiteral(", "));
    const int remaining = int(fileNames.size()) - listed;
    if (remaining > 0) {
        text += QLatin1Char(' ') + tr("+%n more", nullptr, remaining);
    }
    return text;
}

/**
 * @brief Emits the grouped warning for one finished gesture.
 * @param skippedFiles File names skipped during the gesture.
 * @return True when a notification was emitted, false for an empty list.
 */
bool SkipAggregator::report(const QStringList &skippedFiles)
{
    if (skippedFiles.isEmpty()) {
        return false;
    }

    const QString files = formatSkippedFiles(skippedFiles);

    Notification notification;
    notification.kind = Notification::Warning;
    notification.messageKey = QLatin1String(skippedFilesKey);
    notification.args.insert(QStringLiteral("files"), files);
    notification.args.insert(QStringLiteral("count"), int(skippedFiles.size()));
    notification.text = tr("Skipped unreadable files: %1").arg(files);
    notification.autoDismissMs = SkipAggregatorConstants::autoDismissMs;

    emit notificationRequested(notification);
    return true;
}
