
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

#include "NotificationModel.h"

#include <QTimer>

namespace {
struct NotificationModelConstants {
    static constexpr int maxVisible = 4;
};
} // namespace

NotificationModel::NotificationModel(QObject *parent)
    : QAbstractListModel(parent)
{
}

int NotificationModel::count() const
{
    return m_items.size();
}

Notification NotificationModel::notificationAt(int row) const
{
    if (row < 0 || row >= m_items.size()) {
        return Notification();
    }
    return m_items.at(row).notification;
}

int NotificationModel::rowCount(const QModelIndex &parent) const
{
    if (parent.isValid()) {
        return 0;
    }
    return m_items.size();
}

QVariant NotificationModel::data(const QModelIndex &index, int role) const
{
    if (!index.isValid() || index.row() < 0 || index.row() >= m_items.size()) {
        return QVariant();
    }

    const Item &item = m_items.at(index.row());
    switch (role) {
    case IdRole:
        return item.id;
    case KindRole:
        return int(item.notification.kind);
    case MessageKeyRole:
        return item.notification.messageKey;
    case Qt::DisplayRole:
    case TextRole:
        return item.notification.text;
    case ArgsRole:
        return item.notification.args;
    default:
        return QVariant();
    }
}

QHash<int, QByteArray> NotificationModel::roleNames() const
{
    return {
        {IdRole, "notificationId"},
        {KindRole, "kind"},
        {MessageKeyRole, "messageKey"},
        {TextRole, "text"},
        {ArgsRole, "args"},
    };
}

/**
 * @brief Appends a notification, evicting the oldest when too many are shown.
 * @param notification Notification to show. A positive autoDismissMs schedules its removal.
 */
void NotificationModel::push(const Notification &notification)
{
    if (m_items.size() >= NotificationModelConstants::maxVisible) {
        dismiss(0);
    }

    Item item;
    item.id = m_nextId++;
    item.notification = notification;

    const int row = m_items.size();
    beginInsertRows(QModelIndex(), row, row);
    m_items.append(item);
    endInsertRows();
    emit countChanged();

    if (notification.autoDismissMs > 0) {
        const quint64 id = item.id;
        QTimer::singleShot(notification.autoDismissMs, this, [this, id]() {
            dismissById(id);
        });
    }
}

void NotificationModel::dismiss(int row)
{
    if (row < 0 || row >= m_items.size()) {
        return;
    }
    beginRemoveRows(QModelIndex(), row, row);
    m_items.removeAt(row);
    endRemoveRows();
    emit countChanged();
}

void NotificationModel::clear()
{
    if (m_items.isEmpty()) {
        return;
    }
    beginResetModel();
    m_items.clear();
    endResetModel();
    emit countChanged();
}

void NotificationModel::dismissById(quint64 id)
{
    for (int row = 0; row < m_items.size(); ++row) {
        if (m_items.at(row).id == id) {
            dismiss(row);
            return;
        }
    }
}
