#pragma once

#include <QAbstractListModel>
#include <QVector>

#include "MediaTypes.h"

class NotificationModel : public QAbstractListModel
{
    Q_OBJECT
    Q_PROPERTY(int count READ count NOTIFY countChanged)

public:
    enum Role {
        IdRole = Qt::UserRole + 1,
        KindRole,
        MessageKeyRole,
        TextRole,
        ArgsRole
    };

    explicit NotificationModel(QObject *parent = nullptr);

    int count() const;
    Notification notificationAt(int row) const;

    int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    QVariant data(const QModelIndex &index, int role = Qt::DisplayRole) const override;
    QHash<int, QByteArray> roleNames() const override;

    Q_INVOKABLE void dismiss(int row);
    Q_INVOKABLE void clear();

public slots:
    void push(const Notification &notification);

signals:
    void countChanged();

private:
    struct Item {
        quint64 id = 0;
        Notification notification;
    };

    void dismissById(quint64 id);

    QVector<Item> m_items;
    quint64 m_nextId = 1;
};
