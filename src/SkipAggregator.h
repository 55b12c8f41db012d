#pragma once

#include <QObject>
#include <QStringList>

#include "MediaTypes.h"

class SkipAggregator : public QObject
{
    Q_OBJECT

public:
    explicit SkipAggregator(QObject *parent = nullptr);

    static QString formatSkippedFiles(const QStringList &fileNames);
    static QString truncateFileName(const QString &fileName);

    bool report(const QStringList &skippedFiles);

signals:
    void notificationRequested(const Notification &notification);
};
