#pragma once

#include <QAtomicInt>
#include <QSharedPointer>

class CancellationToken
{
public:
    CancellationToken() = default;

    void cancel();
    bool isCancelled() const;

private:
    QAtomicInt m_cancelled = 0;
};

using CancellationTokenPtr = QSharedPointer<CancellationToken>;
