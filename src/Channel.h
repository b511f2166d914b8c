#pragma once

#include <QMutex>
#include <QMutexLocker>
#include <QQueue>
#include <QSharedPointer>
#include <QVector>

/*
 * Channel<T>
 * ----------
 * Unbounded many-to-one FIFO used between worker threads and the
 * foreground. Workers send(); the foreground drains with tryReceive()
 * on each tick and never blocks.
 *
 * Messages from one sender are received in the order they were sent.
 */
template <typename T>
class Channel
{
public:
    void send(const T& value)
    {
        QMutexLocker lock(&m_mutex);
        m_queue.enqueue(value);
    }

    bool tryReceive(T* out)
    {
        QMutexLocker lock(&m_mutex);
        if (m_queue.isEmpty())
            return false;
        *out = m_queue.dequeue();
        return true;
    }

    QVector<T> drain()
    {
        QMutexLocker lock(&m_mutex);
        QVector<T> out;
        out.reserve(m_queue.size());
        while (!m_queue.isEmpty())
            out.push_back(m_queue.dequeue());
        return out;
    }

    int pending() const
    {
        QMutexLocker lock(&m_mutex);
        return m_queue.size();
    }

private:
    mutable QMutex m_mutex;
    QQueue<T>      m_queue;
};

/*
 * OneShot<T>
 * ----------
 * Single-value channel. The first send() wins, later ones are dropped.
 * Used for cancellation (peeked, never consumed) and for worker results
 * such as a remote listing (taken once).
 */
template <typename T>
class OneShot
{
public:
    bool send(const T& value)
    {
        QMutexLocker lock(&m_mutex);
        if (m_sent)
            return false;
        m_sent = true;
        m_value = value;
        return true;
    }

    bool isSet() const
    {
        QMutexLocker lock(&m_mutex);
        return m_sent && !m_taken;
    }

    bool tryTake(T* out)
    {
        QMutexLocker lock(&m_mutex);
        if (!m_sent || m_taken)
            return false;
        m_taken = true;
        *out = m_value;
        return true;
    }

private:
    mutable QMutex m_mutex;
    bool           m_sent  = false;
    bool           m_taken = false;
    T              m_value {};
};

template <typename T>
using ChannelPtr = QSharedPointer<Channel<T>>;

template <typename T>
using OneShotPtr = QSharedPointer<OneShot<T>>;

using CancelSignal = OneShot<bool>;
using CancelPtr    = OneShotPtr<bool>;
