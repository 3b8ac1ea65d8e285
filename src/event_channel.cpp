#include "event_channel.h"

#include <QMutexLocker>

void EventChannel::push(const ProgressEvent& event)
{
    QMutexLocker locker(&m_mutex);
    if (m_closed) return;
    m_queue.enqueue(event);
}

void EventChannel::close()
{
    QMutexLocker locker(&m_mutex);
    m_closed = true;
}

QVector<ProgressEvent> EventChannel::drain()
{
    QMutexLocker locker(&m_mutex);
    QVector<ProgressEvent> out;
    out.reserve(m_queue.size());
    while (!m_queue.isEmpty()) out.append(m_queue.dequeue());
    return out;
}

bool EventChannel::tryPop(ProgressEvent& out)
{
    QMutexLocker locker(&m_mutex);
    if (m_queue.isEmpty()) return false;
    out = m_queue.dequeue();
    return true;
}

bool EventChannel::isClosed() const
{
    QMutexLocker locker(&m_mutex);
    return m_closed;
}

bool EventChannel::isFinished() const
{
    QMutexLocker locker(&m_mutex);
    return m_closed && m_queue.isEmpty();
}
