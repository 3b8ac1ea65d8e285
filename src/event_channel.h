#pragma once

#include <QMutex>
#include <QQueue>
#include <QVector>

#include "progress_sink.h"

// Ordered, unbounded event queue between one producer (the batch worker thread)
// and one consumer (the UI tick). Events are copied in and out; neither side
// shares any other state.
class EventChannel {
public:
    EventChannel() = default;
    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    void push(const ProgressEvent& event);
    // Producer signals that no further events will arrive
    void close();

    // Removes and returns everything queued so far, oldest first
    QVector<ProgressEvent> drain();
    bool tryPop(ProgressEvent& out);

    bool isClosed() const;
    // Closed and nothing left to read
    bool isFinished() const;

private:
    mutable QMutex m_mutex;
    QQueue<ProgressEvent> m_queue;
    bool m_closed = false;
};
