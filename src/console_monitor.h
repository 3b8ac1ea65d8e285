#pragma once

#include <QHash>
#include <QObject>
#include <QStringList>
#include <QTimer>
#include <QVector>

#include "progress_sink.h"

class EventChannel;
class QSocketNotifier;

// Text dashboard fed only by events read from an EventChannel on a fixed tick.
// It never touches the worker; once the channel is closed and drained it shows
// the totals and waits for Enter before emitting closed().
class ConsoleMonitor : public QObject {
    Q_OBJECT
public:
    enum class Status { Pending, Running, Ok, Failed };

    struct TaskState {
        QString label;
        Status status = Status::Pending;
        double percent = 0.0;
        bool hasEta = false;
        double etaSeconds = 0.0;
        QString message;
    };

    static constexpr int kTickMs = 120;
    static constexpr int kMaxLogLines = 200;

    explicit ConsoleMonitor(EventChannel& channel, QObject* parent = nullptr);
    ~ConsoleMonitor() override;

    void setPending(const QStringList& labels);
    // Render the screen with ANSI clear codes (off for tests)
    void setRenderToTerminal(bool enabled) { m_renderToTerminal = enabled; }
    void setWaitForEnter(bool enabled) { m_waitForEnter = enabled; }
    void start();

    // Applies one event to the model
    void apply(const ProgressEvent& event);
    QStringList renderLines() const;

    const QVector<TaskState>& tasks() const { return m_tasks; }
    const QStringList& activity() const { return m_log; }
    bool isComplete() const { return m_complete; }
    int succeeded() const;
    int failed() const;

    static QString statusCode(Status status);

signals:
    void closed();

private slots:
    void onTick();
    void onStdinReady();

private:
    TaskState& taskFor(const QString& label);
    void appendLog(const QString& line);
    void redraw();
    void finishObserving();

    EventChannel& m_channel;
    QTimer m_timer;
    QVector<TaskState> m_tasks;
    QHash<QString, int> m_index;
    QStringList m_log;
    QString m_current;
    bool m_complete = false;
    bool m_renderToTerminal = true;
    bool m_waitForEnter = true;
    QSocketNotifier* m_stdinNotifier = nullptr;
};
