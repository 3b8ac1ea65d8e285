#include "console_monitor.h"
#include "event_channel.h"

#include <QDebug>
#include <QSocketNotifier>
#include <QTextStream>

#include <cstdio>

#ifdef Q_OS_UNIX
#include <unistd.h>
#endif

ConsoleMonitor::ConsoleMonitor(EventChannel& channel, QObject* parent)
    : QObject(parent), m_channel(channel)
{
    m_timer.setInterval(kTickMs);
    connect(&m_timer, &QTimer::timeout, this, &ConsoleMonitor::onTick);
}

ConsoleMonitor::~ConsoleMonitor() = default;

QString ConsoleMonitor::statusCode(Status status)
{
    switch (status) {
        case Status::Pending: return QStringLiteral("P");
        case Status::Running: return QStringLiteral("R");
        case Status::Ok:      return QStringLiteral("OK");
        case Status::Failed:  return QStringLiteral("ER");
    }
    return QString();
}

void ConsoleMonitor::setPending(const QStringList& labels)
{
    for (const QString& l : labels) taskFor(l);
}

void ConsoleMonitor::start()
{
    m_timer.start();
    onTick();
}

ConsoleMonitor::TaskState& ConsoleMonitor::taskFor(const QString& label)
{
    auto it = m_index.constFind(label);
    if (it != m_index.constEnd()) return m_tasks[it.value()];
    TaskState t;
    t.label = label;
    m_tasks.append(t);
    m_index.insert(label, m_tasks.size() - 1);
    return m_tasks.last();
}

void ConsoleMonitor::appendLog(const QString& line)
{
    m_log.append(line);
    while (m_log.size() > kMaxLogLines) m_log.removeFirst();
}

void ConsoleMonitor::apply(const ProgressEvent& e)
{
    TaskState& t = taskFor(e.label);
    switch (e.type) {
        case ProgressEvent::Type::Started:
            t.status = Status::Running;
            t.percent = 0.0;
            t.hasEta = false;
            t.message.clear();
            m_current = e.label;
            appendLog(QString("Started %1").arg(e.label));
            break;
        case ProgressEvent::Type::Spinner:
            t.message = QString("%1 %2s").arg(e.message).arg(e.elapsedSeconds, 0, 'f', 1);
            break;
        case ProgressEvent::Type::Progress:
            t.percent = e.percent;
            t.hasEta = e.hasEta;
            t.etaSeconds = e.etaSeconds;
            break;
        case ProgressEvent::Type::Finished:
            t.status = e.ok ? Status::Ok : Status::Failed;
            if (e.ok) t.percent = 100.0;
            t.message = e.message;
            if (m_current == e.label) m_current.clear();
            appendLog(e.ok ? QString("Finished %1").arg(e.label)
                           : QString("Failed %1: %2").arg(e.label, e.message));
            break;
    }
}

int ConsoleMonitor::succeeded() const
{
    int n = 0;
    for (const TaskState& t : m_tasks) if (t.status == Status::Ok) ++n;
    return n;
}

int ConsoleMonitor::failed() const
{
    int n = 0;
    for (const TaskState& t : m_tasks) if (t.status == Status::Failed) ++n;
    return n;
}

QStringList ConsoleMonitor::renderLines() const
{
    QStringList lines;
    lines << QString("mvx  %1 task(s)  ok %2  failed %3").arg(m_tasks.size()).arg(succeeded()).arg(failed());
    lines << QString();
    for (const TaskState& t : m_tasks) {
        lines << QString("[%1] %2% %3")
                     .arg(statusCode(t.status), 2)
                     .arg(qRound(t.percent), 3)
                     .arg(t.label);
    }

    lines << QString();
    if (!m_current.isEmpty()) {
        const TaskState& t = m_tasks.at(m_index.value(m_current));
        QString detail = QString("Current: %1  %2%").arg(t.label).arg(t.percent, 0, 'f', 1);
        if (t.hasEta) detail += QString("  eta %1s").arg(t.etaSeconds, 0, 'f', 1);
        if (!t.message.isEmpty()) detail += "  " + t.message;
        lines << detail;
    } else if (m_complete) {
        lines << QString("Completed: %1 succeeded, %2 failed. Press Enter to exit.").arg(succeeded()).arg(failed());
    }

    lines << QString() << "Activity:";
    const int first = qMax(0, m_log.size() - 10);
    for (int i = first; i < m_log.size(); ++i) lines << "  " + m_log.at(i);
    return lines;
}

void ConsoleMonitor::redraw()
{
    if (!m_renderToTerminal) return;
    QTextStream out(stdout);
    out << "\x1b[2J\x1b[H" << renderLines().join('\n') << '\n';
    out.flush();
}

void ConsoleMonitor::onTick()
{
    const QVector<ProgressEvent> events = m_channel.drain();
    for (const ProgressEvent& e : events) apply(e);

    if (!m_complete && m_channel.isFinished()) {
        m_complete = true;
        m_timer.stop();
        redraw();
        finishObserving();
        return;
    }
    redraw();
}

void ConsoleMonitor::finishObserving()
{
#ifdef Q_OS_UNIX
    if (m_waitForEnter && isatty(STDIN_FILENO)) {
        m_stdinNotifier = new QSocketNotifier(STDIN_FILENO, QSocketNotifier::Read, this);
        connect(m_stdinNotifier, &QSocketNotifier::activated, this, &ConsoleMonitor::onStdinReady);
        return;
    }
#endif
    // Delivered from the event loop; start() may run before exec()
    QMetaObject::invokeMethod(this, &ConsoleMonitor::closed, Qt::QueuedConnection);
}

void ConsoleMonitor::onStdinReady()
{
    m_stdinNotifier->setEnabled(false);
#ifdef Q_OS_UNIX
    // Consume the keypress so it does not reach the shell
    char buf[256];
    if (::read(STDIN_FILENO, buf, sizeof(buf)) < 0) {
        qWarning() << "[Monitor] failed to read stdin";
    }
#endif
    emit closed();
}
