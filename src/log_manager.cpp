#include "log_manager.h"
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QMutexLocker>
#include <QStandardPaths>
#include <QThread>

#include <cstdio>
#include <cstdlib>

namespace {

int severity(QtMsgType type)
{
    switch (type) {
        case QtDebugMsg:    return 0;
        case QtInfoMsg:     return 1;
        case QtWarningMsg:  return 2;
        case QtCriticalMsg: return 3;
        case QtFatalMsg:    return 4;
    }
    return 0;
}

} // namespace

LogManager::LogManager(QObject* parent) : QObject(parent) {
    m_flushTimer.setSingleShot(true);
    m_flushTimer.setInterval(FLUSH_INTERVAL_MS);
    connect(&m_flushTimer, &QTimer::timeout, this, [this]() {
        QMutexLocker locker(&m_mutex);
        flushPending();
    });
}

LogManager::~LogManager() {
    QMutexLocker locker(&m_mutex);
    flushPending();
    if (m_ts.device()) {
        m_ts.flush();
    }
}

bool LogManager::openLogFile(const QString& path) {
    QMutexLocker locker(&m_mutex);
    QString target = path;
    if (target.isEmpty()) {
        target = QDir(QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation)).filePath("mvx.log");
    }
    QDir().mkpath(QFileInfo(target).absolutePath());

    if (m_file.isOpen()) {
        m_ts.flush();
        m_file.close();
    }
    m_file.setFileName(target);
    if (!m_file.open(QIODevice::Append | QIODevice::Text)) {
        m_ts.setDevice(nullptr);
        return false;
    }
    m_ts.setDevice(&m_file);
    m_ts << "\n--- session start ---\n";
    m_ts.flush();
    return true;
}

QStringList LogManager::logs() const {
    QMutexLocker locker(&m_mutex);
    return m_logs;
}

bool LogManager::echoesToConsole(QtMsgType type) const {
    return severity(type) >= severity(m_consoleThreshold);
}

void LogManager::addLog(const QString& message, const QString& level) {
    QString logEntry;
    {
        QMutexLocker locker(&m_mutex);
        QString timestamp = QDateTime::currentDateTime().toString("hh:mm:ss.zzz");
        logEntry = QString("[%1] [%2] %3").arg(timestamp, level, message);
        m_logs.append(logEntry);
        if (m_logs.size() > MAX_LOGS) {
            m_logs.removeFirst();
        }

        // Write-through to disk log with buffered flushing
        if (m_ts.device()) {
            m_ts << logEntry << '\n';
            scheduleFlush(level);
        }
    }

    emit logAdded(logEntry);
}

void LogManager::flushPending() {
    if (!m_ts.device()) {
        m_pendingFlush = false;
        return;
    }
    if (m_pendingFlush) {
        m_ts.flush();
        m_pendingFlush = false;
    }
}

bool LogManager::shouldFlushImmediately(const QString& level) const {
    const QString upper = level.toUpper();
    return upper == "WARN" || upper == "ERROR" || upper == "FATAL";
}

void LogManager::scheduleFlush(const QString& level) {
    m_pendingFlush = true;

    // The timer belongs to the main thread; other threads flush on the spot
    if (shouldFlushImmediately(level) || QThread::currentThread() != thread()) {
        flushPending();
        return;
    }

    if (!m_flushTimer.isActive()) {
        m_flushTimer.start(FLUSH_INTERVAL_MS);
    }
}

void LogManager::clear() {
    QMutexLocker locker(&m_mutex);
    m_logs.clear();
}

void customMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg) {
    Q_UNUSED(context);
    QString level;
    switch (type) {
        case QtDebugMsg:
            level = "DEBUG";
            break;
        case QtInfoMsg:
            level = "INFO";
            break;
        case QtWarningMsg:
            level = "WARN";
            break;
        case QtCriticalMsg:
            level = "ERROR";
            break;
        case QtFatalMsg:
            level = "FATAL";
            break;
    }

    LogManager& logs = LogManager::instance();
    logs.addLog(msg, level);

    if (logs.echoesToConsole(type)) {
        // Warnings read as plain messages on the console; the log file keeps the level
        if (type == QtDebugMsg || type == QtInfoMsg) {
            QString timestamp = QDateTime::currentDateTime().toString("hh:mm:ss.zzz");
            fprintf(stderr, "[%s] [%s] %s\n",
                    timestamp.toLocal8Bit().constData(),
                    level.toLocal8Bit().constData(),
                    msg.toLocal8Bit().constData());
        } else {
            fprintf(stderr, "%s\n", msg.toLocal8Bit().constData());
        }
        fflush(stderr);
    }

    if (type == QtFatalMsg) {
        abort();
    }
}
