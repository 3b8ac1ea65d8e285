#ifndef LOG_MANAGER_H
#define LOG_MANAGER_H

#include <QObject>
#include <QStringList>
#include <QMutex>
#include <QDateTime>
#include <QFile>
#include <QTextStream>
#include <QTimer>

class LogManager : public QObject {
    Q_OBJECT

public:
    static LogManager& instance() {
        static LogManager inst;
        return inst;
    }

    ~LogManager() override;

    // Opens the persistent log; an empty path selects <AppLocalDataLocation>/mvx.log
    bool openLogFile(const QString& path = QString());
    QString logFilePath() const { return m_file.fileName(); }

    QStringList logs() const;

    void addLog(const QString& message, const QString& level = "INFO");
    void clear();

    // Messages below this level are kept in the log but not echoed to stderr
    void setConsoleThreshold(QtMsgType type) { m_consoleThreshold = type; }
    bool echoesToConsole(QtMsgType type) const;

signals:
    void logAdded(const QString& message);

private:
    explicit LogManager(QObject* parent = nullptr);
    void flushPending();
    void scheduleFlush(const QString& level);
    bool shouldFlushImmediately(const QString& level) const;

    QStringList m_logs;
    mutable QMutex m_mutex;
    QFile m_file;
    QTextStream m_ts;
    QTimer m_flushTimer;
    bool m_pendingFlush = false;
    QtMsgType m_consoleThreshold = QtWarningMsg;
    static constexpr int MAX_LOGS = 1000;
    static constexpr int FLUSH_INTERVAL_MS = 250;
};

// Custom message handler for qDebug/qInfo/qWarning/qCritical
void customMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg);

#endif // LOG_MANAGER_H
