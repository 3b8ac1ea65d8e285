#pragma once

#include <QElapsedTimer>
#include <QMetaType>
#include <QString>

#include <cstdio>

class EventChannel;

// Uniform progress event. label identifies one plan within a batch (its source path).
struct ProgressEvent {
    enum class Type { Started, Spinner, Progress, Finished };

    Type type = Type::Started;
    QString label;
    double elapsedSeconds = 0.0; // Spinner
    QString message;             // Spinner: tool name; Finished: "ok" or the error
    double percent = 0.0;        // Progress, 0..100
    bool hasEta = false;
    double etaSeconds = 0.0;
    bool ok = false;             // Finished

    static ProgressEvent started(const QString& label);
    static ProgressEvent spinner(const QString& label, double elapsed, const QString& message);
    static ProgressEvent progress(const QString& label, double percent, bool hasEta, double eta);
    static ProgressEvent finished(const QString& label, bool ok, const QString& message);
};
Q_DECLARE_METATYPE(ProgressEvent)

// Receives the event sequence of each plan: started, any number of spinner/progress
// updates, then exactly one finished.
class ProgressSink {
public:
    virtual ~ProgressSink() = default;

    virtual void started(const QString& label) = 0;
    virtual void spinner(const QString& label, double elapsedSeconds, const QString& message) = 0;
    virtual void progress(const QString& label, double percent, bool hasEta, double etaSeconds) = 0;
    virtual void finished(const QString& label, bool ok, const QString& message) = 0;
};

// In-place status line on a terminal stream (stderr by default)
class ConsoleProgressSink : public ProgressSink {
public:
    explicit ConsoleProgressSink(FILE* stream = stderr);

    void started(const QString& label) override;
    void spinner(const QString& label, double elapsedSeconds, const QString& message) override;
    void progress(const QString& label, double percent, bool hasEta, double etaSeconds) override;
    void finished(const QString& label, bool ok, const QString& message) override;

private:
    void writeLine(const QString& text, bool inPlace);

    FILE* m_stream;
    QString m_activeTool;
    bool m_lineOpen = false;
    double m_lastSpinner = 0.0;
};

// Publishes every event as a value onto an EventChannel
class ChannelProgressSink : public ProgressSink {
public:
    explicit ChannelProgressSink(EventChannel& channel) : m_channel(channel) {}

    void started(const QString& label) override;
    void spinner(const QString& label, double elapsedSeconds, const QString& message) override;
    void progress(const QString& label, double percent, bool hasEta, double etaSeconds) override;
    void finished(const QString& label, bool ok, const QString& message) override;

private:
    EventChannel& m_channel;
};

// Swallows everything; used for planning-only runs and tests
class NullProgressSink : public ProgressSink {
public:
    void started(const QString&) override {}
    void spinner(const QString&, double, const QString&) override {}
    void progress(const QString&, double, bool, double) override {}
    void finished(const QString&, bool, const QString&) override {}
};
