#pragma once

#include <QByteArray>
#include <QString>

class ProgressSink;

// Turns ffmpeg "-progress pipe:1" key=value lines into sink updates.
// With a known duration it reports percent and ETA whenever the whole percent
// advances; otherwise it reports elapsed output time at most once per second.
class FfmpegProgressParser {
public:
    FfmpegProgressParser(ProgressSink& sink, const QString& label, double durationSeconds);

    // Accepts arbitrary chunks; incomplete trailing lines are buffered
    void feed(const QByteArray& chunk);
    void feedLine(const QString& line);
    // Flushes any buffered partial line and emits the final 100% update if the
    // stream ended and it was not reported yet
    void finish();

    bool sawEnd() const { return m_sawEnd; }
    double lastElapsedSeconds() const { return m_elapsed; }

private:
    void handleElapsed(double seconds);
    void emitComplete();

    ProgressSink& m_sink;
    QString m_label;
    double m_duration;
    QByteArray m_buffer;
    double m_elapsed = 0.0;
    int m_lastPercent = -1;
    double m_lastElapsedEmit = -1.0;
    bool m_sawEnd = false;
    bool m_completeEmitted = false;
};
