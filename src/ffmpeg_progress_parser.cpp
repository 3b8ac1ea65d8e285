#include "ffmpeg_progress_parser.h"
#include "progress_sink.h"

#include <QRegularExpression>
#include <QtGlobal>

#include <algorithm>
#include <cmath>

FfmpegProgressParser::FfmpegProgressParser(ProgressSink& sink, const QString& label, double durationSeconds)
    : m_sink(sink), m_label(label), m_duration(durationSeconds)
{
}

void FfmpegProgressParser::feed(const QByteArray& chunk)
{
    m_buffer.append(chunk);
    int nl = m_buffer.indexOf('\n');
    while (nl >= 0) {
        feedLine(QString::fromUtf8(m_buffer.left(nl)));
        m_buffer.remove(0, nl + 1);
        nl = m_buffer.indexOf('\n');
    }
}

void FfmpegProgressParser::feedLine(const QString& rawLine)
{
    // Both keys carry microseconds despite the name of the first one
    static const QRegularExpression rxTime("^out_time_(?:ms|us)=([0-9]+)$");
    static const QRegularExpression rxEnd("^progress=end$");

    const QString line = rawLine.trimmed();
    if (line.isEmpty()) return;

    const QRegularExpressionMatch m = rxTime.match(line);
    if (m.hasMatch()) {
        bool ok = false;
        const qint64 us = m.captured(1).toLongLong(&ok);
        if (ok) handleElapsed(static_cast<double>(us) / 1e6);
        return;
    }
    if (rxEnd.match(line).hasMatch()) {
        m_sawEnd = true;
        emitComplete();
    }
}

void FfmpegProgressParser::handleElapsed(double seconds)
{
    m_elapsed = seconds;
    if (m_duration > 0.0) {
        const double percent = std::min(100.0, seconds / m_duration * 100.0);
        const int whole = static_cast<int>(std::floor(percent));
        if (whole - m_lastPercent >= 1) {
            m_lastPercent = whole;
            const double eta = std::max(m_duration - seconds, 0.0);
            m_sink.progress(m_label, percent, true, eta);
            if (whole >= 100) m_completeEmitted = true;
        }
    } else if (m_lastElapsedEmit < 0.0 || seconds - m_lastElapsedEmit >= 1.0) {
        m_lastElapsedEmit = seconds;
        m_sink.spinner(m_label, seconds, QStringLiteral("ffmpeg"));
    }
}

void FfmpegProgressParser::emitComplete()
{
    if (m_completeEmitted) return;
    m_completeEmitted = true;
    m_lastPercent = 100;
    m_sink.progress(m_label, 100.0, m_duration > 0.0, 0.0);
}

void FfmpegProgressParser::finish()
{
    if (!m_buffer.isEmpty()) {
        feedLine(QString::fromUtf8(m_buffer));
        m_buffer.clear();
    }
    if (m_sawEnd) emitComplete();
}
