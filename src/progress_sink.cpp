#include "progress_sink.h"
#include "event_channel.h"

ProgressEvent ProgressEvent::started(const QString& label)
{
    ProgressEvent e;
    e.type = Type::Started;
    e.label = label;
    return e;
}

ProgressEvent ProgressEvent::spinner(const QString& label, double elapsed, const QString& message)
{
    ProgressEvent e;
    e.type = Type::Spinner;
    e.label = label;
    e.elapsedSeconds = elapsed;
    e.message = message;
    return e;
}

ProgressEvent ProgressEvent::progress(const QString& label, double percent, bool hasEta, double eta)
{
    ProgressEvent e;
    e.type = Type::Progress;
    e.label = label;
    e.percent = percent;
    e.hasEta = hasEta;
    e.etaSeconds = eta;
    return e;
}

ProgressEvent ProgressEvent::finished(const QString& label, bool ok, const QString& message)
{
    ProgressEvent e;
    e.type = Type::Finished;
    e.label = label;
    e.ok = ok;
    e.message = message;
    return e;
}

// ---- ConsoleProgressSink ----

ConsoleProgressSink::ConsoleProgressSink(FILE* stream)
    : m_stream(stream)
{
}

void ConsoleProgressSink::writeLine(const QString& text, bool inPlace)
{
    if (!m_stream) return;
    const QByteArray bytes = text.toLocal8Bit();
    if (inPlace) {
        // Pad to clear leftovers of a longer previous line
        fprintf(m_stream, "\r%-60s", bytes.constData());
        m_lineOpen = true;
    } else {
        if (m_lineOpen) fputc('\n', m_stream);
        fprintf(m_stream, "%s\n", bytes.constData());
        m_lineOpen = false;
    }
    fflush(m_stream);
}

void ConsoleProgressSink::started(const QString& label)
{
    m_activeTool.clear();
    m_lastSpinner = 0.0;
    writeLine(QString("%1 ...").arg(label), false);
}

void ConsoleProgressSink::spinner(const QString& label, double elapsedSeconds, const QString& message)
{
    Q_UNUSED(label);
    m_activeTool = message;
    m_lastSpinner = elapsedSeconds;
    writeLine(QString("%1 ... %2s").arg(message).arg(elapsedSeconds, 0, 'f', 1), true);
}

void ConsoleProgressSink::progress(const QString& label, double percent, bool hasEta, double etaSeconds)
{
    Q_UNUSED(label);
    QString line = QString("ffmpeg %1%").arg(qRound(percent));
    if (hasEta) line += QString(" eta %1s").arg(etaSeconds, 0, 'f', 1);
    writeLine(line, true);
}

void ConsoleProgressSink::finished(const QString& label, bool ok, const QString& message)
{
    if (m_lineOpen && !m_activeTool.isEmpty()) {
        writeLine(QString("%1 done in %2s").arg(m_activeTool).arg(m_lastSpinner, 0, 'f', 1), false);
    }
    writeLine(ok ? QString("%1: ok").arg(label) : QString("%1: failed: %2").arg(label, message), false);
    m_activeTool.clear();
}

// ---- ChannelProgressSink ----

void ChannelProgressSink::started(const QString& label)
{
    m_channel.push(ProgressEvent::started(label));
}

void ChannelProgressSink::spinner(const QString& label, double elapsedSeconds, const QString& message)
{
    m_channel.push(ProgressEvent::spinner(label, elapsedSeconds, message));
}

void ChannelProgressSink::progress(const QString& label, double percent, bool hasEta, double etaSeconds)
{
    m_channel.push(ProgressEvent::progress(label, percent, hasEta, etaSeconds));
}

void ChannelProgressSink::finished(const QString& label, bool ok, const QString& message)
{
    m_channel.push(ProgressEvent::finished(label, ok, message));
}
