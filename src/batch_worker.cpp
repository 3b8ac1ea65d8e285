#include "batch_worker.h"
#include "event_channel.h"
#include "progress_sink.h"

BatchWorker::BatchWorker(EventChannel& channel, QObject* parent)
    : QObject(parent), m_channel(channel)
{
}

void BatchWorker::start(const QVector<PlanRequest>& requests, bool overwrite)
{
    ChannelProgressSink sink(m_channel);
    BatchRunner runner(sink);
    runner.setToolPaths(m_tools);
    if (m_prober) runner.setProber(m_prober);

    m_summary = runner.run(requests, overwrite);
    m_channel.close();
    emit finished();
}
