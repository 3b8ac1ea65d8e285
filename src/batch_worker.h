#pragma once

#include <QObject>
#include <QVector>

#include "batch_runner.h"
#include "conversion_plan.h"

class EventChannel;

// Runs a batch on whatever thread it lives on, publishing every progress event
// to an EventChannel. Move it to a QThread and invoke start() queued.
class BatchWorker : public QObject {
    Q_OBJECT
public:
    explicit BatchWorker(EventChannel& channel, QObject* parent = nullptr);

    void setToolPaths(const ToolPaths& tools) { m_tools = tools; }
    void setProber(PlanExecutor::ProbeFunction prober) { m_prober = std::move(prober); }

    BatchSummary summary() const { return m_summary; }

signals:
    // Emitted after the channel has been closed
    void finished();

public slots:
    void start(const QVector<PlanRequest>& requests, bool overwrite);

private:
    EventChannel& m_channel;
    ToolPaths m_tools;
    PlanExecutor::ProbeFunction m_prober;
    BatchSummary m_summary;
};
