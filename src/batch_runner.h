#pragma once

#include <QJsonObject>
#include <QString>
#include <QVector>

#include "command_builder.h"
#include "conversion_plan.h"
#include "plan_executor.h"

class ProgressSink;

struct BatchFailure {
    QString source;
    QString error;
};

// Aggregate outcome of a batch, in processing order
struct BatchSummary {
    int total = 0;
    int succeeded = 0;
    int failed = 0;
    QVector<BatchFailure> failures;

    bool allSucceeded() const { return failed == 0; }
    void recordSuccess() { ++total; ++succeeded; }
    void recordFailure(const QString& source, const QString& error);

    QString toText() const;
    QJsonObject toJson() const;
};

// Plans and executes requests one after another on the calling thread.
// A failing request is recorded and the next one still runs.
class BatchRunner {
public:
    explicit BatchRunner(ProgressSink& sink);

    void setToolPaths(const ToolPaths& tools) { m_tools = tools; }
    void setProber(PlanExecutor::ProbeFunction prober) { m_prober = std::move(prober); }

    BatchSummary run(const QVector<PlanRequest>& requests, bool overwrite);

private:
    ProgressSink& m_sink;
    ToolPaths m_tools;
    PlanExecutor::ProbeFunction m_prober;
};
