#include "batch_runner.h"
#include "progress_sink.h"

#include <QDebug>
#include <QJsonArray>

void BatchSummary::recordFailure(const QString& source, const QString& error)
{
    ++total;
    ++failed;
    failures.append({source, error});
}

QString BatchSummary::toText() const
{
    QStringList lines;
    lines << QString("Batch summary: total %1, succeeded %2, failed %3").arg(total).arg(succeeded).arg(failed);
    for (const BatchFailure& f : failures) {
        lines << QString("Fail: %1 -> %2").arg(f.source, f.error);
    }
    return lines.join('\n');
}

QJsonObject BatchSummary::toJson() const
{
    QJsonArray list;
    for (const BatchFailure& f : failures) {
        list.append(QJsonObject{{"source", f.source}, {"error", f.error}});
    }
    QJsonObject obj;
    obj["status"] = allSucceeded() ? "ok" : "partial";
    obj["total"] = total;
    obj["succeeded"] = succeeded;
    obj["failed"] = failed;
    obj["failures"] = list;
    return obj;
}

BatchRunner::BatchRunner(ProgressSink& sink)
    : m_sink(sink)
{
}

BatchSummary BatchRunner::run(const QVector<PlanRequest>& requests, bool overwrite)
{
    BatchSummary summary;
    PlanExecutor executor(m_sink);
    executor.setToolPaths(m_tools);
    if (m_prober) executor.setProber(m_prober);

    qInfo() << "[Batch] starting" << requests.size() << "item(s)";
    for (const PlanRequest& req : requests) {
        ConversionPlan plan;
        QString planError;
        if (!Planner::build(req, plan, &planError)) {
            // Report planning failures through the same event sequence as execution
            m_sink.started(req.source);
            m_sink.finished(req.source, false, planError);
            summary.recordFailure(req.source, planError);
            continue;
        }

        ExecutionError err;
        if (executor.execute(plan, overwrite, &err)) {
            summary.recordSuccess();
        } else {
            summary.recordFailure(req.source, err.toString());
        }
    }
    qInfo().noquote() << "[Batch]" << QString("done: %1 ok, %2 failed").arg(summary.succeeded).arg(summary.failed);
    return summary;
}
