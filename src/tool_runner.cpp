#include "tool_runner.h"
#include "ffmpeg_progress_parser.h"
#include "file_utils.h"
#include "progress_sink.h"

#include <QDebug>
#include <QElapsedTimer>
#include <QProcess>

namespace {
constexpr int kStartTimeoutMs = 10000;

void superviseWithSpinner(QProcess& proc, ProgressSink& sink, const QString& label, const QString& tool)
{
    QElapsedTimer timer;
    timer.start();
    while (proc.state() != QProcess::NotRunning) {
        if (proc.waitForFinished(ToolRunner::kPollIntervalMs)) break;
        if (proc.state() == QProcess::NotRunning) break;
        sink.spinner(label, timer.elapsed() / 1000.0, tool);
    }
}

void superviseWithProgress(QProcess& proc, ProgressSink& sink, const QString& label, double durationSeconds)
{
    FfmpegProgressParser parser(sink, label, durationSeconds);
    while (proc.state() != QProcess::NotRunning) {
        if (!proc.waitForReadyRead(ToolRunner::kPollIntervalMs) && proc.state() != QProcess::NotRunning) {
            proc.waitForFinished(ToolRunner::kPollIntervalMs);
        }
        parser.feed(proc.readAllStandardOutput());
    }
    parser.feed(proc.readAllStandardOutput());
    parser.finish();
}
} // namespace

ToolRunResult ToolRunner::run(const ToolCommand& command, ProgressSink& sink, const QString& label,
                              double durationSeconds)
{
    ToolRunResult result;
    for (const QString& candidate : command.candidates) {
        const QString exe = FileUtils::resolveExecutable(candidate);
        if (exe.isEmpty()) {
            qDebug() << "[Tool]" << candidate << "not found, trying next candidate";
            continue;
        }

        QProcess proc;
        proc.setProcessChannelMode(QProcess::ForwardedErrorChannel);
        if (!command.reportsProgress) {
            proc.setStandardOutputFile(QProcess::nullDevice());
        }
        proc.setStandardInputFile(QProcess::nullDevice());

        qInfo().noquote() << "[Tool]" << CommandBuilder::formatCommandLine(exe, command.args);
        proc.start(exe, command.args);
        if (!proc.waitForStarted(kStartTimeoutMs)) {
            if (proc.error() == QProcess::FailedToStart) {
                qWarning().noquote() << "[Tool] failed to start" << exe << ":" << proc.errorString();
                continue;
            }
            proc.kill();
            proc.waitForFinished(1000);
            result.status = ToolRunResult::Status::Failed;
            result.program = candidate;
            result.exitCode = -1;
            return result;
        }

        if (command.reportsProgress) {
            superviseWithProgress(proc, sink, label, durationSeconds);
        } else {
            superviseWithSpinner(proc, sink, label, command.tool);
        }
        proc.waitForFinished(-1);

        result.program = candidate;
        result.exitCode = proc.exitCode();
        if (proc.exitStatus() == QProcess::CrashExit) {
            result.status = ToolRunResult::Status::Crashed;
        } else if (proc.exitCode() != 0) {
            result.status = ToolRunResult::Status::Failed;
        } else {
            result.status = ToolRunResult::Status::Ok;
        }
        return result;
    }

    result.status = ToolRunResult::Status::NotFound;
    return result;
}
