#include "plan_executor.h"
#include "conversion_plan.h"
#include "file_utils.h"
#include "mode_decider.h"
#include "progress_sink.h"
#include "tool_runner.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>
#include <QTemporaryFile>

namespace {
constexpr qint64 kCopyChunkBytes = 4 * 1024 * 1024;

bool fail(ExecutionError& err, ExecutionError::Kind kind, const QString& step, const QString& message)
{
    err.kind = kind;
    err.step = step;
    err.message = message;
    return false;
}
} // namespace

QString ExecutionError::kindName(Kind kind)
{
    switch (kind) {
        case Kind::None:         return QStringLiteral("none");
        case Kind::Precondition: return QStringLiteral("precondition");
        case Kind::Unsupported:  return QStringLiteral("unsupported");
        case Kind::ToolMissing:  return QStringLiteral("tool-missing");
        case Kind::ToolFailure:  return QStringLiteral("tool-failure");
        case Kind::OutputEmpty:  return QStringLiteral("output-empty");
        case Kind::Io:           return QStringLiteral("io");
    }
    return QString();
}

QString ExecutionError::toString() const
{
    if (kind == Kind::ToolMissing && !installHint.isEmpty()) return installHint;
    return message;
}

PlanExecutor::PlanExecutor(ProgressSink& sink)
    : m_sink(sink)
{
    m_prober = [this](const QString& path, MediaProbeInfo& info, QString* errorMessage) {
        return MediaProbe::probeMediaFile(path, info, errorMessage, m_tools.ffprobe);
    };
}

QString PlanExecutor::availableBackupPath(const QString& destination)
{
    const QString first = destination + ".bak";
    if (!FileUtils::pathExists(first)) return first;
    for (int i = 1; i <= kMaxBackupAttempts; ++i) {
        const QString cand = QString("%1.bak.%2").arg(destination).arg(i);
        if (!FileUtils::pathExists(cand)) return cand;
    }
    return QString();
}

bool PlanExecutor::copyFileContents(const QString& src, QFile& out, QString* errorOut)
{
    QFile in(src);
    if (!in.open(QIODevice::ReadOnly)) {
        if (errorOut) *errorOut = QString("failed to open %1: %2").arg(src, in.errorString());
        return false;
    }
    QByteArray buf;
    buf.resize(kCopyChunkBytes);
    while (!in.atEnd()) {
        const qint64 r = in.read(buf.data(), buf.size());
        if (r < 0) {
            if (errorOut) *errorOut = QString("read error on %1: %2").arg(src, in.errorString());
            return false;
        }
        if (r == 0) break;
        const qint64 w = out.write(buf.constData(), r);
        if (w != r) {
            if (errorOut) *errorOut = QString("write error on %1: %2").arg(out.fileName(), out.errorString());
            return false;
        }
    }
    if (!out.flush()) {
        if (errorOut) *errorOut = QString("write error on %1: %2").arg(out.fileName(), out.errorString());
        return false;
    }
    return true;
}

bool PlanExecutor::execute(const ConversionPlan& plan, bool overwrite, ExecutionError* error)
{
    const QString label = plan.source();
    m_sink.started(label);

    ExecutionError err;
    bool ok = prepareDestination(plan, overwrite, err);
    if (ok) {
        switch (plan.strategy()) {
            case Strategy::RenameOnly: ok = runRename(plan, overwrite, err); break;
            case Strategy::CopyOnly:   ok = runCopy(plan, overwrite, err); break;
            case Strategy::Convert:    ok = runConvert(plan, overwrite, err); break;
        }
    }

    if (ok) {
        qInfo().noquote() << "[Executor]" << MediaTypes::strategyName(plan.strategy()) << plan.source()
                          << "->" << plan.destination();
    } else {
        qInfo().noquote() << QString("[Executor] %1 failed at %2 (%3): %4")
                                 .arg(plan.source(), err.step, ExecutionError::kindName(err.kind), err.toString());
    }
    m_sink.finished(label, ok, ok ? QStringLiteral("ok") : err.toString());
    if (error) *error = err;
    return ok;
}

bool PlanExecutor::prepareDestination(const ConversionPlan& plan, bool overwrite, ExecutionError& err)
{
    QString msg;
    if (!FileUtils::ensureParentDir(plan.destination(), &msg)) {
        return fail(err, ExecutionError::Kind::Precondition, "prepare", msg);
    }
    if (!FileUtils::pathExists(plan.destination())) return true;

    if (plan.backup()) {
        const QString backupPath = availableBackupPath(plan.destination());
        if (backupPath.isEmpty()) {
            return fail(err, ExecutionError::Kind::Precondition, "backup", "could not find available backup path");
        }
        if (!QFile::rename(plan.destination(), backupPath)) {
            return fail(err, ExecutionError::Kind::Io, "backup",
                        QString("failed to move %1 to %2").arg(plan.destination(), backupPath));
        }
        qInfo().noquote() << "[Executor] backed up" << plan.destination() << "to" << backupPath;
        return true;
    }
    if (!overwrite) {
        return fail(err, ExecutionError::Kind::Precondition, "prepare",
                    "destination exists; pass --overwrite or --backup");
    }
    return true;
}

bool PlanExecutor::removeExistingDestination(const QString& destination, const QString& step, ExecutionError& err)
{
    if (!FileUtils::pathExists(destination)) return true;
    if (QFile::remove(destination)) return true;
    return fail(err, ExecutionError::Kind::Io, step, QString("failed to remove existing %1").arg(destination));
}

bool PlanExecutor::runRename(const ConversionPlan& plan, bool overwrite, ExecutionError& err)
{
    if (overwrite && !removeExistingDestination(plan.destination(), "rename", err)) return false;
    if (!QFile::rename(plan.source(), plan.destination())) {
        return fail(err, ExecutionError::Kind::Io, "rename",
                    QString("failed to rename %1 to %2").arg(plan.source(), plan.destination()));
    }
    return true;
}

bool PlanExecutor::runCopy(const ConversionPlan& plan, bool overwrite, ExecutionError& err)
{
    const QString parent = QFileInfo(plan.destination()).absolutePath();
    QTemporaryFile tmp(QDir(parent).filePath(QString(kTempPrefix) + "XXXXXX"));
    if (!tmp.open()) {
        return fail(err, ExecutionError::Kind::Io, "copy",
                    QString("failed to create temp file in %1: %2").arg(parent, tmp.errorString()));
    }

    QString msg;
    if (!copyFileContents(plan.source(), tmp, &msg)) {
        return fail(err, ExecutionError::Kind::Io, "copy", msg);
    }
    tmp.setPermissions(QFile::permissions(plan.source()));
    tmp.close();

    if (overwrite && !removeExistingDestination(plan.destination(), "copy", err)) return false;
    if (!tmp.rename(plan.destination())) {
        return fail(err, ExecutionError::Kind::Io, "copy",
                    QString("failed to move temp file into %1: %2").arg(plan.destination(), tmp.errorString()));
    }
    tmp.setAutoRemove(false);
    return true;
}

bool PlanExecutor::runConvert(const ConversionPlan& plan, bool overwrite, ExecutionError& err)
{
    if (plan.backend() == Backend::None) {
        return fail(err, ExecutionError::Kind::Unsupported, "convert",
                    QString("no backend available to convert .%1 to .%2")
                        .arg(plan.sourceExtension(), plan.destinationExtension()));
    }

    // Removed with everything in it when this scope ends
    const QString parent = QFileInfo(plan.destination()).absolutePath();
    QTemporaryDir tmpDir(QDir(parent).filePath(QString(kTempPrefix) + "XXXXXX"));
    if (!tmpDir.isValid()) {
        return fail(err, ExecutionError::Kind::Io, "convert",
                    QString("failed to create temp directory in %1: %2").arg(parent, tmpDir.errorString()));
    }
    const QString ext = plan.destinationExtension();
    const QString tempOut = tmpDir.filePath(ext.isEmpty() ? QStringLiteral("output.out") : "output." + ext);

    if (!invokeBackend(plan, tmpDir.path(), tempOut, err)) return false;

    if (FileUtils::fileSize(tempOut) <= 0) {
        return fail(err, ExecutionError::Kind::OutputEmpty, "convert", "output file is empty");
    }

    if (overwrite && !removeExistingDestination(plan.destination(), "finalize", err)) return false;
    if (!QFile::rename(tempOut, plan.destination())) {
        return fail(err, ExecutionError::Kind::Io, "finalize",
                    QString("failed to move output into %1").arg(plan.destination()));
    }

    if (plan.moveSource() && !QFile::remove(plan.source())) {
        return fail(err, ExecutionError::Kind::Io, "remove-source",
                    QString("converted, but failed to remove source %1").arg(plan.source()));
    }
    return true;
}

bool PlanExecutor::invokeBackend(const ConversionPlan& plan, const QString& tempDir, const QString& tempOut,
                                 ExecutionError& err)
{
    const QString label = plan.source();
    switch (plan.backend()) {
        case Backend::ImageMagick:
            return runTool(CommandBuilder::imageMagick(plan, plan.source(), tempOut, m_tools), label, 0.0, err);

        case Backend::Ffmpeg: {
            MediaProbeInfo info;
            bool haveInfo = false;
            const FfmpegMode mode = chooseFfmpegMode(plan, info, haveInfo);
            qInfo().noquote() << "[Executor] ffmpeg mode"
                              << (mode == FfmpegMode::StreamCopy ? "stream-copy" : "transcode");
            return runTool(CommandBuilder::ffmpeg(plan, mode, plan.source(), tempOut, m_tools), label,
                           haveInfo ? info.durationSeconds : 0.0, err);
        }

        case Backend::LibreOffice: {
            if (!runTool(CommandBuilder::libreOffice(plan, plan.source(), tempDir, m_tools), label, 0.0, err)) {
                return false;
            }
            // soffice names its output after the source stem
            const QString produced = QDir(tempDir).filePath(QFileInfo(plan.source()).completeBaseName() + ".pdf");
            if (!FileUtils::fileExists(produced)) {
                return fail(err, ExecutionError::Kind::OutputEmpty, "convert",
                            QString("LibreOffice did not produce %1").arg(QFileInfo(produced).fileName()));
            }
            if (produced != tempOut && !QFile::rename(produced, tempOut)) {
                return fail(err, ExecutionError::Kind::Io, "convert",
                            QString("failed to move %1 into place").arg(produced));
            }
            return true;
        }

        case Backend::None:
            break;
    }
    return fail(err, ExecutionError::Kind::Unsupported, "convert", "no backend available for conversion");
}

FfmpegMode PlanExecutor::chooseFfmpegMode(const ConversionPlan& plan, MediaProbeInfo& info, bool& haveInfo)
{
    haveInfo = false;
    if (m_prober) {
        QString msg;
        const MediaProbe::ProbeResult r = m_prober(plan.source(), info, &msg);
        switch (r) {
            case MediaProbe::ProbeResult::Ok:
                haveInfo = true;
                break;
            case MediaProbe::ProbeResult::Unavailable:
                qWarning().noquote() << "Warning:" << msg;
                break;
            case MediaProbe::ProbeResult::Failed:
                qWarning().noquote() << "Warning: ffprobe failed; continuing without it:" << msg;
                break;
        }
    }
    return ModeDecider::decide(plan, haveInfo ? &info : nullptr);
}

bool PlanExecutor::runTool(const ToolCommand& command, const QString& label, double durationSeconds,
                           ExecutionError& err)
{
    const ToolRunResult r = ToolRunner::run(command, m_sink, label, durationSeconds);
    switch (r.status) {
        case ToolRunResult::Status::Ok:
            return true;
        case ToolRunResult::Status::NotFound:
            err.tool = command.tool;
            err.installHint = command.installHint;
            return fail(err, ExecutionError::Kind::ToolMissing, "convert",
                        QString("%1 not found").arg(command.tool));
        case ToolRunResult::Status::Failed:
            err.tool = command.tool;
            err.exitCode = r.exitCode;
            return fail(err, ExecutionError::Kind::ToolFailure, "convert",
                        QString("%1 exited with status %2").arg(command.tool).arg(r.exitCode));
        case ToolRunResult::Status::Crashed:
            err.tool = command.tool;
            err.exitCode = r.exitCode;
            return fail(err, ExecutionError::Kind::ToolFailure, "convert",
                        QString("%1 terminated abnormally").arg(command.tool));
    }
    return false;
}
