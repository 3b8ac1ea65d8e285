#pragma once

#include <QString>
#include <functional>

#include "command_builder.h"
#include "media_probe.h"
#include "media_types.h"

class ConversionPlan;
class ProgressSink;
class QFile;

// Structured failure of one plan execution
struct ExecutionError {
    enum class Kind { None, Precondition, Unsupported, ToolMissing, ToolFailure, OutputEmpty, Io };

    Kind kind = Kind::None;
    QString step;        // prepare, backup, rename, copy, convert, finalize, remove-source
    QString message;
    QString tool;        // ToolMissing / ToolFailure
    int exitCode = 0;    // ToolFailure
    QString installHint; // ToolMissing

    bool isError() const { return kind != Kind::None; }
    QString toString() const;
    static QString kindName(Kind kind);
};

// Carries out one plan: staged output, backup or overwrite of an existing
// destination, backend invocation and atomic finalize. The source is deleted
// only after the destination is in place.
class PlanExecutor {
public:
    using ProbeFunction = std::function<MediaProbe::ProbeResult(const QString&, MediaProbeInfo&, QString*)>;

    static constexpr int kMaxBackupAttempts = 1000;
    static constexpr const char* kTempPrefix = ".mvx.tmp";

    explicit PlanExecutor(ProgressSink& sink);

    void setToolPaths(const ToolPaths& tools) { m_tools = tools; }
    const ToolPaths& toolPaths() const { return m_tools; }
    // Replaces the default MediaProbe::probeMediaFile
    void setProber(ProbeFunction prober) { m_prober = std::move(prober); }

    // Emits started, then any updates, then exactly one finished for plan.source()
    bool execute(const ConversionPlan& plan, bool overwrite, ExecutionError* error = nullptr);

    // <dest>.bak, then <dest>.bak.1 ... <dest>.bak.1000; empty when all are taken
    static QString availableBackupPath(const QString& destination);
    static bool copyFileContents(const QString& src, QFile& out, QString* errorOut);

private:
    bool prepareDestination(const ConversionPlan& plan, bool overwrite, ExecutionError& err);
    bool runRename(const ConversionPlan& plan, bool overwrite, ExecutionError& err);
    bool runCopy(const ConversionPlan& plan, bool overwrite, ExecutionError& err);
    bool runConvert(const ConversionPlan& plan, bool overwrite, ExecutionError& err);
    bool invokeBackend(const ConversionPlan& plan, const QString& tempDir, const QString& tempOut,
                       ExecutionError& err);
    bool runTool(const ToolCommand& command, const QString& label, double durationSeconds, ExecutionError& err);
    FfmpegMode chooseFfmpegMode(const ConversionPlan& plan, MediaProbeInfo& info, bool& haveInfo);
    bool removeExistingDestination(const QString& destination, const QString& step, ExecutionError& err);

    ProgressSink& m_sink;
    ToolPaths m_tools;
    ProbeFunction m_prober;
};
