#pragma once

#include <QString>
#include <QStringList>

#include "media_types.h"

class ConversionPlan;

// Executable names or paths for every external program the tool may run.
struct ToolPaths {
    QStringList magick = {"magick", "convert"}; // tried in order
    QString ffmpeg = QStringLiteral("ffmpeg");
    QString ffprobe = QStringLiteral("ffprobe");
    QString soffice = QStringLiteral("soffice");
    QString file = QStringLiteral("file");
};

// One backend invocation: the candidates are tried in order until one can be started.
struct ToolCommand {
    QString tool;             // display name used in errors and progress labels
    QStringList candidates;
    QStringList args;
    QString installHint;
    bool reportsProgress = false; // true when stdout carries ffmpeg -progress output
};

// The single place backend arguments are assembled. Both the plan preview and the
// executor go through these functions.
namespace CommandBuilder {

ToolCommand imageMagick(const ConversionPlan& plan, const QString& input, const QString& output,
                        const ToolPaths& tools = ToolPaths());
ToolCommand ffmpeg(const ConversionPlan& plan, FfmpegMode mode, const QString& input, const QString& output,
                   const ToolPaths& tools = ToolPaths());
ToolCommand libreOffice(const ConversionPlan& plan, const QString& input, const QString& outDir,
                        const ToolPaths& tools = ToolPaths());

// Codec/bitrate/preset flags for transcode mode, with destination defaults applied
QStringList transcodeArgs(const ConversionPlan& plan);
QString defaultVideoCodec(const QString& destExt);
QString defaultAudioCodec(const QString& destExt);

// Shell-like rendering of a command for display
QString formatCommandLine(const QString& program, const QStringList& args);
// Preview of what the executor will run; empty when nothing external runs
QString preview(const ConversionPlan& plan, const ToolPaths& tools = ToolPaths());

} // namespace CommandBuilder
