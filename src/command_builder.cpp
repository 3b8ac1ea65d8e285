#include "command_builder.h"
#include "conversion_plan.h"
#include "file_type_helpers.h"

#include <QRegularExpression>

namespace {

QString quoteArg(const QString& arg)
{
    static const QRegularExpression rxPlain("^[A-Za-z0-9_@%+=:,./\\[\\]<>-]+$");
    if (!arg.isEmpty() && rxPlain.match(arg).hasMatch()) return arg;
    QString escaped = arg;
    escaped.replace("'", "'\\''");
    return QString("'%1'").arg(escaped);
}

QStringList streamCopyArgs()
{
    return {"-c", "copy"};
}

} // namespace

namespace CommandBuilder {

QString defaultVideoCodec(const QString& destExt)
{
    const QString ext = normalizeExtension(destExt);
    if (ext == "mp4" || ext == "mov" || ext == "mkv" || ext == "avi") return QStringLiteral("libx264");
    if (ext == "webm") return QStringLiteral("libvpx-vp9");
    return QString();
}

QString defaultAudioCodec(const QString& destExt)
{
    const QString ext = normalizeExtension(destExt);
    // Audio-only containers
    if (ext == "mp3") return QStringLiteral("libmp3lame");
    if (ext == "flac") return QStringLiteral("flac");
    if (ext == "wav") return QStringLiteral("pcm_s16le");
    if (ext == "opus") return QStringLiteral("libopus");
    if (ext == "ogg") return QStringLiteral("libvorbis");
    if (ext == "m4a" || ext == "aac") return QStringLiteral("aac");
    // Audio track inside video containers
    if (ext == "mp4" || ext == "mov" || ext == "mkv" || ext == "avi") return QStringLiteral("aac");
    if (ext == "webm") return QStringLiteral("libopus");
    return QString();
}

QStringList transcodeArgs(const ConversionPlan& plan)
{
    const ConversionOptions& o = plan.options();
    QStringList args;
    switch (plan.destinationKind()) {
        case MediaKind::Video: {
            const QString vcodec = o.hasVideoCodec() ? o.videoCodec : defaultVideoCodec(plan.destinationExtension());
            if (!vcodec.isEmpty()) args << "-c:v" << vcodec;
            if (o.hasVideoBitrate()) args << "-b:v" << o.videoBitrate;
            if (o.hasPreset()) args << "-preset" << o.preset;
            const QString acodec = o.hasAudioCodec() ? o.audioCodec : defaultAudioCodec(plan.destinationExtension());
            if (!acodec.isEmpty()) args << "-c:a" << acodec;
            if (o.hasAudioBitrate()) args << "-b:a" << o.audioBitrate;
            break;
        }
        case MediaKind::Audio: {
            const QString acodec = o.hasAudioCodec() ? o.audioCodec : defaultAudioCodec(plan.destinationExtension());
            if (!acodec.isEmpty()) args << "-c:a" << acodec;
            if (o.hasAudioBitrate()) args << "-b:a" << o.audioBitrate;
            break;
        }
        default:
            break;
    }
    return args;
}

ToolCommand imageMagick(const ConversionPlan& plan, const QString& input, const QString& output,
                        const ToolPaths& tools)
{
    ToolCommand cmd;
    cmd.tool = QStringLiteral("ImageMagick");
    cmd.candidates = tools.magick;
    cmd.installHint = QStringLiteral("ImageMagick not found; install it (e.g., apt install imagemagick)");

    // Rasterize only the first page of a PDF
    const bool firstPageOnly = isPdfFile(plan.sourceExtension()) && !isPdfFile(plan.destinationExtension());
    cmd.args << (firstPageOnly ? input + "[0]" : input);
    if (plan.options().hasImageQuality()) {
        cmd.args << "-quality" << QString::number(plan.options().imageQuality);
    }
    cmd.args << output;
    return cmd;
}

ToolCommand ffmpeg(const ConversionPlan& plan, FfmpegMode mode, const QString& input, const QString& output,
                   const ToolPaths& tools)
{
    ToolCommand cmd;
    cmd.tool = QStringLiteral("ffmpeg");
    cmd.candidates = QStringList{tools.ffmpeg};
    cmd.installHint = QStringLiteral("ffmpeg not found; install it (e.g., apt install ffmpeg)");
    cmd.reportsProgress = true;

    cmd.args << "-nostdin" << "-y" << "-hide_banner" << "-nostats" << "-loglevel" << "error"
             << "-i" << input;
    cmd.args << (mode == FfmpegMode::StreamCopy ? streamCopyArgs() : transcodeArgs(plan));
    cmd.args << "-progress" << "pipe:1" << output;
    return cmd;
}

ToolCommand libreOffice(const ConversionPlan& plan, const QString& input, const QString& outDir,
                        const ToolPaths& tools)
{
    Q_UNUSED(plan);
    ToolCommand cmd;
    cmd.tool = QStringLiteral("LibreOffice");
    cmd.candidates = QStringList{tools.soffice};
    cmd.installHint = QStringLiteral("LibreOffice not found; install libreoffice (e.g., apt install libreoffice)");
    cmd.args << "--headless" << "--convert-to" << "pdf" << "--outdir" << outDir << input;
    return cmd;
}

QString formatCommandLine(const QString& program, const QStringList& args)
{
    QStringList parts;
    parts << quoteArg(program);
    for (const QString& a : args) parts << quoteArg(a);
    return parts.join(' ');
}

QString preview(const ConversionPlan& plan, const ToolPaths& tools)
{
    if (plan.strategy() != Strategy::Convert) return QString();

    auto render = [](const ToolCommand& cmd) {
        return formatCommandLine(cmd.candidates.value(0), cmd.args);
    };

    switch (plan.backend()) {
        case Backend::ImageMagick:
            return render(imageMagick(plan, plan.source(), plan.destination(), tools));
        case Backend::Ffmpeg:
            switch (plan.options().ffmpegPreference) {
                case FfmpegPreference::StreamCopy:
                    return render(ffmpeg(plan, FfmpegMode::StreamCopy, plan.source(), plan.destination(), tools));
                case FfmpegPreference::Transcode:
                    return render(ffmpeg(plan, FfmpegMode::Transcode, plan.source(), plan.destination(), tools));
                case FfmpegPreference::Auto:
                    return QString("%1 (if compatible), else %2")
                        .arg(render(ffmpeg(plan, FfmpegMode::StreamCopy, plan.source(), plan.destination(), tools)),
                             render(ffmpeg(plan, FfmpegMode::Transcode, plan.source(), plan.destination(), tools)));
            }
            break;
        case Backend::LibreOffice:
            return render(libreOffice(plan, plan.source(), QStringLiteral("<temp>"), tools));
        case Backend::None:
            break;
    }
    return QString();
}

} // namespace CommandBuilder
