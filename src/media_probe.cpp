#include "media_probe.h"
#include "file_utils.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QProcess>

#ifdef HAVE_FFMPEG
extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/avutil.h>
#include <libavutil/log.h>
}
#endif

namespace {
#ifndef HAVE_FFMPEG
constexpr int kProbeStartTimeoutMs = 5000;
constexpr int kProbeFinishTimeoutMs = 30000;
#endif

#ifdef HAVE_FFMPEG
MediaProbe::ProbeResult probeWithLibav(const QString& filePath, MediaProbeInfo& out, QString* errorMessage)
{
    // Reduce FFmpeg logging noise
    static bool logLevelSet = false;
    if (!logLevelSet) {
        av_log_set_level(AV_LOG_ERROR);
        logLevelSet = true;
    }

    AVFormatContext* fmtCtx = nullptr;
    QByteArray localPath = QFile::encodeName(filePath);
    int ret = avformat_open_input(&fmtCtx, localPath.constData(), nullptr, nullptr);
    if (ret < 0) {
        if (errorMessage) *errorMessage = QString("avformat_open_input failed (%1)").arg(ret);
        return MediaProbe::ProbeResult::Failed;
    }

    ret = avformat_find_stream_info(fmtCtx, nullptr);
    if (ret < 0) {
        if (errorMessage) *errorMessage = QString("avformat_find_stream_info failed (%1)").arg(ret);
        avformat_close_input(&fmtCtx);
        return MediaProbe::ProbeResult::Failed;
    }

    if (fmtCtx->duration != AV_NOPTS_VALUE && fmtCtx->duration > 0) {
        out.durationSeconds = static_cast<double>(fmtCtx->duration) / AV_TIME_BASE;
    }

    auto codecNameOf = [fmtCtx](int idx) {
        if (idx < 0) return QString();
        AVStream* st = fmtCtx->streams[idx];
        AVCodecParameters* par = st ? st->codecpar : nullptr;
        if (!par) return QString();
        // avcodec_get_name yields the same short names ffprobe reports (h264, aac, ...)
        const char* name = avcodec_get_name(par->codec_id);
        return name ? QString::fromUtf8(name) : QString();
    };

    out.videoCodec = codecNameOf(av_find_best_stream(fmtCtx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0));
    out.audioCodec = codecNameOf(av_find_best_stream(fmtCtx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0));

    avformat_close_input(&fmtCtx);
    return MediaProbe::ProbeResult::Ok;
}
#else
MediaProbe::ProbeResult probeWithFfprobe(const QString& ffprobe, const QString& filePath,
                                         MediaProbeInfo& out, QString* errorMessage)
{
    const QString exe = FileUtils::resolveExecutable(ffprobe);
    if (exe.isEmpty()) {
        if (errorMessage) *errorMessage = "ffprobe not found; install ffmpeg to enable stream-copy detection.";
        return MediaProbe::ProbeResult::Unavailable;
    }

    QProcess p;
    p.start(exe, {"-v", "error", "-show_format", "-show_streams", "-print_format", "json", filePath});
    if (!p.waitForStarted(kProbeStartTimeoutMs)) {
        if (errorMessage) *errorMessage = "ffprobe not found; install ffmpeg to enable stream-copy detection.";
        return MediaProbe::ProbeResult::Unavailable;
    }
    if (!p.waitForFinished(kProbeFinishTimeoutMs)) {
        p.kill();
        p.waitForFinished(1000);
        if (errorMessage) *errorMessage = "ffprobe timed out";
        return MediaProbe::ProbeResult::Failed;
    }
    if (p.exitStatus() != QProcess::NormalExit || p.exitCode() != 0) {
        const QString stderrText = QString::fromUtf8(p.readAllStandardError()).trimmed();
        if (errorMessage) {
            *errorMessage = QString("ffprobe exited with status %1").arg(p.exitCode());
            if (!stderrText.isEmpty()) *errorMessage += ": " + stderrText;
        }
        return MediaProbe::ProbeResult::Failed;
    }
    return MediaProbe::parseFfprobeJson(p.readAllStandardOutput(), out, errorMessage)
        ? MediaProbe::ProbeResult::Ok : MediaProbe::ProbeResult::Failed;
}
#endif
} // namespace

namespace MediaProbe {

bool parseFfprobeJson(const QByteArray& json, MediaProbeInfo& out, QString* errorMessage)
{
    out = MediaProbeInfo();

    QJsonParseError perr{};
    const QJsonDocument doc = QJsonDocument::fromJson(json, &perr);
    if (perr.error != QJsonParseError::NoError || !doc.isObject()) {
        if (errorMessage) *errorMessage = QString("invalid ffprobe output: %1").arg(perr.errorString());
        return false;
    }
    const QJsonObject root = doc.object();

    // ffprobe reports duration as a decimal string
    const QJsonValue durVal = root.value("format").toObject().value("duration");
    bool ok = false;
    const double dur = durVal.isString() ? durVal.toString().toDouble(&ok) : durVal.toDouble();
    if ((ok || durVal.isDouble()) && dur > 0.0) out.durationSeconds = dur;

    const QJsonArray streams = root.value("streams").toArray();
    for (const QJsonValue& v : streams) {
        const QJsonObject s = v.toObject();
        const QString type = s.value("codec_type").toString();
        const QString name = s.value("codec_name").toString();
        if (type == "video" && out.videoCodec.isEmpty()) out.videoCodec = name;
        else if (type == "audio" && out.audioCodec.isEmpty()) out.audioCodec = name;
    }
    return true;
}

ProbeResult probeMediaFile(const QString& filePath, MediaProbeInfo& out, QString* errorMessage,
                           const QString& ffprobe)
{
    out = MediaProbeInfo();
    if (!FileUtils::fileExists(filePath)) {
        if (errorMessage) *errorMessage = QString("no such file: %1").arg(filePath);
        return ProbeResult::Failed;
    }
#ifdef HAVE_FFMPEG
    Q_UNUSED(ffprobe);
    return probeWithLibav(filePath, out, errorMessage);
#else
    return probeWithFfprobe(ffprobe, filePath, out, errorMessage);
#endif
}

} // namespace MediaProbe
