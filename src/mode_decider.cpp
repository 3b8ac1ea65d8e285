#include "mode_decider.h"
#include "conversion_plan.h"
#include "file_type_helpers.h"

#include <QSet>

namespace {

bool audioCompatible(const MediaProbeInfo& probe, const QSet<QString>& allowed)
{
    return probe.audioCodec.isEmpty() || allowed.contains(probe.audioCodec.toLower());
}

} // namespace

namespace ModeDecider {

FfmpegMode decide(FfmpegPreference preference, MediaKind destKind, const QString& destExt,
                  const MediaProbeInfo* probe)
{
    if (preference == FfmpegPreference::StreamCopy) return FfmpegMode::StreamCopy;
    if (preference == FfmpegPreference::Transcode) return FfmpegMode::Transcode;

    // Audio containers rarely accept the source's audio codec as is
    if (destKind == MediaKind::Audio) return FfmpegMode::Transcode;

    const QString ext = normalizeExtension(destExt);
    if (ext.isEmpty() || !probe) return FfmpegMode::Transcode;
    if (probe->videoCodec.isEmpty()) return FfmpegMode::Transcode;

    if (ext == "mkv") return FfmpegMode::StreamCopy;

    const QString vcodec = probe->videoCodec.toLower();
    if (ext == "mp4" || ext == "mov") {
        static const QSet<QString> video = {"h264", "hevc", "mpeg4", "av1"};
        static const QSet<QString> audio = {"aac", "mp3", "alac"};
        return (video.contains(vcodec) && audioCompatible(*probe, audio))
            ? FfmpegMode::StreamCopy : FfmpegMode::Transcode;
    }
    if (ext == "webm") {
        static const QSet<QString> video = {"vp8", "vp9", "av1"};
        static const QSet<QString> audio = {"opus", "vorbis"};
        return (video.contains(vcodec) && audioCompatible(*probe, audio))
            ? FfmpegMode::StreamCopy : FfmpegMode::Transcode;
    }
    return FfmpegMode::Transcode;
}

FfmpegMode decide(const ConversionPlan& plan, const MediaProbeInfo* probe)
{
    return decide(plan.options().ffmpegPreference, plan.destinationKind(), plan.destinationExtension(), probe);
}

} // namespace ModeDecider
