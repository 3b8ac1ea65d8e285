#include "plan_report.h"
#include "conversion_plan.h"

#include <QJsonArray>
#include <QStringList>

namespace {

QString yesNo(bool v)
{
    return v ? QStringLiteral("yes") : QStringLiteral("no");
}

QJsonValue orNull(const QString& s)
{
    return s.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(s);
}

QJsonValue optionOrNull(bool set, const QString& value)
{
    return set ? QJsonValue(value) : QJsonValue(QJsonValue::Null);
}

} // namespace

namespace PlanReport {

QString renderText(const ConversionPlan& plan, bool overwrite)
{
    const ConversionOptions& o = plan.options();
    const DetectedType& d = plan.detected();

    QStringList lines;
    lines << QString("Source: %1").arg(plan.source());
    lines << QString("Destination: %1").arg(plan.destination());
    QString detected = QString("Detected: %1").arg(d.mime.isEmpty() ? QStringLiteral("unknown") : d.mime);
    if (!d.systemMime.isEmpty()) detected += QString(" (file: %1)").arg(d.systemMime);
    lines << detected;
    if (!d.extension.isEmpty()) lines << QString("Detected extension: %1").arg(d.extension);
    lines << QString("Strategy: %1").arg(MediaTypes::strategyName(plan.strategy()));
    if (!plan.destinationExtension().isEmpty()) {
        lines << QString("Destination extension: %1").arg(plan.destinationExtension());
    }
    if (plan.strategy() == Strategy::Convert) {
        lines << QString("Backend: %1").arg(plan.backend() == Backend::None
                                                ? QStringLiteral("none")
                                                : MediaTypes::backendName(plan.backend()));
    }
    lines << QString("Destination kind: %1").arg(MediaTypes::mediaKindName(plan.destinationKind()));

    if (o.hasImageQuality()) lines << QString("Image quality: %1").arg(o.imageQuality);
    if (o.hasVideoBitrate()) lines << QString("Video bitrate: %1").arg(o.videoBitrate);
    if (o.hasAudioBitrate()) lines << QString("Audio bitrate: %1").arg(o.audioBitrate);
    if (o.hasPreset()) lines << QString("Preset: %1").arg(o.preset);
    if (o.hasVideoCodec()) lines << QString("Video codec: %1").arg(o.videoCodec);
    if (o.hasAudioCodec()) lines << QString("Audio codec: %1").arg(o.audioCodec);
    if (plan.backend() == Backend::Ffmpeg) {
        lines << QString("FFmpeg mode: %1").arg(MediaTypes::preferenceName(o.ffmpegPreference));
    }
    if (!plan.commandPreview().isEmpty()) {
        lines << QString("Command preview: %1").arg(plan.commandPreview());
    }

    lines << QString("Move source: %1").arg(yesNo(plan.moveSource()));
    lines << QString("Overwrite: %1").arg(yesNo(overwrite));
    lines << QString("Backup: %1").arg(yesNo(plan.backup()));
    for (const QString& note : plan.notes()) {
        lines << QString("Note: %1").arg(note);
    }
    return lines.join('\n');
}

QJsonObject renderJson(const ConversionPlan& plan, bool overwrite)
{
    const ConversionOptions& o = plan.options();
    const DetectedType& d = plan.detected();

    QJsonObject options;
    options["image_quality"] = o.hasImageQuality() ? QJsonValue(o.imageQuality) : QJsonValue(QJsonValue::Null);
    options["video_bitrate"] = optionOrNull(o.hasVideoBitrate(), o.videoBitrate);
    options["audio_bitrate"] = optionOrNull(o.hasAudioBitrate(), o.audioBitrate);
    options["preset"] = optionOrNull(o.hasPreset(), o.preset);
    options["video_codec"] = optionOrNull(o.hasVideoCodec(), o.videoCodec);
    options["audio_codec"] = optionOrNull(o.hasAudioCodec(), o.audioCodec);
    options["ffmpeg_mode"] = MediaTypes::preferenceName(o.ffmpegPreference);

    QJsonObject obj;
    obj["source"] = plan.source();
    obj["destination"] = plan.destination();
    obj["detected_mime"] = orNull(d.mime);
    obj["detected_extension"] = orNull(d.extension);
    obj["system_mime"] = orNull(d.systemMime);
    obj["strategy"] = MediaTypes::strategyName(plan.strategy());
    obj["backend"] = orNull(MediaTypes::backendName(plan.backend()));
    obj["destination_kind"] = MediaTypes::mediaKindName(plan.destinationKind());
    obj["destination_extension"] = orNull(plan.destinationExtension());
    obj["move_source"] = plan.moveSource();
    obj["overwrite"] = overwrite;
    obj["backup"] = plan.backup();
    obj["options"] = options;
    obj["notes"] = QJsonArray::fromStringList(plan.notes());
    obj["command_preview"] = orNull(plan.commandPreview());
    return obj;
}

} // namespace PlanReport
