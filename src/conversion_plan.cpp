#include "conversion_plan.h"
#include "command_builder.h"
#include "file_type_helpers.h"
#include "file_utils.h"

#include <QDebug>

namespace {

void normalizeOptions(ConversionOptions& o)
{
    if (o.hasPreset()) o.preset = o.preset.trimmed().toLower();
    if (o.hasVideoCodec()) o.videoCodec = o.videoCodec.trimmed();
    if (o.hasAudioCodec()) o.audioCodec = o.audioCodec.trimmed();
}

} // namespace

const QStringList& Planner::presets()
{
    static const QStringList values = {
        "ultrafast", "superfast", "veryfast", "faster", "fast",
        "medium", "slow", "slower", "veryslow"
    };
    return values;
}

bool Planner::isValidBitrate(const QString& value)
{
    // Surrounding whitespace is rejected, not trimmed
    QString digits = value;
    if (digits.isEmpty()) return false;
    const QChar last = digits.back();
    if (last == 'k' || last == 'K' || last == 'm' || last == 'M') {
        digits.chop(1);
    }
    if (digits.isEmpty()) return false;
    for (const QChar c : digits) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

bool Planner::isValidPreset(const QString& value)
{
    return presets().contains(value.trimmed().toLower());
}

bool Planner::validateOptions(const ConversionOptions& o, QString* errorMessage)
{
    auto fail = [errorMessage](const QString& msg) {
        if (errorMessage) *errorMessage = msg;
        return false;
    };

    if (o.hasImageQuality() && (o.imageQuality < 1 || o.imageQuality > 100)) {
        return fail("image quality must be between 1 and 100");
    }
    if (o.hasVideoBitrate() && !isValidBitrate(o.videoBitrate)) {
        return fail(QString("invalid video bitrate '%1': expected digits with an optional k/K/m/M suffix").arg(o.videoBitrate));
    }
    if (o.hasAudioBitrate() && !isValidBitrate(o.audioBitrate)) {
        return fail(QString("invalid audio bitrate '%1': expected digits with an optional k/K/m/M suffix").arg(o.audioBitrate));
    }
    if (o.hasPreset() && !isValidPreset(o.preset)) {
        return fail(QString("invalid preset '%1': expected one of %2").arg(o.preset, presets().join(", ")));
    }
    if (o.hasVideoCodec() && o.videoCodec.trimmed().isEmpty()) {
        return fail("video codec must be a non-empty string");
    }
    if (o.hasAudioCodec() && o.audioCodec.trimmed().isEmpty()) {
        return fail("audio codec must be a non-empty string");
    }
    return true;
}

bool Planner::build(const PlanRequest& request, ConversionPlan& out, QString* errorMessage)
{
    if (request.source.isEmpty() || request.destination.isEmpty()) {
        if (errorMessage) *errorMessage = "source and destination are required";
        return false;
    }
    if (FileUtils::canonicalForm(request.source) == FileUtils::canonicalForm(request.destination)) {
        if (errorMessage) *errorMessage = "source and destination must differ";
        return false;
    }
    if (!validateOptions(request.options, errorMessage)) {
        return false;
    }

    ConversionPlan plan;
    plan.m_source = request.source;
    plan.m_destination = request.destination;
    plan.m_moveSource = request.moveSource;
    plan.m_backup = request.backup;
    plan.m_options = request.options;
    normalizeOptions(plan.m_options);
    plan.m_detected = TypeDetector::detect(request.source, request.sniffProgram);
    plan.m_sourceExt = extensionOf(request.source);
    plan.m_destExt = extensionOf(request.destination);
    plan.m_destKind = mediaKindForExtension(plan.m_destExt);

    // A missing extension on either side never counts as a match
    if (!plan.m_sourceExt.isEmpty() && plan.m_sourceExt == plan.m_destExt) {
        plan.m_strategy = request.moveSource ? Strategy::RenameOnly : Strategy::CopyOnly;
        plan.m_backend = Backend::None;
    } else {
        plan.m_strategy = Strategy::Convert;
        plan.m_backend = backendForPair(plan.m_sourceExt, plan.m_destExt);
    }

    if (plan.m_strategy == Strategy::Convert) {
        if (plan.m_backend == Backend::None) {
            plan.m_notes << "no supported backend found for this conversion";
        }
        if (plan.m_backend == Backend::Ffmpeg) {
            plan.m_notes << "ffprobe may be used at runtime to choose stream copy vs transcode";
        }
        if (isPdfFile(plan.m_sourceExt) && !isPdfFile(plan.m_destExt)
            && plan.m_backend == Backend::ImageMagick) {
            plan.m_notes << "PDF to image converts the first page only";
        }
    }
    if (!plan.m_moveSource) {
        plan.m_notes << "source will be kept";
    }
    plan.m_notes << adviseOptions(plan);

    plan.m_commandPreview = CommandBuilder::preview(plan);

    qDebug() << "[Planner]" << plan.m_source << "->" << plan.m_destination
             << MediaTypes::strategyName(plan.m_strategy) << MediaTypes::backendName(plan.m_backend);
    out = plan;
    return true;
}

QStringList Planner::adviseOptions(const ConversionPlan& plan)
{
    QStringList notes;
    const ConversionOptions& o = plan.m_options;
    const bool hasMediaOptions = o.hasVideoBitrate() || o.hasAudioBitrate() || o.hasPreset()
                                 || o.hasVideoCodec() || o.hasAudioCodec();

    const MediaKind kind = plan.m_destKind;

    if (o.hasImageQuality() && kind != MediaKind::Image) {
        notes << "image quality ignored for non-image output";
    }
    if (kind == MediaKind::Document && !isPdfImagePair(plan.m_sourceExt, plan.m_destExt)
        && (o.hasImageQuality() || hasMediaOptions)) {
        notes << "media options ignored for document conversions";
    }
    if (kind == MediaKind::Audio) {
        if (o.hasVideoBitrate()) notes << "video bitrate ignored for audio-only output";
        if (o.hasPreset()) notes << "preset ignored for audio-only output";
    }
    if (kind == MediaKind::Image) {
        if (o.hasVideoBitrate()) notes << "video bitrate ignored for image output";
        if (o.hasAudioBitrate()) notes << "audio bitrate ignored for image output";
        if (o.hasVideoCodec()) notes << "video codec ignored for image output";
        if (o.hasAudioCodec()) notes << "audio codec ignored for image output";
    }
    if (kind == MediaKind::Audio && o.hasVideoCodec()) {
        notes << "video codec ignored for audio-only output";
    }

    if (o.ffmpegPreference != FfmpegPreference::Auto && plan.m_backend != Backend::Ffmpeg) {
        notes << "ffmpeg mode preference ignored for non-ffmpeg backend";
    }

    if (o.ffmpegPreference == FfmpegPreference::StreamCopy) {
        if (o.hasVideoBitrate()) notes << "video bitrate ignored when stream copy is forced";
        if (o.hasAudioBitrate()) notes << "audio bitrate ignored when stream copy is forced";
        if (o.hasPreset()) notes << "preset ignored when stream copy is forced";
        if (o.hasVideoCodec()) notes << "video codec ignored when stream copy is forced";
        if (o.hasAudioCodec()) notes << "audio codec ignored when stream copy is forced";
    }
    return notes;
}
