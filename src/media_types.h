#pragma once

#include <QString>

// Top-level operation kind, decided from normalized extensions only
enum class Strategy { RenameOnly, CopyOnly, Convert };

enum class Backend { None, ImageMagick, Ffmpeg, LibreOffice };

// Classification of a destination extension
enum class MediaKind { Image, Audio, Video, Document, Other };

enum class FfmpegPreference { Auto, StreamCopy, Transcode };

enum class FfmpegMode { StreamCopy, Transcode };

// A null QString means "not set"; an empty but non-null string is a supplied value
// and is subject to validation.
struct ConversionOptions {
    bool imageQualitySet = false;
    int imageQuality = 0;          // 1..100 when set
    QString videoBitrate;          // e.g. "2500k"
    QString audioBitrate;          // e.g. "192k"
    QString preset;                // x264-style preset name
    QString videoCodec;
    QString audioCodec;
    FfmpegPreference ffmpegPreference = FfmpegPreference::Auto;

    void setImageQuality(int q) { imageQualitySet = true; imageQuality = q; }
    bool hasImageQuality() const { return imageQualitySet; }
    bool hasVideoBitrate() const { return !videoBitrate.isNull(); }
    bool hasAudioBitrate() const { return !audioBitrate.isNull(); }
    bool hasPreset() const { return !preset.isNull(); }
    bool hasVideoCodec() const { return !videoCodec.isNull(); }
    bool hasAudioCodec() const { return !audioCodec.isNull(); }
};

// Metadata probed from a source at execution time. Empty codec = stream absent or unknown.
struct MediaProbeInfo {
    double durationSeconds = 0.0;  // <= 0 when unknown
    QString videoCodec;
    QString audioCodec;

    bool hasDuration() const { return durationSeconds > 0.0; }
};

namespace MediaTypes {

QString strategyName(Strategy s);
QString backendName(Backend b);
QString mediaKindName(MediaKind k);
QString preferenceName(FfmpegPreference p);
// Accepts "auto", "stream-copy", "stream_copy" and "transcode"
bool parsePreference(const QString& text, FfmpegPreference& out);

} // namespace MediaTypes
