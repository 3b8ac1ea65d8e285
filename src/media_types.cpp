#include "media_types.h"

namespace MediaTypes {

QString strategyName(Strategy s)
{
    switch (s) {
        case Strategy::RenameOnly: return QStringLiteral("rename");
        case Strategy::CopyOnly:   return QStringLiteral("copy");
        case Strategy::Convert:    return QStringLiteral("convert");
    }
    return QString();
}

QString backendName(Backend b)
{
    switch (b) {
        case Backend::None:        return QString();
        case Backend::ImageMagick: return QStringLiteral("imagemagick");
        case Backend::Ffmpeg:      return QStringLiteral("ffmpeg");
        case Backend::LibreOffice: return QStringLiteral("libreoffice");
    }
    return QString();
}

QString mediaKindName(MediaKind k)
{
    switch (k) {
        case MediaKind::Image:    return QStringLiteral("image");
        case MediaKind::Audio:    return QStringLiteral("audio");
        case MediaKind::Video:    return QStringLiteral("video");
        case MediaKind::Document: return QStringLiteral("document");
        case MediaKind::Other:    return QStringLiteral("other");
    }
    return QString();
}

QString preferenceName(FfmpegPreference p)
{
    switch (p) {
        case FfmpegPreference::Auto:       return QStringLiteral("auto");
        case FfmpegPreference::StreamCopy: return QStringLiteral("stream-copy");
        case FfmpegPreference::Transcode:  return QStringLiteral("transcode");
    }
    return QString();
}

bool parsePreference(const QString& text, FfmpegPreference& out)
{
    const QString v = text.trimmed().toLower();
    if (v == "auto") {
        out = FfmpegPreference::Auto;
    } else if (v == "stream-copy" || v == "stream_copy") {
        out = FfmpegPreference::StreamCopy;
    } else if (v == "transcode") {
        out = FfmpegPreference::Transcode;
    } else {
        return false;
    }
    return true;
}

} // namespace MediaTypes
