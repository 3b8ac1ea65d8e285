#pragma once

#include <QByteArray>
#include <QString>

#include "media_types.h"

namespace MediaProbe {

enum class ProbeResult { Ok, Unavailable, Failed };

// Probes a media file for duration and the first video/audio codec names.
// Uses libavformat in-process when built with FFmpeg, otherwise runs ffprobe.
// On anything but Ok, errorMessage describes why; callers treat that as a warning.
ProbeResult probeMediaFile(const QString& filePath, MediaProbeInfo& out, QString* errorMessage = nullptr,
                           const QString& ffprobe = QStringLiteral("ffprobe"));

// Parses `ffprobe -show_format -show_streams -print_format json` output.
bool parseFfprobeJson(const QByteArray& json, MediaProbeInfo& out, QString* errorMessage = nullptr);

} // namespace MediaProbe
