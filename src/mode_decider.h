#pragma once

#include "media_types.h"

class ConversionPlan;

namespace ModeDecider {

// Chooses stream copy or transcode for an ffmpeg conversion.
// probe may be null when probing was unavailable or failed.
FfmpegMode decide(const ConversionPlan& plan, const MediaProbeInfo* probe);

// Rule table without a plan, for callers that only have the pieces
FfmpegMode decide(FfmpegPreference preference, MediaKind destKind, const QString& destExt,
                  const MediaProbeInfo* probe);

} // namespace ModeDecider
