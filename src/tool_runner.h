#pragma once

#include <QString>

#include "command_builder.h"

class ProgressSink;

struct ToolRunResult {
    enum class Status { Ok, NotFound, Failed, Crashed };

    Status status = Status::NotFound;
    QString program;   // the candidate that was started
    int exitCode = 0;
};

// Runs one backend command to completion. Candidates are tried in order; a candidate
// that cannot be resolved or started is skipped. The child's stderr is forwarded to
// ours untouched. stdout is either parsed as ffmpeg progress or discarded, and it is
// drained continuously so the child never blocks on a full pipe.
class ToolRunner {
public:
    static constexpr int kPollIntervalMs = 150;

    static ToolRunResult run(const ToolCommand& command, ProgressSink& sink, const QString& label,
                             double durationSeconds = 0.0);
};
