#pragma once

#include <QString>

// Best-effort classification of a source file. Advisory only: nothing in the
// strategy or backend selection reads these values.
struct DetectedType {
    QString mime;        // content-sniffed, empty when sniffing failed
    QString extension;   // lowercased suffix of the path
    QString systemMime;  // from `file --mime-type`, empty when unavailable
};

namespace TypeDetector {

// Never fails; every field degrades to empty. Pass an empty fileProgram to skip
// the external sniff.
DetectedType detect(const QString& path, const QString& fileProgram = QStringLiteral("file"));

} // namespace TypeDetector
