#pragma once

#include <QSet>
#include <QString>

#include "media_types.h"

// Extension classification shared by the planner and the mode decider.
// All helpers accept an extension with or without a leading dot, in any case.

// Lowercase, strip a leading dot and fold aliases (jpeg -> jpg, htm -> html)
QString normalizeExtension(const QString& ext);
// Normalized extension of a path's last suffix; empty when the file name has none
QString extensionOf(const QString& path);

bool isImageFile(const QString& ext);
bool isVideoFile(const QString& ext);
bool isAudioFile(const QString& ext);
bool isMediaFile(const QString& ext);
bool isPdfFile(const QString& ext);
bool isDocumentFile(const QString& ext);

// Destination classification; pdf counts as a document
MediaKind mediaKindForExtension(const QString& ext);

// First matching conversion rule for a (source, destination) extension pair
Backend backendForPair(const QString& srcExt, const QString& dstExt);
bool isPdfImagePair(const QString& srcExt, const QString& dstExt);
