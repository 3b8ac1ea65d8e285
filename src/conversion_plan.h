#pragma once

#include <QString>
#include <QStringList>

#include "media_types.h"
#include "type_detector.h"

// Input to plan construction
struct PlanRequest {
    QString source;
    QString destination;
    bool moveSource = false;
    bool backup = false;
    ConversionOptions options;
    QString sniffProgram = QStringLiteral("file"); // empty disables the external MIME sniff
};

// Immutable description of one source -> destination operation.
// Only Planner::build can populate one.
class ConversionPlan {
public:
    ConversionPlan() = default;

    const QString& source() const { return m_source; }
    const QString& destination() const { return m_destination; }
    const DetectedType& detected() const { return m_detected; }
    Strategy strategy() const { return m_strategy; }
    Backend backend() const { return m_backend; }
    const QStringList& notes() const { return m_notes; }
    bool moveSource() const { return m_moveSource; }
    bool backup() const { return m_backup; }
    const ConversionOptions& options() const { return m_options; }
    const QString& sourceExtension() const { return m_sourceExt; }
    const QString& destinationExtension() const { return m_destExt; }
    MediaKind destinationKind() const { return m_destKind; }
    const QString& commandPreview() const { return m_commandPreview; }

    bool isValid() const { return !m_source.isEmpty(); }

private:
    friend class Planner;

    QString m_source;
    QString m_destination;
    DetectedType m_detected;
    Strategy m_strategy = Strategy::CopyOnly;
    Backend m_backend = Backend::None;
    QStringList m_notes;
    bool m_moveSource = false;
    bool m_backup = false;
    ConversionOptions m_options;
    QString m_sourceExt;       // normalized
    QString m_destExt;         // normalized
    MediaKind m_destKind = MediaKind::Other;
    QString m_commandPreview;  // empty unless strategy is Convert with a backend
};

class Planner {
public:
    // Builds a plan, or returns false with a validation message. Notes never fail a build.
    static bool build(const PlanRequest& request, ConversionPlan& out, QString* errorMessage = nullptr);

    static bool validateOptions(const ConversionOptions& options, QString* errorMessage = nullptr);
    static bool isValidBitrate(const QString& value);
    static bool isValidPreset(const QString& value);
    static const QStringList& presets();

private:
    static QStringList adviseOptions(const ConversionPlan& plan);
};
