#pragma once

#include <QString>
#include <QStringList>

#include "command_builder.h"
#include "media_types.h"

class QSettings;

/**
 * @brief AppConfig - option profiles and tool locations from an INI file
 *
 * Layout:
 *   [default]        base conversion options
 *   [<name>]         profile selected with --profile <name>, overrides [default]
 *   [tools]          ffmpeg, ffprobe, magick, soffice, file executables
 *
 * Option keys: image_quality, video_bitrate, audio_bitrate, preset, video_codec,
 * audio_codec, ffmpeg_preference.
 */
class AppConfig {
public:
    static constexpr const char* kDefaultGroup = "default";
    static constexpr const char* kToolsGroup = "tools";

    // <GenericConfigLocation>/mvx/config.ini
    static QString defaultPath();

    // An explicit path must exist; a missing default file yields an empty config
    bool load(const QString& path, bool explicitPath, QString* errorMessage = nullptr);

    bool isLoaded() const { return !m_path.isEmpty(); }
    const QString& path() const { return m_path; }
    QStringList profiles() const;

    // [default] overlaid with the profile (empty = default only)
    bool options(const QString& profile, ConversionOptions& out, QString* errorMessage = nullptr) const;
    ToolPaths toolPaths() const;

private:
    static bool readOptionGroup(QSettings& s, const QString& group, ConversionOptions& out, QString* errorMessage);

    QString m_path;
};
