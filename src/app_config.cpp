#include "app_config.h"
#include "file_utils.h"

#include <QDebug>
#include <QDir>
#include <QSettings>
#include <QStandardPaths>

QString AppConfig::defaultPath()
{
    const QString base = QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation);
    return QDir(base).filePath("mvx/config.ini");
}

bool AppConfig::load(const QString& path, bool explicitPath, QString* errorMessage)
{
    m_path.clear();
    if (!FileUtils::fileExists(path)) {
        if (explicitPath) {
            if (errorMessage) *errorMessage = QString("config file not found: %1").arg(path);
            return false;
        }
        qDebug() << "[Config] no config at" << path;
        return true;
    }

    QSettings s(path, QSettings::IniFormat);
    if (s.status() != QSettings::NoError) {
        if (errorMessage) *errorMessage = QString("failed to parse config %1").arg(path);
        return false;
    }
    m_path = path;
    qDebug() << "[Config] loaded" << path << "profiles:" << profiles();
    return true;
}

QStringList AppConfig::profiles() const
{
    if (m_path.isEmpty()) return {};
    QSettings s(m_path, QSettings::IniFormat);
    QStringList groups = s.childGroups();
    groups.removeAll(kDefaultGroup);
    groups.removeAll(kToolsGroup);
    groups.sort();
    return groups;
}

bool AppConfig::readOptionGroup(QSettings& s, const QString& group, ConversionOptions& out, QString* errorMessage)
{
    s.beginGroup(group);

    if (s.contains("image_quality")) {
        bool ok = false;
        const int q = s.value("image_quality").toString().trimmed().toInt(&ok);
        if (!ok) {
            if (errorMessage) *errorMessage = QString("[%1] image_quality must be an integer").arg(group);
            s.endGroup();
            return false;
        }
        out.setImageQuality(q);
    }
    if (s.contains("video_bitrate")) out.videoBitrate = s.value("video_bitrate").toString();
    if (s.contains("audio_bitrate")) out.audioBitrate = s.value("audio_bitrate").toString();
    if (s.contains("preset")) out.preset = s.value("preset").toString();
    if (s.contains("video_codec")) out.videoCodec = s.value("video_codec").toString();
    if (s.contains("audio_codec")) out.audioCodec = s.value("audio_codec").toString();
    if (s.contains("ffmpeg_preference")) {
        const QString pref = s.value("ffmpeg_preference").toString();
        if (!MediaTypes::parsePreference(pref, out.ffmpegPreference)) {
            if (errorMessage) {
                *errorMessage = QString("[%1] invalid ffmpeg_preference '%2': expected auto, stream-copy or transcode")
                                    .arg(group, pref);
            }
            s.endGroup();
            return false;
        }
    }

    s.endGroup();
    return true;
}

bool AppConfig::options(const QString& profile, ConversionOptions& out, QString* errorMessage) const
{
    if (m_path.isEmpty()) {
        if (!profile.isEmpty()) {
            if (errorMessage) *errorMessage = QString("profile '%1' requested but no config file was found").arg(profile);
            return false;
        }
        return true;
    }

    QSettings s(m_path, QSettings::IniFormat);
    if (!readOptionGroup(s, kDefaultGroup, out, errorMessage)) return false;
    if (profile.isEmpty()) return true;

    if (!profiles().contains(profile)) {
        if (errorMessage) *errorMessage = QString("profile '%1' not found in %2").arg(profile, m_path);
        return false;
    }
    return readOptionGroup(s, profile, out, errorMessage);
}

ToolPaths AppConfig::toolPaths() const
{
    ToolPaths tools;
    if (m_path.isEmpty()) return tools;

    QSettings s(m_path, QSettings::IniFormat);
    s.beginGroup(kToolsGroup);
    if (s.contains("magick")) {
        // A configured ImageMagick still falls back to the legacy name
        tools.magick = QStringList{s.value("magick").toString(), QStringLiteral("convert")};
    }
    tools.ffmpeg = s.value("ffmpeg", tools.ffmpeg).toString();
    tools.ffprobe = s.value("ffprobe", tools.ffprobe).toString();
    tools.soffice = s.value("soffice", tools.soffice).toString();
    tools.file = s.value("file", tools.file).toString();
    s.endGroup();
    return tools;
}
