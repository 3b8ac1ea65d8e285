#include "file_type_helpers.h"

#include <QFileInfo>

namespace {

inline QString normalize(const QString& ext)
{
    return normalizeExtension(ext);
}

} // namespace

QString normalizeExtension(const QString& ext)
{
    QString e = ext.trimmed().toLower();
    if (e.startsWith('.')) e.remove(0, 1);
    if (e == "jpeg") return QStringLiteral("jpg");
    if (e == "htm") return QStringLiteral("html");
    return e;
}

QString extensionOf(const QString& path)
{
    return normalizeExtension(QFileInfo(path).suffix());
}

bool isImageFile(const QString& ext)
{
    static const QSet<QString> exts = {
        "jpg","png","gif","webp","bmp","tiff","tif","heic","avif"
    };
    return exts.contains(normalize(ext));
}

bool isVideoFile(const QString& ext)
{
    static const QSet<QString> exts = {"mp4","mov","mkv","webm","avi"};
    return exts.contains(normalize(ext));
}

bool isAudioFile(const QString& ext)
{
    static const QSet<QString> exts = {"mp3","wav","flac","aac","ogg","m4a","opus"};
    return exts.contains(normalize(ext));
}

bool isMediaFile(const QString& ext)
{
    return isAudioFile(ext) || isVideoFile(ext);
}

bool isPdfFile(const QString& ext)
{
    return normalize(ext) == "pdf";
}

bool isDocumentFile(const QString& ext)
{
    static const QSet<QString> exts = {
        "doc","docx","ppt","pptx","xls","xlsx","odt","odp","ods","rtf","txt"
    };
    return exts.contains(normalize(ext));
}

MediaKind mediaKindForExtension(const QString& ext)
{
    if (isImageFile(ext)) return MediaKind::Image;
    if (isAudioFile(ext)) return MediaKind::Audio;
    if (isVideoFile(ext)) return MediaKind::Video;
    if (isPdfFile(ext) || isDocumentFile(ext)) return MediaKind::Document;
    return MediaKind::Other;
}

bool isPdfImagePair(const QString& srcExt, const QString& dstExt)
{
    return (isPdfFile(srcExt) && isImageFile(dstExt))
        || (isImageFile(srcExt) && isPdfFile(dstExt));
}

Backend backendForPair(const QString& srcExt, const QString& dstExt)
{
    if (isImageFile(srcExt) && isImageFile(dstExt)) return Backend::ImageMagick;
    if (isPdfImagePair(srcExt, dstExt)) return Backend::ImageMagick;
    if (isMediaFile(srcExt) && isMediaFile(dstExt)) return Backend::Ffmpeg;
    if (isDocumentFile(srcExt) && isPdfFile(dstExt)) return Backend::LibreOffice;
    return Backend::None;
}
