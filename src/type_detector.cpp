#include "type_detector.h"
#include "file_utils.h"

#include <QFileInfo>
#include <QMimeDatabase>
#include <QProcess>

namespace {
constexpr int kFileProbeTimeoutMs = 3000;

QString sniffWithFileUtility(const QString& program, const QString& path)
{
    const QString exe = FileUtils::resolveExecutable(program);
    if (exe.isEmpty()) return QString();

    QProcess p;
    p.start(exe, {"--brief", "--mime-type", path});
    if (!p.waitForStarted(kFileProbeTimeoutMs)) return QString();
    if (!p.waitForFinished(kFileProbeTimeoutMs)) {
        p.kill();
        p.waitForFinished(500);
        return QString();
    }
    if (p.exitStatus() != QProcess::NormalExit || p.exitCode() != 0) return QString();
    return QString::fromUtf8(p.readAllStandardOutput()).trimmed();
}
} // namespace

namespace TypeDetector {

DetectedType detect(const QString& path, const QString& fileProgram)
{
    DetectedType out;
    QFileInfo fi(path);
    out.extension = fi.suffix().toLower();

    if (!fi.isFile() || !fi.isReadable()) return out;

    QMimeDatabase db;
    const QMimeType mt = db.mimeTypeForFile(fi, QMimeDatabase::MatchContent);
    if (mt.isValid() && !mt.isDefault()) {
        out.mime = mt.name();
    }

    if (!fileProgram.isEmpty()) {
        out.systemMime = sniffWithFileUtility(fileProgram, fi.absoluteFilePath());
    }
    return out;
}

} // namespace TypeDetector
