#include "batch_inputs.h"
#include "file_utils.h"

#include <QDir>
#include <QDirIterator>
#include <QFileInfo>
#include <QRegularExpression>
#include <QSet>

namespace {

QString stripDot(const QString& ext)
{
    QString e = ext.trimmed();
    while (e.startsWith('.')) e.remove(0, 1);
    return e;
}

bool isPattern(const QString& input)
{
    static const QRegularExpression rxWild("[*?\\[]");
    return rxWild.match(input).hasMatch();
}

void addDirectory(const QString& dir, bool recursive, QSet<QString>& found)
{
    QDirIterator it(dir, QDir::Files | QDir::NoDotAndDotDot,
                    recursive ? QDirIterator::Subdirectories : QDirIterator::NoIteratorFlags);
    while (it.hasNext()) {
        found.insert(QDir::cleanPath(it.next()));
    }
}

int addPattern(const QString& pattern, QSet<QString>& found)
{
    const QFileInfo fi(pattern);
    const QString dirPath = fi.path();
    const QString namePattern = fi.fileName();
    const QRegularExpression rx(QRegularExpression::wildcardToRegularExpression(namePattern));

    int matched = 0;
    QDir dir(dirPath);
    const QFileInfoList entries = dir.entryInfoList(QDir::Files | QDir::NoDotAndDotDot, QDir::Name);
    for (const QFileInfo& e : entries) {
        if (rx.match(e.fileName()).hasMatch()) {
            found.insert(QDir::cleanPath(dir.filePath(e.fileName())));
            ++matched;
        }
    }
    return matched;
}

} // namespace

namespace BatchInputs {

bool collectSources(const QStringList& inputs, bool recursive, QStringList& out, QString* errorMessage)
{
    QSet<QString> found;
    for (const QString& input : inputs) {
        if (input.trimmed().isEmpty()) continue;
        if (FileUtils::fileExists(input)) {
            found.insert(QDir::cleanPath(input));
        } else if (FileUtils::dirExists(input)) {
            addDirectory(input, recursive, found);
        } else if (isPattern(input)) {
            if (addPattern(input, found) == 0) {
                if (errorMessage) *errorMessage = QString("no files match %1").arg(input);
                return false;
            }
        } else {
            if (errorMessage) *errorMessage = QString("no such file or directory: %1").arg(input);
            return false;
        }
    }
    out = QStringList(found.begin(), found.end());
    out.sort();
    return true;
}

QStringList readPathList(const QByteArray& text)
{
    QStringList paths;
    const QList<QByteArray> lines = text.split('\n');
    for (const QByteArray& line : lines) {
        const QString p = QString::fromUtf8(line).trimmed();
        if (!p.isEmpty()) paths << p;
    }
    return paths;
}

QString destinationFor(const QString& destDir, const QString& toExt, const QString& source)
{
    const QFileInfo fi(source);
    const QString ext = stripDot(toExt);
    const QString name = ext.isEmpty() ? fi.fileName() : QString("%1.%2").arg(fi.completeBaseName(), ext);
    return QDir(destDir).filePath(name);
}

QString replaceExtension(const QString& path, const QString& toExt)
{
    const QString ext = stripDot(toExt);
    if (ext.isEmpty()) return path;
    const QFileInfo fi(path);
    const QString name = QString("%1.%2").arg(fi.completeBaseName(), ext);
    return fi.path() == "." && !path.startsWith("./") ? name : QDir(fi.path()).filePath(name);
}

} // namespace BatchInputs
