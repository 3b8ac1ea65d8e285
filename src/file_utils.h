#pragma once

#include <QString>
#include <QFileInfo>
#include <QFile>
#include <QDir>
#include <QStandardPaths>

/**
 * FileUtils - small filesystem helpers shared by the planner and the executor.
 */
namespace FileUtils {

/**
 * Check if a file exists at the given path.
 *
 * @param filePath The file path to check
 * @return true if the file exists and is a regular file, false otherwise
 */
inline bool fileExists(const QString& filePath)
{
    QFileInfo fi(filePath);
    return fi.exists() && fi.isFile();
}

/**
 * Check if a directory exists at the given path.
 */
inline bool dirExists(const QString& dirPath)
{
    QFileInfo fi(dirPath);
    return fi.exists() && fi.isDir();
}

/**
 * Check if a path exists (file, directory, or dangling symlink).
 */
inline bool pathExists(const QString& path)
{
    QFileInfo fi(path);
    return fi.exists() || fi.isSymLink();
}

/**
 * Size in bytes of a regular file, or -1 when it does not exist.
 */
inline qint64 fileSize(const QString& filePath)
{
    QFileInfo fi(filePath);
    return fi.isFile() ? fi.size() : -1;
}

/**
 * Cleaned absolute form of a path, used to compare source and destination.
 */
inline QString canonicalForm(const QString& path)
{
    return QDir::cleanPath(QFileInfo(path).absoluteFilePath());
}

/**
 * Resolve a program name or path to an executable.
 * Names containing a separator are checked directly; bare names are looked up on PATH.
 *
 * @return the absolute executable path, or an empty string when not found
 */
inline QString resolveExecutable(const QString& program)
{
    if (program.isEmpty()) return QString();
    if (program.contains('/') || program.contains('\\')) {
        QFileInfo fi(program);
        return (fi.isFile() && fi.isExecutable()) ? fi.absoluteFilePath() : QString();
    }
    return QStandardPaths::findExecutable(program);
}

/**
 * Create the parent directory tree of a path.
 *
 * @param filePath Path whose parent must exist afterwards
 * @param errorOut Optional error message
 */
inline bool ensureParentDir(const QString& filePath, QString* errorOut = nullptr)
{
    const QString parent = QFileInfo(filePath).absolutePath();
    if (dirExists(parent)) return true;
    if (QDir().mkpath(parent)) return true;
    if (errorOut) *errorOut = QString("failed to create parent directory %1").arg(parent);
    return false;
}

} // namespace FileUtils
