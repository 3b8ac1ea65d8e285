#pragma once

#include <QByteArray>
#include <QString>
#include <QStringList>

namespace BatchInputs {

// Expands files, directories and wildcard patterns into a sorted, de-duplicated
// list of files. A pattern that matches nothing is an error.
bool collectSources(const QStringList& inputs, bool recursive, QStringList& out, QString* errorMessage = nullptr);

// Reads one path per line; blank lines are skipped
QStringList readPathList(const QByteArray& text);

// destDir/<stem>.<toExt>, or destDir/<file name> when toExt is empty
QString destinationFor(const QString& destDir, const QString& toExt, const QString& source);

// Replaces the suffix of a single destination path, keeping its stem
QString replaceExtension(const QString& path, const QString& toExt);

} // namespace BatchInputs
