#include "history_store.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QSettings>
#include <QStandardPaths>

namespace {
const char* kSourcesKey = "History/Sources";
}

HistoryStore::HistoryStore(const QString& path)
    : m_path(path)
{
    if (m_path.isEmpty()) {
        m_path = QDir(QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation)).filePath("history.ini");
    }
}

QStringList HistoryStore::entries() const
{
    QSettings s(m_path, QSettings::IniFormat);
    return s.value(kSourcesKey).toStringList();
}

void HistoryStore::record(const QStringList& sources)
{
    if (sources.isEmpty()) return;
    QDir().mkpath(QFileInfo(m_path).absolutePath());

    QStringList list = entries();
    for (const QString& src : sources) {
        const QString abs = QFileInfo(src).absoluteFilePath();
        list.removeAll(abs);
        list.prepend(abs);
    }
    while (list.size() > kMaxEntries) list.removeLast();

    QSettings s(m_path, QSettings::IniFormat);
    s.setValue(kSourcesKey, list);
    s.sync();
    if (s.status() != QSettings::NoError) {
        qWarning() << "[History] failed to write" << m_path;
    }
}

void HistoryStore::clear()
{
    QSettings s(m_path, QSettings::IniFormat);
    s.remove(kSourcesKey);
    s.sync();
}
