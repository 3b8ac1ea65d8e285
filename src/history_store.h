#pragma once

#include <QString>
#include <QStringList>

// Most-recent-first list of source paths handed to the tool, kept across runs
class HistoryStore {
public:
    static constexpr int kMaxEntries = 50;

    // Empty path selects <AppLocalDataLocation>/history.ini
    explicit HistoryStore(const QString& path = QString());

    QStringList entries() const;
    void record(const QStringList& sources);
    void clear();

    const QString& path() const { return m_path; }

private:
    QString m_path;
};
