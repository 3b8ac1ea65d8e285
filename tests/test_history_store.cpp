#include <QtTest/QtTest>
#include <QDir>
#include <QTemporaryDir>

#include "../src/history_store.h"

class TestHistoryStore : public QObject {
    Q_OBJECT
private slots:
    void testRecordMostRecentFirst();
    void testRecordMakesPathsAbsolute();
    void testCapAndClear();
};

void TestHistoryStore::testRecordMostRecentFirst()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    HistoryStore store(tmp.filePath("state/history.ini"));
    QVERIFY(store.entries().isEmpty());

    store.record({"/in/a.mov", "/in/b.mov"});
    QCOMPARE(store.entries(), QStringList({"/in/b.mov", "/in/a.mov"}));

    // Re-recording moves an entry to the front without duplicating it
    store.record({"/in/a.mov"});
    QCOMPARE(store.entries(), QStringList({"/in/a.mov", "/in/b.mov"}));

    HistoryStore reopened(store.path());
    QCOMPARE(reopened.entries(), store.entries());
}

void TestHistoryStore::testRecordMakesPathsAbsolute()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    HistoryStore store(tmp.filePath("history.ini"));
    store.record({"relative/clip.wav"});
    const QString entry = store.entries().value(0);
    QVERIFY(QDir::isAbsolutePath(entry));
    QVERIFY(entry.endsWith("/relative/clip.wav"));
}

void TestHistoryStore::testCapAndClear()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    HistoryStore store(tmp.filePath("history.ini"));

    QStringList many;
    for (int i = 0; i < HistoryStore::kMaxEntries + 10; ++i) many << QString("/in/%1.png").arg(i);
    store.record(many);
    const QStringList entries = store.entries();
    QCOMPARE(entries.size(), HistoryStore::kMaxEntries);
    QCOMPARE(entries.first(), QString("/in/%1.png").arg(HistoryStore::kMaxEntries + 9));

    store.clear();
    QVERIFY(store.entries().isEmpty());
}

QTEST_APPLESS_MAIN(TestHistoryStore)
#include "test_history_store.moc"
