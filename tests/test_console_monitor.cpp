#include <QtTest/QtTest>
#include <QSignalSpy>

#include "../src/console_monitor.h"
#include "../src/event_channel.h"

class TestConsoleMonitor : public QObject {
    Q_OBJECT
private slots:
    void testStatusCodes();
    void testApplyTracksTasks();
    void testRenderLines();
    void testActivityLogIsCapped();
    void testCompletesWhenChannelCloses();
    void testClosedBeforeEventLoopStarts();
};

void TestConsoleMonitor::testStatusCodes()
{
    QCOMPARE(ConsoleMonitor::statusCode(ConsoleMonitor::Status::Pending), QString("P"));
    QCOMPARE(ConsoleMonitor::statusCode(ConsoleMonitor::Status::Running), QString("R"));
    QCOMPARE(ConsoleMonitor::statusCode(ConsoleMonitor::Status::Ok), QString("OK"));
    QCOMPARE(ConsoleMonitor::statusCode(ConsoleMonitor::Status::Failed), QString("ER"));
}

void TestConsoleMonitor::testApplyTracksTasks()
{
    EventChannel channel;
    ConsoleMonitor monitor(channel);
    monitor.setPending({"/in/a.mov", "/in/b.zip", "/in/c.png"});
    QCOMPARE(monitor.tasks().size(), 3);
    QCOMPARE(monitor.tasks().at(2).status, ConsoleMonitor::Status::Pending);

    monitor.apply(ProgressEvent::started("/in/a.mov"));
    QCOMPARE(monitor.tasks().at(0).status, ConsoleMonitor::Status::Running);
    monitor.apply(ProgressEvent::progress("/in/a.mov", 42.0, true, 3.5));
    QCOMPARE(monitor.tasks().at(0).percent, 42.0);
    QVERIFY(monitor.tasks().at(0).hasEta);
    monitor.apply(ProgressEvent::finished("/in/a.mov", true, "ok"));
    QCOMPARE(monitor.tasks().at(0).status, ConsoleMonitor::Status::Ok);
    QCOMPARE(monitor.tasks().at(0).percent, 100.0);

    monitor.apply(ProgressEvent::started("/in/b.zip"));
    monitor.apply(ProgressEvent::finished("/in/b.zip", false, "no backend available to convert .zip to .rar"));
    QCOMPARE(monitor.tasks().at(1).status, ConsoleMonitor::Status::Failed);

    monitor.apply(ProgressEvent::started("/in/c.png"));
    monitor.apply(ProgressEvent::spinner("/in/c.png", 1.34, "ImageMagick"));
    QCOMPARE(monitor.tasks().at(2).message, QString("ImageMagick 1.3s"));

    QCOMPARE(monitor.succeeded(), 1);
    QCOMPARE(monitor.failed(), 1);
    QCOMPARE(monitor.activity().first(), QString("Started /in/a.mov"));
    QVERIFY(monitor.activity().contains("Failed /in/b.zip: no backend available to convert .zip to .rar"));
}

void TestConsoleMonitor::testRenderLines()
{
    EventChannel channel;
    ConsoleMonitor monitor(channel);
    monitor.setPending({"/in/a.wav", "/in/b.wav"});
    monitor.apply(ProgressEvent::started("/in/a.wav"));
    monitor.apply(ProgressEvent::progress("/in/a.wav", 50.0, true, 2.0));

    const QStringList lines = monitor.renderLines();
    QCOMPARE(lines.first(), QString("mvx  2 task(s)  ok 0  failed 0"));
    QVERIFY(lines.contains("[ R]  50% /in/a.wav"));
    QVERIFY(lines.contains("[ P]   0% /in/b.wav"));
    QVERIFY(lines.contains("Current: /in/a.wav  50.0%  eta 2.0s"));
    QVERIFY(lines.contains("Activity:"));
}

void TestConsoleMonitor::testActivityLogIsCapped()
{
    EventChannel channel;
    ConsoleMonitor monitor(channel);
    for (int i = 0; i < ConsoleMonitor::kMaxLogLines + 50; ++i) {
        const QString label = QString("/in/%1.txt").arg(i);
        monitor.apply(ProgressEvent::started(label));
    }
    QCOMPARE(monitor.activity().size(), ConsoleMonitor::kMaxLogLines);
    QCOMPARE(monitor.activity().last(), QString("Started /in/%1.txt").arg(ConsoleMonitor::kMaxLogLines + 49));
}

void TestConsoleMonitor::testCompletesWhenChannelCloses()
{
    EventChannel channel;
    ConsoleMonitor monitor(channel);
    monitor.setRenderToTerminal(false);
    monitor.setWaitForEnter(false);
    monitor.setPending({"/in/a.txt", "/in/b.txt"});
    QSignalSpy closedSpy(&monitor, &ConsoleMonitor::closed);

    monitor.start();
    QVERIFY(!monitor.isComplete());

    channel.push(ProgressEvent::started("/in/a.txt"));
    channel.push(ProgressEvent::finished("/in/a.txt", true, "ok"));
    channel.push(ProgressEvent::started("/in/b.txt"));
    channel.push(ProgressEvent::finished("/in/b.txt", false, "destination exists; pass --overwrite or --backup"));
    channel.close();

    QTRY_VERIFY_WITH_TIMEOUT(monitor.isComplete(), 5000);
    QTRY_COMPARE(closedSpy.count(), 1);
    QCOMPARE(monitor.succeeded(), 1);
    QCOMPARE(monitor.failed(), 1);
    QVERIFY(monitor.renderLines().contains("Completed: 1 succeeded, 1 failed. Press Enter to exit."));

    // Events pushed after close are dropped
    channel.push(ProgressEvent::started("/in/late.txt"));
    QVERIFY(channel.drain().isEmpty());
}

void TestConsoleMonitor::testClosedBeforeEventLoopStarts()
{
    // The batch is over before the monitor's first tick
    EventChannel channel;
    channel.push(ProgressEvent::started("/in/a.png"));
    channel.push(ProgressEvent::finished("/in/a.png", false, "source and destination must differ"));
    channel.close();

    ConsoleMonitor monitor(channel);
    monitor.setRenderToTerminal(false);
    monitor.setWaitForEnter(false);
    QSignalSpy closedSpy(&monitor, &ConsoleMonitor::closed);

    QEventLoop loop;
    connect(&monitor, &ConsoleMonitor::closed, &loop, &QEventLoop::quit);
    bool timedOut = false;
    QTimer::singleShot(5000, &loop, [&loop, &timedOut]() {
        timedOut = true;
        loop.quit();
    });

    monitor.start();
    QVERIFY(monitor.isComplete());
    QCOMPARE(closedSpy.count(), 0);

    loop.exec();
    QVERIFY(!timedOut);
    QCOMPARE(closedSpy.count(), 1);
    QCOMPARE(monitor.failed(), 1);
}

QTEST_GUILESS_MAIN(TestConsoleMonitor)
#include "test_console_monitor.moc"
