#include <QtTest/QtTest>
#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include "../src/conversion_plan.h"
#include "../src/plan_executor.h"
#include "../src/progress_sink.h"

namespace {

class RecordingSink : public ProgressSink {
public:
    QVector<ProgressEvent> events;

    void started(const QString& label) override { events << ProgressEvent::started(label); }
    void spinner(const QString& label, double e, const QString& m) override { events << ProgressEvent::spinner(label, e, m); }
    void progress(const QString& label, double p, bool h, double eta) override { events << ProgressEvent::progress(label, p, h, eta); }
    void finished(const QString& label, bool ok, const QString& m) override { events << ProgressEvent::finished(label, ok, m); }

    int count(ProgressEvent::Type type) const
    {
        int n = 0;
        for (const ProgressEvent& e : events) if (e.type == type) ++n;
        return n;
    }
};

bool writeFile(const QString& path, const QByteArray& data)
{
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly)) return false;
    return f.write(data) == data.size();
}

QByteArray readFile(const QString& path)
{
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) return QByteArray();
    return f.readAll();
}

QString writeScript(const QString& dir, const QString& name, const QByteArray& body)
{
    const QString path = QDir(dir).filePath(name);
    writeFile(path, "#!/bin/sh\n" + body);
    QFile::setPermissions(path, QFileDevice::ReadOwner | QFileDevice::WriteOwner | QFileDevice::ExeOwner);
    return path;
}

// Fake ffmpeg: records its arguments into the output file, reports progress on stdout
const QByteArray kFakeFfmpeg =
    "for last in \"$@\"; do :; done\n"
    "printf 'out_time_ms=5000000\\nprogress=continue\\nout_time_ms=10000000\\nprogress=end\\n'\n"
    "printf '%s\\n' \"$@\" > \"$last\"\n";

// Fake soffice: writes <stem>.pdf into the --outdir directory
const QByteArray kFakeSoffice =
    "outdir=''\nprev=''\n"
    "for a in \"$@\"; do\n"
    "  if [ \"$prev\" = \"--outdir\" ]; then outdir=\"$a\"; fi\n"
    "  prev=\"$a\"\n  input=\"$a\"\n"
    "done\n"
    "name=$(basename \"$input\")\n"
    "printf '%%PDF-1.4' > \"$outdir/${name%.*}.pdf\"\n";

MediaProbe::ProbeResult probeH264(const QString&, MediaProbeInfo& info, QString*)
{
    info.durationSeconds = 10.0;
    info.videoCodec = "h264";
    info.audioCodec = "aac";
    return MediaProbe::ProbeResult::Ok;
}

MediaProbe::ProbeResult probeFails(const QString&, MediaProbeInfo&, QString* err)
{
    if (err) *err = "unreadable";
    return MediaProbe::ProbeResult::Failed;
}

ConversionPlan makePlan(const QString& src, const QString& dst, bool move = false, bool backup = false)
{
    PlanRequest r;
    r.source = src;
    r.destination = dst;
    r.moveSource = move;
    r.backup = backup;
    r.sniffProgram.clear();
    ConversionPlan plan;
    Planner::build(r, plan);
    return plan;
}

QStringList tempLeftovers(const QString& dir)
{
    return QDir(dir).entryList(QStringList{QString(PlanExecutor::kTempPrefix) + "*"},
                               QDir::AllEntries | QDir::Hidden | QDir::NoDotAndDotDot);
}

} // namespace

class TestPlanExecutor : public QObject {
    Q_OBJECT
private slots:
    void init();
    void cleanup();

    void testCopyProducesIdenticalBytes();
    void testRenameMovesSource();
    void testExistingDestinationWithoutOverwriteFails();
    void testOverwriteReplacesDestination();
    void testBackupRotation();
    void testBackupPathExhausted();
    void testConvertStreamCopyAndMoveSource();
    void testProbeFailureFallsBackToTranscode();
    void testZeroByteOutputFails();
    void testToolFailureCarriesExitStatus();
    void testMissingToolReportsHint();
    void testImageMagickFallsBackToLegacyName();
    void testSlowToolReportsSpinner();
    void testLibreOfficeRenamesStemArtifact();
    void testUnsupportedConversionFails();

private:
    QTemporaryDir* m_tmp = nullptr;
    QString m_bin;
    QString m_out;
};

void TestPlanExecutor::init()
{
    m_tmp = new QTemporaryDir();
    QVERIFY(m_tmp->isValid());
    m_bin = m_tmp->filePath("bin");
    m_out = m_tmp->filePath("out");
    QVERIFY(QDir().mkpath(m_bin));
}

void TestPlanExecutor::cleanup()
{
    delete m_tmp;
    m_tmp = nullptr;
}

void TestPlanExecutor::testCopyProducesIdenticalBytes()
{
    const QString src = m_tmp->filePath("a.bin");
    QByteArray payload(300000, '\0');
    for (int i = 0; i < payload.size(); ++i) payload[i] = char(i % 251);
    QVERIFY(writeFile(src, payload));
    const QString dst = QDir(m_out).filePath("nested/b.bin");

    RecordingSink sink;
    PlanExecutor exec(sink);
    ExecutionError err;
    QVERIFY(exec.execute(makePlan(src, dst), false, &err));
    QCOMPARE(readFile(dst), payload);
    QVERIFY(QFile::exists(src));
    QVERIFY(tempLeftovers(QFileInfo(dst).absolutePath()).isEmpty());

    QCOMPARE(sink.events.first().type, ProgressEvent::Type::Started);
    QCOMPARE(sink.events.last().type, ProgressEvent::Type::Finished);
    QVERIFY(sink.events.last().ok);
    QCOMPARE(sink.events.last().label, src);
}

void TestPlanExecutor::testRenameMovesSource()
{
    const QString src = m_tmp->filePath("notes.txt");
    QVERIFY(writeFile(src, "hello"));
    const QString dst = QDir(m_out).filePath("renamed.txt");

    RecordingSink sink;
    PlanExecutor exec(sink);
    const ConversionPlan plan = makePlan(src, dst, true);
    QCOMPARE(plan.strategy(), Strategy::RenameOnly);
    QVERIFY(exec.execute(plan, false));
    QVERIFY(!QFile::exists(src));
    QCOMPARE(readFile(dst), QByteArray("hello"));
}

void TestPlanExecutor::testExistingDestinationWithoutOverwriteFails()
{
    const QString src = m_tmp->filePath("a.txt");
    const QString dst = m_tmp->filePath("b.txt");
    QVERIFY(writeFile(src, "new"));
    QVERIFY(writeFile(dst, "old"));

    RecordingSink sink;
    PlanExecutor exec(sink);
    ExecutionError err;
    QVERIFY(!exec.execute(makePlan(src, dst), false, &err));
    QCOMPARE(err.kind, ExecutionError::Kind::Precondition);
    QCOMPARE(err.step, QString("prepare"));
    QCOMPARE(err.toString(), QString("destination exists; pass --overwrite or --backup"));
    QCOMPARE(readFile(dst), QByteArray("old"));

    QVERIFY(!sink.events.last().ok);
    QCOMPARE(sink.events.last().message, err.toString());
}

void TestPlanExecutor::testOverwriteReplacesDestination()
{
    const QString src = m_tmp->filePath("a.txt");
    const QString dst = m_tmp->filePath("b.txt");
    QVERIFY(writeFile(src, "new"));
    QVERIFY(writeFile(dst, "old"));

    NullProgressSink sink;
    PlanExecutor exec(sink);
    QVERIFY(exec.execute(makePlan(src, dst), true));
    QCOMPARE(readFile(dst), QByteArray("new"));
    QVERIFY(!QFile::exists(dst + ".bak"));
}

void TestPlanExecutor::testBackupRotation()
{
    const QString src = m_tmp->filePath("in.mp4");
    const QString dst = m_tmp->filePath("out.mp4");
    QVERIFY(writeFile(dst, "first"));

    NullProgressSink sink;
    PlanExecutor exec(sink);

    QVERIFY(writeFile(src, "second"));
    QVERIFY(exec.execute(makePlan(src, dst, false, true), false));
    QCOMPARE(readFile(dst + ".bak"), QByteArray("first"));
    QCOMPARE(readFile(dst), QByteArray("second"));

    QVERIFY(writeFile(src, "third"));
    QVERIFY(exec.execute(makePlan(src, dst, false, true), false));
    QCOMPARE(readFile(dst + ".bak"), QByteArray("first"));
    QCOMPARE(readFile(dst + ".bak.1"), QByteArray("second"));
    QCOMPARE(readFile(dst), QByteArray("third"));
}

void TestPlanExecutor::testBackupPathExhausted()
{
    const QString dst = m_tmp->filePath("full.txt");
    QCOMPARE(PlanExecutor::availableBackupPath(dst), dst + ".bak");

    QVERIFY(writeFile(dst + ".bak", "x"));
    for (int i = 1; i <= PlanExecutor::kMaxBackupAttempts; ++i) {
        QVERIFY(writeFile(QString("%1.bak.%2").arg(dst).arg(i), "x"));
    }
    QVERIFY(PlanExecutor::availableBackupPath(dst).isEmpty());

    const QString src = m_tmp->filePath("src.txt");
    QVERIFY(writeFile(src, "data"));
    QVERIFY(writeFile(dst, "existing"));
    NullProgressSink sink;
    PlanExecutor exec(sink);
    ExecutionError err;
    QVERIFY(!exec.execute(makePlan(src, dst, false, true), false, &err));
    QCOMPARE(err.kind, ExecutionError::Kind::Precondition);
    QCOMPARE(err.message, QString("could not find available backup path"));
}

void TestPlanExecutor::testConvertStreamCopyAndMoveSource()
{
    ToolPaths tools;
    tools.ffmpeg = writeScript(m_bin, "ffmpeg", kFakeFfmpeg);

    const QString src = m_tmp->filePath("clip.mov");
    QVERIFY(writeFile(src, "movie"));
    const QString dst = QDir(m_out).filePath("clip.mp4");

    RecordingSink sink;
    PlanExecutor exec(sink);
    exec.setToolPaths(tools);
    exec.setProber(probeH264);
    ExecutionError err;
    QVERIFY2(exec.execute(makePlan(src, dst, true), false, &err), qPrintable(err.toString()));

    const QString recordedArgs = QString::fromUtf8(readFile(dst));
    QVERIFY(recordedArgs.contains("-c\ncopy\n"));
    QVERIFY(recordedArgs.contains("-progress\npipe:1\n"));
    QVERIFY(!QFile::exists(src));
    QVERIFY(tempLeftovers(m_out).isEmpty());

    QCOMPARE(sink.events.first().type, ProgressEvent::Type::Started);
    QVERIFY(sink.count(ProgressEvent::Type::Progress) >= 2);
    QCOMPARE(sink.count(ProgressEvent::Type::Finished), 1);
    QCOMPARE(sink.events.last().type, ProgressEvent::Type::Finished);
    QVERIFY(sink.events.last().ok);
}

void TestPlanExecutor::testProbeFailureFallsBackToTranscode()
{
    ToolPaths tools;
    tools.ffmpeg = writeScript(m_bin, "ffmpeg", kFakeFfmpeg);

    const QString src = m_tmp->filePath("clip.mov");
    QVERIFY(writeFile(src, "movie"));
    const QString dst = QDir(m_out).filePath("clip.mkv");

    NullProgressSink sink;
    PlanExecutor exec(sink);
    exec.setToolPaths(tools);
    exec.setProber(probeFails);
    QVERIFY(exec.execute(makePlan(src, dst), false));

    const QString recordedArgs = QString::fromUtf8(readFile(dst));
    QVERIFY(recordedArgs.contains("-c:v\nlibx264\n"));
    QVERIFY(!recordedArgs.contains("-c\ncopy\n"));
    QVERIFY(QFile::exists(src));
}

void TestPlanExecutor::testZeroByteOutputFails()
{
    ToolPaths tools;
    tools.ffmpeg = writeScript(m_bin, "ffmpeg", "for last in \"$@\"; do :; done\n: > \"$last\"\n");

    const QString src = m_tmp->filePath("song.wav");
    QVERIFY(writeFile(src, "pcm"));
    const QString dst = QDir(m_out).filePath("song.mp3");

    NullProgressSink sink;
    PlanExecutor exec(sink);
    exec.setToolPaths(tools);
    exec.setProber(probeFails);
    ExecutionError err;
    QVERIFY(!exec.execute(makePlan(src, dst, true), false, &err));
    QCOMPARE(err.kind, ExecutionError::Kind::OutputEmpty);
    QCOMPARE(err.toString(), QString("output file is empty"));
    QVERIFY(QFile::exists(src));
    QVERIFY(!QFile::exists(dst));
    QVERIFY(tempLeftovers(m_out).isEmpty());
}

void TestPlanExecutor::testToolFailureCarriesExitStatus()
{
    ToolPaths tools;
    tools.ffmpeg = writeScript(m_bin, "ffmpeg", "exit 3\n");

    const QString src = m_tmp->filePath("song.wav");
    QVERIFY(writeFile(src, "pcm"));

    NullProgressSink sink;
    PlanExecutor exec(sink);
    exec.setToolPaths(tools);
    exec.setProber(probeFails);
    ExecutionError err;
    QVERIFY(!exec.execute(makePlan(src, QDir(m_out).filePath("song.ogg")), false, &err));
    QCOMPARE(err.kind, ExecutionError::Kind::ToolFailure);
    QCOMPARE(err.tool, QString("ffmpeg"));
    QCOMPARE(err.exitCode, 3);
    QCOMPARE(err.toString(), QString("ffmpeg exited with status 3"));
    QVERIFY(tempLeftovers(m_out).isEmpty());
}

void TestPlanExecutor::testMissingToolReportsHint()
{
    ToolPaths tools;
    tools.ffmpeg = m_tmp->filePath("nonexistent/ffmpeg");

    const QString src = m_tmp->filePath("song.wav");
    QVERIFY(writeFile(src, "pcm"));

    NullProgressSink sink;
    PlanExecutor exec(sink);
    exec.setToolPaths(tools);
    exec.setProber(probeFails);
    ExecutionError err;
    QVERIFY(!exec.execute(makePlan(src, QDir(m_out).filePath("song.flac")), false, &err));
    QCOMPARE(err.kind, ExecutionError::Kind::ToolMissing);
    QVERIFY(err.toString().contains("apt install ffmpeg"));
}

void TestPlanExecutor::testImageMagickFallsBackToLegacyName()
{
    const QString legacy = writeScript(m_bin, "convert",
                                       "for last in \"$@\"; do :; done\nprintf 'jpeg' > \"$last\"\n");
    ToolPaths tools;
    tools.magick = QStringList{m_tmp->filePath("nonexistent/magick"), legacy};

    const QString src = m_tmp->filePath("photo.png");
    QVERIFY(writeFile(src, "png"));
    const QString dst = QDir(m_out).filePath("photo.jpg");

    RecordingSink sink;
    PlanExecutor exec(sink);
    exec.setToolPaths(tools);
    ExecutionError err;
    QVERIFY2(exec.execute(makePlan(src, dst), false, &err), qPrintable(err.toString()));
    QCOMPARE(readFile(dst), QByteArray("jpeg"));

    // Neither candidate available
    tools.magick = QStringList{m_tmp->filePath("nonexistent/magick"), m_tmp->filePath("nonexistent/convert")};
    exec.setToolPaths(tools);
    QVERIFY(!exec.execute(makePlan(src, QDir(m_out).filePath("photo.webp")), false, &err));
    QCOMPARE(err.kind, ExecutionError::Kind::ToolMissing);
    QVERIFY(err.toString().startsWith("ImageMagick not found"));
}

void TestPlanExecutor::testSlowToolReportsSpinner()
{
    ToolPaths tools;
    tools.magick = QStringList{writeScript(m_bin, "magick",
                                           "sleep 0.5\nfor last in \"$@\"; do :; done\nprintf 'png' > \"$last\"\n")};

    const QString src = m_tmp->filePath("scan.pdf");
    QVERIFY(writeFile(src, "%PDF-1.4"));
    const QString dst = QDir(m_out).filePath("scan.png");

    RecordingSink sink;
    PlanExecutor exec(sink);
    exec.setToolPaths(tools);
    ExecutionError err;
    QVERIFY2(exec.execute(makePlan(src, dst), false, &err), qPrintable(err.toString()));
    QCOMPARE(readFile(dst), QByteArray("png"));

    QVERIFY(sink.count(ProgressEvent::Type::Spinner) >= 1);
    QCOMPARE(sink.count(ProgressEvent::Type::Finished), 1);
    QCOMPARE(sink.events.first().type, ProgressEvent::Type::Started);
    QCOMPARE(sink.events.last().type, ProgressEvent::Type::Finished);

    double lastElapsed = -1.0;
    for (int i = 1; i < sink.events.size() - 1; ++i) {
        const ProgressEvent& e = sink.events.at(i);
        QCOMPARE(e.type, ProgressEvent::Type::Spinner);
        QCOMPARE(e.label, src);
        QCOMPARE(e.message, QString("ImageMagick"));
        QVERIFY(e.elapsedSeconds > lastElapsed);
        lastElapsed = e.elapsedSeconds;
    }
}

void TestPlanExecutor::testLibreOfficeRenamesStemArtifact()
{
    ToolPaths tools;
    tools.soffice = writeScript(m_bin, "soffice", kFakeSoffice);

    const QString src = m_tmp->filePath("report.docx");
    QVERIFY(writeFile(src, "docx"));
    const QString dst = QDir(m_out).filePath("final.pdf");

    NullProgressSink sink;
    PlanExecutor exec(sink);
    exec.setToolPaths(tools);
    ExecutionError err;
    QVERIFY2(exec.execute(makePlan(src, dst), false, &err), qPrintable(err.toString()));
    QCOMPARE(readFile(dst), QByteArray("%PDF-1.4"));
    QVERIFY(!QFile::exists(QDir(m_out).filePath("report.pdf")));
    QVERIFY(tempLeftovers(m_out).isEmpty());
}

void TestPlanExecutor::testUnsupportedConversionFails()
{
    const QString src = m_tmp->filePath("a.zip");
    QVERIFY(writeFile(src, "zip"));

    NullProgressSink sink;
    PlanExecutor exec(sink);
    ExecutionError err;
    QVERIFY(!exec.execute(makePlan(src, QDir(m_out).filePath("a.rar")), false, &err));
    QCOMPARE(err.kind, ExecutionError::Kind::Unsupported);
    QVERIFY(QFile::exists(src));
}

QTEST_GUILESS_MAIN(TestPlanExecutor)
#include "test_plan_executor.moc"
