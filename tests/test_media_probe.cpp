#include <QtTest/QtTest>
#include <QTemporaryDir>

#include "../src/media_probe.h"

class TestMediaProbe : public QObject {
    Q_OBJECT
private slots:
    void testParseFfprobeJson();
    void testParseWithoutVideo();
    void testParseRejectsGarbage();
    void testMissingFileFails();
};

void TestMediaProbe::testParseFfprobeJson()
{
    const QByteArray json = R"({
        "streams": [
            {"index": 0, "codec_name": "h264", "codec_type": "video"},
            {"index": 1, "codec_name": "aac", "codec_type": "audio"},
            {"index": 2, "codec_name": "mp3", "codec_type": "audio"}
        ],
        "format": {"filename": "in.mp4", "duration": "63.250000"}
    })";
    MediaProbeInfo info;
    QVERIFY(MediaProbe::parseFfprobeJson(json, info));
    QCOMPARE(info.videoCodec, QString("h264"));
    QCOMPARE(info.audioCodec, QString("aac"));
    QVERIFY(info.hasDuration());
    QCOMPARE(info.durationSeconds, 63.25);
}

void TestMediaProbe::testParseWithoutVideo()
{
    const QByteArray json = R"({"streams":[{"codec_name":"flac","codec_type":"audio"}],"format":{"duration":"N/A"}})";
    MediaProbeInfo info;
    QVERIFY(MediaProbe::parseFfprobeJson(json, info));
    QVERIFY(info.videoCodec.isEmpty());
    QCOMPARE(info.audioCodec, QString("flac"));
    QVERIFY(!info.hasDuration());
}

void TestMediaProbe::testParseRejectsGarbage()
{
    MediaProbeInfo info;
    QString err;
    QVERIFY(!MediaProbe::parseFfprobeJson("not json", info, &err));
    QVERIFY(err.startsWith("invalid ffprobe output"));
}

void TestMediaProbe::testMissingFileFails()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    MediaProbeInfo info;
    QString err;
    const auto r = MediaProbe::probeMediaFile(tmp.filePath("missing.mp4"), info, &err);
    QCOMPARE(r, MediaProbe::ProbeResult::Failed);
    QVERIFY(!err.isEmpty());
}

QTEST_APPLESS_MAIN(TestMediaProbe)
#include "test_media_probe.moc"
