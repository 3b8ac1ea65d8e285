#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QMetaObject>
#include <QTextStream>
#include <QThread>

#include <cstdio>

#include "app_config.h"
#include "batch_inputs.h"
#include "batch_runner.h"
#include "batch_worker.h"
#include "console_monitor.h"
#include "conversion_plan.h"
#include "event_channel.h"
#include "history_store.h"
#include "log_manager.h"
#include "plan_executor.h"
#include "plan_report.h"
#include "progress_sink.h"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

struct CliOptions {
    bool planOnly = false;
    bool json = false;
    bool overwrite = false;
    bool backup = false;
    bool moveSource = false;
    bool interactive = false;
    ConversionOptions conversion;
    ToolPaths tools;
};

void printOut(const QString& text)
{
    QTextStream out(stdout);
    out << text << '\n';
    out.flush();
}

void printErr(const QString& text)
{
    QTextStream err(stderr);
    err << text << '\n';
    err.flush();
}

QString toJsonText(const QJsonDocument& doc)
{
    return QString::fromUtf8(doc.toJson(QJsonDocument::Indented)).trimmed();
}

// Command-line values override whatever the config supplied
bool applyOptionFlags(const QCommandLineParser& parser, ConversionOptions& o, QString* errorMessage)
{
    if (parser.isSet("image-quality")) {
        bool ok = false;
        const int q = parser.value("image-quality").toInt(&ok);
        if (!ok) {
            if (errorMessage) *errorMessage = QString("invalid image quality '%1'").arg(parser.value("image-quality"));
            return false;
        }
        o.setImageQuality(q);
    }
    if (parser.isSet("video-bitrate")) o.videoBitrate = parser.value("video-bitrate");
    if (parser.isSet("audio-bitrate")) o.audioBitrate = parser.value("audio-bitrate");
    if (parser.isSet("preset")) o.preset = parser.value("preset");
    if (parser.isSet("video-codec")) o.videoCodec = parser.value("video-codec");
    if (parser.isSet("audio-codec")) o.audioCodec = parser.value("audio-codec");
    if (parser.isSet("stream-copy")) o.ffmpegPreference = FfmpegPreference::StreamCopy;
    if (parser.isSet("transcode")) o.ffmpegPreference = FfmpegPreference::Transcode;
    return true;
}

PlanRequest makeRequest(const CliOptions& cli, const QString& source, const QString& destination)
{
    PlanRequest req;
    req.source = source;
    req.destination = destination;
    req.moveSource = cli.moveSource;
    req.backup = cli.backup;
    req.options = cli.conversion;
    req.sniffProgram = cli.tools.file;
    return req;
}

int printPlans(const CliOptions& cli, const QVector<PlanRequest>& requests)
{
    int failures = 0;
    QJsonArray jsonPlans;
    QStringList blocks;
    for (const PlanRequest& req : requests) {
        ConversionPlan plan;
        QString err;
        if (!Planner::build(req, plan, &err)) {
            ++failures;
            if (cli.json) {
                jsonPlans.append(QJsonObject{{"source", req.source}, {"error", err}});
            } else {
                blocks << QString("Source: %1\nError: %2").arg(req.source, err);
            }
            continue;
        }
        if (cli.json) {
            jsonPlans.append(PlanReport::renderJson(plan, cli.overwrite));
        } else {
            blocks << PlanReport::renderText(plan, cli.overwrite);
        }
    }

    if (cli.json) {
        if (requests.size() == 1 && jsonPlans.size() == 1) {
            printOut(toJsonText(QJsonDocument(jsonPlans.first().toObject())));
        } else {
            printOut(toJsonText(QJsonDocument(jsonPlans)));
        }
    } else {
        printOut(blocks.join("\n\n"));
    }
    return failures == 0 ? kExitOk : kExitFailure;
}

int runSingle(const CliOptions& cli, const PlanRequest& request)
{
    ConversionPlan plan;
    QString planError;
    if (!Planner::build(request, plan, &planError)) {
        if (cli.json) {
            printOut(toJsonText(QJsonDocument(QJsonObject{{"status", "error"}, {"error", planError}})));
        } else {
            printErr(QString("Error: %1").arg(planError));
        }
        return kExitFailure;
    }

    ConsoleProgressSink consoleSink(stderr);
    NullProgressSink quietSink;
    PlanExecutor executor(cli.json ? static_cast<ProgressSink&>(quietSink) : consoleSink);
    executor.setToolPaths(cli.tools);

    ExecutionError err;
    const bool ok = executor.execute(plan, cli.overwrite, &err);
    if (cli.json) {
        QJsonObject obj{{"status", ok ? "ok" : "error"}, {"source", plan.source()}, {"destination", plan.destination()}};
        if (!ok) {
            obj["error"] = err.toString();
            obj["step"] = err.step;
            obj["kind"] = ExecutionError::kindName(err.kind);
        }
        printOut(toJsonText(QJsonDocument(obj)));
    } else if (!ok) {
        printErr(QString("Error: %1").arg(err.toString()));
    }
    return ok ? kExitOk : kExitFailure;
}

int runBatchInteractive(QCoreApplication& app, const CliOptions& cli, const QVector<PlanRequest>& requests)
{
    // Keep log output off the dashboard
    LogManager::instance().setConsoleThreshold(QtFatalMsg);

    EventChannel channel;
    QThread thread;
    auto* worker = new BatchWorker(channel);
    worker->setToolPaths(cli.tools);
    worker->moveToThread(&thread);
    QObject::connect(&thread, &QThread::finished, worker, &QObject::deleteLater);

    QStringList labels;
    for (const PlanRequest& r : requests) labels << r.source;

    ConsoleMonitor monitor(channel);
    monitor.setPending(labels);
    QObject::connect(&monitor, &ConsoleMonitor::closed, &app, &QCoreApplication::quit, Qt::QueuedConnection);

    thread.start();
    const bool overwrite = cli.overwrite;
    QMetaObject::invokeMethod(worker, [worker, requests, overwrite]() {
        worker->start(requests, overwrite);
    }, Qt::QueuedConnection);
    monitor.start();

    app.exec();
    thread.quit();
    thread.wait();

    return monitor.failed() == 0 ? kExitOk : kExitFailure;
}

int runBatch(const CliOptions& cli, const QVector<PlanRequest>& requests)
{
    ConsoleProgressSink consoleSink(stderr);
    NullProgressSink quietSink;
    BatchRunner runner(cli.json ? static_cast<ProgressSink&>(quietSink) : consoleSink);
    runner.setToolPaths(cli.tools);

    const BatchSummary summary = runner.run(requests, cli.overwrite);
    if (cli.json) {
        printOut(toJsonText(QJsonDocument(summary.toJson())));
    } else {
        printOut(summary.toText());
    }
    return summary.allSucceeded() ? kExitOk : kExitFailure;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    // Identify app for QStandardPaths
    QCoreApplication::setOrganizationName("mvx");
    QCoreApplication::setApplicationName("mvx");
    QCoreApplication::setApplicationVersion("0.3.0");

    LogManager::instance().openLogFile();
    qInstallMessageHandler(customMessageHandler);

    QCommandLineParser parser;
    parser.setApplicationDescription("Rename, copy or convert files, choosing the right external tool.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("source", "Source file (or batch inputs with --batch).");
    parser.addPositionalArgument("dest", "Destination path (single-file mode).");
    parser.addOptions({
        {{"plan", "dry-run"}, "Print the plan without executing it."},
        {"json", "Print plans and results as JSON."},
        {"overwrite", "Replace an existing destination."},
        {"backup", "Move an existing destination to <dest>.bak[.N] first."},
        {"move-source", "Remove the source after a successful operation."},
        {"batch", "Treat positional arguments as inputs (files, directories, patterns)."},
        {"dest-dir", "Output directory for batch mode.", "dir"},
        {"to-ext", "Destination extension override.", "ext"},
        {"recursive", "Descend into directories given as batch inputs."},
        {"stdin", "Read additional batch inputs from stdin, one per line."},
        {"interactive", "Show a live dashboard while a batch runs."},
        {"config", "Config file path.", "file"},
        {"profile", "Option profile from the config file.", "name"},
        {"image-quality", "Image quality (1-100).", "n"},
        {"video-bitrate", "Video bitrate, e.g. 2500k.", "rate"},
        {"audio-bitrate", "Audio bitrate, e.g. 192k.", "rate"},
        {"preset", "Encoder preset (ultrafast..veryslow).", "name"},
        {"video-codec", "Video codec for transcoding.", "codec"},
        {"audio-codec", "Audio codec for transcoding.", "codec"},
        {"stream-copy", "Force ffmpeg stream copy."},
        {"transcode", "Force ffmpeg transcoding."},
        {"history", "Print recently used sources and exit."},
        {"clear-history", "Forget recently used sources and exit."},
        {"verbose", "Echo debug and info log messages to stderr."},
    });
    parser.process(app);

    if (parser.isSet("verbose")) {
        LogManager::instance().setConsoleThreshold(QtDebugMsg);
    }

    HistoryStore history;
    if (parser.isSet("history")) {
        const QStringList entries = history.entries();
        if (!entries.isEmpty()) printOut(entries.join('\n'));
        return kExitOk;
    }
    if (parser.isSet("clear-history")) {
        history.clear();
        return kExitOk;
    }

    if (parser.isSet("stream-copy") && parser.isSet("transcode")) {
        printErr("Error: --stream-copy and --transcode cannot be combined");
        return kExitUsage;
    }
    if (parser.isSet("overwrite") && parser.isSet("backup")) {
        printErr("Error: --overwrite and --backup cannot be combined");
        return kExitUsage;
    }

    CliOptions cli;
    cli.planOnly = parser.isSet("plan");
    cli.json = parser.isSet("json");
    cli.overwrite = parser.isSet("overwrite");
    cli.backup = parser.isSet("backup");
    cli.moveSource = parser.isSet("move-source");
    cli.interactive = parser.isSet("interactive");

    AppConfig config;
    QString err;
    const bool explicitConfig = parser.isSet("config");
    const QString configPath = explicitConfig ? parser.value("config") : AppConfig::defaultPath();
    if (!config.load(configPath, explicitConfig, &err)
        || !config.options(parser.value("profile"), cli.conversion, &err)
        || !applyOptionFlags(parser, cli.conversion, &err)) {
        printErr(QString("Error: %1").arg(err));
        return kExitUsage;
    }
    cli.tools = config.toolPaths();

    const QStringList positional = parser.positionalArguments();
    QVector<PlanRequest> requests;

    if (parser.isSet("batch")) {
        if (!parser.isSet("dest-dir")) {
            printErr("Error: --batch requires --dest-dir");
            return kExitUsage;
        }
        QStringList inputs = positional;
        if (parser.isSet("stdin")) {
            QFile in;
            if (!in.open(stdin, QIODevice::ReadOnly)) {
                printErr("Error: failed to read stdin");
                return kExitUsage;
            }
            inputs << BatchInputs::readPathList(in.readAll());
        }
        QStringList sources;
        if (!BatchInputs::collectSources(inputs, parser.isSet("recursive"), sources, &err)) {
            printErr(QString("Error: %1").arg(err));
            return kExitUsage;
        }
        if (sources.isEmpty()) {
            printErr("Error: no batch inputs");
            return kExitUsage;
        }
        for (const QString& src : sources) {
            const QString dest = BatchInputs::destinationFor(parser.value("dest-dir"), parser.value("to-ext"), src);
            requests << makeRequest(cli, src, dest);
        }
    } else {
        if (positional.size() != 2) {
            printErr("Error: expected SOURCE and DEST (or --batch)");
            parser.showHelp(kExitUsage);
        }
        QString dest = positional.at(1);
        if (parser.isSet("to-ext")) dest = BatchInputs::replaceExtension(dest, parser.value("to-ext"));
        requests << makeRequest(cli, positional.at(0), dest);
    }

    if (cli.planOnly) {
        return printPlans(cli, requests);
    }

    QStringList sources;
    for (const PlanRequest& r : requests) sources << r.source;
    history.record(sources);

    if (!parser.isSet("batch")) {
        return runSingle(cli, requests.first());
    }
    if (cli.interactive) {
        return runBatchInteractive(app, cli, requests);
    }
    return runBatch(cli, requests);
}
