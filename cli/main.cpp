// owlxfer: command-line front end for the upload, download and move queues.
#include "DownloadQueueManager.hpp"
#include "MoveQueueManager.hpp"
#include "QueueFormat.hpp"
#include "TransferSettings.hpp"
#include "UploadQueueManager.hpp"
#include "owlxfer/Logging.hpp"
#include "owlxfer/MockObjectStoreClient.hpp"
#include "owlxfer/S3ObjectStoreClient.hpp"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QTextStream>
#include <cstdlib>
#include <memory>

Q_LOGGING_CATEGORY(owlCli, "owlxfer.cli")

static QTextStream &out() {
    static QTextStream s(stdout);
    return s;
}

static QTextStream &err() {
    static QTextStream s(stderr);
    return s;
}

// "key" or "key:size"; keys may themselves contain ':'.
static DownloadItem parseDownloadArg(const QString &arg) {
    DownloadItem item;
    item.key = arg;
    const int colon = arg.lastIndexOf(':');
    if (colon > 0) {
        bool ok = false;
        const quint64 size = arg.mid(colon + 1).toULongLong(&ok);
        if (ok) {
            item.key = arg.left(colon);
            item.size = size;
        }
    }
    return item;
}

static void printProgress(const QueueManager &m) {
    const QueueStats s = m.stats();
    out() << "[" << m.name() << "] "
          << s.completed << "/" << s.total << " done, "
          << s.failed << " failed  "
          << owlqueue::formatBytes(s.transferredBytes) << " / "
          << owlqueue::formatBytes(s.totalBytes) << "  "
          << owlqueue::formatSpeed(s.bytesPerSecond) << "  ETA "
          << owlqueue::formatEta(s.etaSeconds) << Qt::endl;
}

static int printSummary(const QueueManager &m) {
    int notCompleted = 0;
    for (const auto &t : m.tasksSnapshot()) {
        out() << taskStatusName(t.status) << "  " << t.source << " -> "
              << t.destination;
        if (t.status == TaskStatus::Failed) {
            out() << "  (" << owlxfer::errorKindName(t.errorKind)
                  << (t.retryable ? ", retryable" : "") << "): " << t.error;
        }
        if (t.kind == TaskKind::Move && t.isDirectory)
            out() << "  [" << t.movedObjects << " moved, " << t.failedObjects
                  << " failed]";
        out() << Qt::endl;
        for (const QString &key : t.failedKeys)
            out() << "    not moved: " << key << Qt::endl;
        if (t.status != TaskStatus::Completed)
            ++notCompleted;
    }
    return notCompleted;
}

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("OwlXfer"));
    QCoreApplication::setApplicationName(QStringLiteral("owlxfer"));
    QCoreApplication::setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Transfer files to and from an S3-compatible store."));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption settingsOpt(
        QStringLiteral("settings"),
        QStringLiteral("Read configuration from <ini> instead of the user "
                       "settings."),
        QStringLiteral("ini"));
    const QCommandLineOption mockOpt(
        QStringLiteral("mock"),
        QStringLiteral("Use an in-memory store instead of the network."));
    const QCommandLineOption bucketOpt(QStringLiteral("bucket"),
                                       QStringLiteral("Bucket override."),
                                       QStringLiteral("name"));
    const QCommandLineOption prefixOpt(QStringLiteral("prefix"),
                                       QStringLiteral("Key prefix for uploads."),
                                       QStringLiteral("p"));
    const QCommandLineOption toOpt(
        QStringLiteral("to"),
        QStringLiteral("Destination folder (download) or prefix (move)."),
        QStringLiteral("dest"));
    parser.addOption(settingsOpt);
    parser.addOption(mockOpt);
    parser.addOption(bucketOpt);
    parser.addOption(prefixOpt);
    parser.addOption(toOpt);
    parser.addPositionalArgument(
        QStringLiteral("command"),
        QStringLiteral("upload <paths...> | download <key[:size]...> | "
                       "move <keys...> | rename <key> <newName>"));
    parser.process(app);

    QStringList args = parser.positionalArguments();
    if (args.isEmpty())
        parser.showHelp(EXIT_FAILURE);
    const QString command = args.takeFirst();

    const TransferSettings settings =
        TransferSettings::load(parser.value(settingsOpt));
    const QString bucket =
        parser.isSet(bucketOpt) ? parser.value(bucketOpt) : settings.bucket;
    if (bucket.isEmpty()) {
        err() << "No bucket configured (Store/bucket or --bucket)" << Qt::endl;
        return EXIT_FAILURE;
    }

    std::unique_ptr<owlxfer::ObjectStoreClient> client;
    if (parser.isSet(mockOpt)) {
        auto mock = std::make_unique<owlxfer::MockObjectStoreClient>();
        mock->addBucket(bucket.toStdString());
        client = std::move(mock);
        qCInfo(owlCli) << "using in-memory store";
    } else {
        const owlxfer::StoreOptions opt = settings.storeOptions();
        if (opt.endpoint.empty() || opt.accessKeyId.empty() ||
            opt.secretAccessKey.empty()) {
            err() << "Store not configured: set Store/endpoint, "
                     "Store/accessKeyId and OWLXFER_SECRET_ACCESS_KEY"
                  << Qt::endl;
            return EXIT_FAILURE;
        }
        qCInfo(owlCli) << "endpoint" << QString::fromStdString(opt.endpoint)
                       << "keyId"
                       << QString::fromStdString(
                              owlxfer::LogPolicy::fromEnvironment().keyId(
                                  opt.accessKeyId));
        client = std::make_unique<owlxfer::S3ObjectStoreClient>(opt);
    }

    UploadQueueManager uploads;
    DownloadQueueManager downloads;
    MoveQueueManager moves;
    settings.applyTo(uploads, downloads, moves);
    for (QueueManager *m : {static_cast<QueueManager *>(&uploads),
                            static_cast<QueueManager *>(&downloads),
                            static_cast<QueueManager *>(&moves)}) {
        m->setClient(client.get(), bucket.toStdString());
    }

    QueueManager *active = nullptr;
    int added = 0;
    if (command == QLatin1String("upload")) {
        active = &uploads;
        const QString prefix = parser.value(prefixOpt);
        for (const QString &path : args) {
            if (QFileInfo(path).isDir())
                added += uploads.addFolder(path, prefix);
            else
                added += uploads.addFiles({path}, prefix);
        }
    } else if (command == QLatin1String("download")) {
        active = &downloads;
        if (!parser.isSet(toOpt)) {
            err() << "download needs --to <dir>" << Qt::endl;
            return EXIT_FAILURE;
        }
        QVector<DownloadItem> items;
        for (const QString &arg : args) {
            if (arg.endsWith('/')) {
                int folderAdded = 0;
                owlxfer::TransferError e;
                if (!downloads.addFolderDownload(arg, parser.value(toOpt),
                                                 folderAdded, e)) {
                    err() << "Cannot list " << arg << ": "
                          << QString::fromStdString(e.message) << Qt::endl;
                    continue;
                }
                added += folderAdded;
            } else {
                items.push_back(parseDownloadArg(arg));
            }
        }
        added += downloads.addDownloads(items, parser.value(toOpt));
    } else if (command == QLatin1String("move")) {
        active = &moves;
        if (!parser.isSet(toOpt)) {
            err() << "move needs --to <prefix>" << Qt::endl;
            return EXIT_FAILURE;
        }
        QVector<MoveItem> items;
        for (const QString &arg : args)
            items.push_back(MoveItem{arg, arg.endsWith('/')});
        added = moves.addMoves(items, parser.value(toOpt));
    } else if (command == QLatin1String("rename")) {
        active = &moves;
        if (args.size() != 2) {
            err() << "rename needs <key> <newName>" << Qt::endl;
            return EXIT_FAILURE;
        }
        QString e;
        if (!moves.addRename(args[0], args[1], args[0].endsWith('/'), e)) {
            err() << e << Qt::endl;
            return EXIT_FAILURE;
        }
        added = 1;
    } else {
        err() << "Unknown command: " << command << Qt::endl;
        parser.showHelp(EXIT_FAILURE);
    }

    if (added == 0) {
        err() << "Nothing to do" << Qt::endl;
        return EXIT_FAILURE;
    }

    QObject::connect(active, &QueueManager::statsChanged, active,
                     [active]() { printProgress(*active); });
    QObject::connect(active, &QueueManager::queueCompleted, &app,
                     [&app](int) { app.quit(); });
    app.exec();

    const int notCompleted = printSummary(*active);
    return notCompleted == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
