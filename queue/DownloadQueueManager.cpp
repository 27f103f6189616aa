#include "DownloadQueueManager.hpp"
#include "owlxfer/DownloadExecutor.hpp"
#include "owlxfer/ObjectKeys.hpp"
#include "owlxfer/ObjectStoreClient.hpp"

#include <QDir>
#include <QFileInfo>

DownloadQueueManager::DownloadQueueManager(QObject *parent)
    : QueueManager(QStringLiteral("download"), kDefaultConcurrency, parent) {}

DownloadQueueManager::~DownloadQueueManager() { shutdown(); }

int DownloadQueueManager::addDownloads(const QVector<DownloadItem> &items,
                                       const QString &destinationFolder) {
    int added = 0;
    const QDir dest(destinationFolder);
    const QString root = QDir::cleanPath(dest.absolutePath());
    for (const auto &item : items) {
        if (item.key.isEmpty() || item.key.endsWith('/'))
            continue;
        if (hasActiveTaskFor(item.key)) {
            qCInfo(owlQueue) << name() << "skipping duplicate" << item.key;
            continue;
        }
        const QString relName =
            item.name.isEmpty()
                ? QString::fromStdString(owlxfer::leafName(item.key.toStdString()))
                : item.name;
        const QString target = QDir::cleanPath(dest.absoluteFilePath(relName));
        if (!target.startsWith(root + QLatin1Char('/'))) {
            qCWarning(owlQueue) << name() << "skipping key outside destination"
                                << item.key << "->" << target;
            continue;
        }
        QueueTask t;
        t.kind = TaskKind::Download;
        t.displayName = QFileInfo(relName).fileName();
        t.size = item.size;
        t.source = item.key;
        t.destination = target;
        enqueue(t);
        ++added;
    }
    return added;
}

bool DownloadQueueManager::addFolderDownload(const QString &folderKey,
                                             const QString &destinationFolder,
                                             int &added,
                                             owlxfer::TransferError &err) {
    added = 0;
    owlxfer::ObjectStoreClient *c = client();
    if (!c) {
        err.kind = owlxfer::ErrorKind::NotConfigured;
        err.message = "Object store client not configured";
        return false;
    }
    const std::string prefix = owlxfer::folderPrefix(folderKey.toStdString());
    const std::string parent = owlxfer::parentPrefix(prefix);
    QVector<DownloadItem> items;
    std::optional<std::string> token;
    do {
        owlxfer::ListPage page;
        owlxfer::StoreError serr;
        if (!c->listObjects(bucket(), prefix, token, page, serr)) {
            err = owlxfer::classify(serr);
            return false;
        }
        for (const auto &o : page.objects) {
            if (owlxfer::isFolderKey(o.key))
                continue; // markers
            DownloadItem item;
            item.key = QString::fromStdString(o.key);
            item.name = QString::fromStdString(o.key.substr(parent.size()));
            item.size = o.size;
            items.push_back(item);
        }
        token = page.nextToken;
    } while (token);
    added = addDownloads(items, destinationFolder);
    return true;
}

bool DownloadQueueManager::runTask(const QueueTask &task, TaskContext &ctx,
                                   owlxfer::TransferError &err) {
    const QFileInfo target(task.destination);
    if (!QDir().mkpath(target.absolutePath())) {
        err.kind = owlxfer::ErrorKind::PermissionDenied;
        err.message = "Cannot create folder " +
                      target.absolutePath().toStdString();
        return false;
    }
    owlxfer::DownloadExecutor executor(client(), limits());
    owlxfer::DownloadRequest req;
    req.bucket = bucket();
    req.key = task.source.toStdString();
    req.localPath = task.destination.toStdString();
    req.size = task.size;
    return executor.run(req, err, ctx.progressFn(), ctx.cancelFn(),
                        [&ctx](std::uint64_t size) { ctx.setSize(size); });
}
