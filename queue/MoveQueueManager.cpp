#include "MoveQueueManager.hpp"
#include "owlxfer/ObjectKeys.hpp"

MoveQueueManager::MoveQueueManager(QObject *parent)
    : QueueManager(QStringLiteral("move"), kDefaultConcurrency, parent) {}

MoveQueueManager::~MoveQueueManager() { shutdown(); }

void MoveQueueManager::setConflictPolicy(owlxfer::ConflictPolicy policy) {
    std::lock_guard<std::mutex> lk(settingsMtx_);
    policy_ = policy;
}

owlxfer::ConflictPolicy MoveQueueManager::conflictPolicy() const {
    std::lock_guard<std::mutex> lk(settingsMtx_);
    return policy_;
}

void MoveQueueManager::setRenamePattern(const QString &pattern) {
    std::lock_guard<std::mutex> lk(settingsMtx_);
    pattern_ = pattern.contains(QStringLiteral("{n}")) ? pattern
                                                        : QStringLiteral("({n})");
}

QString MoveQueueManager::renamePattern() const {
    std::lock_guard<std::mutex> lk(settingsMtx_);
    return pattern_;
}

int MoveQueueManager::addMoves(const QVector<MoveItem> &items,
                               const QString &destinationPrefix) {
    const std::string dest = owlxfer::folderPrefix(destinationPrefix.toStdString());
    int added = 0;
    for (const auto &item : items) {
        std::string key = item.key.toStdString();
        if (item.isDirectory)
            key = owlxfer::folderPrefix(key);
        if (owlxfer::parentPrefix(key) == dest)
            continue;
        const QString source = QString::fromStdString(key);
        if (hasActiveTaskFor(source)) {
            qCInfo(owlQueue) << name() << "skipping duplicate" << source;
            continue;
        }
        const std::string leaf = owlxfer::leafName(key);
        QueueTask t;
        t.kind = TaskKind::Move;
        t.displayName = QString::fromStdString(leaf);
        t.source = source;
        t.destination =
            QString::fromStdString(dest + leaf + (item.isDirectory ? "/" : ""));
        t.isDirectory = item.isDirectory;
        enqueue(t);
        ++added;
    }
    return added;
}

bool MoveQueueManager::addRename(const QString &key, const QString &newName,
                                 bool isDirectory, QString &err) {
    const std::string name = newName.toStdString();
    if (!owlxfer::isValidObjectName(name)) {
        err = QStringLiteral("Invalid name: %1").arg(newName);
        return false;
    }
    std::string source = key.toStdString();
    if (isDirectory)
        source = owlxfer::folderPrefix(source);
    const std::string dest =
        owlxfer::parentPrefix(source) + name + (isDirectory ? "/" : "");
    if (dest == source) {
        err = QStringLiteral("Name unchanged");
        return false;
    }
    if (hasActiveTaskFor(QString::fromStdString(source))) {
        err = QStringLiteral("A task for %1 is already active").arg(key);
        return false;
    }
    QueueTask t;
    t.kind = TaskKind::Move;
    t.displayName = newName;
    t.source = QString::fromStdString(source);
    t.destination = QString::fromStdString(dest);
    t.isDirectory = isDirectory;
    enqueue(t);
    return true;
}

bool MoveQueueManager::runTask(const QueueTask &task, TaskContext &ctx,
                               owlxfer::TransferError &err) {
    owlxfer::MoveExecutor executor(client());
    const std::string bkt = bucket();
    ctx.reportProgress(0, 0.1);

    std::string finalKey;
    bool skip = false;
    if (!executor.resolveDestination(bkt, task.destination.toStdString(),
                                     conflictPolicy(),
                                     renamePattern().toStdString(), finalKey,
                                     skip, err))
        return false;
    if (skip) {
        qCInfo(owlQueue) << name() << "destination exists, skipping"
                         << task.destination;
        ctx.markSkipped();
        return true;
    }
    if (finalKey != task.destination.toStdString()) {
        qCInfo(owlQueue) << name() << "destination exists, renamed to"
                         << QString::fromStdString(finalKey);
        ctx.setDestination(QString::fromStdString(finalKey));
    }
    if (ctx.shouldCancel()) {
        err.message = owlxfer::kCancelledMessage;
        return false;
    }
    ctx.reportProgress(0, 0.3);

    if (!task.isDirectory)
        return executor.moveObject(bkt, task.source.toStdString(), finalKey,
                                   err);

    owlxfer::MoveResult result;
    const bool ok = executor.moveFolder(
        bkt, task.source.toStdString(), finalKey, result, err,
        [&ctx](std::uint64_t, double fraction) {
            ctx.reportProgress(0, 0.3 + 0.7 * fraction);
        },
        ctx.cancelFn());
    QStringList failedKeys;
    for (const auto &key : result.failedKeys)
        failedKeys << QString::fromStdString(key);
    ctx.setMoveResult(result.movedCount, failedKeys);
    return ok;
}
