#include "UploadQueueManager.hpp"
#include "owlxfer/ObjectKeys.hpp"
#include "owlxfer/UploadExecutor.hpp"

#include <QDir>
#include <QDirIterator>
#include <QFileInfo>
#include <QMimeDatabase>

UploadQueueManager::UploadQueueManager(QObject *parent)
    : QueueManager(QStringLiteral("upload"), kDefaultConcurrency, parent) {}

UploadQueueManager::~UploadQueueManager() { shutdown(); }

QString UploadQueueManager::keyFor(const QString &path, const QString &prefix,
                                   const QString &baseFolder) {
    const QFileInfo fi(path);
    QString relative = fi.fileName();
    if (!baseFolder.isEmpty()) {
        // Keep the base folder's own name: relative to its parent.
        const QFileInfo base(QDir::cleanPath(baseFolder));
        relative = QDir(base.absolutePath()).relativeFilePath(fi.absoluteFilePath());
    }
    return QString::fromStdString(
        owlxfer::joinKey(prefix.toStdString(), relative.toStdString()));
}

int UploadQueueManager::addFiles(const QStringList &paths,
                                 const QString &prefix,
                                 const QString &baseFolder) {
    static const QMimeDatabase mimeDb;
    int added = 0;
    for (const QString &path : paths) {
        const QFileInfo fi(path);
        if (!fi.exists() || !fi.isFile()) {
            qCWarning(owlQueue) << name() << "skipping missing file" << path;
            continue;
        }
        QueueTask t;
        t.kind = TaskKind::Upload;
        t.displayName = fi.fileName();
        t.size = static_cast<quint64>(fi.size());
        t.source = fi.absoluteFilePath();
        t.destination = keyFor(path, prefix, baseFolder);
        t.contentType =
            mimeDb.mimeTypeForFile(fi, QMimeDatabase::MatchExtension).name();
        enqueue(t);
        ++added;
    }
    return added;
}

int UploadQueueManager::addFolder(const QString &folder,
                                  const QString &prefix) {
    const QFileInfo fi(folder);
    if (!fi.isDir()) {
        qCWarning(owlQueue) << name() << "not a folder" << folder;
        return 0;
    }
    QStringList files;
    QDirIterator it(fi.absoluteFilePath(),
                    QDir::Files | QDir::Hidden | QDir::NoDotAndDotDot,
                    QDirIterator::Subdirectories);
    while (it.hasNext())
        files << it.next();
    files.sort();
    return addFiles(files, prefix, fi.absoluteFilePath());
}

bool UploadQueueManager::runTask(const QueueTask &task, TaskContext &ctx,
                                 owlxfer::TransferError &err) {
    owlxfer::UploadExecutor executor(client(), limits());
    owlxfer::UploadRequest req;
    req.localPath = task.source.toStdString();
    req.bucket = bucket();
    req.key = task.destination.toStdString();
    if (!task.contentType.isEmpty())
        req.contentType = task.contentType.toStdString();
    return executor.run(req, err, ctx.progressFn(), ctx.cancelFn());
}
