// Upload queue: local files to object keys.
#pragma once
#include "QueueManager.hpp"

#include <QStringList>

class UploadQueueManager : public QueueManager {
    Q_OBJECT
public:
    static constexpr int kDefaultConcurrency = 5;

    explicit UploadQueueManager(QObject *parent = nullptr);
    ~UploadQueueManager() override;

    // Keys are prefix/<file name>, or prefix/<path relative to the parent of
    // baseFolder> when baseFolder is given. Missing or non-regular files are
    // skipped. Returns the number of tasks added.
    int addFiles(const QStringList &paths, const QString &prefix,
                 const QString &baseFolder = QString());
    // Walks `folder` recursively and keeps its name as the top key segment.
    int addFolder(const QString &folder, const QString &prefix);

    // Key an upload of `path` would get; exposed for callers that preview.
    static QString keyFor(const QString &path, const QString &prefix,
                          const QString &baseFolder);

protected:
    bool runTask(const QueueTask &task, TaskContext &ctx,
                 owlxfer::TransferError &err) override;
};
