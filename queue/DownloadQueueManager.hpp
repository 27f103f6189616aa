// Download queue: object keys to local files.
#pragma once
#include "QueueManager.hpp"

#include <QVector>

struct DownloadItem {
    QString key;
    QString name; // may contain a relative path; empty = last key segment
    quint64 size = 0; // 0 = unknown
};

class DownloadQueueManager : public QueueManager {
    Q_OBJECT
public:
    static constexpr int kDefaultConcurrency = 3;

    explicit DownloadQueueManager(QObject *parent = nullptr);
    ~DownloadQueueManager() override;

    // Keys that already have a pending or processing task are skipped.
    // Returns the number of tasks added.
    int addDownloads(const QVector<DownloadItem> &items,
                     const QString &destinationFolder);

    // Lists everything under `folderKey` and queues each object under
    // destinationFolder/<folder name>/... Blocks for the listing.
    bool addFolderDownload(const QString &folderKey,
                           const QString &destinationFolder, int &added,
                           owlxfer::TransferError &err);

protected:
    bool runTask(const QueueTask &task, TaskContext &ctx,
                 owlxfer::TransferError &err) override;
};
