// Persistent transfer configuration (QSettings "OwlXfer"/"OwlXfer" or an
// explicit ini file).
#pragma once
#include "owlxfer/ChunkPlanner.hpp"
#include "owlxfer/MoveExecutor.hpp"
#include "owlxfer/StoreTypes.hpp"

#include <QSettings>
#include <QString>

class UploadQueueManager;
class DownloadQueueManager;
class MoveQueueManager;

struct TransferSettings {
    int maxConcurrentUploads = 5;
    int maxConcurrentDownloads = 3;
    int maxConcurrentMoves = 3;
    int partConcurrency = 12;
    int uploadThresholdMiB = 100;
    int downloadThresholdMiB = 10;
    int downloadChunkMiB = 10;
    int maxFileSizeMiB = 5120;

    QString conflictResolution = QStringLiteral("rename");
    QString renamePattern = QStringLiteral("({n})");

    QString endpoint;
    QString region = QStringLiteral("auto");
    QString bucket;
    QString accessKeyId;
    bool pathStyle = true;
    int connectTimeoutMs = 15000;
    int requestTimeoutMs = 60000;

    static TransferSettings load(QSettings &s);
    // Empty path: the user's native settings store.
    static TransferSettings load(const QString &iniPath = QString());
    void save(QSettings &s) const;

    owlxfer::TransferLimits limits() const;
    // Secret comes from OWLXFER_SECRET_ACCESS_KEY.
    owlxfer::StoreOptions storeOptions() const;
    owlxfer::ConflictPolicy conflictPolicy() const;

    void applyTo(UploadQueueManager &uploads, DownloadQueueManager &downloads,
                 MoveQueueManager &moves) const;
};
