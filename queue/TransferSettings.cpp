#include "TransferSettings.hpp"
#include "DownloadQueueManager.hpp"
#include "MoveQueueManager.hpp"
#include "UploadQueueManager.hpp"

#include <QtGlobal>
#include <algorithm>

static int clampedConcurrency(int n) {
    return std::clamp(n, QueueManager::kMinConcurrency,
                      QueueManager::kMaxConcurrency);
}

TransferSettings TransferSettings::load(QSettings &s) {
    TransferSettings t;
    t.maxConcurrentUploads = clampedConcurrency(
        s.value("Transfers/maxConcurrentUploads", t.maxConcurrentUploads).toInt());
    t.maxConcurrentDownloads = clampedConcurrency(
        s.value("Transfers/maxConcurrentDownloads", t.maxConcurrentDownloads)
            .toInt());
    t.maxConcurrentMoves = clampedConcurrency(
        s.value("Transfers/maxConcurrentMoves", t.maxConcurrentMoves).toInt());
    t.partConcurrency = std::clamp(
        s.value("Transfers/partConcurrency", t.partConcurrency).toInt(), 1, 32);
    t.uploadThresholdMiB = std::max(
        5, s.value("Transfers/uploadThresholdMiB", t.uploadThresholdMiB).toInt());
    t.downloadThresholdMiB = std::max(
        1, s.value("Transfers/downloadThresholdMiB", t.downloadThresholdMiB)
               .toInt());
    t.downloadChunkMiB = std::max(
        1, s.value("Transfers/downloadChunkMiB", t.downloadChunkMiB).toInt());
    t.maxFileSizeMiB = std::max(
        1, s.value("Transfers/maxFileSizeMiB", t.maxFileSizeMiB).toInt());
    // A single-shot PUT never carries more than the file size limit.
    t.uploadThresholdMiB = std::min(t.uploadThresholdMiB, t.maxFileSizeMiB);

    t.conflictResolution =
        s.value("Move/conflictResolution", t.conflictResolution)
            .toString()
            .toLower();
    t.renamePattern = s.value("Move/renamePattern", t.renamePattern).toString();
    if (!t.renamePattern.contains(QStringLiteral("{n}")))
        t.renamePattern = QStringLiteral("({n})");

    t.endpoint = s.value("Store/endpoint").toString();
    t.region = s.value("Store/region", t.region).toString();
    t.bucket = s.value("Store/bucket").toString();
    t.accessKeyId = s.value("Store/accessKeyId").toString();
    t.pathStyle = s.value("Store/pathStyle", t.pathStyle).toBool();
    t.connectTimeoutMs = std::max(
        1000, s.value("Store/connectTimeoutMs", t.connectTimeoutMs).toInt());
    t.requestTimeoutMs = std::max(
        1000, s.value("Store/requestTimeoutMs", t.requestTimeoutMs).toInt());
    return t;
}

TransferSettings TransferSettings::load(const QString &iniPath) {
    if (iniPath.isEmpty()) {
        QSettings s("OwlXfer", "OwlXfer");
        return load(s);
    }
    QSettings s(iniPath, QSettings::IniFormat);
    return load(s);
}

void TransferSettings::save(QSettings &s) const {
    s.setValue("Transfers/maxConcurrentUploads", maxConcurrentUploads);
    s.setValue("Transfers/maxConcurrentDownloads", maxConcurrentDownloads);
    s.setValue("Transfers/maxConcurrentMoves", maxConcurrentMoves);
    s.setValue("Transfers/partConcurrency", partConcurrency);
    s.setValue("Transfers/uploadThresholdMiB", uploadThresholdMiB);
    s.setValue("Transfers/downloadThresholdMiB", downloadThresholdMiB);
    s.setValue("Transfers/downloadChunkMiB", downloadChunkMiB);
    s.setValue("Transfers/maxFileSizeMiB", maxFileSizeMiB);
    s.setValue("Move/conflictResolution", conflictResolution);
    s.setValue("Move/renamePattern", renamePattern);
    s.setValue("Store/endpoint", endpoint);
    s.setValue("Store/region", region);
    s.setValue("Store/bucket", bucket);
    s.setValue("Store/accessKeyId", accessKeyId);
    s.setValue("Store/pathStyle", pathStyle);
    s.setValue("Store/connectTimeoutMs", connectTimeoutMs);
    s.setValue("Store/requestTimeoutMs", requestTimeoutMs);
    s.sync();
}

owlxfer::TransferLimits TransferSettings::limits() const {
    owlxfer::TransferLimits l;
    l.uploadThreshold = std::uint64_t(uploadThresholdMiB) * owlxfer::kMiB;
    l.downloadThreshold = std::uint64_t(downloadThresholdMiB) * owlxfer::kMiB;
    l.downloadChunkSize = std::uint64_t(downloadChunkMiB) * owlxfer::kMiB;
    l.partParallelism = partConcurrency;
    l.maxFileSize = std::uint64_t(maxFileSizeMiB) * owlxfer::kMiB;
    return l;
}

owlxfer::StoreOptions TransferSettings::storeOptions() const {
    owlxfer::StoreOptions o;
    o.endpoint = endpoint.toStdString();
    o.region = region.isEmpty() ? std::string("auto") : region.toStdString();
    o.accessKeyId = accessKeyId.toStdString();
    o.secretAccessKey = qEnvironmentVariable("OWLXFER_SECRET_ACCESS_KEY").toStdString();
    o.pathStyle = pathStyle;
    o.connectTimeoutMs = connectTimeoutMs;
    o.requestTimeoutMs = requestTimeoutMs;
    return o;
}

owlxfer::ConflictPolicy TransferSettings::conflictPolicy() const {
    return owlxfer::conflictPolicyFromString(conflictResolution.toStdString());
}

void TransferSettings::applyTo(UploadQueueManager &uploads,
                               DownloadQueueManager &downloads,
                               MoveQueueManager &moves) const {
    const owlxfer::TransferLimits l = limits();
    uploads.setLimits(l);
    downloads.setLimits(l);
    moves.setLimits(l);
    uploads.setMaxConcurrentTasks(maxConcurrentUploads);
    downloads.setMaxConcurrentTasks(maxConcurrentDownloads);
    moves.setMaxConcurrentTasks(maxConcurrentMoves);
    moves.setConflictPolicy(conflictPolicy());
    moves.setRenamePattern(renamePattern);
}
