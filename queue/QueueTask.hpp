// Queue task model shared by the upload, download and move queues.
#pragma once
#include "owlxfer/ErrorClassifier.hpp"

#include <QMetaType>
#include <QString>
#include <QStringList>
#include <QVector>

// Lifecycle:
//   Pending -> Processing | Cancelled
//   Processing -> Completed | Failed | Cancelled
//   Failed -> Pending (retry)
// Completed and Cancelled are terminal.
enum class TaskStatus { Pending, Processing, Completed, Failed, Cancelled };

enum class TaskKind { Upload, Download, Move };

const char *taskStatusName(TaskStatus s);

inline bool isActiveStatus(TaskStatus s) {
    return s == TaskStatus::Pending || s == TaskStatus::Processing;
}

struct QueueTask {
    quint64 id = 0; // process-unique, stable across threads
    TaskKind kind = TaskKind::Upload;
    QString displayName;
    quint64 size = 0; // bytes; 0 when unknown (folders, moves)
    QString source;      // local path (upload) or key (download/move)
    QString destination; // key (upload/move) or local path (download)
    QString contentType; // uploads only
    bool isDirectory = false; // moves only

    TaskStatus status = TaskStatus::Pending;
    double progress = 0.0; // 0..1
    quint64 bytesTransferred = 0;
    qint64 startedAtMs = 0;
    qint64 finishedAtMs = 0;
    int attempts = 0;

    QString error;
    owlxfer::ErrorKind errorKind = owlxfer::ErrorKind::Unknown;
    bool retryable = false;

    // Folder moves
    int movedObjects = 0;
    int failedObjects = 0;
    QStringList failedKeys; // keys left at the source
};

// Aggregate view of one queue.
struct QueueStats {
    int total = 0;
    int pending = 0;
    int processing = 0;
    int completed = 0;
    int failed = 0;
    int cancelled = 0;

    quint64 totalBytes = 0;
    quint64 transferredBytes = 0;
    double bytesPerSecond = 0.0;
    int etaSeconds = -1; // -1 = unknown
    double averageProgress = 0.0;

    bool hasActive() const { return pending + processing > 0; }
};

Q_DECLARE_METATYPE(TaskStatus)
