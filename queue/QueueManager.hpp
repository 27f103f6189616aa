// Generic transfer queue: task list, admission through a ConcurrencyGate,
// a QTimer poll loop and executors running on a private QThreadPool.
// Subclasses provide runTask() and their own add*() entry points.
#pragma once
#include "QueueTask.hpp"
#include "owlxfer/ChunkPlanner.hpp"
#include "owlxfer/ConcurrencyGate.hpp"
#include "owlxfer/TransferCallbacks.hpp"

#include <QLoggingCategory>
#include <QObject>
#include <QThreadPool>
#include <QTimer>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

Q_DECLARE_LOGGING_CATEGORY(owlQueue)

namespace owlxfer { class ObjectStoreClient; }

class QueueManager;

// Handed to runTask(); the only way an executor reports back to the queue.
class TaskContext {
public:
    TaskContext(QueueManager *manager, quint64 taskId)
        : manager_(manager), taskId_(taskId) {}

    quint64 taskId() const { return taskId_; }

    // Monotonic: values lower than what was already reported are ignored.
    void reportProgress(quint64 bytes, double fraction);
    // True once the task left Processing (cancelled or cleared).
    bool shouldCancel() const;
    void setDestination(const QString &destination);
    // Fills in a size that was unknown at enqueue time.
    void setSize(quint64 size);
    void setMoveResult(int moved, const QStringList &failedKeys);
    // Ends the task as Cancelled instead of Completed (collision "skip").
    void markSkipped() { skipped_ = true; }
    bool skipped() const { return skipped_; }

    owlxfer::ProgressFn progressFn();
    owlxfer::CancelFn cancelFn() const;

private:
    QueueManager *manager_ = nullptr;
    quint64 taskId_ = 0;
    bool skipped_ = false;
};

class QueueManager : public QObject {
    Q_OBJECT
public:
    static constexpr int kMinConcurrency = 1;
    static constexpr int kMaxConcurrency = 10;
    static constexpr int kDefaultPollIntervalMs = 500;
    static constexpr qint64 kSpeedWindowMs = 5000;

    QueueManager(const QString &name, int maxConcurrent,
                 QObject *parent = nullptr);
    ~QueueManager() override;

    // Injects the store client (not owned) and the bucket to operate on.
    void setClient(owlxfer::ObjectStoreClient *client,
                   const std::string &bucket);
    void setLimits(const owlxfer::TransferLimits &limits);
    owlxfer::TransferLimits limits() const;

    // Clamped to [1, 10]. Takes effect for the next admissions.
    void setMaxConcurrentTasks(int n);
    int maxConcurrentTasks() const;
    void setPollIntervalMs(int ms);
    // Called on the manager's thread when the queue drains with at least one
    // completed task.
    void setOnQueueComplete(std::function<void()> cb);

    const QString &name() const { return name_; }

    // Assigns an id, resets runtime fields and starts polling.
    quint64 enqueue(QueueTask task);

    void cancelTask(quint64 id);
    void retryTask(quint64 id);
    void retryAllFailed();
    void clearCompleted();
    void clearFailedCancelled();
    void clearAll();

    QVector<QueueTask> tasksSnapshot() const;
    std::optional<QueueTask> task(quint64 id) const;
    QueueStats stats() const;
    bool isPolling() const;

    // Cancels everything active and waits for running executors. Subclasses
    // call this from their destructor.
    void shutdown();

signals:
    void taskUpdated(quint64 id, TaskStatus status, double progress);
    void tasksChanged();
    void statsChanged();
    void queueCompleted(int completedCount);

protected:
    // Runs on a pool thread. Returns false with `err` filled on failure.
    virtual bool runTask(const QueueTask &task, TaskContext &ctx,
                         owlxfer::TransferError &err) = 0;

    owlxfer::ObjectStoreClient *client() const;
    std::string bucket() const;
    // True if a pending or processing task already has this source.
    bool hasActiveTaskFor(const QString &source) const;

private slots:
    void startPolling();
    void pollTick();

private:
    friend class TaskContext;

    int indexForId(quint64 id) const; // expects mtx_ held
    void runWorker(const QueueTask &task);
    void finishTask(quint64 id, bool ok, bool skipped,
                    const owlxfer::TransferError &err);
    void sampleThroughput(); // expects mtx_ held
    void resetRuntime(QueueTask &t) const;
    void requestPoll();

    // TaskContext entry points
    void applyProgress(quint64 id, quint64 bytes, double fraction);
    bool isTaskCancelled(quint64 id) const;
    void applyDestination(quint64 id, const QString &destination);
    void applySize(quint64 id, quint64 size);
    void applyMoveResult(quint64 id, int moved, const QStringList &failedKeys);

    QString name_;
    mutable std::mutex mtx_; // protects everything below except pool_/timer_
    QVector<QueueTask> tasks_;
    owlxfer::ObjectStoreClient *client_ = nullptr; // not owned
    std::string bucket_;
    owlxfer::TransferLimits limits_;
    int maxConcurrent_ = 1;
    std::function<void()> onQueueComplete_;
    std::deque<std::pair<qint64, quint64>> samples_; // (ms, transferred)
    double bytesPerSecond_ = 0.0;
    bool shuttingDown_ = false;

    owlxfer::ConcurrencyGate gate_;
    QThreadPool pool_;
    QTimer timer_;
};
