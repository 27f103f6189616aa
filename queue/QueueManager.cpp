// Queue implementation: admits pending tasks through the gate on each poll
// tick and runs their executors on the manager's thread pool.
#include "QueueManager.hpp"
#include "owlxfer/ObjectStoreClient.hpp"

#include <QDateTime>
#include <QMetaObject>
#include <algorithm>
#include <atomic>

Q_LOGGING_CATEGORY(owlQueue, "owlxfer.queue")

const char *taskStatusName(TaskStatus s) {
    switch (s) {
    case TaskStatus::Pending:
        return "Pending";
    case TaskStatus::Processing:
        return "Processing";
    case TaskStatus::Completed:
        return "Completed";
    case TaskStatus::Failed:
        return "Failed";
    case TaskStatus::Cancelled:
        return "Cancelled";
    }
    return "Unknown";
}

static quint64 nextTaskId() {
    static std::atomic<quint64> counter{1};
    return counter.fetch_add(1);
}

static int clampConcurrency(int n) {
    return std::clamp(n, QueueManager::kMinConcurrency,
                      QueueManager::kMaxConcurrency);
}

// TaskContext

void TaskContext::reportProgress(quint64 bytes, double fraction) {
    manager_->applyProgress(taskId_, bytes, fraction);
}

bool TaskContext::shouldCancel() const {
    return manager_->isTaskCancelled(taskId_);
}

void TaskContext::setDestination(const QString &destination) {
    manager_->applyDestination(taskId_, destination);
}

void TaskContext::setMoveResult(int moved, const QStringList &failedKeys) {
    manager_->applyMoveResult(taskId_, moved, failedKeys);
}

void TaskContext::setSize(quint64 size) { manager_->applySize(taskId_, size); }

owlxfer::ProgressFn TaskContext::progressFn() {
    return [this](std::uint64_t bytes, double fraction) {
        reportProgress(bytes, fraction);
    };
}

owlxfer::CancelFn TaskContext::cancelFn() const {
    return [this]() { return shouldCancel(); };
}

// QueueManager

QueueManager::QueueManager(const QString &name, int maxConcurrent,
                           QObject *parent)
    : QObject(parent), name_(name),
      maxConcurrent_(clampConcurrency(maxConcurrent)),
      gate_(clampConcurrency(maxConcurrent)) {
    qRegisterMetaType<TaskStatus>("TaskStatus");
    pool_.setMaxThreadCount(kMaxConcurrency);
    timer_.setInterval(kDefaultPollIntervalMs);
    connect(&timer_, &QTimer::timeout, this, &QueueManager::pollTick);
}

QueueManager::~QueueManager() { shutdown(); }

void QueueManager::setClient(owlxfer::ObjectStoreClient *client,
                             const std::string &bucket) {
    std::lock_guard<std::mutex> lk(mtx_);
    client_ = client;
    bucket_ = bucket;
}

void QueueManager::setLimits(const owlxfer::TransferLimits &limits) {
    std::lock_guard<std::mutex> lk(mtx_);
    limits_ = limits;
}

owlxfer::TransferLimits QueueManager::limits() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return limits_;
}

void QueueManager::setMaxConcurrentTasks(int n) {
    n = clampConcurrency(n);
    {
        std::lock_guard<std::mutex> lk(mtx_);
        maxConcurrent_ = n;
    }
    gate_.setLimit(n);
    qCInfo(owlQueue) << name_ << "max concurrent tasks" << n;
    requestPoll();
}

int QueueManager::maxConcurrentTasks() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return maxConcurrent_;
}

void QueueManager::setPollIntervalMs(int ms) {
    timer_.setInterval(std::max(10, ms));
}

void QueueManager::setOnQueueComplete(std::function<void()> cb) {
    std::lock_guard<std::mutex> lk(mtx_);
    onQueueComplete_ = std::move(cb);
}

owlxfer::ObjectStoreClient *QueueManager::client() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return client_;
}

std::string QueueManager::bucket() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return bucket_;
}

bool QueueManager::hasActiveTaskFor(const QString &source) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return std::any_of(tasks_.cbegin(), tasks_.cend(),
                       [&source](const QueueTask &t) {
                           return t.source == source &&
                                  isActiveStatus(t.status);
                       });
}

int QueueManager::indexForId(quint64 id) const {
    for (int i = 0; i < tasks_.size(); ++i) {
        if (tasks_[i].id == id)
            return i;
    }
    return -1;
}

void QueueManager::resetRuntime(QueueTask &t) const {
    t.status = TaskStatus::Pending;
    t.progress = 0.0;
    t.bytesTransferred = 0;
    t.startedAtMs = 0;
    t.finishedAtMs = 0;
    t.error.clear();
    t.errorKind = owlxfer::ErrorKind::Unknown;
    t.retryable = false;
    t.movedObjects = 0;
    t.failedObjects = 0;
    t.failedKeys.clear();
}

void QueueManager::requestPoll() {
    QMetaObject::invokeMethod(this, "startPolling", Qt::QueuedConnection);
}

quint64 QueueManager::enqueue(QueueTask task) {
    task.id = nextTaskId();
    task.attempts = 0;
    resetRuntime(task);
    {
        std::lock_guard<std::mutex> lk(mtx_);
        tasks_.push_back(task);
    }
    qCInfo(owlQueue) << name_ << "enqueued" << "taskId=" << task.id
                     << "source=" << task.source
                     << "destination=" << task.destination
                     << "size=" << task.size;
    emit tasksChanged();
    requestPoll();
    return task.id;
}

void QueueManager::cancelTask(quint64 id) {
    bool changed = false;
    double progress = 0.0;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        const int i = indexForId(id);
        if (i >= 0 && isActiveStatus(tasks_[i].status)) {
            tasks_[i].status = TaskStatus::Cancelled;
            tasks_[i].finishedAtMs = QDateTime::currentMSecsSinceEpoch();
            progress = tasks_[i].progress;
            changed = true;
        }
    }
    if (changed) {
        qCInfo(owlQueue) << name_ << "cancelTask" << "taskId=" << id;
        emit taskUpdated(id, TaskStatus::Cancelled, progress);
        emit tasksChanged();
    }
}

void QueueManager::retryTask(quint64 id) {
    bool changed = false;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        const int i = indexForId(id);
        if (i >= 0 && tasks_[i].status == TaskStatus::Failed) {
            resetRuntime(tasks_[i]);
            changed = true;
        }
    }
    if (changed) {
        qCInfo(owlQueue) << name_ << "retryTask" << "taskId=" << id;
        emit taskUpdated(id, TaskStatus::Pending, 0.0);
        emit tasksChanged();
        requestPoll();
    }
}

void QueueManager::retryAllFailed() {
    int count = 0;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        for (auto &t : tasks_) {
            if (t.status == TaskStatus::Failed) {
                resetRuntime(t);
                ++count;
            }
        }
    }
    if (count > 0) {
        qCInfo(owlQueue) << name_ << "retryAllFailed" << "count=" << count;
        emit tasksChanged();
        requestPoll();
    }
}

void QueueManager::clearCompleted() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        QVector<QueueTask> next;
        next.reserve(tasks_.size());
        for (const auto &t : tasks_) {
            if (t.status != TaskStatus::Completed)
                next.push_back(t);
        }
        tasks_.swap(next);
        samples_.clear();
    }
    emit tasksChanged();
    emit statsChanged();
}

void QueueManager::clearFailedCancelled() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        QVector<QueueTask> next;
        next.reserve(tasks_.size());
        for (const auto &t : tasks_) {
            if (t.status != TaskStatus::Failed &&
                t.status != TaskStatus::Cancelled)
                next.push_back(t);
        }
        tasks_.swap(next);
        samples_.clear();
    }
    emit tasksChanged();
    emit statsChanged();
}

void QueueManager::clearAll() {
    int cancelled = 0;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        // Running executors observe Cancelled before the entries disappear;
        // once removed, isTaskCancelled() keeps answering true for them.
        for (auto &t : tasks_) {
            if (isActiveStatus(t.status)) {
                t.status = TaskStatus::Cancelled;
                ++cancelled;
            }
        }
        tasks_.clear();
        samples_.clear();
        bytesPerSecond_ = 0.0;
    }
    qCInfo(owlQueue) << name_ << "clearAll" << "cancelled=" << cancelled;
    emit tasksChanged();
    emit statsChanged();
}

QVector<QueueTask> QueueManager::tasksSnapshot() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return tasks_;
}

std::optional<QueueTask> QueueManager::task(quint64 id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    const int i = indexForId(id);
    if (i < 0)
        return std::nullopt;
    return tasks_[i];
}

QueueStats QueueManager::stats() const {
    std::lock_guard<std::mutex> lk(mtx_);
    QueueStats s;
    s.total = static_cast<int>(tasks_.size());
    double progressSum = 0.0;
    quint64 remaining = 0;
    for (const auto &t : tasks_) {
        s.totalBytes += t.size;
        progressSum += t.progress;
        switch (t.status) {
        case TaskStatus::Pending:
            ++s.pending;
            remaining += t.size;
            break;
        case TaskStatus::Processing:
            ++s.processing;
            s.transferredBytes += t.bytesTransferred;
            remaining += t.size > t.bytesTransferred
                             ? t.size - t.bytesTransferred
                             : 0;
            break;
        case TaskStatus::Completed:
            ++s.completed;
            s.transferredBytes += t.size;
            break;
        case TaskStatus::Failed:
            ++s.failed;
            break;
        case TaskStatus::Cancelled:
            ++s.cancelled;
            break;
        }
    }
    s.averageProgress = s.total > 0 ? progressSum / s.total : 0.0;
    s.bytesPerSecond = bytesPerSecond_;
    if (bytesPerSecond_ > 0.0 && remaining > 0)
        s.etaSeconds = static_cast<int>(double(remaining) / bytesPerSecond_);
    else if (s.hasActive())
        s.etaSeconds = -1;
    else
        s.etaSeconds = 0;
    return s;
}

bool QueueManager::isPolling() const { return timer_.isActive(); }

void QueueManager::shutdown() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (shuttingDown_)
            return;
        shuttingDown_ = true;
        const qint64 nowMs = QDateTime::currentMSecsSinceEpoch();
        for (auto &t : tasks_) {
            if (isActiveStatus(t.status)) {
                t.status = TaskStatus::Cancelled;
                t.finishedAtMs = nowMs;
            }
        }
    }
    timer_.stop();
    pool_.waitForDone();
}

void QueueManager::startPolling() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (shuttingDown_)
            return;
    }
    if (!timer_.isActive())
        timer_.start();
    pollTick();
}

void QueueManager::sampleThroughput() {
    const qint64 now = QDateTime::currentMSecsSinceEpoch();
    quint64 transferred = 0;
    for (const auto &t : tasks_) {
        if (t.status == TaskStatus::Completed)
            transferred += t.size;
        else if (t.status == TaskStatus::Processing)
            transferred += t.bytesTransferred;
    }
    // Clears and retries shrink the total; restart the window.
    if (!samples_.empty() && transferred < samples_.back().second)
        samples_.clear();
    samples_.emplace_back(now, transferred);
    while (samples_.size() > 1 && now - samples_.front().first > kSpeedWindowMs)
        samples_.pop_front();

    bytesPerSecond_ = 0.0;
    if (samples_.size() >= 2) {
        const auto &first = samples_.front();
        const auto &last = samples_.back();
        const qint64 dt = last.first - first.first;
        if (dt > 0)
            bytesPerSecond_ =
                double(last.second - first.second) * 1000.0 / double(dt);
    }
}

void QueueManager::pollTick() {
    QVector<QueueTask> launch;
    bool idle = false;
    int completed = 0;
    std::function<void()> onComplete;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (shuttingDown_)
            return;
        const qint64 nowMs = QDateTime::currentMSecsSinceEpoch();
        for (auto &t : tasks_) {
            if (t.status != TaskStatus::Pending)
                continue;
            if (!gate_.tryAcquire())
                break;
            t.status = TaskStatus::Processing;
            t.startedAtMs = nowMs;
            t.finishedAtMs = 0;
            ++t.attempts;
            launch.push_back(t);
        }
        sampleThroughput();

        idle = std::none_of(tasks_.cbegin(), tasks_.cend(),
                            [](const QueueTask &t) {
                                return isActiveStatus(t.status);
                            });
        if (idle) {
            completed = static_cast<int>(std::count_if(
                tasks_.cbegin(), tasks_.cend(), [](const QueueTask &t) {
                    return t.status == TaskStatus::Completed;
                }));
            onComplete = onQueueComplete_;
            samples_.clear();
            bytesPerSecond_ = 0.0;
        }
    }

    for (const auto &t : launch) {
        qCInfo(owlQueue) << name_ << "task started" << "taskId=" << t.id
                         << "attempt=" << t.attempts;
        emit taskUpdated(t.id, TaskStatus::Processing, 0.0);
        pool_.start([this, t]() { runWorker(t); });
    }
    if (!launch.isEmpty())
        emit tasksChanged();
    emit statsChanged();

    if (idle && timer_.isActive()) {
        timer_.stop();
        qCInfo(owlQueue) << name_ << "queue drained" << "completed="
                         << completed;
        emit queueCompleted(completed);
        if (completed > 0 && onComplete)
            onComplete();
    }
}

void QueueManager::runWorker(const QueueTask &task) {
    TaskContext ctx(this, task.id);
    owlxfer::TransferError err;
    bool ok = false;
    if (!client()) {
        err.kind = owlxfer::ErrorKind::NotConfigured;
        err.message = "Object store client not configured";
    } else {
        ok = runTask(task, ctx, err);
    }
    finishTask(task.id, ok, ctx.skipped(), err);
    gate_.release();
    QMetaObject::invokeMethod(this, "pollTick", Qt::QueuedConnection);
}

void QueueManager::finishTask(quint64 id, bool ok, bool skipped,
                              const owlxfer::TransferError &err) {
    TaskStatus status = TaskStatus::Completed;
    double progress = 0.0;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        const int i = indexForId(id);
        if (i < 0)
            return; // cleared while running
        auto &t = tasks_[i];
        const qint64 nowMs = QDateTime::currentMSecsSinceEpoch();
        if (t.status != TaskStatus::Processing) {
            // Cancelled while running; the executor already cleaned up.
            if (t.finishedAtMs == 0)
                t.finishedAtMs = nowMs;
        } else if (skipped) {
            t.status = TaskStatus::Cancelled;
            t.finishedAtMs = nowMs;
        } else if (ok) {
            t.status = TaskStatus::Completed;
            t.progress = 1.0;
            if (t.size > 0)
                t.bytesTransferred = t.size;
            t.finishedAtMs = nowMs;
        } else {
            t.status = TaskStatus::Failed;
            t.error = QString::fromStdString(err.message);
            t.errorKind = err.kind;
            t.retryable = err.retryable();
            t.finishedAtMs = nowMs;
        }
        status = t.status;
        progress = t.progress;
    }
    if (status == TaskStatus::Failed) {
        qCWarning(owlQueue) << name_ << "task failed" << "taskId=" << id
                            << "kind=" << owlxfer::errorKindName(err.kind)
                            << "retryable=" << err.retryable()
                            << "error=" << QString::fromStdString(err.message);
    } else {
        qCInfo(owlQueue) << name_ << "task finished" << "taskId=" << id
                         << "status=" << taskStatusName(status);
    }
    emit taskUpdated(id, status, progress);
    emit tasksChanged();
}

void QueueManager::applyProgress(quint64 id, quint64 bytes, double fraction) {
    double progress = 0.0;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        const int i = indexForId(id);
        if (i < 0 || tasks_[i].status != TaskStatus::Processing)
            return;
        auto &t = tasks_[i];
        if (t.size > 0)
            bytes = std::min<quint64>(bytes, t.size);
        t.bytesTransferred = std::max(t.bytesTransferred, bytes);
        t.progress = std::max(t.progress, std::clamp(fraction, 0.0, 1.0));
        progress = t.progress;
    }
    emit taskUpdated(id, TaskStatus::Processing, progress);
}

bool QueueManager::isTaskCancelled(quint64 id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    if (shuttingDown_)
        return true;
    const int i = indexForId(id);
    return i < 0 || tasks_[i].status != TaskStatus::Processing;
}

void QueueManager::applyDestination(quint64 id, const QString &destination) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        const int i = indexForId(id);
        if (i < 0)
            return;
        tasks_[i].destination = destination;
    }
    emit tasksChanged();
}

void QueueManager::applySize(quint64 id, quint64 size) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        const int i = indexForId(id);
        if (i < 0 || tasks_[i].size != 0)
            return;
        tasks_[i].size = size;
        tasks_[i].bytesTransferred =
            std::min<quint64>(tasks_[i].bytesTransferred, size);
    }
    emit statsChanged();
}

void QueueManager::applyMoveResult(quint64 id, int moved,
                                   const QStringList &failedKeys) {
    std::lock_guard<std::mutex> lk(mtx_);
    const int i = indexForId(id);
    if (i < 0)
        return;
    tasks_[i].movedObjects = moved;
    tasks_[i].failedObjects = static_cast<int>(failedKeys.size());
    tasks_[i].failedKeys = failedKeys;
}
