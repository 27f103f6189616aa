// Move/rename queue: server-side copy + delete with a collision policy.
#pragma once
#include "QueueManager.hpp"
#include "owlxfer/MoveExecutor.hpp"

#include <QVector>

struct MoveItem {
    QString key; // folder keys end in '/'
    bool isDirectory = false;
};

class MoveQueueManager : public QueueManager {
    Q_OBJECT
public:
    static constexpr int kDefaultConcurrency = 3;

    explicit MoveQueueManager(QObject *parent = nullptr);
    ~MoveQueueManager() override;

    void setConflictPolicy(owlxfer::ConflictPolicy policy);
    owlxfer::ConflictPolicy conflictPolicy() const;
    // Suffix containing "{n}", e.g. "({n})", "_{n}", "-{n}", "[{n}]".
    void setRenamePattern(const QString &pattern);
    QString renamePattern() const;

    // Items already directly under the destination and items with an active
    // task are skipped. Returns the number of tasks added.
    int addMoves(const QVector<MoveItem> &items,
                 const QString &destinationPrefix);
    // Renames `key` in place. Fails for names with / \ : * ? " < > |.
    bool addRename(const QString &key, const QString &newName, bool isDirectory,
                   QString &err);

protected:
    bool runTask(const QueueTask &task, TaskContext &ctx,
                 owlxfer::TransferError &err) override;

private:
    mutable std::mutex settingsMtx_;
    owlxfer::ConflictPolicy policy_ = owlxfer::ConflictPolicy::Rename;
    QString pattern_ = QStringLiteral("({n})");
};
