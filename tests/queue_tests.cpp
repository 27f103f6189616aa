// Queue manager tests without external framework (run via CTest). Drives the
// managers' event loop by hand and runs executors against the in-memory store.
#include "DownloadQueueManager.hpp"
#include "MoveQueueManager.hpp"
#include "QueueFormat.hpp"
#include "TransferSettings.hpp"
#include "UploadQueueManager.hpp"
#include "owlxfer/MockObjectStoreClient.hpp"

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSettings>
#include <QTemporaryDir>
#include <QThread>
#include <algorithm>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <string>

using owlxfer::ErrorKind;
using Op = owlxfer::MockObjectStoreClient::Op;

namespace {

constexpr const char *kBucket = "test-bucket";

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }

    void checkContains(const QString &haystack, const QString &needle,
                       const std::string &msg) {
        check(haystack.contains(needle), msg);
    }
};

// Pumps the event loop until pred() holds or the timeout expires.
bool waitUntil(const std::function<bool()> &pred, int timeoutMs = 10000) {
    for (int waited = 0; waited < timeoutMs; waited += 5) {
        QCoreApplication::processEvents();
        if (pred())
            return true;
        QThread::msleep(5);
    }
    QCoreApplication::processEvents();
    return pred();
}

bool drained(const QueueManager &q) { return !q.stats().hasActive(); }

owlxfer::StoreError httpError(int status, const std::string &code) {
    owlxfer::StoreError e;
    e.httpStatus = status;
    e.code = code;
    e.message = code;
    return e;
}

QString writeFile(const QDir &dir, const QString &rel, int size) {
    const QString path = dir.filePath(rel);
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile f(path);
    if (f.open(QIODevice::WriteOnly))
        f.write(QByteArray(size, 'x'));
    return path;
}

std::vector<char> bytes(int n) { return std::vector<char>(n, 'y'); }

// Small thresholds so multipart uploads and chunked downloads run on tiny
// files.
owlxfer::TransferLimits smallLimits() {
    owlxfer::TransferLimits l;
    l.uploadThreshold = 100 * 1024;
    l.partSizeOverride = 20 * 1024;
    l.downloadThreshold = 10 * 1024;
    l.downloadChunkSize = 4 * 1024;
    l.partParallelism = 2;
    return l;
}

void test_upload_queue_respects_concurrency(TestContext &t) {
    QTemporaryDir tmp;
    QDir dir(tmp.path());
    QStringList paths;
    for (int i = 0; i < 8; ++i)
        paths << writeFile(dir, QStringLiteral("f%1.txt").arg(i), 100 + i);

    owlxfer::MockObjectStoreClient store;
    store.addBucket(kBucket);
    store.setLatencyMs(40);
    UploadQueueManager q;
    q.setClient(&store, kBucket);
    q.setPollIntervalMs(10);
    q.setMaxConcurrentTasks(2);

    int completedSignal = -1;
    QObject::connect(&q, &QueueManager::queueCompleted,
                     [&](int n) { completedSignal = n; });

    t.check(q.addFiles(paths, QStringLiteral("inbox")) == 8,
            "all eight files should be queued");
    int peak = 0;
    const bool done = waitUntil([&]() {
        const QueueStats s = q.stats();
        peak = std::max(peak, s.processing);
        return !s.hasActive();
    });
    t.check(done, "upload queue should drain");
    t.check(peak <= 2, "at most two uploads may run at once");
    t.check(peak >= 1, "uploads should have run");
    const QueueStats s = q.stats();
    t.check(s.completed == 8, "all uploads should complete");
    t.check(s.transferredBytes == s.totalBytes,
            "transferred bytes should equal total once complete");
    t.check(store.hasObject(kBucket, "inbox/f3.txt"),
            "object key should be prefix/name");
    waitUntil([&]() { return completedSignal >= 0; }, 2000);
    t.check(completedSignal == 8, "queueCompleted should report 8");
    t.check(!q.isPolling(), "polling should stop once idle");
}

void test_upload_content_type_and_folder_keys(TestContext &t) {
    QTemporaryDir tmp;
    QDir dir(tmp.path());
    writeFile(dir, QStringLiteral("site/index.html"), 10);
    writeFile(dir, QStringLiteral("site/css/main.css"), 10);

    owlxfer::MockObjectStoreClient store;
    store.addBucket(kBucket);
    UploadQueueManager q;
    q.setClient(&store, kBucket);
    q.setPollIntervalMs(10);
    t.check(q.addFolder(dir.filePath(QStringLiteral("site")),
                        QStringLiteral("web")) == 2,
            "folder walk should find both files");
    t.check(waitUntil([&]() { return drained(q); }), "folder upload drains");
    t.check(store.hasObject(kBucket, "web/site/index.html") &&
                store.hasObject(kBucket, "web/site/css/main.css"),
            "keys should keep the folder name and relative paths");
    t.check(store.objectContentType(kBucket, "web/site/index.html") ==
                "text/html",
            "content type should come from the extension");

    t.check(UploadQueueManager::keyFor(QStringLiteral("/a/b/c.txt"),
                                       QString(), QString()) ==
                QStringLiteral("c.txt"),
            "empty prefix yields the file name");
    t.check(UploadQueueManager::keyFor(QStringLiteral("/a/b/c.txt"),
                                       QStringLiteral("up/"),
                                       QStringLiteral("/a/b")) ==
                QStringLiteral("up/b/c.txt"),
            "base folder keeps its own name");
}

void test_failed_task_retry(TestContext &t) {
    QTemporaryDir tmp;
    const QString path = writeFile(QDir(tmp.path()), QStringLiteral("r.txt"), 64);

    owlxfer::MockObjectStoreClient store;
    store.addBucket(kBucket);
    store.failOp(Op::Put, httpError(503, "SlowDown"), 1);
    UploadQueueManager q;
    q.setClient(&store, kBucket);
    q.setPollIntervalMs(10);
    q.addFiles({path}, QString());
    t.check(waitUntil([&]() { return drained(q); }), "first attempt finishes");

    QueueTask task = q.tasksSnapshot().value(0);
    t.check(task.status == TaskStatus::Failed, "first attempt should fail");
    t.check(task.errorKind == ErrorKind::ServerError && task.retryable,
            "503 should be a retryable server error");
    t.checkContains(task.error, QStringLiteral("SlowDown"),
                    "error text should carry the store code");

    q.retryTask(task.id);
    t.check(q.task(task.id)->status == TaskStatus::Pending,
            "retry moves the task back to pending");
    t.check(waitUntil([&]() { return drained(q); }), "retry finishes");
    task = *q.task(task.id);
    t.check(task.status == TaskStatus::Completed, "retry should succeed");
    t.check(task.attempts == 2, "attempts should count both runs");
    t.check(task.error.isEmpty(), "error is cleared by retry");
}

void test_cancel_and_clear(TestContext &t) {
    QTemporaryDir tmp;
    QDir dir(tmp.path());
    owlxfer::MockObjectStoreClient store;
    store.addBucket(kBucket);
    store.setLatencyMs(30);
    UploadQueueManager q;
    q.setClient(&store, kBucket);
    q.setPollIntervalMs(10);
    q.setMaxConcurrentTasks(1);

    QStringList paths;
    for (int i = 0; i < 4; ++i)
        paths << writeFile(dir, QStringLiteral("c%1.bin").arg(i), 32);
    q.addFiles(paths, QString());
    // Admission happens on the next event loop pass.
    const quint64 last = q.tasksSnapshot().back().id;
    q.cancelTask(last);
    t.check(q.task(last)->status == TaskStatus::Cancelled,
            "pending task cancels immediately");

    t.check(waitUntil([&]() { return drained(q); }), "remaining tasks drain");
    const QueueStats s = q.stats();
    t.check(s.completed == 3 && s.cancelled == 1,
            "three complete and one stays cancelled");
    t.check(!store.hasObject(kBucket, "c3.bin"),
            "cancelled task never reaches the store");

    q.retryTask(last);
    t.check(q.task(last)->status == TaskStatus::Cancelled,
            "cancelled tasks are not retryable");

    q.clearCompleted();
    t.check(q.stats().total == 1, "clearCompleted keeps the cancelled task");
    q.clearFailedCancelled();
    t.check(q.stats().total == 0, "clearFailedCancelled removes it");

    q.addFiles(paths, QString());
    q.clearAll();
    t.check(q.tasksSnapshot().isEmpty(), "clearAll removes everything");
    waitUntil([&]() { return !q.isPolling(); }, 2000);
}

void test_missing_client_fails_not_configured(TestContext &t) {
    QTemporaryDir tmp;
    const QString path = writeFile(QDir(tmp.path()), QStringLiteral("n.txt"), 8);
    UploadQueueManager q;
    q.setPollIntervalMs(10);
    q.addFiles({path}, QString());
    t.check(waitUntil([&]() { return drained(q); }), "task finishes");
    const QueueTask task = q.tasksSnapshot().value(0);
    t.check(task.status == TaskStatus::Failed &&
                task.errorKind == ErrorKind::NotConfigured && !task.retryable,
            "no client -> non-retryable NotConfigured");
}

void test_download_queue(TestContext &t) {
    QTemporaryDir tmp;
    owlxfer::MockObjectStoreClient store;
    store.addBucket(kBucket);
    store.seedObject(kBucket, "docs/a.txt", bytes(10));
    store.seedObject(kBucket, "docs/sub/b.txt", bytes(20));
    store.seedObject(kBucket, "docs/sub/", {});
    store.setLatencyMs(20);

    DownloadQueueManager q;
    q.setClient(&store, kBucket);
    q.setPollIntervalMs(10);

    const QVector<DownloadItem> items = {
        {QStringLiteral("docs/a.txt"), QString(), 10},
        {QStringLiteral("docs/sub/"), QString(), 0}};
    t.check(q.addDownloads(items, tmp.path()) == 1,
            "folder keys are not downloaded as files");
    t.check(q.addDownloads(items, tmp.path()) == 0,
            "active duplicates are skipped");
    t.check(waitUntil([&]() { return drained(q); }), "download drains");
    t.check(QFileInfo(QDir(tmp.path()).filePath(QStringLiteral("a.txt"))).size() ==
                10,
            "file lands at dest/name");

    int added = 0;
    owlxfer::TransferError err;
    t.check(q.addFolderDownload(QStringLiteral("docs/sub"), tmp.path(), added,
                                err),
            "folder download listing succeeds");
    t.check(added == 1, "only real objects are queued");
    t.check(waitUntil([&]() { return drained(q); }), "folder download drains");
    t.check(QFileInfo(QDir(tmp.path()).filePath(QStringLiteral("sub/b.txt")))
                    .size() == 20,
            "nested file keeps the folder name");

    q.addDownloads({{QStringLiteral("docs/sub/b.txt"), QStringLiteral("b2.txt"),
                     0}},
                   tmp.path());
    t.check(waitUntil([&]() { return drained(q); }),
            "unknown-size download drains");
    const QueueTask sized = q.tasksSnapshot().back();
    t.check(sized.status == TaskStatus::Completed && sized.size == 20,
            "size resolved by HEAD is stored on the task");
    t.check(sized.bytesTransferred == 20, "bytes match the resolved size");

    q.addDownloads({{QStringLiteral("docs/missing.txt"), QString(), 0}},
                   tmp.path());
    t.check(waitUntil([&]() { return drained(q); }), "missing object finishes");
    const QueueTask last = q.tasksSnapshot().back();
    t.check(last.status == TaskStatus::Failed &&
                last.errorKind == ErrorKind::FileNotFound,
            "missing object fails with FileNotFound");
}

void test_download_stays_inside_destination(TestContext &t) {
    QTemporaryDir tmp;
    const QDir root(tmp.path());
    const QString dest = root.filePath(QStringLiteral("dl/inner"));
    owlxfer::MockObjectStoreClient store;
    store.addBucket(kBucket);
    store.seedObject(kBucket, "docs/ok.txt", bytes(4));
    store.seedObject(kBucket, "docs/../../escape.txt", bytes(4));

    DownloadQueueManager q;
    q.setClient(&store, kBucket);
    q.setPollIntervalMs(10);
    int added = 0;
    owlxfer::TransferError err;
    t.check(q.addFolderDownload(QStringLiteral("docs/"), dest, added, err),
            "folder listing succeeds");
    t.check(added == 1, "key climbing out of the destination is skipped");
    t.check(q.addDownloads({{QStringLiteral("docs/ok.txt"),
                             QStringLiteral("../../x.txt"), 4}},
                           dest) == 0,
            "relative name climbing out of the destination is skipped");
    t.check(waitUntil([&]() { return drained(q); }), "download drains");
    t.check(QFileInfo::exists(QDir(dest).filePath(QStringLiteral("docs/ok.txt"))),
            "regular key lands under the destination");
    t.check(!QFileInfo::exists(root.filePath(QStringLiteral("dl/escape.txt"))) &&
                !QFileInfo::exists(root.filePath(QStringLiteral("x.txt"))),
            "nothing is written outside the destination");
}

void test_cancel_processing_upload(TestContext &t) {
    QTemporaryDir tmp;
    QDir dir(tmp.path());
    const QString big = writeFile(dir, QStringLiteral("big.bin"), 250 * 1024);
    const QString small = writeFile(dir, QStringLiteral("small.bin"), 64);

    owlxfer::MockObjectStoreClient store;
    store.addBucket(kBucket);
    store.setLatencyMs(30);
    UploadQueueManager q;
    q.setClient(&store, kBucket);
    q.setLimits(smallLimits());
    q.setPollIntervalMs(10);
    q.setMaxConcurrentTasks(1);
    q.addFiles({big, small}, QString());
    const quint64 bigId = q.tasksSnapshot().value(0).id;
    const quint64 smallId = q.tasksSnapshot().value(1).id;

    t.check(waitUntil([&]() { return store.callCount(Op::UploadPart) >= 1; }),
            "multipart upload starts");
    t.check(q.task(bigId)->status == TaskStatus::Processing,
            "large upload is processing");
    q.cancelTask(bigId);
    t.check(waitUntil([&]() { return drained(q); }), "queue drains");

    t.check(q.task(bigId)->status == TaskStatus::Cancelled,
            "cancelled upload stays cancelled after its worker returns");
    t.check(store.abortedUploadIds().size() == 1,
            "multipart session is aborted once");
    t.check(store.openMultipartSessions() == 0, "no session left open");
    t.check(!store.hasObject(kBucket, "big.bin"), "no object for the cancel");
    t.check(q.task(smallId)->status == TaskStatus::Completed,
            "next task is admitted after the cancel");
    t.check(store.hasObject(kBucket, "small.bin"), "next upload lands");
}

void test_cancel_processing_download(TestContext &t) {
    QTemporaryDir tmp;
    QDir dir(tmp.path());
    owlxfer::MockObjectStoreClient store;
    store.addBucket(kBucket);
    store.seedObject(kBucket, "big.bin", bytes(50 * 1024));
    store.seedObject(kBucket, "small.bin", bytes(16));
    store.setLatencyMs(20);

    DownloadQueueManager q;
    q.setClient(&store, kBucket);
    owlxfer::TransferLimits l = smallLimits();
    l.partParallelism = 1;
    q.setLimits(l);
    q.setPollIntervalMs(10);
    q.setMaxConcurrentTasks(1);
    q.addDownloads({{QStringLiteral("big.bin"), QString(), 50 * 1024},
                    {QStringLiteral("small.bin"), QString(), 16}},
                   tmp.path());
    const quint64 bigId = q.tasksSnapshot().value(0).id;
    const quint64 smallId = q.tasksSnapshot().value(1).id;

    t.check(waitUntil([&]() { return store.callCount(Op::Get) >= 2; }),
            "chunked download starts");
    q.cancelTask(bigId);
    t.check(waitUntil([&]() { return drained(q); }), "queue drains");

    t.check(q.task(bigId)->status == TaskStatus::Cancelled,
            "cancelled download stays cancelled");
    t.check(!QFileInfo::exists(dir.filePath(QStringLiteral("big.bin"))),
            "no partial file is left");
    t.check(q.task(smallId)->status == TaskStatus::Completed,
            "next download is admitted after the cancel");
    t.check(QFileInfo(dir.filePath(QStringLiteral("small.bin"))).size() == 16,
            "next download lands");
}

void test_move_queue_conflicts(TestContext &t) {
    owlxfer::MockObjectStoreClient store;
    store.addBucket(kBucket);
    MoveQueueManager q;
    q.setClient(&store, kBucket);
    q.setPollIntervalMs(10);

    // rename
    store.seedObject(kBucket, "a.txt", bytes(3));
    store.seedObject(kBucket, "dest/a.txt", bytes(4));
    t.check(q.addMoves({{QStringLiteral("a.txt"), false}},
                       QStringLiteral("dest")) == 1,
            "move is queued");
    t.check(waitUntil([&]() { return drained(q); }), "rename move drains");
    QueueTask task = q.tasksSnapshot().back();
    t.check(task.status == TaskStatus::Completed, "renamed move completes");
    t.check(task.destination == QStringLiteral("dest/a(1).txt"),
            "task destination shows the renamed key");
    t.check(store.hasObject(kBucket, "dest/a(1).txt") &&
                store.objectData(kBucket, "dest/a.txt").size() == 4,
            "existing destination is left untouched");

    // skip
    store.seedObject(kBucket, "b.txt", bytes(3));
    store.seedObject(kBucket, "dest/b.txt", bytes(4));
    q.setConflictPolicy(owlxfer::ConflictPolicy::Skip);
    q.addMoves({{QStringLiteral("b.txt"), false}}, QStringLiteral("dest/"));
    t.check(waitUntil([&]() { return drained(q); }), "skip move drains");
    task = q.tasksSnapshot().back();
    t.check(task.status == TaskStatus::Cancelled, "skipped move is cancelled");
    t.check(store.hasObject(kBucket, "b.txt"), "skipped source remains");

    // fail
    q.setConflictPolicy(owlxfer::ConflictPolicy::Fail);
    q.addMoves({{QStringLiteral("b.txt"), false}}, QStringLiteral("dest/"));
    t.check(waitUntil([&]() { return drained(q); }), "fail move drains");
    task = q.tasksSnapshot().back();
    t.check(task.status == TaskStatus::Failed &&
                task.errorKind == ErrorKind::InvalidName && !task.retryable,
            "collision under fail policy is a non-retryable InvalidName");

    t.check(q.addMoves({{QStringLiteral("dest/a.txt"), false}},
                       QStringLiteral("dest")) == 0,
            "item already in the destination is skipped");
}

void test_move_queue_folder_and_rename(TestContext &t) {
    owlxfer::MockObjectStoreClient store;
    store.addBucket(kBucket);
    store.seedObject(kBucket, "pics/", {});
    store.seedObject(kBucket, "pics/1.jpg", bytes(5));
    store.seedObject(kBucket, "pics/2.jpg", bytes(5));
    MoveQueueManager q;
    q.setClient(&store, kBucket);
    q.setPollIntervalMs(10);

    QString err;
    t.check(!q.addRename(QStringLiteral("pics/"), QStringLiteral("bad:name"),
                         true, err),
            "invalid characters are rejected");
    t.check(!err.isEmpty(), "rejection carries a message");
    t.check(!q.addRename(QStringLiteral("pics/"), QStringLiteral("pics"), true,
                         err),
            "unchanged name is rejected");
    t.check(q.addRename(QStringLiteral("pics/"), QStringLiteral("photos"), true,
                        err),
            "valid folder rename is queued");
    t.check(waitUntil([&]() { return drained(q); }), "folder rename drains");
    const QueueTask task = q.tasksSnapshot().back();
    t.check(task.status == TaskStatus::Completed, "folder rename completes");
    t.check(task.movedObjects == 3 && task.failedObjects == 0,
            "marker and two objects move");
    t.check(store.hasObject(kBucket, "photos/1.jpg") &&
                !store.hasObject(kBucket, "pics/1.jpg"),
            "objects live under the new prefix");
    t.check(task.failedKeys.isEmpty(), "no keys left behind");

    store.failKey(Op::Copy, "photos/2.jpg", httpError(403, "AccessDenied"));
    t.check(q.addMoves({{QStringLiteral("photos/"), true}},
                       QStringLiteral("archive")) == 1,
            "folder move is queued");
    t.check(waitUntil([&]() { return drained(q); }), "partial move drains");
    const QueueTask partial = q.tasksSnapshot().back();
    t.check(partial.status == TaskStatus::Failed &&
                partial.errorKind == ErrorKind::PermissionDenied,
            "partial folder move fails with the first error");
    t.check(partial.movedObjects == 2 && partial.failedObjects == 1,
            "two objects move and one stays");
    t.check(partial.failedKeys == QStringList{QStringLiteral("photos/2.jpg")},
            "the key left at the source is reported");
    t.check(store.hasObject(kBucket, "photos/2.jpg") &&
                store.hasObject(kBucket, "archive/photos/1.jpg"),
            "failed object stays, the rest moves");

    q.setRenamePattern(QStringLiteral("copy"));
    t.check(q.renamePattern() == QStringLiteral("({n})"),
            "pattern without {n} falls back to the default");
}

void test_settings_load_clamps(TestContext &t) {
    QTemporaryDir tmp;
    const QString ini = QDir(tmp.path()).filePath(QStringLiteral("owlxfer.ini"));
    {
        QSettings s(ini, QSettings::IniFormat);
        s.setValue("Transfers/maxConcurrentUploads", 50);
        s.setValue("Transfers/maxConcurrentDownloads", 0);
        s.setValue("Transfers/partConcurrency", 99);
        s.setValue("Transfers/uploadThresholdMiB", 8192);
        s.setValue("Transfers/maxFileSizeMiB", 1024);
        s.setValue("Move/conflictResolution", "SKIP");
        s.setValue("Move/renamePattern", "no-placeholder");
        s.setValue("Store/endpoint", "https://example.invalid");
        s.setValue("Store/bucket", "b1");
        s.sync();
    }
    const TransferSettings ts = TransferSettings::load(ini);
    t.check(ts.maxConcurrentUploads == 10, "upload concurrency clamps to 10");
    t.check(ts.maxConcurrentDownloads == 1, "download concurrency clamps to 1");
    t.check(ts.partConcurrency == 32, "part concurrency clamps to 32");
    t.check(ts.uploadThresholdMiB == 1024,
            "single-shot threshold never exceeds the file size limit");
    t.check(ts.limits().uploadThreshold <= ts.limits().maxFileSize,
            "limits keep the threshold below the size limit");
    t.check(ts.conflictPolicy() == owlxfer::ConflictPolicy::Skip,
            "policy is case-insensitive");
    t.check(ts.renamePattern == QStringLiteral("({n})"),
            "pattern without {n} falls back");
    t.check(ts.bucket == QStringLiteral("b1"), "store keys are read");
    t.check(ts.limits().partParallelism == 32, "limits carry part concurrency");

    UploadQueueManager up;
    DownloadQueueManager down;
    MoveQueueManager mv;
    ts.applyTo(up, down, mv);
    t.check(up.maxConcurrentTasks() == 10 && down.maxConcurrentTasks() == 1,
            "applyTo sets queue concurrency");
    t.check(mv.conflictPolicy() == owlxfer::ConflictPolicy::Skip,
            "applyTo sets the move policy");
}

void test_format_helpers(TestContext &t) {
    t.check(owlqueue::formatBytes(512) == QStringLiteral("512 B"),
            "bytes below 1 KiB");
    t.checkContains(owlqueue::formatBytes(3 * 1024 * 1024), QStringLiteral("MB"),
                    "megabytes use MB");
    t.checkContains(owlqueue::formatSpeed(2048.0), QStringLiteral("/s"),
                    "speed carries a rate suffix");
    t.check(owlqueue::formatEta(-1) == QStringLiteral("-"),
            "unknown eta renders as -");
    t.check(owlqueue::formatEta(125) == QStringLiteral("2m 05s"),
            "minutes and zero-padded seconds");
}

} // namespace

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    TestContext t;
    test_upload_queue_respects_concurrency(t);
    test_upload_content_type_and_folder_keys(t);
    test_failed_task_retry(t);
    test_cancel_and_clear(t);
    test_missing_client_fails_not_configured(t);
    test_download_queue(t);
    test_download_stays_inside_destination(t);
    test_cancel_processing_upload(t);
    test_cancel_processing_download(t);
    test_move_queue_conflicts(t);
    test_move_queue_folder_and_rename(t);
    test_settings_load_clamps(t);
    test_format_helpers(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] owlxfer_queue_tests\n";
    return EXIT_SUCCESS;
}
