// Download executor. The chunked path pre-sizes the destination and writes
// each ranged GET at its own offset.
#include "owlxfer/DownloadExecutor.hpp"
#include "owlxfer/ConcurrencyGate.hpp"
#include "owlxfer/Logging.hpp"
#include "owlxfer/ObjectStoreClient.hpp"

#include <QString>
#include <QThreadPool>
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstdio>
#include <mutex>
#include <unistd.h>
#include <vector>

namespace owlxfer {

static QString q(const std::string &s) { return QString::fromStdString(s); }

// Writes `data` at `offset` through a private FILE* opened in update mode.
static bool writeAt(const std::string &path, std::uint64_t offset,
                    const std::vector<char> &data, TransferError &err) {
    FILE *f = std::fopen(path.c_str(), "r+b");
    if (!f) {
        err = classifyFileError(errno, path);
        return false;
    }
    if (::fseeko(f, static_cast<off_t>(offset), SEEK_SET) != 0) {
        err = classifyFileError(errno, path);
        std::fclose(f);
        return false;
    }
    const std::size_t n =
        data.empty() ? 0 : std::fwrite(data.data(), 1, data.size(), f);
    const int writeErrno = errno;
    if (n != data.size()) {
        err = classifyFileError(writeErrno, path);
        std::fclose(f);
        return false;
    }
    if (std::fclose(f) != 0) {
        err = classifyFileError(errno, path);
        return false;
    }
    return true;
}

// Creates (or truncates) `path` and extends it to `size` bytes.
static bool createSized(const std::string &path, std::uint64_t size,
                        TransferError &err) {
    FILE *f = std::fopen(path.c_str(), "wb");
    if (!f) {
        err = classifyFileError(errno, path);
        return false;
    }
    if (::ftruncate(::fileno(f), static_cast<off_t>(size)) != 0) {
        err = classifyFileError(errno, path);
        std::fclose(f);
        return false;
    }
    if (std::fclose(f) != 0) {
        err = classifyFileError(errno, path);
        return false;
    }
    return true;
}

DownloadExecutor::DownloadExecutor(ObjectStoreClient *client,
                                   const TransferLimits &limits)
    : client_(client), limits_(limits) {}

bool DownloadExecutor::run(const DownloadRequest &req, TransferError &err,
                           ProgressFn progress, CancelFn shouldCancel,
                           SizeFn sizeResolved) {
    if (!client_) {
        err.kind = ErrorKind::NotConfigured;
        err.message = "Object store client not configured";
        return false;
    }
    DownloadRequest resolved = req;
    if (resolved.size == 0) {
        ObjectInfo info;
        StoreError serr;
        if (!client_->headObject(req.bucket, req.key, info, serr)) {
            if (serr.empty()) {
                err.kind = ErrorKind::FileNotFound;
                err.message = req.key + ": object does not exist";
            } else {
                err = classify(serr);
            }
            return false;
        }
        resolved.size = info.size;
        if (sizeResolved)
            sizeResolved(resolved.size);
    }

    const ChunkPlan plan = planDownload(resolved.size, limits_);
    if (!plan.chunked())
        return runSingle(resolved, err, progress, shouldCancel);
    return runChunked(resolved, plan, err, progress, shouldCancel);
}

bool DownloadExecutor::runSingle(const DownloadRequest &req,
                                 TransferError &err, const ProgressFn &progress,
                                 const CancelFn &shouldCancel) {
    std::vector<char> body;
    StoreError serr;
    if (!client_->getObject(req.bucket, req.key, std::nullopt, body, serr)) {
        err = classify(serr);
        return false;
    }
    if (shouldCancel && shouldCancel()) {
        err.kind = ErrorKind::Unknown;
        err.message = kCancelledMessage;
        return false;
    }
    if (!createSized(req.localPath, 0, err) ||
        !writeAt(req.localPath, 0, body, err)) {
        std::remove(req.localPath.c_str());
        return false;
    }
    if (progress)
        progress(body.size(), 1.0);
    return true;
}

bool DownloadExecutor::runChunked(const DownloadRequest &req,
                                  const ChunkPlan &plan, TransferError &err,
                                  const ProgressFn &progress,
                                  const CancelFn &shouldCancel) {
    std::atomic<bool> removed{false};
    auto removePartial = [&]() {
        if (removed.exchange(true))
            return;
        if (std::remove(req.localPath.c_str()) != 0 && errno != ENOENT) {
            qCWarning(owlEngine) << "could not remove partial download"
                                 << "path=" << q(req.localPath);
        }
    };

    if (!createSized(req.localPath, plan.totalSize, err)) {
        removePartial();
        return false;
    }
    qCInfo(owlEngine) << "chunked download started" << "key=" << q(req.key)
                      << "chunks=" << plan.partCount
                      << "chunkSize=" << plan.partSize;

    const int parallelism = std::max(1, limits_.partParallelism);
    ConcurrencyGate gate(parallelism);
    QThreadPool pool;
    pool.setMaxThreadCount(parallelism);

    std::atomic<bool> failed{false};
    std::mutex errMtx;
    TransferError firstErr;
    auto recordFailure = [&](const TransferError &e) {
        std::lock_guard<std::mutex> lk(errMtx);
        if (!failed.load()) {
            firstErr = e;
            failed = true;
        }
    };
    auto cancelled = [&]() { return shouldCancel && shouldCancel(); };

    std::atomic<std::uint64_t> received{0};
    const double total = static_cast<double>(plan.totalSize);

    for (int i = 0; i < plan.partCount; ++i) {
        if (failed.load() || cancelled())
            break;
        gate.acquire();
        if (failed.load() || cancelled()) {
            gate.release();
            break;
        }
        pool.start([&, i]() {
            const ByteRange range = plan.rangeFor(i);
            std::vector<char> body;
            StoreError serr;
            if (!client_->getObject(req.bucket, req.key, range, body, serr)) {
                recordFailure(classify(serr));
                gate.release();
                return;
            }
            if (body.size() != range.length()) {
                TransferError short_;
                short_.kind = ErrorKind::ServerError;
                short_.message = req.key + ": short read at offset " +
                                 std::to_string(range.first) + " (" +
                                 std::to_string(body.size()) + " of " +
                                 std::to_string(range.length()) + " bytes)";
                recordFailure(short_);
                gate.release();
                return;
            }
            if (failed.load() || cancelled()) {
                gate.release();
                return;
            }
            TransferError werr;
            if (!writeAt(req.localPath, range.first, body, werr)) {
                recordFailure(werr);
                gate.release();
                return;
            }
            const std::uint64_t done =
                received.fetch_add(range.length()) + range.length();
            if (progress)
                progress(done, std::min(double(done) / total, 1.0));
            gate.release();
        });
    }
    pool.waitForDone();

    if (failed.load() || cancelled()) {
        removePartial();
        if (failed.load()) {
            std::lock_guard<std::mutex> lk(errMtx);
            err = firstErr;
            qCWarning(owlEngine) << "chunked download failed"
                                 << "key=" << q(req.key)
                                 << "error=" << q(err.message);
        } else {
            err.kind = ErrorKind::Unknown;
            err.message = kCancelledMessage;
        }
        return false;
    }
    if (progress)
        progress(plan.totalSize, 1.0);
    return true;
}

} // namespace owlxfer
