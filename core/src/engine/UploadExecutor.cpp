// Upload executor: single PUT for small files, multipart session with
// gate-bounded parallel parts for large ones.
#include "owlxfer/UploadExecutor.hpp"
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
#include <sys/stat.h>
#include <vector>

namespace owlxfer {

static QString q(const std::string &s) { return QString::fromStdString(s); }

bool localFileSize(const std::string &path, std::uint64_t &size,
                   TransferError &err) {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        err = classifyFileError(errno, path);
        return false;
    }
    if (!S_ISREG(st.st_mode)) {
        err.kind = ErrorKind::InvalidName;
        err.message = path + ": not a regular file";
        return false;
    }
    size = static_cast<std::uint64_t>(st.st_size);
    return true;
}

// Reads `length` bytes at `offset` through a private FILE*.
static bool readRange(const std::string &path, std::uint64_t offset,
                      std::uint64_t length, std::vector<char> &out,
                      TransferError &err) {
    FILE *f = std::fopen(path.c_str(), "rb");
    if (!f) {
        err = classifyFileError(errno, path);
        return false;
    }
    if (::fseeko(f, static_cast<off_t>(offset), SEEK_SET) != 0) {
        err = classifyFileError(errno, path);
        std::fclose(f);
        return false;
    }
    out.resize(static_cast<std::size_t>(length));
    const std::size_t n =
        length > 0 ? std::fread(out.data(), 1, out.size(), f) : 0;
    const bool readError = std::ferror(f) != 0;
    const int readErrno = errno;
    std::fclose(f);
    if (readError) {
        err = classifyFileError(readErrno, path);
        return false;
    }
    if (n != out.size()) {
        // File shrank underneath us.
        err.kind = ErrorKind::FileNotFound;
        err.message = path + ": unexpected end of file";
        return false;
    }
    return true;
}

UploadExecutor::UploadExecutor(ObjectStoreClient *client,
                               const TransferLimits &limits)
    : client_(client), limits_(limits) {}

bool UploadExecutor::run(const UploadRequest &req, TransferError &err,
                         ProgressFn progress, CancelFn shouldCancel) {
    if (!client_) {
        err.kind = ErrorKind::NotConfigured;
        err.message = "Object store client not configured";
        return false;
    }
    std::uint64_t size = 0;
    if (!localFileSize(req.localPath, size, err))
        return false;
    if (size > limits_.maxFileSize) {
        err.kind = ErrorKind::SizeExceeded;
        err.message = req.localPath + ": file is " + std::to_string(size) +
                      " bytes, limit is " + std::to_string(limits_.maxFileSize);
        return false;
    }

    const ChunkPlan plan = planUpload(size, limits_);
    if (!plan.chunked())
        return runSingle(req, size, err, progress, shouldCancel);
    return runMultipart(req, plan, err, progress, shouldCancel);
}

bool UploadExecutor::runSingle(const UploadRequest &req, std::uint64_t size,
                               TransferError &err, const ProgressFn &progress,
                               const CancelFn &shouldCancel) {
    std::vector<char> body;
    if (!readRange(req.localPath, 0, size, body, err))
        return false;
    if (shouldCancel && shouldCancel()) {
        err.kind = ErrorKind::Unknown;
        err.message = kCancelledMessage;
        return false;
    }
    std::string etag;
    StoreError serr;
    if (!client_->putObject(req.bucket, req.key, body, req.contentType, etag,
                            serr)) {
        err = classify(serr);
        return false;
    }
    if (progress)
        progress(size, 1.0);
    return true;
}

bool UploadExecutor::runMultipart(const UploadRequest &req,
                                  const ChunkPlan &plan, TransferError &err,
                                  const ProgressFn &progress,
                                  const CancelFn &shouldCancel) {
    std::string uploadId;
    StoreError serr;
    if (!client_->createMultipartUpload(req.bucket, req.key, req.contentType,
                                        uploadId, serr)) {
        err = classify(serr);
        return false;
    }
    qCInfo(owlEngine) << "multipart upload started"
                      << "key=" << q(req.key) << "uploadId=" << q(uploadId)
                      << "parts=" << plan.partCount
                      << "partSize=" << plan.partSize;

    std::atomic<bool> abortIssued{false};
    auto abortSession = [&]() {
        if (abortIssued.exchange(true))
            return;
        StoreError aerr;
        if (!client_->abortMultipartUpload(req.bucket, req.key, uploadId,
                                           aerr)) {
            qCWarning(owlEngine)
                << "abort multipart failed; session may be orphaned"
                << "key=" << q(req.key) << "uploadId=" << q(uploadId)
                << "error=" << q(classify(aerr).message);
        }
    };

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

    std::mutex partsMtx;
    std::vector<CompletedPart> parts;
    parts.reserve(static_cast<std::size_t>(plan.partCount));
    std::atomic<std::uint64_t> sent{0};
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
            const int partNumber = i + 1;
            std::vector<char> body;
            TransferError perr;
            if (!readRange(req.localPath, range.first, range.length(), body,
                           perr)) {
                recordFailure(perr);
                gate.release();
                return;
            }
            if (failed.load() || cancelled()) {
                gate.release();
                return;
            }
            std::string etag;
            StoreError pserr;
            if (!client_->uploadPart(req.bucket, req.key, uploadId, partNumber,
                                     body, etag, pserr)) {
                TransferError classified = classify(pserr);
                qCWarning(owlEngine)
                    << "part upload failed" << "key=" << q(req.key)
                    << "part=" << partNumber
                    << "error=" << q(classified.message);
                recordFailure(classified);
                gate.release();
                return;
            }
            {
                std::lock_guard<std::mutex> lk(partsMtx);
                parts.push_back(CompletedPart{partNumber, etag});
            }
            const std::uint64_t done = sent.fetch_add(range.length()) +
                                       range.length();
            if (progress)
                progress(done, std::min(double(done) / total, 0.95));
            gate.release();
        });
    }
    pool.waitForDone();

    if (failed.load() || cancelled()) {
        abortSession();
        if (failed.load()) {
            std::lock_guard<std::mutex> lk(errMtx);
            err = firstErr;
        } else {
            err.kind = ErrorKind::Unknown;
            err.message = kCancelledMessage;
            qCInfo(owlEngine) << "multipart upload cancelled"
                              << "key=" << q(req.key)
                              << "uploadId=" << q(uploadId);
        }
        return false;
    }

    std::sort(parts.begin(), parts.end(),
              [](const CompletedPart &a, const CompletedPart &b) {
                  return a.partNumber < b.partNumber;
              });
    serr.clear();
    if (!client_->completeMultipartUpload(req.bucket, req.key, uploadId, parts,
                                          serr)) {
        err = classify(serr);
        abortSession();
        return false;
    }
    if (progress)
        progress(plan.totalSize, 1.0);
    qCInfo(owlEngine) << "multipart upload completed" << "key=" << q(req.key)
                      << "parts=" << static_cast<int>(parts.size());
    return true;
}

} // namespace owlxfer
