// Downloads one object with a single GET or with parallel ranged GETs
// written in place into a pre-sized file.
#pragma once
#include "ChunkPlanner.hpp"
#include "ErrorClassifier.hpp"
#include "TransferCallbacks.hpp"

#include <string>

namespace owlxfer {

class ObjectStoreClient;

struct DownloadRequest {
    std::string bucket;
    std::string key;
    std::string localPath;
    std::uint64_t size = 0; // 0 = unknown, resolved with headObject
};

class DownloadExecutor {
public:
    // `client` is not owned and must outlive the executor.
    DownloadExecutor(ObjectStoreClient *client, const TransferLimits &limits);

    // On failure or cancellation the destination file is removed before
    // returning false. The parent directory must already exist.
    bool run(const DownloadRequest &req, TransferError &err,
             ProgressFn progress = {}, CancelFn shouldCancel = {},
             SizeFn sizeResolved = {});

private:
    bool runSingle(const DownloadRequest &req, TransferError &err,
                   const ProgressFn &progress, const CancelFn &shouldCancel);
    bool runChunked(const DownloadRequest &req, const ChunkPlan &plan,
                    TransferError &err, const ProgressFn &progress,
                    const CancelFn &shouldCancel);

    ObjectStoreClient *client_ = nullptr;
    TransferLimits limits_;
};

} // namespace owlxfer
