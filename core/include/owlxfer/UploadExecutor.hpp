// Uploads one local file as a single PUT or as a parallel multipart session.
#pragma once
#include "ChunkPlanner.hpp"
#include "ErrorClassifier.hpp"
#include "TransferCallbacks.hpp"

#include <string>

namespace owlxfer {

class ObjectStoreClient;

struct UploadRequest {
    std::string localPath;
    std::string bucket;
    std::string key;
    std::string contentType = "application/octet-stream";
};

class UploadExecutor {
public:
    // `client` is not owned and must outlive the executor.
    UploadExecutor(ObjectStoreClient *client, const TransferLimits &limits);

    // Returns false with `err` set on failure. On cancellation returns false
    // with kCancelledMessage; any multipart session is aborted before return.
    bool run(const UploadRequest &req, TransferError &err,
             ProgressFn progress = {}, CancelFn shouldCancel = {});

private:
    bool runSingle(const UploadRequest &req, std::uint64_t size,
                   TransferError &err, const ProgressFn &progress,
                   const CancelFn &shouldCancel);
    bool runMultipart(const UploadRequest &req, const ChunkPlan &plan,
                      TransferError &err, const ProgressFn &progress,
                      const CancelFn &shouldCancel);

    ObjectStoreClient *client_ = nullptr;
    TransferLimits limits_;
};

// Size of a local regular file. Returns false with a classified error when
// it cannot be read.
bool localFileSize(const std::string &path, std::uint64_t &size,
                   TransferError &err);

} // namespace owlxfer
