// In-memory object store used by tests and `owlxfer --mock`. Thread-safe;
// supports latency and failure injection per operation, per part number,
// per range start and per key.
#pragma once
#include "ObjectStoreClient.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace owlxfer {

class MockObjectStoreClient : public ObjectStoreClient {
public:
    enum class Op {
        Put,
        Get,
        Head,
        CreateMultipart,
        UploadPart,
        Complete,
        Abort,
        Copy,
        Delete,
        DeleteBatch,
        List
    };

    MockObjectStoreClient() = default;

    // Store setup/inspection
    void addBucket(const std::string &bucket);
    void seedObject(const std::string &bucket, const std::string &key,
                    const std::vector<char> &data,
                    const std::string &contentType = "application/octet-stream");
    bool hasObject(const std::string &bucket, const std::string &key) const;
    std::vector<char> objectData(const std::string &bucket,
                                 const std::string &key) const;
    std::string objectContentType(const std::string &bucket,
                                  const std::string &key) const;
    std::vector<std::string> keys(const std::string &bucket) const;

    // Failure injection. `times` < 0 means every call.
    void failOp(Op op, const StoreError &err, int times = 1);
    void failPart(int partNumber, const StoreError &err);
    void failRangeStart(std::uint64_t first, const StoreError &err);
    void failKey(Op op, const std::string &key, const StoreError &err);
    // Ranged reads starting at `first` return `bytes` fewer bytes.
    void shortenRange(std::uint64_t first, std::uint64_t bytes);
    void clearFailures();

    void setLatencyMs(int ms) { latencyMs_.store(ms); }
    void setListPageSize(int n) { listPageSize_.store(n < 1 ? 1 : n); }

    // Call accounting
    int callCount(Op op) const;
    int maxInFlightParts() const { return maxInFlightParts_.load(); }
    int maxInFlightGets() const { return maxInFlightGets_.load(); }
    int openMultipartSessions() const;
    std::vector<std::string> abortedUploadIds() const;
    std::vector<int> lastCompletedPartOrder() const;

    // ObjectStoreClient
    bool putObject(const std::string &bucket, const std::string &key,
                   const std::vector<char> &body, const std::string &contentType,
                   std::string &etag, StoreError &err) override;
    bool getObject(const std::string &bucket, const std::string &key,
                   const std::optional<ByteRange> &range, std::vector<char> &out,
                   StoreError &err) override;
    bool headObject(const std::string &bucket, const std::string &key,
                    ObjectInfo &info, StoreError &err) override;
    bool createMultipartUpload(const std::string &bucket, const std::string &key,
                               const std::string &contentType,
                               std::string &uploadId, StoreError &err) override;
    bool uploadPart(const std::string &bucket, const std::string &key,
                    const std::string &uploadId, int partNumber,
                    const std::vector<char> &body, std::string &etag,
                    StoreError &err) override;
    bool completeMultipartUpload(const std::string &bucket,
                                 const std::string &key,
                                 const std::string &uploadId,
                                 const std::vector<CompletedPart> &parts,
                                 StoreError &err) override;
    bool abortMultipartUpload(const std::string &bucket, const std::string &key,
                              const std::string &uploadId,
                              StoreError &err) override;
    bool copyObject(const std::string &bucket, const std::string &sourceKey,
                    const std::string &destKey, StoreError &err) override;
    bool deleteObject(const std::string &bucket, const std::string &key,
                      StoreError &err) override;
    bool deleteObjects(const std::string &bucket,
                       const std::vector<std::string> &keys,
                       std::vector<std::string> &failedKeys,
                       StoreError &err) override;
    bool listObjects(const std::string &bucket, const std::string &prefix,
                     const std::optional<std::string> &continuationToken,
                     ListPage &page, StoreError &err) override;

private:
    struct Object {
        std::vector<char> data;
        std::string contentType;
        std::string etag;
        std::uint64_t lastModified = 0;
    };
    struct Session {
        std::string bucket;
        std::string key;
        std::string contentType;
        std::map<int, std::vector<char>> parts;
        std::map<int, std::string> etags;
    };
    struct Injection {
        StoreError err;
        int remaining = 1;
    };

    // All helpers below expect mtx_ to be held.
    bool takeInjected(Op op, const std::string &key, StoreError &err);
    bool checkBucket(const std::string &bucket, StoreError &err) const;
    void simulateLatency() const;

    mutable std::mutex mtx_;
    std::map<std::string, std::map<std::string, Object>> buckets_;
    std::map<std::string, Session> sessions_;
    std::vector<std::string> aborted_;
    std::vector<int> lastCompletedOrder_;
    std::uint64_t nextUploadId_ = 1;

    std::map<Op, Injection> opFailures_;
    std::map<int, StoreError> partFailures_;
    std::map<std::uint64_t, StoreError> rangeFailures_;
    std::map<std::uint64_t, std::uint64_t> shortRanges_;
    std::map<std::pair<Op, std::string>, StoreError> keyFailures_;
    std::map<Op, int> calls_;

    std::atomic<int> latencyMs_{0};
    std::atomic<int> listPageSize_{1000};
    std::atomic<int> inFlightParts_{0};
    std::atomic<int> maxInFlightParts_{0};
    std::atomic<int> inFlightGets_{0};
    std::atomic<int> maxInFlightGets_{0};
};

} // namespace owlxfer
