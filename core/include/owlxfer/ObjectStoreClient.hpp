// Abstract interface for S3-compatible object store operations. Concrete
// backends (Qt Network S3, in-memory mock) implement this API so the
// transfer engine stays decoupled from the wire protocol.
//
// All methods may be called concurrently from several threads.
#pragma once
#include "ErrorClassifier.hpp"
#include "StoreTypes.hpp"

#include <optional>
#include <string>
#include <vector>

namespace owlxfer {

class ObjectStoreClient {
public:
    virtual ~ObjectStoreClient() = default;

    virtual bool putObject(const std::string &bucket, const std::string &key,
                           const std::vector<char> &body,
                           const std::string &contentType, std::string &etag,
                           StoreError &err) = 0;

    // Reads the whole object, or only `range` when given.
    virtual bool getObject(const std::string &bucket, const std::string &key,
                           const std::optional<ByteRange> &range,
                           std::vector<char> &out, StoreError &err) = 0;

    // Returns true if the object exists. Returns false with an empty `err`
    // when it does not.
    virtual bool headObject(const std::string &bucket, const std::string &key,
                            ObjectInfo &info, StoreError &err) = 0;

    // Multipart sessions
    virtual bool createMultipartUpload(const std::string &bucket,
                                       const std::string &key,
                                       const std::string &contentType,
                                       std::string &uploadId,
                                       StoreError &err) = 0;

    virtual bool uploadPart(const std::string &bucket, const std::string &key,
                            const std::string &uploadId, int partNumber,
                            const std::vector<char> &body, std::string &etag,
                            StoreError &err) = 0;

    // `parts` must be sorted by part number.
    virtual bool completeMultipartUpload(const std::string &bucket,
                                         const std::string &key,
                                         const std::string &uploadId,
                                         const std::vector<CompletedPart> &parts,
                                         StoreError &err) = 0;

    virtual bool abortMultipartUpload(const std::string &bucket,
                                      const std::string &key,
                                      const std::string &uploadId,
                                      StoreError &err) = 0;

    // Server-side copy within one bucket.
    virtual bool copyObject(const std::string &bucket,
                            const std::string &sourceKey,
                            const std::string &destKey, StoreError &err) = 0;

    virtual bool deleteObject(const std::string &bucket, const std::string &key,
                              StoreError &err) = 0;

    // Batch delete. Keys the store refused are appended to `failedKeys`; the
    // call itself only fails when the request could not be made.
    virtual bool deleteObjects(const std::string &bucket,
                               const std::vector<std::string> &keys,
                               std::vector<std::string> &failedKeys,
                               StoreError &err) = 0;

    // Flat listing of every key under `prefix`, one page per call.
    virtual bool listObjects(const std::string &bucket, const std::string &prefix,
                             const std::optional<std::string> &continuationToken,
                             ListPage &page, StoreError &err) = 0;
};

} // namespace owlxfer
