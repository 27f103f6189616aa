// ObjectStoreClient over HTTP(S) for S3-compatible endpoints (R2, MinIO,
// AWS). Requests are signed with SigV4 and executed synchronously on the
// calling thread.
#pragma once
#include "ObjectStoreClient.hpp"

#include <QByteArray>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace owlxfer {

class S3ObjectStoreClient : public ObjectStoreClient {
public:
    explicit S3ObjectStoreClient(const StoreOptions &opt);

    const StoreOptions &options() const { return opt_; }

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

    // Encoded request path for an object (path-style: /bucket/key).
    std::string objectPath(const std::string &bucket,
                           const std::string &key) const;

private:
    using Query = std::vector<std::pair<std::string, std::string>>;
    using Headers = std::map<std::string, std::string>;

    struct Response {
        int status = 0;
        QByteArray body;
        std::map<std::string, std::string> headers; // lowercase names
    };

    // Signs and sends one request. Returns false on transport failures and
    // on HTTP status >= 300 (with the S3 error parsed into `err`).
    bool send(const char *method, const std::string &bucket,
              const std::string &key, const Query &query,
              const Headers &extraHeaders, const QByteArray &body,
              Response &resp, StoreError &err) const;

    std::string hostFor(const std::string &bucket) const;

    StoreOptions opt_;
    std::string scheme_;
    std::string host_; // host[:port] of the endpoint
};

} // namespace owlxfer
