#include "owlxfer/MockObjectStoreClient.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <functional>
#include <thread>

namespace owlxfer {

namespace {

// Tracks calls in flight and keeps the high-water mark.
struct InFlightGuard {
    std::atomic<int> &current;
    InFlightGuard(std::atomic<int> &cur, std::atomic<int> &peak)
        : current(cur) {
        const int now = ++current;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {
        }
    }
    ~InFlightGuard() { --current; }
};

std::string etagFor(const std::vector<char> &data) {
    const std::size_t h =
        std::hash<std::string>{}(std::string(data.begin(), data.end()));
    return "\"" + std::to_string(h) + "\"";
}

StoreError notFound(const std::string &code, const std::string &what) {
    StoreError e;
    e.httpStatus = 404;
    e.code = code;
    e.message = what;
    return e;
}

} // namespace

void MockObjectStoreClient::addBucket(const std::string &bucket) {
    std::lock_guard<std::mutex> lk(mtx_);
    buckets_[bucket];
}

void MockObjectStoreClient::seedObject(const std::string &bucket,
                                       const std::string &key,
                                       const std::vector<char> &data,
                                       const std::string &contentType) {
    std::lock_guard<std::mutex> lk(mtx_);
    Object o;
    o.data = data;
    o.contentType = contentType;
    o.etag = etagFor(data);
    o.lastModified = static_cast<std::uint64_t>(std::time(nullptr));
    buckets_[bucket][key] = std::move(o);
}

bool MockObjectStoreClient::hasObject(const std::string &bucket,
                                      const std::string &key) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto b = buckets_.find(bucket);
    return b != buckets_.end() && b->second.count(key) > 0;
}

std::vector<char> MockObjectStoreClient::objectData(
    const std::string &bucket, const std::string &key) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto b = buckets_.find(bucket);
    if (b == buckets_.end())
        return {};
    auto o = b->second.find(key);
    return o == b->second.end() ? std::vector<char>{} : o->second.data;
}

std::string MockObjectStoreClient::objectContentType(
    const std::string &bucket, const std::string &key) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto b = buckets_.find(bucket);
    if (b == buckets_.end())
        return {};
    auto o = b->second.find(key);
    return o == b->second.end() ? std::string{} : o->second.contentType;
}

std::vector<std::string>
MockObjectStoreClient::keys(const std::string &bucket) const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<std::string> out;
    auto b = buckets_.find(bucket);
    if (b == buckets_.end())
        return out;
    for (const auto &kv : b->second)
        out.push_back(kv.first);
    return out;
}

void MockObjectStoreClient::failOp(Op op, const StoreError &err, int times) {
    std::lock_guard<std::mutex> lk(mtx_);
    opFailures_[op] = Injection{err, times};
}

void MockObjectStoreClient::failPart(int partNumber, const StoreError &err) {
    std::lock_guard<std::mutex> lk(mtx_);
    partFailures_[partNumber] = err;
}

void MockObjectStoreClient::failRangeStart(std::uint64_t first,
                                           const StoreError &err) {
    std::lock_guard<std::mutex> lk(mtx_);
    rangeFailures_[first] = err;
}

void MockObjectStoreClient::failKey(Op op, const std::string &key,
                                    const StoreError &err) {
    std::lock_guard<std::mutex> lk(mtx_);
    keyFailures_[{op, key}] = err;
}

void MockObjectStoreClient::shortenRange(std::uint64_t first,
                                         std::uint64_t bytes) {
    std::lock_guard<std::mutex> lk(mtx_);
    shortRanges_[first] = bytes;
}

void MockObjectStoreClient::clearFailures() {
    std::lock_guard<std::mutex> lk(mtx_);
    opFailures_.clear();
    partFailures_.clear();
    rangeFailures_.clear();
    shortRanges_.clear();
    keyFailures_.clear();
}

int MockObjectStoreClient::callCount(Op op) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = calls_.find(op);
    return it == calls_.end() ? 0 : it->second;
}

int MockObjectStoreClient::openMultipartSessions() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return static_cast<int>(sessions_.size());
}

std::vector<std::string> MockObjectStoreClient::abortedUploadIds() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return aborted_;
}

std::vector<int> MockObjectStoreClient::lastCompletedPartOrder() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return lastCompletedOrder_;
}

bool MockObjectStoreClient::takeInjected(Op op, const std::string &key,
                                         StoreError &err) {
    ++calls_[op];
    auto k = keyFailures_.find({op, key});
    if (k != keyFailures_.end()) {
        err = k->second;
        return true;
    }
    auto it = opFailures_.find(op);
    if (it == opFailures_.end())
        return false;
    err = it->second.err;
    if (it->second.remaining > 0 && --it->second.remaining == 0)
        opFailures_.erase(it);
    return true;
}

bool MockObjectStoreClient::checkBucket(const std::string &bucket,
                                        StoreError &err) const {
    if (buckets_.count(bucket))
        return true;
    err = notFound("NoSuchBucket", "The specified bucket does not exist");
    return false;
}

void MockObjectStoreClient::simulateLatency() const {
    const int ms = latencyMs_.load();
    if (ms > 0)
        std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

bool MockObjectStoreClient::putObject(const std::string &bucket,
                                      const std::string &key,
                                      const std::vector<char> &body,
                                      const std::string &contentType,
                                      std::string &etag, StoreError &err) {
    simulateLatency();
    std::lock_guard<std::mutex> lk(mtx_);
    if (takeInjected(Op::Put, key, err) || !checkBucket(bucket, err))
        return false;
    Object o;
    o.data = body;
    o.contentType = contentType;
    o.etag = etagFor(body);
    o.lastModified = static_cast<std::uint64_t>(std::time(nullptr));
    etag = o.etag;
    buckets_[bucket][key] = std::move(o);
    return true;
}

bool MockObjectStoreClient::getObject(const std::string &bucket,
                                      const std::string &key,
                                      const std::optional<ByteRange> &range,
                                      std::vector<char> &out, StoreError &err) {
    InFlightGuard guard(inFlightGets_, maxInFlightGets_);
    simulateLatency();
    std::lock_guard<std::mutex> lk(mtx_);
    if (takeInjected(Op::Get, key, err) || !checkBucket(bucket, err))
        return false;
    if (range) {
        auto rf = rangeFailures_.find(range->first);
        if (rf != rangeFailures_.end()) {
            err = rf->second;
            return false;
        }
    }
    const auto &objects = buckets_[bucket];
    auto it = objects.find(key);
    if (it == objects.end()) {
        err = notFound("NoSuchKey", "The specified key does not exist.");
        return false;
    }
    const auto &data = it->second.data;
    if (!range) {
        out = data;
        return true;
    }
    if (range->first >= data.size() || range->last < range->first) {
        err.httpStatus = 416;
        err.code = "InvalidRange";
        err.message = "The requested range is not satisfiable";
        return false;
    }
    std::uint64_t last = std::min<std::uint64_t>(range->last, data.size() - 1);
    auto sr = shortRanges_.find(range->first);
    std::uint64_t len = last - range->first + 1;
    if (sr != shortRanges_.end())
        len = sr->second >= len ? 0 : len - sr->second;
    out.assign(data.begin() + static_cast<std::ptrdiff_t>(range->first),
               data.begin() + static_cast<std::ptrdiff_t>(range->first + len));
    return true;
}

bool MockObjectStoreClient::headObject(const std::string &bucket,
                                       const std::string &key, ObjectInfo &info,
                                       StoreError &err) {
    simulateLatency();
    std::lock_guard<std::mutex> lk(mtx_);
    err.clear();
    if (takeInjected(Op::Head, key, err) || !checkBucket(bucket, err))
        return false;
    const auto &objects = buckets_[bucket];
    auto it = objects.find(key);
    if (it == objects.end())
        return false;
    info.key = key;
    info.size = it->second.data.size();
    info.etag = it->second.etag;
    info.contentType = it->second.contentType;
    info.lastModified = it->second.lastModified;
    return true;
}

bool MockObjectStoreClient::createMultipartUpload(
    const std::string &bucket, const std::string &key,
    const std::string &contentType, std::string &uploadId, StoreError &err) {
    simulateLatency();
    std::lock_guard<std::mutex> lk(mtx_);
    if (takeInjected(Op::CreateMultipart, key, err) ||
        !checkBucket(bucket, err))
        return false;
    uploadId = "mock-upload-" + std::to_string(nextUploadId_++);
    Session s;
    s.bucket = bucket;
    s.key = key;
    s.contentType = contentType;
    sessions_[uploadId] = std::move(s);
    return true;
}

bool MockObjectStoreClient::uploadPart(const std::string &bucket,
                                       const std::string &key,
                                       const std::string &uploadId,
                                       int partNumber,
                                       const std::vector<char> &body,
                                       std::string &etag, StoreError &err) {
    InFlightGuard guard(inFlightParts_, maxInFlightParts_);
    simulateLatency();
    std::lock_guard<std::mutex> lk(mtx_);
    if (takeInjected(Op::UploadPart, key, err))
        return false;
    auto pf = partFailures_.find(partNumber);
    if (pf != partFailures_.end()) {
        err = pf->second;
        return false;
    }
    auto it = sessions_.find(uploadId);
    if (it == sessions_.end() || it->second.bucket != bucket ||
        it->second.key != key) {
        err = notFound("NoSuchUpload", "The specified upload does not exist.");
        return false;
    }
    if (partNumber < 1 || partNumber > 10000) {
        err.httpStatus = 400;
        err.code = "InvalidArgument";
        err.message = "Part number must be between 1 and 10000";
        return false;
    }
    etag = etagFor(body);
    it->second.parts[partNumber] = body;
    it->second.etags[partNumber] = etag;
    return true;
}

bool MockObjectStoreClient::completeMultipartUpload(
    const std::string &bucket, const std::string &key,
    const std::string &uploadId, const std::vector<CompletedPart> &parts,
    StoreError &err) {
    simulateLatency();
    std::lock_guard<std::mutex> lk(mtx_);
    if (takeInjected(Op::Complete, key, err))
        return false;
    auto it = sessions_.find(uploadId);
    if (it == sessions_.end() || it->second.bucket != bucket ||
        it->second.key != key) {
        err = notFound("NoSuchUpload", "The specified upload does not exist.");
        return false;
    }
    lastCompletedOrder_.clear();
    for (const auto &p : parts)
        lastCompletedOrder_.push_back(p.partNumber);

    const Session &s = it->second;
    std::vector<char> assembled;
    int previous = 0;
    for (const auto &p : parts) {
        if (p.partNumber <= previous) {
            err.httpStatus = 400;
            err.code = "InvalidPartOrder";
            err.message = "The list of parts was not in ascending order.";
            return false;
        }
        previous = p.partNumber;
        auto e = s.etags.find(p.partNumber);
        if (e == s.etags.end() || e->second != p.etag) {
            err.httpStatus = 400;
            err.code = "InvalidPart";
            err.message = "One or more of the specified parts could not be found.";
            return false;
        }
        const auto &data = s.parts.at(p.partNumber);
        assembled.insert(assembled.end(), data.begin(), data.end());
    }
    Object o;
    o.data = std::move(assembled);
    o.contentType = s.contentType;
    o.etag = etagFor(o.data);
    o.lastModified = static_cast<std::uint64_t>(std::time(nullptr));
    buckets_[bucket][key] = std::move(o);
    sessions_.erase(it);
    return true;
}

bool MockObjectStoreClient::abortMultipartUpload(const std::string &bucket,
                                                 const std::string &key,
                                                 const std::string &uploadId,
                                                 StoreError &err) {
    simulateLatency();
    std::lock_guard<std::mutex> lk(mtx_);
    aborted_.push_back(uploadId);
    if (takeInjected(Op::Abort, key, err))
        return false;
    auto it = sessions_.find(uploadId);
    if (it == sessions_.end() || it->second.bucket != bucket) {
        err = notFound("NoSuchUpload", "The specified upload does not exist.");
        return false;
    }
    sessions_.erase(it);
    return true;
}

bool MockObjectStoreClient::copyObject(const std::string &bucket,
                                       const std::string &sourceKey,
                                       const std::string &destKey,
                                       StoreError &err) {
    simulateLatency();
    std::lock_guard<std::mutex> lk(mtx_);
    if (takeInjected(Op::Copy, sourceKey, err) || !checkBucket(bucket, err))
        return false;
    auto &objects = buckets_[bucket];
    auto it = objects.find(sourceKey);
    if (it == objects.end()) {
        err = notFound("NoSuchKey", "The specified key does not exist.");
        return false;
    }
    Object copy = it->second;
    copy.lastModified = static_cast<std::uint64_t>(std::time(nullptr));
    objects[destKey] = std::move(copy);
    return true;
}

bool MockObjectStoreClient::deleteObject(const std::string &bucket,
                                         const std::string &key,
                                         StoreError &err) {
    simulateLatency();
    std::lock_guard<std::mutex> lk(mtx_);
    if (takeInjected(Op::Delete, key, err) || !checkBucket(bucket, err))
        return false;
    // Deleting a missing key succeeds, as on S3.
    buckets_[bucket].erase(key);
    return true;
}

bool MockObjectStoreClient::deleteObjects(const std::string &bucket,
                                          const std::vector<std::string> &keys,
                                          std::vector<std::string> &failedKeys,
                                          StoreError &err) {
    simulateLatency();
    std::lock_guard<std::mutex> lk(mtx_);
    if (takeInjected(Op::DeleteBatch, std::string(), err) ||
        !checkBucket(bucket, err))
        return false;
    auto &objects = buckets_[bucket];
    for (const auto &k : keys) {
        if (keyFailures_.count({Op::DeleteBatch, k})) {
            failedKeys.push_back(k);
            continue;
        }
        objects.erase(k);
    }
    return true;
}

bool MockObjectStoreClient::listObjects(
    const std::string &bucket, const std::string &prefix,
    const std::optional<std::string> &continuationToken, ListPage &page,
    StoreError &err) {
    simulateLatency();
    std::lock_guard<std::mutex> lk(mtx_);
    if (takeInjected(Op::List, prefix, err) || !checkBucket(bucket, err))
        return false;
    page.objects.clear();
    page.nextToken.reset();
    const auto &objects = buckets_[bucket];
    // The token is the last key of the previous page.
    auto it = continuationToken ? objects.upper_bound(*continuationToken)
                                : objects.lower_bound(prefix);
    const int pageSize = listPageSize_.load();
    for (; it != objects.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0)
            break;
        if (static_cast<int>(page.objects.size()) == pageSize) {
            page.nextToken = page.objects.back().key;
            break;
        }
        ObjectInfo info;
        info.key = it->first;
        info.size = it->second.data.size();
        info.etag = it->second.etag;
        info.lastModified = it->second.lastModified;
        info.contentType = it->second.contentType;
        page.objects.push_back(std::move(info));
    }
    return true;
}

} // namespace owlxfer
