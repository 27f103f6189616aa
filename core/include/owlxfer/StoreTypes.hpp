// Basic types shared between the engine, the queue layer and store backends.
// Keep these structures plain so they can be copied across threads freely.
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace owlxfer {

// Metadata for one object in a bucket.
struct ObjectInfo {
    std::string   key;            // full key, folders end in '/'
    std::uint64_t size = 0;       // bytes
    std::uint64_t lastModified = 0; // epoch (seconds), 0 if unknown
    std::string   etag;
    std::string   contentType;
};

// Inclusive byte range [first, last], as used by HTTP Range headers.
struct ByteRange {
    std::uint64_t first = 0;
    std::uint64_t last = 0;

    std::uint64_t length() const { return last - first + 1; }
};

// Tag returned by the store for one uploaded part of a multipart session.
struct CompletedPart {
    int         partNumber = 0; // 1-based
    std::string etag;
};

// One page of a flat (recursive) listing.
struct ListPage {
    std::vector<ObjectInfo>    objects;
    std::optional<std::string> nextToken; // empty when this is the last page
};

// Connection settings for an S3-compatible endpoint.
struct StoreOptions {
    std::string endpoint;        // e.g. https://<account>.r2.cloudflarestorage.com
    std::string region = "auto";
    std::string accessKeyId;
    std::string secretAccessKey;
    bool pathStyle = true;       // https://host/bucket/key instead of bucket.host

    // Timeouts applied per request by the backend.
    int connectTimeoutMs = 15000;
    int requestTimeoutMs = 60000;
};

} // namespace owlxfer
