#include "owlxfer/ChunkPlanner.hpp"

#include <algorithm>

namespace owlxfer {

ByteRange ChunkPlan::rangeFor(int index) const {
    ByteRange r;
    if (totalSize == 0)
        return r;
    r.first = static_cast<std::uint64_t>(index) * partSize;
    r.last = std::min(r.first + partSize, totalSize) - 1;
    return r;
}

std::uint64_t uploadPartSizeFor(std::uint64_t size) {
    if (size <= 500 * kMiB)
        return 20 * kMiB;
    if (size <= 2 * kGiB)
        return 50 * kMiB;
    return 100 * kMiB;
}

static ChunkPlan singleShot(std::uint64_t size) {
    ChunkPlan p;
    p.strategy = ChunkStrategy::SingleShot;
    p.totalSize = size;
    p.partSize = size;
    p.partCount = 1;
    return p;
}

static ChunkPlan chunkedPlan(std::uint64_t size, std::uint64_t partSize) {
    ChunkPlan p;
    p.strategy = ChunkStrategy::Chunked;
    p.totalSize = size;
    p.partSize = std::max<std::uint64_t>(1, partSize);
    p.partCount = static_cast<int>((size + p.partSize - 1) / p.partSize);
    return p;
}

ChunkPlan planUpload(std::uint64_t size, const TransferLimits &limits) {
    if (size <= limits.uploadThreshold)
        return singleShot(size);
    const std::uint64_t part = limits.partSizeOverride > 0
                                   ? limits.partSizeOverride
                                   : uploadPartSizeFor(size);
    return chunkedPlan(size, part);
}

ChunkPlan planDownload(std::uint64_t size, const TransferLimits &limits) {
    if (size <= limits.downloadThreshold)
        return singleShot(size);
    return chunkedPlan(size, limits.downloadChunkSize);
}

} // namespace owlxfer
