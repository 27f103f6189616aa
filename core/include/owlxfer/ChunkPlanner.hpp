// Decides between single-shot and chunked transfers and sizes the chunks.
#pragma once
#include "StoreTypes.hpp"

#include <cstdint>

namespace owlxfer {

constexpr std::uint64_t kMiB = 1024ull * 1024ull;
constexpr std::uint64_t kGiB = 1024ull * kMiB;

// Tunables for the transfer engine. Defaults match what the store accepts
// for multipart sessions.
struct TransferLimits {
    std::uint64_t uploadThreshold = 100 * kMiB;   // above: multipart
    std::uint64_t downloadThreshold = 10 * kMiB;  // above: ranged chunks
    std::uint64_t downloadChunkSize = 10 * kMiB;
    std::uint64_t partSizeOverride = 0;           // 0 = tiered upload parts
    int partParallelism = 12;                     // parts/chunks in flight
    std::uint64_t maxFileSize = 5 * kGiB;
};

enum class ChunkStrategy { SingleShot, Chunked };

struct ChunkPlan {
    ChunkStrategy strategy = ChunkStrategy::SingleShot;
    std::uint64_t totalSize = 0;
    std::uint64_t partSize = 0;
    int partCount = 1;

    bool chunked() const { return strategy == ChunkStrategy::Chunked; }
    // Inclusive byte range of part `index` (0-based). The last part may be
    // shorter than partSize.
    ByteRange rangeFor(int index) const;
};

// Upload part size tier for a multipart upload of `size` bytes.
std::uint64_t uploadPartSizeFor(std::uint64_t size);

ChunkPlan planUpload(std::uint64_t size, const TransferLimits &limits);
ChunkPlan planDownload(std::uint64_t size, const TransferLimits &limits);

} // namespace owlxfer
