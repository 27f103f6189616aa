// Server-side move/rename: copy then delete, folders by prefix substitution.
#pragma once
#include "ErrorClassifier.hpp"
#include "TransferCallbacks.hpp"

#include <string>
#include <vector>

namespace owlxfer {

class ObjectStoreClient;

enum class ConflictPolicy { Skip, Rename, Fail };

// Parses "skip" / "rename" / "fail" ("replace" is treated as "fail").
// Unknown values fall back to Rename.
ConflictPolicy conflictPolicyFromString(const std::string &value);
const char *conflictPolicyName(ConflictPolicy policy);

struct MoveResult {
    int movedCount = 0;
    std::vector<std::string> failedKeys;
};

class MoveExecutor {
public:
    static constexpr int kMaxRenameAttempts = 100;

    // `client` is not owned and must outlive the executor.
    explicit MoveExecutor(ObjectStoreClient *client);

    bool moveObject(const std::string &bucket, const std::string &sourceKey,
                    const std::string &destKey, TransferError &err);

    // Moves every object under `sourceFolder` (including its marker) below
    // `destFolder`. Returns false if any object could not be moved; the
    // failed keys are in `result` and `err` holds the first error.
    bool moveFolder(const std::string &bucket, const std::string &sourceFolder,
                    const std::string &destFolder, MoveResult &result,
                    TransferError &err, ProgressFn progress = {},
                    CancelFn shouldCancel = {});

    // True when `key` is taken: an object for file keys, a marker or any key
    // under the prefix for folder keys.
    bool destinationExists(const std::string &bucket, const std::string &key,
                           bool &exists, TransferError &err);

    // Applies the collision policy to `desiredKey`. On success `finalKey`
    // holds the key to use, or `skip` is true.
    bool resolveDestination(const std::string &bucket,
                            const std::string &desiredKey, ConflictPolicy policy,
                            const std::string &renamePattern,
                            std::string &finalKey, bool &skip,
                            TransferError &err);

private:
    ObjectStoreClient *client_ = nullptr;
};

} // namespace owlxfer
