#include "owlxfer/MoveExecutor.hpp"
#include "owlxfer/Logging.hpp"
#include "owlxfer/ObjectKeys.hpp"
#include "owlxfer/ObjectStoreClient.hpp"

#include <QString>
#include <optional>

namespace owlxfer {

static QString q(const std::string &s) { return QString::fromStdString(s); }

ConflictPolicy conflictPolicyFromString(const std::string &value) {
    if (value == "skip")
        return ConflictPolicy::Skip;
    if (value == "fail" || value == "replace")
        return ConflictPolicy::Fail;
    return ConflictPolicy::Rename;
}

const char *conflictPolicyName(ConflictPolicy policy) {
    switch (policy) {
    case ConflictPolicy::Skip:
        return "skip";
    case ConflictPolicy::Rename:
        return "rename";
    case ConflictPolicy::Fail:
        return "fail";
    }
    return "rename";
}

MoveExecutor::MoveExecutor(ObjectStoreClient *client) : client_(client) {}

bool MoveExecutor::moveObject(const std::string &bucket,
                              const std::string &sourceKey,
                              const std::string &destKey, TransferError &err) {
    if (!client_) {
        err.kind = ErrorKind::NotConfigured;
        err.message = "Object store client not configured";
        return false;
    }
    if (sourceKey == destKey) {
        err.kind = ErrorKind::InvalidName;
        err.message = "Source and destination are the same: " + sourceKey;
        return false;
    }
    StoreError serr;
    if (!client_->copyObject(bucket, sourceKey, destKey, serr)) {
        err = classify(serr);
        return false;
    }
    if (!client_->deleteObject(bucket, sourceKey, serr)) {
        // The copy landed; the source is left behind as a duplicate.
        err = classify(serr);
        qCWarning(owlEngine) << "move left source behind"
                             << "source=" << q(sourceKey)
                             << "dest=" << q(destKey);
        return false;
    }
    return true;
}

bool MoveExecutor::moveFolder(const std::string &bucket,
                              const std::string &sourceFolder,
                              const std::string &destFolder, MoveResult &result,
                              TransferError &err, ProgressFn progress,
                              CancelFn shouldCancel) {
    if (!client_) {
        err.kind = ErrorKind::NotConfigured;
        err.message = "Object store client not configured";
        return false;
    }
    const std::string src = folderPrefix(sourceFolder);
    const std::string dst = folderPrefix(destFolder);
    if (src.empty() || isWithinFolder(dst, src)) {
        err.kind = ErrorKind::InvalidName;
        err.message = "Cannot move folder " + src + " into itself (" + dst + ")";
        return false;
    }

    std::vector<std::string> keys;
    std::optional<std::string> token;
    do {
        ListPage page;
        StoreError serr;
        if (!client_->listObjects(bucket, src, token, page, serr)) {
            err = classify(serr);
            return false;
        }
        for (const auto &o : page.objects)
            keys.push_back(o.key);
        token = page.nextToken;
    } while (token);

    if (keys.empty()) {
        err.kind = ErrorKind::FileNotFound;
        err.message = src + ": folder is empty or does not exist";
        return false;
    }
    qCInfo(owlEngine) << "folder move" << "source=" << q(src)
                      << "dest=" << q(dst) << "objects=" << int(keys.size());

    std::optional<TransferError> firstErr;
    std::size_t processed = 0;
    for (const auto &key : keys) {
        if (shouldCancel && shouldCancel()) {
            err.kind = ErrorKind::Unknown;
            err.message = kCancelledMessage;
            return false;
        }
        const std::string target = dst + key.substr(src.size());
        StoreError serr;
        if (!client_->copyObject(bucket, key, target, serr)) {
            result.failedKeys.push_back(key);
            if (!firstErr)
                firstErr = classify(serr);
        } else if (!client_->deleteObject(bucket, key, serr)) {
            result.failedKeys.push_back(key);
            if (!firstErr)
                firstErr = classify(serr);
        } else {
            ++result.movedCount;
        }
        ++processed;
        if (progress)
            progress(processed, double(processed) / double(keys.size()));
    }

    if (!result.failedKeys.empty()) {
        err = *firstErr;
        err.message = std::to_string(result.failedKeys.size()) + " of " +
                      std::to_string(keys.size()) +
                      " objects could not be moved: " + err.message;
        return false;
    }
    return true;
}

bool MoveExecutor::destinationExists(const std::string &bucket,
                                     const std::string &key, bool &exists,
                                     TransferError &err) {
    exists = false;
    ObjectInfo info;
    StoreError serr;
    if (client_->headObject(bucket, key, info, serr)) {
        exists = true;
        return true;
    }
    if (!serr.empty()) {
        err = classify(serr);
        return false;
    }
    if (!isFolderKey(key))
        return true;
    // Folders without a marker still exist if anything lives below them.
    ListPage page;
    if (!client_->listObjects(bucket, key, std::nullopt, page, serr)) {
        err = classify(serr);
        return false;
    }
    exists = !page.objects.empty();
    return true;
}

bool MoveExecutor::resolveDestination(const std::string &bucket,
                                      const std::string &desiredKey,
                                      ConflictPolicy policy,
                                      const std::string &renamePattern,
                                      std::string &finalKey, bool &skip,
                                      TransferError &err) {
    if (!client_) {
        err.kind = ErrorKind::NotConfigured;
        err.message = "Object store client not configured";
        return false;
    }
    skip = false;
    finalKey = desiredKey;
    bool exists = false;
    if (!destinationExists(bucket, desiredKey, exists, err))
        return false;
    if (!exists)
        return true;

    switch (policy) {
    case ConflictPolicy::Skip:
        skip = true;
        return true;
    case ConflictPolicy::Fail:
        err.kind = ErrorKind::InvalidName;
        err.message = "Destination already exists: " + desiredKey;
        return false;
    case ConflictPolicy::Rename:
        break;
    }

    for (int n = 1; n <= kMaxRenameAttempts; ++n) {
        const std::string candidate =
            applyRenamePattern(desiredKey, renamePattern, n);
        if (!destinationExists(bucket, candidate, exists, err))
            return false;
        if (!exists) {
            finalKey = candidate;
            return true;
        }
    }
    err.kind = ErrorKind::InvalidName;
    err.message = "Destination already exists: " + desiredKey +
                  " (no free name after " +
                  std::to_string(kMaxRenameAttempts) + " attempts)";
    return false;
}

} // namespace owlxfer
