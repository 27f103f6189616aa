// Maps raw store, network and filesystem failures into a closed taxonomy.
// Callers decide on retries through TransferError::retryable() only.
#pragma once
#include <string>

namespace owlxfer {

enum class ErrorKind {
    NotConfigured,
    InvalidCredentials,
    Authentication,
    PermissionDenied,
    BucketNotFound,
    FileNotFound,
    InvalidName,
    SizeExceeded,
    QuotaExceeded,
    Timeout,
    DnsFailure,
    TlsFailure,
    EndpointUnreachable,
    Network,
    ServerError,
    Unknown
};

// How a request failed below HTTP. None means an HTTP response was received
// (or the failure did not involve the network at all).
enum class TransportFailure {
    None,
    Timeout,
    DnsFailure,
    ConnectionRefused,
    TlsFailure,
    Other
};

// Raw failure reported by an ObjectStoreClient. Backends fill whatever they
// know; classify() turns it into a TransferError.
struct StoreError {
    TransportFailure transport = TransportFailure::None;
    int httpStatus = 0;   // 0 if no response
    std::string code;     // S3 error code, e.g. "NoSuchKey"
    std::string message;

    bool empty() const {
        return transport == TransportFailure::None && httpStatus == 0 &&
               code.empty() && message.empty();
    }
    void clear() { *this = StoreError{}; }
};

struct TransferError {
    ErrorKind kind = ErrorKind::Unknown;
    std::string message;

    bool retryable() const;
};

bool isRetryable(ErrorKind kind);
const char *errorKindName(ErrorKind kind);

TransferError classify(const StoreError &raw);
// errnum is an errno value captured right after the failing call.
TransferError classifyFileError(int errnum, const std::string &path);
// Keyword heuristics for failures that only come with free text.
TransferError classifyMessage(const std::string &message);

} // namespace owlxfer
