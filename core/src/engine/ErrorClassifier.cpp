// Error taxonomy: S3 codes first, then HTTP status, then transport failure,
// then text heuristics.
#include "owlxfer/ErrorClassifier.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <unordered_map>

namespace owlxfer {

static std::string lowered(std::string s) {
    for (char &c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

static bool contains(const std::string &haystack, const char *needle) {
    return haystack.find(needle) != std::string::npos;
}

bool isRetryable(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Timeout:
    case ErrorKind::DnsFailure:
    case ErrorKind::EndpointUnreachable:
    case ErrorKind::Network:
    case ErrorKind::ServerError:
    case ErrorKind::Unknown:
        return true;
    case ErrorKind::NotConfigured:
    case ErrorKind::InvalidCredentials:
    case ErrorKind::Authentication:
    case ErrorKind::PermissionDenied:
    case ErrorKind::BucketNotFound:
    case ErrorKind::FileNotFound:
    case ErrorKind::InvalidName:
    case ErrorKind::SizeExceeded:
    case ErrorKind::QuotaExceeded:
    case ErrorKind::TlsFailure:
        return false;
    }
    return false;
}

bool TransferError::retryable() const { return isRetryable(kind); }

const char *errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NotConfigured:
        return "not-configured";
    case ErrorKind::InvalidCredentials:
        return "invalid-credentials";
    case ErrorKind::Authentication:
        return "authentication";
    case ErrorKind::PermissionDenied:
        return "permission-denied";
    case ErrorKind::BucketNotFound:
        return "bucket-not-found";
    case ErrorKind::FileNotFound:
        return "file-not-found";
    case ErrorKind::InvalidName:
        return "invalid-name";
    case ErrorKind::SizeExceeded:
        return "size-exceeded";
    case ErrorKind::QuotaExceeded:
        return "quota-exceeded";
    case ErrorKind::Timeout:
        return "timeout";
    case ErrorKind::DnsFailure:
        return "dns-failure";
    case ErrorKind::TlsFailure:
        return "tls-failure";
    case ErrorKind::EndpointUnreachable:
        return "endpoint-unreachable";
    case ErrorKind::Network:
        return "network";
    case ErrorKind::ServerError:
        return "server-error";
    case ErrorKind::Unknown:
        return "unknown";
    }
    return "unknown";
}

static bool kindForStoreCode(const std::string &code, ErrorKind &out) {
    static const std::unordered_map<std::string, ErrorKind> table = {
        {"NoSuchBucket", ErrorKind::BucketNotFound},
        {"NoSuchKey", ErrorKind::FileNotFound},
        {"NoSuchUpload", ErrorKind::FileNotFound},
        {"NotFound", ErrorKind::FileNotFound},
        {"InvalidAccessKeyId", ErrorKind::InvalidCredentials},
        {"InvalidSecretAccessKey", ErrorKind::InvalidCredentials},
        {"SignatureDoesNotMatch", ErrorKind::Authentication},
        {"ExpiredToken", ErrorKind::Authentication},
        {"InvalidToken", ErrorKind::Authentication},
        {"RequestTimeTooSkewed", ErrorKind::Authentication},
        {"AccessDenied", ErrorKind::PermissionDenied},
        {"AllAccessDisabled", ErrorKind::PermissionDenied},
        {"InvalidObjectName", ErrorKind::InvalidName},
        {"InvalidBucketName", ErrorKind::InvalidName},
        {"KeyTooLongError", ErrorKind::InvalidName},
        {"EntityTooLarge", ErrorKind::SizeExceeded},
        {"EntityTooSmall", ErrorKind::SizeExceeded},
        {"QuotaExceeded", ErrorKind::QuotaExceeded},
        {"TooManyBuckets", ErrorKind::QuotaExceeded},
        {"RequestTimeout", ErrorKind::Timeout},
        {"InternalError", ErrorKind::ServerError},
        {"ServiceUnavailable", ErrorKind::ServerError},
        {"SlowDown", ErrorKind::ServerError},
    };
    auto it = table.find(code);
    if (it == table.end())
        return false;
    out = it->second;
    return true;
}

static bool kindForHttpStatus(int status, ErrorKind &out) {
    switch (status) {
    case 401:
        out = ErrorKind::Authentication;
        return true;
    case 403:
        out = ErrorKind::PermissionDenied;
        return true;
    case 404:
        out = ErrorKind::FileNotFound;
        return true;
    case 408:
        out = ErrorKind::Timeout;
        return true;
    case 413:
        out = ErrorKind::SizeExceeded;
        return true;
    case 507:
        out = ErrorKind::QuotaExceeded;
        return true;
    default:
        break;
    }
    if (status == 429 || (status >= 500 && status <= 599)) {
        out = ErrorKind::ServerError;
        return true;
    }
    return false;
}

static std::string describe(const StoreError &raw) {
    std::string msg = raw.message;
    if (!raw.code.empty()) {
        msg = msg.empty() ? raw.code : raw.code + ": " + msg;
    }
    if (raw.httpStatus > 0) {
        msg += " (HTTP " + std::to_string(raw.httpStatus) + ")";
    }
    if (msg.empty())
        msg = "Unknown store error";
    return msg;
}

TransferError classify(const StoreError &raw) {
    TransferError out;
    out.message = describe(raw);

    ErrorKind k = ErrorKind::Unknown;
    if (!raw.code.empty() && kindForStoreCode(raw.code, k)) {
        out.kind = k;
        return out;
    }
    if (raw.httpStatus > 0 && kindForHttpStatus(raw.httpStatus, k)) {
        out.kind = k;
        return out;
    }
    switch (raw.transport) {
    case TransportFailure::Timeout:
        out.kind = ErrorKind::Timeout;
        return out;
    case TransportFailure::DnsFailure:
        out.kind = ErrorKind::DnsFailure;
        return out;
    case TransportFailure::ConnectionRefused:
        out.kind = ErrorKind::EndpointUnreachable;
        return out;
    case TransportFailure::TlsFailure:
        out.kind = ErrorKind::TlsFailure;
        return out;
    case TransportFailure::Other:
        out.kind = ErrorKind::Network;
        return out;
    case TransportFailure::None:
        break;
    }
    // Nothing structured to go on.
    TransferError guessed = classifyMessage(raw.message);
    out.kind = guessed.kind;
    return out;
}

TransferError classifyFileError(int errnum, const std::string &path) {
    TransferError out;
    out.message = path + ": " + std::strerror(errnum);
    switch (errnum) {
    case ENOENT:
    case ENOTDIR:
        out.kind = ErrorKind::FileNotFound;
        break;
    case EACCES:
    case EPERM:
    case EROFS:
        out.kind = ErrorKind::PermissionDenied;
        break;
    case ENOSPC:
#ifdef EDQUOT
    case EDQUOT:
#endif
        out.kind = ErrorKind::QuotaExceeded;
        break;
    case EFBIG:
        out.kind = ErrorKind::SizeExceeded;
        break;
    case ENAMETOOLONG:
    case EISDIR:
        out.kind = ErrorKind::InvalidName;
        break;
    default:
        out.kind = ErrorKind::Unknown;
        break;
    }
    return out;
}

TransferError classifyMessage(const std::string &message) {
    TransferError out;
    out.message = message.empty() ? std::string("Unknown error") : message;
    const std::string m = lowered(message);

    if (contains(m, "not configured")) {
        out.kind = ErrorKind::NotConfigured;
    } else if (contains(m, "accessdenied") || contains(m, "access denied") ||
               contains(m, "forbidden") || contains(m, "permission")) {
        out.kind = ErrorKind::PermissionDenied;
    } else if (contains(m, "nosuchbucket")) {
        out.kind = ErrorKind::BucketNotFound;
    } else if (contains(m, "no such key") || contains(m, "nosuchkey") ||
               contains(m, "not found") || contains(m, "does not exist")) {
        out.kind = ErrorKind::FileNotFound;
    } else if (contains(m, "quota")) {
        out.kind = ErrorKind::QuotaExceeded;
    } else if (contains(m, "timed out") || contains(m, "timeout")) {
        out.kind = ErrorKind::Timeout;
    } else if (contains(m, "hostname") || contains(m, "dns") ||
               contains(m, "name resolution")) {
        out.kind = ErrorKind::DnsFailure;
    } else if (contains(m, "unreachable") ||
               contains(m, "connection refused")) {
        out.kind = ErrorKind::EndpointUnreachable;
    } else if (contains(m, "ssl") || contains(m, "tls") ||
               contains(m, "certificate")) {
        out.kind = ErrorKind::TlsFailure;
    } else if (contains(m, "too large")) {
        out.kind = ErrorKind::SizeExceeded;
    } else if (contains(m, "credentials") || contains(m, "signature") ||
               contains(m, "authentication")) {
        out.kind = ErrorKind::Authentication;
    } else if (contains(m, "network") || contains(m, "connection")) {
        out.kind = ErrorKind::Network;
    } else {
        out.kind = ErrorKind::Unknown;
    }
    return out;
}

} // namespace owlxfer
