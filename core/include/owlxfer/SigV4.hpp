// AWS Signature Version 4 for S3 requests.
#pragma once
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace owlxfer {
namespace sigv4 {

// SHA-256 of an empty payload, hex encoded.
constexpr const char *kEmptyPayloadHash =
    "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

struct SigningKey {
    std::string accessKeyId;
    std::string secretAccessKey;
    std::string region = "auto";
    std::string service = "s3";
};

struct Request {
    std::string method;
    std::string canonicalUri; // already URI-encoded path
    std::vector<std::pair<std::string, std::string>> query; // raw, unencoded
    std::map<std::string, std::string> headers; // lowercase names
    std::string payloadHash = kEmptyPayloadHash;
};

// RFC 3986 encoding as S3 expects. '/' is kept when encodeSlash is false.
std::string uriEncode(const std::string &value, bool encodeSlash);

std::string sha256Hex(const std::string &data);

std::string canonicalQuery(const Request &req);
std::string signedHeaders(const Request &req);
std::string canonicalRequest(const Request &req);

// amzDate is yyyyMMddTHHmmssZ.
std::string credentialScope(const std::string &amzDate, const SigningKey &key);
std::string stringToSign(const Request &req, const std::string &amzDate,
                         const SigningKey &key);
std::string signature(const Request &req, const std::string &amzDate,
                      const SigningKey &key);
std::string authorizationHeader(const Request &req, const std::string &amzDate,
                                const SigningKey &key);

} // namespace sigv4
} // namespace owlxfer
