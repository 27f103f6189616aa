#include "owlxfer/SigV4.hpp"

#include <QByteArray>
#include <QCryptographicHash>
#include <QMessageAuthenticationCode>
#include <algorithm>
#include <cctype>
#include <cstdio>

namespace owlxfer {
namespace sigv4 {

static QByteArray bytes(const std::string &s) {
    return QByteArray(s.data(), static_cast<qsizetype>(s.size()));
}

static QByteArray hmac(const QByteArray &key, const std::string &msg) {
    return QMessageAuthenticationCode::hash(bytes(msg), key,
                                            QCryptographicHash::Sha256);
}

static std::string trimmed(const std::string &v) {
    std::size_t b = 0, e = v.size();
    while (b < e && std::isspace(static_cast<unsigned char>(v[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(v[e - 1])))
        --e;
    return v.substr(b, e - b);
}

std::string uriEncode(const std::string &value, bool encodeSlash) {
    std::string out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' ||
            (c == '/' && !encodeSlash)) {
            out.push_back(static_cast<char>(c));
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

std::string sha256Hex(const std::string &data) {
    return QCryptographicHash::hash(bytes(data), QCryptographicHash::Sha256)
        .toHex()
        .toStdString();
}

std::string canonicalQuery(const Request &req) {
    std::vector<std::pair<std::string, std::string>> encoded;
    encoded.reserve(req.query.size());
    for (const auto &kv : req.query)
        encoded.emplace_back(uriEncode(kv.first, true),
                             uriEncode(kv.second, true));
    std::sort(encoded.begin(), encoded.end());
    std::string out;
    for (const auto &kv : encoded) {
        if (!out.empty())
            out += '&';
        out += kv.first + "=" + kv.second;
    }
    return out;
}

std::string signedHeaders(const Request &req) {
    std::string out;
    for (const auto &kv : req.headers) {
        if (!out.empty())
            out += ';';
        out += kv.first;
    }
    return out;
}

std::string canonicalRequest(const Request &req) {
    std::string out = req.method + "\n";
    out += (req.canonicalUri.empty() ? std::string("/") : req.canonicalUri) +
           "\n";
    out += canonicalQuery(req) + "\n";
    for (const auto &kv : req.headers)
        out += kv.first + ":" + trimmed(kv.second) + "\n";
    out += "\n";
    out += signedHeaders(req) + "\n";
    out += req.payloadHash;
    return out;
}

std::string credentialScope(const std::string &amzDate, const SigningKey &key) {
    return amzDate.substr(0, 8) + "/" + key.region + "/" + key.service +
           "/aws4_request";
}

std::string stringToSign(const Request &req, const std::string &amzDate,
                         const SigningKey &key) {
    return "AWS4-HMAC-SHA256\n" + amzDate + "\n" +
           credentialScope(amzDate, key) + "\n" +
           sha256Hex(canonicalRequest(req));
}

std::string signature(const Request &req, const std::string &amzDate,
                      const SigningKey &key) {
    QByteArray k = hmac(bytes("AWS4" + key.secretAccessKey),
                        amzDate.substr(0, 8));
    k = hmac(k, key.region);
    k = hmac(k, key.service);
    k = hmac(k, "aws4_request");
    return hmac(k, stringToSign(req, amzDate, key)).toHex().toStdString();
}

std::string authorizationHeader(const Request &req, const std::string &amzDate,
                                const SigningKey &key) {
    return "AWS4-HMAC-SHA256 Credential=" + key.accessKeyId + "/" +
           credentialScope(amzDate, key) +
           ", SignedHeaders=" + signedHeaders(req) +
           ", Signature=" + signature(req, amzDate, key);
}

} // namespace sigv4
} // namespace owlxfer
