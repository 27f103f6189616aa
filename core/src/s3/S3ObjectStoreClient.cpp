// S3 over Qt Network. Every call runs its own QNetworkAccessManager and
// QEventLoop so it can be issued from any worker thread.
#include "owlxfer/S3ObjectStoreClient.hpp"
#include "owlxfer/Logging.hpp"
#include "owlxfer/S3Xml.hpp"
#include "owlxfer/SigV4.hpp"

#include <QCryptographicHash>
#include <QDateTime>
#include <QElapsedTimer>
#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrl>
#include <algorithm>
#include <cctype>

namespace owlxfer {

namespace {

constexpr std::size_t kDeleteBatchSize = 1000;

QString q(const std::string &s) { return QString::fromStdString(s); }

std::string lowered(std::string s) {
    for (char &c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

TransportFailure transportFor(QNetworkReply::NetworkError e) {
    switch (e) {
    case QNetworkReply::TimeoutError:
    case QNetworkReply::OperationCanceledError:
        return TransportFailure::Timeout;
    case QNetworkReply::HostNotFoundError:
        return TransportFailure::DnsFailure;
    case QNetworkReply::ConnectionRefusedError:
        return TransportFailure::ConnectionRefused;
    case QNetworkReply::SslHandshakeFailedError:
        return TransportFailure::TlsFailure;
    default:
        return TransportFailure::Other;
    }
}

QByteArray toBytes(const std::vector<char> &v) {
    return QByteArray(v.data(), static_cast<qsizetype>(v.size()));
}

std::vector<char> toVector(const QByteArray &b) {
    return std::vector<char>(b.constBegin(), b.constEnd());
}

std::string header(const std::map<std::string, std::string> &headers,
                   const char *name) {
    auto it = headers.find(name);
    return it == headers.end() ? std::string() : it->second;
}

} // namespace

S3ObjectStoreClient::S3ObjectStoreClient(const StoreOptions &opt) : opt_(opt) {
    QString endpoint = q(opt_.endpoint).trimmed();
    if (!endpoint.isEmpty() && !endpoint.contains(QStringLiteral("://")))
        endpoint.prepend(QStringLiteral("https://"));
    const QUrl url(endpoint);
    if (url.isValid() && !url.host().isEmpty()) {
        scheme_ = url.scheme().toStdString();
        host_ = url.host().toStdString();
        const int defaultPort = scheme_ == "http" ? 80 : 443;
        if (url.port() != -1 && url.port() != defaultPort)
            host_ += ":" + std::to_string(url.port());
    }
}

std::string S3ObjectStoreClient::hostFor(const std::string &bucket) const {
    if (opt_.pathStyle || bucket.empty())
        return host_;
    return bucket + "." + host_;
}

std::string S3ObjectStoreClient::objectPath(const std::string &bucket,
                                            const std::string &key) const {
    const std::string encodedKey = sigv4::uriEncode(key, false);
    if (!opt_.pathStyle)
        return "/" + encodedKey;
    if (key.empty())
        return "/" + sigv4::uriEncode(bucket, true);
    return "/" + sigv4::uriEncode(bucket, true) + "/" + encodedKey;
}

bool S3ObjectStoreClient::send(const char *method, const std::string &bucket,
                               const std::string &key, const Query &query,
                               const Headers &extraHeaders,
                               const QByteArray &body, Response &resp,
                               StoreError &err) const {
    err.clear();
    if (host_.empty() || opt_.accessKeyId.empty() ||
        opt_.secretAccessKey.empty()) {
        err.message = "Object store not configured (endpoint and credentials "
                      "are required)";
        return false;
    }

    const std::string amzDate =
        QDateTime::currentDateTimeUtc()
            .toString(QStringLiteral("yyyyMMdd'T'HHmmss'Z'"))
            .toStdString();

    sigv4::Request sreq;
    sreq.method = method;
    sreq.canonicalUri = objectPath(bucket, key);
    sreq.query = query;
    sreq.payloadHash =
        body.isEmpty()
            ? std::string(sigv4::kEmptyPayloadHash)
            : QCryptographicHash::hash(body, QCryptographicHash::Sha256)
                  .toHex()
                  .toStdString();
    sreq.headers = extraHeaders;
    sreq.headers["host"] = hostFor(bucket);
    sreq.headers["x-amz-date"] = amzDate;
    sreq.headers["x-amz-content-sha256"] = sreq.payloadHash;

    sigv4::SigningKey signingKey;
    signingKey.accessKeyId = opt_.accessKeyId;
    signingKey.secretAccessKey = opt_.secretAccessKey;
    signingKey.region = opt_.region.empty() ? std::string("auto") : opt_.region;
    const std::string authorization =
        sigv4::authorizationHeader(sreq, amzDate, signingKey);

    std::string url = scheme_ + "://" + hostFor(bucket) + sreq.canonicalUri;
    const std::string qs = sigv4::canonicalQuery(sreq);
    if (!qs.empty())
        url += "?" + qs;

    QNetworkRequest req(
        QUrl::fromEncoded(QByteArray::fromStdString(url), QUrl::StrictMode));
    req.setTransferTimeout(opt_.requestTimeoutMs);
    for (const auto &kv : sreq.headers) {
        if (kv.first == "host")
            continue;
        req.setRawHeader(QByteArray::fromStdString(kv.first),
                         QByteArray::fromStdString(kv.second));
    }
    req.setRawHeader("Authorization", QByteArray::fromStdString(authorization));

    if (LogPolicy::fromEnvironment().showCredentials()) {
        qCDebug(owlStore) << "signed request" << method << q(url)
                          << "keyId=" << q(opt_.accessKeyId)
                          << "authorization=" << q(authorization);
    }

    QElapsedTimer elapsed;
    elapsed.start();
    QNetworkAccessManager nam;
    QNetworkReply *reply = nam.sendCustomRequest(req, QByteArray(method), body);

    // Fails the request if nothing is sent or received within
    // connectTimeoutMs.
    bool connectTimedOut = false;
    QTimer connectTimer;
    connectTimer.setSingleShot(true);
    QObject::connect(&connectTimer, &QTimer::timeout, reply,
                     [&connectTimedOut, reply]() {
                         connectTimedOut = true;
                         reply->abort();
                     });
    QObject::connect(reply, &QNetworkReply::metaDataChanged, &connectTimer,
                     &QTimer::stop);
    QObject::connect(reply, &QNetworkReply::uploadProgress, &connectTimer,
                     [&connectTimer](qint64 sent, qint64) {
                         if (sent > 0)
                             connectTimer.stop();
                     });
    QEventLoop loop;
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    connectTimer.start(opt_.connectTimeoutMs);
    if (!reply->isFinished())
        loop.exec();
    connectTimer.stop();

    resp.status =
        reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    resp.body = reply->readAll();
    resp.headers.clear();
    for (const auto &pair : reply->rawHeaderPairs())
        resp.headers[lowered(pair.first.toStdString())] =
            pair.second.toStdString();

    qCDebug(owlStore) << method << q(sreq.canonicalUri) << "status="
                      << resp.status << "ms=" << elapsed.elapsed();

    if (resp.status == 0) {
        if (connectTimedOut) {
            err.transport = TransportFailure::Timeout;
            err.message = "No response within " +
                          std::to_string(opt_.connectTimeoutMs) + " ms";
        } else {
            err.transport = transportFor(reply->error());
            err.message = reply->errorString().toStdString();
        }
        qCWarning(owlStore) << "request failed" << method
                            << q(sreq.canonicalUri) << q(err.message);
        return false;
    }
    if (resp.status >= 300) {
        err.httpStatus = resp.status;
        if (!s3xml::parseError(resp.body, err.code, err.message))
            err.message = reply->errorString().toStdString();
        return false;
    }
    return true;
}

bool S3ObjectStoreClient::putObject(const std::string &bucket,
                                    const std::string &key,
                                    const std::vector<char> &body,
                                    const std::string &contentType,
                                    std::string &etag, StoreError &err) {
    Response resp;
    Headers h;
    if (!contentType.empty())
        h["content-type"] = contentType;
    if (!send("PUT", bucket, key, {}, h, toBytes(body), resp, err))
        return false;
    etag = header(resp.headers, "etag");
    return true;
}

bool S3ObjectStoreClient::getObject(const std::string &bucket,
                                    const std::string &key,
                                    const std::optional<ByteRange> &range,
                                    std::vector<char> &out, StoreError &err) {
    Response resp;
    Headers h;
    if (range) {
        h["range"] = "bytes=" + std::to_string(range->first) + "-" +
                     std::to_string(range->last);
    }
    if (!send("GET", bucket, key, {}, h, QByteArray(), resp, err))
        return false;
    if (range && resp.status == 200) {
        // Server ignored the Range header and sent the whole object.
        out = toVector(resp.body.mid(static_cast<qsizetype>(range->first),
                                     static_cast<qsizetype>(range->length())));
        return true;
    }
    out = toVector(resp.body);
    return true;
}

bool S3ObjectStoreClient::headObject(const std::string &bucket,
                                     const std::string &key, ObjectInfo &info,
                                     StoreError &err) {
    Response resp;
    if (!send("HEAD", bucket, key, {}, {}, QByteArray(), resp, err)) {
        if (err.httpStatus == 404 && err.code != "NoSuchBucket")
            err.clear();
        return false;
    }
    info.key = key;
    info.size = std::stoull("0" + header(resp.headers, "content-length"));
    info.etag = header(resp.headers, "etag");
    info.contentType = header(resp.headers, "content-type");
    const QDateTime modified = QDateTime::fromString(
        q(header(resp.headers, "last-modified")), Qt::RFC2822Date);
    info.lastModified = modified.isValid()
                            ? static_cast<std::uint64_t>(modified.toSecsSinceEpoch())
                            : 0;
    return true;
}

bool S3ObjectStoreClient::createMultipartUpload(const std::string &bucket,
                                                const std::string &key,
                                                const std::string &contentType,
                                                std::string &uploadId,
                                                StoreError &err) {
    Response resp;
    Headers h;
    if (!contentType.empty())
        h["content-type"] = contentType;
    if (!send("POST", bucket, key, {{"uploads", ""}}, h, QByteArray(), resp,
              err))
        return false;
    if (!s3xml::parseUploadId(resp.body, uploadId)) {
        err.httpStatus = resp.status;
        err.code = "MalformedResponse";
        err.message = "Missing UploadId in CreateMultipartUpload response";
        return false;
    }
    return true;
}

bool S3ObjectStoreClient::uploadPart(const std::string &bucket,
                                     const std::string &key,
                                     const std::string &uploadId,
                                     int partNumber,
                                     const std::vector<char> &body,
                                     std::string &etag, StoreError &err) {
    Response resp;
    const Query query = {{"partNumber", std::to_string(partNumber)},
                         {"uploadId", uploadId}};
    if (!send("PUT", bucket, key, query, {}, toBytes(body), resp, err))
        return false;
    etag = header(resp.headers, "etag");
    if (etag.empty()) {
        err.httpStatus = resp.status;
        err.code = "MalformedResponse";
        err.message = "Missing ETag for part " + std::to_string(partNumber);
        return false;
    }
    return true;
}

bool S3ObjectStoreClient::completeMultipartUpload(
    const std::string &bucket, const std::string &key,
    const std::string &uploadId, const std::vector<CompletedPart> &parts,
    StoreError &err) {
    Response resp;
    Headers h;
    h["content-type"] = "application/xml";
    if (!send("POST", bucket, key, {{"uploadId", uploadId}}, h,
              s3xml::completeMultipartBody(parts), resp, err))
        return false;
    // A 200 response may still carry an error document.
    if (s3xml::parseError(resp.body, err.code, err.message)) {
        err.httpStatus = resp.status;
        return false;
    }
    return true;
}

bool S3ObjectStoreClient::abortMultipartUpload(const std::string &bucket,
                                               const std::string &key,
                                               const std::string &uploadId,
                                               StoreError &err) {
    Response resp;
    return send("DELETE", bucket, key, {{"uploadId", uploadId}}, {},
                QByteArray(), resp, err);
}

bool S3ObjectStoreClient::copyObject(const std::string &bucket,
                                     const std::string &sourceKey,
                                     const std::string &destKey,
                                     StoreError &err) {
    Response resp;
    Headers h;
    h["x-amz-copy-source"] = "/" + sigv4::uriEncode(bucket, true) + "/" +
                             sigv4::uriEncode(sourceKey, false);
    if (!send("PUT", bucket, destKey, {}, h, QByteArray(), resp, err))
        return false;
    if (s3xml::parseError(resp.body, err.code, err.message)) {
        err.httpStatus = resp.status;
        return false;
    }
    return true;
}

bool S3ObjectStoreClient::deleteObject(const std::string &bucket,
                                       const std::string &key,
                                       StoreError &err) {
    Response resp;
    return send("DELETE", bucket, key, {}, {}, QByteArray(), resp, err);
}

bool S3ObjectStoreClient::deleteObjects(const std::string &bucket,
                                        const std::vector<std::string> &keys,
                                        std::vector<std::string> &failedKeys,
                                        StoreError &err) {
    for (std::size_t start = 0; start < keys.size(); start += kDeleteBatchSize) {
        const std::size_t end = std::min(keys.size(), start + kDeleteBatchSize);
        const std::vector<std::string> batch(keys.begin() + start,
                                             keys.begin() + end);
        const QByteArray body = s3xml::deleteObjectsBody(batch);
        Headers h;
        h["content-type"] = "application/xml";
        h["content-md5"] =
            QCryptographicHash::hash(body, QCryptographicHash::Md5)
                .toBase64()
                .toStdString();
        Response resp;
        if (!send("POST", bucket, std::string(), {{"delete", ""}}, h, body,
                  resp, err))
            return false;
        const auto refused = s3xml::parseDeleteErrors(resp.body);
        failedKeys.insert(failedKeys.end(), refused.begin(), refused.end());
    }
    return true;
}

bool S3ObjectStoreClient::listObjects(
    const std::string &bucket, const std::string &prefix,
    const std::optional<std::string> &continuationToken, ListPage &page,
    StoreError &err) {
    Query query = {{"list-type", "2"}, {"prefix", prefix}};
    if (continuationToken)
        query.emplace_back("continuation-token", *continuationToken);
    Response resp;
    if (!send("GET", bucket, std::string(), query, {}, QByteArray(), resp, err))
        return false;
    if (!s3xml::parseListPage(resp.body, page)) {
        err.httpStatus = resp.status;
        err.code = "MalformedResponse";
        err.message = "Unparseable ListObjectsV2 response";
        return false;
    }
    return true;
}

} // namespace owlxfer
