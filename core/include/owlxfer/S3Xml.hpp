// Request bodies and response parsing for the S3 XML dialect.
#pragma once
#include "StoreTypes.hpp"

#include <QByteArray>
#include <string>
#include <vector>

namespace owlxfer {
namespace s3xml {

// <Error><Code/><Message/></Error>. Returns false if the body is not one.
bool parseError(const QByteArray &body, std::string &code,
                std::string &message);

// InitiateMultipartUploadResult/UploadId
bool parseUploadId(const QByteArray &body, std::string &uploadId);

// ListBucketResult (ListObjectsV2)
bool parseListPage(const QByteArray &body, ListPage &page);

// DeleteResult: keys reported under <Error>.
std::vector<std::string> parseDeleteErrors(const QByteArray &body);

QByteArray completeMultipartBody(const std::vector<CompletedPart> &parts);
QByteArray deleteObjectsBody(const std::vector<std::string> &keys);

} // namespace s3xml
} // namespace owlxfer
