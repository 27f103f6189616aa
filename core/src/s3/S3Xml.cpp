#include "owlxfer/S3Xml.hpp"

#include <QDateTime>
#include <QXmlStreamReader>
#include <QXmlStreamWriter>

namespace owlxfer {
namespace s3xml {

bool parseError(const QByteArray &body, std::string &code,
                std::string &message) {
    QXmlStreamReader xml(body);
    bool inError = false;
    while (!xml.atEnd()) {
        xml.readNext();
        if (!xml.isStartElement())
            continue;
        const auto name = xml.name();
        if (name == QLatin1String("Error")) {
            inError = true;
        } else if (inError && name == QLatin1String("Code")) {
            code = xml.readElementText().toStdString();
        } else if (inError && name == QLatin1String("Message")) {
            message = xml.readElementText().toStdString();
        }
    }
    return inError && !code.empty();
}

bool parseUploadId(const QByteArray &body, std::string &uploadId) {
    QXmlStreamReader xml(body);
    while (!xml.atEnd()) {
        xml.readNext();
        if (xml.isStartElement() && xml.name() == QLatin1String("UploadId")) {
            uploadId = xml.readElementText().toStdString();
            return !uploadId.empty();
        }
    }
    return false;
}

bool parseListPage(const QByteArray &body, ListPage &page) {
    page.objects.clear();
    page.nextToken.reset();
    QXmlStreamReader xml(body);
    bool truncated = false;
    bool sawRoot = false;
    std::string nextToken;
    ObjectInfo current;
    bool inContents = false;
    while (!xml.atEnd()) {
        xml.readNext();
        if (xml.isStartElement()) {
            const auto name = xml.name();
            if (name == QLatin1String("ListBucketResult")) {
                sawRoot = true;
            } else if (name == QLatin1String("Contents")) {
                inContents = true;
                current = ObjectInfo{};
            } else if (inContents && name == QLatin1String("Key")) {
                current.key = xml.readElementText().toStdString();
            } else if (inContents && name == QLatin1String("Size")) {
                current.size = xml.readElementText().toULongLong();
            } else if (inContents && name == QLatin1String("ETag")) {
                current.etag = xml.readElementText().toStdString();
            } else if (inContents && name == QLatin1String("LastModified")) {
                const QDateTime dt =
                    QDateTime::fromString(xml.readElementText(), Qt::ISODateWithMs);
                if (dt.isValid())
                    current.lastModified =
                        static_cast<std::uint64_t>(dt.toSecsSinceEpoch());
            } else if (name == QLatin1String("IsTruncated")) {
                truncated = xml.readElementText() == QLatin1String("true");
            } else if (name == QLatin1String("NextContinuationToken")) {
                nextToken = xml.readElementText().toStdString();
            }
        } else if (xml.isEndElement() &&
                   xml.name() == QLatin1String("Contents")) {
            inContents = false;
            page.objects.push_back(current);
        }
    }
    if (xml.hasError() || !sawRoot)
        return false;
    if (truncated && !nextToken.empty())
        page.nextToken = nextToken;
    return true;
}

std::vector<std::string> parseDeleteErrors(const QByteArray &body) {
    std::vector<std::string> keys;
    QXmlStreamReader xml(body);
    bool inError = false;
    while (!xml.atEnd()) {
        xml.readNext();
        if (xml.isStartElement()) {
            if (xml.name() == QLatin1String("Error"))
                inError = true;
            else if (inError && xml.name() == QLatin1String("Key"))
                keys.push_back(xml.readElementText().toStdString());
        } else if (xml.isEndElement() && xml.name() == QLatin1String("Error")) {
            inError = false;
        }
    }
    return keys;
}

QByteArray completeMultipartBody(const std::vector<CompletedPart> &parts) {
    QByteArray out;
    QXmlStreamWriter xml(&out);
    xml.writeStartDocument();
    xml.writeStartElement(QStringLiteral("CompleteMultipartUpload"));
    for (const auto &p : parts) {
        xml.writeStartElement(QStringLiteral("Part"));
        xml.writeTextElement(QStringLiteral("PartNumber"),
                             QString::number(p.partNumber));
        xml.writeTextElement(QStringLiteral("ETag"),
                             QString::fromStdString(p.etag));
        xml.writeEndElement();
    }
    xml.writeEndElement();
    xml.writeEndDocument();
    return out;
}

QByteArray deleteObjectsBody(const std::vector<std::string> &keys) {
    QByteArray out;
    QXmlStreamWriter xml(&out);
    xml.writeStartDocument();
    xml.writeStartElement(QStringLiteral("Delete"));
    xml.writeTextElement(QStringLiteral("Quiet"), QStringLiteral("true"));
    for (const auto &k : keys) {
        xml.writeStartElement(QStringLiteral("Object"));
        xml.writeTextElement(QStringLiteral("Key"), QString::fromStdString(k));
        xml.writeEndElement();
    }
    xml.writeEndElement();
    xml.writeEndDocument();
    return out;
}

} // namespace s3xml
} // namespace owlxfer
