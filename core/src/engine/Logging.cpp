#include "owlxfer/Logging.hpp"

#include <QString>
#include <QStringList>
#include <QtGlobal>

Q_LOGGING_CATEGORY(owlEngine, "owlxfer.engine")
Q_LOGGING_CATEGORY(owlStore, "owlxfer.store")

namespace owlxfer {

namespace {

QString envValue(const char *name) {
    return qEnvironmentVariable(name).trimmed().toLower();
}

} // namespace

LogPolicy LogPolicy::fromEnvironment() {
    static const QStringList devNames = {QStringLiteral("dev"),
                                         QStringLiteral("development"),
                                         QStringLiteral("local"),
                                         QStringLiteral("debug")};
    static const QStringList onValues = {QStringLiteral("1"),
                                         QStringLiteral("true"),
                                         QStringLiteral("yes"),
                                         QStringLiteral("on")};
    LogPolicy p;
    p.devEnvironment = devNames.contains(envValue("OWLXFER_ENV"));
    p.sensitive = onValues.contains(envValue("OWLXFER_LOG_SENSITIVE"));
    return p;
}

std::string LogPolicy::keyId(const std::string &id) const {
    if (showCredentials())
        return id;
    if (id.size() <= 4)
        return "****";
    return id.substr(0, 4) + "****";
}

} // namespace owlxfer
