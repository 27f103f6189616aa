// Logging categories shared by the engine and the backends.
#pragma once
#include <QLoggingCategory>

#include <string>

Q_DECLARE_LOGGING_CATEGORY(owlEngine)
Q_DECLARE_LOGGING_CATEGORY(owlStore)

namespace owlxfer {

// What may appear in log lines. Read from OWLXFER_ENV and
// OWLXFER_LOG_SENSITIVE; credentials are shown in full only when the
// environment is a development one and the flag is switched on.
// Secret keys are never logged.
struct LogPolicy {
    bool devEnvironment = false;
    bool sensitive = false;

    static LogPolicy fromEnvironment();

    bool showCredentials() const { return devEnvironment && sensitive; }
    // Access key id as it may be logged: first four characters otherwise.
    std::string keyId(const std::string &id) const;
};

} // namespace owlxfer
