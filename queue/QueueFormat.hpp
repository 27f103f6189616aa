// Human-readable sizes, speeds and ETAs for progress output.
#pragma once
#include <QChar>
#include <QString>

namespace owlqueue {

inline QString formatBytes(quint64 bytes) {
    static const char *units[] = {"B", "KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }
    const int precision = (value < 10.0 && unit > 0) ? 1 : 0;
    return QString::number(value, 'f', precision) + " " + units[unit];
}

inline QString formatSpeed(double bytesPerSecond) {
    if (bytesPerSecond <= 0.0)
        return QStringLiteral("-");
    return formatBytes(static_cast<quint64>(bytesPerSecond)) + "/s";
}

inline QString formatEta(int sec) {
    if (sec < 0)
        return QStringLiteral("-");
    const int h = sec / 3600;
    const int m = (sec % 3600) / 60;
    const int s = sec % 60;
    if (h > 0)
        return QString("%1h %2m").arg(h).arg(m, 2, 10, QChar('0'));
    if (m > 0)
        return QString("%1m %2s").arg(m).arg(s, 2, 10, QChar('0'));
    return QString("%1s").arg(s);
}

} // namespace owlqueue
