// AppConfig.cpp
#include "AppConfig.h"

#include <QDebug>
#include <QDir>
#include <QSettings>

namespace AppConfig {

QString defaultSessionsFilePath()
{
    return QDir(QDir::homePath()).filePath(".spackle_2.0");
}

QString sessionsFilePath()
{
    QSettings s;
    const QString p = s.value("sessions/filePath", "").toString().trimmed();
    return p.isEmpty() ? defaultSessionsFilePath() : QDir::cleanPath(p);
}

int logLevel()
{
    QSettings s;
    return qBound(0, s.value("logging/level", 1).toInt(), 2);
}

QString logFilePath()
{
    QSettings s;
    return s.value("logging/filePath", "").toString().trimmed();
}

int probeTimeoutSeconds()
{
    QSettings s;
    const int t = s.value("launch/probeTimeoutSeconds", 5).toInt();
    return t > 0 ? t : 5;
}

bool skipProbe()
{
    QSettings s;
    return s.value("launch/skipProbe", false).toBool();
}

HostStrategy hostStrategy()
{
    QSettings s;

    HostStrategy h;
    h.kind = platformTerminalHost();

    const QString kind = s.value("launch/terminalHost", "auto").toString();
    if (kind.trimmed().toLower() != "auto" && !terminalHostFromString(kind, &h.kind)) {
        qWarning().noquote() << QString("[CONFIG] unknown launch/terminalHost '%1', using %2")
                                .arg(kind, terminalHostToString(h.kind));
    }

    h.terminalPath = s.value("launch/terminalPath", "").toString().trimmed();
    return h;
}

} // namespace AppConfig
