#pragma once
#include <QString>

namespace Logger {
    // Install the Qt message handler and open <AppLocalData>/logs/<appName>.log
    // (or overridePath if not empty).
    void install(const QString& appName, const QString& overridePath = QString());

    // 0=Errors only, 1=Normal, 2=Debug
    void setLogLevel(int level);
    int  logLevel();

    // Also copy records to stderr (CLI --verbose).
    void setEchoToStderr(bool on);

    QString logFilePath();

    // Flush and close the file; the handler falls back to stderr afterwards.
    void shutdown();
}
