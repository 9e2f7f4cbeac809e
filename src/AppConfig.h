#pragma once

#include <QString>

#include "LaunchSpec.h"

// Application settings stored through QSettings (organization/application
// names set in main.cpp). Session profiles are NOT kept here; they live in
// the legacy properties file whose path this returns.
//
// Keys:
//   sessions/filePath            default ~/.spackle_2.0
//   logging/level                0..2, default 1
//   logging/filePath             default empty (AppLocalData/logs)
//   launch/probeTimeoutSeconds   default 5
//   launch/terminalHost          auto | native | emulator
//   launch/terminalPath          default empty (xterm on PATH)
//   launch/skipProbe             default false
namespace AppConfig {
    QString defaultSessionsFilePath();

    QString sessionsFilePath();
    int     logLevel();
    QString logFilePath();
    int     probeTimeoutSeconds();
    bool    skipProbe();

    // "auto" resolves to the platform's host family.
    HostStrategy hostStrategy();
}
