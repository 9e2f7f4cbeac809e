#pragma once

#include <QColor>
#include <QString>
#include <QStringList>

#include "ConnectionResolver.h"
#include "LaunchSpec.h"

/*
    LaunchSpecBuilder
    -----------------
    Pure function from (ConnectionSpec, TerminalAppearance, HostStrategy)
    to a LaunchSpec. Nothing is executed here.

    Inner command (same for both hosts):
        ssh    : <ssh> -p <port> [-i <keypath>] <user>@<host>
        telnet : <telnet> <host> <port>

    Native host   : osascript -e <AppleScript driving Terminal.app>
    Emulator host : <xterm> -T <title> -geometry CxR -sl N -fa mono-S
                            -fg rgb:RR/GG/BB -bg rgb:RR/GG/BB -e <argv...>

    Hostnames/ports are expected to be validated by ConnectionResolver and
    key paths to come from a file picker; no shell quoting is applied.
*/

class LaunchSpecBuilder
{
public:
    static LaunchSpec build(const ConnectionSpec &conn,
                            const TerminalAppearance &appearance,
                            const HostStrategy &host,
                            const ClientPaths &clients = ClientPaths());

    // Remote-access client argv (program first).
    static QStringList remoteArgv(const ConnectionSpec &conn, const ClientPaths &clients);

    // "80x24" -> 80, 24. Invalid input yields 80x24 and returns false.
    static bool parseGeometry(const QString &geometry, int *columns, int *rows);

    // Escape for an AppleScript string literal: \ -> \\, " -> \"
    static QString escapeAppleScript(const QString &s);

    // "{r*257, g*257, b*257}"
    static QString appleScriptColor(const QColor &c);

    // "rgb:RR/GG/BB"
    static QString xtermColor(const QColor &c);

    static QString nativeScript(const LaunchSpec &spec);
};
