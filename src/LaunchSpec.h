#pragma once

#include <QColor>
#include <QString>
#include <QStringList>

#include "SessionProfile.h"

// Terminal host family that will run the remote-access client.
enum class TerminalHost {
    Native,    // Terminal.app driven through osascript
    Emulator   // X terminal emulator (xterm) with explicit flags
};

static inline QString terminalHostToString(TerminalHost h)
{
    switch (h) {
        case TerminalHost::Native:   return "native";
        case TerminalHost::Emulator: return "emulator";
    }
    return "emulator";
}

static inline bool terminalHostFromString(const QString &s, TerminalHost *out)
{
    const QString v = s.trimmed().toLower();
    if (v == "native")   { if (out) *out = TerminalHost::Native;   return true; }
    if (v == "emulator") { if (out) *out = TerminalHost::Emulator; return true; }
    return false;
}

// Native on macOS, emulator everywhere else.
static inline TerminalHost platformTerminalHost()
{
#if defined(Q_OS_MACOS)
    return TerminalHost::Native;
#else
    return TerminalHost::Emulator;
#endif
}

// Which host strategy to use, and the terminal program for it.
struct HostStrategy {
    TerminalHost kind = TerminalHost::Emulator;
    QString terminalPath;   // xterm path; osascript for Native (defaults to "osascript")
};

// Resolved client binaries (from PlatformServices::locateExecutable).
struct ClientPaths {
    QString ssh    = "ssh";
    QString telnet = "telnet";
};

// Appearance settings carried from the session profile.
struct TerminalAppearance {
    QColor  foreground = QColor(0, 0, 0);
    QColor  background = QColor(255, 255, 255);
    QString geometry   = "80x24";
    int     scrollback = SessionDefaults::kScrollback;
    int     fontSize   = SessionDefaults::kFontSize;

    static TerminalAppearance fromProfile(const SessionProfile &p)
    {
        TerminalAppearance a;
        a.foreground = p.foreground;
        a.background = p.background;
        a.geometry   = p.geometry;
        a.scrollback = p.scrollback;
        a.fontSize   = p.fontSize;
        return a;
    }
};

// Everything needed to start one terminal with a remote-access client in it.
struct LaunchSpec {
    TerminalHost host   = TerminalHost::Emulator;
    SessionMode  client = SessionMode::Ssh;

    QString user;
    QString hostname;
    QString port;
    QString keyPath;        // ssh only
    QString title;

    int     columns    = 80;
    int     rows       = 24;
    int     fontSize   = SessionDefaults::kFontSize;
    int     scrollback = SessionDefaults::kScrollback;   // emulator only
    QColor  foreground;
    QColor  background;

    // Remote-access invocation, as one display string and as argv.
    QString     remoteCommand;
    QStringList remoteArgv;

    // What the spawner executes. For the emulator host the client follows
    // "-e" as separate entries (remoteArgv), not as the remoteCommand string.
    QString     program;
    QStringList arguments;
};
