#pragma once

#include <QString>
#include <QtGlobal>

#include "SessionProfile.h"
#include "SpackleError.h"

// Result of resolving the hostname field for a launch.
struct ConnectionSpec {
    SessionMode mode = SessionMode::Ssh;
    QString user;
    QString host;
    QString port;
    QString title;      // window title shown by the terminal
    QString keyPath;    // ssh only; empty = client default
};

class ConnectionResolver
{
public:
    /*
        Resolve the raw hostname field.

        - "user@host"  -> user/host split, title = raw text verbatim
        - "host"       -> user = fallbackUser, title = "user@host"
        - telnet mode  -> title = "telnet: host" regardless of the above

        Errors:
        - ErrorKind::Validation: empty hostname or empty port
        - ErrorKind::Format: '@' present but not exactly two non-empty parts
    */
    static bool resolve(const QString &rawHostname,
                        const QString &port,
                        SessionMode mode,
                        const QString &fallbackUser,
                        ConnectionSpec *out,
                        Error *err = nullptr);

    // Convenience overload: hostname/port/mode/key taken from a session profile.
    static bool resolve(const SessionProfile &profile,
                        const QString &fallbackUser,
                        ConnectionSpec *out,
                        Error *err = nullptr);

    // First non-empty of $USER, $LOGNAME; empty string otherwise.
    static QString localUserName();

    // Numeric port check (1..65535) done before probing the host.
    static bool parsePort(const QString &text, quint16 *out, Error *err = nullptr);
};
