// ConnectionResolver.cpp
//
// Turns what the user typed in the hostname field into the pieces the
// launch command needs. Does no network access; the host is only probed
// later by PlatformServices.

#include "ConnectionResolver.h"

#include <QDebug>
#include <QStringList>

bool ConnectionResolver::resolve(const QString &rawHostname,
                                 const QString &port,
                                 SessionMode mode,
                                 const QString &fallbackUser,
                                 ConnectionSpec *out,
                                 Error *err)
{
    clearError(err);

    const QString raw = rawHostname.trimmed();
    if (raw.isEmpty()) {
        setError(err, ErrorKind::Validation, "Please enter a hostname.", ErrorField::Hostname);
        return false;
    }

    ConnectionSpec spec;
    spec.mode = mode;

    if (raw.contains('@')) {
        const QStringList parts = raw.split('@');
        if (parts.size() != 2 || parts.at(0).isEmpty() || parts.at(1).isEmpty()) {
            setError(err, ErrorKind::Format, "Invalid hostname format.", ErrorField::Hostname);
            qWarning().noquote() << QString("[RESOLVE] invalid hostname '%1'").arg(raw);
            return false;
        }
        spec.title = raw;
        spec.user  = parts.at(0);
        spec.host  = parts.at(1);
    } else {
        spec.user  = fallbackUser;
        spec.host  = raw;
        spec.title = QString("%1@%2").arg(spec.user, spec.host);
    }

    if (mode == SessionMode::Telnet)
        spec.title = QString("telnet: %1").arg(spec.host);

    spec.port = port.trimmed();
    if (spec.port.isEmpty()) {
        setError(err, ErrorKind::Validation,
                 "No port specified: Please enter a port number.", ErrorField::Port);
        return false;
    }

    if (out) *out = spec;
    return true;
}

bool ConnectionResolver::resolve(const SessionProfile &profile,
                                 const QString &fallbackUser,
                                 ConnectionSpec *out,
                                 Error *err)
{
    ConnectionSpec spec;
    if (!resolve(profile.hostname, profile.port, profile.mode, fallbackUser, &spec, err))
        return false;

    if (profile.mode == SessionMode::Ssh)
        spec.keyPath = profile.effectiveKeyPath();

    if (out) *out = spec;
    return true;
}

QString ConnectionResolver::localUserName()
{
    const QString user = qEnvironmentVariable("USER");
    if (!user.isEmpty())
        return user;
    return qEnvironmentVariable("LOGNAME");
}

bool ConnectionResolver::parsePort(const QString &text, quint16 *out, Error *err)
{
    clearError(err);

    bool ok = false;
    const int n = text.trimmed().toInt(&ok);
    if (!ok || n < 1 || n > 65535) {
        setError(err, ErrorKind::Validation,
                 QString("No port specified: invalid port '%1'").arg(text), ErrorField::Port);
        return false;
    }

    if (out) *out = quint16(n);
    return true;
}
