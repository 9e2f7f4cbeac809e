// LaunchController.cpp
#include "LaunchController.h"

#include "LaunchSpecBuilder.h"

#include <QDebug>

LaunchController::LaunchController(PlatformServices &platform, const Options &options)
    : m_platform(platform)
    , m_options(options)
{
}

bool LaunchController::locateClients(Error *err)
{
    clearError(err);

    Error sshErr;
    QString path;
    m_haveSsh = m_platform.locateExecutable("ssh", &path, &sshErr);
    if (m_haveSsh)
        m_clients.ssh = path;

    // Telnet is optional (removed from modern macOS).
    m_haveTelnet = m_platform.locateExecutable("telnet", &path, nullptr);
    if (m_haveTelnet)
        m_clients.telnet = path;

    Error termErr;
    m_haveTerminal = true;
    if (m_options.host.kind == TerminalHost::Emulator) {
        const QString term = m_options.host.terminalPath.isEmpty()
                                 ? QStringLiteral("xterm")
                                 : m_options.host.terminalPath;
        m_haveTerminal = m_platform.locateExecutable(term, &path, &termErr);
        if (m_haveTerminal)
            m_options.host.terminalPath = path;
    }

    if (!m_haveTerminal) {
        setError(err, ErrorKind::NotFound, termErr.message);
        return false;
    }
    if (!m_haveSsh) {
        setError(err, ErrorKind::NotFound, sshErr.message);
        return false;
    }
    return true;
}

bool LaunchController::clientAvailable(SessionMode mode) const
{
    return mode == SessionMode::Telnet ? m_haveTelnet : m_haveSsh;
}

bool LaunchController::prepare(const SessionProfile &profile,
                               const QString &fallbackUser,
                               LaunchSpec *out,
                               Error *err) const
{
    clearError(err);

    ConnectionSpec conn;
    if (!ConnectionResolver::resolve(profile, fallbackUser, &conn, err))
        return false;

    const LaunchSpec spec = LaunchSpecBuilder::build(conn,
                                                     TerminalAppearance::fromProfile(profile),
                                                     m_options.host,
                                                     m_clients);
    if (out) *out = spec;
    return true;
}

bool LaunchController::launch(const SessionProfile &profile,
                              const QString &fallbackUser,
                              LaunchSpec *out,
                              Error *err)
{
    clearError(err);

    if (!m_haveTerminal) {
        const QString term = m_options.host.terminalPath.isEmpty()
                                 ? QStringLiteral("xterm")
                                 : m_options.host.terminalPath;
        setError(err, ErrorKind::NotFound, QString("%1 not found on the system.").arg(term));
        return false;
    }

    if (!clientAvailable(profile.mode)) {
        setError(err, ErrorKind::NotFound,
                 QString("%1 not found on the system.")
                     .arg(profile.mode == SessionMode::Telnet ? "Telnet" : "SSH"));
        return false;
    }

    LaunchSpec spec;
    if (!prepare(profile, fallbackUser, &spec, err))
        return false;
    if (out) *out = spec;

    quint16 port = 0;
    if (!ConnectionResolver::parsePort(spec.port, &port, err))
        return false;

    if (!m_options.skipProbe) {
        if (!m_platform.checkTcpReachable(spec.hostname, port,
                                          m_options.probeTimeoutSeconds, err)) {
            qWarning().noquote() << QString("[LAUNCH] aborted, %1:%2 not reachable")
                                    .arg(spec.hostname).arg(port);
            return false;
        }
    }

    qInfo().noquote() << QString("[LAUNCH] opening '%1' via %2")
                         .arg(spec.title, terminalHostToString(spec.host));
    return m_platform.spawnProcess(spec, err);
}
