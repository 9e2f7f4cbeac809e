#pragma once

#include <QString>

#include "ConnectionResolver.h"
#include "LaunchSpec.h"
#include "PlatformServices.h"
#include "SessionProfile.h"
#include "SpackleError.h"

/*
    LaunchController
    ----------------
    The "Open" flow:

        SessionProfile
            -> ConnectionResolver::resolve()      (validate hostname/port)
            -> PlatformServices::checkTcpReachable (abort on failure)
            -> LaunchSpecBuilder::build()
            -> PlatformServices::spawnProcess()    (detached)

    Binary discovery happens once in locateClients(); a missing ssh or
    terminal is reported but does not stop the controller from being used
    for the protocols that are available.
*/

class LaunchController
{
public:
    struct Options {
        HostStrategy host;
        int  probeTimeoutSeconds = 5;
        bool skipProbe = false;
    };

    LaunchController(PlatformServices &platform, const Options &options);

    /*
        Locate ssh, telnet and (for the emulator host) the terminal binary.
        Returns false with ErrorKind::NotFound if ssh or the terminal is
        missing. A missing telnet is not an error.
    */
    bool locateClients(Error *err = nullptr);

    bool clientAvailable(SessionMode mode) const;
    bool terminalAvailable() const { return m_haveTerminal; }
    const ClientPaths &clients() const { return m_clients; }
    const Options &options() const { return m_options; }

    // Resolve + build only. Used by launch() and for dry runs.
    bool prepare(const SessionProfile &profile,
                 const QString &fallbackUser,
                 LaunchSpec *out,
                 Error *err = nullptr) const;

    // prepare(), then probe and spawn. *out receives the spec when not null.
    bool launch(const SessionProfile &profile,
                const QString &fallbackUser,
                LaunchSpec *out = nullptr,
                Error *err = nullptr);

private:
    PlatformServices &m_platform;
    Options           m_options;
    ClientPaths       m_clients;
    bool              m_haveSsh = false;
    bool              m_haveTelnet = false;
    bool              m_haveTerminal = false;
};
