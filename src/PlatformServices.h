#pragma once

#include <QString>
#include <QtGlobal>

#include "LaunchSpec.h"
#include "SpackleError.h"

// Boundary to the operating system: binary lookup, port probe, process spawn.
// LaunchController only talks to this interface, so tests substitute a fake.
class PlatformServices
{
public:
    virtual ~PlatformServices() = default;

    // ErrorKind::NotFound if the binary is not on PATH.
    virtual bool locateExecutable(const QString &name, QString *path, Error *err = nullptr) = 0;

    // Blocks for at most timeoutSeconds.
    // ErrorKind::Unreachable (unknown host / refused) or ErrorKind::Timeout.
    virtual bool checkTcpReachable(const QString &host, quint16 port,
                                   int timeoutSeconds, Error *err = nullptr) = 0;

    // Fire and forget. Only a failure to start is reported (ErrorKind::Io).
    virtual bool spawnProcess(const LaunchSpec &spec, Error *err = nullptr) = 0;
};

// QStandardPaths / QHostInfo + QTcpSocket / QProcess::startDetached
class QtPlatformServices : public PlatformServices
{
public:
    bool locateExecutable(const QString &name, QString *path, Error *err = nullptr) override;
    bool checkTcpReachable(const QString &host, quint16 port,
                           int timeoutSeconds, Error *err = nullptr) override;
    bool spawnProcess(const LaunchSpec &spec, Error *err = nullptr) override;
};
