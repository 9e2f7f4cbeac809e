// PlatformServices.cpp
//
// Qt implementation of the OS boundary.
//
// Design notes:
// - All calls are synchronous; the probe (DNS + connect) is bounded by its
//   timeout. The DNS step spins a local QEventLoop, so a QCoreApplication
//   must exist.
// - Spawned terminals are detached: no exit status is collected.
// - Never run anything through a shell: program + argv go straight to exec.

#include "PlatformServices.h"

#include <QAbstractSocket>
#include <QDebug>
#include <QElapsedTimer>
#include <QEventLoop>
#include <QHostAddress>
#include <QHostInfo>
#include <QProcess>
#include <QStandardPaths>
#include <QStringList>
#include <QTcpSocket>
#include <QTimer>

bool QtPlatformServices::locateExecutable(const QString &name, QString *path, Error *err)
{
    clearError(err);

    QString found = QStandardPaths::findExecutable(name);

#if defined(Q_OS_MACOS)
    // XQuartz installs outside the default PATH.
    if (found.isEmpty())
        found = QStandardPaths::findExecutable(name, QStringList() << "/usr/X11/bin");
#endif

    if (found.isEmpty()) {
        setError(err, ErrorKind::NotFound, QString("%1 not found on the system.").arg(name));
        qWarning().noquote() << QString("[PLATFORM] %1 not found").arg(name);
        return false;
    }

    qInfo().noquote() << QString("[PLATFORM] %1 -> %2").arg(name, found);
    if (path) *path = found;
    return true;
}

// Resolve within timeoutMs. Literal addresses skip the resolver.
// Sets *timedOut and returns false if the lookup did not finish in time.
static bool lookupWithin(const QString &host, int timeoutMs, QHostInfo *out, bool *timedOut)
{
    *timedOut = false;

    QHostAddress literal;
    if (literal.setAddress(host)) {
        out->setAddresses({ literal });
        out->setError(QHostInfo::NoError);
        return true;
    }

    QEventLoop loop;
    bool done = false;
    const int id = QHostInfo::lookupHost(host, &loop, [&](const QHostInfo &info) {
        *out = info;
        done = true;
        loop.quit();
    });

    QTimer::singleShot(timeoutMs, &loop, &QEventLoop::quit);
    if (!done)
        loop.exec();

    if (!done) {
        QHostInfo::abortHostLookup(id);
        *timedOut = true;
        return false;
    }
    return true;
}

bool QtPlatformServices::checkTcpReachable(const QString &host, quint16 port,
                                           int timeoutSeconds, Error *err)
{
    clearError(err);

    const int timeoutMs = qMax(1, timeoutSeconds) * 1000;
    QElapsedTimer clock;
    clock.start();

    // DNS first so an unknown host is reported as such, not as a refusal.
    QHostInfo info;
    bool lookupTimedOut = false;
    if (!lookupWithin(host, timeoutMs, &info, &lookupTimedOut)) {
        setError(err, ErrorKind::Timeout,
                 QString("IOException: lookup of %1 timed out").arg(host));
        qWarning().noquote() << QString("[PROBE] DNS lookup for %1 timed out after %2 ms")
                                .arg(host).arg(timeoutMs);
        return false;
    }

    if (info.error() != QHostInfo::NoError || info.addresses().isEmpty()) {
        setError(err, ErrorKind::Unreachable, QString("Unknown Host: %1").arg(host));
        qWarning().noquote() << QString("[PROBE] DNS lookup failed for %1: %2")
                                .arg(host, info.errorString());
        return false;
    }

    // Every address in resolver order, sharing one deadline: a name that
    // resolves to ::1 first must still reach a service bound to 127.0.0.1.
    bool timedOut = false;
    QString lastError;
    for (const QHostAddress &addr : info.addresses()) {
        const qint64 left = timeoutMs - clock.elapsed();
        if (left <= 0) {
            timedOut = true;
            break;
        }

        QTcpSocket sock;
        sock.connectToHost(addr, port);
        if (sock.waitForConnected(int(left))) {
            sock.disconnectFromHost();
            qInfo().noquote() << QString("[PROBE] %1:%2 reachable via %3")
                                 .arg(host).arg(port).arg(addr.toString());
            return true;
        }

        timedOut  = sock.error() == QAbstractSocket::SocketTimeoutError;
        lastError = sock.errorString();
        qDebug().noquote() << QString("[PROBE] %1 port %2: %3")
                              .arg(addr.toString()).arg(port).arg(lastError);
        sock.abort();
    }

    setError(err, timedOut ? ErrorKind::Timeout : ErrorKind::Unreachable,
             timedOut ? QString("IOException: connect to %1:%2 timed out").arg(host).arg(port)
                      : QString("IOException: %1").arg(lastError));
    qWarning().noquote() << QString("[PROBE] %1:%2 FAILED: %3")
                            .arg(host).arg(port).arg(timedOut ? QString("timeout") : lastError);
    return false;
}

bool QtPlatformServices::spawnProcess(const LaunchSpec &spec, Error *err)
{
    clearError(err);

    QProcess proc;
    proc.setProgram(spec.program);
    proc.setArguments(spec.arguments);
    proc.setStandardOutputFile(QProcess::nullDevice());
    proc.setStandardErrorFile(QProcess::nullDevice());

    qint64 pid = 0;
    if (!proc.startDetached(&pid)) {
        setError(err, ErrorKind::Io, QString("IOException: could not start %1").arg(spec.program));
        qWarning().noquote() << QString("[LAUNCH] start FAILED: %1").arg(spec.program);
        return false;
    }

    qInfo().noquote() << QString("[LAUNCH] started %1 (pid %2) for %3")
                         .arg(spec.program).arg(pid).arg(spec.title);
    return true;
}
