// LaunchSpecBuilder.cpp
#include "LaunchSpecBuilder.h"

#include <QDebug>

static const char *kMonoFamily = "mono";

QStringList LaunchSpecBuilder::remoteArgv(const ConnectionSpec &conn, const ClientPaths &clients)
{
    QStringList argv;

    if (conn.mode == SessionMode::Telnet) {
        argv << clients.telnet << conn.host << conn.port;
        return argv;
    }

    argv << clients.ssh << "-p" << conn.port;
    if (!conn.keyPath.isEmpty())
        argv << "-i" << conn.keyPath;
    argv << QString("%1@%2").arg(conn.user, conn.host);
    return argv;
}

bool LaunchSpecBuilder::parseGeometry(const QString &geometry, int *columns, int *rows)
{
    int c = 80, r = 24;
    bool valid = false;

    const QStringList parts = geometry.trimmed().split('x');
    if (parts.size() == 2) {
        bool okC = false, okR = false;
        const int pc = parts.at(0).toInt(&okC);
        const int pr = parts.at(1).toInt(&okR);
        if (okC && okR && pc > 0 && pr > 0) {
            c = pc;
            r = pr;
            valid = true;
        }
    }

    if (columns) *columns = c;
    if (rows)    *rows = r;
    return valid;
}

QString LaunchSpecBuilder::escapeAppleScript(const QString &s)
{
    QString out = s;
    out.replace(QLatin1String("\\"), QLatin1String("\\\\"));
    out.replace(QLatin1String("\""), QLatin1String("\\\""));
    return out;
}

QString LaunchSpecBuilder::appleScriptColor(const QColor &c)
{
    // Terminal.app wants 16 bits per channel; 0xFF * 257 == 0xFFFF.
    return QString("{%1, %2, %3}")
        .arg(c.red() * 257)
        .arg(c.green() * 257)
        .arg(c.blue() * 257);
}

QString LaunchSpecBuilder::xtermColor(const QColor &c)
{
    return QString("rgb:%1/%2/%3")
        .arg(c.red(),   2, 16, QChar('0'))
        .arg(c.green(), 2, 16, QChar('0'))
        .arg(c.blue(),  2, 16, QChar('0'));
}

QString LaunchSpecBuilder::nativeScript(const LaunchSpec &spec)
{
    QStringList lines;
    lines << "tell application \"Terminal\""
          << "    activate"
          << QString("    do script \"%1\"").arg(escapeAppleScript(spec.remoteCommand))
          << "    set targetWindow to front window"
          << QString("    set custom title of targetWindow to \"%1\"").arg(escapeAppleScript(spec.title))
          << QString("    set number of columns of targetWindow to %1").arg(spec.columns)
          << QString("    set number of rows of targetWindow to %1").arg(spec.rows)
          << QString("    set background color of current settings of selected tab of targetWindow to %1")
                 .arg(appleScriptColor(spec.background))
          << QString("    set normal text color of current settings of selected tab of targetWindow to %1")
                 .arg(appleScriptColor(spec.foreground))
          << QString("    set font size of current settings of selected tab of targetWindow to %1")
                 .arg(spec.fontSize)
          << "end tell";
    return lines.join('\n') + '\n';
}

LaunchSpec LaunchSpecBuilder::build(const ConnectionSpec &conn,
                                    const TerminalAppearance &appearance,
                                    const HostStrategy &host,
                                    const ClientPaths &clients)
{
    LaunchSpec spec;
    spec.host       = host.kind;
    spec.client     = conn.mode;
    spec.user       = conn.user;
    spec.hostname   = conn.host;
    spec.port       = conn.port;
    spec.keyPath    = (conn.mode == SessionMode::Ssh) ? conn.keyPath : QString();
    spec.title      = conn.title;
    spec.fontSize   = appearance.fontSize;
    spec.scrollback = appearance.scrollback;
    spec.foreground = appearance.foreground;
    spec.background = appearance.background;

    const QString geometry = normalizeGeometry(appearance.geometry);
    if (geometry != appearance.geometry.trimmed()) {
        qWarning().noquote() << QString("[LAUNCH] unsupported geometry '%1', using %2")
                                .arg(appearance.geometry, geometry);
    }
    parseGeometry(geometry, &spec.columns, &spec.rows);

    ConnectionSpec inner = conn;
    inner.keyPath = spec.keyPath;
    spec.remoteArgv    = remoteArgv(inner, clients);
    spec.remoteCommand = spec.remoteArgv.join(' ');

    switch (host.kind) {
        case TerminalHost::Native:
            spec.program = host.terminalPath.isEmpty() ? QStringLiteral("osascript")
                                                       : host.terminalPath;
            spec.arguments << "-e" << nativeScript(spec);
            break;

        case TerminalHost::Emulator:
            spec.program = host.terminalPath.isEmpty() ? QStringLiteral("xterm")
                                                       : host.terminalPath;
            spec.arguments << "-T" << spec.title
                           << "-geometry" << QString("%1x%2").arg(spec.columns).arg(spec.rows)
                           << "-sl" << QString::number(spec.scrollback)
                           << "-fa" << QString("%1-%2").arg(kMonoFamily).arg(spec.fontSize)
                           << "-fg" << xtermColor(spec.foreground)
                           << "-bg" << xtermColor(spec.background)
                           << "-e";
            spec.arguments << spec.remoteArgv;
            break;
    }

    qDebug().noquote() << QString("[LAUNCH] built %1 launch: %2")
                          .arg(terminalHostToString(spec.host), spec.remoteCommand);
    return spec;
}
