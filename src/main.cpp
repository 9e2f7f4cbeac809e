/*
 * Spackle — SSH/Telnet session launcher for Mac and Linux
 *
 * Copyright (c) 2026 TCM
 *
 * Licensed under the Apache License, Version 2.0
 * http://www.apache.org/licenses/LICENSE-2.0
 */

#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDebug>
#include <QDir>
#include <QTextStream>

#include <cstdio>

#include "AppConfig.h"
#include "CliCommands.h"
#include "LaunchController.h"
#include "Logger.h"
#include "PlatformServices.h"
#include "SessionRegistry.h"

// main.cpp
// --------
// Application entry point.
//
// Responsibilities:
// - Set QCoreApplication metadata (org/app name/version) for QSettings and paths
// - Parse the command line
// - Install logging with the configured level / file
// - Open the session registry (creates ~/.spackle_2.0 and the default scope on first run)
// - Hand the parsed command to CliCommands
//
// Everything below runs synchronously on the main thread; no event loop is
// entered because no command waits on asynchronous work.

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    // Stable names: QSettings -> ~/.config/TCM/spackle.conf,
    // logs -> ~/.local/share/TCM/spackle/logs/spackle.log
    QCoreApplication::setOrganizationName("TCM");
    QCoreApplication::setApplicationName("spackle");
    QCoreApplication::setApplicationVersion("2.0");

    QTextStream out(stdout);
    QTextStream err(stderr);

#if defined(Q_OS_WIN)
    err << "E099 This program is not for Windows. Please use PuTTY\n";
    return 1;
#endif

    QCommandLineParser parser;
    CliCommands::configureParser(parser);
    parser.process(app);   // exits on --help / --version / unknown option

    Logger::setLogLevel(parser.isSet("verbose") ? 2 : AppConfig::logLevel());
    Logger::setEchoToStderr(parser.isSet("verbose"));
    Logger::install("spackle", AppConfig::logFilePath());

    const QString prefsPath = parser.isSet("prefs")
                                  ? QDir::cleanPath(parser.value("prefs"))
                                  : AppConfig::sessionsFilePath();

    SessionRegistry registry(prefsPath);
    Error openErr;
    if (!registry.open(&openErr)) {
        err << "E105 " << openErr.message << "\n";
        err.flush();
        Logger::shutdown();
        return CliCommands::exitCodeFor(openErr.kind);
    }

    LaunchController::Options launchOptions;
    launchOptions.host                = AppConfig::hostStrategy();
    launchOptions.probeTimeoutSeconds = AppConfig::probeTimeoutSeconds();
    launchOptions.skipProbe           = AppConfig::skipProbe();

    QtPlatformServices platform;
    CliCommands cli(registry, platform, launchOptions, out, err);

    const int rc = cli.run(parser);

    qInfo().noquote() << QString("[CLI] exit %1").arg(rc);
    Logger::shutdown();
    return rc;
}
