#pragma once

#include <QString>
#include <QStringList>
#include <QTextStream>

#include "LaunchController.h"
#include "PlatformServices.h"
#include "SessionProfile.h"
#include "SessionRegistry.h"
#include "SpackleError.h"

class QCommandLineParser;

// Command line front end. One instance handles one invocation:
//
//   spackle list
//   spackle show <name>
//   spackle save <name> --host H [--port P] [--mode ssh|telnet] [appearance]
//   spackle delete <name>
//   spackle defaults [appearance]
//   spackle open (<name> | --host H) [--dry-run] [--no-probe] [appearance]
//
// appearance: --fg --bg --geometry --scrollback --font-size --key
class CliCommands
{
public:
    CliCommands(SessionRegistry &registry,
                PlatformServices &platform,
                const LaunchController::Options &launchOptions,
                QTextStream &out,
                QTextStream &err);

    // Options and positional arguments understood by run().
    static void configureParser(QCommandLineParser &parser);

    // parser must already be configured and parsed. Returns the exit code.
    int run(const QCommandLineParser &parser);

    static int exitCodeFor(ErrorKind kind);

private:
    int cmdList();
    int cmdShow(const QString &name);
    int cmdSave(const QString &name, const QCommandLineParser &parser);
    int cmdDelete(const QString &name);
    int cmdDefaults(const QCommandLineParser &parser);
    int cmdOpen(const QString &name, const QCommandLineParser &parser);

    SessionProfile defaultsProfile() const;
    bool applyConnectionOptions(const QCommandLineParser &parser, SessionProfile *p, Error *err) const;
    bool applyAppearanceOptions(const QCommandLineParser &parser, SessionProfile *p, Error *err) const;

    int fail(const QString &code, const Error &e);
    void printProfile(const SessionProfile &p);
    void printLaunch(const LaunchSpec &spec);

    SessionRegistry                &m_registry;
    PlatformServices               &m_platform;
    LaunchController::Options       m_launchOptions;
    QTextStream                    &m_out;
    QTextStream                    &m_err;
};
