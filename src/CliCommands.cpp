// CliCommands.cpp
//
// Stands in for the main window / options dialog of the desktop client.
// Every command maps to one user action of that UI:
//   list     -> stored session list
//   show     -> "Load"
//   save     -> "Save"
//   delete   -> "Delete"
//   defaults -> "Save as default" in the options dialog
//   open     -> "Open"
//
// User-facing error codes are kept from the desktop client:
//   E100 required binary missing, E101 protocol client missing,
//   E102/E103 no session selected, E105 launch failure.

#include "CliCommands.h"

#include "ColorCodec.h"
#include "ConnectionResolver.h"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>

CliCommands::CliCommands(SessionRegistry &registry,
                         PlatformServices &platform,
                         const LaunchController::Options &launchOptions,
                         QTextStream &out,
                         QTextStream &err)
    : m_registry(registry)
    , m_platform(platform)
    , m_launchOptions(launchOptions)
    , m_out(out)
    , m_err(err)
{
}

int CliCommands::exitCodeFor(ErrorKind kind)
{
    switch (kind) {
        case ErrorKind::None:        return 0;
        case ErrorKind::Validation:
        case ErrorKind::Format:      return 2;
        case ErrorKind::NotFound:    return 3;
        case ErrorKind::Unreachable:
        case ErrorKind::Timeout:     return 4;
        case ErrorKind::Io:          return 5;
    }
    return 1;
}

int CliCommands::fail(const QString &code, const Error &e)
{
    if (code.isEmpty())
        m_err << e.message << "\n";
    else
        m_err << code << " " << e.message << "\n";
    m_err.flush();

    qWarning().noquote() << QString("[CLI] %1 (%2)").arg(e.message, errorKindToString(e.kind));
    return exitCodeFor(e.kind);
}

void CliCommands::configureParser(QCommandLineParser &parser)
{
    parser.setApplicationDescription(
        QCoreApplication::translate("CliCommands",
                                    "Store SSH/Telnet sessions and open them in a terminal."));
    parser.addHelpOption();
    parser.addVersionOption();

    parser.addPositionalArgument("command", "list | show | save | delete | defaults | open");
    parser.addPositionalArgument("name", "Session name", "[name]");

    parser.addOptions({
        { "prefs",      "Preferences file (default ~/.spackle_2.0).", "file" },
        { "verbose",    "Echo log records to stderr." },
        { "host",       "Hostname or user@host.", "host" },
        { "port",       "Port (22 for ssh, 23 for telnet if omitted).", "port" },
        { "mode",       "Protocol: ssh or telnet.", "mode" },
        { "fg",         "Foreground color #rrggbb.", "color" },
        { "bg",         "Background color #rrggbb.", "color" },
        { "geometry",   "80x24, 80x43, 132x24 or 132x43.", "geometry" },
        { "scrollback", "Scrollback lines (0-20000).", "lines" },
        { "font-size",  "Font size (6-20).", "size" },
        { "key",        "SSH private key path, or 'default'.", "path" },
        { "dry-run",    "open: print the launch command instead of running it." },
        { "no-probe",   "open: skip the port reachability check." },
    });
}

int CliCommands::run(const QCommandLineParser &parser)
{
    const QStringList pos = parser.positionalArguments();
    if (pos.isEmpty()) {
        m_err << "Missing command (list, show, save, delete, defaults, open). See --help.\n";
        m_err.flush();
        return 1;
    }

    const QString command = pos.at(0);
    const QString name = pos.value(1).trimmed();

    qInfo().noquote() << QString("[CLI] command=%1 name='%2'").arg(command, name);

    if (command == "list")
        return cmdList();

    if (command == "show") {
        if (name.isEmpty())
            return fail("E102", { ErrorKind::Validation, "Please select an item from the list" });
        return cmdShow(name);
    }

    if (command == "save")
        return cmdSave(name, parser);

    if (command == "delete") {
        if (name.isEmpty())
            return fail("E103", { ErrorKind::Validation, "Please select an item from the list" });
        return cmdDelete(name);
    }

    if (command == "defaults")
        return cmdDefaults(parser);

    if (command == "open")
        return cmdOpen(name, parser);

    m_err << "Unknown command: " << command << "\n";
    m_err.flush();
    return 1;
}

// Built-in values with the stored "default" scope merged over them.
SessionProfile CliCommands::defaultsProfile() const
{
    SessionProfile p;
    m_registry.loadSession(SessionRegistry::kDefaultScope, &p);
    return p;
}

bool CliCommands::applyConnectionOptions(const QCommandLineParser &parser,
                                         SessionProfile *p, Error *err) const
{
    if (parser.isSet("mode")) {
        if (!sessionModeFromString(parser.value("mode"), &p->mode)) {
            setError(err, ErrorKind::Validation,
                     QString("Unknown protocol '%1' (ssh or telnet)").arg(parser.value("mode")));
            return false;
        }
        // Switching protocol resets the port, like the protocol radio buttons.
        p->port = defaultPortFor(p->mode);
    }

    if (parser.isSet("host"))
        p->hostname = parser.value("host").trimmed();

    if (parser.isSet("port"))
        p->port = parser.value("port").trimmed();

    return true;
}

bool CliCommands::applyAppearanceOptions(const QCommandLineParser &parser,
                                         SessionProfile *p, Error *err) const
{
    if (parser.isSet("fg") && !ColorCodec::fromHex(parser.value("fg"), &p->foreground, err))
        return false;

    if (parser.isSet("bg") && !ColorCodec::fromHex(parser.value("bg"), &p->background, err))
        return false;

    if (parser.isSet("geometry")) {
        const QString g = parser.value("geometry").trimmed();
        if (!geometryOptions().contains(g)) {
            setError(err, ErrorKind::Validation,
                     QString("Unsupported geometry '%1' (%2)")
                         .arg(g, geometryOptions().join(", ")));
            return false;
        }
        p->geometry = g;
    }

    if (parser.isSet("scrollback")) {
        bool ok = false;
        const int n = parser.value("scrollback").toInt(&ok);
        if (!ok || n < 0 || n > SessionDefaults::kMaxScrollback) {
            setError(err, ErrorKind::Validation,
                     QString("Scrollback must be 0-%1").arg(SessionDefaults::kMaxScrollback));
            return false;
        }
        p->scrollback = n;
    }

    if (parser.isSet("font-size")) {
        bool ok = false;
        const int n = parser.value("font-size").toInt(&ok);
        if (!ok || n < SessionDefaults::kMinFontSize || n > SessionDefaults::kMaxFontSize) {
            setError(err, ErrorKind::Validation,
                     QString("Font size must be %1-%2")
                         .arg(SessionDefaults::kMinFontSize)
                         .arg(SessionDefaults::kMaxFontSize));
            return false;
        }
        p->fontSize = n;
    }

    if (parser.isSet("key")) {
        const QString k = parser.value("key").trimmed();
        if (k.isEmpty() || k == "default") {
            p->keyChoice = KeyChoice::Default;
            p->keyPath.clear();
        } else {
            p->keyChoice = KeyChoice::Other;
            p->keyPath = k;
        }
    }

    return true;
}

void CliCommands::printProfile(const SessionProfile &p)
{
    m_out << "name=" << p.name << "\n"
          << "hostname=" << p.hostname << "\n"
          << "port=" << p.port << "\n"
          << "mode=" << sessionModeToString(p.mode) << "\n"
          << "foreground=" << ColorCodec::toHex(p.foreground) << "\n"
          << "background=" << ColorCodec::toHex(p.background) << "\n"
          << "geometry=" << p.geometry << "\n"
          << "scrollback=" << p.scrollback << "\n"
          << "fontsize=" << p.fontSize << "\n"
          << "keypath=" << (p.keyChoice == KeyChoice::Other ? p.keyPath : QString("default")) << "\n";
    m_out.flush();
}

void CliCommands::printLaunch(const LaunchSpec &spec)
{
    m_out << spec.program << "\n";
    for (const QString &a : spec.arguments)
        m_out << "  " << a << "\n";
    m_out.flush();
}

int CliCommands::cmdList()
{
    for (const QString &n : m_registry.sessionNames())
        m_out << n << "\n";
    m_out.flush();
    return 0;
}

int CliCommands::cmdShow(const QString &name)
{
    if (!m_registry.hasSession(name))
        return fail("E102", { ErrorKind::Validation, QString("No stored session named '%1'").arg(name) });

    SessionProfile p = defaultsProfile();
    m_registry.loadSession(name, &p);
    printProfile(p);
    return 0;
}

int CliCommands::cmdSave(const QString &name, const QCommandLineParser &parser)
{
    SessionProfile p = defaultsProfile();
    if (!name.isEmpty() && m_registry.hasSession(name))
        m_registry.loadSession(name, &p);
    p.name = name;

    Error e;
    if (!applyConnectionOptions(parser, &p, &e) || !applyAppearanceOptions(parser, &p, &e))
        return fail(QString(), e);

    if (!m_registry.saveSession(p, &e))
        return fail(QString(), e);

    m_out << "Saved session '" << p.name << "'\n";
    m_out.flush();
    return 0;
}

int CliCommands::cmdDelete(const QString &name)
{
    Error e;
    if (!m_registry.deleteSession(name, &e))
        return fail(QString(), e);

    m_out << "Deleted session '" << name << "'\n";
    m_out.flush();
    return 0;
}

int CliCommands::cmdDefaults(const QCommandLineParser &parser)
{
    SessionProfile p = defaultsProfile();

    Error e;
    if (!applyAppearanceOptions(parser, &p, &e))
        return fail(QString(), e);

    if (!m_registry.saveDefaults(p, &e))
        return fail(QString(), e);

    printProfile(p);
    return 0;
}

int CliCommands::cmdOpen(const QString &name, const QCommandLineParser &parser)
{
    SessionProfile p = defaultsProfile();

    if (!name.isEmpty()) {
        if (!m_registry.hasSession(name))
            return fail("E102", { ErrorKind::Validation, QString("No stored session named '%1'").arg(name) });
        m_registry.loadSession(name, &p);
    }

    Error e;
    if (!applyConnectionOptions(parser, &p, &e) || !applyAppearanceOptions(parser, &p, &e))
        return fail(QString(), e);

    LaunchController::Options opts = m_launchOptions;
    if (parser.isSet("no-probe"))
        opts.skipProbe = true;

    LaunchController controller(m_platform, opts);

    Error locateErr;
    if (!controller.locateClients(&locateErr)) {
        if (!parser.isSet("dry-run") && !controller.terminalAvailable())
            return fail("E100", locateErr);
        m_err << "E100 " << locateErr.message << "\n";
        m_err.flush();
    }

    const QString localUser = ConnectionResolver::localUserName();

    if (parser.isSet("dry-run")) {
        LaunchSpec spec;
        if (!controller.prepare(p, localUser, &spec, &e))
            return fail(QString(), e);
        printLaunch(spec);
        return 0;
    }

    if (!controller.launch(p, localUser, nullptr, &e)) {
        switch (e.kind) {
            case ErrorKind::NotFound:
                return fail("E101", e);
            case ErrorKind::Unreachable:
            case ErrorKind::Timeout:
            case ErrorKind::Io:
                return fail("E105", e);
            case ErrorKind::Validation:
                return fail(e.field == ErrorField::Port ? "E105" : QString(), e);
            default:
                return fail(QString(), e);
        }
    }

    return 0;
}
