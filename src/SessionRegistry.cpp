// SessionRegistry.cpp
//
// ARCHITECTURE NOTES (SessionRegistry.cpp)
//
// Key layout in ~/.spackle_2.0:
//
//   default.background=-1
//   default.foreground=-16777216
//   default.fontsize=10
//   default.geometry=80x24
//   default.keypath=default
//   default.scrollback=10000
//   work.background=-1
//   ...
//   work.hostname=10.0.0.5
//   work.mode=ssh
//   work.name=work
//   work.port=22
//
// Load is a merge: anything missing on disk keeps the in-memory value.
// Save is a full overwrite of all ten fields.
//

#include "SessionRegistry.h"

#include "ColorCodec.h"

#include <QDebug>
#include <QFile>

const QString SessionRegistry::kDefaultScope = QStringLiteral("default");

static const char *kKeyPathDefault = "default";

QStringList SessionRegistry::fieldNames()
{
    return { "background", "foreground", "hostname", "mode",
             "name", "port", "geometry", "keypath",
             "scrollback", "fontsize" };
}

SessionRegistry::SessionRegistry(const QString &filePath)
    : m_filePath(filePath)
{
}

QString SessionRegistry::key(const QString &scope, const char *field)
{
    return scope + QLatin1Char('.') + QLatin1String(field);
}

bool SessionRegistry::open(Error *err)
{
    clearError(err);

    if (!QFile::exists(m_filePath)) {
        QFile touch(m_filePath);
        if (!touch.open(QIODevice::WriteOnly)) {
            setError(err, ErrorKind::Io,
                     QString("Could not create %1: %2").arg(m_filePath, touch.errorString()));
            qWarning().noquote() << QString("[REGISTRY] create FAILED: %1").arg(touch.errorString());
            return false;
        }
        touch.close();
        qInfo().noquote() << QString("[REGISTRY] created %1").arg(m_filePath);
    }

    if (!m_props.load(m_filePath, err))
        return false;

    if (!hasDefaults()) {
        qInfo().noquote() << "[REGISTRY] no default scope, seeding built-in defaults";

        const SessionProfile builtIn;
        writeAppearance(kDefaultScope, builtIn);
        return persist(err);
    }

    return true;
}

bool SessionRegistry::hasDefaults() const
{
    const QString prefix = kDefaultScope + QLatin1Char('.');
    for (const QString &k : m_props.keys()) {
        if (k.startsWith(prefix))
            return true;
    }
    return false;
}

bool SessionRegistry::hasSession(const QString &scope) const
{
    for (const QString &field : fieldNames()) {
        if (m_props.contains(scope + QLatin1Char('.') + field))
            return true;
    }
    return false;
}

QStringList SessionRegistry::sessionNames() const
{
    QStringList names;
    for (const QString &k : m_props.keys()) {
        if (!k.endsWith(QLatin1String(".name")))
            continue;

        const QString v = m_props.value(k);
        if (!v.isEmpty())
            names << v;
    }
    names.sort();
    return names;
}

bool SessionRegistry::loadSession(const QString &scope, SessionProfile *profile) const
{
    if (!profile) return false;

    bool found = false;

    // Present and non-empty; an empty stored value is treated as absent.
    auto stored = [&](const char *field, QString *out) -> bool {
        const QString k = key(scope, field);
        if (!m_props.contains(k))
            return false;
        const QString v = m_props.value(k);
        if (v.isEmpty())
            return false;
        *out = v;
        found = true;
        return true;
    };

    QString v;

    if (scope != kDefaultScope) {
        if (stored("name", &v))     profile->name = v;
        if (stored("hostname", &v)) profile->hostname = v;
        if (stored("port", &v))     profile->port = v;
        if (stored("mode", &v))     sessionModeFromString(v, &profile->mode);
    }

    if (stored("geometry", &v))
        profile->geometry = normalizeGeometry(v);

    if (stored("scrollback", &v)) {
        bool ok = false;
        const int n = v.toInt(&ok);
        profile->scrollback = ok ? n : SessionDefaults::kScrollback;
    }

    if (stored("fontsize", &v)) {
        bool ok = false;
        const int n = v.toInt(&ok);
        profile->fontSize = ok ? n : SessionDefaults::kFontSize;
    }

    if (stored("keypath", &v)) {
        if (v == QLatin1String(kKeyPathDefault)) {
            profile->keyChoice = KeyChoice::Default;
            profile->keyPath.clear();
        } else {
            profile->keyChoice = KeyChoice::Other;
            profile->keyPath = v;
        }
    }

    if (stored("background", &v))
        profile->background = ColorCodec::fromSigned32OrBlack(v);

    if (stored("foreground", &v))
        profile->foreground = ColorCodec::fromSigned32OrBlack(v);

    qDebug().noquote() << QString("[REGISTRY] loadSession '%1' found=%2").arg(scope).arg(found);
    return found;
}

void SessionRegistry::writeAppearance(const QString &scope, const SessionProfile &p)
{
    m_props.setValue(key(scope, "background"), ColorCodec::toSigned32Text(p.background));
    m_props.setValue(key(scope, "foreground"), ColorCodec::toSigned32Text(p.foreground));
    m_props.setValue(key(scope, "geometry"),   p.geometry);
    m_props.setValue(key(scope, "scrollback"), QString::number(p.scrollback));
    m_props.setValue(key(scope, "fontsize"),   QString::number(p.fontSize));
    m_props.setValue(key(scope, "keypath"),
                     p.keyChoice == KeyChoice::Other ? p.keyPath
                                                     : QString::fromLatin1(kKeyPathDefault));
}

bool SessionRegistry::saveSession(const SessionProfile &profile, Error *err)
{
    clearError(err);

    const QString name     = profile.name.trimmed();
    const QString hostname = profile.hostname.trimmed();
    const QString port     = profile.port.trimmed();

    if (name.isEmpty() || hostname.isEmpty() || port.isEmpty()) {
        setError(err, ErrorKind::Validation,
                 "Please enter a hostname, a port number, and a session name.");
        qWarning().noquote() << "[REGISTRY] saveSession rejected: missing required field";
        return false;
    }

    // The name becomes the key prefix and the stored value of <name>.name.
    if (name == kDefaultScope || name.startsWith('#')
        || name.contains('.') || name.contains('=')
        || name.contains('\n') || name.contains('\r')) {
        setError(err, ErrorKind::Validation,
                 QString("Invalid session name '%1'.").arg(name), ErrorField::SessionName);
        qWarning().noquote() << QString("[REGISTRY] saveSession rejected: name '%1'").arg(name);
        return false;
    }

    m_props.setValue(key(name, "name"),     name);
    m_props.setValue(key(name, "hostname"), hostname);
    m_props.setValue(key(name, "mode"),     sessionModeToString(profile.mode));
    m_props.setValue(key(name, "port"),     port);
    writeAppearance(name, profile);

    qInfo().noquote() << QString("[REGISTRY] saved session '%1'").arg(name);
    return persist(err);
}

bool SessionRegistry::saveDefaults(const SessionProfile &profile, Error *err)
{
    clearError(err);
    writeAppearance(kDefaultScope, profile);

    qInfo().noquote() << "[REGISTRY] saved defaults";
    return persist(err);
}

bool SessionRegistry::deleteSession(const QString &scope, Error *err)
{
    clearError(err);

    for (const QString &field : fieldNames())
        m_props.remove(scope + QLatin1Char('.') + field);

    qInfo().noquote() << QString("[REGISTRY] deleted session '%1'").arg(scope);
    return persist(err);
}

bool SessionRegistry::persist(Error *err)
{
    return m_props.store(m_filePath, err);
}
