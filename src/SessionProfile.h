#pragma once

#include <QColor>
#include <QString>
#include <QStringList>

// -----------------------------
// Protocol
// -----------------------------
enum class SessionMode {
    Ssh,
    Telnet
};

static inline QString sessionModeToString(SessionMode m)
{
    switch (m) {
        case SessionMode::Ssh:    return "ssh";
        case SessionMode::Telnet: return "telnet";
    }
    return "ssh";
}

// Only the two literal values are recognized; anything else leaves *out untouched.
static inline bool sessionModeFromString(const QString &s, SessionMode *out)
{
    const QString v = s.trimmed();
    if (v == "ssh")    { if (out) *out = SessionMode::Ssh;    return true; }
    if (v == "telnet") { if (out) *out = SessionMode::Telnet; return true; }
    return false;
}

static inline QString defaultPortFor(SessionMode m)
{
    return m == SessionMode::Telnet ? QStringLiteral("23") : QStringLiteral("22");
}

// -----------------------------
// SSH private key selection
// -----------------------------
enum class KeyChoice {
    Default,  // ~/.ssh/id_* picked by the client itself
    Other     // explicit key file
};

// -----------------------------
// Terminal geometry
// -----------------------------
static inline QStringList geometryOptions()
{
    return { "80x24", "80x43", "132x24", "132x43" };
}

static inline QString normalizeGeometry(const QString &geo)
{
    const QString g = geo.trimmed();
    return geometryOptions().contains(g) ? g : geometryOptions().first();
}

struct SessionProfile {
    // Connection (not stored for the "default" scope)
    QString     name;
    QString     hostname;          // host, IP, or user@host
    QString     port = "22";
    SessionMode mode = SessionMode::Ssh;

    // Terminal appearance
    QColor  background = QColor(255, 255, 255);
    QColor  foreground = QColor(0, 0, 0);
    QString geometry   = "80x24";
    int     scrollback = 10000;
    int     fontSize   = 10;

    // Auth
    KeyChoice keyChoice = KeyChoice::Default;
    QString   keyPath;             // empty unless keyChoice == Other

    // Path actually handed to the client: empty means "let ssh pick".
    QString effectiveKeyPath() const
    {
        return keyChoice == KeyChoice::Other ? keyPath : QString();
    }
};

// Built-in values used to seed the "default" scope and reset appearance.
namespace SessionDefaults {
    constexpr int kScrollback = 10000;
    constexpr int kFontSize   = 10;
    constexpr int kMinFontSize = 6;
    constexpr int kMaxFontSize = 20;
    constexpr int kMaxScrollback = 20000;
}
