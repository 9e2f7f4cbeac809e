#pragma once

#include <QString>
#include <QStringList>

#include "SessionProfile.h"
#include "SortedProperties.h"
#include "SpackleError.h"

/*
    SessionRegistry
    ---------------
    Groups the flat "<scope>.<field>" properties into session records.

    Responsibilities:
    - Own the SortedProperties instance and the preferences file path
    - Synthesize the "default" scope on first run
    - Load (merge), save (full overwrite) and delete sessions
    - Rewrite the file after every mutation

    Non-responsibilities:
    - No hostname parsing (ConnectionResolver)
    - No launching (LaunchSpecBuilder / LaunchController)

    The "default" scope only carries appearance fields: name, hostname, port
    and mode are never read or written for it.
*/

class SessionRegistry
{
public:
    static const QString kDefaultScope;   // "default"

    // The ten field suffixes a named session owns.
    static QStringList fieldNames();

    explicit SessionRegistry(const QString &filePath);

    QString filePath() const { return m_filePath; }

    /*
        Load the preferences file (created empty if missing) and seed the
        "default" scope from built-in values if no "default." key exists.
        Returns false only on I/O failure.
    */
    bool open(Error *err = nullptr);

    bool hasDefaults() const;
    bool hasSession(const QString &scope) const;

    // Values of every "*.name" key, empty values skipped, sorted ascending.
    QStringList sessionNames() const;

    /*
        Merge stored fields of "scope" into *profile.
        Fields that are not stored are left exactly as the caller passed them.
        Returns true if at least one field was found.
    */
    bool loadSession(const QString &scope, SessionProfile *profile) const;

    /*
        Write all ten fields under profile.name and store the file.
        ErrorKind::Validation if name/hostname/port is empty, or the name is
        "default", starts with '#' or contains '.', '=' or a line break.
        ErrorKind::Io if the file cannot be written.
    */
    bool saveSession(const SessionProfile &profile, Error *err = nullptr);

    // Write the appearance fields of profile under "default." and store.
    bool saveDefaults(const SessionProfile &profile, Error *err = nullptr);

    // Remove all ten fields of scope and store. Unknown scope is not an error.
    bool deleteSession(const QString &scope, Error *err = nullptr);

    const SortedProperties &properties() const { return m_props; }

private:
    void writeAppearance(const QString &scope, const SessionProfile &p);
    bool persist(Error *err);

    static QString key(const QString &scope, const char *field);

    QString          m_filePath;
    SortedProperties m_props;
};
