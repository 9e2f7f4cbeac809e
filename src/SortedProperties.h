#pragma once

#include <QMap>
#include <QString>
#include <QStringList>

#include "SpackleError.h"

/*
    SortedProperties
    ----------------
    Flat key/value store compatible with the properties file
    written by every Spackle release since 1.x.

    File layout:
        #
        #<timestamp, informational only>
        key=value
        ...

    Design notes:
    - Keys are kept in a QMap, so keys() and store() are always in ascending
      key order. Existing files are diffed by users; the order is part of the
      format.
    - Values are plain strings. Nothing is escaped: keys/values containing '='
      or line breaks do not survive a store/load cycle.
*/

class SortedProperties
{
public:
    bool contains(const QString &key) const;

    // Empty string when absent; use contains() to tell the two apart.
    QString value(const QString &key) const;
    QString value(const QString &key, const QString &defaultValue) const;

    void setValue(const QString &key, const QString &value);

    // No-op if the key does not exist.
    void remove(const QString &key);

    QStringList keys() const;
    int size() const { return m_props.size(); }
    bool isEmpty() const { return m_props.isEmpty(); }
    void clear() { m_props.clear(); }

    /*
        Merge entries from a properties file into this store.

        Behavior:
        - Missing file: returns true, nothing loaded (NOT an error)
        - Each line is trimmed; blank lines and '#' comments are skipped
        - Lines without '=' are skipped
        - key/value split at the first '=', both sides trimmed
        - File exists but cannot be opened: returns false, err->kind = Io
    */
    bool load(const QString &path, Error *err = nullptr);

    /*
        Overwrite the file with the two header lines followed by one
        key=value line per entry in key order.

        Returns false with err->kind = Io if the file cannot be written.
    */
    bool store(const QString &path, Error *err = nullptr) const;

private:
    QMap<QString, QString> m_props;
};
