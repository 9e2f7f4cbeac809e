// SortedProperties.cpp
//
// Persistence primitive for ~/.spackle_2.0.
// Knows nothing about sessions; SessionRegistry layers the "<scope>.<field>"
// naming on top of it.

#include "SortedProperties.h"

#include <QDateTime>
#include <QDebug>
#include <QFile>
#include <QTextStream>

bool SortedProperties::contains(const QString &key) const
{
    return m_props.contains(key);
}

QString SortedProperties::value(const QString &key) const
{
    return m_props.value(key);
}

QString SortedProperties::value(const QString &key, const QString &defaultValue) const
{
    return m_props.value(key, defaultValue);
}

void SortedProperties::setValue(const QString &key, const QString &value)
{
    m_props.insert(key, value);
}

void SortedProperties::remove(const QString &key)
{
    m_props.remove(key);
}

QStringList SortedProperties::keys() const
{
    return m_props.keys();
}

bool SortedProperties::load(const QString &path, Error *err)
{
    clearError(err);

    QFile f(path);
    if (!f.exists()) {
        qDebug().noquote() << QString("[PROPS] %1 does not exist, starting empty").arg(path);
        return true;
    }

    if (!f.open(QIODevice::ReadOnly | QIODevice::Text)) {
        setError(err, ErrorKind::Io,
                 QString("Could not open %1: %2").arg(path, f.errorString()));
        qWarning().noquote() << QString("[PROPS] load FAILED: %1").arg(f.errorString());
        return false;
    }

    QTextStream in(&f);
    in.setCodec("UTF-8");

    int loaded = 0;
    while (!in.atEnd()) {
        const QString line = in.readLine().trimmed();
        if (line.isEmpty() || line.startsWith('#'))
            continue;

        const int eq = line.indexOf('=');
        if (eq < 0)
            continue;

        m_props.insert(line.left(eq).trimmed(), line.mid(eq + 1).trimmed());
        ++loaded;
    }

    qInfo().noquote() << QString("[PROPS] loaded %1 entries from %2").arg(loaded).arg(path);
    return true;
}

bool SortedProperties::store(const QString &path, Error *err) const
{
    clearError(err);

    QFile f(path);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text)) {
        setError(err, ErrorKind::Io,
                 QString("Could not write %1: %2").arg(path, f.errorString()));
        qWarning().noquote() << QString("[PROPS] store FAILED: %1").arg(f.errorString());
        return false;
    }

    QTextStream out(&f);
    out.setCodec("UTF-8");

    out << "#\n";
    out << "#" << QDateTime::currentDateTime().toString("yyyy-MM-dd HH:mm:ss.zzz") << "\n";

    for (auto it = m_props.constBegin(); it != m_props.constEnd(); ++it)
        out << it.key() << "=" << it.value() << "\n";

    out.flush();
    if (out.status() != QTextStream::Ok || f.error() != QFileDevice::NoError) {
        setError(err, ErrorKind::Io,
                 QString("Could not write %1: %2").arg(path, f.errorString()));
        qWarning().noquote() << QString("[PROPS] store FAILED: %1").arg(f.errorString());
        return false;
    }

    f.close();
    qDebug().noquote() << QString("[PROPS] stored %1 entries to %2").arg(m_props.size()).arg(path);
    return true;
}
