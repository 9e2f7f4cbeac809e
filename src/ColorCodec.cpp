// ColorCodec.cpp
#include "ColorCodec.h"

#include <QDebug>

namespace ColorCodec {

qint32 toSigned32(int r, int g, int b)
{
    const quint32 argb = 0xFF000000u
                       | (quint32(r & 0xFF) << 16)
                       | (quint32(g & 0xFF) << 8)
                       |  quint32(b & 0xFF);

    // argb >= 2^31 always (alpha is 0xFF), so this is argb - 2^32.
    return qint32(qint64(argb) - (Q_INT64_C(1) << 32));
}

qint32 toSigned32(const QColor &c)
{
    return toSigned32(c.red(), c.green(), c.blue());
}

QString toSigned32Text(const QColor &c)
{
    return QString::number(toSigned32(c));
}

bool fromSigned32(const QString &text, QColor *out, Error *err)
{
    clearError(err);

    bool ok = false;
    const qint64 v = text.trimmed().toLongLong(&ok);
    if (!ok) {
        setError(err, ErrorKind::Format,
                 QString("Not an integer color value: '%1'").arg(text));
        return false;
    }

    // Negative values: add 2^32. The cast keeps the low 32 bits either way.
    const quint32 argb = quint32(v);

    if (out) {
        *out = QColor(int((argb >> 16) & 0xFF),
                      int((argb >> 8) & 0xFF),
                      int(argb & 0xFF));
    }
    return true;
}

QColor fromSigned32OrBlack(const QString &text)
{
    QColor c;
    Error err;
    if (!fromSigned32(text, &c, &err)) {
        qDebug().noquote() << QString("[COLOR] %1, using black").arg(err.message);
        return QColor(0, 0, 0);
    }
    return c;
}

QString toHex(const QColor &c)
{
    return QString("#%1%2%3")
        .arg(c.red(),   2, 16, QChar('0'))
        .arg(c.green(), 2, 16, QChar('0'))
        .arg(c.blue(),  2, 16, QChar('0'));
}

bool fromHex(const QString &text, QColor *out, Error *err)
{
    clearError(err);

    QString h = text.trimmed();
    if (h.startsWith('#'))
        h.remove(0, 1);

    bool okR = false, okG = false, okB = false;
    const int r = h.mid(0, 2).toInt(&okR, 16);
    const int g = h.mid(2, 2).toInt(&okG, 16);
    const int b = h.mid(4, 2).toInt(&okB, 16);

    if (h.size() != 6 || !okR || !okG || !okB) {
        setError(err, ErrorKind::Format,
                 QString("Invalid color '%1' (expected #rrggbb)").arg(text));
        return false;
    }

    if (out) *out = QColor(r, g, b);
    return true;
}

} // namespace ColorCodec
