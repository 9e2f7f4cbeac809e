#pragma once

#include <QColor>
#include <QString>
#include <QtGlobal>

#include "SpackleError.h"

// Terminal colors are stored as a signed 32-bit ARGB value with alpha fixed at 255. White is -1, black is
// -16777216. The encoding must stay bit-exact for older preference files.
namespace ColorCodec {
    qint32 toSigned32(int r, int g, int b);
    qint32 toSigned32(const QColor &c);

    // Decimal text as written to the preferences file.
    QString toSigned32Text(const QColor &c);

    // Fails with ErrorKind::Format if text is not an integer.
    bool fromSigned32(const QString &text, QColor *out, Error *err = nullptr);

    // Forgiving form used when reading stored sessions: black on bad input.
    QColor fromSigned32OrBlack(const QString &text);

    // "#rrggbb" (lower case)
    QString toHex(const QColor &c);

    // Accepts "#rrggbb" or "rrggbb".
    bool fromHex(const QString &text, QColor *out, Error *err = nullptr);
}
