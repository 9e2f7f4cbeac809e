#include <QColor>
#include <QTest>

#include "ColorCodec.h"

class TestColorCodec : public QObject
{
    Q_OBJECT

private slots:
    void encodesLegacyValues_data()
    {
        QTest::addColumn<int>("r");
        QTest::addColumn<int>("g");
        QTest::addColumn<int>("b");
        QTest::addColumn<qint32>("expected");

        QTest::newRow("white") << 255 << 255 << 255 << qint32(-1);
        QTest::newRow("black") << 0 << 0 << 0 << qint32(-16777216);
        QTest::newRow("red")   << 255 << 0 << 0 << qint32(-65536);
        QTest::newRow("blue")  << 0 << 0 << 255 << qint32(-16776961);
        QTest::newRow("grey")  << 128 << 128 << 128 << qint32(-8355712);
    }

    void encodesLegacyValues()
    {
        QFETCH(int, r);
        QFETCH(int, g);
        QFETCH(int, b);
        QFETCH(qint32, expected);

        QCOMPARE(ColorCodec::toSigned32(r, g, b), expected);
        QCOMPARE(ColorCodec::toSigned32(QColor(r, g, b)), expected);
        QCOMPARE(ColorCodec::toSigned32Text(QColor(r, g, b)), QString::number(expected));
    }

    void decodeInvertsEncode()
    {
        for (int v = 0; v < 256; ++v) {
            const QColor c(v, 255 - v, (v * 7) & 0xFF);
            QColor back;
            QVERIFY(ColorCodec::fromSigned32(ColorCodec::toSigned32Text(c), &back));
            QCOMPARE(back.red(), c.red());
            QCOMPARE(back.green(), c.green());
            QCOMPARE(back.blue(), c.blue());
        }
    }

    void decodesPositiveValuesWithoutAlpha()
    {
        // 0x00FFFFFF: no alpha byte, channels still white.
        QColor c;
        QVERIFY(ColorCodec::fromSigned32("16777215", &c));
        QCOMPARE(c, QColor(255, 255, 255));
    }

    void decodeRejectsNonIntegers_data()
    {
        QTest::addColumn<QString>("text");
        QTest::newRow("empty")  << QString();
        QTest::newRow("word")   << QString("white");
        QTest::newRow("hex")    << QString("#ffffff");
        QTest::newRow("float")  << QString("1.5");
    }

    void decodeRejectsNonIntegers()
    {
        QFETCH(QString, text);

        QColor c(1, 2, 3);
        Error err;
        QVERIFY(!ColorCodec::fromSigned32(text, &c, &err));
        QCOMPARE(err.kind, ErrorKind::Format);
        QCOMPARE(c, QColor(1, 2, 3));
    }

    void forgivingDecodeFallsBackToBlack()
    {
        QCOMPARE(ColorCodec::fromSigned32OrBlack("garbage"), QColor(0, 0, 0));
        QCOMPARE(ColorCodec::fromSigned32OrBlack("-1"), QColor(255, 255, 255));
    }

    void hexFormatting()
    {
        QCOMPARE(ColorCodec::toHex(QColor(1, 2, 255)), QString("#0102ff"));
        QCOMPARE(ColorCodec::toHex(QColor(0, 0, 0)), QString("#000000"));
    }

    void hexParsing()
    {
        QColor c;
        QVERIFY(ColorCodec::fromHex("#A0b0C0", &c));
        QCOMPARE(c, QColor(0xa0, 0xb0, 0xc0));

        QVERIFY(ColorCodec::fromHex("102030", &c));
        QCOMPARE(c, QColor(0x10, 0x20, 0x30));

        Error err;
        QVERIFY(!ColorCodec::fromHex("#12345", &c, &err));
        QCOMPARE(err.kind, ErrorKind::Format);
        QVERIFY(!ColorCodec::fromHex("#gg0000", &c, &err));
        QVERIFY(!ColorCodec::fromHex("#1234567", &c, &err));
    }
};

QTEST_GUILESS_MAIN(TestColorCodec)
#include "tst_colorcodec.moc"
