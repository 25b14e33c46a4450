#include <QtTest/QtTest>

#include "homework/data/DateFormat.hpp"

using namespace homework::data;

class DateFormatTest : public QObject
{
    Q_OBJECT

private slots:
    void parsesAcceptedForms_data();
    void parsesAcceptedForms();
    void rejectsMalformedInput_data();
    void rejectsMalformedInput();
    void normalizesEquivalentSpellings();
    void cachedResultsSurviveClear();
};

void DateFormatTest::parsesAcceptedForms_data()
{
    QTest::addColumn<QString>("text");
    QTest::addColumn<QDate>("expected");

    QTest::newRow("padded") << "05/03/2025" << QDate(2025, 3, 5);
    QTest::newRow("unpadded") << "5/3/2025" << QDate(2025, 3, 5);
    QTest::newRow("dashes") << "5-3-2025" << QDate(2025, 3, 5);
    QTest::newRow("two digit year") << "05/03/25" << QDate(2025, 3, 5);
    QTest::newRow("surrounding space") << "  31/12/2024 " << QDate(2024, 12, 31);
    QTest::newRow("leap day") << "29/02/2024" << QDate(2024, 2, 29);
    QTest::newRow("spaced separators") << "1 / 2 / 2025" << QDate(2025, 2, 1);
    QTest::newRow("spaced dashes") << "1 -2- 25" << QDate(2025, 2, 1);
    QTest::newRow("three digit year") << "05/03/202" << QDate(202, 3, 5);
    QTest::newRow("one digit year") << "05/03/7" << QDate(2007, 3, 5);
}

void DateFormatTest::parsesAcceptedForms()
{
    QFETCH(QString, text);
    QFETCH(QDate, expected);

    QCOMPARE(parseDate(text), expected);
}

void DateFormatTest::rejectsMalformedInput_data()
{
    QTest::addColumn<QString>("text");

    QTest::newRow("empty") << "";
    QTest::newRow("iso") << "2025-03-05";
    QTest::newRow("words") << "tomorrow";
    QTest::newRow("five digit year") << "05/03/20255";
    QTest::newRow("space inside number") << "0 5/03/2025";
    QTest::newRow("mixed missing separator") << "05 03/2025";
    QTest::newRow("no such day") << "31/02/2025";
    QTest::newRow("month thirteen") << "01/13/2025";
}

void DateFormatTest::rejectsMalformedInput()
{
    QFETCH(QString, text);

    QVERIFY(!parseDate(text).isValid());
    QCOMPARE(formatDate(parseDate(text)), QString());
}

void DateFormatTest::normalizesEquivalentSpellings()
{
    QCOMPARE(normalizeDate("1/2/2025"), QStringLiteral("01/02/2025"));
    QCOMPARE(normalizeDate("01-02-25"), QStringLiteral("01/02/2025"));
    QCOMPARE(normalizeDate("1 / 2 / 2025"), QStringLiteral("01/02/2025"));
    QCOMPARE(normalizeDate("01/02/2025"), normalizeDate("1/2/2025"));
    QCOMPARE(normalizeDate("not a date"), QStringLiteral("not a date"));
    QCOMPARE(formatDate(QDate(2099, 1, 1)), QStringLiteral("01/01/2099"));
}

void DateFormatTest::cachedResultsSurviveClear()
{
    const QDate first = parseDate("7/8/2025");
    QCOMPARE(parseDate("7/8/2025"), first);
    clearDateCache();
    QCOMPARE(parseDate("7/8/2025"), QDate(2025, 8, 7));
}

QTEST_GUILESS_MAIN(DateFormatTest)
#include "DateFormatTest.moc"
