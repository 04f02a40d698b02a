#include "utils/DateUtils.h"
#include <QtTest>

/**
 * Tests for DateUtils: master expiry formats and order time entry.
 */
class TestDateUtils : public QObject {
  Q_OBJECT

private slots:
  void testParseExpiryDate_data();
  void testParseExpiryDate();
  void testRejectsBadExpiry();

  void testParseTimeOfDay_data();
  void testParseTimeOfDay();
  void testRejectsBadTime_data();
  void testRejectsBadTime();
};

void TestDateUtils::testParseExpiryDate_data() {
  QTest::addColumn<QString>("input");
  QTest::addColumn<QString>("expected");
  QTest::addColumn<QDate>("date");

  QTest::newRow("iso") << "2026-02-26T14:30:00" << "26FEB2026" << QDate(2026, 2, 26);
  QTest::newRow("yyyymmdd") << "20260226" << "26FEB2026" << QDate(2026, 2, 26);
  QTest::newRow("yyyy-mm-dd") << "2026-03-05" << "05MAR2026" << QDate(2026, 3, 5);
  QTest::newRow("dd-mm-yyyy") << "5-03-2026" << "05MAR2026" << QDate(2026, 3, 5);
  QTest::newRow("dd/mm/yyyy") << "26/02/2026" << "26FEB2026" << QDate(2026, 2, 26);
  QTest::newRow("ddmmmyyyy") << "26feb2026" << "26FEB2026" << QDate(2026, 2, 26);
  QTest::newRow("ddmmmyyyy with T") << "29OCT2026" << "29OCT2026" << QDate(2026, 10, 29);
}

void TestDateUtils::testParseExpiryDate() {
  QFETCH(QString, input);
  QFETCH(QString, expected);
  QFETCH(QDate, date);

  QString out;
  QDate outDate;
  QVERIFY(DateUtils::parseExpiryDate(input, out, outDate));
  QCOMPARE(out, expected);
  QCOMPARE(outDate, date);
}

void TestDateUtils::testRejectsBadExpiry() {
  QString out;
  QDate outDate;
  QVERIFY(!DateUtils::parseExpiryDate("", out, outDate));
  QVERIFY(!DateUtils::parseExpiryDate("N/A", out, outDate));
  QVERIFY(!DateUtils::parseExpiryDate("2026-13-01", out, outDate));
  QVERIFY(!DateUtils::parseExpiryDate("31FEB2026", out, outDate));
  QVERIFY(!outDate.isValid());
}

void TestDateUtils::testParseTimeOfDay_data() {
  QTest::addColumn<QString>("input");
  QTest::addColumn<QTime>("expected");

  QTest::newRow("hh:mm") << "09:20" << QTime(9, 20, 0);
  QTest::newRow("h:mm") << "9:20" << QTime(9, 20, 0);
  QTest::newRow("hh:mm:ss") << "15:10:45" << QTime(15, 10, 45);
  QTest::newRow("padded") << "  14:00 " << QTime(14, 0, 0);
}

void TestDateUtils::testParseTimeOfDay() {
  QFETCH(QString, input);
  QFETCH(QTime, expected);

  const QDateTime reference(QDate(2026, 2, 26), QTime(9, 0, 0));
  QDateTime result = DateUtils::parseTimeOfDay(input, reference);
  QVERIFY(result.isValid());
  QCOMPARE(result.date(), reference.date());
  QCOMPARE(result.time(), expected);
}

void TestDateUtils::testRejectsBadTime_data() {
  QTest::addColumn<QString>("input");

  QTest::newRow("empty") << "";
  QTest::newRow("hour only") << "9";
  QTest::newRow("hour 24") << "24:00";
  QTest::newRow("minute 60") << "10:60";
  QTest::newRow("letters") << "ab:cd";
  QTest::newRow("trailing") << "10:00pm";
}

void TestDateUtils::testRejectsBadTime() {
  QFETCH(QString, input);
  const QDateTime reference(QDate(2026, 2, 26), QTime(9, 0, 0));
  QVERIFY(!DateUtils::parseTimeOfDay(input, reference).isValid());
}

QTEST_MAIN(TestDateUtils)
#include "test_date_utils.moc"
