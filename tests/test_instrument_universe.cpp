#include "TestFakes.h"
#include "repository/InstrumentUniverse.h"
#include <QTemporaryFile>
#include <QtTest>

using namespace TestFakes;

/**
 * Tests for InstrumentUniverse: nearest-expiry selection, strike spacing
 * detection and loading from a master file on disk.
 */
class TestInstrumentUniverse : public QObject {
  Q_OBJECT

private slots:
  void testSelectsNearestExpiry();
  void testIgnoresPastAndFarExpiries();
  void testIgnoresOtherUnderlyings();
  void testNoExpiryFails();
  void testStrikeSpacingUsesSmallestGap();
  void testSingleStrikeFails();
  void testLoadFromMasterFile();
  void testMissingMasterFile();
};

namespace {

QVector<ContractData> chainAt(const QDate &expiry, double low, double high,
                              double spacing, const QString &name = "NIFTY") {
  QVector<ContractData> out;
  for (double s = low; s <= high; s += spacing) {
    ContractData ce = makeOption(s, OptionType::Call, 50, expiry);
    ContractData pe = makeOption(s, OptionType::Put, 50, expiry);
    ce.name = name;
    pe.name = name;
    out << ce << pe;
  }
  return out;
}

} // namespace

void TestInstrumentUniverse::testSelectsNearestExpiry() {
  QVector<ContractData> all = chainAt(QDate(2026, 3, 26), 17000, 18000, 100);
  all += chainAt(QDate(2026, 2, 26), 17000, 18000, 50);

  InstrumentUniverse u;
  QVERIFY(u.build(all, "NIFTY", QDate(2026, 2, 10)));
  QCOMPARE(u.expiry(), QDate(2026, 2, 26));
  QCOMPARE(u.contracts().size(), 42);
  QCOMPARE(u.strikeSpacing(), 50.0);
  for (const auto &c : u.contracts())
    QCOMPARE(c.expiry, QDate(2026, 2, 26));
}

void TestInstrumentUniverse::testIgnoresPastAndFarExpiries() {
  QVector<ContractData> all = chainAt(QDate(2026, 1, 29), 17000, 18000, 50);
  all += chainAt(QDate(2026, 6, 25), 17000, 18000, 50);
  all += chainAt(QDate(2026, 3, 26), 17000, 18000, 100);

  InstrumentUniverse u;
  QVERIFY(u.build(all, "NIFTY", QDate(2026, 2, 10)));
  QCOMPARE(u.expiry(), QDate(2026, 3, 26));
  QCOMPARE(u.strikeSpacing(), 100.0);

  // Expiry on the reference date itself still qualifies
  QVERIFY(u.build(all, "NIFTY", QDate(2026, 1, 29)));
  QCOMPARE(u.expiry(), QDate(2026, 1, 29));
}

void TestInstrumentUniverse::testIgnoresOtherUnderlyings() {
  QVector<ContractData> all =
      chainAt(QDate(2026, 2, 24), 50000, 52000, 100, "BANKNIFTY");
  all += chainAt(QDate(2026, 2, 26), 17000, 18000, 50);

  InstrumentUniverse u;
  QVERIFY(u.build(all, "NIFTY", QDate(2026, 2, 10)));
  QCOMPARE(u.expiry(), QDate(2026, 2, 26));
  QCOMPARE(u.underlying(), QString("NIFTY"));
}

void TestInstrumentUniverse::testNoExpiryFails() {
  InstrumentUniverse u;
  QString error;
  QVERIFY(!u.build(chainAt(QDate(2026, 1, 29), 17000, 18000, 50), "NIFTY",
                   QDate(2026, 2, 10), 2, &error));
  QVERIFY(error.contains("NIFTY"));
  QVERIFY(u.isEmpty());
}

void TestInstrumentUniverse::testStrikeSpacingUsesSmallestGap() {
  QCOMPARE(InstrumentUniverse::detectStrikeSpacing({17000, 17100, 17150, 17200}), 50.0);
  QCOMPARE(InstrumentUniverse::detectStrikeSpacing({17000, 17050}), 50.0);
  QCOMPARE(InstrumentUniverse::detectStrikeSpacing({17000}), 0.0);
  QCOMPARE(InstrumentUniverse::detectStrikeSpacing({}), 0.0);
}

void TestInstrumentUniverse::testSingleStrikeFails() {
  InstrumentUniverse u;
  QString error;
  QVERIFY(!u.build(chainAt(QDate(2026, 2, 26), 17000, 17000, 50), "NIFTY",
                   QDate(2026, 2, 10), 2, &error));
  QVERIFY(error.contains("spacing"));
}

void TestInstrumentUniverse::testLoadFromMasterFile() {
  QTemporaryFile file;
  QVERIFY(file.open());
  {
    QTextStream out(&file);
    for (int strike = 24400; strike <= 24700; strike += 50) {
      for (int type : {3, 4}) {
        QString suffix = type == 3 ? "CE" : "PE";
        out << "NSEFO|" << (strike * 10 + type) << "|2|NIFTY|NIFTY26FEB" << strike
            << suffix << "|OPTIDX|NIFTY-OPTIDX|1|1000|0.05|1800|0.05|65|1|-1|"
            << "Nifty 50|2026-02-26T14:30:00|" << strike << "|" << type
            << "|NIFTY 26FEB2026 " << suffix << " " << strike << "\n";
      }
    }
    out << "NSEFO|1|1|NIFTY|NIFTY26FEBFUT|FUTIDX|NIFTY-FUTIDX|1|1000|0.05|1800|"
           "0.05|65|1|-1|Nifty 50|2026-02-26T14:30:00|-1|0|NIFTY 26FEB2026\n";
  }
  file.close();

  InstrumentUniverse u;
  QString error;
  QVERIFY2(u.loadFromMasterFile(file.fileName(), "NIFTY", QDate(2026, 2, 1), &error),
           qPrintable(error));
  QCOMPARE(u.contracts().size(), 14);
  QCOMPARE(u.strikes().size(), 7);
  QCOMPARE(u.strikeSpacing(), 50.0);
  QCOMPARE(u.contracts().first().lotSize, 65);
}

void TestInstrumentUniverse::testMissingMasterFile() {
  InstrumentUniverse u;
  QString error;
  QVERIFY(!u.loadFromMasterFile("/nonexistent/master.txt", "NIFTY",
                                QDate(2026, 2, 1), &error));
  QVERIFY(error.contains("/nonexistent/master.txt"));
}

QTEST_MAIN(TestInstrumentUniverse)
#include "test_instrument_universe.moc"
