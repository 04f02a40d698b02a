#include "services/StrategyConfig.h"
#include "utils/ConfigLoader.h"
#include <QTemporaryFile>
#include <QtTest>

/**
 * Tests for ConfigLoader (INI parsing) and the StrategyConfig view on it.
 */
class TestConfigLoader : public QObject {
  Q_OBJECT

private slots:
  void testSectionsAndComments();
  void testTypedGetters();
  void testLoadFromFile();
  void testMissingFile();
  void testStrategyDefaults();
  void testStrategyFromConfig();
  void testStrategyValidation();
};

namespace {

const char *SAMPLE_INI = R"(
# XTS endpoints
[XTS]
url = https://xts.example.com
mdurl = https://xts.example.com/apimarketdata

[CREDENTIALS]
marketdata_appkey = md-key
marketdata_secretkey = md-secret
interactive_appkey = ia-key
interactive_secretkey = ia-secret
; source omitted

[STRATEGY]
underlying = BANKNIFTY
strike_window = 8
price_tolerance = 0.15
similarity_tolerance = 0.04
stoploss_fraction = 0.3
lot_multiplier = 2
product = NRML

[UNDERLYING]
exchange = NSECM
symbol = NIFTY BANK
instrument_id = 26001

[LOGGING]
directory = /tmp/strangle-logs
debug = yes
)";

} // namespace

void TestConfigLoader::testSectionsAndComments() {
  ConfigLoader config;
  config.loadFromString(SAMPLE_INI);

  QVERIFY(config.isLoaded());
  QCOMPARE(config.getXTSUrl(), QString("https://xts.example.com"));
  QCOMPARE(config.getXTSMDUrl(), QString("https://xts.example.com/apimarketdata"));
  QCOMPARE(config.getMarketDataAppKey(), QString("md-key"));
  QCOMPARE(config.getInteractiveSecretKey(), QString("ia-secret"));
  QCOMPARE(config.getSource(), QString("WEBAPI"));
  QCOMPARE(config.getValue("XTS", "missing", "fallback"), QString("fallback"));
}

void TestConfigLoader::testTypedGetters() {
  ConfigLoader config;
  config.loadFromString("[A]\nn = 42\nx = 0.25\nbad = abc\nflag = false\n");

  QCOMPARE(config.getInt("A", "n"), 42);
  QCOMPARE(config.getDouble("A", "x"), 0.25);
  QCOMPARE(config.getInt("A", "bad", 7), 7);
  QCOMPARE(config.getDouble("A", "bad", 1.5), 1.5);
  QCOMPARE(config.getBool("A", "flag", true), false);
  QCOMPARE(config.getBool("A", "missing", true), true);
}

void TestConfigLoader::testLoadFromFile() {
  QTemporaryFile file;
  QVERIFY(file.open());
  file.write(SAMPLE_INI);
  file.close();

  ConfigLoader config;
  QVERIFY(config.load(file.fileName()));
  QCOMPARE(config.getLogDirectory(), QString("/tmp/strangle-logs"));
  QVERIFY(config.getDebugLogging());
}

void TestConfigLoader::testMissingFile() {
  ConfigLoader config;
  QVERIFY(!config.load("/nonexistent/config.ini"));
  QVERIFY(!config.isLoaded());
  QCOMPARE(config.getLogDirectory(), QString("logs"));
  QVERIFY(!config.getDebugLogging());
}

void TestConfigLoader::testStrategyDefaults() {
  ConfigLoader empty;
  StrategyConfig s = StrategyConfig::fromConfig(empty);

  QCOMPARE(s.underlying, QString("NIFTY"));
  QCOMPARE(s.underlyingSymbol, QString("NIFTY 50"));
  QCOMPARE(s.strikeWindow, 10);
  QCOMPARE(s.priceTolerance, 0.10);
  QCOMPARE(s.similarityTolerance, 0.05);
  QCOMPARE(s.stopLossFraction, 0.20);
  QCOMPARE(s.lotMultiplier, 1);
  QCOMPARE(s.productType, QString("MIS"));
  QVERIFY(s.masterFile.isEmpty());
  QVERIFY(s.isValid());
}

void TestConfigLoader::testStrategyFromConfig() {
  ConfigLoader config;
  config.loadFromString(SAMPLE_INI);
  StrategyConfig s = StrategyConfig::fromConfig(config);

  QCOMPARE(s.underlying, QString("BANKNIFTY"));
  QCOMPARE(s.underlyingSymbol, QString("NIFTY BANK"));
  QCOMPARE(s.underlyingInstrumentID, static_cast<int64_t>(26001));
  QCOMPARE(s.strikeWindow, 8);
  QCOMPARE(s.priceTolerance, 0.15);
  QCOMPARE(s.similarityTolerance, 0.04);
  QCOMPARE(s.stopLossFraction, 0.3);
  QCOMPARE(s.lotMultiplier, 2);
  QCOMPARE(s.productType, QString("NRML"));
}

void TestConfigLoader::testStrategyValidation() {
  StrategyConfig s;
  QString error;

  s.strikeWindow = 0;
  QVERIFY(!s.isValid(&error));
  QVERIFY(error.contains("strike_window"));

  s = StrategyConfig();
  s.priceTolerance = 1.5;
  QVERIFY(!s.isValid(&error));
  QVERIFY(error.contains("price_tolerance"));

  s = StrategyConfig();
  s.lotMultiplier = -1;
  QVERIFY(!s.isValid(&error));
  QVERIFY(error.contains("lot_multiplier"));
}

QTEST_MAIN(TestConfigLoader)
#include "test_config_loader.moc"
