#include "TestFakes.h"
#include "app/ConsolePrompt.h"
#include <QtTest>

using namespace TestFakes;

/**
 * Tests for the interactive order queue: input validation, re-prompting on
 * bad times and rendering of job events.
 */
class TestConsolePrompt : public QObject {
  Q_OBJECT

private slots:
  void init();

  void testParseTargetPrice();
  void testStopImmediately();
  void testInvalidOptionReprompts();
  void testInvalidPriceIsRejected();
  void testBadTimeIsAskedAgain();
  void testPastTimeIsAskedAgain();
  void testQueuedOrderRunsAndPrints();
  void testNoMatchListMarksFirstRow();

private:
  InstrumentUniverse m_universe;
  QScopedPointer<FakeQuoteProvider> m_quotes;
  QScopedPointer<FakeOrderSubmitter> m_orders;
};

namespace {

QString futureTime(int secondsAhead) {
  return QDateTime::currentDateTime().addSecs(secondsAhead).toString("HH:mm:ss");
}

bool nearMidnight() {
  return QTime::currentTime() > QTime(23, 58, 0) ||
         QTime::currentTime() < QTime(0, 2, 0);
}

} // namespace

void TestConsolePrompt::init() {
  QVERIFY(m_universe.build(makeChain(16000, 20000, 50), "NIFTY",
                           QDate(2026, 2, 1)));
  m_quotes.reset(new FakeQuoteProvider);
  m_quotes->defaultPremium = 500.0;
  m_quotes->setPremium(17900, OptionType::Call, 92);
  m_quotes->setPremium(17750, OptionType::Put, 98);
  m_orders.reset(new FakeOrderSubmitter);
}

void TestConsolePrompt::testParseTargetPrice() {
  double price = 0.0;
  QVERIFY(ConsolePrompt::parseTargetPrice("100", price));
  QCOMPARE(price, 100.0);
  QVERIFY(ConsolePrompt::parseTargetPrice(" 97.5 ", price));
  QCOMPARE(price, 97.5);
  QVERIFY(!ConsolePrompt::parseTargetPrice("0", price));
  QVERIFY(!ConsolePrompt::parseTargetPrice("-10", price));
  QVERIFY(!ConsolePrompt::parseTargetPrice("abc", price));
}

void TestConsolePrompt::testStopImmediately() {
  StrangleService service(m_universe, *m_quotes, *m_orders, StrategyConfig());
  QString input = "0\n";
  QString output;
  QTextStream in(&input);
  QTextStream out(&output);

  ConsolePrompt prompt(service, in, out);
  prompt.run();

  QVERIFY(output.contains("1.Add order to queue"));
  QVERIFY(output.contains("DO NOT CLOSE THIS PROGRAM"));
  QCOMPARE(service.pendingJobs(), 0);
}

void TestConsolePrompt::testInvalidOptionReprompts() {
  StrangleService service(m_universe, *m_quotes, *m_orders, StrategyConfig());
  QString input = "7\n0\n";
  QString output;
  QTextStream in(&input);
  QTextStream out(&output);

  ConsolePrompt(service, in, out).run();

  QVERIFY(output.contains("Invalid option '7'"));
  QCOMPARE(output.count("Select option:"), 2);
}

void TestConsolePrompt::testInvalidPriceIsRejected() {
  StrangleService service(m_universe, *m_quotes, *m_orders, StrategyConfig());
  QString input = "1\nabc\n0\n";
  QString output;
  QTextStream in(&input);
  QTextStream out(&output);

  ConsolePrompt(service, in, out).run();

  QVERIFY(output.contains("Invalid price 'abc'"));
  QVERIFY(service.armedJobs().isEmpty());
}

void TestConsolePrompt::testBadTimeIsAskedAgain() {
  if (nearMidnight())
    QSKIP("Time of day entry cannot cross midnight");

  StrangleService service(m_universe, *m_quotes, *m_orders, StrategyConfig());
  QString input = "1\n100\n25:99\n" + futureTime(2) + "\n0\n";
  QString output;
  QTextStream in(&input);
  QTextStream out(&output);

  ConsolePrompt(service, in, out).run();

  QVERIFY(output.contains("Invalid time '25:99'"));
  QCOMPARE(output.count("Enter time in 24H format"), 2);
  QVERIFY(output.contains("Order added to queue"));
  QCOMPARE(service.armedJobs().size(), 1);
  QCOMPARE(service.armedJobs().first().targetPrice, 100.0);
  service.waitForAll();
}

void TestConsolePrompt::testPastTimeIsAskedAgain() {
  if (nearMidnight())
    QSKIP("Time of day entry cannot cross midnight");

  StrangleService service(m_universe, *m_quotes, *m_orders, StrategyConfig());
  QString input = "1\n100\n" + futureTime(-60) + "\n" + futureTime(2) + "\n0\n";
  QString output;
  QTextStream in(&input);
  QTextStream out(&output);

  ConsolePrompt prompt(service, in, out);
  service.setEventSink(prompt.eventSink());
  prompt.run();
  service.waitForAll();

  QVERIFY(output.contains("Must enter future time"));
  QVERIFY(output.contains("Order added to queue"));
}

void TestConsolePrompt::testQueuedOrderRunsAndPrints() {
  if (nearMidnight())
    QSKIP("Time of day entry cannot cross midnight");

  QString output;
  QTextStream out(&output);
  QString input = "1\n100\n" + futureTime(2) + "\n0\n";
  QTextStream in(&input);

  {
    StrangleService service(m_universe, *m_quotes, *m_orders, StrategyConfig());
    ConsolePrompt prompt(service, in, out);
    service.setEventSink(prompt.eventSink());
    prompt.run();
    service.waitForAll();
    service.setEventSink(nullptr);
  }

  QVERIFY(output.contains("EXECUTING ORDER"));
  QVERIFY(output.contains("strike: 17900CE, ltp: 92"));
  QVERIFY(output.contains("strike: 17750PE, ltp: 98"));
  QCOMPARE(output.count("Order id:"), 2);
  QVERIFY(output.contains("Both legs placed"));
  QCOMPARE(m_orders->orders().size(), 2);
}

void TestConsolePrompt::testNoMatchListMarksFirstRow() {
  StrangleService service(m_universe, *m_quotes, *m_orders, StrategyConfig());
  QString input;
  QString output;
  QTextStream in(&input);
  QTextStream out(&output);
  ConsolePrompt prompt(service, in, out);

  ExecutionEvent event;
  event.jobId = 3;
  event.type = ExecutionEvent::Type::NoMatch;
  event.targetPrice = 1000.0;
  SimilarPair nearPair;
  nearPair.strikeDistance = 100;
  nearPair.call = QuotedStrike(17900, 40);
  nearPair.put = QuotedStrike(17800, 41);
  SimilarPair farPair;
  farPair.strikeDistance = 300;
  farPair.call = QuotedStrike(18000, 20);
  farPair.put = QuotedStrike(17700, 20.5);
  event.similarPairs << nearPair << farPair;

  prompt.printEvent(event);

  QVERIFY(output.contains("There is no option instrument trading near 1000"));
  QStringList lines = output.split('\n', Qt::SkipEmptyParts);
  QString first, second;
  for (const QString &line : lines) {
    if (line.contains("0 strike: 17900CE"))
      first = line;
    if (line.contains("1 strike: 18000CE"))
      second = line;
  }
  QVERIFY(first.contains("(near to ATM)"));
  QVERIFY(!second.isEmpty());
  QVERIFY(!second.contains("(near to ATM)"));
}

QTEST_MAIN(TestConsolePrompt)
#include "test_console_prompt.moc"
