#include "app/ConsolePrompt.h"
#include "utils/DateUtils.h"
#include <QMutexLocker>

ConsolePrompt::ConsolePrompt(StrangleService &service, QTextStream &in,
                             QTextStream &out)
    : m_service(service), m_in(in), m_out(out) {}

EventSink ConsolePrompt::eventSink() {
  return [this](const ExecutionEvent &event) { printEvent(event); };
}

bool ConsolePrompt::parseTargetPrice(const QString &text, double &price) {
  bool ok = false;
  double value = text.trimmed().toDouble(&ok);
  if (!ok || value <= 0.0)
    return false;
  price = value;
  return true;
}

bool ConsolePrompt::readLine(QString &line) {
  if (m_in.atEnd())
    return false;
  line = m_in.readLine();
  return !line.isNull();
}

void ConsolePrompt::write(const QString &text) {
  QMutexLocker locker(&m_outputMutex);
  m_out << text;
  m_out.flush();
}

void ConsolePrompt::run() {
  QString line;
  for (;;) {
    write("\n1.Add order to queue\n0.exit add order\nSelect option: ");
    if (!readLine(line))
      break;

    const QString choice = line.trimmed();
    if (choice == "0")
      break;
    if (choice != "1") {
      write(QString("Invalid option '%1'\n").arg(choice));
      continue;
    }
    addOrder();
  }

  write("DO NOT CLOSE THIS PROGRAM, otherwise your orders in queue will not "
        "be executed\nThis program will automatically exit when there are no "
        "orders in queue\n");
}

void ConsolePrompt::addOrder() {
  QString line;
  double price = 0.0;
  write("Enter price: ");
  if (!readLine(line))
    return;
  if (!parseTargetPrice(line, price)) {
    write(QString("Invalid price '%1'\n").arg(line.trimmed()));
    return;
  }

  for (;;) {
    const QDateTime now = QDateTime::currentDateTime();
    write(QString("when do you want to execute this order\n"
                  "Enter time in 24H format (HH:MM) (%1): ")
              .arg(now.toString("HH:mm:ss")));
    if (!readLine(line))
      return;

    QDateTime fireAt = DateUtils::parseTimeOfDay(line, now);
    if (!fireAt.isValid()) {
      write(QString("Invalid time '%1', expected HH:MM or HH:MM:SS\n")
                .arg(line.trimmed()));
      continue;
    }

    ScheduleResult result = m_service.requestSchedule(price, fireAt);
    if (!result.success) {
      write(result.errorMessage + "\n");
      if (result.error == ExecutionError::InvalidTime)
        continue;
      return;
    }

    write(QString("Order added to queue, successfully (job %1, in %2 s)\n")
              .arg(result.handle.id)
              .arg(QDateTime::currentDateTime().msecsTo(fireAt) / 1000.0, 0,
                   'f', 1));
    return;
  }
}

void ConsolePrompt::printSnapshot(const MarketSnapshot &snapshot) {
  write(QString("Reference %1, ATM %2, strike spacing %3, window [%4, %5]\n"
                "%6 OTM calls, %7 OTM puts\n")
            .arg(snapshot.referencePrice)
            .arg(snapshot.atmStrike)
            .arg(snapshot.strikeSpacing)
            .arg(snapshot.windowLow)
            .arg(snapshot.windowHigh)
            .arg(snapshot.callCandidates.size())
            .arg(snapshot.putCandidates.size()));
}

void ConsolePrompt::printEvent(const ExecutionEvent &event) {
  const QString prefix = QString("[job %1] ").arg(event.jobId);
  QString text;

  switch (event.type) {
  case ExecutionEvent::Type::JobArmed:
    // Confirmed by addOrder()
    return;
  case ExecutionEvent::Type::RefreshStarted:
    text = "\n" + QString(100, '*') + "\n" + prefix +
           QString("EXECUTING ORDER, target %1\n").arg(event.targetPrice) +
           prefix + "Refreshing data...\n";
    break;
  case ExecutionEvent::Type::SnapshotReady:
    text = prefix + event.message + "\n" + prefix + "fetching LTPs...\n";
    break;
  case ExecutionEvent::Type::QuotesFetched:
    text = prefix + "matching LTPs...\n";
    break;
  case ExecutionEvent::Type::MatchFound:
    text = prefix + QString("strike: %1CE, ltp: %2\n")
                        .arg(event.match.call.strike)
                        .arg(event.match.call.ltp) +
           prefix + QString("strike: %1PE, ltp: %2\n")
                        .arg(event.match.put.strike)
                        .arg(event.match.put.ltp);
    break;
  case ExecutionEvent::Type::NoMatch:
    text = prefix + QString("There is no option instrument trading near %1\n")
                        .arg(event.targetPrice);
    text += prefix + "strikes with similar ltp:\n";
    for (int i = 0; i < event.similarPairs.size(); ++i) {
      const SimilarPair &pair = event.similarPairs[i];
      text += prefix + QString("%1 strike: %2CE -> ltp: %3, strike: %4PE -> "
                               "ltp: %5 %6\n")
                           .arg(i)
                           .arg(pair.call.strike)
                           .arg(pair.call.ltp)
                           .arg(pair.put.strike)
                           .arg(pair.put.ltp)
                           .arg(i == 0 ? QString("(near to ATM)") : QString());
    }
    break;
  case ExecutionEvent::Type::OrderPlaced:
    text = prefix + QString("placed sell order of %1 (qty %2, SL %3), Order "
                            "id: %4\n")
                        .arg(event.leg.tradingSymbol)
                        .arg(event.leg.quantity)
                        .arg(event.leg.stopLossPrice, 0, 'f', 2)
                        .arg(event.leg.orderId);
    break;
  case ExecutionEvent::Type::OrderFailed:
    text = prefix + QString("sell order of %1 FAILED: %2\n")
                        .arg(event.leg.tradingSymbol, event.leg.error);
    break;
  case ExecutionEvent::Type::JobFailed:
    text = prefix + "FAILED " + event.message + "\n";
    break;
  case ExecutionEvent::Type::JobCompleted:
    text = prefix + event.message + "\n";
    break;
  }

  write(text);
}
