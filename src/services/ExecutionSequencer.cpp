#include "services/ExecutionSequencer.h"
#include <QDebug>

ExecutionSequencer::ExecutionSequencer(const InstrumentUniverse &universe,
                                       IQuoteProvider &quotes,
                                       IOrderSubmitter &orders,
                                       const StrategyConfig &config,
                                       EventSink sink)
    : m_universe(universe), m_quotes(quotes), m_orders(orders),
      m_config(config), m_sink(std::move(sink)) {}

bool ExecutionSequencer::refreshSnapshot(MarketSnapshot &snapshot,
                                         QString &error) const {
  QuoteResult reference = m_quotes.getLastPrice(m_config.underlyingExchange,
                                                m_config.underlyingSymbol);
  if (!reference.success) {
    error = QString("Reference quote for %1 unavailable: %2")
                .arg(m_config.underlyingSymbol, reference.error);
    return false;
  }

  snapshot = SnapshotBuilder::build(reference.ltp, m_universe.strikeSpacing(),
                                    m_universe.contracts(),
                                    m_config.strikeWindow);
  if (!snapshot.isValid) {
    error = QString("Cannot build snapshot from reference %1 (spacing %2)")
                .arg(reference.ltp)
                .arg(m_universe.strikeSpacing());
    return false;
  }
  return true;
}

ExecutionOutcome ExecutionSequencer::run(quint64 jobId,
                                         double targetPrice) const {
  ExecutionOutcome outcome;
  outcome.jobId = jobId;
  outcome.targetPrice = targetPrice;

  // Refreshing
  transition(outcome, ExecutionState::Refreshing);
  emitEvent(outcome, ExecutionEvent::Type::RefreshStarted,
            QString("Fetching %1 reference price").arg(m_config.underlyingSymbol));

  QString error;
  if (!refreshSnapshot(outcome.snapshot, error)) {
    fail(outcome, ExecutionError::QuoteUnavailable, error);
    return outcome;
  }
  emitEvent(outcome, ExecutionEvent::Type::SnapshotReady,
            QString("Reference %1 ATM %2 window [%3, %4] calls %5 puts %6")
                .arg(outcome.snapshot.referencePrice)
                .arg(outcome.snapshot.atmStrike)
                .arg(outcome.snapshot.windowLow)
                .arg(outcome.snapshot.windowHigh)
                .arg(outcome.snapshot.callCandidates.size())
                .arg(outcome.snapshot.putCandidates.size()));

  // Matching
  transition(outcome, ExecutionState::Matching);
  QVector<QuotedStrike> callQuotes;
  QVector<QuotedStrike> putQuotes;
  if (!fetchQuotes(outcome.snapshot.callCandidates, callQuotes, error)) {
    fail(outcome, ExecutionError::QuoteUnavailable,
         "Call quotes unavailable: " + error);
    return outcome;
  }
  if (!fetchQuotes(outcome.snapshot.putCandidates, putQuotes, error)) {
    fail(outcome, ExecutionError::QuoteUnavailable,
         "Put quotes unavailable: " + error);
    return outcome;
  }
  emitEvent(outcome, ExecutionEvent::Type::QuotesFetched,
            QString("%1 call and %2 put quotes")
                .arg(callQuotes.size())
                .arg(putQuotes.size()));

  outcome.match = StrikeMatcher::matchAtPrice(
      targetPrice, callQuotes, putQuotes, m_config.priceTolerance);

  if (!outcome.match.matched) {
    transition(outcome, ExecutionState::ReportingNoMatch);
    outcome.similarPairs = StrikeMatcher::matchBySimilarity(
        callQuotes, putQuotes, m_config.similarityTolerance);
    emitEvent(outcome, ExecutionEvent::Type::NoMatch,
              QString("No strikes near %1, %2 similar pairs")
                  .arg(targetPrice)
                  .arg(outcome.similarPairs.size()));
    transition(outcome, ExecutionState::Done);
    return outcome;
  }

  emitEvent(outcome, ExecutionEvent::Type::MatchFound,
            QString("CE %1 @ %2, PE %3 @ %4")
                .arg(outcome.match.call.strike)
                .arg(outcome.match.call.ltp)
                .arg(outcome.match.put.strike)
                .arg(outcome.match.put.ltp));

  // Executing
  transition(outcome, ExecutionState::Executing);
  executeMatch(outcome);
  if (outcome.finalState == ExecutionState::Error)
    return outcome;

  transition(outcome, ExecutionState::Done);
  return outcome;
}

bool ExecutionSequencer::fetchQuotes(const QVector<ContractData> &candidates,
                                     QVector<QuotedStrike> &quoted,
                                     QString &error) const {
  quoted.clear();
  if (candidates.isEmpty())
    return true;

  QuoteBatchResult batch = m_quotes.getLastPrices(candidates);
  if (!batch.success) {
    error = batch.error;
    return false;
  }
  if (batch.ltps.size() != candidates.size()) {
    error = QString("expected %1 quotes, got %2")
                .arg(candidates.size())
                .arg(batch.ltps.size());
    return false;
  }

  quoted.reserve(candidates.size());
  for (int i = 0; i < candidates.size(); ++i)
    quoted.append(QuotedStrike(candidates[i].strikePrice, batch.ltps[i]));
  return true;
}

void ExecutionSequencer::executeMatch(ExecutionOutcome &outcome) const {
  const ContractData *call = SnapshotBuilder::findByStrike(
      outcome.snapshot.callCandidates, outcome.match.call.strike);
  const ContractData *put = SnapshotBuilder::findByStrike(
      outcome.snapshot.putCandidates, outcome.match.put.strike);

  if (!call || !put) {
    qCritical() << "[Sequencer] Job" << outcome.jobId
                << "matched strike missing from candidates, CE"
                << outcome.match.call.strike << "PE" << outcome.match.put.strike;
    fail(outcome, ExecutionError::InstrumentLookup,
         QString("Matched strike %1 not in candidate set")
             .arg(!call ? outcome.match.call.strike : outcome.match.put.strike));
    return;
  }

  // Legs are independent: a rejected call does not skip the put
  outcome.callOrder = submitLeg(outcome, *call, outcome.match.call);
  outcome.putOrder = submitLeg(outcome, *put, outcome.match.put);

  if (!outcome.callOrder.success || !outcome.putOrder.success) {
    outcome.error = ExecutionError::OrderRejected;
    outcome.errorMessage = !outcome.callOrder.success ? outcome.callOrder.error
                                                      : outcome.putOrder.error;
  }
}

LegOrder ExecutionSequencer::submitLeg(const ExecutionOutcome &outcome,
                                       const ContractData &contract,
                                       const QuotedStrike &matched) const {
  LegOrder leg;
  leg.attempted = true;
  leg.tradingSymbol = contract.tradingSymbol;
  leg.strike = matched.strike;
  leg.matchedLtp = matched.ltp;
  leg.quantity = m_config.lotMultiplier * contract.lotSize;
  leg.stopLossPrice = m_config.stopLossFraction * matched.ltp;

  OrderResult result =
      m_orders.placeSellOrder(contract, leg.quantity, leg.stopLossPrice);
  leg.success = result.success;
  leg.orderId = result.orderId;
  leg.error = result.error;

  ExecutionEvent event;
  event.jobId = outcome.jobId;
  event.state = outcome.finalState;
  event.timestamp = QDateTime::currentDateTime();
  event.targetPrice = outcome.targetPrice;
  event.atmStrike = outcome.snapshot.atmStrike;
  event.leg = leg;

  if (leg.success) {
    event.type = ExecutionEvent::Type::OrderPlaced;
    event.message = QString("SELL %1 x%2 SL %3 order %4")
                        .arg(leg.tradingSymbol)
                        .arg(leg.quantity)
                        .arg(leg.stopLossPrice)
                        .arg(leg.orderId);
    qInfo() << "[Sequencer] Job" << outcome.jobId << event.message;
  } else {
    event.type = ExecutionEvent::Type::OrderFailed;
    event.error = ExecutionError::OrderRejected;
    event.message = QString("SELL %1 x%2 rejected: %3")
                        .arg(leg.tradingSymbol)
                        .arg(leg.quantity)
                        .arg(leg.error);
    qWarning() << "[Sequencer] Job" << outcome.jobId << event.message;
  }

  if (m_sink)
    m_sink(event);
  return leg;
}

void ExecutionSequencer::transition(ExecutionOutcome &outcome,
                                    ExecutionState next) const {
  qDebug() << "[Sequencer] Job" << outcome.jobId << toString(outcome.finalState)
           << "->" << toString(next);
  outcome.finalState = next;
}

void ExecutionSequencer::fail(ExecutionOutcome &outcome, ExecutionError error,
                              const QString &message) const {
  qWarning() << "[Sequencer] Job" << outcome.jobId << "failed in"
             << toString(outcome.finalState) << "-" << toString(error) << ":"
             << message;
  outcome.finalState = ExecutionState::Error;
  outcome.error = error;
  outcome.errorMessage = message;
}

void ExecutionSequencer::emitEvent(const ExecutionOutcome &outcome,
                                   ExecutionEvent::Type type,
                                   const QString &message) const {
  qInfo() << "[Sequencer] Job" << outcome.jobId << toString(type) << message;
  if (!m_sink)
    return;

  ExecutionEvent event;
  event.jobId = outcome.jobId;
  event.type = type;
  event.state = outcome.finalState;
  event.error = outcome.error;
  event.message = message;
  event.timestamp = QDateTime::currentDateTime();
  event.targetPrice = outcome.targetPrice;
  event.atmStrike = outcome.snapshot.atmStrike;
  event.match = outcome.match;
  event.similarPairs = outcome.similarPairs;
  m_sink(event);
}
