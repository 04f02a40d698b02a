#ifndef EXECUTION_SEQUENCER_H
#define EXECUTION_SEQUENCER_H

#include "api/IOrderSubmitter.h"
#include "api/IQuoteProvider.h"
#include "repository/InstrumentUniverse.h"
#include "services/ExecutionEvent.h"
#include "services/SnapshotBuilder.h"
#include "services/StrategyConfig.h"
#include "services/StrikeMatcher.h"

/**
 * @brief Everything one fired job did, for the caller and for tests.
 */
struct ExecutionOutcome {
  quint64 jobId = 0;
  double targetPrice = 0.0;
  ExecutionState finalState = ExecutionState::Armed;
  ExecutionError error = ExecutionError::None; // first error seen
  QString errorMessage;

  MarketSnapshot snapshot;
  MatchResult match;
  QVector<SimilarPair> similarPairs; // only when no match
  LegOrder callOrder;
  LegOrder putOrder;
};

/**
 * @brief Runs one fired job to completion.
 *
 *   Armed -> Refreshing -> Matching -> Executing        -> Done
 *                                   -> ReportingNoMatch -> Done
 *   any non-terminal state -> Error
 *
 * Stateless apart from its collaborators: several jobs may call run() on
 * the same sequencer concurrently, each builds its own snapshot.
 */
class ExecutionSequencer {
public:
  ExecutionSequencer(const InstrumentUniverse &universe,
                     IQuoteProvider &quotes, IOrderSubmitter &orders,
                     const StrategyConfig &config, EventSink sink = nullptr);

  ExecutionOutcome run(quint64 jobId, double targetPrice) const;

  /**
   * @brief Fetch the reference price and build a snapshot (no matching)
   * @return false with @p error filled if the quote is unavailable
   */
  bool refreshSnapshot(MarketSnapshot &snapshot, QString &error) const;

private:
  void transition(ExecutionOutcome &outcome, ExecutionState next) const;
  void fail(ExecutionOutcome &outcome, ExecutionError error,
            const QString &message) const;
  void emitEvent(const ExecutionOutcome &outcome, ExecutionEvent::Type type,
                 const QString &message) const;

  bool fetchQuotes(const QVector<ContractData> &candidates,
                   QVector<QuotedStrike> &quoted, QString &error) const;
  void executeMatch(ExecutionOutcome &outcome) const;
  LegOrder submitLeg(const ExecutionOutcome &outcome,
                     const ContractData &contract,
                     const QuotedStrike &matched) const;

  const InstrumentUniverse &m_universe;
  IQuoteProvider &m_quotes;
  IOrderSubmitter &m_orders;
  StrategyConfig m_config;
  EventSink m_sink;
};

#endif // EXECUTION_SEQUENCER_H
