#ifndef EXECUTION_EVENT_H
#define EXECUTION_EVENT_H

#include "services/StrikeMatcher.h"
#include <QDateTime>
#include <QString>
#include <QVector>
#include <functional>

/**
 * @brief Failure taxonomy of a scheduled job.
 *
 * "No match" is not listed: it is a normal outcome (ReportingNoMatch).
 */
enum class ExecutionError {
  None,
  InvalidTime,      // schedule request not strictly in the future
  InvalidRequest,   // schedule request with a non-positive target price
  ScheduleFailed,   // worker thread for the job could not be started
  QuoteUnavailable, // reference or candidate quote fetch failed
  OrderRejected,    // one leg rejected, the other leg is still attempted
  InstrumentLookup  // matched strike missing from the candidate set
};

enum class ExecutionState {
  Armed,
  Refreshing,
  Matching,
  Executing,
  ReportingNoMatch,
  Done,
  Error
};

QString toString(ExecutionError error);
QString toString(ExecutionState state);

/**
 * @brief Outcome of one leg's order submission.
 */
struct LegOrder {
  bool attempted = false;
  bool success = false;
  QString tradingSymbol;
  double strike = 0.0;
  double matchedLtp = 0.0;
  int quantity = 0;
  double stopLossPrice = 0.0;
  QString orderId;
  QString error;
};

/**
 * @brief Progress/diagnostic event for the caller to render.
 */
struct ExecutionEvent {
  enum class Type {
    JobArmed,
    RefreshStarted,
    SnapshotReady,
    QuotesFetched,
    MatchFound,
    NoMatch,
    OrderPlaced,
    OrderFailed,
    JobFailed,
    JobCompleted
  };

  quint64 jobId = 0;
  Type type = Type::JobArmed;
  ExecutionState state = ExecutionState::Armed;
  ExecutionError error = ExecutionError::None;
  QString message;
  QDateTime timestamp;

  // Payload, filled depending on type
  double targetPrice = 0.0;
  double atmStrike = 0.0;
  MatchResult match;                 // MatchFound
  QVector<SimilarPair> similarPairs; // NoMatch
  LegOrder leg;                      // OrderPlaced / OrderFailed
};

QString toString(ExecutionEvent::Type type);

// May be invoked concurrently from several job threads
using EventSink = std::function<void(const ExecutionEvent &)>;

#endif // EXECUTION_EVENT_H
