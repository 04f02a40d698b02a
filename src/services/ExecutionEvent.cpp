#include "services/ExecutionEvent.h"

QString toString(ExecutionError error) {
  switch (error) {
  case ExecutionError::None:
    return "None";
  case ExecutionError::InvalidTime:
    return "InvalidTime";
  case ExecutionError::InvalidRequest:
    return "InvalidRequest";
  case ExecutionError::ScheduleFailed:
    return "ScheduleFailed";
  case ExecutionError::QuoteUnavailable:
    return "QuoteUnavailable";
  case ExecutionError::OrderRejected:
    return "OrderRejected";
  case ExecutionError::InstrumentLookup:
    return "InstrumentLookup";
  }
  return "Unknown";
}

QString toString(ExecutionState state) {
  switch (state) {
  case ExecutionState::Armed:
    return "ARMED";
  case ExecutionState::Refreshing:
    return "REFRESHING";
  case ExecutionState::Matching:
    return "MATCHING";
  case ExecutionState::Executing:
    return "EXECUTING";
  case ExecutionState::ReportingNoMatch:
    return "REPORTING_NO_MATCH";
  case ExecutionState::Done:
    return "DONE";
  case ExecutionState::Error:
    return "ERROR";
  }
  return "UNKNOWN";
}

QString toString(ExecutionEvent::Type type) {
  switch (type) {
  case ExecutionEvent::Type::JobArmed:
    return "JobArmed";
  case ExecutionEvent::Type::RefreshStarted:
    return "RefreshStarted";
  case ExecutionEvent::Type::SnapshotReady:
    return "SnapshotReady";
  case ExecutionEvent::Type::QuotesFetched:
    return "QuotesFetched";
  case ExecutionEvent::Type::MatchFound:
    return "MatchFound";
  case ExecutionEvent::Type::NoMatch:
    return "NoMatch";
  case ExecutionEvent::Type::OrderPlaced:
    return "OrderPlaced";
  case ExecutionEvent::Type::OrderFailed:
    return "OrderFailed";
  case ExecutionEvent::Type::JobFailed:
    return "JobFailed";
  case ExecutionEvent::Type::JobCompleted:
    return "JobCompleted";
  }
  return "Unknown";
}
