#include "services/StrangleService.h"
#include <QDebug>
#include <QtConcurrent>
#include <future>
#include <memory>

StrangleService::StrangleService(const InstrumentUniverse &universe,
                                 IQuoteProvider &quotes,
                                 IOrderSubmitter &orders,
                                 const StrategyConfig &config)
    : m_config(config),
      m_sequencer(universe, quotes, orders, config,
                  [this](const ExecutionEvent &event) { publish(event); }) {}

StrangleService::~StrangleService() { m_scheduler.waitForAll(); }

void StrangleService::setEventSink(EventSink sink) { m_sink = std::move(sink); }

ScheduleResult StrangleService::requestSchedule(double targetPrice,
                                                const QDateTime &fireAt) {
  if (targetPrice <= 0.0) {
    ScheduleResult result;
    result.error = ExecutionError::InvalidRequest;
    result.errorMessage =
        QString("Target price must be positive (got %1)").arg(targetPrice);
    qWarning() << "[StrangleService]" << result.errorMessage;
    return result;
  }

  // Opened once JobArmed is published, the job waits on it before its first
  // step. A broken promise opens it too.
  auto armedGate = std::make_shared<std::promise<void>>();
  std::shared_future<void> armed = armedGate->get_future().share();

  ScheduleResult result = m_scheduler.scheduleAt(
      fireAt, [this, targetPrice, armed](const JobHandle &handle) {
        armed.wait();
        runJob(handle, targetPrice);
      });
  if (!result.success)
    return result;

  ScheduledOrderJob job;
  job.targetPrice = targetPrice;
  job.handle = result.handle;
  {
    std::lock_guard<std::mutex> lock(m_jobsMutex);
    m_armed.append(job);
  }

  qInfo() << "[StrangleService] Job" << job.handle.id << "target" << targetPrice
          << "armed for" << fireAt.toString("HH:mm:ss");

  ExecutionEvent event;
  event.jobId = job.handle.id;
  event.type = ExecutionEvent::Type::JobArmed;
  event.state = ExecutionState::Armed;
  event.timestamp = QDateTime::currentDateTime();
  event.targetPrice = targetPrice;
  event.message = QString("Target %1 armed for %2")
                      .arg(targetPrice)
                      .arg(fireAt.toString("yyyy-MM-dd HH:mm:ss"));
  publish(event);
  armedGate->set_value();

  return result;
}

void StrangleService::runJob(const JobHandle &handle, double targetPrice) {
  // Drops the armed entry on every exit path
  struct ArmedEntry {
    StrangleService *service;
    quint64 jobId;
    ~ArmedEntry() { service->forgetJob(jobId); }
  } entry{this, handle.id};

  ExecutionOutcome outcome = m_sequencer.run(handle.id, targetPrice);

  ExecutionEvent event;
  event.jobId = handle.id;
  event.state = outcome.finalState;
  event.error = outcome.error;
  event.timestamp = QDateTime::currentDateTime();
  event.targetPrice = targetPrice;
  event.atmStrike = outcome.snapshot.atmStrike;
  event.match = outcome.match;
  event.similarPairs = outcome.similarPairs;

  if (outcome.finalState == ExecutionState::Error) {
    event.type = ExecutionEvent::Type::JobFailed;
    event.message = QString("%1: %2").arg(toString(outcome.error),
                                          outcome.errorMessage);
  } else {
    event.type = ExecutionEvent::Type::JobCompleted;
    if (!outcome.match.matched)
      event.message = "No matching strikes, no orders placed";
    else if (outcome.error == ExecutionError::OrderRejected)
      event.message = "Completed with rejected leg: " + outcome.errorMessage;
    else
      event.message = "Both legs placed";
  }
  publish(event);
}

void StrangleService::forgetJob(quint64 jobId) {
  std::lock_guard<std::mutex> lock(m_jobsMutex);
  for (int i = 0; i < m_armed.size(); ++i) {
    if (m_armed[i].handle.id == jobId) {
      m_armed.removeAt(i);
      return;
    }
  }
}

void StrangleService::publish(const ExecutionEvent &event) const {
  if (m_sink)
    m_sink(event);
}

SnapshotRefreshResult StrangleService::refreshSnapshot() {
  SnapshotRefreshResult result;
  MarketSnapshot snapshot;
  if (!m_sequencer.refreshSnapshot(snapshot, result.error)) {
    qWarning() << "[StrangleService] Snapshot refresh failed:" << result.error;
    return result;
  }

  {
    std::unique_lock lock(m_snapshotMutex);
    m_snapshot = snapshot;
  }

  qInfo() << "[StrangleService] Snapshot refreshed: reference"
          << snapshot.referencePrice << "ATM" << snapshot.atmStrike << "calls"
          << snapshot.callCandidates.size() << "puts"
          << snapshot.putCandidates.size();

  result.success = true;
  result.snapshot = snapshot;
  return result;
}

QFuture<SnapshotRefreshResult> StrangleService::refreshSnapshotAsync() {
  return QtConcurrent::run([this]() { return refreshSnapshot(); });
}

MarketSnapshot StrangleService::currentSnapshot() const {
  std::shared_lock lock(m_snapshotMutex);
  return m_snapshot;
}

QVector<ScheduledOrderJob> StrangleService::armedJobs() const {
  std::lock_guard<std::mutex> lock(m_jobsMutex);
  return m_armed;
}

int StrangleService::pendingJobs() const { return m_scheduler.pendingCount(); }

void StrangleService::waitForAll() { m_scheduler.waitForAll(); }
