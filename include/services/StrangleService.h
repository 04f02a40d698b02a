#ifndef STRANGLE_SERVICE_H
#define STRANGLE_SERVICE_H

#include "services/ExecutionSequencer.h"
#include "services/OrderScheduler.h"
#include <QFuture>
#include <QVector>
#include <mutex>
#include <shared_mutex>

/**
 * @brief A target premium armed for a fire instant.
 */
struct ScheduledOrderJob {
  double targetPrice = 0.0;
  JobHandle handle;
};

struct SnapshotRefreshResult {
  bool success = false;
  MarketSnapshot snapshot;
  QString error;
};

/**
 * @brief Caller-facing core: schedules strangle jobs and keeps the ad hoc
 * snapshot slot.
 *
 * Jobs never read the shared slot; each fired job builds its own snapshot.
 * The slot is only for display (startup refresh, status).
 *
 * Usage:
 * ```cpp
 * StrangleService service(universe, mdClient, iaClient, config);
 * service.setEventSink([](const ExecutionEvent &e) { ... });
 * auto result = service.requestSchedule(100.0, fireAt);
 * if (!result.success) qWarning() << result.errorMessage;
 * service.waitForAll();
 * ```
 */
class StrangleService {
public:
  StrangleService(const InstrumentUniverse &universe, IQuoteProvider &quotes,
                  IOrderSubmitter &orders, const StrategyConfig &config);
  ~StrangleService();

  StrangleService(const StrangleService &) = delete;
  StrangleService &operator=(const StrangleService &) = delete;

  // Set before the first requestSchedule(); invoked from worker threads
  void setEventSink(EventSink sink);

  /**
   * @brief Arm a job selling the strangle priced near @p targetPrice
   * @return InvalidTime failure if @p fireAt is not strictly in the future,
   * InvalidRequest if @p targetPrice is not positive; nothing is armed then.
   * The sink receives JobArmed with no lock held, so it may call back in.
   */
  ScheduleResult requestSchedule(double targetPrice, const QDateTime &fireAt);

  // Fetch reference price now and replace the shared snapshot slot
  SnapshotRefreshResult refreshSnapshot();

  // refreshSnapshot() on the global thread pool
  QFuture<SnapshotRefreshResult> refreshSnapshotAsync();

  MarketSnapshot currentSnapshot() const;

  QVector<ScheduledOrderJob> armedJobs() const;
  int pendingJobs() const;
  void waitForAll();

private:
  void runJob(const JobHandle &handle, double targetPrice);
  void publish(const ExecutionEvent &event) const;
  void forgetJob(quint64 jobId);

  StrategyConfig m_config;
  EventSink m_sink;
  ExecutionSequencer m_sequencer;

  mutable std::shared_mutex m_snapshotMutex;
  MarketSnapshot m_snapshot;

  mutable std::mutex m_jobsMutex;
  QVector<ScheduledOrderJob> m_armed;

  // Declared last: destroyed first, so running jobs finish while the
  // members they use are still alive
  OrderScheduler m_scheduler;
};

#endif // STRANGLE_SERVICE_H
