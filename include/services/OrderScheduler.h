#ifndef ORDER_SCHEDULER_H
#define ORDER_SCHEDULER_H

#include "services/ExecutionEvent.h"
#include <QDateTime>
#include <QString>
#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

/**
 * @brief Bookkeeping handle of an armed job (no cancellation).
 */
struct JobHandle {
  quint64 id = 0;
  QDateTime fireAt;

  bool isValid() const { return id != 0; }
};

struct ScheduleResult {
  bool success = false;
  JobHandle handle;
  ExecutionError error = ExecutionError::None;
  QString errorMessage;
};

/**
 * @brief Single-shot delayed actions, one worker thread per job.
 *
 * scheduleAt() never blocks: the worker sleeps until the wall clock reaches
 * the fire instant and then runs the action once. Jobs are independent, a
 * slow action does not delay any other job.
 *
 * The destructor waits for every armed job to fire and finish.
 */
class OrderScheduler {
public:
  using Action = std::function<void(const JobHandle &)>;

  OrderScheduler() = default;
  virtual ~OrderScheduler();

  OrderScheduler(const OrderScheduler &) = delete;
  OrderScheduler &operator=(const OrderScheduler &) = delete;

  /**
   * @brief Arm @p action for @p fireAt
   * @return InvalidTime failure if @p fireAt is invalid or not strictly later
   * than now, ScheduleFailed if no worker thread could be started; nothing is
   * armed in either case
   */
  ScheduleResult scheduleAt(const QDateTime &fireAt, Action action);

  // Jobs armed but not yet finished
  int pendingCount() const;

  // Block until every armed job has finished
  void waitForAll();

protected:
  // Starts the worker running runJob(); throws std::system_error on failure
  virtual std::thread startWorker(JobHandle handle, Action action);

  void runJob(JobHandle handle, Action action);

private:
  void reapFinished(std::unique_lock<std::mutex> &lock);

  mutable std::mutex m_mutex;
  std::condition_variable m_idle;
  std::map<quint64, std::thread> m_workers;
  std::vector<quint64> m_finished;
  int m_pending = 0;
  std::atomic<quint64> m_nextId{1};
};

#endif // ORDER_SCHEDULER_H
