#include "services/OrderScheduler.h"
#include <QDebug>
#include <algorithm>
#include <chrono>
#include <exception>
#include <system_error>

OrderScheduler::~OrderScheduler() { waitForAll(); }

ScheduleResult OrderScheduler::scheduleAt(const QDateTime &fireAt,
                                          Action action) {
  ScheduleResult result;

  const QDateTime now = QDateTime::currentDateTime();
  if (!fireAt.isValid() || fireAt <= now) {
    result.error = ExecutionError::InvalidTime;
    result.errorMessage =
        QString("Must enter future time (requested %1, now %2)")
            .arg(fireAt.isValid() ? fireAt.toString("HH:mm:ss.zzz")
                                  : QString("invalid"))
            .arg(now.toString("HH:mm:ss.zzz"));
    qWarning() << "[Scheduler]" << result.errorMessage;
    return result;
  }

  JobHandle handle;
  handle.id = m_nextId.fetch_add(1);
  handle.fireAt = fireAt;

  {
    std::unique_lock<std::mutex> lock(m_mutex);
    reapFinished(lock);

    std::thread worker;
    try {
      worker = startWorker(handle, std::move(action));
    } catch (const std::system_error &e) {
      result.error = ExecutionError::ScheduleFailed;
      result.errorMessage =
          QString("Could not start worker for job %1: %2").arg(handle.id).arg(e.what());
      qCritical() << "[Scheduler]" << result.errorMessage;
      return result;
    }

    // Worker reports itself finished under m_mutex, so it cannot run ahead
    // of this bookkeeping
    m_workers.emplace(handle.id, std::move(worker));
    ++m_pending;
  }

  qDebug() << "[Scheduler] Job" << handle.id << "armed for"
           << fireAt.toString("yyyy-MM-dd HH:mm:ss") << "delay:"
           << now.msecsTo(fireAt) / 1000.0 << "s";

  result.success = true;
  result.handle = handle;
  return result;
}

std::thread OrderScheduler::startWorker(JobHandle handle, Action action) {
  return std::thread(&OrderScheduler::runJob, this, handle, std::move(action));
}

void OrderScheduler::runJob(JobHandle handle, Action action) {
  // Sleep in slices so a wall-clock adjustment cannot make us fire early
  for (;;) {
    qint64 remaining = QDateTime::currentDateTime().msecsTo(handle.fireAt);
    if (remaining < 0)
      break;
    std::this_thread::sleep_for(
        std::chrono::milliseconds(std::min<qint64>(remaining + 1, 1000)));
  }

  qDebug() << "[Scheduler] Job" << handle.id << "fired";

  try {
    if (action)
      action(handle);
  } catch (const std::exception &e) {
    qCritical() << "[Scheduler] Job" << handle.id
                << "terminated with exception:" << e.what();
  } catch (...) {
    qCritical() << "[Scheduler] Job" << handle.id
                << "terminated with unknown exception";
  }

  std::lock_guard<std::mutex> lock(m_mutex);
  m_finished.push_back(handle.id);
  --m_pending;
  m_idle.notify_all();
}

void OrderScheduler::reapFinished(std::unique_lock<std::mutex> &lock) {
  Q_UNUSED(lock);
  for (quint64 id : m_finished) {
    auto it = m_workers.find(id);
    if (it != m_workers.end()) {
      // Worker already left its critical section, join returns promptly
      it->second.join();
      m_workers.erase(it);
    }
  }
  m_finished.clear();
}

int OrderScheduler::pendingCount() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_pending;
}

void OrderScheduler::waitForAll() {
  std::unique_lock<std::mutex> lock(m_mutex);
  m_idle.wait(lock, [this]() { return m_pending == 0; });
  reapFinished(lock);
}
