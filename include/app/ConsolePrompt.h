#ifndef CONSOLE_PROMPT_H
#define CONSOLE_PROMPT_H

#include "services/StrangleService.h"
#include <QMutex>
#include <QTextStream>

/**
 * @brief Interactive order queue on a text console.
 *
 *   1.Add order to queue
 *   0.exit add order
 *
 * Adding asks for a target price, then a 24h time (HH:MM or HH:MM:SS, today).
 * Unparsable or past times are reported and the time is asked again.
 *
 * Job events arrive on worker threads; all output goes through one mutex so
 * event lines never interleave with the prompt mid-line.
 */
class ConsolePrompt {
public:
  ConsolePrompt(StrangleService &service, QTextStream &in, QTextStream &out);

  // Sink to install with StrangleService::setEventSink()
  EventSink eventSink();

  // Runs until "0" or end of input; does not wait for armed jobs
  void run();

  void printSnapshot(const MarketSnapshot &snapshot);
  void printEvent(const ExecutionEvent &event);

  // Positive number, e.g. "100" or "97.5"
  static bool parseTargetPrice(const QString &text, double &price);

private:
  bool readLine(QString &line);
  void write(const QString &text);
  void addOrder();

  StrangleService &m_service;
  QTextStream &m_in;
  QTextStream &m_out;
  QMutex m_outputMutex;
};

#endif // CONSOLE_PROMPT_H
