#include "utils/FileLogger.h"
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QMutex>
#include <QTextStream>
#include <QtGlobal>
#include <atomic>
#include <cstdio>

namespace {

QFile *logFile = nullptr;
QMutex logMutex;
std::atomic<bool> debugLogging{false};

void messageHandler(QtMsgType type, const QMessageLogContext &context,
                    const QString &msg) {
  Q_UNUSED(context);

  QString level;
  switch (type) {
  case QtDebugMsg:
    if (!debugLogging.load())
      return;
    level = "DEBUG";
    break;
  case QtInfoMsg:
    level = "INFO ";
    break;
  case QtWarningMsg:
    level = "WARN ";
    break;
  case QtCriticalMsg:
    level = "ERROR";
    break;
  case QtFatalMsg:
    level = "FATAL";
    break;
  }

  QString timestamp =
      QDateTime::currentDateTime().toString("yyyy-MM-dd HH:mm:ss.zzz");
  QString logMessage = QString("[%1] [%2] %3\n").arg(timestamp, level, msg);

  QMutexLocker locker(&logMutex);

  fprintf(stderr, "%s", logMessage.toLocal8Bit().constData());

  if (logFile && logFile->isOpen()) {
    QTextStream stream(logFile);
    stream << logMessage;
    stream.flush();
  }
}

} // namespace

namespace FileLogger {

QString setup(const QString &directory, bool debugEnabled) {
  debugLogging.store(debugEnabled);

  QDir().mkpath(directory);

  QString timestamp = QDateTime::currentDateTime().toString("yyyyMMdd_HHmmss");
  QString logFileName =
      QDir(directory).filePath(QString("strangle_seller_%1.log").arg(timestamp));

  {
    QMutexLocker locker(&logMutex);
    logFile = new QFile(logFileName);
    if (!logFile->open(QIODevice::WriteOnly | QIODevice::Append |
                       QIODevice::Text)) {
      fprintf(stderr, "Failed to open log file: %s\n",
              logFileName.toLocal8Bit().constData());
      delete logFile;
      logFile = nullptr;
      logFileName.clear();
    }
  }

  qInstallMessageHandler(messageHandler);
  return logFileName;
}

void cleanup() {
  qInstallMessageHandler(nullptr);

  QMutexLocker locker(&logMutex);
  if (logFile) {
    logFile->close();
    delete logFile;
    logFile = nullptr;
  }
}

} // namespace FileLogger
