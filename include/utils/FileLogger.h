#ifndef FILE_LOGGER_H
#define FILE_LOGGER_H

#include <QString>

/**
 * @brief Routes Qt message logging to stderr and a timestamped log file.
 *
 * Lines look like "[2026-02-26 09:15:00.123] [INFO ] message".
 */
namespace FileLogger {

/**
 * @brief Create @p directory, open strangle_seller_<timestamp>.log inside it
 * and install the message handler.
 * @param debugEnabled When false, qDebug() output is dropped
 * @return Path of the log file, empty if the file could not be opened (console
 * logging stays active in that case)
 */
QString setup(const QString &directory, bool debugEnabled);

/**
 * @brief Restore the default handler and close the log file
 */
void cleanup();

} // namespace FileLogger

#endif // FILE_LOGGER_H
