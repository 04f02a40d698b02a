#ifndef DATE_UTILS_H
#define DATE_UTILS_H

#include <QDate>
#include <QDateTime>
#include <QString>
#include <QStringList>

/**
 * @brief Utility class for date and time-of-day parsing
 *
 * Centralizes the expiry parsing used by the master file parser and the
 * time entry used when queueing an order.
 */
class DateUtils {
public:
  /**
   * @brief Parse expiry date from various formats to standardized DDMMMYYYY
   *
   * Handles multiple input formats:
   * - ISO format: "2024-12-26T00:00:00"
   * - YYYYMMDD: "20241226"
   * - YYYY-MM-DD / DD-MM-YYYY / DD/MM/YYYY
   * - Already formatted: "26DEC2024"
   *
   * @param input Raw date string from master file/CSV
   * @param outDDMMMYYYY Output in DDMMMYYYY format (e.g., "26DEC2024")
   * @param outDate Output as QDate for sorting/comparison
   * @return true if parsing successful, false otherwise
   */
  static bool parseExpiryDate(const QString &input, QString &outDDMMMYYYY,
                              QDate &outDate);

  /**
   * @brief Parse a 24H time of day ("HH:MM" or "HH:MM:SS") on the date of
   * @p reference.
   *
   * "HH:MM" means second zero. The result is not checked against
   * @p reference, callers decide whether a past time is acceptable.
   *
   * @return Valid QDateTime on success, invalid QDateTime otherwise
   */
  static QDateTime parseTimeOfDay(const QString &input,
                                  const QDateTime &reference);

  /**
   * @brief Validate if string is in DDMMMYYYY format
   */
  static bool isValidDDMMMYYYY(const QString &date);

private:
  static const QStringList MONTH_NAMES;
};

#endif // DATE_UTILS_H
