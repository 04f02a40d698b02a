#include "utils/DateUtils.h"
#include <QDebug>
#include <QRegularExpression>
#include <QTime>

// Month names for DDMMMYYYY format
const QStringList DateUtils::MONTH_NAMES = {"",    "JAN", "FEB", "MAR", "APR",
                                            "MAY", "JUN", "JUL", "AUG", "SEP",
                                            "OCT", "NOV", "DEC"};

bool DateUtils::parseExpiryDate(const QString &input, QString &outDDMMMYYYY,
                                QDate &outDate) {
  outDDMMMYYYY.clear();
  outDate = QDate();

  if (input.isEmpty() || input == "N/A") {
    return false;
  }

  QString year, month, day;

  // ===== FORMAT 1: ISO format with 'T' (e.g., "2024-12-26T00:00:00") =====
  // "26OCT2026" also contains a 'T', so require a dash before it
  int tIdx = input.indexOf('T');
  int d1 = input.indexOf('-');
  if (tIdx != -1 && d1 != -1 && d1 < tIdx) {
    int d2 = input.indexOf('-', d1 + 1);
    if (d2 != -1 && d2 < tIdx) {
      year = input.mid(0, d1);
      month = input.mid(d1 + 1, d2 - d1 - 1);
      day = input.mid(d2 + 1, tIdx - d2 - 1);
    }
  }
  // ===== FORMAT 2: YYYYMMDD (e.g., "20241226") =====
  else if (input.length() == 8 && input.at(0).isDigit()) {
    year = input.mid(0, 4);
    month = input.mid(4, 2);
    day = input.mid(6, 2);
  }
  // ===== FORMAT 3: YYYY-MM-DD or DD-MM-YYYY =====
  else if (input.contains('-')) {
    QStringList parts = input.split('-');
    if (parts.size() == 3) {
      if (parts[0].length() == 4) {
        year = parts[0];
        month = parts[1];
        day = parts[2];
      } else {
        day = parts[0];
        month = parts[1];
        year = parts[2];
      }
    }
  }
  // ===== FORMAT 4: DD/MM/YYYY =====
  else if (input.contains('/')) {
    QStringList parts = input.split('/');
    if (parts.size() == 3) {
      day = parts[0];
      month = parts[1];
      year = parts[2];
    }
  }
  // ===== FORMAT 5: Already in DDMMMYYYY (e.g., "26DEC2024") =====
  else if (isValidDDMMMYYYY(input.toUpper())) {
    QString upper = input.toUpper();
    int monthNum = MONTH_NAMES.indexOf(upper.mid(2, 3));
    outDate = QDate(upper.mid(5).toInt(), monthNum, upper.mid(0, 2).toInt());
    if (outDate.isValid()) {
      outDDMMMYYYY = upper;
      return true;
    }
    outDate = QDate();
    return false;
  }

  if (year.isEmpty() || month.isEmpty() || day.isEmpty()) {
    return false;
  }

  int monthNum = month.toInt();
  if (monthNum < 1 || monthNum > 12) {
    return false;
  }

  if (day.length() == 1) {
    day = "0" + day;
  }

  outDate = QDate(year.toInt(), monthNum, day.toInt());
  if (!outDate.isValid()) {
    qWarning() << "[DateUtils] Invalid date parsed:" << input
               << "-> Year:" << year << "Month:" << monthNum << "Day:" << day;
    outDate = QDate();
    return false;
  }

  outDDMMMYYYY = day + MONTH_NAMES[monthNum] + year;
  return true;
}

QDateTime DateUtils::parseTimeOfDay(const QString &input,
                                    const QDateTime &reference) {
  static const QRegularExpression timeRegex(
      R"(^(\d{1,2}):(\d{2})(?::(\d{2}))?$)");

  QRegularExpressionMatch match = timeRegex.match(input.trimmed());
  if (!match.hasMatch()) {
    return QDateTime();
  }

  int seconds = match.captured(3).isEmpty() ? 0 : match.captured(3).toInt();
  QTime time(match.captured(1).toInt(), match.captured(2).toInt(), seconds);
  if (!time.isValid()) {
    return QDateTime();
  }

  return QDateTime(reference.date(), time, reference.timeSpec());
}

bool DateUtils::isValidDDMMMYYYY(const QString &date) {
  static const QRegularExpression ddmmmyyyy(R"(^\d{2}[A-Z]{3}\d{4}$)");
  return ddmmmyyyy.match(date).hasMatch() &&
         MONTH_NAMES.indexOf(date.mid(2, 3)) >= 1;
}
