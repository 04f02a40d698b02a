#ifndef INSTRUMENT_UNIVERSE_H
#define INSTRUMENT_UNIVERSE_H

#include "ContractData.h"
#include <QDate>
#include <QString>
#include <QVector>

/**
 * @brief Option contracts of one underlying at its nearest expiry.
 *
 * Built once at startup and shared read-only by every scheduled job.
 *
 * Usage:
 * ```cpp
 * InstrumentUniverse universe;
 * QString error;
 * if (!universe.loadFromMasterFile("Masters/nsefo.txt", "NIFTY",
 *                                  QDate::currentDate(), &error)) {
 *   qWarning() << error;
 * }
 * double spd = universe.strikeSpacing(); // 50 for NIFTY
 * ```
 */
class InstrumentUniverse {
public:
  InstrumentUniverse() = default;

  /**
   * @brief Select the nearest-expiry option contracts of @p underlying
   * @param contracts All parsed option contracts (any underlying)
   * @param underlying Underlying name as it appears in the master (NIFTY)
   * @param today Expiries before this date are ignored
   * @param monthsAhead Expiries further than this are ignored
   * @param error Optional output message on failure
   * @return false if no expiry qualifies or spacing cannot be detected
   */
  bool build(const QVector<ContractData> &contracts, const QString &underlying,
             const QDate &today, int monthsAhead = 2,
             QString *error = nullptr);

  /**
   * @brief Read a master file from disk and build() from it
   */
  bool loadFromMasterFile(const QString &filePath, const QString &underlying,
                          const QDate &today, QString *error = nullptr);

  bool isEmpty() const { return m_contracts.isEmpty(); }
  const QString &underlying() const { return m_underlying; }
  const QDate &expiry() const { return m_expiry; }
  double strikeSpacing() const { return m_strikeSpacing; }
  const QVector<ContractData> &contracts() const { return m_contracts; }
  const QVector<double> &strikes() const { return m_strikes; }

  /**
   * @brief Smallest gap between adjacent distinct strikes, 0 if fewer than two
   */
  static double detectStrikeSpacing(const QVector<double> &sortedStrikes);

private:
  QString m_underlying;
  QDate m_expiry;
  double m_strikeSpacing = 0.0;
  QVector<ContractData> m_contracts;
  QVector<double> m_strikes; // sorted, unique
};

#endif // INSTRUMENT_UNIVERSE_H
