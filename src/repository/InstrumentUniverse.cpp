#include "repository/InstrumentUniverse.h"
#include "repository/MasterFileParser.h"
#include <QDebug>
#include <QFile>
#include <QTextStream>
#include <algorithm>

bool InstrumentUniverse::build(const QVector<ContractData> &contracts,
                               const QString &underlying, const QDate &today,
                               int monthsAhead, QString *error) {
  auto fail = [error](const QString &message) {
    qWarning() << "[InstrumentUniverse]" << message;
    if (error)
      *error = message;
    return false;
  };

  const QDate lastExpiry = today.addMonths(monthsAhead);

  // Step 1: nearest expiry for the underlying
  QDate nearest;
  for (const auto &c : contracts) {
    if (c.name != underlying || !c.expiry.isValid())
      continue;
    if (c.expiry < today || c.expiry > lastExpiry)
      continue;
    if (!nearest.isValid() || c.expiry < nearest)
      nearest = c.expiry;
  }

  if (!nearest.isValid()) {
    return fail(QString("No expiry found for %1 between %2 and %3")
                    .arg(underlying)
                    .arg(today.toString(Qt::ISODate))
                    .arg(lastExpiry.toString(Qt::ISODate)));
  }

  // Step 2: contracts at that expiry
  QVector<ContractData> selected;
  QVector<double> strikes;
  for (const auto &c : contracts) {
    if (c.name == underlying && c.expiry == nearest) {
      selected.append(c);
      strikes.append(c.strikePrice);
    }
  }

  std::sort(strikes.begin(), strikes.end());
  strikes.erase(std::unique(strikes.begin(), strikes.end()), strikes.end());

  // Step 3: strike price difference
  double spacing = detectStrikeSpacing(strikes);
  if (spacing <= 0) {
    return fail(QString("Cannot detect strike spacing for %1 (%2 strikes)")
                    .arg(underlying)
                    .arg(strikes.size()));
  }

  m_underlying = underlying;
  m_expiry = nearest;
  m_strikeSpacing = spacing;
  m_contracts = std::move(selected);
  m_strikes = std::move(strikes);

  qInfo() << "[InstrumentUniverse]" << underlying
          << "expiry:" << m_expiry.toString(Qt::ISODate)
          << "contracts:" << m_contracts.size()
          << "strike spacing:" << m_strikeSpacing;
  return true;
}

bool InstrumentUniverse::loadFromMasterFile(const QString &filePath,
                                            const QString &underlying,
                                            const QDate &today,
                                            QString *error) {
  QFile file(filePath);
  if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
    QString message = QString("Failed to open master file: %1").arg(filePath);
    qWarning() << "[InstrumentUniverse]" << message;
    if (error)
      *error = message;
    return false;
  }

  QTextStream in(&file);
  QVector<ContractData> contracts = MasterFileParser::parseContent(in.readAll());
  file.close();

  return build(contracts, underlying, today, 2, error);
}

double InstrumentUniverse::detectStrikeSpacing(
    const QVector<double> &sortedStrikes) {
  double spacing = 0.0;
  for (int i = 1; i < sortedStrikes.size(); ++i) {
    double gap = sortedStrikes[i] - sortedStrikes[i - 1];
    if (gap > 0 && (spacing == 0.0 || gap < spacing)) {
      spacing = gap;
    }
  }
  return spacing;
}
