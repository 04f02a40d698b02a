#include "services/SnapshotBuilder.h"
#include "utils/ATMCalculator.h"
#include <QDebug>
#include <cmath>

namespace {
// Strikes are copied verbatim from the master, this only absorbs
// representation noise from window arithmetic.
constexpr double STRIKE_EPSILON = 1e-6;
} // namespace

MarketSnapshot SnapshotBuilder::build(double referencePrice,
                                      double strikeSpacing,
                                      const QVector<ContractData> &universe,
                                      int windowStrikes) {
  MarketSnapshot snapshot;
  snapshot.referencePrice = referencePrice;
  snapshot.strikeSpacing = strikeSpacing;
  snapshot.builtAt = QDateTime::currentDateTime();

  auto atm = ATMCalculator::calculateFixedDifference(
      referencePrice, strikeSpacing, windowStrikes);
  if (!atm.isValid) {
    qWarning() << "[Snapshot] Cannot compute ATM for price" << referencePrice
               << "spacing" << strikeSpacing;
    return snapshot;
  }

  snapshot.atmStrike = atm.atmStrike;
  snapshot.windowLow = atm.lowerBound;
  snapshot.windowHigh = atm.upperBound;

  for (const auto &contract : universe) {
    const double strike = contract.strikePrice;
    if (strike < snapshot.windowLow - STRIKE_EPSILON ||
        strike > snapshot.windowHigh + STRIKE_EPSILON)
      continue;

    if (contract.isCall() && strike > snapshot.atmStrike + STRIKE_EPSILON) {
      snapshot.callCandidates.append(contract);
    } else if (contract.isPut() &&
               strike < snapshot.atmStrike - STRIKE_EPSILON) {
      snapshot.putCandidates.append(contract);
    }
  }

  snapshot.isValid = true;

  qDebug() << "[Snapshot] ref:" << referencePrice << "ATM:" << snapshot.atmStrike
           << "window:" << snapshot.windowLow << "-" << snapshot.windowHigh
           << "CE:" << snapshot.callCandidates.size()
           << "PE:" << snapshot.putCandidates.size();
  return snapshot;
}

const ContractData *
SnapshotBuilder::findByStrike(const QVector<ContractData> &candidates,
                              double strike) {
  for (const auto &contract : candidates) {
    if (std::abs(contract.strikePrice - strike) < STRIKE_EPSILON)
      return &contract;
  }
  return nullptr;
}
