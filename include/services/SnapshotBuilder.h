#ifndef SNAPSHOT_BUILDER_H
#define SNAPSHOT_BUILDER_H

#include "repository/ContractData.h"
#include <QDateTime>
#include <QVector>

/**
 * @brief ATM strike and OTM candidate sets derived from one reference price.
 *
 * Value type: a refresh produces a new snapshot, nothing edits one in place.
 * Invariant: every call candidate has strike > atmStrike, every put candidate
 * strike < atmStrike.
 */
struct MarketSnapshot {
  double referencePrice = 0.0;
  double strikeSpacing = 0.0;
  double atmStrike = 0.0;
  double windowLow = 0.0;  // inclusive
  double windowHigh = 0.0; // inclusive
  QVector<ContractData> callCandidates;
  QVector<ContractData> putCandidates;
  QDateTime builtAt;
  bool isValid = false;
};

class SnapshotBuilder {
public:
  /**
   * @brief Build a snapshot from @p universe around @p referencePrice
   *
   * Example: spacing 50, reference 17832 -> ATM 17850, window
   * [17350, 18350] with the default 10 strikes each side.
   *
   * @return Invalid snapshot if the price or spacing is not positive
   */
  static MarketSnapshot build(double referencePrice, double strikeSpacing,
                              const QVector<ContractData> &universe,
                              int windowStrikes = 10);

  /**
   * @brief Candidate with exactly @p strike, nullptr if absent
   */
  static const ContractData *findByStrike(const QVector<ContractData> &candidates,
                                          double strike);
};

#endif // SNAPSHOT_BUILDER_H
