#ifndef STRIKE_MATCHER_H
#define STRIKE_MATCHER_H

#include <QVector>

/**
 * @brief (strike, last traded price) of one candidate at matching time.
 */
struct QuotedStrike {
  double strike = 0.0;
  double ltp = 0.0;

  QuotedStrike() = default;
  QuotedStrike(double s, double p) : strike(s), ltp(p) {}

  bool operator==(const QuotedStrike &other) const {
    return strike == other.strike && ltp == other.ltp;
  }
};

/**
 * @brief Chosen call/put pair, or no legs when matched == false.
 */
struct MatchResult {
  bool matched = false;
  QuotedStrike call;
  QuotedStrike put;
};

/**
 * @brief Call/put pair with similar LTPs, keyed by the distance between
 * their strikes.
 */
struct SimilarPair {
  double strikeDistance = 0.0;
  QuotedStrike call;
  QuotedStrike put;
};

/**
 * @brief Maps a target premium to a call/put pair.
 *
 * All sorts are stable, so identical inputs always produce identical output.
 */
class StrikeMatcher {
public:
  /**
   * @brief Pick the call and put trading near @p targetPrice
   *
   * A quote survives when |ltp - target| <= ltp * tolerance. If both sides
   * have survivors the call with the lowest strike and the put with the
   * highest strike are chosen (the pair closest to ATM from outside).
   */
  static MatchResult matchAtPrice(double targetPrice,
                                  QVector<QuotedStrike> callQuotes,
                                  QVector<QuotedStrike> putQuotes,
                                  double tolerance);

  /**
   * @brief Quotes within @p tolerance of @p targetPrice, ascending by LTP
   */
  static QVector<QuotedStrike> filterNearPrice(double targetPrice,
                                               QVector<QuotedStrike> quotes,
                                               double tolerance);

  /**
   * @brief Every call/put pair with |putLtp - callLtp| < callLtp * tolerance,
   * ascending by |putStrike - callStrike|.
   *
   * Cross-join over two bounded windows. Fallback listing only, never used
   * to place orders.
   */
  static QVector<SimilarPair> matchBySimilarity(QVector<QuotedStrike> callQuotes,
                                                QVector<QuotedStrike> putQuotes,
                                                double similarityTolerance);

private:
  static void sortByPrice(QVector<QuotedStrike> &quotes);
};

#endif // STRIKE_MATCHER_H
