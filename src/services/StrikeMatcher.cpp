#include "services/StrikeMatcher.h"
#include <QDebug>
#include <algorithm>
#include <cmath>

void StrikeMatcher::sortByPrice(QVector<QuotedStrike> &quotes) {
  std::stable_sort(quotes.begin(), quotes.end(),
                   [](const QuotedStrike &a, const QuotedStrike &b) {
                     return a.ltp < b.ltp;
                   });
}

QVector<QuotedStrike> StrikeMatcher::filterNearPrice(double targetPrice,
                                                     QVector<QuotedStrike> quotes,
                                                     double tolerance) {
  sortByPrice(quotes);

  QVector<QuotedStrike> survivors;
  for (const auto &q : quotes) {
    if (std::abs(targetPrice - q.ltp) <= q.ltp * tolerance) {
      survivors.append(q);
    }
  }
  return survivors;
}

MatchResult StrikeMatcher::matchAtPrice(double targetPrice,
                                        QVector<QuotedStrike> callQuotes,
                                        QVector<QuotedStrike> putQuotes,
                                        double tolerance) {
  MatchResult result;

  QVector<QuotedStrike> calls =
      filterNearPrice(targetPrice, std::move(callQuotes), tolerance);
  QVector<QuotedStrike> puts =
      filterNearPrice(targetPrice, std::move(putQuotes), tolerance);

  qDebug() << "[StrikeMatcher] target:" << targetPrice
           << "tolerance:" << tolerance << "CE survivors:" << calls.size()
           << "PE survivors:" << puts.size();

  if (calls.isEmpty() || puts.isEmpty())
    return result;

  std::stable_sort(calls.begin(), calls.end(),
                   [](const QuotedStrike &a, const QuotedStrike &b) {
                     return a.strike < b.strike;
                   });
  std::stable_sort(puts.begin(), puts.end(),
                   [](const QuotedStrike &a, const QuotedStrike &b) {
                     return a.strike > b.strike;
                   });

  result.matched = true;
  result.call = calls.first();
  result.put = puts.first();
  return result;
}

QVector<SimilarPair>
StrikeMatcher::matchBySimilarity(QVector<QuotedStrike> callQuotes,
                                 QVector<QuotedStrike> putQuotes,
                                 double similarityTolerance) {
  sortByPrice(callQuotes);
  sortByPrice(putQuotes);

  QVector<SimilarPair> pairs;
  for (const auto &ce : callQuotes) {
    const double diff = ce.ltp * similarityTolerance;
    for (const auto &pe : putQuotes) {
      if (std::abs(pe.ltp - ce.ltp) < diff) {
        SimilarPair pair;
        pair.strikeDistance = std::abs(pe.strike - ce.strike);
        pair.call = ce;
        pair.put = pe;
        pairs.append(pair);
      }
    }
  }

  std::stable_sort(pairs.begin(), pairs.end(),
                   [](const SimilarPair &a, const SimilarPair &b) {
                     return a.strikeDistance < b.strikeDistance;
                   });
  return pairs;
}
