#ifndef STRATEGY_CONFIG_H
#define STRATEGY_CONFIG_H

#include <QString>
#include <cstdint>

class ConfigLoader;

/**
 * @brief Typed view of the [STRATEGY] and [UNDERLYING] config sections.
 */
struct StrategyConfig {
  QString underlying = "NIFTY";          // name in the F&O master
  QString underlyingExchange = "NSECM";  // segment of the reference quote
  QString underlyingSymbol = "NIFTY 50"; // reference quote symbol
  int64_t underlyingInstrumentID = 26000;

  int strikeWindow = 10;            // strikes each side of ATM
  double priceTolerance = 0.10;     // matchAtPrice
  double similarityTolerance = 0.05; // matchBySimilarity
  double stopLossFraction = 0.20;   // stop-loss = fraction * matched LTP
  int lotMultiplier = 1;            // quantity = multiplier * lot size

  QString masterFile;               // empty = download NSEFO master
  QString productType = "MIS";

  static StrategyConfig fromConfig(const ConfigLoader &config);

  /**
   * @brief Check ranges; fills @p error with the first problem found
   */
  bool isValid(QString *error = nullptr) const;
};

#endif // STRATEGY_CONFIG_H
