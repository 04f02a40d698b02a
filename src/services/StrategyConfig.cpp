#include "services/StrategyConfig.h"
#include "utils/ConfigLoader.h"

StrategyConfig StrategyConfig::fromConfig(const ConfigLoader &config) {
  StrategyConfig c;

  c.underlying = config.getValue("STRATEGY", "underlying", c.underlying);
  c.strikeWindow = config.getInt("STRATEGY", "strike_window", c.strikeWindow);
  c.priceTolerance =
      config.getDouble("STRATEGY", "price_tolerance", c.priceTolerance);
  c.similarityTolerance = config.getDouble("STRATEGY", "similarity_tolerance",
                                           c.similarityTolerance);
  c.stopLossFraction =
      config.getDouble("STRATEGY", "stoploss_fraction", c.stopLossFraction);
  c.lotMultiplier =
      config.getInt("STRATEGY", "lot_multiplier", c.lotMultiplier);
  c.masterFile = config.getValue("STRATEGY", "master_file", c.masterFile);
  c.productType = config.getValue("STRATEGY", "product", c.productType);

  c.underlyingExchange =
      config.getValue("UNDERLYING", "exchange", c.underlyingExchange);
  c.underlyingSymbol =
      config.getValue("UNDERLYING", "symbol", c.underlyingSymbol);
  c.underlyingInstrumentID =
      config.getValue("UNDERLYING", "instrument_id",
                      QString::number(c.underlyingInstrumentID))
          .toLongLong();

  return c;
}

bool StrategyConfig::isValid(QString *error) const {
  QString problem;
  if (underlying.isEmpty())
    problem = "underlying is empty";
  else if (underlyingSymbol.isEmpty())
    problem = "underlying symbol is empty";
  else if (strikeWindow <= 0)
    problem = QString("strike_window must be positive (%1)").arg(strikeWindow);
  else if (priceTolerance <= 0 || priceTolerance >= 1)
    problem = QString("price_tolerance must be in (0, 1) (%1)")
                  .arg(priceTolerance);
  else if (similarityTolerance <= 0 || similarityTolerance >= 1)
    problem = QString("similarity_tolerance must be in (0, 1) (%1)")
                  .arg(similarityTolerance);
  else if (stopLossFraction <= 0)
    problem = QString("stoploss_fraction must be positive (%1)")
                  .arg(stopLossFraction);
  else if (lotMultiplier <= 0)
    problem =
        QString("lot_multiplier must be positive (%1)").arg(lotMultiplier);

  if (error)
    *error = problem;
  return problem.isEmpty();
}
