#ifndef ATM_CALCULATOR_H
#define ATM_CALCULATOR_H

#include <cmath>

/**
 * @brief Utility class for ATM (At-The-Money) calculations
 */
class ATMCalculator {
public:
  struct CalculationResult {
    double atmStrike = 0.0;
    double lowerBound = 0.0; // atm - rangeCount * strikeDiff
    double upperBound = 0.0; // atm + rangeCount * strikeDiff
    bool isValid = false;
  };

  /**
   * @brief Calculate ATM using a fixed strike difference
   *
   * The ATM strike is the multiple of @p strikeDiff nearest to
   * @p basePrice. Halfway prices round away from zero (std::round), so
   * 17825 with a 50 spacing gives 17850.
   *
   * @param basePrice Current underlying price
   * @param strikeDiff The difference between two strikes (e.g., 50 for NIFTY)
   * @param rangeCount Number of strikes to include on each side
   * @return CalculationResult with inclusive window bounds
   */
  static CalculationResult calculateFixedDifference(double basePrice,
                                                    double strikeDiff,
                                                    int rangeCount = 0) {
    CalculationResult result;
    if (strikeDiff <= 0 || basePrice <= 0 || rangeCount < 0)
      return result;

    double nearest = std::round(basePrice / strikeDiff) * strikeDiff;
    result.atmStrike = nearest;
    result.lowerBound = nearest - rangeCount * strikeDiff;
    result.upperBound = nearest + rangeCount * strikeDiff;
    result.isValid = true;

    return result;
  }
};

#endif // ATM_CALCULATOR_H
