#ifndef CONTRACT_DATA_H
#define CONTRACT_DATA_H

#include <QDate>
#include <QString>
#include <cstdint>

/**
 * @brief Option type of an F&O contract.
 *
 * Master files encode CE as 3 and PE as 4 (XTS NSEFO), older dumps use 1/2.
 */
enum class OptionType { Call, Put };

/**
 * @brief One tradable option contract of the instrument universe.
 *
 * Loaded once from the NSEFO master and never modified afterwards. The
 * execution engine only ever reads these records.
 */
struct ContractData {
  // ===== SECURITY MASTER DATA =====
  int64_t exchangeInstrumentID; // Exchange token (primary key)
  QString exchange;             // Exchange segment name (NSEFO)
  QString name;                 // Underlying symbol (e.g., NIFTY)
  QString tradingSymbol;        // Tradable symbol (e.g., NIFTY26FEB24550CE)

  // ===== TRADING PARAMETERS =====
  int32_t lotSize; // Contract lot size
  double tickSize; // Minimum price movement

  // ===== F&O SPECIFIC FIELDS =====
  QString expiryDate; // DDMMMYYYY, e.g. 26FEB2026
  QDate expiry;       // Same date for sorting/comparison
  double strikePrice;
  OptionType optionType;

  ContractData()
      : exchangeInstrumentID(0), lotSize(0), tickSize(0.0), strikePrice(0.0),
        optionType(OptionType::Call) {}

  bool isCall() const { return optionType == OptionType::Call; }
  bool isPut() const { return optionType == OptionType::Put; }
};

inline QString optionTypeSuffix(OptionType type) {
  return type == OptionType::Call ? QStringLiteral("CE") : QStringLiteral("PE");
}

#endif // CONTRACT_DATA_H
