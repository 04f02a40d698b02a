#ifndef MASTER_FILE_PARSER_H
#define MASTER_FILE_PARSER_H

#include "ContractData.h"
#include <QString>
#include <QVector>

/**
 * @brief Parses NSEFO master contract lines into ContractData.
 *
 * Master file format (pipe-separated, 19+ fields):
 *  0: ExchangeSegment        10: FreezeQty
 *  1: ExchangeInstrumentID   11: TickSize
 *  2: InstrumentType         12: LotSize
 *  3: Name                   13: Multiplier
 *  4: Description            14: UnderlyingToken
 *  5: Series                 15: UnderlyingInstrumentID
 *  6: NameWithSeries         16: ExpiryDate (YYYYMMDD or ISO)
 *  7: InstrumentID           17: StrikePrice
 *  8: PriceBandHigh          18: OptionType
 *  9: PriceBandLow           19: DisplayName (optional)
 *
 * Futures and any line that is not a CE/PE option are rejected.
 */
class MasterFileParser {
public:
  /**
   * @brief Parse a single NSEFO option line
   * @param line Raw line from the master file
   * @param contract Output contract
   * @return true if the line is a well-formed option contract
   */
  static bool parseOptionLine(const QString &line, ContractData &contract);

  /**
   * @brief Parse a whole master dump (one contract per line)
   * @param content File or download content
   * @param skipped Optional output: number of lines that were not options
   */
  static QVector<ContractData> parseContent(const QString &content,
                                            int *skipped = nullptr);

private:
  static bool convertOptionType(int32_t code, OptionType &type);
};

#endif // MASTER_FILE_PARSER_H
