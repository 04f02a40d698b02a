#ifndef XTSTYPES_H
#define XTSTYPES_H

#include <QString>

namespace XTS {

// Exchange Segment Constants
enum class ExchangeSegment {
    NSECM = 1,  // NSE Cash
    NSEFO = 2,  // NSE F&O
    BSECM = 11, // BSE Cash
    BSEFO = 12, // BSE F&O
    NSECD = 13, // NSE Currency
    MCXFO = 51  // MCX Commodity
};

/**
 * @brief Map a segment name ("NSECM", "NSEFO", ...) to its numeric code.
 * @return false for unknown names
 */
inline bool segmentFromName(const QString &name, ExchangeSegment &segment) {
    const QString upper = name.trimmed().toUpper();
    if (upper == "NSECM" || upper == "NSE") segment = ExchangeSegment::NSECM;
    else if (upper == "NSEFO" || upper == "NFO") segment = ExchangeSegment::NSEFO;
    else if (upper == "BSECM" || upper == "BSE") segment = ExchangeSegment::BSECM;
    else if (upper == "BSEFO" || upper == "BFO") segment = ExchangeSegment::BSEFO;
    else if (upper == "NSECD") segment = ExchangeSegment::NSECD;
    else if (upper == "MCXFO") segment = ExchangeSegment::MCXFO;
    else return false;
    return true;
}

// Quote request message code (touchline)
constexpr int MESSAGE_CODE_TOUCHLINE = 1501;

// Order request constants
namespace Order {
constexpr const char *SIDE_SELL = "SELL";
constexpr const char *TYPE_STOP_MARKET = "StopMarket";
constexpr const char *PRODUCT_MIS = "MIS";
constexpr const char *VALIDITY_DAY = "DAY";
} // namespace Order

} // namespace XTS

#endif // XTSTYPES_H
