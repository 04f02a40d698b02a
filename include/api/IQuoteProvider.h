#ifndef I_QUOTE_PROVIDER_H
#define I_QUOTE_PROVIDER_H

#include "repository/ContractData.h"
#include <QString>
#include <QVector>

struct QuoteResult {
    bool success = false;
    double ltp = 0.0;
    QString error;
};

struct QuoteBatchResult {
    bool success = false;
    QVector<double> ltps; // same order as the requested instruments
    QString error;
};

/**
 * @brief Last-traded-price source used by the execution engine.
 *
 * Implementations must be callable from several job threads at once.
 */
class IQuoteProvider {
public:
    virtual ~IQuoteProvider() = default;

    // Single quote, e.g. ("NSECM", "NIFTY 50") for the underlying index
    virtual QuoteResult getLastPrice(const QString &exchange,
                                     const QString &symbol) = 0;

    // Batched quotes. A missing quote for any instrument fails the whole call.
    virtual QuoteBatchResult getLastPrices(const QVector<ContractData> &instruments) = 0;
};

#endif // I_QUOTE_PROVIDER_H
