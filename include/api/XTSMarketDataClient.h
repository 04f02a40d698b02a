#ifndef XTSMARKETDATACLIENT_H
#define XTSMARKETDATACLIENT_H

#include "IQuoteProvider.h"
#include "NativeHTTPClient.h"
#include "XTSTypes.h"
#include <QHash>
#include <QString>
#include <functional>
#include <memory>
#include <shared_mutex>

/**
 * @brief XTS market data REST client
 *
 * Session login, master download and LTP lookup through
 * /instruments/quotes. Index symbols such as "NIFTY 50" have no entry in the
 * F&O master, so they are registered up front with their instrument ID.
 */
class XTSMarketDataClient : public IQuoteProvider
{
public:
    XTSMarketDataClient(const QString &baseURL,
                        const QString &apiKey,
                        const QString &secretKey,
                        const QString &source = "WEBAPI");
    ~XTSMarketDataClient() override;

    // Authentication (synchronous, callback invoked before returning)
    void login(std::function<void(bool, const QString&)> callback);
    QString getToken() const { return m_token; }
    bool isLoggedIn() const { return !m_token.isEmpty(); }

    // Master contracts for the given segments ("NSEFO"), pipe-separated text
    void downloadMasterContracts(const QStringList &exchangeSegments,
                                 std::function<void(bool, const QString&, const QString&)> callback);

    // Symbol registry for getLastPrice()
    void registerSymbol(const QString &exchange, const QString &symbol, int64_t exchangeInstrumentID);

    // IQuoteProvider
    QuoteResult getLastPrice(const QString &exchange, const QString &symbol) override;
    QuoteBatchResult getLastPrices(const QVector<ContractData> &instruments) override;

private:
    struct InstrumentRef {
        int exchangeSegment = 0;
        int64_t exchangeInstrumentID = 0;
    };

    // POST /instruments/quotes, returns LTP per instrument ID
    bool fetchQuotes(const QVector<InstrumentRef> &instruments,
                     QHash<int64_t, double> &ltpById,
                     QString &error);

    static QString symbolKey(const QString &exchange, const QString &symbol);

    QString m_baseURL;
    QString m_apiKey;
    QString m_secretKey;
    QString m_source;
    QString m_token;
    QString m_userID;

    QHash<QString, InstrumentRef> m_symbols;
    mutable std::shared_mutex m_symbolMutex;

    std::unique_ptr<NativeHTTPClient> m_httpClient;
};

#endif // XTSMARKETDATACLIENT_H
