#ifndef XTSINTERACTIVECLIENT_H
#define XTSINTERACTIVECLIENT_H

#include "IOrderSubmitter.h"
#include "NativeHTTPClient.h"
#include "XTSTypes.h"
#include <QString>
#include <functional>
#include <memory>

/**
 * @brief XTS interactive (order) REST client
 *
 * Places intraday stop-loss-market SELL orders for the option legs.
 */
class XTSInteractiveClient : public IOrderSubmitter
{
public:
    XTSInteractiveClient(const QString &baseURL,
                         const QString &apiKey,
                         const QString &secretKey,
                         const QString &source = "WEBAPI");
    ~XTSInteractiveClient() override;

    // Authentication (synchronous, callback invoked before returning)
    void login(std::function<void(bool, const QString&)> callback);
    QString getToken() const { return m_token; }
    QString getClientID() const { return m_clientID; }
    bool isLoggedIn() const { return !m_token.isEmpty(); }

    // Product type for new orders (MIS by default)
    void setProductType(const QString &productType) { m_productType = productType; }

    // IOrderSubmitter
    OrderResult placeSellOrder(const ContractData &contract,
                               int quantity,
                               double stopLossPrice) override;

private:
    // Stop prices must sit on the contract's tick grid
    static double roundToTick(double price, double tickSize);

    QString m_baseURL;
    QString m_apiKey;
    QString m_secretKey;
    QString m_source;
    QString m_token;
    QString m_userID;
    QString m_clientID;
    QString m_productType;

    std::unique_ptr<NativeHTTPClient> m_httpClient;
};

#endif // XTSINTERACTIVECLIENT_H
