#include "api/XTSInteractiveClient.h"
#include <QDateTime>
#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <atomic>
#include <cmath>

XTSInteractiveClient::XTSInteractiveClient(const QString &baseURL,
                                           const QString &apiKey,
                                           const QString &secretKey,
                                           const QString &source)
    : m_baseURL(baseURL)
    , m_apiKey(apiKey)
    , m_secretKey(secretKey)
    , m_source(source)
    , m_productType(XTS::Order::PRODUCT_MIS)
    , m_httpClient(std::make_unique<NativeHTTPClient>())
{
}

XTSInteractiveClient::~XTSInteractiveClient()
{
}

void XTSInteractiveClient::login(std::function<void(bool, const QString&)> callback)
{
    std::string url = (m_baseURL + "/interactive/user/session").toStdString();

    QJsonObject loginData;
    loginData["appKey"] = m_apiKey;
    loginData["secretKey"] = m_secretKey;
    loginData["source"] = m_source;

    QJsonDocument doc(loginData);
    std::string body = doc.toJson().toStdString();

    std::map<std::string, std::string> headers;
    headers["Content-Type"] = "application/json";

    auto response = m_httpClient->post(url, body, headers);

    if (!response.success) {
        QString error = QString("Interactive login failed: %1").arg(QString::fromStdString(response.error));
        qWarning() << "[XTSInteractive]" << error;
        if (callback) callback(false, error);
        return;
    }

    QJsonDocument responseDoc = QJsonDocument::fromJson(QByteArray::fromStdString(response.body));
    QJsonObject obj = responseDoc.object();

    if (obj["type"].toString() == "success") {
        QJsonObject result = obj["result"].toObject();
        m_token = result["token"].toString();
        m_userID = result["userID"].toString();

        QJsonArray clientCodes = result["clientCodes"].toArray();
        m_clientID = clientCodes.isEmpty() ? m_userID : clientCodes[0].toString();

        qDebug() << "[XTSInteractive] Login successful. Client:" << m_clientID;
        if (callback) callback(true, "Login successful");
    } else {
        QString error = QString("Interactive login failed: %1 - %2")
                            .arg(obj["code"].toString())
                            .arg(obj["description"].toString());
        qWarning() << "[XTSInteractive]" << error;
        if (callback) callback(false, error);
    }
}

OrderResult XTSInteractiveClient::placeSellOrder(const ContractData &contract,
                                                 int quantity,
                                                 double stopLossPrice)
{
    OrderResult result;

    if (m_token.isEmpty()) {
        result.error = "Not logged in";
        return result;
    }
    if (quantity <= 0) {
        result.error = QString("Invalid quantity %1").arg(quantity);
        return result;
    }

    // Unique per process, XTS echoes it back on the order book
    static std::atomic<quint64> orderSequence{0};
    QString uniqueId = QString("SS%1%2")
                           .arg(QDateTime::currentMSecsSinceEpoch() % 100000000)
                           .arg(++orderSequence);

    QJsonObject orderParams;
    orderParams["exchangeSegment"] = contract.exchange;
    orderParams["exchangeInstrumentID"] = (qint64)contract.exchangeInstrumentID;
    orderParams["productType"] = m_productType;
    orderParams["orderType"] = XTS::Order::TYPE_STOP_MARKET;
    orderParams["orderSide"] = XTS::Order::SIDE_SELL;
    orderParams["timeInForce"] = XTS::Order::VALIDITY_DAY;
    orderParams["disclosedQuantity"] = 0;
    orderParams["orderQuantity"] = quantity;
    orderParams["limitPrice"] = 0;
    orderParams["stopPrice"] = roundToTick(stopLossPrice, contract.tickSize);
    orderParams["orderUniqueIdentifier"] = uniqueId;
    if (!m_clientID.isEmpty()) {
        orderParams["clientID"] = m_clientID;
    }

    std::string url = (m_baseURL + "/interactive/orders").toStdString();
    QJsonDocument doc(orderParams);
    std::string body = doc.toJson().toStdString();

    std::map<std::string, std::string> headers;
    headers["Content-Type"] = "application/json";
    headers["Authorization"] = m_token.toStdString();

    qDebug() << "[XTSInteractive] placeOrder:" << doc.toJson(QJsonDocument::Compact);

    auto response = m_httpClient->post(url, body, headers);

    QJsonDocument responseDoc = QJsonDocument::fromJson(QByteArray::fromStdString(response.body));
    QJsonObject obj = responseDoc.object();

    if (response.success && obj["type"].toString() == "success") {
        QJsonObject resultObj = obj["result"].toObject();
        result.orderId = resultObj["AppOrderID"].toVariant().toString();
        result.success = !result.orderId.isEmpty();
        if (!result.success) {
            result.error = "Order accepted without AppOrderID";
        }
    } else if (obj.contains("description")) {
        result.error = obj["description"].toString();
    } else {
        result.error = QString::fromStdString(response.error);
    }

    if (result.success) {
        qInfo() << "[XTSInteractive] SELL order placed for" << contract.tradingSymbol
                << "order id:" << result.orderId;
    } else {
        qWarning() << "[XTSInteractive] SELL order placement failed for" << contract.tradingSymbol
                   << "error:" << result.error;
    }
    return result;
}

double XTSInteractiveClient::roundToTick(double price, double tickSize)
{
    if (tickSize <= 0)
        tickSize = 0.05;
    return std::round(price / tickSize) * tickSize;
}
