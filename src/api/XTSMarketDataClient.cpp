#include "api/XTSMarketDataClient.h"
#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStringList>
#include <mutex>

XTSMarketDataClient::XTSMarketDataClient(const QString &baseURL,
                                         const QString &apiKey,
                                         const QString &secretKey,
                                         const QString &source)
    : m_baseURL(baseURL)
    , m_apiKey(apiKey)
    , m_secretKey(secretKey)
    , m_source(source)
    , m_httpClient(std::make_unique<NativeHTTPClient>())
{
}

XTSMarketDataClient::~XTSMarketDataClient()
{
}

void XTSMarketDataClient::login(std::function<void(bool, const QString&)> callback)
{
    std::string url = (m_baseURL + "/auth/login").toStdString();

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
        QString error = QString("Market data login failed: %1").arg(QString::fromStdString(response.error));
        qWarning() << "[XTSMarketData]" << error;
        if (callback) callback(false, error);
        return;
    }

    QJsonDocument responseDoc = QJsonDocument::fromJson(QByteArray::fromStdString(response.body));
    QJsonObject obj = responseDoc.object();

    if (obj["type"].toString() == "success") {
        QJsonObject result = obj["result"].toObject();
        m_token = result["token"].toString();
        m_userID = result["userID"].toString();

        qDebug() << "[XTSMarketData] Login successful. Token:" << m_token.left(20) + "...";
        if (callback) callback(true, "Login successful");
    } else {
        QString error = QString("Market data login failed: %1 - %2")
                            .arg(obj["code"].toString())
                            .arg(obj["description"].toString());
        qWarning() << "[XTSMarketData]" << error;
        if (callback) callback(false, error);
    }
}

void XTSMarketDataClient::downloadMasterContracts(const QStringList &exchangeSegments,
                                                  std::function<void(bool, const QString&, const QString&)> callback)
{
    if (m_token.isEmpty()) {
        if (callback) callback(false, QString(), "Not authenticated - please login first");
        return;
    }

    std::string url = (m_baseURL + "/instruments/master").toStdString();

    QJsonObject requestObj;
    requestObj["exchangeSegmentList"] = QJsonArray::fromStringList(exchangeSegments);
    std::string body = QJsonDocument(requestObj).toJson().toStdString();

    std::map<std::string, std::string> headers;
    headers["Content-Type"] = "application/json";
    headers["Authorization"] = m_token.toStdString();

    qInfo() << "[XTSMarketData] Downloading masters for" << exchangeSegments;
    auto response = m_httpClient->post(url, body, headers);

    if (!response.success) {
        if (callback) callback(false, QString(), "Network error: " + QString::fromStdString(response.error));
        return;
    }

    QJsonDocument doc = QJsonDocument::fromJson(QByteArray::fromStdString(response.body));
    if (doc.isNull() || !doc.isObject()) {
        if (callback) callback(false, QString(), "Invalid JSON response");
        return;
    }

    QJsonObject obj = doc.object();
    if (obj["type"].toString() != "success") {
        if (callback) callback(false, QString(), "Download failed: " + obj["description"].toString());
        return;
    }

    // Result is the raw pipe-separated dump
    QString masterData = obj["result"].toString();
    qInfo() << "[XTSMarketData] Master download complete (" << masterData.length() << "bytes)";
    if (callback) callback(true, masterData, QString());
}

void XTSMarketDataClient::registerSymbol(const QString &exchange, const QString &symbol,
                                         int64_t exchangeInstrumentID)
{
    XTS::ExchangeSegment segment;
    if (!XTS::segmentFromName(exchange, segment)) {
        qWarning() << "[XTSMarketData] Unknown exchange segment" << exchange << "for" << symbol;
        return;
    }

    std::unique_lock lock(m_symbolMutex);
    InstrumentRef ref;
    ref.exchangeSegment = static_cast<int>(segment);
    ref.exchangeInstrumentID = exchangeInstrumentID;
    m_symbols[symbolKey(exchange, symbol)] = ref;
}

QuoteResult XTSMarketDataClient::getLastPrice(const QString &exchange, const QString &symbol)
{
    QuoteResult result;

    InstrumentRef ref;
    {
        std::shared_lock lock(m_symbolMutex);
        auto it = m_symbols.constFind(symbolKey(exchange, symbol));
        if (it == m_symbols.constEnd()) {
            result.error = QString("Symbol %1:%2 is not registered").arg(exchange, symbol);
            return result;
        }
        ref = it.value();
    }

    QHash<int64_t, double> ltpById;
    if (!fetchQuotes({ref}, ltpById, result.error)) {
        return result;
    }

    auto it = ltpById.constFind(ref.exchangeInstrumentID);
    if (it == ltpById.constEnd()) {
        result.error = QString("No quote returned for %1:%2").arg(exchange, symbol);
        return result;
    }

    result.ltp = it.value();
    result.success = true;
    return result;
}

QuoteBatchResult XTSMarketDataClient::getLastPrices(const QVector<ContractData> &instruments)
{
    QuoteBatchResult result;
    if (instruments.isEmpty()) {
        result.success = true;
        return result;
    }

    QVector<InstrumentRef> refs;
    refs.reserve(instruments.size());
    for (const auto &contract : instruments) {
        XTS::ExchangeSegment segment;
        if (!XTS::segmentFromName(contract.exchange, segment)) {
            result.error = QString("Unknown exchange segment %1 for %2")
                               .arg(contract.exchange, contract.tradingSymbol);
            return result;
        }
        InstrumentRef ref;
        ref.exchangeSegment = static_cast<int>(segment);
        ref.exchangeInstrumentID = contract.exchangeInstrumentID;
        refs.append(ref);
    }

    QHash<int64_t, double> ltpById;
    if (!fetchQuotes(refs, ltpById, result.error)) {
        return result;
    }

    // Keep the caller's ordering; any gap fails the batch
    result.ltps.reserve(instruments.size());
    for (const auto &contract : instruments) {
        auto it = ltpById.constFind(contract.exchangeInstrumentID);
        if (it == ltpById.constEnd()) {
            result.ltps.clear();
            result.error = QString("No quote returned for %1").arg(contract.tradingSymbol);
            return result;
        }
        result.ltps.append(it.value());
    }

    result.success = true;
    return result;
}

bool XTSMarketDataClient::fetchQuotes(const QVector<InstrumentRef> &instruments,
                                      QHash<int64_t, double> &ltpById,
                                      QString &error)
{
    if (m_token.isEmpty()) {
        error = "Not logged in";
        return false;
    }

    std::string url = (m_baseURL + "/instruments/quotes").toStdString();

    QJsonObject reqObj;
    QJsonArray list;
    for (const auto &ref : instruments) {
        QJsonObject inst;
        inst["exchangeSegment"] = ref.exchangeSegment;
        inst["exchangeInstrumentID"] = (qint64)ref.exchangeInstrumentID;
        list.append(inst);
    }
    reqObj["instruments"] = list;
    reqObj["xtsMessageCode"] = XTS::MESSAGE_CODE_TOUCHLINE;
    reqObj["publishFormat"] = "JSON";

    QJsonDocument doc(reqObj);
    std::string body = doc.toJson().toStdString();

    qDebug() << "[XTSMarketData] quotes request:" << doc.toJson(QJsonDocument::Compact);

    std::map<std::string, std::string> headers;
    headers["Content-Type"] = "application/json";
    headers["Authorization"] = m_token.toStdString();

    auto response = m_httpClient->post(url, body, headers);

    if (!response.success) {
        error = QString("Quote request failed: %1").arg(QString::fromStdString(response.error));
        return false;
    }

    QJsonDocument responseDoc = QJsonDocument::fromJson(QByteArray::fromStdString(response.body));
    if (responseDoc.isNull() || !responseDoc.isObject()) {
        error = "Invalid JSON response";
        return false;
    }

    QJsonObject obj = responseDoc.object();
    if (obj["type"].toString() != "success") {
        error = QString("Quote request rejected: %1").arg(obj["description"].toString());
        return false;
    }

    // XTS returns listQuotes as array of JSON strings
    const QJsonArray listQuotes = obj["result"].toObject()["listQuotes"].toArray();
    for (const QJsonValue &entry : listQuotes) {
        QJsonDocument quoteDoc = QJsonDocument::fromJson(entry.toString().toUtf8());
        if (!quoteDoc.isObject())
            continue;

        QJsonObject quote = quoteDoc.object();
        int64_t id = quote["ExchangeInstrumentID"].toVariant().toLongLong();
        QJsonObject touchline = quote["Touchline"].toObject();
        QJsonValue ltp = touchline.contains("LastTradedPrice") ? touchline["LastTradedPrice"]
                                                               : quote["LastTradedPrice"];
        if (id != 0 && ltp.isDouble()) {
            ltpById[id] = ltp.toDouble();
        }
    }

    return true;
}

QString XTSMarketDataClient::symbolKey(const QString &exchange, const QString &symbol)
{
    return exchange.trimmed().toUpper() + ":" + symbol.trimmed().toUpper();
}
