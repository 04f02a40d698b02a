#ifndef TEST_FAKES_H
#define TEST_FAKES_H

#include "api/IOrderSubmitter.h"
#include "api/IQuoteProvider.h"
#include "repository/ContractData.h"
#include <QHash>
#include <QMutex>
#include <QMutexLocker>
#include <QSet>
#include <QStringList>
#include <QVector>
#include <atomic>

/**
 * Shared fixtures for the engine tests: an option chain builder plus
 * in-memory stand-ins for the XTS quote and order adapters.
 */
namespace TestFakes {

inline QString symbolFor(double strike, OptionType type) {
  return QString("NIFTY26FEB%1%2")
      .arg(static_cast<int>(strike))
      .arg(optionTypeSuffix(type));
}

inline ContractData makeOption(double strike, OptionType type,
                               int lotSize = 50,
                               const QDate &expiry = QDate(2026, 2, 26)) {
  ContractData c;
  c.exchangeInstrumentID =
      static_cast<int64_t>(strike) * 10 + (type == OptionType::Call ? 1 : 2);
  c.exchange = "NSEFO";
  c.name = "NIFTY";
  c.tradingSymbol = symbolFor(strike, type);
  c.lotSize = lotSize;
  c.tickSize = 0.05;
  c.expiry = expiry;
  c.expiryDate = expiry.toString("ddMMMyyyy").toUpper();
  c.strikePrice = strike;
  c.optionType = type;
  return c;
}

// CE and PE for every strike in [low, high] stepping by spacing
inline QVector<ContractData> makeChain(double low, double high, double spacing,
                                       int lotSize = 50) {
  QVector<ContractData> chain;
  for (double s = low; s <= high + 1e-9; s += spacing) {
    chain.append(makeOption(s, OptionType::Call, lotSize));
    chain.append(makeOption(s, OptionType::Put, lotSize));
  }
  return chain;
}

inline QString quoteKey(double strike, OptionType type) {
  return QString::number(strike, 'f', 2) + optionTypeSuffix(type);
}

/**
 * Quotes from a table keyed by strike and option type. Strikes without an
 * explicit price get a default premium so whole windows can be quoted.
 */
class FakeQuoteProvider : public IQuoteProvider {
public:
  double referencePrice = 17832.0;
  bool failReference = false;
  bool failBatch = false;
  bool shortBatch = false;
  double defaultPremium = 0.0; // 0 = unlisted strikes fail the batch

  void setPremium(double strike, OptionType type, double ltp) {
    QMutexLocker locker(&m_mutex);
    m_premiums[quoteKey(strike, type)] = ltp;
  }

  int referenceCalls() const { return m_referenceCalls.load(); }
  int batchCalls() const { return m_batchCalls.load(); }

  QuoteResult getLastPrice(const QString &exchange,
                           const QString &symbol) override {
    Q_UNUSED(exchange);
    Q_UNUSED(symbol);
    ++m_referenceCalls;
    QuoteResult r;
    if (failReference) {
      r.error = "connection refused";
      return r;
    }
    r.success = true;
    r.ltp = referencePrice;
    return r;
  }

  QuoteBatchResult
  getLastPrices(const QVector<ContractData> &instruments) override {
    ++m_batchCalls;
    QuoteBatchResult r;
    if (failBatch) {
      r.error = "HTTP 500";
      return r;
    }

    QMutexLocker locker(&m_mutex);
    for (const auto &c : instruments) {
      const QString key = quoteKey(c.strikePrice, c.optionType);
      if (m_premiums.contains(key)) {
        r.ltps.append(m_premiums.value(key));
      } else if (defaultPremium > 0.0) {
        r.ltps.append(defaultPremium);
      } else {
        r.error = "no quote for " + c.tradingSymbol;
        r.ltps.clear();
        return r;
      }
    }
    if (shortBatch && !r.ltps.isEmpty())
      r.ltps.removeLast();
    r.success = true;
    return r;
  }

private:
  QMutex m_mutex;
  QHash<QString, double> m_premiums;
  std::atomic<int> m_referenceCalls{0};
  std::atomic<int> m_batchCalls{0};
};

struct SubmittedOrder {
  QString tradingSymbol;
  int quantity = 0;
  double stopLossPrice = 0.0;
};

/**
 * Records every order; symbols in rejectSymbols are refused.
 */
class FakeOrderSubmitter : public IOrderSubmitter {
public:
  QSet<QString> rejectSymbols;

  OrderResult placeSellOrder(const ContractData &contract, int quantity,
                             double stopLossPrice) override {
    QMutexLocker locker(&m_mutex);
    SubmittedOrder order;
    order.tradingSymbol = contract.tradingSymbol;
    order.quantity = quantity;
    order.stopLossPrice = stopLossPrice;
    m_orders.append(order);

    OrderResult r;
    if (rejectSymbols.contains(contract.tradingSymbol)) {
      r.error = "RMS: margin exceeds";
      return r;
    }
    r.success = true;
    r.orderId = QString::number(1000 + m_orders.size());
    return r;
  }

  QVector<SubmittedOrder> orders() const {
    QMutexLocker locker(&m_mutex);
    return m_orders;
  }

private:
  mutable QMutex m_mutex;
  QVector<SubmittedOrder> m_orders;
};

} // namespace TestFakes

#endif // TEST_FAKES_H
