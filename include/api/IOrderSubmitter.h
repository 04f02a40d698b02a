#ifndef I_ORDER_SUBMITTER_H
#define I_ORDER_SUBMITTER_H

#include "repository/ContractData.h"
#include <QString>

struct OrderResult {
    bool success = false;
    QString orderId;
    QString error; // upstream rejection reason
};

/**
 * @brief Places one stop-loss-market SELL order.
 *
 * The contract carries the trading symbol plus the exchange instrument ID
 * the broker needs to route the order.
 */
class IOrderSubmitter {
public:
    virtual ~IOrderSubmitter() = default;

    virtual OrderResult placeSellOrder(const ContractData &contract,
                                       int quantity,
                                       double stopLossPrice) = 0;
};

#endif // I_ORDER_SUBMITTER_H
