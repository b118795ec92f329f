#include "match.hpp"

#include <algorithm>
#include <string>

namespace oceanbook {

std::optional<Trade> matchOrders(Order& maker, Order& taker, Timestamp execTime)
{
    if (maker.side == taker.side) {
        throw ContractViolation(std::string("match order with same side ") + toString(maker.side) + ", " +
                                std::to_string(maker.id) + ", " + std::to_string(taker.id));
    }
    if (maker.symbol != taker.symbol) {
        throw ContractViolation("match orders of different symbols " + maker.symbol + ", " + taker.symbol);
    }
    if (maker.isMarket()) {
        throw ContractViolation("resting order without price " + std::to_string(maker.id));
    }

    Order& bid = maker.side == Side::Buy ? maker : taker;
    Order& ask = maker.side == Side::Sell ? maker : taker;

    if (taker.isLimit() && *bid.price < *ask.price) {
        return std::nullopt;
    }

    Decimal fillQty = std::min(bid.pendingQty(), ask.pendingQty());
    Decimal price = *maker.price;

    Trade trade{};
    trade.symbol = maker.symbol;
    trade.price = price;
    trade.qty = fillQty;
    trade.total = fillQty * price;
    trade.makerOrderId = maker.id;
    trade.takerOrderId = taker.id;
    trade.makerId = maker.memberId;
    trade.takerId = taker.memberId;
    trade.takerSide = taker.side;
    trade.timestamp = execTime;

    bid.fill(fillQty);
    ask.fill(fillQty);

    return trade;
}

} // namespace oceanbook
