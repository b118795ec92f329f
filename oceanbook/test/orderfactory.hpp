#pragma once

#include "../src/order.hpp"

#include <optional>
#include <string>

namespace oceanbook::test {

inline const std::string kSymbol = "BTCUSDT";

inline Order limitOrder(OrderId id, Side side, const char* price, const char* qty, Timestamp createdAt,
                        MemberId member = 100)
{
    Order order;
    order.id = id;
    order.symbol = kSymbol;
    order.memberId = member;
    order.side = side;
    order.price = Decimal::parse(price);
    order.qty = Decimal::parse(qty);
    order.createdAt = createdAt;
    return order;
}

inline Order marketOrder(OrderId id, Side side, const char* qty, Timestamp createdAt, MemberId member = 100)
{
    Order order;
    order.id = id;
    order.symbol = kSymbol;
    order.memberId = member;
    order.side = side;
    order.qty = Decimal::parse(qty);
    order.createdAt = createdAt;
    return order;
}

inline Order iocOrder(OrderId id, Side side, const char* price, const char* qty, Timestamp createdAt)
{
    Order order = limitOrder(id, side, price, qty, createdAt);
    order.immediateOrCancel = true;
    return order;
}

// price == nullptr gives a stop-market order
inline Order stopOrder(OrderId id, Side side, const char* stopPrice, const char* price, const char* qty,
                       Timestamp createdAt)
{
    Order order = marketOrder(id, side, qty, createdAt);
    order.stopPrice = Decimal::parse(stopPrice);
    if (price != nullptr) {
        order.price = Decimal::parse(price);
    }
    return order;
}

inline Decimal dec(const char* text) { return Decimal::parse(text); }

} // namespace oceanbook::test
