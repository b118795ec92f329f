#pragma once

#include "decimal.hpp"
#include "types.hpp"

#include <string>

namespace oceanbook {

struct Trade {
    std::string symbol;    // Traded instrument
    Decimal price;         // Execution price (maker's price)
    Decimal qty;           // Quantity traded
    Decimal total;         // price × qty
    OrderId makerOrderId;  // Passive order (was resting in book)
    OrderId takerOrderId;  // Aggressive order
    MemberId makerId;      // Owner of the maker order
    MemberId takerId;      // Owner of the taker order
    Side takerSide;        // Side of the taker
    Timestamp timestamp;   // Execution time
};

} // namespace oceanbook
