#pragma once

#include "order.hpp"
#include "trade.hpp"

#include <optional>

namespace oceanbook {

// Try to execute a resting order (maker) against an incoming order (taker).
// Limit takers trade only when the bid price reaches the ask price; market takers always
// trade. The trade runs at the maker's price for the smaller of the two pending
// quantities, and both orders are filled in place.
// Returns std::nullopt when the prices do not cross.
// Throws ContractViolation for same-side or cross-symbol pairs and for unpriced makers.
std::optional<Trade> matchOrders(Order& maker, Order& taker, Timestamp execTime);

} // namespace oceanbook
