#pragma once

#include "order.hpp"

namespace oceanbook {

// Matching priority between two keys of the same side.
// compare() returns 1 when a ranks higher (must be matched first), -1 when lower and
// 0 only for the same order ID. The sell side inverts the price comparison, so the best
// order of either side is always the maximum-ranked one.
// Ties on price fall back to earlier createdAt, then lower ID.
// Throws ContractViolation for keys of different sides or keys without the ranked price.

// Ranks active orders by limit price
struct PriceOrdering {
    static int compare(const OrderKey& a, const OrderKey& b);
};

// Ranks pending stop orders by stop price
struct StopOrdering {
    static int compare(const OrderKey& a, const OrderKey& b);
};

// Strict weak ordering for ordered containers: highest-ranked key first, so begin()
// is the best order
template <typename Ordering>
struct HighestFirst {
    bool operator()(const OrderKey& a, const OrderKey& b) const { return Ordering::compare(a, b) > 0; }
};

} // namespace oceanbook
