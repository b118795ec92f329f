#pragma once

#include "decimal.hpp"

namespace oceanbook {

struct BookLevel {
    Decimal price;    // Price at this level
    Decimal totalQty; // Sum of pending quantities at this price
    int orderCount;   // Number of orders at this level
};

} // namespace oceanbook
