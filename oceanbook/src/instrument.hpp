#pragma once

#include "decimal.hpp"

#include <string>

namespace oceanbook {

struct Instrument {
    std::string symbol;      // "BTCUSDT", "ETHUSDT", etc.
    std::string description; // "Bitcoin / Tether"
    Decimal tickSize;        // Minimum price increment (e.g., 0.01)
    Decimal lotSize;         // Minimum quantity increment (e.g., 0.0001)

    // Validate price is on tick
    [[nodiscard]] bool isValidPrice(const Decimal& price) const { return price.isMultipleOf(tickSize); }

    // Validate quantity is on lot
    [[nodiscard]] bool isValidQty(const Decimal& qty) const { return qty.isMultipleOf(lotSize); }
};

} // namespace oceanbook
