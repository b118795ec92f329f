#pragma once

#include "decimal.hpp"
#include "errors.hpp"
#include "types.hpp"

#include <optional>
#include <string>

namespace oceanbook {

// Subset of an order used for ranking; derived from the order, never edited on its own
struct OrderKey {
    OrderId id;
    Side side;
    std::optional<Decimal> price;
    std::optional<Decimal> stopPrice;
    Timestamp createdAt;
};

struct Order {
    OrderId id = 0;                   // Unique identifier
    std::string symbol;               // Traded instrument
    MemberId memberId = 0;            // Owner
    Side side = Side::Buy;            // Buy or Sell
    std::optional<Decimal> price;     // Limit price (absent for market orders)
    std::optional<Decimal> stopPrice; // Trigger price (absent for non-stop orders)
    Decimal qty;                      // Original quantity
    Decimal filledQty;                // Quantity executed so far
    bool immediateOrCancel = false;   // Discard the remainder instead of resting it
    Timestamp createdAt = 0;          // Submission time (for time priority)

    [[nodiscard]] bool isFilled() const { return filledQty == qty; }

    [[nodiscard]] Decimal pendingQty() const { return qty - filledQty; }

    [[nodiscard]] bool isLimit() const { return price.has_value(); }
    [[nodiscard]] bool isMarket() const { return !price.has_value(); }

    [[nodiscard]] OrderKey key() const { return {id, side, price, stopPrice, createdAt}; }

    // Record an execution. Amounts above the pending quantity are rejected so the
    // filled quantity can never exceed the order quantity.
    void fill(const Decimal& amount)
    {
        if (amount.isNegative() || amount > pendingQty()) {
            throw ContractViolation("fill of " + amount.toString() + " exceeds pending " + pendingQty().toString() +
                                    " on order " + std::to_string(id));
        }
        filledQty += amount;
    }
};

} // namespace oceanbook
