#include "ordering.hpp"

#include <string>

namespace oceanbook {

namespace {

int rank(const OrderKey& a, const OrderKey& b, std::optional<Decimal> OrderKey::*field, const char* fieldName)
{
    if (a.side != b.side) {
        throw ContractViolation("comparing orders " + std::to_string(a.id) + " and " + std::to_string(b.id) +
                                " with different sides");
    }

    if (a.id == b.id) {
        return 0;
    }

    const auto& priceA = a.*field;
    const auto& priceB = b.*field;
    if (!priceA.has_value() || !priceB.has_value()) {
        throw ContractViolation(std::string("ranking order without ") + fieldName + ": " +
                                std::to_string(priceA.has_value() ? b.id : a.id));
    }

    int byPrice = Decimal::compare(*priceA, *priceB);
    if (byPrice != 0) {
        // Buy: higher price first. Sell: lower price first.
        return a.side == Side::Buy ? byPrice : -byPrice;
    }

    if (a.createdAt != b.createdAt) {
        return a.createdAt < b.createdAt ? 1 : -1;
    }

    return a.id < b.id ? 1 : -1;
}

} // namespace

int PriceOrdering::compare(const OrderKey& a, const OrderKey& b) { return rank(a, b, &OrderKey::price, "price"); }

int StopOrdering::compare(const OrderKey& a, const OrderKey& b)
{
    return rank(a, b, &OrderKey::stopPrice, "stop price");
}

} // namespace oceanbook
