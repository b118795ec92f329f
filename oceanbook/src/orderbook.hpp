#pragma once

#include "booklevel.hpp"
#include "order.hpp"
#include "ordering.hpp"
#include "trade.hpp"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace oceanbook {

// Price-time priority book for one symbol.
// Owns every order it holds: active bids/asks ranked by PriceOrdering and pending stop
// orders ranked by StopOrdering. Not thread-safe; one owner drives it sequentially.
// Any exception escaping a submit or cancel once it has started changing the book (a
// ContractViolation, an arithmetic overflow) halts the book, after which every call
// to submitOrder or cancelOrder throws BookHalted.
class OrderBook {
public:
    // Callback type for trade notifications
    using TradeCallback = std::function<void(const Trade&)>;

    explicit OrderBook(std::string symbol);

    // Set optional trade callback (called for each trade)
    void setTradeCallback(TradeCallback callback);

    // Main operations
    std::vector<Trade> submitOrder(Order order);
    bool cancelOrder(OrderId id);

    // Queries
    [[nodiscard]] std::optional<Order> bestBid() const;
    [[nodiscard]] std::optional<Order> bestAsk() const;
    [[nodiscard]] std::optional<Decimal> spread() const;
    [[nodiscard]] std::optional<Decimal> lastTradePrice() const { return m_lastPrice; }

    // Get depth (top N price levels per side)
    [[nodiscard]] std::vector<BookLevel> bidDepth(size_t levels) const;
    [[nodiscard]] std::vector<BookLevel> askDepth(size_t levels) const;

    // Order lookup (active or pending stop)
    [[nodiscard]] const Order& findOrder(OrderId id) const;
    [[nodiscard]] bool contains(OrderId id) const { return m_orderIndex.count(id) != 0; }

    // Statistics
    [[nodiscard]] const std::string& symbol() const { return m_symbol; }
    [[nodiscard]] size_t bidCount() const { return m_bids.size(); }
    [[nodiscard]] size_t askCount() const { return m_asks.size(); }
    [[nodiscard]] size_t orderCount() const { return m_bids.size() + m_asks.size(); }
    [[nodiscard]] size_t stopOrderCount() const { return m_stopBids.size() + m_stopAsks.size(); }
    [[nodiscard]] bool halted() const { return m_halted; }

    // Current wall-clock time in nanoseconds since epoch
    [[nodiscard]] static Timestamp now();

private:
    using ActiveOrders = std::map<OrderKey, Order, HighestFirst<PriceOrdering>>;
    using StopOrders = std::map<OrderKey, Order, HighestFirst<StopOrdering>>;

    // Where an order currently lives
    struct Location {
        OrderKey key;
        bool pendingStop;
    };

    // Match an incoming order against the opposite side, then rest or discard the remainder
    void processIncoming(Order order, std::vector<Trade>& trades, Timestamp execTime);

    // Resubmit stop orders crossed by the last trade price until none trigger.
    // Each resubmitted stop takes the arrival time of the order that set it off.
    void triggerStops(std::vector<Trade>& trades, Timestamp arrival, Timestamp execTime);

    // Remove and return the stop orders of one side triggered by lastPrice, best first
    std::vector<Order> takeTriggered(Side side, const Decimal& lastPrice);

    void restOrder(Order order);
    void parkStopOrder(Order order);

    ActiveOrders& activeSide(Side side) { return side == Side::Buy ? m_bids : m_asks; }
    StopOrders& stopSide(Side side) { return side == Side::Buy ? m_stopBids : m_stopAsks; }

    static std::vector<BookLevel> depth(const ActiveOrders& orders, size_t levels);

    void ensureRunning() const;

    std::string m_symbol;

    // Bids: highest price first. Asks: lowest price first. Ties: oldest, then lowest ID.
    ActiveOrders m_bids;
    ActiveOrders m_asks;

    // Pending stop orders, ranked the same way by stop price
    StopOrders m_stopBids;
    StopOrders m_stopAsks;

    // Fast order lookup by ID
    std::unordered_map<OrderId, Location> m_orderIndex;

    std::optional<Decimal> m_lastPrice;

    // Optional trade callback
    TradeCallback m_tradeCallback;

    bool m_halted = false;
};

} // namespace oceanbook
