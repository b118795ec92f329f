#include "orderbook.hpp"
#include "match.hpp"

#include <algorithm>
#include <chrono>
#include <iterator>
#include <stdexcept>
#include <string>

namespace oceanbook {

OrderBook::OrderBook(std::string symbol) : m_symbol(std::move(symbol)) {}

void OrderBook::setTradeCallback(TradeCallback callback) { m_tradeCallback = std::move(callback); }

std::vector<Trade> OrderBook::submitOrder(Order order)
{
    ensureRunning();

    if (order.symbol != m_symbol) {
        throw std::invalid_argument("Order " + std::to_string(order.id) + " for " + order.symbol +
                                    " submitted to book " + m_symbol);
    }
    if (m_orderIndex.count(order.id)) {
        throw std::invalid_argument("Duplicate order ID: " + std::to_string(order.id));
    }

    std::vector<Trade> trades;

    try {
        // Stop orders wait for a trade to cross their trigger
        if (order.stopPrice.has_value()) {
            parkStopOrder(std::move(order));
            return trades;
        }

        Timestamp execTime = now();
        Timestamp arrival = order.createdAt;
        processIncoming(std::move(order), trades, execTime);

        if (!trades.empty()) {
            triggerStops(trades, arrival, execTime);
        }
    } catch (...) {
        // Makers may already be filled and removed; the book cannot be trusted anymore
        m_halted = true;
        throw;
    }

    // Notify via callback
    if (m_tradeCallback != nullptr) {
        for (const auto& trade : trades) {
            m_tradeCallback(trade);
        }
    }

    return trades;
}

bool OrderBook::cancelOrder(OrderId id)
{
    ensureRunning();

    auto indexIterator = m_orderIndex.find(id);
    if (indexIterator == m_orderIndex.end()) {
        return false;
    }

    const auto& [key, pendingStop] = indexIterator->second;

    try {
        size_t removed = pendingStop ? stopSide(key.side).erase(key) : activeSide(key.side).erase(key);
        if (removed == 0) {
            throw ContractViolation("order " + std::to_string(id) + " indexed but missing from book " + m_symbol);
        }
    } catch (...) {
        m_halted = true;
        throw;
    }

    m_orderIndex.erase(indexIterator);
    return true;
}

std::optional<Order> OrderBook::bestBid() const
{
    if (m_bids.empty()) {
        return std::nullopt;
    }
    return m_bids.begin()->second;
}

std::optional<Order> OrderBook::bestAsk() const
{
    if (m_asks.empty()) {
        return std::nullopt;
    }
    return m_asks.begin()->second;
}

std::optional<Decimal> OrderBook::spread() const
{
    auto bid = bestBid();
    auto ask = bestAsk();
    if (!bid.has_value() || !ask.has_value()) {
        return std::nullopt;
    }
    return *ask->price - *bid->price;
}

std::vector<BookLevel> OrderBook::bidDepth(size_t levels) const { return depth(m_bids, levels); }

std::vector<BookLevel> OrderBook::askDepth(size_t levels) const { return depth(m_asks, levels); }

std::vector<BookLevel> OrderBook::depth(const ActiveOrders& orders, size_t levels)
{
    std::vector<BookLevel> result;
    result.reserve(levels);

    // Orders sharing a price are adjacent in priority order
    for (const auto& [key, order] : orders) {
        if (!result.empty() && result.back().price == *order.price) {
            result.back().totalQty += order.pendingQty();
            ++result.back().orderCount;
            continue;
        }
        if (result.size() >= levels) {
            break;
        }
        result.push_back({*order.price, order.pendingQty(), 1});
    }

    return result;
}

const Order& OrderBook::findOrder(OrderId id) const
{
    auto indexIterator = m_orderIndex.find(id);
    if (indexIterator == m_orderIndex.end()) {
        throw std::out_of_range("Order not found: " + std::to_string(id));
    }

    const auto& [key, pendingStop] = indexIterator->second;

    if (pendingStop) {
        const StopOrders& stops = key.side == Side::Buy ? m_stopBids : m_stopAsks;
        auto stopIterator = stops.find(key);
        if (stopIterator != stops.end()) {
            return stopIterator->second;
        }
    } else {
        const ActiveOrders& active = key.side == Side::Buy ? m_bids : m_asks;
        auto orderIterator = active.find(key);
        if (orderIterator != active.end()) {
            return orderIterator->second;
        }
    }

    throw std::out_of_range("Order index is inconsistent for ID: " + std::to_string(id));
}

void OrderBook::processIncoming(Order order, std::vector<Trade>& trades, Timestamp execTime)
{
    ActiveOrders& resting = activeSide(opposite(order.side));

    while (!order.isFilled() && !resting.empty()) {
        auto best = resting.begin();
        Order& maker = best->second;

        // The best resting order does not cross, so nothing behind it will
        auto trade = matchOrders(maker, order, execTime);
        if (!trade.has_value()) {
            break;
        }

        m_lastPrice = trade->price;
        trades.push_back(std::move(*trade));

        if (maker.isFilled()) {
            m_orderIndex.erase(maker.id);
            resting.erase(best);
        }
    }

    // Only limit orders rest; IOC and market remainders are dropped
    if (!order.isFilled() && order.isLimit() && !order.immediateOrCancel) {
        restOrder(std::move(order));
    }
}

void OrderBook::triggerStops(std::vector<Trade>& trades, Timestamp arrival, Timestamp execTime)
{
    while (m_lastPrice.has_value()) {
        Decimal lastPrice = *m_lastPrice;

        std::vector<Order> triggered = takeTriggered(Side::Buy, lastPrice);
        std::vector<Order> sells = takeTriggered(Side::Sell, lastPrice);
        triggered.insert(triggered.end(), std::make_move_iterator(sells.begin()),
                         std::make_move_iterator(sells.end()));

        if (triggered.empty()) {
            break;
        }

        // Triggered stops queue behind everything that rested before the triggering order
        for (auto& stopOrder : triggered) {
            stopOrder.createdAt = std::max(stopOrder.createdAt, arrival);
            processIncoming(std::move(stopOrder), trades, execTime);
        }
    }
}

std::vector<Order> OrderBook::takeTriggered(Side side, const Decimal& lastPrice)
{
    StopOrders& stops = stopSide(side);
    std::vector<Order> triggered;

    for (auto iterator = stops.begin(); iterator != stops.end();) {
        const Decimal& stopPrice = *iterator->second.stopPrice;
        bool crossed = side == Side::Buy ? lastPrice >= stopPrice : lastPrice <= stopPrice;
        if (!crossed) {
            ++iterator;
            continue;
        }
        m_orderIndex.erase(iterator->first.id);
        triggered.push_back(std::move(iterator->second));
        iterator = stops.erase(iterator);
    }

    return triggered;
}

void OrderBook::restOrder(Order order)
{
    OrderKey key = order.key();
    auto [iterator, inserted] = activeSide(order.side).emplace(key, std::move(order));
    if (!inserted) {
        throw ContractViolation("order " + std::to_string(key.id) + " already rests in book " + m_symbol);
    }
    m_orderIndex.emplace(key.id, Location{key, false});
}

void OrderBook::parkStopOrder(Order order)
{
    OrderKey key = order.key();
    auto [iterator, inserted] = stopSide(order.side).emplace(key, std::move(order));
    if (!inserted) {
        throw ContractViolation("stop order " + std::to_string(key.id) + " already pending in book " + m_symbol);
    }
    m_orderIndex.emplace(key.id, Location{key, true});
}

void OrderBook::ensureRunning() const
{
    if (m_halted) {
        throw BookHalted(m_symbol);
    }
}

Timestamp OrderBook::now()
{
    auto timePoint = std::chrono::system_clock::now();
    auto duration = timePoint.time_since_epoch();
    return static_cast<Timestamp>(std::chrono::duration_cast<std::chrono::nanoseconds>(duration).count());
}

} // namespace oceanbook
