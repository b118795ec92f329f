#include "matchingengine.hpp"

#include <stdexcept>

namespace oceanbook {

MatchingEngine::MatchingEngine(const InstrumentManager& instruments) : m_instruments(instruments)
{
    // Initialize one worker per instrument
    for (const auto& symbol : m_instruments.allSymbols()) {
        m_workers.emplace(symbol, std::make_unique<SymbolWorker>(symbol));
    }
}

MatchingEngine::~MatchingEngine() { shutdown(); }

void MatchingEngine::setTradeCallback(const OrderBook::TradeCallback& callback)
{
    std::vector<std::future<void>> pending;
    for (auto& [symbol, worker] : m_workers) {
        pending.push_back(worker->post([callback](OrderBook& book) { book.setTradeCallback(callback); }));
    }
    for (auto& done : pending) {
        done.get();
    }
}

std::future<std::vector<Trade>> MatchingEngine::submitAsync(Order order)
{
    const Instrument* instrument = m_instruments.find(order.symbol);
    if (instrument == nullptr) {
        throw std::invalid_argument("Unknown symbol: " + order.symbol);
    }
    try {
        validate(order, *instrument);
    } catch (const std::overflow_error& e) {
        // Values too large to align with the tick or lot
        throw std::invalid_argument("Order " + std::to_string(order.id) + ": " + e.what());
    }

    if (order.createdAt == 0) {
        order.createdAt = OrderBook::now();
    }

    return worker(order.symbol).post(
        [order = std::move(order)](OrderBook& book) mutable { return book.submitOrder(std::move(order)); });
}

std::vector<Trade> MatchingEngine::submit(Order order) { return submitAsync(std::move(order)).get(); }

bool MatchingEngine::cancel(const std::string& symbol, OrderId id)
{
    return worker(symbol).post([id](OrderBook& book) { return book.cancelOrder(id); }).get();
}

std::optional<Order> MatchingEngine::bestBid(const std::string& symbol)
{
    return worker(symbol).post([](OrderBook& book) { return book.bestBid(); }).get();
}

std::optional<Order> MatchingEngine::bestAsk(const std::string& symbol)
{
    return worker(symbol).post([](OrderBook& book) { return book.bestAsk(); }).get();
}

std::optional<Decimal> MatchingEngine::lastTradePrice(const std::string& symbol)
{
    return worker(symbol).post([](OrderBook& book) { return book.lastTradePrice(); }).get();
}

std::vector<BookLevel> MatchingEngine::depth(const std::string& symbol, Side side, size_t levels)
{
    return worker(symbol)
        .post([side, levels](OrderBook& book) {
            return side == Side::Buy ? book.bidDepth(levels) : book.askDepth(levels);
        })
        .get();
}

void MatchingEngine::shutdown()
{
    for (auto& [symbol, worker] : m_workers) {
        worker->stop();
    }
}

void MatchingEngine::validate(const Order& order, const Instrument& instrument)
{
    std::string prefix = "Order " + std::to_string(order.id) + ": ";

    if (!order.qty.isPositive()) {
        throw std::invalid_argument(prefix + "quantity must be positive");
    }
    if (!order.filledQty.isZero()) {
        throw std::invalid_argument(prefix + "new order cannot be partially filled");
    }
    if (!instrument.isValidQty(order.qty)) {
        throw std::invalid_argument(prefix + "quantity " + order.qty.toString() + " is not a multiple of lot " +
                                    instrument.lotSize.toString());
    }
    if (order.price.has_value()) {
        if (!order.price->isPositive()) {
            throw std::invalid_argument(prefix + "price must be positive");
        }
        if (!instrument.isValidPrice(*order.price)) {
            throw std::invalid_argument(prefix + "price " + order.price->toString() + " is not on tick " +
                                        instrument.tickSize.toString());
        }
    }
    if (order.stopPrice.has_value()) {
        if (!order.stopPrice->isPositive()) {
            throw std::invalid_argument(prefix + "stop price must be positive");
        }
        if (!instrument.isValidPrice(*order.stopPrice)) {
            throw std::invalid_argument(prefix + "stop price " + order.stopPrice->toString() + " is not on tick " +
                                        instrument.tickSize.toString());
        }
    }
}

SymbolWorker& MatchingEngine::worker(const std::string& symbol)
{
    auto iterator = m_workers.find(symbol);
    if (iterator == m_workers.end()) {
        throw std::invalid_argument("Unknown symbol: " + symbol);
    }
    return *iterator->second;
}

} // namespace oceanbook
