#pragma once

#include "instrumentmanager.hpp"
#include "symbolworker.hpp"

#include <future>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace oceanbook {

// Entry point for order intake: one SymbolWorker (and OrderBook) per configured
// instrument. Calls may come from any thread; each symbol sees its commands in the
// order they were accepted.
class MatchingEngine {
public:
    explicit MatchingEngine(const InstrumentManager& instruments);
    ~MatchingEngine();

    MatchingEngine(const MatchingEngine&) = delete;
    MatchingEngine& operator=(const MatchingEngine&) = delete;

    // Install a trade listener on every book. Invoked on the worker threads, so it
    // must be thread-safe when more than one symbol is configured.
    void setTradeCallback(const OrderBook::TradeCallback& callback);

    // Validate and queue an order. Assigns createdAt when the caller left it at 0.
    // Throws std::invalid_argument for orders that fail intake checks.
    std::future<std::vector<Trade>> submitAsync(Order order);

    // Blocking variants
    std::vector<Trade> submit(Order order);
    bool cancel(const std::string& symbol, OrderId id);

    // Queries (run on the symbol's worker)
    [[nodiscard]] std::optional<Order> bestBid(const std::string& symbol);
    [[nodiscard]] std::optional<Order> bestAsk(const std::string& symbol);
    [[nodiscard]] std::optional<Decimal> lastTradePrice(const std::string& symbol);
    [[nodiscard]] std::vector<BookLevel> depth(const std::string& symbol, Side side, size_t levels);

    [[nodiscard]] std::vector<std::string> symbols() const { return m_instruments.allSymbols(); }

    // Finish queued work and stop all workers
    void shutdown();

private:
    // Intake checks against the instrument definition
    static void validate(const Order& order, const Instrument& instrument);

    SymbolWorker& worker(const std::string& symbol);

    const InstrumentManager& m_instruments;
    std::unordered_map<std::string, std::unique_ptr<SymbolWorker>> m_workers;
};

} // namespace oceanbook
