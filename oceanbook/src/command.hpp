#pragma once

#include "order.hpp"
#include "trade.hpp"

#include <string>

namespace oceanbook {

// One line of a replay file
struct Command {
    enum class Action : uint8_t { Submit, Cancel };

    Action action;
    Order order;        // Submit only
    std::string symbol; // Cancel target book
    OrderId orderId;    // Cancel target order
};

// Parse a JSON command object, e.g.
//   {"action": "submit", "id": 7, "symbol": "BTCUSDT", "member": 3, "side": "buy",
//    "price": "100.5", "qty": "2", "ioc": false}
//   {"action": "cancel", "symbol": "BTCUSDT", "id": 7}
// Throws std::invalid_argument for unknown actions or malformed fields.
Command parseCommand(const std::string& line);

// JSON rendering for replay output
std::string formatTrade(const Trade& trade);

} // namespace oceanbook
