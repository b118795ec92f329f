#include "command.hpp"
#include "jsonutils.hpp"

#include <sstream>
#include <stdexcept>

namespace oceanbook {

using namespace json;

Command parseCommand(const std::string& line)
{
    Command command{};
    std::string action = extractString(line, "action");

    if (action == "cancel") {
        command.action = Command::Action::Cancel;
        command.symbol = extractString(line, "symbol");
        command.orderId = extractUInt(line, "id");
        if (command.symbol.empty() || !hasKey(line, "id")) {
            throw std::invalid_argument("cancel needs symbol and id");
        }
        return command;
    }

    if (action != "submit") {
        throw std::invalid_argument("Unknown action: '" + action + "'");
    }

    command.action = Command::Action::Submit;
    Order& order = command.order;
    order.id = extractUInt(line, "id");
    order.symbol = extractString(line, "symbol");
    order.memberId = extractUInt(line, "member");

    std::string side = extractString(line, "side");
    if (side == "buy") {
        order.side = Side::Buy;
    } else if (side == "sell") {
        order.side = Side::Sell;
    } else {
        throw std::invalid_argument("Invalid side: '" + side + "'");
    }

    auto qty = extractDecimal(line, "qty");
    if (!qty.has_value()) {
        throw std::invalid_argument("Missing qty");
    }
    order.qty = *qty;
    order.price = extractDecimal(line, "price");
    order.stopPrice = extractDecimal(line, "stop_price");
    order.immediateOrCancel = extractBool(line, "ioc");
    order.createdAt = extractUInt(line, "created_at");

    command.symbol = order.symbol;
    command.orderId = order.id;
    return command;
}

std::string formatTrade(const Trade& trade)
{
    // Decimals are quoted so consumers never read them as binary floats
    std::stringstream ss;
    ss << "{\"symbol\": \"" << trade.symbol << "\", \"price\": \"" << trade.price << "\", \"qty\": \"" << trade.qty
       << "\", \"total\": \"" << trade.total << "\", \"makerId\": " << trade.makerOrderId
       << ", \"takerId\": " << trade.takerOrderId << ", \"makerMember\": " << trade.makerId
       << ", \"takerMember\": " << trade.takerId << ", \"takerSide\": \"" << toString(trade.takerSide) << "\"}";
    return ss.str();
}

} // namespace oceanbook
