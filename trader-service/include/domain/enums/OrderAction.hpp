#pragma once

#include <string>

namespace trader::domain {

enum class OrderAction {
    BUY,
    SELL
};

inline std::string toString(OrderAction action) {
    switch (action) {
        case OrderAction::BUY: return "BUY";
        case OrderAction::SELL: return "SELL";
        default: return "UNKNOWN";
    }
}

inline OrderAction parseOrderAction(const std::string& str) {
    if (str == "SELL") return OrderAction::SELL;
    return OrderAction::BUY;
}

} // namespace trader::domain
