#pragma once

#include <string>

namespace trader::domain {

enum class OrderType {
    MARKET,
    LIMIT
};

inline std::string toString(OrderType type) {
    switch (type) {
        case OrderType::MARKET: return "MKT";
        case OrderType::LIMIT: return "LMT";
        default: return "UNKNOWN";
    }
}

} // namespace trader::domain
