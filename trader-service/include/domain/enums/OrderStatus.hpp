#pragma once

#include <string>

namespace trader::domain {

enum class OrderStatus {
    SUBMITTED,
    OPEN,
    PARTIALLY_FILLED,
    FILLED,
    CANCELLED,
    REJECTED
};

inline std::string toString(OrderStatus status) {
    switch (status) {
        case OrderStatus::SUBMITTED: return "SUBMITTED";
        case OrderStatus::OPEN: return "OPEN";
        case OrderStatus::PARTIALLY_FILLED: return "PARTIALLY_FILLED";
        case OrderStatus::FILLED: return "FILLED";
        case OrderStatus::CANCELLED: return "CANCELLED";
        case OrderStatus::REJECTED: return "REJECTED";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Терминальный статус: ордер больше не может измениться
 */
inline bool isTerminal(OrderStatus status) {
    return status == OrderStatus::FILLED
        || status == OrderStatus::CANCELLED
        || status == OrderStatus::REJECTED;
}

} // namespace trader::domain
