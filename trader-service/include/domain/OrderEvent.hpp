#pragma once

#include "Trade.hpp"
#include <string>

namespace trader::domain {

/**
 * @brief Вид события жизненного цикла ордера от шлюза
 */
enum class OrderEventType {
    NEW,        ///< ордер принят шлюзом
    STATUS,     ///< изменился статус/исполнение
    MODIFY,     ///< ордер изменён
    CANCEL,     ///< запрошена отмена
    OPEN        ///< ордер из снимка открытых ордеров
};

inline std::string toString(OrderEventType type) {
    switch (type) {
        case OrderEventType::NEW: return "NEW";
        case OrderEventType::STATUS: return "STATUS";
        case OrderEventType::MODIFY: return "MODIFY";
        case OrderEventType::CANCEL: return "CANCEL";
        case OrderEventType::OPEN: return "OPEN";
        default: return "UNKNOWN";
    }
}

struct OrderEvent {
    OrderEventType type = OrderEventType::STATUS;
    Trade trade;

    OrderEvent() = default;
    OrderEvent(OrderEventType t, const Trade& tr) : type(t), trade(tr) {}
};

} // namespace trader::domain
