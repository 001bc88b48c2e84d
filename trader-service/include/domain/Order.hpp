#pragma once

#include "enums/OrderAction.hpp"
#include "enums/OrderType.hpp"
#include <cstdint>
#include <string>

namespace trader::domain {

/**
 * @brief Ордер
 *
 * orderId присваивает шлюз. clientId: id клиентской сессии,
 * которая разместила ордер: отменить его может только она.
 */
class Order {
public:
    int64_t orderId = 0;
    int clientId = 0;
    int64_t permId = 0;
    std::string account;
    OrderAction action = OrderAction::BUY;
    OrderType type = OrderType::MARKET;
    double totalQuantity = 0.0;
    double limitPrice = 0.0;

    Order() = default;

    static Order limit(OrderAction action, double quantity, double price) {
        Order order;
        order.action = action;
        order.type = OrderType::LIMIT;
        order.totalQuantity = quantity;
        order.limitPrice = price;
        return order;
    }

    static Order market(OrderAction action, double quantity) {
        Order order;
        order.action = action;
        order.type = OrderType::MARKET;
        order.totalQuantity = quantity;
        return order;
    }
};

} // namespace trader::domain
