#pragma once

#include "Contract.hpp"
#include "Order.hpp"
#include "enums/OrderStatus.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace trader::domain {

/**
 * @brief Исполнение (частичное или полное)
 */
struct Fill {
    std::string execId;
    double shares = 0.0;
    double price = 0.0;
    std::chrono::system_clock::time_point time;
};

/**
 * @brief Ордер вместе с его исполнениями и текущим статусом
 */
class Trade {
public:
    Contract contract;
    Order order;
    OrderStatus status = OrderStatus::SUBMITTED;
    std::vector<Fill> fills;

    Trade() = default;

    Trade(const Contract& c, const Order& o, OrderStatus s = OrderStatus::SUBMITTED)
        : contract(c), order(o), status(s)
    {}

    int64_t orderId() const { return order.orderId; }

    double filled() const {
        double total = 0.0;
        for (const auto& fill : fills) {
            total += fill.shares;
        }
        return total;
    }

    double remaining() const {
        return order.totalQuantity - filled();
    }

    double averageFillPrice() const {
        double shares = filled();
        if (shares <= 0.0) return 0.0;
        double notional = 0.0;
        for (const auto& fill : fills) {
            notional += fill.shares * fill.price;
        }
        return notional / shares;
    }

    bool isDone() const { return isTerminal(status); }
};

} // namespace trader::domain
