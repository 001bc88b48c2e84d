#pragma once

#include "domain/Ticker.hpp"
#include "domain/enums/OrderAction.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace trader::application {

/**
 * @brief Расчёт количества и лимитной цены для ордера «на сумму»
 */
class OrderSizing {
public:
    /**
     * @brief Цена для расчёта: bid, если он положительный, иначе last
     * @throws std::invalid_argument если положительной цены нет
     */
    static double referencePrice(const domain::Ticker& ticker) {
        if (ticker.bid > 0.0) {
            return ticker.bid;
        }
        if (ticker.last > 0.0) {
            return ticker.last;
        }
        throw std::invalid_argument("no positive price for " + ticker.contract.symbol);
    }

    /**
     * @brief Количество на сумму amount по цене price
     *
     * Округляется до целых; значение строго между 0 и 1 становится 1.
     * @throws std::invalid_argument для неположительной суммы или цены
     */
    static double quantityFor(double amount, double price) {
        if (amount <= 0.0) {
            throw std::invalid_argument("amount must be positive, got " + std::to_string(amount));
        }
        if (price <= 0.0) {
            throw std::invalid_argument("price must be positive, got " + std::to_string(price));
        }
        const double raw = amount / price;
        if (raw > 0.0 && raw < 1.0) {
            return 1.0;
        }
        return std::round(raw);
    }

    /**
     * @brief Лимитная цена; в debug-режиме уводится от рынка, чтобы ордер не исполнился
     */
    static double limitPrice(double price, domain::OrderAction action, bool debug) {
        if (!debug) {
            return price;
        }
        const double factor = action == domain::OrderAction::BUY ? 0.81 : 1.1;
        return std::round(price * factor * 100.0) / 100.0;
    }
};

} // namespace trader::application
