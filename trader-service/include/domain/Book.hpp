#pragma once

#include "OrderEvent.hpp"
#include "Trade.hpp"
#include <ThreadSafeMap.hpp>
#include <algorithm>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <vector>

namespace trader::domain {

/**
 * @brief Книга ордеров сессии: все известные Trade по orderId
 *
 * Наполняется снимком открытых ордеров при (пере)подключении,
 * дальше поддерживается потоком событий ордеров.
 *
 * Ордер никогда не отбрасывается молча: переход из терминального
 * статуса в другой логируется, но применяется.
 *
 * Thread-safe: да
 */
class Book {
public:
    Book() = default;

    /**
     * @brief Применить событие жизненного цикла ордера
     */
    void apply(const OrderEvent& event) {
        const int64_t orderId = event.trade.orderId();
        if (orderId == 0) {
            std::cerr << "[Book] " << toString(event.type)
                      << " event without order id for " << event.trade.contract.symbol
                      << ", status=" << toString(event.trade.status) << std::endl;
            return;
        }

        std::optional<OrderStatus> previous;
        trades_.compute(orderId, [&](std::shared_ptr<Trade> current) {
            if (current) {
                previous = current->status;
            }
            return std::make_shared<Trade>(event.trade);
        });

        if (previous && isTerminal(*previous) && *previous != event.trade.status) {
            std::cerr << "[Book] Unexpected transition for order " << orderId << ": "
                      << toString(*previous) << " -> " << toString(event.trade.status)
                      << " (" << toString(event.type) << ")" << std::endl;
        } else if (!previous || *previous != event.trade.status) {
            std::cout << "[Book] Order " << orderId << " " << event.trade.contract.symbol
                      << " -> " << toString(event.trade.status) << std::endl;
        }
    }

    /**
     * @brief Добавить ордер из авторитетного снимка открытых ордеров
     */
    void add(const Trade& trade) {
        apply(OrderEvent(OrderEventType::OPEN, trade));
    }

    std::optional<Trade> getTrade(int64_t orderId) const {
        auto trade = trades_.find(orderId);
        if (!trade) {
            return std::nullopt;
        }
        return *trade;
    }

    std::optional<Order> getOrder(int64_t orderId) const {
        auto trade = trades_.find(orderId);
        if (!trade) {
            return std::nullopt;
        }
        return trade->order;
    }

    bool contains(int64_t orderId) const {
        return trades_.contains(orderId);
    }

    /**
     * @brief Все ордера, отсортированные по orderId
     */
    std::vector<Trade> trades() const {
        std::vector<Trade> result;
        for (const auto& trade : trades_.values()) {
            result.push_back(*trade);
        }
        std::sort(result.begin(), result.end(), [](const Trade& a, const Trade& b) {
            return a.orderId() < b.orderId();
        });
        return result;
    }

    /**
     * @brief Ордера в нетерминальных статусах
     */
    std::vector<Trade> openTrades() const {
        auto all = trades();
        all.erase(std::remove_if(all.begin(), all.end(),
                                 [](const Trade& t) { return t.isDone(); }),
                  all.end());
        return all;
    }

    size_t size() const { return trades_.size(); }

private:
    ThreadSafeMap<int64_t, Trade> trades_;
};

} // namespace trader::domain
