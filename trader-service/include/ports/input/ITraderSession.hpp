#pragma once

#include "domain/CancelResult.hpp"
#include "domain/Contract.hpp"
#include "domain/Order.hpp"
#include "domain/SessionStatus.hpp"
#include "domain/Trade.hpp"
#include "domain/Universe.hpp"
#include "domain/enums/OrderAction.hpp"
#include <CachedObserver.hpp>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <vector>

namespace trader::ports::input {

/**
 * @brief Командная поверхность сессии для стратегий (Input Port)
 */
class ITraderSession {
public:
    /// nullptr и наблюдатель ордера, либо ошибка и nullptr
    using OrderHandler = std::function<void(std::exception_ptr,
                                            std::shared_ptr<CachedObserver<domain::Trade>>)>;

    virtual ~ITraderSession() = default;

    /**
     * @brief Разместить готовый ордер
     * @return Наблюдатель потока результатов по ордеру
     */
    virtual std::shared_ptr<CachedObserver<domain::Trade>> placeOrder(
        const domain::Contract& contract, const domain::Order& order) = 0;

    /**
     * @brief Купить/продать на сумму amount по текущей цене (лимитный ордер)
     *
     * Снимок цены ожидается асинхронно, handler вызывается в цикле событий сессии.
     */
    virtual void placeOrderForAmount(
        const domain::Contract& contract,
        domain::OrderAction action,
        double amount,
        OrderHandler handler,
        bool debug = false) = 0;

    /**
     * @brief Отменить ордер, если он принадлежит этой сессии
     */
    virtual domain::CancelResult cancelOrder(int64_t orderId) = 0;

    virtual bool isConnected() const = 0;

    virtual domain::SessionStatus status() const = 0;

    /**
     * @brief Аварийная отмена всех ордеров
     */
    virtual void redButton() = 0;

    /**
     * @brief Принудительно переподключиться к шлюзу
     */
    virtual void reconnect() = 0;

    virtual std::vector<domain::Universe> getUniverses() const = 0;
};

} // namespace trader::ports::input
